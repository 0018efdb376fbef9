#pragma once

#include <string>

#include "nabunet/config/adaptor_config.h"
#include "nabunet/fs/filesystem.h"

namespace nabunet::config {

// YAML config file on an IFileSystem ("nabunet.yaml").
class YamlAdaptorConfigStore : public AdaptorConfigStore {
public:
    // fs may be null; load() then returns defaults.
    YamlAdaptorConfigStore(fs::IFileSystem* fs, std::string relativePath);

    AdaptorConfig load() override;
    void save(const AdaptorConfig& cfg) override;

private:
    fs::IFileSystem* _fs;
    std::string      _relPath;

    AdaptorConfig loadFromFs(fs::IFileSystem& fs);
    void saveToFs(fs::IFileSystem& fs, const AdaptorConfig& cfg);
};

// Exposed for command-line parsing as well.
ChannelKind parse_channel_kind(const std::string& s);
std::string channel_kind_to_string(ChannelKind k);

} // namespace nabunet::config
