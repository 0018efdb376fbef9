#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace nabunet::config {

enum class ChannelKind {
    Tty,
    Pty,
    Unknown,
};

struct SerialConfig {
    ChannelKind   kind{ChannelKind::Tty};
    std::string   device{"/dev/ttyUSB0"};
    std::uint32_t baudRate{115200};
};

struct RawImageConfig {
    std::string   path;                  // empty: no raw image source
    std::uint32_t pakId{0x000001};
    bool          padFinalSegment{false};
};

struct CloudConfig {
    bool        enabled{true};
    std::string url{"http://cloud.nabu.ca/cycle1/"};
};

struct SourcesConfig {
    std::string    pakDirectory{"./paks"};
    RawImageConfig rawImage;
    CloudConfig    cloud;
};

struct AdaptorSettings {
    std::vector<std::uint32_t> preload{0x000001};
    std::string                logLevel{"info"};
};

// Unified config for one adaptor instance.
struct AdaptorConfig {
    SerialConfig    serial;
    SourcesConfig   sources;
    AdaptorSettings adaptor;
};


// Abstract storage interface.
class AdaptorConfigStore {
public:
    virtual ~AdaptorConfigStore() = default;

    virtual AdaptorConfig load() = 0;
    virtual void          save(const AdaptorConfig& cfg) = 0;
};

} // namespace nabunet::config
