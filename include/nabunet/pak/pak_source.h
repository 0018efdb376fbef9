#pragma once

#include <memory>
#include <string>
#include <vector>

#include "nabunet/fs/filesystem.h"
#include "nabunet/net/http_client.h"
#include "nabunet/pak/pak_format.h"
#include "nabunet/pak/pak_types.h"

namespace nabunet::pak {

// One place program images can come from. load() returns UnknownProgram when
// this source simply does not have the id, so the store can try the next one.
class IPakSource {
public:
    virtual ~IPakSource() = default;

    virtual const char* name() const noexcept = 0;

    virtual PakResult load(PakId id) = 0;
};

// Pre-segmented "<ID>.pak" files in `dir` of `fs`.
std::unique_ptr<IPakSource> make_directory_pak_source(fs::IFileSystem& fs,
                                                      std::string dir = "/");

// A single raw program file served as `boundId`. Other ids are unknown.
std::unique_ptr<IPakSource> make_raw_image_source(fs::IFileSystem& fs,
                                                  std::string path,
                                                  PakId boundId,
                                                  SegmentOptions opts = {});

// Encrypted .npak files fetched from `baseUrl` and decrypted.
std::unique_ptr<IPakSource> make_cloud_pak_source(net::IHttpClient& http,
                                                  std::string baseUrl);

// "FC-2C-3F-...-7D.npak" for pak 1.
std::string cloud_pak_file_name(PakId id);

// Pak ids for which "<ID>.pak" exists in `dir`, sorted ascending.
std::vector<PakId> list_pak_ids(fs::IFileSystem& fs, const std::string& dir = "/");

} // namespace nabunet::pak
