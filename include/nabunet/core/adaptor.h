#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "nabunet/config/adaptor_config.h"
#include "nabunet/fs/storage_manager.h"
#include "nabunet/io/core/channel.h"
#include "nabunet/io/session/adaptor_session.h"
#include "nabunet/net/http_client.h"
#include "nabunet/pak/segment_store.h"

namespace nabunet::core {

// Filesystem names looked up in the StorageManager.
inline constexpr const char* PAK_FS_NAME = "paks";
inline constexpr const char* RAW_FS_NAME = "raw";

// Central engine for one adaptor.
// Owns:
//   - StorageManager (pak directory / raw image filesystems)
//   - the HTTP client used by the cloud source
//   - SegmentStore   (source chain + image cache)
class AdaptorCore {
public:
    AdaptorCore() = default;

    AdaptorCore(const AdaptorCore&) = delete;
    AdaptorCore& operator=(const AdaptorCore&) = delete;

    fs::StorageManager&        storageManager()       { return _storageManager; }
    const fs::StorageManager&  storageManager() const { return _storageManager; }

    pak::SegmentStore&         segmentStore()         { return _store; }

    void setHttpClient(std::unique_ptr<net::IHttpClient> http) { _http = std::move(http); }

    // Register sources in lookup order: raw image, pak directory, cloud.
    // The raw image path is relative to the "raw" filesystem. Returns the
    // number of sources registered.
    std::size_t configureSources(const config::SourcesConfig& cfg);

    // Load the given paks into the cache. Returns how many succeeded.
    std::size_t preload(const std::vector<pak::PakId>& ids);

    // Serve one client on `channel` until it closes.
    void serve(io::Channel& channel, io::AdaptorSession::Clock clock = platform::local_time_now);

private:
    fs::StorageManager                 _storageManager;
    std::unique_ptr<net::IHttpClient>  _http;
    pak::SegmentStore                  _store;
};

} // namespace nabunet::core
