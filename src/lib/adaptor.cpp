#include "nabunet/core/adaptor.h"

#include "nabunet/core/logging.h"
#include "nabunet/io/transport/nabu_transport.h"
#include "nabunet/pak/pak_source.h"

namespace nabunet::core {

static constexpr const char* TAG = "core";

std::size_t AdaptorCore::configureSources(const config::SourcesConfig& cfg)
{
    if (!cfg.rawImage.path.empty()) {
        if (auto* rawFs = _storageManager.get(RAW_FS_NAME)) {
            pak::SegmentOptions opts;
            opts.padFinalSegment = cfg.rawImage.padFinalSegment;
            _store.add_source(pak::make_raw_image_source(
                *rawFs, cfg.rawImage.path, cfg.rawImage.pakId, opts));
            NN_LOGI(TAG, "raw image %s served as pak %s",
                    cfg.rawImage.path.c_str(), pak::format_pak_id(cfg.rawImage.pakId).c_str());
        } else {
            NN_LOGE(TAG, "raw image configured but no '%s' filesystem registered", RAW_FS_NAME);
        }
    }

    if (auto* pakFs = _storageManager.get(PAK_FS_NAME)) {
        _store.add_source(pak::make_directory_pak_source(*pakFs));
        NN_LOGI(TAG, "pak directory on '%s'", pakFs->name().c_str());
    }

    if (cfg.cloud.enabled) {
        if (_http) {
            _store.add_source(pak::make_cloud_pak_source(*_http, cfg.cloud.url));
            NN_LOGI(TAG, "cloud source %s", cfg.cloud.url.c_str());
        } else {
            NN_LOGW(TAG, "cloud source enabled but no HTTP client available");
        }
    }

    if (_store.source_count() == 0) {
        NN_LOGW(TAG, "no pak sources configured; every request will be refused");
    }
    return _store.source_count();
}

std::size_t AdaptorCore::preload(const std::vector<pak::PakId>& ids)
{
    std::size_t loaded = 0;
    for (auto id : ids) {
        pak::PakResult r = _store.resolve(id);
        if (r.ok()) {
            ++loaded;
        } else {
            NN_LOGW(TAG, "preload of pak %s failed: %s",
                    pak::format_pak_id(id).c_str(), pak::to_string(r.error));
        }
    }
    return loaded;
}

void AdaptorCore::serve(io::Channel& channel, io::AdaptorSession::Clock clock)
{
    io::NabuTransport transport(channel);
    io::AdaptorSession session(transport, _store, std::move(clock));
    io::SessionContext ctx;
    session.run(ctx);
}

} // namespace nabunet::core
