#include "nabunet/pak/segment_store.h"

#include "nabunet/core/logging.h"

namespace nabunet::pak {

static constexpr const char* TAG = "store";

std::shared_ptr<const ProgramImage> ImageCache::find(PakId id) const
{
    auto it = _images.find(id);
    return it == _images.end() ? nullptr : it->second;
}

std::shared_ptr<const ProgramImage>
ImageCache::insert_if_absent(PakId id, std::shared_ptr<const ProgramImage> image)
{
    auto [it, inserted] = _images.try_emplace(id, std::move(image));
    (void)inserted;
    return it->second;
}

void SegmentStore::add_source(std::unique_ptr<IPakSource> source)
{
    if (!source) {
        return;
    }
    NN_LOGD(TAG, "source %zu: %s", _sources.size(), source->name());
    _sources.push_back(std::move(source));
}

PakResult SegmentStore::resolve(PakId id)
{
    if (auto cached = _cache.find(id)) {
        return PakResult{PakError::None, std::move(cached)};
    }

    for (auto& src : _sources) {
        PakResult r = src->load(id);
        if (r.error == PakError::UnknownProgram) {
            continue;
        }
        if (!r.ok()) {
            NN_LOGE(TAG, "pak %s from %s: %s",
                    format_pak_id(id).c_str(), src->name(), to_string(r.error));
            if (r.error == PakError::None) {
                r.error = PakError::StorageReadError;
            }
            return PakResult{r.error, nullptr};
        }

        NN_LOGI(TAG, "loaded pak %s from %s: %zu segments",
                format_pak_id(id).c_str(), src->name(), r.image->segment_count());
        return PakResult{PakError::None, _cache.insert_if_absent(id, std::move(r.image))};
    }

    NN_LOGW(TAG, "pak %s: %s", format_pak_id(id).c_str(), to_string(PakError::UnknownProgram));
    return PakResult{PakError::UnknownProgram, nullptr};
}

SegmentResult SegmentStore::segment(PakId id, std::size_t index)
{
    PakResult r = resolve(id);
    if (!r.ok()) {
        return SegmentResult{r.error, nullptr, nullptr};
    }

    const Segment* seg = r.image->segment(index);
    if (!seg) {
        NN_LOGW(TAG, "pak %s: segment %zu requested, last is %zu",
                format_pak_id(id).c_str(), index, r.image->segment_count() - 1);
        return SegmentResult{PakError::SegmentIndexOutOfRange, std::move(r.image), nullptr};
    }
    return SegmentResult{PakError::None, std::move(r.image), seg};
}

} // namespace nabunet::pak
