#pragma once

#include <cstddef>
#include <memory>
#include <unordered_map>
#include <vector>

#include "nabunet/pak/pak_source.h"
#include "nabunet/pak/pak_types.h"

namespace nabunet::pak {

// Process-wide map of loaded program images.
class ImageCache {
public:
    std::shared_ptr<const ProgramImage> find(PakId id) const;

    // Store `image` unless an image for the same id is already cached.
    // Returns whichever image is cached afterwards.
    std::shared_ptr<const ProgramImage>
    insert_if_absent(PakId id, std::shared_ptr<const ProgramImage> image);

    std::size_t size() const noexcept { return _images.size(); }

private:
    std::unordered_map<PakId, std::shared_ptr<const ProgramImage>> _images;
};

struct SegmentResult {
    PakError error{PakError::None};
    std::shared_ptr<const ProgramImage> image;
    const Segment* segment{nullptr};

    bool ok() const noexcept { return error == PakError::None && segment != nullptr; }
};

// Maps (pak id, segment index) to framed segments, loading images lazily
// from the registered sources in registration order.
class SegmentStore {
public:
    SegmentStore() = default;

    SegmentStore(const SegmentStore&) = delete;
    SegmentStore& operator=(const SegmentStore&) = delete;

    void add_source(std::unique_ptr<IPakSource> source);
    std::size_t source_count() const noexcept { return _sources.size(); }

    // Cached image, or the first source that knows the id.
    PakResult resolve(PakId id);

    SegmentResult segment(PakId id, std::size_t index);

    const ImageCache& cache() const noexcept { return _cache; }

private:
    std::vector<std::unique_ptr<IPakSource>> _sources;
    ImageCache _cache;
};

} // namespace nabunet::pak
