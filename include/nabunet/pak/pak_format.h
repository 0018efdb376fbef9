#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "nabunet/pak/pak_types.h"

namespace nabunet::pak {

// How a raw image is cut into segments.
struct SegmentOptions {
    // Pad the final payload to the full segment size with SEGMENT_FILL_BYTE.
    bool padFinalSegment{false};
};

// Build the 16-byte segment header for segment `index` of pak `id`.
std::vector<std::uint8_t> build_segment_header(PakId id,
                                               std::uint16_t index,
                                               std::size_t offset,
                                               bool first,
                                               bool last);

// Parse a pre-segmented pak file: u16le record length + framed segment,
// repeated. Trailing 0x1A fill is ignored. Segments whose stored CRC does not
// verify are repaired and reported through `repairedCrcs` (may be null).
// Errors: StorageReadError for any structural inconsistency, including a
// record longer than SEGMENT_MAX_FRAMED_SIZE or a header naming another pak.
PakResult parse_pak(PakId id,
                    const std::uint8_t* data,
                    std::size_t len,
                    std::size_t* repairedCrcs = nullptr);

inline PakResult parse_pak(PakId id, const std::vector<std::uint8_t>& bytes,
                           std::size_t* repairedCrcs = nullptr)
{
    return parse_pak(id, bytes.data(), bytes.size(), repairedCrcs);
}

// Cut a raw program image into framed segments of at most
// SEGMENT_MAX_PAYLOAD bytes. Errors: StorageReadError when the image is empty
// or a segment would start past the 16-bit header offset (0xFFFF).
PakResult segment_raw_image(PakId id,
                            const std::vector<std::uint8_t>& image,
                            const SegmentOptions& opts = {});

// Cheap structural check used after decryption: the first record must be
// long enough to hold a segment and fit inside the buffer.
bool plausible_pak(const std::uint8_t* data, std::size_t len);

} // namespace nabunet::pak
