#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace nabunet::pak {

// 24-bit program identifier as carried in segment requests.
using PakId = std::uint32_t;

enum class PakError : std::uint8_t {
    None = 0,
    UnknownProgram,
    StorageReadError,
    SegmentIndexOutOfRange,
    DecryptError,
    NetworkError,
    ChecksumMismatch,
};

const char* to_string(PakError err) noexcept;

// "000001" style: six uppercase hex digits.
std::string format_pak_id(PakId id);

// Accepts one to six hex digits, optionally prefixed with "0x".
bool parse_pak_id(std::string_view text, PakId& out);

// One segment in its framed form: 16-byte header, payload, 2-byte CRC.
class Segment {
public:
    explicit Segment(std::vector<std::uint8_t> framed)
        : _framed(std::move(framed))
    {}

    const std::vector<std::uint8_t>& framed() const noexcept { return _framed; }

    std::uint8_t index() const noexcept;
    PakId pak_id() const noexcept;
    std::uint16_t crc() const noexcept;

    const std::uint8_t* payload() const noexcept;
    std::size_t payload_size() const noexcept;

private:
    std::vector<std::uint8_t> _framed;
};

// A program image split into segments. Immutable once built; shared by the
// image cache and any session serving it.
class ProgramImage {
public:
    // `imageSize` is the unpadded length of the original program bytes.
    ProgramImage(PakId id, std::vector<Segment> segments, std::size_t imageSize)
        : _id(id)
        , _segments(std::move(segments))
        , _imageSize(imageSize)
    {}

    PakId id() const noexcept { return _id; }
    std::size_t segment_count() const noexcept { return _segments.size(); }
    std::size_t image_size() const noexcept { return _imageSize; }

    // nullptr when index is past the last segment.
    const Segment* segment(std::size_t index) const noexcept;

    // Payloads concatenated in index order and trimmed to image_size().
    std::vector<std::uint8_t> assemble() const;

private:
    PakId _id;
    std::vector<Segment> _segments;
    std::size_t _imageSize;
};

struct PakResult {
    PakError error{PakError::None};
    std::shared_ptr<const ProgramImage> image;

    bool ok() const noexcept { return error == PakError::None && image != nullptr; }
};

} // namespace nabunet::pak
