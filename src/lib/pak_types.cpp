#include "nabunet/pak/pak_types.h"

#include <algorithm>
#include <cstdio>

#include "nabunet/io/protocol/nabu_protocol.h"

namespace nabunet::pak {

using namespace nabunet::io::protocol;

const char* to_string(PakError err) noexcept
{
    switch (err) {
    case PakError::None:                   return "ok";
    case PakError::UnknownProgram:         return "unknown program";
    case PakError::StorageReadError:       return "storage read error";
    case PakError::SegmentIndexOutOfRange: return "segment index out of range";
    case PakError::DecryptError:           return "decrypt error";
    case PakError::NetworkError:           return "network error";
    case PakError::ChecksumMismatch:       return "checksum mismatch";
    }
    return "?";
}

std::string format_pak_id(PakId id)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%06X", static_cast<unsigned>(id & MAX_PAK_ID));
    return buf;
}

bool parse_pak_id(std::string_view text, PakId& out)
{
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    if (text.empty() || text.size() > 6) {
        return false;
    }

    PakId value = 0;
    for (char ch : text) {
        int digit;
        if (ch >= '0' && ch <= '9')      digit = ch - '0';
        else if (ch >= 'a' && ch <= 'f') digit = ch - 'a' + 10;
        else if (ch >= 'A' && ch <= 'F') digit = ch - 'A' + 10;
        else return false;
        value = (value << 4) | static_cast<PakId>(digit);
    }

    out = value;
    return true;
}

std::uint8_t Segment::index() const noexcept
{
    return _framed.size() > HDR_SEGMENT_LOW ? _framed[HDR_SEGMENT_LOW] : 0;
}

PakId Segment::pak_id() const noexcept
{
    if (_framed.size() < HDR_PAK_ID + 3) {
        return 0;
    }
    return (static_cast<PakId>(_framed[HDR_PAK_ID]) << 16)
         | (static_cast<PakId>(_framed[HDR_PAK_ID + 1]) << 8)
         | static_cast<PakId>(_framed[HDR_PAK_ID + 2]);
}

std::uint16_t Segment::crc() const noexcept
{
    const std::size_t n = _framed.size();
    if (n < SEGMENT_CRC_SIZE) {
        return 0;
    }
    return static_cast<std::uint16_t>((_framed[n - 2] << 8) | _framed[n - 1]);
}

const std::uint8_t* Segment::payload() const noexcept
{
    return _framed.data() + SEGMENT_HEADER_SIZE;
}

std::size_t Segment::payload_size() const noexcept
{
    constexpr std::size_t overhead = SEGMENT_HEADER_SIZE + SEGMENT_CRC_SIZE;
    return _framed.size() > overhead ? _framed.size() - overhead : 0;
}

const Segment* ProgramImage::segment(std::size_t index) const noexcept
{
    return index < _segments.size() ? &_segments[index] : nullptr;
}

std::vector<std::uint8_t> ProgramImage::assemble() const
{
    std::vector<std::uint8_t> out;
    out.reserve(_imageSize);

    for (const auto& seg : _segments) {
        out.insert(out.end(), seg.payload(), seg.payload() + seg.payload_size());
    }

    out.resize(std::min(out.size(), _imageSize));
    return out;
}

} // namespace nabunet::pak
