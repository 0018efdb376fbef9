#include "nabunet/pak/pak_format.h"

#include <algorithm>
#include <map>

#include "nabunet/core/logging.h"
#include "nabunet/io/protocol/byte_codec.h"
#include "nabunet/io/protocol/crc16.h"
#include "nabunet/io/protocol/nabu_protocol.h"

namespace nabunet::pak {

using namespace nabunet::io::protocol;
namespace bytecodec = nabunet::io::bytecodec;

static constexpr const char* TAG = "pak";

static constexpr std::size_t MIN_RECORD_LEN = SEGMENT_HEADER_SIZE + SEGMENT_CRC_SIZE;

// The header carries the payload offset in 16 bits, so the last segment must
// start at or below 0xFFFF.
static constexpr std::size_t MAX_SEGMENTS = 0xFFFF / SEGMENT_MAX_PAYLOAD + 1;

std::vector<std::uint8_t> build_segment_header(PakId id,
                                               std::uint16_t index,
                                               std::size_t offset,
                                               bool first,
                                               bool last)
{
    std::vector<std::uint8_t> hdr;
    hdr.reserve(SEGMENT_HEADER_SIZE);

    std::uint8_t type = PACKET_TYPE_BASE;
    if (first) type |= PACKET_TYPE_FIRST;
    if (last)  type |= PACKET_TYPE_LAST;

    bytecodec::write_u24be(hdr, id & MAX_PAK_ID);
    bytecodec::write_u8(hdr, static_cast<std::uint8_t>(index & 0xFF));
    bytecodec::write_u8(hdr, OWNER_DEFAULT);
    bytecodec::write_bytes(hdr, TIER_DEFAULT, sizeof(TIER_DEFAULT));
    bytecodec::write_bytes(hdr, RESERVED_DEFAULT, sizeof(RESERVED_DEFAULT));
    bytecodec::write_u8(hdr, type);
    bytecodec::write_u16le(hdr, index);
    bytecodec::write_u16be(hdr, static_cast<std::uint16_t>(offset & 0xFFFF));

    return hdr;
}

static bool only_fill(const std::uint8_t* p, std::size_t n)
{
    return std::all_of(p, p + n, [](std::uint8_t b) { return b == PAK_TRAILING_FILL; });
}

PakResult parse_pak(PakId id,
                    const std::uint8_t* data,
                    std::size_t len,
                    std::size_t* repairedCrcs)
{
    if (repairedCrcs) {
        *repairedCrcs = 0;
    }
    if (!data || len == 0) {
        NN_LOGW(TAG, "pak %s is empty", format_pak_id(id).c_str());
        return PakResult{PakError::StorageReadError, nullptr};
    }

    std::map<std::uint8_t, Segment> byIndex;
    std::size_t payloadBytes = 0;

    bytecodec::Reader r(data, len);
    while (r.remaining() > 0) {
        if (only_fill(data + r.pos(), r.remaining())) {
            NN_LOGW(TAG, "pak %s: ignoring %zu trailing 0x1A fill bytes",
                    format_pak_id(id).c_str(), r.remaining());
            break;
        }

        const std::size_t recordAt = r.pos();
        std::uint16_t recLen = 0;
        const std::uint8_t* rec = nullptr;
        if (!r.read_u16le(recLen) || recLen < MIN_RECORD_LEN
            || recLen > SEGMENT_MAX_FRAMED_SIZE || !r.read_bytes(rec, recLen)) {
            NN_LOGE(TAG, "pak %s: malformed segment record at offset %zu (length %u, %zu bytes left)",
                    format_pak_id(id).c_str(), recordAt,
                    static_cast<unsigned>(recLen), len - recordAt);
            return PakResult{PakError::StorageReadError, nullptr};
        }

        Segment seg(std::vector<std::uint8_t>(rec, rec + recLen));
        const std::uint8_t index = seg.index();

        if (seg.pak_id() != id) {
            NN_LOGE(TAG, "pak %s: segment %u belongs to pak %s",
                    format_pak_id(id).c_str(), index, format_pak_id(seg.pak_id()).c_str());
            return PakResult{PakError::StorageReadError, nullptr};
        }

        if (byIndex.count(index) != 0) {
            NN_LOGE(TAG, "pak %s: duplicate segment %u", format_pak_id(id).c_str(), index);
            return PakResult{PakError::StorageReadError, nullptr};
        }

        if (!verify_crc(seg.framed())) {
            const std::uint16_t stored = seg.crc();
            std::vector<std::uint8_t> framed(rec, rec + recLen - SEGMENT_CRC_SIZE);
            append_crc(framed);
            seg = Segment(std::move(framed));

            NN_LOGW(TAG, "pak %s segment %u: %s, stored %04X should be %04X; repaired",
                    format_pak_id(id).c_str(), index,
                    to_string(PakError::ChecksumMismatch), stored, seg.crc());
            if (repairedCrcs) {
                ++*repairedCrcs;
            }
        }

        payloadBytes += recLen - MIN_RECORD_LEN;
        byIndex.emplace(index, std::move(seg));
    }

    if (byIndex.empty()) {
        NN_LOGE(TAG, "pak %s contains no segments", format_pak_id(id).c_str());
        return PakResult{PakError::StorageReadError, nullptr};
    }

    // std::map is ordered, so contiguity means the last key is size-1.
    if (byIndex.rbegin()->first != byIndex.size() - 1) {
        NN_LOGE(TAG, "pak %s: segment numbers are not contiguous (%zu segments, highest %u)",
                format_pak_id(id).c_str(), byIndex.size(),
                static_cast<unsigned>(byIndex.rbegin()->first));
        return PakResult{PakError::StorageReadError, nullptr};
    }

    std::vector<Segment> segments;
    segments.reserve(byIndex.size());
    for (auto& [index, seg] : byIndex) {
        segments.push_back(std::move(seg));
    }

    NN_LOGD(TAG, "pak %s: %zu segments, %zu payload bytes",
            format_pak_id(id).c_str(), segments.size(), payloadBytes);

    return PakResult{
        PakError::None,
        std::make_shared<const ProgramImage>(id, std::move(segments), payloadBytes)
    };
}

PakResult segment_raw_image(PakId id,
                            const std::vector<std::uint8_t>& image,
                            const SegmentOptions& opts)
{
    if (image.empty()) {
        NN_LOGE(TAG, "raw image for %s is empty", format_pak_id(id).c_str());
        return PakResult{PakError::StorageReadError, nullptr};
    }

    const std::size_t count = (image.size() + SEGMENT_MAX_PAYLOAD - 1) / SEGMENT_MAX_PAYLOAD;
    if (count > MAX_SEGMENTS) {
        NN_LOGE(TAG, "raw image for %s is too large: %zu bytes needs %zu segments (max %zu)",
                format_pak_id(id).c_str(), image.size(), count, MAX_SEGMENTS);
        return PakResult{PakError::StorageReadError, nullptr};
    }

    std::vector<Segment> segments;
    segments.reserve(count);

    for (std::size_t i = 0; i < count; ++i) {
        const std::size_t offset = i * SEGMENT_MAX_PAYLOAD;
        const std::size_t n = std::min(SEGMENT_MAX_PAYLOAD, image.size() - offset);
        const bool last = (i + 1 == count);

        std::vector<std::uint8_t> framed = build_segment_header(
            id, static_cast<std::uint16_t>(i), offset, i == 0, last);
        framed.reserve(SEGMENT_MAX_FRAMED_SIZE);
        framed.insert(framed.end(), image.begin() + offset, image.begin() + offset + n);

        if (last && opts.padFinalSegment) {
            framed.resize(SEGMENT_HEADER_SIZE + SEGMENT_MAX_PAYLOAD, SEGMENT_FILL_BYTE);
        }

        append_crc(framed);
        segments.emplace_back(std::move(framed));
    }

    NN_LOGD(TAG, "raw image %s: %zu bytes in %zu segments",
            format_pak_id(id).c_str(), image.size(), segments.size());

    return PakResult{
        PakError::None,
        std::make_shared<const ProgramImage>(id, std::move(segments), image.size())
    };
}

bool plausible_pak(const std::uint8_t* data, std::size_t len)
{
    bytecodec::Reader r(data, len);
    std::uint16_t recLen = 0;
    if (!r.read_u16le(recLen)) {
        return false;
    }
    return recLen >= MIN_RECORD_LEN && recLen <= r.remaining();
}

} // namespace nabunet::pak
