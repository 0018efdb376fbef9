#include "nabunet/time/time_segment.h"

#include "nabunet/io/protocol/byte_codec.h"
#include "nabunet/io/protocol/crc16.h"
#include "nabunet/io/protocol/nabu_protocol.h"
#include "nabunet/pak/pak_format.h"

namespace nabunet::time {

using namespace nabunet::io::protocol;
namespace bytecodec = nabunet::io::bytecodec;

namespace {

constexpr std::uint8_t TIME_MARKER[2] = {0x02, 0x02};
constexpr std::uint8_t TIME_YEAR      = 84;

} // namespace

std::vector<std::uint8_t> build_time_segment(const platform::LocalTime& now)
{
    // A lone time segment is neither flagged first nor last.
    std::vector<std::uint8_t> seg = pak::build_segment_header(TIME_PAK_ID, 0, 0, false, false);

    bytecodec::write_bytes(seg, TIME_MARKER, sizeof(TIME_MARKER));
    bytecodec::write_u8(seg, static_cast<std::uint8_t>((now.weekday + 1) % 7));
    bytecodec::write_u8(seg, TIME_YEAR);
    bytecodec::write_u8(seg, static_cast<std::uint8_t>(now.month));
    bytecodec::write_u8(seg, static_cast<std::uint8_t>(now.day));
    bytecodec::write_u8(seg, static_cast<std::uint8_t>(now.hour));
    bytecodec::write_u8(seg, static_cast<std::uint8_t>(now.minute));
    bytecodec::write_u8(seg, static_cast<std::uint8_t>(now.second));

    append_crc(seg);
    return seg;
}

} // namespace nabunet::time
