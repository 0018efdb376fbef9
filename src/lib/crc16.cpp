#include "nabunet/io/protocol/crc16.h"

#include <array>

#include "nabunet/io/protocol/nabu_protocol.h"

namespace nabunet::io::protocol {

namespace {

constexpr std::array<std::uint16_t, 256> make_table()
{
    std::array<std::uint16_t, 256> table{};
    for (std::uint32_t i = 0; i < 256; ++i) {
        std::uint16_t crc = static_cast<std::uint16_t>(i << 8);
        for (int bit = 0; bit < 8; ++bit) {
            if (crc & 0x8000) {
                crc = static_cast<std::uint16_t>((crc << 1) ^ CRC16_POLY);
            } else {
                crc = static_cast<std::uint16_t>(crc << 1);
            }
        }
        table[i] = crc;
    }
    return table;
}

constexpr auto CRC_TABLE = make_table();

static_assert(CRC_TABLE[1] == 0x1021, "CRC table generation mismatch");
static_assert(CRC_TABLE[255] == 0x1EF0, "CRC table generation mismatch");

} // namespace

std::uint16_t crc16(const std::uint8_t* data, std::size_t len)
{
    std::uint16_t crc = CRC16_INIT;

    for (std::size_t i = 0; i < len; ++i) {
        const std::uint8_t idx = static_cast<std::uint8_t>((crc >> 8) ^ data[i]);
        crc = static_cast<std::uint16_t>((crc << 8) ^ CRC_TABLE[idx]);
    }

    return static_cast<std::uint16_t>(crc ^ CRC16_XOROUT);
}

void append_crc(std::vector<std::uint8_t>& bytes)
{
    const std::uint16_t crc = crc16(bytes.data(), bytes.size());
    bytes.push_back(static_cast<std::uint8_t>(crc >> 8));
    bytes.push_back(static_cast<std::uint8_t>(crc & 0xFF));
}

bool verify_crc(const std::uint8_t* framed, std::size_t len)
{
    if (!framed || len < SEGMENT_CRC_SIZE) {
        return false;
    }

    const std::size_t body = len - SEGMENT_CRC_SIZE;
    const std::uint16_t expected = crc16(framed, body);
    const std::uint16_t stored = static_cast<std::uint16_t>(
        (static_cast<std::uint16_t>(framed[body]) << 8) | framed[body + 1]);
    return expected == stored;
}

} // namespace nabunet::io::protocol
