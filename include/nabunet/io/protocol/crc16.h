#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace nabunet::io::protocol {

// CRC-16 as implemented by the NABU PC firmware: polynomial 0x1021,
// MSB-first, initial value 0xFFFF, result inverted.
// Check value for "123456789" is 0xD64E.
std::uint16_t crc16(const std::uint8_t* data, std::size_t len);

inline std::uint16_t crc16(const std::vector<std::uint8_t>& data)
{
    return crc16(data.data(), data.size());
}

// Append the CRC of `bytes` to `bytes`, MSB first.
void append_crc(std::vector<std::uint8_t>& bytes);

// True if the last two bytes of `framed` are the CRC of everything before them.
bool verify_crc(const std::uint8_t* framed, std::size_t len);

inline bool verify_crc(const std::vector<std::uint8_t>& framed)
{
    return verify_crc(framed.data(), framed.size());
}

} // namespace nabunet::io::protocol
