#pragma once

#include <cstddef>
#include <cstdint>

namespace nabunet::io::protocol {

// Bytes exchanged between the NABU PC (client) and the adaptor.
enum class ControlByte : std::uint8_t {
    Escape       = 0x10,  // DLE; doubled inside frames, prefixes Ack/Done
    AckSuffix    = 0x06,  // 10 06
    DoneSuffix   = 0xE1,  // 10 E1
    Confirmed    = 0xE4,
    Unauthorized = 0x90,
    Authorized   = 0x91,
    ChannelSet   = 0x1F,
    ChannelUnset = 0x9F,
};

constexpr std::uint8_t to_byte(ControlByte b) noexcept {
    return static_cast<std::uint8_t>(b);
}

// Command opcodes sent by the client.
enum class Opcode : std::uint8_t {
    ResetSegmentHandler = 0x80,
    Reset               = 0x81,
    GetStatus           = 0x82,
    Startup             = 0x83,
    SegmentRequest      = 0x84,
    SetChannelCode      = 0x85,
    Mystery             = 0x8F,
};

// Stray bytes seen after RS-422 overruns; confirmed and otherwise ignored.
constexpr std::uint8_t NOISE_BYTES[] = {0x03, 0x0F, 0xF0};

// Argument widths
constexpr std::size_t SEGMENT_REQUEST_ARG_LEN = 4;   // u8 segment, u24 pak id (LSB first)
constexpr std::size_t CHANNEL_CODE_ARG_LEN    = 2;   // u16 LSB first
constexpr std::size_t STATUS_ARG_LEN          = 1;
constexpr std::size_t MYSTERY_ARG_LEN         = 1;
constexpr std::size_t CLIENT_ACK_LEN          = 2;   // 10 06

// Segment frame layout
constexpr std::size_t SEGMENT_HEADER_SIZE      = 16;
constexpr std::size_t SEGMENT_CRC_SIZE         = 2;
constexpr std::size_t SEGMENT_MAX_PAYLOAD      = 991;
constexpr std::size_t SEGMENT_MAX_FRAMED_SIZE  =
    SEGMENT_HEADER_SIZE + SEGMENT_MAX_PAYLOAD + SEGMENT_CRC_SIZE;

// Header field offsets
constexpr std::size_t HDR_PAK_ID         = 0;   // 3 bytes, MSB first
constexpr std::size_t HDR_SEGMENT_LOW    = 3;
constexpr std::size_t HDR_OWNER          = 4;
constexpr std::size_t HDR_TIER           = 5;   // 4 bytes
constexpr std::size_t HDR_RESERVED       = 9;   // 2 bytes
constexpr std::size_t HDR_PACKET_TYPE    = 11;
constexpr std::size_t HDR_SEGMENT_NUMBER = 12;  // 2 bytes, LSB first
constexpr std::size_t HDR_OFFSET         = 14;  // 2 bytes, MSB first

// Header field values
constexpr std::uint8_t OWNER_DEFAULT        = 0x01;
constexpr std::uint8_t TIER_DEFAULT[4]      = {0x7F, 0xFF, 0xFF, 0xFF};
constexpr std::uint8_t RESERVED_DEFAULT[2]  = {0x7F, 0x80};
constexpr std::uint8_t PACKET_TYPE_BASE     = 0x20;
constexpr std::uint8_t PACKET_TYPE_FIRST    = 0x81;
constexpr std::uint8_t PACKET_TYPE_LAST     = 0x10;

// Fill byte for padded final segments of raw images.
constexpr std::uint8_t SEGMENT_FILL_BYTE = 0x00;

// Pak id reserved for the adaptor-generated time segment.
constexpr std::uint32_t TIME_PAK_ID = 0x7FFFFF;
constexpr std::uint32_t MAX_PAK_ID  = 0xFFFFFF;

// CRC-16 parameters (MSB-first, init 0xFFFF, xorout 0xFFFF)
constexpr std::uint16_t CRC16_POLY   = 0x1021;
constexpr std::uint16_t CRC16_INIT   = 0xFFFF;
constexpr std::uint16_t CRC16_XOROUT = 0xFFFF;

// Pak files carry trailing SUB padding from CP/M era tools.
constexpr std::uint8_t PAK_TRAILING_FILL = 0x1A;

} // namespace nabunet::io::protocol
