#pragma once

#include <cstdint>
#include <variant>

namespace nabunet::io {

// One decoded client command, arguments included.

struct ResetSegmentHandlerCmd {};             // 0x80
struct ResetCmd {};                           // 0x81
struct StartupCmd {};                         // 0x83

struct GetStatusCmd {                         // 0x82
    std::uint8_t kind{0};
};

struct SetChannelCodeCmd {                    // 0x85
    std::uint16_t code{0};
};

struct SegmentRequestCmd {                    // 0x84
    std::uint8_t  segment{0};
    std::uint32_t pakId{0};
};

struct MysteryCmd {                           // 0x8F
    std::uint8_t arg{0};
};

// RS-422 overrun garbage the client is known to emit.
struct LineNoiseCmd {
    std::uint8_t byte{0};
};

struct UnknownCmd {
    std::uint8_t byte{0};
};

using Command = std::variant<
    ResetSegmentHandlerCmd,
    ResetCmd,
    StartupCmd,
    GetStatusCmd,
    SetChannelCodeCmd,
    SegmentRequestCmd,
    MysteryCmd,
    LineNoiseCmd,
    UnknownCmd>;

} // namespace nabunet::io
