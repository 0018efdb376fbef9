#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "nabunet/io/core/channel.h"
#include "nabunet/io/protocol/nabu_protocol.h"
#include "nabunet/io/session/commands.h"

namespace nabunet::io {

// Double every Escape (0x10) byte of a framed segment.
std::vector<std::uint8_t> escape_frame(const std::uint8_t* data, std::size_t len);

inline std::vector<std::uint8_t> escape_frame(const std::vector<std::uint8_t>& framed)
{
    return escape_frame(framed.data(), framed.size());
}

// Byte-level NABU link on top of a Channel. Every call that reads returns
// false once the channel is closed.
class NabuTransport {
public:
    explicit NabuTransport(Channel& channel)
        : _channel(channel)
    {}

    // Block for the next command and its arguments. Commands whose
    // arguments follow an acknowledgement (0x82, 0x84, 0x85) get the
    // leading 10 06 sent here.
    bool receive(Command& out);

    bool read_byte(std::uint8_t& out);
    bool read_exact(std::uint8_t* dst, std::size_t len);

    // Consume the client's 10 06. A mismatch is logged, not fatal.
    bool expect_client_ack();

    void send(const std::uint8_t* data, std::size_t len);
    void send(const std::vector<std::uint8_t>& data) { send(data.data(), data.size()); }

    void send_byte(protocol::ControlByte b);
    void send_ack();           // 10 06
    void send_done();          // 10 E1

    // Escaped frame followed by 10 E1.
    void send_frame(const std::vector<std::uint8_t>& framed);

private:
    Channel& _channel;
};

} // namespace nabunet::io
