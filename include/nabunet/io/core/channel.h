#pragma once

#include <cstddef>
#include <cstdint>

namespace nabunet::io {

// Abstract byte-level I/O channel (TTY, PTY, socket, ...).
//
// The adaptor protocol is half-duplex and paced by the client, so reads
// block until at least one byte arrives.
class Channel {
public:
    virtual ~Channel() = default;

    // Block until at least one byte is available, then read up to maxLen
    // bytes into buffer. Returns 0 only when the channel has been closed.
    virtual std::size_t read(std::uint8_t* buffer, std::size_t maxLen) = 0;

    // Write len bytes from buffer. A failed write closes the channel; the
    // next read() then reports closure.
    virtual void write(const std::uint8_t* buffer, std::size_t len) = 0;

    // Unblock any pending read() and make further reads return 0.
    virtual void close() = 0;
};

} // namespace nabunet::io
