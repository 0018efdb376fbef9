#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "nabunet/io/core/channel.h"

namespace nabunet::tests {

// Feeds scripted client bytes and captures everything the adaptor sends.
// Reads report closure once the script runs out.
class FakeChannel final : public nabunet::io::Channel {
public:
    std::size_t read(std::uint8_t* dst, std::size_t maxBytes) override
    {
        if (_closed || _rx.empty()) {
            _closed = true;
            return 0;
        }
        // One byte at a time, as a serial line would deliver them.
        (void)maxBytes;
        *dst = _rx.front();
        _rx.erase(_rx.begin());
        return 1;
    }

    void write(const std::uint8_t* src, std::size_t bytes) override
    {
        if (_closed) return;
        _tx.insert(_tx.end(), src, src + bytes);
    }

    void close() override { _closed = true; }

    void push_rx(const std::vector<std::uint8_t>& data) { _rx.insert(_rx.end(), data.begin(), data.end()); }

    const std::vector<std::uint8_t>& tx() const { return _tx; }
    void clear_tx() { _tx.clear(); }
    bool closed() const { return _closed; }

private:
    std::vector<std::uint8_t> _rx;
    std::vector<std::uint8_t> _tx;
    bool _closed{false};
};

} // namespace nabunet::tests
