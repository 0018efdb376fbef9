#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace nabunet::io::bytecodec {

// Bounds-checked reader over a byte span.
// NABU mixes byte orders: wire arguments are LSB first, header pak ids and
// offsets are MSB first.
class Reader {
public:
    Reader(const std::uint8_t* data, std::size_t size)
        : _begin(data), _p(data), _end(data + size) {}

    bool read_u8(std::uint8_t& out) {
        if (_p + 1 > _end) return false;
        out = *_p++;
        return true;
    }

    bool read_u16le(std::uint16_t& out) {
        if (_p + 2 > _end) return false;
        out = static_cast<std::uint16_t>(_p[0] | (_p[1] << 8));
        _p += 2;
        return true;
    }

    bool read_u16be(std::uint16_t& out) {
        if (_p + 2 > _end) return false;
        out = static_cast<std::uint16_t>((_p[0] << 8) | _p[1]);
        _p += 2;
        return true;
    }

    bool read_u24le(std::uint32_t& out) {
        if (_p + 3 > _end) return false;
        out = (std::uint32_t)_p[0]
            | ((std::uint32_t)_p[1] << 8)
            | ((std::uint32_t)_p[2] << 16);
        _p += 3;
        return true;
    }

    bool read_u24be(std::uint32_t& out) {
        if (_p + 3 > _end) return false;
        out = ((std::uint32_t)_p[0] << 16)
            | ((std::uint32_t)_p[1] << 8)
            | (std::uint32_t)_p[2];
        _p += 3;
        return true;
    }

    bool read_bytes(const std::uint8_t*& ptr, std::size_t n) {
        if (n > remaining()) return false;
        ptr = _p;
        _p += n;
        return true;
    }

    bool skip(std::size_t n) {
        if (n > remaining()) return false;
        _p += n;
        return true;
    }

    std::size_t remaining() const { return (std::size_t)(_end - _p); }
    std::size_t pos() const { return (std::size_t)(_p - _begin); }

private:
    const std::uint8_t* _begin{};
    const std::uint8_t* _p{};
    const std::uint8_t* _end{};
};

// -----------------------------
// Writer helpers
// -----------------------------
using Buffer = std::vector<std::uint8_t>;

inline void write_u8(Buffer& out, std::uint8_t v) {
    out.push_back(v);
}

inline void write_u16le(Buffer& out, std::uint16_t v) {
    out.push_back((std::uint8_t)(v & 0xFF));
    out.push_back((std::uint8_t)((v >> 8) & 0xFF));
}

inline void write_u16be(Buffer& out, std::uint16_t v) {
    out.push_back((std::uint8_t)((v >> 8) & 0xFF));
    out.push_back((std::uint8_t)(v & 0xFF));
}

inline void write_u24le(Buffer& out, std::uint32_t v) {
    out.push_back((std::uint8_t)(v & 0xFF));
    out.push_back((std::uint8_t)((v >> 8) & 0xFF));
    out.push_back((std::uint8_t)((v >> 16) & 0xFF));
}

inline void write_u24be(Buffer& out, std::uint32_t v) {
    out.push_back((std::uint8_t)((v >> 16) & 0xFF));
    out.push_back((std::uint8_t)((v >> 8) & 0xFF));
    out.push_back((std::uint8_t)(v & 0xFF));
}

inline void write_bytes(Buffer& out, const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    out.insert(out.end(), p, p + n);
}

} // namespace nabunet::io::bytecodec
