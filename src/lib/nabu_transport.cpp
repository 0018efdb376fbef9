#include "nabunet/io/transport/nabu_transport.h"

#include <algorithm>
#include <string>

#include "nabunet/core/logging.h"
#include "nabunet/io/protocol/byte_codec.h"

namespace nabunet::io {

using namespace nabunet::io::protocol;

static constexpr const char* TAG = "nabu";

// Hex dumps get long for full frames; the rest is elided.
static constexpr std::size_t TRACE_MAX_BYTES = 64;

static void trace(const char* dir, const std::uint8_t* data, std::size_t len)
{
    if (log::level() < log::Level::Verbose) {
        return;
    }
    std::string hex;
    const std::size_t shown = std::min(len, TRACE_MAX_BYTES);
    hex.reserve(shown * 3);
    static constexpr char digits[] = "0123456789abcdef";
    for (std::size_t i = 0; i < shown; ++i) {
        if (i) hex.push_back(' ');
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0F]);
    }
    if (shown < len) {
        hex.append(" ...");
    }
    NN_LOGV(TAG, "%s %s (%zu bytes)", dir, hex.c_str(), len);
    (void)dir;
}

std::vector<std::uint8_t> escape_frame(const std::uint8_t* data, std::size_t len)
{
    const std::uint8_t esc = to_byte(ControlByte::Escape);
    std::vector<std::uint8_t> out;
    out.reserve(len + len / 8);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(data[i]);
        if (data[i] == esc) {
            out.push_back(esc);
        }
    }
    return out;
}

bool NabuTransport::read_exact(std::uint8_t* dst, std::size_t len)
{
    std::size_t got = 0;
    while (got < len) {
        const std::size_t n = _channel.read(dst + got, len - got);
        if (n == 0) {
            NN_LOGI(TAG, "channel closed");
            return false;
        }
        got += n;
    }
    trace("NPC-->NA", dst, len);
    return true;
}

bool NabuTransport::read_byte(std::uint8_t& out)
{
    return read_exact(&out, 1);
}

bool NabuTransport::expect_client_ack()
{
    std::uint8_t ack[CLIENT_ACK_LEN];
    if (!read_exact(ack, sizeof(ack))) {
        return false;
    }
    if (ack[0] != to_byte(ControlByte::Escape) || ack[1] != to_byte(ControlByte::AckSuffix)) {
        NN_LOGW(TAG, "expected client ack 10 06, got %02x %02x", ack[0], ack[1]);
    }
    return true;
}

void NabuTransport::send(const std::uint8_t* data, std::size_t len)
{
    trace("NA-->NPC", data, len);
    _channel.write(data, len);
}

void NabuTransport::send_byte(ControlByte b)
{
    const std::uint8_t v = to_byte(b);
    send(&v, 1);
}

void NabuTransport::send_ack()
{
    const std::uint8_t ack[2] = {to_byte(ControlByte::Escape), to_byte(ControlByte::AckSuffix)};
    send(ack, sizeof(ack));
}

void NabuTransport::send_done()
{
    const std::uint8_t done[2] = {to_byte(ControlByte::Escape), to_byte(ControlByte::DoneSuffix)};
    send(done, sizeof(done));
}

void NabuTransport::send_frame(const std::vector<std::uint8_t>& framed)
{
    send(escape_frame(framed));
    send_done();
}

bool NabuTransport::receive(Command& out)
{
    std::uint8_t op = 0;
    if (!read_byte(op)) {
        return false;
    }

    switch (static_cast<Opcode>(op)) {
    case Opcode::ResetSegmentHandler:
        out = ResetSegmentHandlerCmd{};
        return true;

    case Opcode::Reset:
        out = ResetCmd{};
        return true;

    case Opcode::Startup:
        out = StartupCmd{};
        return true;

    case Opcode::GetStatus: {
        send_ack();
        std::uint8_t kind = 0;
        if (!read_byte(kind)) return false;
        out = GetStatusCmd{kind};
        return true;
    }

    case Opcode::SetChannelCode: {
        send_ack();
        std::uint8_t arg[CHANNEL_CODE_ARG_LEN];
        if (!read_exact(arg, sizeof(arg))) return false;
        std::uint16_t code = 0;
        bytecodec::Reader r(arg, sizeof(arg));
        r.read_u16le(code);
        out = SetChannelCodeCmd{code};
        return true;
    }

    case Opcode::SegmentRequest: {
        send_ack();
        std::uint8_t arg[SEGMENT_REQUEST_ARG_LEN];
        if (!read_exact(arg, sizeof(arg))) return false;
        SegmentRequestCmd cmd;
        bytecodec::Reader r(arg, sizeof(arg));
        r.read_u8(cmd.segment);
        r.read_u24le(cmd.pakId);
        out = cmd;
        return true;
    }

    case Opcode::Mystery: {
        std::uint8_t arg = 0;
        if (!read_byte(arg)) return false;
        out = MysteryCmd{arg};
        return true;
    }
    }

    if (std::find(std::begin(NOISE_BYTES), std::end(NOISE_BYTES), op) != std::end(NOISE_BYTES)) {
        out = LineNoiseCmd{op};
    } else {
        out = UnknownCmd{op};
    }
    return true;
}

} // namespace nabunet::io
