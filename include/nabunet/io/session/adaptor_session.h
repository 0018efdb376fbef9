#pragma once

#include <cstdint>
#include <functional>
#include <optional>

#include "nabunet/io/session/commands.h"
#include "nabunet/io/transport/nabu_transport.h"
#include "nabunet/pak/segment_store.h"
#include "nabunet/platform/time.h"

namespace nabunet::io {

// Per-client state carried between commands.
struct SessionContext {
    // Pak most recently served by a segment request.
    std::optional<pak::PakId> activePak;
    // Channel code sent by the client with 0x85.
    std::optional<std::uint16_t> channelCode;

    // Reset and startup forget the active program but keep the channel code.
    void clear_selection() { activePak.reset(); }
};

// Half-duplex command loop: read one command, answer it completely, repeat.
class AdaptorSession {
public:
    using Clock = std::function<platform::LocalTime()>;

    AdaptorSession(NabuTransport& transport,
                   pak::SegmentStore& store,
                   Clock clock = platform::local_time_now);

    // Handle one command. Returns false once the transport is closed.
    bool step(SessionContext& ctx);

    // step() until the transport closes.
    void run(SessionContext& ctx);

private:
    bool handle(SessionContext& ctx, const ResetSegmentHandlerCmd&);
    bool handle(SessionContext& ctx, const ResetCmd&);
    bool handle(SessionContext& ctx, const StartupCmd&);
    bool handle(SessionContext& ctx, const GetStatusCmd& cmd);
    bool handle(SessionContext& ctx, const SetChannelCodeCmd& cmd);
    bool handle(SessionContext& ctx, const SegmentRequestCmd& cmd);
    bool handle(SessionContext& ctx, const MysteryCmd& cmd);
    bool handle(SessionContext& ctx, const LineNoiseCmd& cmd);
    bool handle(SessionContext& ctx, const UnknownCmd& cmd);

    // Authorize and send one framed segment.
    bool serve(const std::vector<std::uint8_t>& framed);
    bool refuse();

    NabuTransport& _transport;
    pak::SegmentStore& _store;
    Clock _clock;
};

} // namespace nabunet::io
