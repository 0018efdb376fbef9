#include "nabunet/io/session/adaptor_session.h"

#include "nabunet/core/logging.h"
#include "nabunet/time/time_segment.h"

namespace nabunet::io {

using namespace nabunet::io::protocol;

static constexpr const char* TAG = "session";

AdaptorSession::AdaptorSession(NabuTransport& transport,
                               pak::SegmentStore& store,
                               Clock clock)
    : _transport(transport)
    , _store(store)
    , _clock(std::move(clock))
{
}

bool AdaptorSession::step(SessionContext& ctx)
{
    Command cmd;
    if (!_transport.receive(cmd)) {
        return false;
    }
    return std::visit([this, &ctx](const auto& c) { return handle(ctx, c); }, cmd);
}

void AdaptorSession::run(SessionContext& ctx)
{
    NN_LOGI(TAG, "waiting for NABU PC");
    while (step(ctx)) {
    }
    NN_LOGI(TAG, "session ended");
}

bool AdaptorSession::handle(SessionContext& ctx, const ResetSegmentHandlerCmd&)
{
    NN_LOGD(TAG, "reset segment handler");
    ctx.clear_selection();
    _transport.send_ack();
    _transport.send_byte(ControlByte::Confirmed);
    return true;
}

bool AdaptorSession::handle(SessionContext& ctx, const ResetCmd&)
{
    NN_LOGD(TAG, "reset");
    ctx.clear_selection();
    _transport.send_ack();
    return true;
}

bool AdaptorSession::handle(SessionContext& ctx, const StartupCmd&)
{
    NN_LOGD(TAG, "startup");
    ctx.clear_selection();
    _transport.send_ack();
    _transport.send_byte(ControlByte::Confirmed);
    return true;
}

bool AdaptorSession::handle(SessionContext& ctx, const GetStatusCmd& cmd)
{
    const bool haveChannel = ctx.channelCode.has_value();
    NN_LOGD(TAG, "status query %02x: channel %s", cmd.kind, haveChannel ? "set" : "unset");
    _transport.send_byte(haveChannel ? ControlByte::ChannelSet : ControlByte::ChannelUnset);
    _transport.send_done();
    return true;
}

bool AdaptorSession::handle(SessionContext& ctx, const SetChannelCodeCmd& cmd)
{
    NN_LOGI(TAG, "channel code %04x", cmd.code);
    ctx.channelCode = cmd.code;
    _transport.send_byte(ControlByte::Confirmed);
    return true;
}

bool AdaptorSession::handle(SessionContext& ctx, const SegmentRequestCmd& cmd)
{
    const std::string pakName = pak::format_pak_id(cmd.pakId);
    NN_LOGI(TAG, "segment %u of pak %s requested", cmd.segment, pakName.c_str());

    _transport.send_byte(ControlByte::Confirmed);

    if (cmd.pakId == TIME_PAK_ID) {
        return serve(time::build_time_segment(_clock()));
    }

    pak::SegmentResult r = _store.segment(cmd.pakId, cmd.segment);
    if (!r.ok()) {
        NN_LOGW(TAG, "pak %s segment %u unavailable: %s",
                pakName.c_str(), cmd.segment, pak::to_string(r.error));
        return refuse();
    }

    ctx.activePak = cmd.pakId;
    return serve(r.segment->framed());
}

bool AdaptorSession::handle(SessionContext&, const MysteryCmd& cmd)
{
    NN_LOGD(TAG, "0x8f command, argument %02x", cmd.arg);
    _transport.send_byte(ControlByte::Confirmed);
    return true;
}

bool AdaptorSession::handle(SessionContext&, const LineNoiseCmd& cmd)
{
    NN_LOGD(TAG, "line noise %02x", cmd.byte);
    _transport.send_byte(ControlByte::Confirmed);
    return true;
}

bool AdaptorSession::handle(SessionContext&, const UnknownCmd& cmd)
{
    NN_LOGW(TAG, "unrecognized request %02x", cmd.byte);
    return true;
}

bool AdaptorSession::serve(const std::vector<std::uint8_t>& framed)
{
    _transport.send_byte(ControlByte::Authorized);
    if (!_transport.expect_client_ack()) {
        return false;
    }
    _transport.send_frame(framed);
    return true;
}

bool AdaptorSession::refuse()
{
    _transport.send_byte(ControlByte::Unauthorized);
    return _transport.expect_client_ack();
}

} // namespace nabunet::io
