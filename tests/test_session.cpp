#include "doctest.h"

#include "fake_channel.h"
#include "fake_fs.h"
#include "pak_test_helpers.h"

#include "nabunet/io/protocol/byte_codec.h"
#include "nabunet/io/protocol/crc16.h"
#include "nabunet/io/session/adaptor_session.h"
#include "nabunet/io/transport/nabu_transport.h"
#include "nabunet/pak/pak_format.h"
#include "nabunet/pak/pak_source.h"
#include "nabunet/pak/segment_store.h"
#include "nabunet/time/time_segment.h"

#include <algorithm>
#include <cstdint>
#include <vector>

using namespace nabunet;
using nabunet::tests::FakeChannel;
using nabunet::tests::MemoryFileSystem;
using nabunet::tests::pattern_image;
using nabunet::tests::to_pak_file;
using Bytes = std::vector<std::uint8_t>;

namespace {

const Bytes ACK  = {0x10, 0x06};
const Bytes DONE = {0x10, 0xE1};

Bytes cat(std::initializer_list<Bytes> parts)
{
    Bytes out;
    for (const auto& p : parts) out.insert(out.end(), p.begin(), p.end());
    return out;
}

Bytes segment_request(std::uint8_t segment, std::uint32_t pakId)
{
    Bytes b = {0x84, segment};
    io::bytecodec::write_u24le(b, pakId);
    b.insert(b.end(), ACK.begin(), ACK.end());
    return b;
}

platform::LocalTime fixed_clock()
{
    platform::LocalTime t;
    t.month = 3;
    t.day = 14;
    t.hour = 15;
    t.minute = 9;
    t.second = 26;
    t.weekday = 3;
    return t;
}

// Program 7 is a 1500-byte image split over two segments.
struct SessionFixture {
    SessionFixture()
        : fs("paks")
        , image(pattern_image(1500))
        , transport(ch)
        , session(transport, store, fixed_clock)
    {
        pak::PakResult r = pak::segment_raw_image(7, image);
        REQUIRE(r.ok());
        fs.create_file("/000007.pak", to_pak_file(*r.image));
        store.add_source(pak::make_directory_pak_source(fs));
    }

    // Feed `rx`, run one command and return what the adaptor sent.
    Bytes exchange(const Bytes& rx)
    {
        ch.clear_tx();
        ch.push_rx(rx);
        REQUIRE(session.step(ctx));
        return ch.tx();
    }

    MemoryFileSystem fs;
    Bytes image;
    FakeChannel ch;
    pak::SegmentStore store;
    io::NabuTransport transport;
    io::AdaptorSession session;
    io::SessionContext ctx;
};

// Frame for segment `index` of `image`, built independently of the store.
Bytes expected_frame(std::uint32_t pakId, const Bytes& image, std::size_t index, std::size_t count)
{
    const std::size_t off = index * 991;
    const std::size_t n = std::min<std::size_t>(991, image.size() - off);
    Bytes framed = pak::build_segment_header(pakId, static_cast<std::uint16_t>(index), off,
                                             index == 0, index + 1 == count);
    framed.insert(framed.end(), image.begin() + off, image.begin() + off + n);
    const std::uint16_t crc = io::protocol::crc16(framed);
    framed.push_back(static_cast<std::uint8_t>(crc >> 8));
    framed.push_back(static_cast<std::uint8_t>(crc & 0xFF));
    return framed;
}

} // namespace

TEST_CASE_FIXTURE(SessionFixture, "session: reset, load program 7, fetch segment 0")
{
    CHECK(exchange({0x81}) == ACK);

    const Bytes frame = expected_frame(7, image, 0, 2);
    REQUIRE(io::protocol::verify_crc(frame));

    const Bytes tx = exchange(segment_request(0, 7));
    CHECK(tx == cat({ACK, {0xE4, 0x91}, io::escape_frame(frame), DONE}));
    REQUIRE(ctx.activePak.has_value());
    CHECK(*ctx.activePak == 7);

    // Undo the escaping and check payload and CRC of what went on the wire.
    Bytes wire(tx.begin() + 4, tx.end() - 2);
    Bytes unescaped;
    for (std::size_t i = 0; i < wire.size(); ++i) {
        unescaped.push_back(wire[i]);
        if (wire[i] == 0x10) ++i;
    }
    CHECK(unescaped == frame);
    CHECK(std::equal(image.begin(), image.begin() + 991, unescaped.begin() + 16));
}

TEST_CASE_FIXTURE(SessionFixture, "session: last segment and one past it")
{
    CHECK(exchange(segment_request(1, 7)) ==
          cat({ACK, {0xE4, 0x91}, io::escape_frame(expected_frame(7, image, 1, 2)), DONE}));

    CHECK(exchange(segment_request(2, 7)) == Bytes{0x10, 0x06, 0xE4, 0x90});
}

TEST_CASE_FIXTURE(SessionFixture, "session: frames are identical on repeated requests")
{
    const Bytes a = exchange(segment_request(0, 7));
    const Bytes b = exchange(segment_request(0, 7));
    CHECK(a == b);
}

TEST_CASE_FIXTURE(SessionFixture, "session: unknown program does not poison the session")
{
    CHECK(exchange(segment_request(0, 9999)) == Bytes{0x10, 0x06, 0xE4, 0x90});
    CHECK_FALSE(ctx.activePak.has_value());

    const Bytes tx = exchange(segment_request(0, 7));
    REQUIRE(tx.size() > 4);
    CHECK(tx[2] == 0xE4);
    CHECK(tx[3] == 0x91);
    CHECK(*ctx.activePak == 7);
}

TEST_CASE_FIXTURE(SessionFixture, "session: reset commands clear the active program only")
{
    exchange(segment_request(0, 7));
    CHECK(exchange({0x85, 0x00, 0x00}) == Bytes{0x10, 0x06, 0xE4});
    REQUIRE(ctx.activePak.has_value());

    CHECK(exchange({0x80}) == Bytes{0x10, 0x06, 0xE4});
    CHECK_FALSE(ctx.activePak.has_value());

    exchange(segment_request(0, 7));
    CHECK(exchange({0x83}) == Bytes{0x10, 0x06, 0xE4});
    CHECK_FALSE(ctx.activePak.has_value());

    REQUIRE(ctx.channelCode.has_value());
    CHECK(*ctx.channelCode == 0x0000);
}

TEST_CASE_FIXTURE(SessionFixture, "session: status reflects the channel code")
{
    CHECK(exchange({0x82, 0x01}) == Bytes{0x10, 0x06, 0x9F, 0x10, 0xE1});
    CHECK(exchange({0x85, 0x34, 0x12}) == Bytes{0x10, 0x06, 0xE4});
    CHECK(*ctx.channelCode == 0x1234);
    CHECK(exchange({0x82, 0x01}) == Bytes{0x10, 0x06, 0x1F, 0x10, 0xE1});
    CHECK(exchange({0x81}) == ACK);
    CHECK(exchange({0x82, 0x01}) == Bytes{0x10, 0x06, 0x1F, 0x10, 0xE1});
}

TEST_CASE_FIXTURE(SessionFixture, "session: time segment comes from the clock")
{
    const Bytes seg = time::build_time_segment(fixed_clock());
    CHECK(exchange(segment_request(0, 0x7FFFFF)) ==
          cat({ACK, {0xE4, 0x91}, io::escape_frame(seg), DONE}));
    CHECK(store.cache().size() == 0);
}

TEST_CASE_FIXTURE(SessionFixture, "session: noise, 0x8f and unknown bytes")
{
    CHECK(exchange({0x03}) == Bytes{0xE4});
    CHECK(exchange({0x0F}) == Bytes{0xE4});
    CHECK(exchange({0xF0}) == Bytes{0xE4});
    CHECK(exchange({0x8F, 0x05}) == Bytes{0xE4});
    CHECK(exchange({0x42}).empty());
}

TEST_CASE_FIXTURE(SessionFixture, "session: closed transport ends the loop")
{
    CHECK_FALSE(session.step(ctx));

    ch.push_rx({0x81, 0x83});
    // FakeChannel stays closed once a read has reported closure.
    CHECK_FALSE(session.step(ctx));
}

TEST_CASE_FIXTURE(SessionFixture, "session: run serves until the client goes away")
{
    ch.push_rx(cat({{0x81}, segment_request(0, 9999), segment_request(1, 7), {0x82, 0x00}}));
    session.run(ctx);

    CHECK(ch.closed());
    CHECK(*ctx.activePak == 7);
    const Bytes& tx = ch.tx();
    REQUIRE(tx.size() > 10);
    CHECK(Bytes(tx.begin(), tx.begin() + 6) == Bytes{0x10, 0x06, 0x10, 0x06, 0xE4, 0x90});
    CHECK(Bytes(tx.end() - 5, tx.end()) == Bytes{0x10, 0x06, 0x9F, 0x10, 0xE1});
}
