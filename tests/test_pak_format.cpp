#include "doctest.h"

#include "pak_test_helpers.h"

#include "nabunet/io/protocol/crc16.h"
#include "nabunet/io/protocol/nabu_protocol.h"
#include "nabunet/pak/pak_format.h"

#include <algorithm>
#include <cstdint>
#include <vector>

using namespace nabunet::pak;
using nabunet::io::protocol::crc16;
using nabunet::io::protocol::verify_crc;
using nabunet::io::protocol::SEGMENT_MAX_PAYLOAD;
using nabunet::tests::PAK7_PLAIN;
using nabunet::tests::bytes_of;
using nabunet::tests::pattern_image;
using nabunet::tests::to_pak_file;

TEST_CASE("build_segment_header: single-segment layout")
{
    const auto hdr = build_segment_header(7, 0, 0, true, true);
    const std::vector<std::uint8_t> expected(PAK7_PLAIN.begin() + 2, PAK7_PLAIN.begin() + 18);
    CHECK(hdr == expected);
}

TEST_CASE("build_segment_header: packet type, segment number and offset byte order")
{
    const auto mid = build_segment_header(0x123456, 0x0102, 0x07BE, false, false);
    REQUIRE(mid.size() == 16);
    CHECK(mid[0] == 0x12);
    CHECK(mid[1] == 0x34);
    CHECK(mid[2] == 0x56);
    CHECK(mid[3] == 0x02);
    CHECK(mid[11] == 0x20);
    CHECK(mid[12] == 0x02);
    CHECK(mid[13] == 0x01);
    CHECK(mid[14] == 0x07);
    CHECK(mid[15] == 0xBE);

    CHECK(build_segment_header(1, 0, 0, true, false)[11] == 0xA1);
    CHECK(build_segment_header(1, 2, 0, false, true)[11] == 0x30);
}

TEST_CASE("segment_raw_image: short image matches the packaged form")
{
    PakResult r = segment_raw_image(7, bytes_of("HELLO NABU"));
    REQUIRE(r.ok());
    REQUIRE(r.image->segment_count() == 1);

    const std::vector<std::uint8_t> expected(PAK7_PLAIN.begin() + 2, PAK7_PLAIN.end());
    CHECK(r.image->segment(0)->framed() == expected);
    CHECK(r.image->segment(0)->crc() == 0x432A);
}

TEST_CASE("segment_raw_image: multi-segment split, round trip and boundary")
{
    const auto image = pattern_image(2500);
    PakResult r = segment_raw_image(1, image);
    REQUIRE(r.ok());

    const ProgramImage& img = *r.image;
    REQUIRE(img.segment_count() == 3);
    CHECK(img.segment(0)->payload_size() == SEGMENT_MAX_PAYLOAD);
    CHECK(img.segment(1)->payload_size() == SEGMENT_MAX_PAYLOAD);
    CHECK(img.segment(2)->payload_size() == 2500 - 2 * SEGMENT_MAX_PAYLOAD);

    CHECK(img.segment(0)->framed()[11] == 0xA1);
    CHECK(img.segment(1)->framed()[11] == 0x20);
    CHECK(img.segment(2)->framed()[11] == 0x30);

    // offset 991 = 0x03DF, MSB first
    CHECK(img.segment(1)->framed()[14] == 0x03);
    CHECK(img.segment(1)->framed()[15] == 0xDF);

    for (std::size_t i = 0; i < img.segment_count(); ++i) {
        CHECK(img.segment(i)->index() == i);
        CHECK(img.segment(i)->pak_id() == 1);
        CHECK(verify_crc(img.segment(i)->framed()));
    }

    CHECK(img.assemble() == image);

    const Segment* last = img.segment(2);
    REQUIRE(last != nullptr);
    CHECK(std::equal(last->payload(), last->payload() + last->payload_size(),
                     image.end() - static_cast<std::ptrdiff_t>(last->payload_size())));
    CHECK(img.segment(3) == nullptr);
}

TEST_CASE("segment_raw_image: padded final segment")
{
    const auto image = pattern_image(1000);
    SegmentOptions opts;
    opts.padFinalSegment = true;

    PakResult r = segment_raw_image(2, image, opts);
    REQUIRE(r.ok());
    REQUIRE(r.image->segment_count() == 2);

    const Segment* last = r.image->segment(1);
    CHECK(last->payload_size() == SEGMENT_MAX_PAYLOAD);
    CHECK(std::equal(image.begin() + SEGMENT_MAX_PAYLOAD, image.end(), last->payload()));
    CHECK(std::all_of(last->payload() + 9, last->payload() + SEGMENT_MAX_PAYLOAD,
                      [](std::uint8_t b) { return b == 0x00; }));
    CHECK(verify_crc(last->framed()));

    CHECK(r.image->assemble() == image);
}

TEST_CASE("segment_raw_image: framing is deterministic")
{
    const auto image = pattern_image(1500, 3);
    PakResult a = segment_raw_image(9, image);
    PakResult b = segment_raw_image(9, image);
    REQUIRE(a.ok());
    REQUIRE(b.ok());
    for (std::size_t i = 0; i < a.image->segment_count(); ++i) {
        CHECK(a.image->segment(i)->framed() == b.image->segment(i)->framed());
    }
}

TEST_CASE("segment_raw_image: empty and oversized images are rejected")
{
    CHECK(segment_raw_image(1, {}).error == PakError::StorageReadError);

    // 67 segments: the last one starts at 66 * 991 = 65406 (0xFF7E).
    PakResult largest = segment_raw_image(1, pattern_image(67 * SEGMENT_MAX_PAYLOAD));
    REQUIRE(largest.ok());
    REQUIRE(largest.image->segment_count() == 67);
    CHECK(largest.image->segment(66)->framed()[14] == 0xFF);
    CHECK(largest.image->segment(66)->framed()[15] == 0x7E);

    // A 68th segment would start at 66397, past the 16-bit offset field.
    CHECK(segment_raw_image(1, pattern_image(67 * SEGMENT_MAX_PAYLOAD + 1)).error
          == PakError::StorageReadError);
    CHECK(segment_raw_image(1, pattern_image(70 * SEGMENT_MAX_PAYLOAD)).error
          == PakError::StorageReadError);
}

TEST_CASE("parse_pak: packaged image round trip")
{
    const auto image = pattern_image(2500, 7);
    PakResult raw = segment_raw_image(0x12, image);
    REQUIRE(raw.ok());

    std::size_t repaired = 99;
    PakResult r = parse_pak(0x12, to_pak_file(*raw.image), &repaired);
    REQUIRE(r.ok());
    CHECK(repaired == 0);
    CHECK(r.image->segment_count() == 3);
    CHECK(r.image->assemble() == image);
    for (std::size_t i = 0; i < 3; ++i) {
        CHECK(r.image->segment(i)->framed() == raw.image->segment(i)->framed());
    }
}

TEST_CASE("parse_pak: single record file")
{
    PakResult r = parse_pak(7, PAK7_PLAIN);
    REQUIRE(r.ok());
    CHECK(r.image->assemble() == bytes_of("HELLO NABU"));
}

TEST_CASE("parse_pak: trailing 0x1A fill is ignored")
{
    auto bytes = PAK7_PLAIN;
    bytes.insert(bytes.end(), 37, 0x1A);
    PakResult r = parse_pak(7, bytes);
    REQUIRE(r.ok());
    CHECK(r.image->segment_count() == 1);
}

TEST_CASE("parse_pak: bad CRC is repaired")
{
    PakResult raw = segment_raw_image(3, pattern_image(1500));
    REQUIRE(raw.ok());
    const std::uint16_t good = raw.image->segment(1)->crc();

    auto bytes = to_pak_file(*raw.image);
    bytes.back() ^= 0xFF;

    std::size_t repaired = 0;
    PakResult r = parse_pak(3, bytes, &repaired);
    REQUIRE(r.ok());
    CHECK(repaired == 1);
    CHECK(r.image->segment(1)->crc() == good);
    CHECK(verify_crc(r.image->segment(1)->framed()));
}

TEST_CASE("parse_pak: structural errors")
{
    PakResult raw = segment_raw_image(3, pattern_image(2500));
    REQUIRE(raw.ok());
    const auto& s0 = raw.image->segment(0)->framed();
    const auto& s2 = raw.image->segment(2)->framed();

    SUBCASE("empty") {
        CHECK(parse_pak(3, std::vector<std::uint8_t>{}).error == PakError::StorageReadError);
    }
    SUBCASE("only fill") {
        CHECK(parse_pak(3, std::vector<std::uint8_t>(8, 0x1A)).error == PakError::StorageReadError);
    }
    SUBCASE("record runs past end of file") {
        auto bytes = to_pak_file(*raw.image);
        bytes.resize(bytes.size() - 1);
        CHECK(parse_pak(3, bytes).error == PakError::StorageReadError);
    }
    SUBCASE("record shorter than header and CRC") {
        std::vector<std::uint8_t> bytes = {0x05, 0x00, 1, 2, 3, 4, 5};
        CHECK(parse_pak(3, bytes).error == PakError::StorageReadError);
    }
    SUBCASE("missing segment") {
        std::vector<std::uint8_t> bytes;
        for (const auto* s : {&s0, &s2}) {
            bytes.push_back(static_cast<std::uint8_t>(s->size() & 0xFF));
            bytes.push_back(static_cast<std::uint8_t>(s->size() >> 8));
            bytes.insert(bytes.end(), s->begin(), s->end());
        }
        CHECK(parse_pak(3, bytes).error == PakError::StorageReadError);
    }
    SUBCASE("record longer than a full segment frame") {
        auto framed = build_segment_header(3, 0, 0, true, true);
        framed.resize(16 + 3000, 0x55);
        nabunet::io::protocol::append_crc(framed);
        std::vector<std::uint8_t> bytes;
        bytes.push_back(static_cast<std::uint8_t>(framed.size() & 0xFF));
        bytes.push_back(static_cast<std::uint8_t>(framed.size() >> 8));
        bytes.insert(bytes.end(), framed.begin(), framed.end());
        CHECK(parse_pak(3, bytes).error == PakError::StorageReadError);
    }
    SUBCASE("segments belong to another pak") {
        PakResult other = segment_raw_image(9, pattern_image(1500));
        REQUIRE(other.ok());
        const auto bytes = to_pak_file(*other.image);
        CHECK(parse_pak(9, bytes).ok());
        CHECK(parse_pak(5, bytes).error == PakError::StorageReadError);
    }
    SUBCASE("duplicate segment") {
        std::vector<std::uint8_t> bytes;
        for (int i = 0; i < 2; ++i) {
            bytes.push_back(static_cast<std::uint8_t>(s0.size() & 0xFF));
            bytes.push_back(static_cast<std::uint8_t>(s0.size() >> 8));
            bytes.insert(bytes.end(), s0.begin(), s0.end());
        }
        CHECK(parse_pak(3, bytes).error == PakError::StorageReadError);
    }
}

TEST_CASE("plausible_pak")
{
    CHECK(plausible_pak(PAK7_PLAIN.data(), PAK7_PLAIN.size()));
    CHECK_FALSE(plausible_pak(PAK7_PLAIN.data(), PAK7_PLAIN.size() - 1));
    CHECK_FALSE(plausible_pak(PAK7_PLAIN.data(), 1));

    const std::vector<std::uint8_t> tiny = {0x02, 0x00, 0xAA, 0xBB};
    CHECK_FALSE(plausible_pak(tiny.data(), tiny.size()));
}

TEST_CASE("pak ids format and parse as six hex digits")
{
    CHECK(format_pak_id(1) == "000001");
    CHECK(format_pak_id(0x7FFFFF) == "7FFFFF");
    CHECK(format_pak_id(0xabcdef) == "ABCDEF");

    PakId id = 0;
    CHECK(parse_pak_id("000001", id));
    CHECK(id == 1);
    CHECK(parse_pak_id("0x1A2b", id));
    CHECK(id == 0x1A2B);
    CHECK_FALSE(parse_pak_id("", id));
    CHECK_FALSE(parse_pak_id("1234567", id));
    CHECK_FALSE(parse_pak_id("00000G", id));
}
