#include <doctest/doctest.h>

#include "../src/core/bom.h"
#include "test_util.h"

using namespace encsniff;
using encsniff::test::bytes;

TEST_CASE("BOM: UTF-8") {
    auto data = bytes({0xEF, 0xBB, 0xBF, 'h', 'i'});
    auto label = detail::match_bom(data, BomOrder::longest_first);
    REQUIRE(label.has_value());
    CHECK(*label == EncodingLabel::utf8(true));
}

TEST_CASE("BOM: UTF-16 both byte orders") {
    auto be = bytes({0xFE, 0xFF, 0x00, 0x41});
    auto le = bytes({0xFF, 0xFE, 0x41, 0x00});

    CHECK(detail::match_bom(be, BomOrder::longest_first) == EncodingLabel::utf16(Endianness::big));
    CHECK(detail::match_bom(le, BomOrder::longest_first) == EncodingLabel::utf16(Endianness::little));
    CHECK(detail::match_bom(le, BomOrder::legacy) == EncodingLabel::utf16(Endianness::little));
}

TEST_CASE("BOM: UTF-32 both byte orders") {
    auto be = bytes({0x00, 0x00, 0xFE, 0xFF});
    auto le = bytes({0xFF, 0xFE, 0x00, 0x00});

    CHECK(detail::match_bom(be, BomOrder::longest_first) == EncodingLabel::utf32(Endianness::big));
    CHECK(detail::match_bom(le, BomOrder::longest_first) == EncodingLabel::utf32(Endianness::little));
}

TEST_CASE("BOM: legacy order reports FF FE 00 00 as UTF-16LE") {
    auto le = bytes({0xFF, 0xFE, 0x00, 0x00});
    CHECK(detail::match_bom(le, BomOrder::legacy) == EncodingLabel::utf16(Endianness::little));

    // UTF-32BE does not collide with anything.
    auto be = bytes({0x00, 0x00, 0xFE, 0xFF});
    CHECK(detail::match_bom(be, BomOrder::legacy) == EncodingLabel::utf32(Endianness::big));
}

TEST_CASE("BOM: short and empty buffers") {
    std::vector<std::byte> empty;
    CHECK_FALSE(detail::match_bom(empty, BomOrder::longest_first).has_value());

    auto partial = bytes({0xEF, 0xBB});
    CHECK_FALSE(detail::match_bom(partial, BomOrder::longest_first).has_value());

    auto lone = bytes({0xFF});
    CHECK_FALSE(detail::match_bom(lone, BomOrder::legacy).has_value());

    auto three = bytes({0x00, 0x00, 0xFE});
    CHECK_FALSE(detail::match_bom(three, BomOrder::longest_first).has_value());
}

TEST_CASE("BOM: no mark") {
    auto data = bytes("plain text");
    CHECK_FALSE(detail::match_bom(data, BomOrder::longest_first).has_value());
}

TEST_CASE("UTF-7 signature") {
    CHECK(detail::has_utf7_signature(bytes({0x2B, 0x2F, 0x76, 0x38})));
    CHECK(detail::has_utf7_signature(bytes({0x2B, 0x2F, 0x76, 0x39, 0x41})));
    CHECK(detail::has_utf7_signature(bytes({0x2B, 0x2F, 0x76, 0x2B})));
    CHECK(detail::has_utf7_signature(bytes({0x2B, 0x2F, 0x76, 0x2F})));

    CHECK_FALSE(detail::has_utf7_signature(bytes({0x2B, 0x2F, 0x76, 0x41})));
    CHECK_FALSE(detail::has_utf7_signature(bytes({0x2B, 0x2F, 0x76})));
    CHECK_FALSE(detail::has_utf7_signature(bytes({0x2B, 0x2F, 0x77, 0x38})));
}
