#include <doctest/doctest.h>

#include <encsniff/detector.h>
#include <encsniff/transcode.h>

#include "../src/icu/icu_charset_decoder.h"
#include "test_util.h"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

using namespace encsniff;
using encsniff::test::bytes;
using encsniff::test::TempFile;

TEST_CASE("Transcode: UTF-8 BOM is stripped") {
    auto data = bytes({0xEF, 0xBB, 0xBF, 'h', 'i'});
    CHECK(decode_to_utf8(data, EncodingLabel::utf8(true)) == "hi");
}

TEST_CASE("Transcode: UTF-8 and ASCII are copied") {
    auto data = bytes("plain");
    CHECK(decode_to_utf8(data, EncodingLabel::utf8(false)) == "plain");
    CHECK(decode_to_utf8(data, EncodingLabel::ascii()) == "plain");
}

TEST_CASE("Transcode: UTF-16 and UTF-32") {
    CHECK(decode_to_utf8(bytes({0xFF, 0xFE, 'A', 0x00, 'B', 0x00}),
                         EncodingLabel::utf16(Endianness::little)) == "AB");
    CHECK(decode_to_utf8(bytes({0xFE, 0xFF, 0x30, 0x42}),
                         EncodingLabel::utf16(Endianness::big)) == "\xE3\x81\x82");
    CHECK(decode_to_utf8(bytes({0xFF, 0xFE, 0x00, 0x00, 'A', 0x00, 0x00, 0x00}),
                         EncodingLabel::utf32(Endianness::little)) == "A");
}

TEST_CASE("Transcode: legacy Japanese charsets") {
    CHECK(decode_to_utf8(bytes({0x82, 0xA0}), EncodingLabel::shift_jis()) == "\xE3\x81\x82");
    CHECK(decode_to_utf8(bytes({0xA4, 0xA2}), EncodingLabel::euc_jp()) == "\xE3\x81\x82");
    CHECK(decode_to_utf8(bytes({0x1B, '$', 'B', 0x24, 0x22, 0x1B, '(', 'B'}),
                         EncodingLabel::jis()) == "\xE3\x81\x82");
}

TEST_CASE("Transcode: UTF-7 signature is dropped") {
    CHECK(decode_to_utf8(bytes("+/v8-Hi"), EncodingLabel::utf7()) == "Hi");
}

TEST_CASE("Transcode: BOM-only and empty input") {
    CHECK(decode_to_utf8(bytes({0xFF, 0xFE}), EncodingLabel::utf16(Endianness::little)).empty());
    std::vector<std::byte> empty;
    CHECK(decode_to_utf8(empty, EncodingLabel::shift_jis()).empty());
}

TEST_CASE("Transcode: detect then decode Shift_JIS") {
    auto data = bytes({0x82, 0xB1, 0x82, 0xF1, 0x82, 0xC9, 0x82, 0xBF, 0x82, 0xCD});
    auto label = detect_encoding(data);
    REQUIRE(label == EncodingLabel::shift_jis());
    CHECK(decode_to_utf8(data, label) ==
          "\xE3\x81\x93\xE3\x82\x93\xE3\x81\xAB\xE3\x81\xA1\xE3\x81\xAF");
}

TEST_CASE("Transcode: decode_file detects and decodes") {
    TempFile file(bytes({0xFF, 0xFE, 0x42, 0x30}));
    auto decoded = decode_file(file.path());

    CHECK(decoded.label == EncodingLabel::utf16(Endianness::little));
    CHECK(decoded.text == "\xE3\x81\x82");
}

TEST_CASE("Transcode: decode_file on an empty file") {
    TempFile file(std::vector<std::byte>{});
    auto decoded = decode_file(file.path());

    CHECK(decoded.label == EncodingLabel::utf8(false));
    CHECK(decoded.text.empty());
}

TEST_CASE("Transcode: decode_file on a missing file reports the path") {
    std::filesystem::path missing =
        std::filesystem::temp_directory_path() / "encsniff_test_missing_decode";
    std::filesystem::remove(missing);

    CHECK_THROWS_AS(decode_file(missing), std::runtime_error);
    try {
        decode_file(missing);
    } catch (const std::runtime_error& e) {
        CHECK(std::string(e.what()).find(missing.string()) != std::string::npos);
    }
}

TEST_CASE("Transcode: lengths beyond int32_t are rejected") {
    auto limit = static_cast<std::size_t>(std::numeric_limits<int32_t>::max());
    CHECK(detail::checked_length(0) == 0);
    CHECK(detail::checked_length(limit) == std::numeric_limits<int32_t>::max());
    CHECK_THROWS_AS(detail::checked_length(limit + 1), std::runtime_error);
}
