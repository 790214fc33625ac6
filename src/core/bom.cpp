#include "bom.h"

#include <array>
#include <cstdint>

namespace encsniff::detail {

namespace {

struct BomPattern {
    std::array<uint8_t, 4> bytes;
    std::size_t length;
    EncodingLabel label;
};

constexpr BomPattern kUtf8    {{0xEF, 0xBB, 0xBF, 0x00}, 3, EncodingLabel::utf8(true)};
constexpr BomPattern kUtf16BE {{0xFE, 0xFF, 0x00, 0x00}, 2, EncodingLabel::utf16(Endianness::big)};
constexpr BomPattern kUtf16LE {{0xFF, 0xFE, 0x00, 0x00}, 2, EncodingLabel::utf16(Endianness::little)};
constexpr BomPattern kUtf32BE {{0x00, 0x00, 0xFE, 0xFF}, 4, EncodingLabel::utf32(Endianness::big)};
constexpr BomPattern kUtf32LE {{0xFF, 0xFE, 0x00, 0x00}, 4, EncodingLabel::utf32(Endianness::little)};

// Sorted by descending pattern length.
constexpr std::array<BomPattern, 5> kLongestFirst = {
    kUtf32BE, kUtf32LE, kUtf8, kUtf16BE, kUtf16LE,
};

constexpr std::array<BomPattern, 5> kLegacyOrder = {
    kUtf8, kUtf16BE, kUtf16LE, kUtf32BE, kUtf32LE,
};

bool starts_with(std::span<const std::byte> data, const BomPattern& p) {
    if (data.size() < p.length) return false;
    for (std::size_t i = 0; i < p.length; ++i) {
        if (data[i] != std::byte{p.bytes[i]}) return false;
    }
    return true;
}

} // namespace

std::optional<EncodingLabel> match_bom(std::span<const std::byte> data,
                                       BomOrder order) {
    const auto& patterns = order == BomOrder::legacy ? kLegacyOrder : kLongestFirst;
    for (const auto& p : patterns) {
        if (starts_with(data, p)) return p.label;
    }
    return std::nullopt;
}

bool has_utf7_signature(std::span<const std::byte> data) {
    if (data.size() < 4) return false;
    if (data[0] != std::byte{0x2B} ||
        data[1] != std::byte{0x2F} ||
        data[2] != std::byte{0x76}) {
        return false;
    }

    switch (static_cast<uint8_t>(data[3])) {
    case 0x38:
    case 0x39:
    case 0x2B:
    case 0x2F:
        return true;
    default:
        return false;
    }
}

} // namespace encsniff::detail
