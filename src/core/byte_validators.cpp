#include "byte_validators.h"

#include <cstdint>

namespace encsniff::detail {

namespace {

bool is_continuation(std::byte b) {
    return (static_cast<uint8_t>(b) & 0xC0) == 0x80;
}

// Number of bytes in the sequence introduced by `lead`, or 0 if `lead`
// is not a lead byte.
std::size_t sequence_length(uint8_t lead) {
    if ((lead & 0x80) == 0x00) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

} // namespace

bool is_utf8_without_bom(std::span<const std::byte> data) {
    std::size_t i = 0;
    while (i < data.size()) {
        std::size_t len = sequence_length(static_cast<uint8_t>(data[i]));
        if (len == 0) {
            ++i;
            continue;
        }
        if (len > data.size() - i) return false;
        for (std::size_t k = 1; k < len; ++k) {
            if (!is_continuation(data[i + k])) return false;
        }
        i += len;
    }
    return true;
}

bool has_high_bit(std::span<const std::byte> data) {
    for (auto b : data) {
        if ((static_cast<uint8_t>(b) & 0x80) != 0) return true;
    }
    return false;
}

bool is_ascii(std::span<const std::byte> data) {
    for (auto b : data) {
        uint8_t v = static_cast<uint8_t>(b);
        if (v == 0x1B || v >= 0x80) return false;
    }
    return true;
}

} // namespace encsniff::detail
