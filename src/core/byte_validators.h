#pragma once

#include <cstddef>
#include <span>

namespace encsniff::detail {

// True if `data` splits into well-formed 1-4 byte UTF-8 sequences. A byte
// that is neither ASCII nor a lead byte (e.g. a stray continuation byte)
// is skipped rather than rejected. A lead byte without enough remaining
// bytes is rejected.
bool is_utf8_without_bom(std::span<const std::byte> data);

// True if any byte has the high bit set.
bool has_high_bit(std::span<const std::byte> data);

// True if no byte is ESC (0x1B) or has the high bit set. Only meaningful
// once the Unicode checks have failed.
bool is_ascii(std::span<const std::byte> data);

} // namespace encsniff::detail
