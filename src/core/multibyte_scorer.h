#pragma once

#include <encsniff/charset_decoder.h>

#include <cstddef>
#include <optional>
#include <span>

namespace encsniff::detail {

struct MultibyteCounts {
    std::size_t jis = 0;
    std::size_t shift_jis = 0;
    std::size_t euc_jp = 0;

    std::size_t& operator[](LegacyCharset charset);
    std::size_t operator[](LegacyCharset charset) const;
};

// Count the byte pairs (overlapping windows) that decode to a single
// character in `charset`. A definite_non_match from the decoder zeroes
// the count and ends the scan.
std::size_t count_multibyte(std::span<const std::byte> data,
                            LegacyCharset charset,
                            const CharsetDecoder& decoder);

MultibyteCounts score_multibyte(std::span<const std::byte> data,
                                const CharsetDecoder& decoder);

// Charset with the highest count; ties go to JIS, then Shift_JIS, then
// EUC-JP. nullopt when every count is zero.
std::optional<LegacyCharset> pick_legacy(const MultibyteCounts& counts);

} // namespace encsniff::detail
