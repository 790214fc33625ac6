#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace encsniff {

enum class LegacyCharset : uint8_t {
    jis,
    shift_jis,
    euc_jp,
};

// Scoring order; also the tie-break order.
inline constexpr std::array<LegacyCharset, 3> kLegacyCharsets = {
    LegacyCharset::jis,
    LegacyCharset::shift_jis,
    LegacyCharset::euc_jp,
};

std::string_view charset_name(LegacyCharset charset);

enum class PairOutcome : uint8_t {
    hit,                 // decodes to exactly one non-surrogate character
    miss,                // decodes to something else
    definite_non_match,  // the converter itself failed
};

class CharsetDecoder {
public:
    virtual ~CharsetDecoder() = default;

    // Decode the two bytes as a standalone sequence in `charset`.
    virtual PairOutcome classify_pair(LegacyCharset charset,
                                      std::byte b1, std::byte b2) const = 0;
};

} // namespace encsniff
