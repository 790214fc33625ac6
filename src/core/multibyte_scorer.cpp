#include "multibyte_scorer.h"

namespace encsniff::detail {

std::size_t& MultibyteCounts::operator[](LegacyCharset charset) {
    switch (charset) {
    case LegacyCharset::jis:       return jis;
    case LegacyCharset::shift_jis: return shift_jis;
    case LegacyCharset::euc_jp:    break;
    }
    return euc_jp;
}

std::size_t MultibyteCounts::operator[](LegacyCharset charset) const {
    switch (charset) {
    case LegacyCharset::jis:       return jis;
    case LegacyCharset::shift_jis: return shift_jis;
    case LegacyCharset::euc_jp:    break;
    }
    return euc_jp;
}

std::size_t count_multibyte(std::span<const std::byte> data,
                            LegacyCharset charset,
                            const CharsetDecoder& decoder) {
    std::size_t count = 0;
    for (std::size_t i = 0; i + 1 < data.size(); ++i) {
        switch (decoder.classify_pair(charset, data[i], data[i + 1])) {
        case PairOutcome::hit:
            ++count;
            break;
        case PairOutcome::miss:
            break;
        case PairOutcome::definite_non_match:
            return 0;
        }
    }
    return count;
}

MultibyteCounts score_multibyte(std::span<const std::byte> data,
                                const CharsetDecoder& decoder) {
    MultibyteCounts counts;
    for (auto charset : kLegacyCharsets) {
        counts[charset] = count_multibyte(data, charset, decoder);
    }
    return counts;
}

std::optional<LegacyCharset> pick_legacy(const MultibyteCounts& counts) {
    std::optional<LegacyCharset> best;
    std::size_t best_count = 0;
    for (auto charset : kLegacyCharsets) {
        // Strictly greater, so the earlier charset keeps a tie.
        if (counts[charset] > best_count) {
            best = charset;
            best_count = counts[charset];
        }
    }
    return best;
}

} // namespace encsniff::detail
