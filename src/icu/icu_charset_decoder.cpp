#include "icu_charset_decoder.h"

#include <unicode/utf16.h>

#include <atomic>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <string>

namespace encsniff::detail {

ConverterPtr open_converter(const char* name) {
    UErrorCode status = U_ZERO_ERROR;
    ConverterPtr cnv(ucnv_open(name, &status));
    if (U_FAILURE(status) || !cnv) {
        throw std::runtime_error(std::string("cannot open converter '") + name +
                                 "': " + u_errorName(status));
    }
    return cnv;
}

int32_t checked_length(std::size_t size) {
    if (size > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
        throw std::runtime_error("buffer of " + std::to_string(size) +
                                 " bytes is too large for ICU");
    }
    return static_cast<int32_t>(size);
}

bool first_missing_report(LegacyCharset charset) {
    static std::array<std::atomic<bool>, kLegacyCharsets.size()> reported{};
    return !reported[static_cast<std::size_t>(charset)].exchange(true);
}

IcuCharsetDecoder::IcuCharsetDecoder() {
    for (std::size_t i = 0; i < kLegacyCharsets.size(); ++i) {
        std::string name(charset_name(kLegacyCharsets[i]));
        try {
            converters_[i] = open_converter(name.c_str());
        } catch (const std::exception& e) {
            if (!first_missing_report(kLegacyCharsets[i])) continue;
            std::fprintf(stderr, "encsniff: skipping charset %s: %s\n",
                         name.c_str(), e.what());
        }
    }
}

UConverter* IcuCharsetDecoder::converter(LegacyCharset charset) const {
    return converters_[static_cast<std::size_t>(charset)].get();
}

bool IcuCharsetDecoder::available(LegacyCharset charset) const {
    return converter(charset) != nullptr;
}

PairOutcome IcuCharsetDecoder::classify_pair(LegacyCharset charset,
                                             std::byte b1, std::byte b2) const {
    UConverter* cnv = converter(charset);
    if (!cnv) return PairOutcome::definite_non_match;

    // ucnv_toUChars() resets the converter, so each pair is decoded from
    // the initial state and flushed. Malformed input goes through the
    // default substitute callback.
    const char src[2] = {static_cast<char>(b1), static_cast<char>(b2)};
    UChar dest[8];
    UErrorCode status = U_ZERO_ERROR;
    int32_t len = ucnv_toUChars(cnv, dest, 8, src, 2, &status);
    if (U_FAILURE(status)) return PairOutcome::definite_non_match;

    if (len == 1 && !U16_IS_SURROGATE(dest[0])) return PairOutcome::hit;
    return PairOutcome::miss;
}

} // namespace encsniff::detail
