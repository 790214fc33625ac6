#pragma once

#include <encsniff/charset_decoder.h>

#include <unicode/ucnv.h>

#include <array>
#include <cstdint>
#include <memory>

namespace encsniff::detail {

struct ConverterCloser {
    void operator()(UConverter* cnv) const { ucnv_close(cnv); }
};

using ConverterPtr = std::unique_ptr<UConverter, ConverterCloser>;

// Opens an ICU converter, throwing std::runtime_error on failure.
ConverterPtr open_converter(const char* name);

// Narrow a buffer length to ICU's int32_t, throwing std::runtime_error if
// it does not fit.
int32_t checked_length(std::size_t size);

// True the first time it is called for `charset` in this process. Used so
// a missing converter is reported once, not on every detection.
bool first_missing_report(LegacyCharset charset);

// CharsetDecoder backed by ICU converters, one per legacy charset. A
// converter that cannot be opened is reported on stderr (once per process)
// and makes every pair of that charset a definite_non_match.
//
// Not thread-safe: converters carry state between calls. Create one per
// detection.
class IcuCharsetDecoder : public CharsetDecoder {
public:
    IcuCharsetDecoder();

    IcuCharsetDecoder(const IcuCharsetDecoder&) = delete;
    IcuCharsetDecoder& operator=(const IcuCharsetDecoder&) = delete;

    PairOutcome classify_pair(LegacyCharset charset,
                              std::byte b1, std::byte b2) const override;

    bool available(LegacyCharset charset) const;

private:
    UConverter* converter(LegacyCharset charset) const;

    std::array<ConverterPtr, kLegacyCharsets.size()> converters_;
};

} // namespace encsniff::detail
