#include <encsniff/transcode.h>

#include "../io/mapped_file.h"
#include "icu_charset_decoder.h"

#include <unicode/ustring.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace encsniff {

namespace {

void check(UErrorCode status, const char* what) {
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("decode_to_utf8: ") + what +
                                 " failed: " + u_errorName(status));
    }
}

std::vector<UChar> to_utf16(UConverter* cnv, std::span<const std::byte> payload) {
    const char* src = reinterpret_cast<const char*>(payload.data());
    auto src_len = detail::checked_length(payload.size());

    // Preflight for the output length.
    UErrorCode status = U_ZERO_ERROR;
    int32_t len = ucnv_toUChars(cnv, nullptr, 0, src, src_len, &status);
    if (status == U_BUFFER_OVERFLOW_ERROR) status = U_ZERO_ERROR;
    check(status, "ucnv_toUChars");

    std::vector<UChar> out(static_cast<std::size_t>(len) + 1);
    ucnv_toUChars(cnv, out.data(), detail::checked_length(out.size()),
                  src, src_len, &status);
    check(status, "ucnv_toUChars");
    out.resize(static_cast<std::size_t>(len));
    return out;
}

std::string to_utf8(const std::vector<UChar>& text) {
    auto text_len = detail::checked_length(text.size());

    UErrorCode status = U_ZERO_ERROR;
    int32_t len = 0;
    u_strToUTF8(nullptr, 0, &len, text.data(), text_len, &status);
    if (status == U_BUFFER_OVERFLOW_ERROR) status = U_ZERO_ERROR;
    check(status, "u_strToUTF8");

    std::string out(static_cast<std::size_t>(len), '\0');
    u_strToUTF8(out.data(), len, nullptr, text.data(), text_len, &status);
    if (status == U_STRING_NOT_TERMINATED_WARNING) status = U_ZERO_ERROR;
    check(status, "u_strToUTF8");
    return out;
}

} // namespace

std::string decode_to_utf8(std::span<const std::byte> data,
                           const EncodingLabel& label) {
    std::size_t skip = bom_length(label);
    auto payload = skip <= data.size() ? data.subspan(skip) : data;

    if (label.encoding == Encoding::utf8 || label.encoding == Encoding::ascii) {
        return std::string(reinterpret_cast<const char*>(payload.data()),
                           payload.size());
    }
    if (payload.empty()) return {};

    std::string name(charset_name(label));
    auto cnv = detail::open_converter(name.c_str());
    auto text = to_utf16(cnv.get(), payload);

    // The UTF-7 signature decodes to U+FEFF.
    if (label.encoding == Encoding::utf7 && !text.empty() && text.front() == 0xFEFF) {
        text.erase(text.begin());
    }
    return to_utf8(text);
}

DecodedFile decode_file(const std::filesystem::path& path,
                        const DetectorConfig& config) {
    detail::MappedFile file(path);
    auto label = detect_encoding(file.data(), config);
    return {label, decode_to_utf8(file.data(), label)};
}

} // namespace encsniff
