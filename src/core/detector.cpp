#include <encsniff/detector.h>

#include "../icu/icu_charset_decoder.h"
#include "../io/mapped_file.h"
#include "bom.h"
#include "byte_validators.h"
#include "multibyte_scorer.h"

#include <optional>

namespace encsniff {

namespace {

EncodingLabel to_label(LegacyCharset charset) {
    switch (charset) {
    case LegacyCharset::jis:       return EncodingLabel::jis();
    case LegacyCharset::shift_jis: return EncodingLabel::shift_jis();
    case LegacyCharset::euc_jp:    break;
    }
    return EncodingLabel::euc_jp();
}

} // namespace

EncodingLabel detect_encoding(std::span<const std::byte> data,
                              const DetectorConfig& config) {
    if (auto bom = detail::match_bom(data, config.bom_order)) {
        return *bom;
    }

    if (detail::has_utf7_signature(data)) {
        return EncodingLabel::utf7();
    }

    // Seven-bit input is left to the ASCII and ISO-2022-JP stages; only an
    // empty buffer or one with real multi-byte sequences is UTF-8 here.
    if ((data.empty() || detail::has_high_bit(data)) &&
        detail::is_utf8_without_bom(data)) {
        return EncodingLabel::utf8(false);
    }

    if (detail::is_ascii(data)) {
        return EncodingLabel::ascii();
    }

    std::optional<detail::IcuCharsetDecoder> icu_decoder;
    const CharsetDecoder* decoder = config.decoder;
    if (!decoder) {
        decoder = &icu_decoder.emplace();
    }

    auto counts = detail::score_multibyte(data, *decoder);
    if (auto charset = detail::pick_legacy(counts)) {
        return to_label(*charset);
    }

    // Nothing scored: assume UTF-8 without BOM.
    return EncodingLabel::utf8(false);
}

EncodingLabel detect_encoding(const std::filesystem::path& path,
                              const DetectorConfig& config) {
    detail::MappedFile file(path);
    return detect_encoding(file.data(), config);
}

BomResult skip_bom(std::span<const std::byte> data,
                   const DetectorConfig& config) {
    auto label = detect_encoding(data, config);
    return {data.subspan(bom_length(label)), label};
}

} // namespace encsniff
