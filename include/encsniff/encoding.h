#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace encsniff {

enum class Encoding : uint8_t {
    utf8,
    utf16,
    utf32,
    utf7,
    ascii,
    jis,        // ISO-2022-JP
    shift_jis,
    euc_jp,
};

enum class Endianness : uint8_t {
    big,
    little,
};

// Result of detection. `bom` only applies to UTF-8, `endianness` only to
// UTF-16/32 (which are always reported with their BOM).
struct EncodingLabel {
    Encoding encoding = Encoding::utf8;
    bool bom = false;
    Endianness endianness = Endianness::big;

    static constexpr EncodingLabel utf8(bool with_bom) {
        return {Encoding::utf8, with_bom, Endianness::big};
    }
    static constexpr EncodingLabel utf16(Endianness e) {
        return {Encoding::utf16, true, e};
    }
    static constexpr EncodingLabel utf32(Endianness e) {
        return {Encoding::utf32, true, e};
    }
    static constexpr EncodingLabel utf7()      { return {Encoding::utf7}; }
    static constexpr EncodingLabel ascii()     { return {Encoding::ascii}; }
    static constexpr EncodingLabel jis()       { return {Encoding::jis}; }
    static constexpr EncodingLabel shift_jis() { return {Encoding::shift_jis}; }
    static constexpr EncodingLabel euc_jp()    { return {Encoding::euc_jp}; }

    bool operator==(const EncodingLabel&) const = default;
};

// Human-readable name, e.g. "UTF-8 (BOM)" or "UTF-16LE".
std::string_view to_string(const EncodingLabel& label);

// Converter name suitable for ICU's ucnv_open().
std::string_view charset_name(const EncodingLabel& label);

// Number of leading signature bytes that are not part of the text.
std::size_t bom_length(const EncodingLabel& label);

} // namespace encsniff
