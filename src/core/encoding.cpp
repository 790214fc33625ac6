#include <encsniff/charset_decoder.h>
#include <encsniff/encoding.h>

namespace encsniff {

std::string_view to_string(const EncodingLabel& label) {
    bool le = label.endianness == Endianness::little;
    switch (label.encoding) {
    case Encoding::utf8:      return label.bom ? "UTF-8 (BOM)" : "UTF-8";
    case Encoding::utf16:     return le ? "UTF-16LE" : "UTF-16BE";
    case Encoding::utf32:     return le ? "UTF-32LE" : "UTF-32BE";
    case Encoding::utf7:      return "UTF-7";
    case Encoding::ascii:     return "US-ASCII";
    case Encoding::jis:       return "ISO-2022-JP";
    case Encoding::shift_jis: return "Shift_JIS";
    case Encoding::euc_jp:    return "EUC-JP";
    }
    return "UTF-8";
}

std::string_view charset_name(const EncodingLabel& label) {
    bool le = label.endianness == Endianness::little;
    switch (label.encoding) {
    case Encoding::utf8:      return "UTF-8";
    case Encoding::utf16:     return le ? "UTF-16LE" : "UTF-16BE";
    case Encoding::utf32:     return le ? "UTF-32LE" : "UTF-32BE";
    case Encoding::utf7:      return "UTF-7";
    case Encoding::ascii:     return "US-ASCII";
    case Encoding::jis:       return charset_name(LegacyCharset::jis);
    case Encoding::shift_jis: return charset_name(LegacyCharset::shift_jis);
    case Encoding::euc_jp:    return charset_name(LegacyCharset::euc_jp);
    }
    return "UTF-8";
}

std::string_view charset_name(LegacyCharset charset) {
    switch (charset) {
    case LegacyCharset::jis:       return "ISO-2022-JP";
    case LegacyCharset::shift_jis: return "Shift_JIS";
    case LegacyCharset::euc_jp:    return "EUC-JP";
    }
    return "ISO-2022-JP";
}

std::size_t bom_length(const EncodingLabel& label) {
    switch (label.encoding) {
    case Encoding::utf8:  return label.bom ? 3 : 0;
    case Encoding::utf16: return 2;
    case Encoding::utf32: return 4;
    default:              return 0;
    }
}

} // namespace encsniff
