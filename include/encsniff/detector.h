#pragma once

#include <encsniff/charset_decoder.h>
#include <encsniff/encoding.h>

#include <cstddef>
#include <filesystem>
#include <span>

namespace encsniff {

enum class BomOrder : uint8_t {
    longest_first,  // UTF-32 patterns are tried before UTF-16
    legacy,         // UTF-8, UTF-16BE, UTF-16LE, UTF-32BE, UTF-32LE
};

struct DetectorConfig {
    BomOrder bom_order = BomOrder::longest_first;

    // Decoder used to score JIS / Shift_JIS / EUC-JP. Not owned; must
    // outlive the call. nullptr selects the built-in ICU decoder.
    const CharsetDecoder* decoder = nullptr;
};

// Detect the encoding of an in-memory buffer. The result is defined for
// every input; an empty buffer yields UTF-8 without BOM. Only std::bad_alloc,
// or an exception thrown by a caller-supplied decoder, can escape.
EncodingLabel detect_encoding(std::span<const std::byte> data,
                              const DetectorConfig& config = {});

// Map the file and detect its encoding. I/O errors propagate as
// std::runtime_error.
EncodingLabel detect_encoding(const std::filesystem::path& path,
                              const DetectorConfig& config = {});

// Detection result together with the payload following the BOM (if any).
struct BomResult {
    std::span<const std::byte> data;  // data after skipping BOM
    EncodingLabel label;
};

BomResult skip_bom(std::span<const std::byte> data,
                   const DetectorConfig& config = {});

} // namespace encsniff
