#pragma once

#include <encsniff/detector.h>
#include <encsniff/encoding.h>

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>

namespace encsniff {

// Convert `data` (including any BOM) from `label` to UTF-8. Malformed
// sequences become U+FFFD. Throws std::runtime_error if the converter
// cannot be opened or the conversion fails outright.
std::string decode_to_utf8(std::span<const std::byte> data,
                           const EncodingLabel& label);

struct DecodedFile {
    EncodingLabel label;
    std::string text;  // UTF-8, BOM removed
};

// Map the file, detect its encoding and decode it to UTF-8. I/O and
// conversion errors propagate as std::runtime_error.
DecodedFile decode_file(const std::filesystem::path& path,
                        const DetectorConfig& config = {});

} // namespace encsniff
