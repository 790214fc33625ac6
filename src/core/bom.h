#pragma once

#include <encsniff/detector.h>
#include <encsniff/encoding.h>

#include <cstddef>
#include <optional>
#include <span>

namespace encsniff::detail {

// Match a Unicode byte-order mark at the start of `data`. With
// BomOrder::longest_first the 4-byte UTF-32 marks are tried before the
// 2-byte UTF-16 marks, so FF FE 00 00 is UTF-32LE rather than UTF-16LE.
std::optional<EncodingLabel> match_bom(std::span<const std::byte> data,
                                       BomOrder order);

// 2B 2F 76 followed by one of 38, 39, 2B, 2F.
bool has_utf7_signature(std::span<const std::byte> data);

} // namespace encsniff::detail
