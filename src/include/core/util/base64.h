#pragma once

#include <core/util/binary_data.h>
#include <optional>
#include <string>
#include <string_view>

namespace edgegate::core {

namespace base64 {

// Standard alphabet with padding. ASCII whitespace in the input is skipped;
// any other character outside the alphabet, or a bad length, fails.
std::optional<BinaryData> Decode(std::string_view input);

std::string Encode(const BinaryData& data);

// Unpadded URL-safe alphabet, as used by JWT segments.
std::optional<BinaryData> DecodeUrl(std::string_view input);

std::string EncodeUrl(const BinaryData& data);

} // namespace base64

} // namespace edgegate::core
