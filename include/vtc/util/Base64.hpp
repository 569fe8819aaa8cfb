#pragma once

/**
 * Base64.hpp - Base64 encoding for image data URLs
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vtc::util {

std::string base64Encode(const std::vector<uint8_t>& data);

/// Returns nullopt on characters outside the alphabet or bad padding.
std::optional<std::vector<uint8_t>> base64Decode(const std::string& text);

} // namespace vtc::util
