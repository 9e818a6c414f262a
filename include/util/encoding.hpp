#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace encoding
{

// Standard alphabet with '=' padding, the form frames are displayed in.
std::string b64_encode(const std::uint8_t *data, std::size_t len);
bool        b64_decode(std::string_view text, std::vector<std::uint8_t> &out);

std::string hex_encode(const std::uint8_t *data, std::size_t len);
// Rejects odd lengths and non-hex characters; out is cleared on failure.
bool        hex_decode(std::string_view text, std::vector<std::uint8_t> &out);

}  // namespace encoding
