#pragma once

#include <string>
#include <string_view>

namespace camgate::core {

// Standard (RFC 4648) base64 with '=' padding, used for chunk bodies.
std::string Base64Encode(std::string_view bytes);

// Accepts padded or unpadded input. Whitespace is rejected.
bool Base64Decode(std::string_view text, std::string& bytes, std::string& error);

} // namespace camgate::core
