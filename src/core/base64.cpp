#include "core/base64.hpp"

#include <mbedtls/base64.h>

#include <string>

namespace camgate::core {

namespace {

std::string DescribeMbedtlsError(int rc) {
  switch (rc) {
  case MBEDTLS_ERR_BASE64_INVALID_CHARACTER:
    return "base64 input contains an invalid character";
  case MBEDTLS_ERR_BASE64_BUFFER_TOO_SMALL:
    return "base64 output buffer too small";
  default:
    return "base64 conversion failed (mbedtls error " + std::to_string(rc) + ")";
  }
}

} // namespace

std::string Base64Encode(std::string_view bytes) {
  if (bytes.empty()) {
    return {};
  }
  // mbedtls writes a terminating NUL after the encoded text.
  std::string out(4U * ((bytes.size() + 2U) / 3U) + 1U, '\0');
  std::size_t produced = 0;
  const int rc = mbedtls_base64_encode(reinterpret_cast<unsigned char*>(out.data()), out.size(),
                                       &produced,
                                       reinterpret_cast<const unsigned char*>(bytes.data()),
                                       bytes.size());
  if (rc != 0) {
    return {};
  }
  out.resize(produced);
  return out;
}

bool Base64Decode(std::string_view text, std::string& bytes, std::string& error) {
  bytes.clear();
  error.clear();
  if (text.empty()) {
    return true;
  }

  // mbedtls skips line breaks and spaces; chunk bodies never contain them.
  for (const char ch : text) {
    if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n') {
      error = "base64 input contains whitespace";
      return false;
    }
  }

  std::string padded(text);
  if (padded.size() % 4U == 1U) {
    error = "base64 input has an invalid length";
    return false;
  }
  while (padded.size() % 4U != 0U) {
    padded.push_back('=');
  }

  bytes.resize((padded.size() / 4U) * 3U);
  std::size_t produced = 0;
  const int rc = mbedtls_base64_decode(reinterpret_cast<unsigned char*>(bytes.data()), bytes.size(),
                                       &produced,
                                       reinterpret_cast<const unsigned char*>(padded.data()),
                                       padded.size());
  if (rc != 0) {
    bytes.clear();
    error = DescribeMbedtlsError(rc);
    return false;
  }
  bytes.resize(produced);
  return true;
}

} // namespace camgate::core
