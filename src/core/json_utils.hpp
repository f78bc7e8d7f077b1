#ifndef CAMGATE_CORE_JSON_UTILS_HPP_
#define CAMGATE_CORE_JSON_UTILS_HPP_

#include <cstddef>
#include <string>
#include <string_view>

namespace camgate::core {

namespace detail {

// Length of the well-formed UTF-8 sequence starting at `input[pos]`, or 0 when
// the bytes there are not one (stray continuation, overlong form, surrogate,
// code point above U+10FFFF, truncated sequence).
inline std::size_t Utf8SequenceLength(std::string_view input, std::size_t pos) {
  const auto byte_at = [&input](std::size_t i) { return static_cast<unsigned char>(input[i]); };
  const unsigned char lead = byte_at(pos);
  std::size_t length = 0;
  unsigned char min_second = 0x80U;
  unsigned char max_second = 0xBFU;
  if (lead >= 0xC2U && lead <= 0xDFU) {
    length = 2;
  } else if (lead >= 0xE0U && lead <= 0xEFU) {
    length = 3;
    if (lead == 0xE0U) {
      min_second = 0xA0U;
    } else if (lead == 0xEDU) {
      max_second = 0x9FU;
    }
  } else if (lead >= 0xF0U && lead <= 0xF4U) {
    length = 4;
    if (lead == 0xF0U) {
      min_second = 0x90U;
    } else if (lead == 0xF4U) {
      max_second = 0x8FU;
    }
  } else {
    return 0;
  }

  if (pos + length > input.size()) {
    return 0;
  }
  const unsigned char second = byte_at(pos + 1);
  if (second < min_second || second > max_second) {
    return 0;
  }
  for (std::size_t i = 2; i < length; ++i) {
    const unsigned char next = byte_at(pos + i);
    if (next < 0x80U || next > 0xBFU) {
      return 0;
    }
  }
  return length;
}

} // namespace detail

// Shared JSON string escaping for every response body the control API renders.
// Bytes that are not well-formed UTF-8 become U+FFFD, one per byte, so any
// input yields a valid JSON string.
inline std::string EscapeJson(std::string_view input) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(input.size() + 2U);
  std::size_t pos = 0;
  while (pos < input.size()) {
    const char ch = input[pos];
    const auto as_unsigned = static_cast<unsigned char>(ch);
    if (as_unsigned >= 0x80U) {
      const std::size_t length = detail::Utf8SequenceLength(input, pos);
      if (length == 0U) {
        out += "\\ufffd";
        ++pos;
      } else {
        out.append(input.substr(pos, length));
        pos += length;
      }
      continue;
    }

    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (as_unsigned < 0x20U || as_unsigned == 0x7FU) {
        out += "\\u00";
        out.push_back(kHex[(as_unsigned >> 4U) & 0x0FU]);
        out.push_back(kHex[as_unsigned & 0x0FU]);
      } else {
        out.push_back(ch);
      }
      break;
    }
    ++pos;
  }
  return out;
}

// Markup escaping applied to free text (messages, log bodies) before it is
// embedded in a response, so clients that render it as HTML show it verbatim.
inline std::string EscapeMarkup(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (const char ch : input) {
    switch (ch) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&#x27;";
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  return out;
}

// Quoted JSON string literal.
inline std::string JsonString(std::string_view input) {
  return "\"" + EscapeJson(input) + "\"";
}

inline const char* JsonBool(bool value) {
  return value ? "true" : "false";
}

} // namespace camgate::core

#endif // CAMGATE_CORE_JSON_UTILS_HPP_
