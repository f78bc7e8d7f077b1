#include "core/json_record.hpp"

#include <cctype>
#include <charconv>
#include <system_error>
#include <utility>

namespace camgate::core::json {

namespace {

// Single-pass reader over the input with column-based diagnostics.
class Cursor {
public:
  explicit Cursor(std::string_view input) : input_(input) {}

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  char Peek() const {
    return input_[pos_];
  }

  char Next() {
    return input_[pos_++];
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      ++pos_;
    }
  }

  bool Consume(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    ++pos_;
    return true;
  }

  bool ConsumeWord(std::string_view word) {
    if (input_.substr(pos_, word.size()) != word) {
      return false;
    }
    pos_ += word.size();
    return true;
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "json error at offset " + std::to_string(pos_) + ": " + std::string(message);
    return false;
  }

  bool ReadString(std::string& output, std::string& error) {
    output.clear();
    if (!Consume('"')) {
      return Fail("expected string", error);
    }
    while (!AtEnd()) {
      const char c = Next();
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("raw control character in string", error);
      }
      if (c != '\\') {
        output.push_back(c);
        continue;
      }
      if (AtEnd()) {
        break;
      }
      const char escape = Next();
      switch (escape) {
      case '"':
      case '\\':
      case '/':
        output.push_back(escape);
        break;
      case 'b':
        output.push_back('\b');
        break;
      case 'f':
        output.push_back('\f');
        break;
      case 'n':
        output.push_back('\n');
        break;
      case 'r':
        output.push_back('\r');
        break;
      case 't':
        output.push_back('\t');
        break;
      case 'u':
        if (!ReadUnicodeEscape(output, error)) {
          return false;
        }
        break;
      default:
        return Fail("invalid escape sequence", error);
      }
    }
    return Fail("unterminated string", error);
  }

  bool ReadInteger(std::int64_t& value, std::string& error) {
    const std::size_t start = pos_;
    (void)Consume('-');
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      ++pos_;
    }
    if (!AtEnd() && (Peek() == '.' || Peek() == 'e' || Peek() == 'E')) {
      return Fail("fractional numbers are not supported", error);
    }
    const std::string_view token = input_.substr(start, pos_ - start);
    const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc() || ptr != token.data() + token.size()) {
      return Fail("invalid integer", error);
    }
    return true;
  }

private:
  // Code points up to U+FFFF, re-encoded as UTF-8. Surrogate pairs are not
  // produced by the control API and are rejected.
  bool ReadUnicodeEscape(std::string& output, std::string& error) {
    if (pos_ + 4U > input_.size()) {
      return Fail("truncated unicode escape", error);
    }
    unsigned int code = 0;
    const std::string_view digits = input_.substr(pos_, 4U);
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), code, 16);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
      return Fail("invalid unicode escape", error);
    }
    pos_ += 4U;
    if (code >= 0xD800U && code <= 0xDFFFU) {
      return Fail("surrogate unicode escapes are not supported", error);
    }

    if (code < 0x80U) {
      output.push_back(static_cast<char>(code));
    } else if (code < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (code >> 6U)));
      output.push_back(static_cast<char>(0x80U | (code & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xE0U | (code >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((code >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code & 0x3FU)));
    }
    return true;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
};

bool ReadScalar(Cursor& cursor, Scalar& scalar, std::string& error) {
  if (cursor.AtEnd()) {
    return cursor.Fail("expected value", error);
  }
  const char c = cursor.Peek();
  if (c == '"') {
    scalar.type = Scalar::Type::kString;
    return cursor.ReadString(scalar.string_value, error);
  }
  if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
    scalar.type = Scalar::Type::kInteger;
    return cursor.ReadInteger(scalar.integer_value, error);
  }
  if (cursor.ConsumeWord("true")) {
    scalar.type = Scalar::Type::kBool;
    scalar.bool_value = true;
    return true;
  }
  if (cursor.ConsumeWord("false")) {
    scalar.type = Scalar::Type::kBool;
    scalar.bool_value = false;
    return true;
  }
  if (cursor.ConsumeWord("null")) {
    scalar.type = Scalar::Type::kNull;
    return true;
  }
  if (c == '{' || c == '[') {
    return cursor.Fail("nested values are not supported", error);
  }
  return cursor.Fail("expected value", error);
}

} // namespace

bool Record::Parse(std::string_view text, std::string& error) {
  fields_.clear();
  Cursor cursor(text);

  cursor.SkipWhitespace();
  if (!cursor.Consume('{')) {
    return cursor.Fail("expected '{'", error);
  }
  cursor.SkipWhitespace();
  if (!cursor.Consume('}')) {
    while (true) {
      cursor.SkipWhitespace();
      std::string key;
      if (!cursor.ReadString(key, error)) {
        return false;
      }
      cursor.SkipWhitespace();
      if (!cursor.Consume(':')) {
        return cursor.Fail("expected ':' after key", error);
      }
      cursor.SkipWhitespace();
      Scalar scalar;
      if (!ReadScalar(cursor, scalar, error)) {
        return false;
      }
      fields_[key] = std::move(scalar);

      cursor.SkipWhitespace();
      if (cursor.Consume('}')) {
        break;
      }
      if (!cursor.Consume(',')) {
        return cursor.Fail("expected ',' or '}'", error);
      }
    }
  }

  cursor.SkipWhitespace();
  if (!cursor.AtEnd()) {
    return cursor.Fail("trailing content after object", error);
  }
  return true;
}

bool Record::Has(const std::string& key) const {
  return fields_.find(key) != fields_.end();
}

const Scalar* Record::Find(const std::string& key, Scalar::Type type, std::string& error) const {
  const auto it = fields_.find(key);
  if (it == fields_.end()) {
    error = "missing field '" + key + "'";
    return nullptr;
  }
  if (it->second.type != type) {
    error = "field '" + key + "' has an unexpected type";
    return nullptr;
  }
  return &it->second;
}

bool Record::GetString(const std::string& key, std::string& value, std::string& error) const {
  const Scalar* scalar = Find(key, Scalar::Type::kString, error);
  if (scalar == nullptr) {
    return false;
  }
  value = scalar->string_value;
  return true;
}

bool Record::GetInteger(const std::string& key, std::int64_t& value, std::string& error) const {
  const Scalar* scalar = Find(key, Scalar::Type::kInteger, error);
  if (scalar == nullptr) {
    return false;
  }
  value = scalar->integer_value;
  return true;
}

bool Record::GetBool(const std::string& key, bool& value, std::string& error) const {
  const Scalar* scalar = Find(key, Scalar::Type::kBool, error);
  if (scalar == nullptr) {
    return false;
  }
  value = scalar->bool_value;
  return true;
}

} // namespace camgate::core::json
