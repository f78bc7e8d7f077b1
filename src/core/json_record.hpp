#ifndef CAMGATE_CORE_JSON_RECORD_HPP_
#define CAMGATE_CORE_JSON_RECORD_HPP_

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace camgate::core::json {

// One scalar field of a flat JSON object.
struct Scalar {
  enum class Type {
    kString,
    kInteger,
    kBool,
    kNull,
  };

  Type type = Type::kNull;
  std::string string_value;
  std::int64_t integer_value = 0;
  bool bool_value = false;
};

// Flat JSON object (string keys, scalar values) as produced by the control
// API. Nested objects, arrays and fractional numbers are rejected.
class Record {
public:
  bool Parse(std::string_view text, std::string& error);

  bool Has(const std::string& key) const;
  bool GetString(const std::string& key, std::string& value, std::string& error) const;
  bool GetInteger(const std::string& key, std::int64_t& value, std::string& error) const;
  bool GetBool(const std::string& key, bool& value, std::string& error) const;

  const std::map<std::string, Scalar>& fields() const {
    return fields_;
  }

private:
  const Scalar* Find(const std::string& key, Scalar::Type type, std::string& error) const;

  std::map<std::string, Scalar> fields_;
};

} // namespace camgate::core::json

#endif // CAMGATE_CORE_JSON_RECORD_HPP_
