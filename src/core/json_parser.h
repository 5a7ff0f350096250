// Minimal flat-object JSON parser for config input (no external dependencies).
//
// Handles only the subset needed for DiscoveryConfig files: a flat object
// with string, number, boolean and null values. Nested objects and arrays
// are skipped.

#ifndef REPAT_CORE_JSON_PARSER_H
#define REPAT_CORE_JSON_PARSER_H

#include <cstddef>
#include <map>
#include <string>

namespace repat {

/// @brief A single JSON value (string, number, boolean or null).
struct JsonValue {
  enum Type { String, Number, Bool, Null };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;

  double asDouble(double default_val = 0.0) const {
    return type == Number ? number_val : default_val;
  }
  int asInt(int default_val = 0) const {
    return type == Number ? static_cast<int>(number_val) : default_val;
  }
  bool asBool(bool default_val = false) const { return type == Bool ? bool_val : default_val; }
  std::string asString(const std::string& default_val = "") const {
    return type == String ? string_val : default_val;
  }
};

using JsonObject = std::map<std::string, JsonValue>;

/// @brief Parse a flat JSON object into a key-value map.
///
/// @param json JSON text.
/// @param out Receives the parsed entries (cleared first).
/// @param error Receives the reason on failure.
/// @return True on success.
bool parseJsonObject(const std::string& json, JsonObject& out, std::string& error);

}  // namespace repat

#endif  // REPAT_CORE_JSON_PARSER_H
