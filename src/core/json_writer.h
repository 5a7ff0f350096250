// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON text incrementally for pattern exports and CLI reports.
// Does not parse JSON; see json_parser.h for config input.

#ifndef REPAT_CORE_JSON_WRITER_H
#define REPAT_CORE_JSON_WRITER_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace repat {

/// @brief Incremental JSON writer with automatic comma placement.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("piece");
///   writer.value("bwv847");
///   writer.key("data");
///   writer.beginArray();
///   writer.value(0.5);
///   writer.endArray();
///   writer.endObject();
///   // -> {"piece":"bwv847","data":[0.5]}
/// @endcode
///
/// Does not validate structure (caller must match begin/end pairs).
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value or container).
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);
  void value(const char* val) { value(std::string_view(val)); }

  void value(int val) { value(static_cast<int64_t>(val)); }
  void value(int64_t val);
  void value(uint64_t val);

  /// @brief Write a double with the shortest text that reads back exactly.
  /// NaN and infinities are written as null.
  void value(double val);

  void value(bool val);
  void valueNull();

  /// @brief Write a two-element number array, e.g. a (onset, pitch) pair.
  void pair(double first, double second);

  /// @brief Compact JSON text built so far.
  const std::string& toString() const { return buffer_; }

  /// @brief JSON text with one element per line and nested indentation.
  /// @param indent_size Spaces per nesting level.
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Emit a separator if the current container already has an element.
  void separate();

  /// Record that the current container now holds an element.
  void markElement();

  void open(char bracket);
  void close(char bracket);

  static std::string escapeString(std::string_view input);
  static std::string formatDouble(double val);

  std::string buffer_;

  // One entry per open container: true once it holds an element.
  std::vector<bool> has_element_;

  // Set between key() and its value so the value is not comma-prefixed.
  bool after_key_ = false;
};

}  // namespace repat

#endif  // REPAT_CORE_JSON_WRITER_H
