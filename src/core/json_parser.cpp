// Implementation of the minimal flat-object JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cstdlib>
#include <cstring>

namespace repat {

namespace {

/// @brief Cursor over JSON text with error reporting.
struct Cursor {
  const std::string& text;
  size_t pos = 0;
  std::string error;

  explicit Cursor(const std::string& input) : text(input) {}

  bool atEnd() const { return pos >= text.size(); }
  char peek() const { return atEnd() ? '\0' : text[pos]; }

  void skipWhitespace() {
    while (!atEnd() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
  }

  bool fail(const std::string& message) {
    error = message + " at offset " + std::to_string(pos);
    return false;
  }

  bool expectWord(const char* word) {
    size_t len = std::strlen(word);
    if (text.compare(pos, len, word) != 0) return fail(std::string("expected '") + word + "'");
    pos += len;
    return true;
  }
};

/// @brief Parse a string literal (cursor at the opening quote).
bool parseString(Cursor& cur, std::string& out) {
  if (cur.peek() != '"') return cur.fail("expected string");
  ++cur.pos;
  out.clear();
  while (!cur.atEnd() && cur.peek() != '"') {
    char chr = cur.text[cur.pos];
    if (chr == '\\') {
      ++cur.pos;
      if (cur.atEnd()) break;
      switch (cur.text[cur.pos]) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case 'r': out += '\r'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        default:  out += cur.text[cur.pos]; break;
      }
    } else {
      out += chr;
    }
    ++cur.pos;
  }
  if (cur.atEnd()) return cur.fail("unterminated string");
  ++cur.pos;  // closing quote
  return true;
}

/// @brief Parse a number with optional fraction and exponent.
bool parseNumber(Cursor& cur, double& out) {
  const char* start = cur.text.c_str() + cur.pos;
  char* end = nullptr;
  out = std::strtod(start, &end);
  if (end == start) return cur.fail("invalid number");
  cur.pos += static_cast<size_t>(end - start);
  return true;
}

/// @brief Skip a nested object or array, honoring strings inside it.
bool skipContainer(Cursor& cur) {
  int depth = 0;
  while (!cur.atEnd()) {
    char chr = cur.peek();
    if (chr == '"') {
      std::string ignored;
      if (!parseString(cur, ignored)) return false;
      continue;
    }
    if (chr == '{' || chr == '[') ++depth;
    if (chr == '}' || chr == ']') --depth;
    ++cur.pos;
    if (depth == 0) return true;
  }
  return cur.fail("unterminated container");
}

bool parseValue(Cursor& cur, JsonValue& val, bool& skipped) {
  skipped = false;
  char chr = cur.peek();
  if (chr == '"') {
    val.type = JsonValue::String;
    return parseString(cur, val.string_val);
  }
  if (chr == 't' || chr == 'f') {
    val.type = JsonValue::Bool;
    val.bool_val = (chr == 't');
    return cur.expectWord(val.bool_val ? "true" : "false");
  }
  if (chr == 'n') {
    val.type = JsonValue::Null;
    return cur.expectWord("null");
  }
  if (chr == '{' || chr == '[') {
    skipped = true;
    return skipContainer(cur);
  }
  val.type = JsonValue::Number;
  return parseNumber(cur, val.number_val);
}

}  // namespace

bool parseJsonObject(const std::string& json, JsonObject& out, std::string& error) {
  out.clear();
  Cursor cur(json);

  cur.skipWhitespace();
  if (cur.peek() != '{') {
    error = "expected '{' at start of object";
    return false;
  }
  ++cur.pos;

  cur.skipWhitespace();
  if (cur.peek() == '}') {
    ++cur.pos;
    return true;
  }

  while (true) {
    cur.skipWhitespace();
    std::string key;
    if (!parseString(cur, key)) break;

    cur.skipWhitespace();
    if (cur.peek() != ':') {
      cur.fail("expected ':'");
      break;
    }
    ++cur.pos;
    cur.skipWhitespace();

    JsonValue val;
    bool skipped = false;
    if (!parseValue(cur, val, skipped)) break;
    if (!skipped) out[key] = val;

    cur.skipWhitespace();
    if (cur.peek() == ',') {
      ++cur.pos;
      continue;
    }
    if (cur.peek() == '}') {
      ++cur.pos;
      return true;
    }
    cur.fail("expected ',' or '}'");
    break;
  }

  error = cur.error;
  out.clear();
  return false;
}

}  // namespace repat
