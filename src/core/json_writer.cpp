/// @file
/// @brief Implementation of the minimal JSON writer for structured output.

#include "core/json_writer.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace repat {

void JsonWriter::separate() {
  if (after_key_) {
    after_key_ = false;
    return;
  }
  if (!has_element_.empty() && has_element_.back()) {
    buffer_ += ',';
  }
}

void JsonWriter::markElement() {
  if (!has_element_.empty()) {
    has_element_.back() = true;
  }
}

void JsonWriter::open(char bracket) {
  separate();
  markElement();
  buffer_ += bracket;
  has_element_.push_back(false);
}

void JsonWriter::close(char bracket) {
  buffer_ += bracket;
  if (!has_element_.empty()) {
    has_element_.pop_back();
  }
}

void JsonWriter::beginObject() { open('{'); }
void JsonWriter::endObject() { close('}'); }
void JsonWriter::beginArray() { open('['); }
void JsonWriter::endArray() { close(']'); }

void JsonWriter::key(std::string_view name) {
  separate();
  markElement();
  buffer_ += '"';
  buffer_ += escapeString(name);
  buffer_ += "\":";
  after_key_ = true;
}

void JsonWriter::value(std::string_view val) {
  separate();
  markElement();
  buffer_ += '"';
  buffer_ += escapeString(val);
  buffer_ += '"';
}

void JsonWriter::value(int64_t val) {
  separate();
  markElement();
  buffer_ += std::to_string(val);
}

void JsonWriter::value(uint64_t val) {
  separate();
  markElement();
  buffer_ += std::to_string(val);
}

void JsonWriter::value(double val) {
  separate();
  markElement();
  if (std::isnan(val) || std::isinf(val)) {
    buffer_ += "null";
  } else {
    buffer_ += formatDouble(val);
  }
}

void JsonWriter::value(bool val) {
  separate();
  markElement();
  buffer_ += val ? "true" : "false";
}

void JsonWriter::valueNull() {
  separate();
  markElement();
  buffer_ += "null";
}

void JsonWriter::pair(double first, double second) {
  beginArray();
  value(first);
  value(second);
  endArray();
}

std::string JsonWriter::formatDouble(double val) {
  char buf[32];
  // 15 significant digits covers ordinary onsets and pitches; fall back to
  // 17 when that does not read back to the same double.
  std::snprintf(buf, sizeof(buf), "%.15g", val);
  if (std::strtod(buf, nullptr) != val) {
    std::snprintf(buf, sizeof(buf), "%.17g", val);
  }
  std::string text = buf;
  // Keep integral doubles recognisable as floats: 60 -> 60.0
  if (text.find_first_of(".eEn") == std::string::npos) {
    text += ".0";
  }
  return text;
}

std::string JsonWriter::toPrettyString(int indent_size) const {
  std::string result;
  result.reserve(buffer_.size() * 2);

  int depth = 0;
  bool in_string = false;
  bool escaped = false;

  auto newline = [&]() {
    result += '\n';
    result.append(static_cast<size_t>(depth * indent_size), ' ');
  };

  for (size_t pos = 0; pos < buffer_.size(); ++pos) {
    char chr = buffer_[pos];

    if (in_string) {
      result += chr;
      if (escaped) {
        escaped = false;
      } else if (chr == '\\') {
        escaped = true;
      } else if (chr == '"') {
        in_string = false;
      }
      continue;
    }

    switch (chr) {
      case '"':
        in_string = true;
        result += chr;
        break;
      case '{':
      case '[': {
        result += chr;
        ++depth;
        bool empty = pos + 1 < buffer_.size() && (buffer_[pos + 1] == '}' || buffer_[pos + 1] == ']');
        if (!empty) newline();
        break;
      }
      case '}':
      case ']':
        --depth;
        if (result.back() != '{' && result.back() != '[') newline();
        result += chr;
        break;
      case ',':
        result += chr;
        newline();
        break;
      case ':':
        result += ": ";
        break;
      default:
        result += chr;
        break;
    }
  }

  return result;
}

std::string JsonWriter::escapeString(std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (char chr : input) {
    switch (chr) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\b': result += "\\b";  break;
      case '\f': result += "\\f";  break;
      case '\n': result += "\\n";  break;
      case '\r': result += "\\r";  break;
      case '\t': result += "\\t";  break;
      default:
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex[8];
          std::snprintf(hex, sizeof(hex), "\\u%04x", static_cast<unsigned char>(chr));
          result += hex;
        } else {
          result += chr;
        }
        break;
    }
  }
  return result;
}

}  // namespace repat
