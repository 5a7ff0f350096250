/// @file
/// @brief Buffer and CSV ingestion for point sets.

#include "io/point_reader.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace repat {

namespace {

/// @brief Trim leading and trailing whitespace.
std::string trim(const std::string& text) {
  size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
  size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return text.substr(start, end - start);
}

/// @brief Parse one CSV field as a double.
/// @return False if the field is empty or has trailing garbage.
bool parseField(const std::string& field, double& out) {
  std::string cleaned = trim(field);
  if (cleaned.empty()) return false;
  char* end = nullptr;
  out = std::strtod(cleaned.c_str(), &end);
  return end != nullptr && *end == '\0';
}

}  // namespace

bool PointReader::fail(const std::string& message) {
  error_ = message;
  points_.clear();
  return false;
}

bool PointReader::readBuffer(const double* data, size_t rows, size_t cols) {
  if (data == nullptr || rows == 0) {
    return fail("input buffer is empty");
  }
  std::vector<double> values(data, data + rows * cols);
  return convertRows(values, rows, cols);
}

bool PointReader::readCsvText(const std::string& text) {
  std::vector<double> values;
  size_t rows = 0;
  size_t cols = 0;

  std::istringstream stream(text);
  std::string line;
  size_t line_number = 0;
  while (std::getline(stream, line)) {
    ++line_number;
    std::string content = trim(line);
    if (content.empty() || content[0] == '#') continue;

    size_t fields = 0;
    std::istringstream line_stream(content);
    std::string field;
    while (std::getline(line_stream, field, ',')) {
      double value = 0.0;
      if (!parseField(field, value)) {
        return fail("line " + std::to_string(line_number) + ": invalid number '" + trim(field) +
                    "'");
      }
      values.push_back(value);
      ++fields;
    }

    if (rows == 0) {
      cols = fields;
    } else if (fields != cols) {
      return fail("line " + std::to_string(line_number) + ": expected " + std::to_string(cols) +
                  " columns, found " + std::to_string(fields));
    }
    ++rows;
  }

  if (rows == 0) {
    return fail("no data rows");
  }
  return convertRows(values, rows, cols);
}

bool PointReader::readCsv(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return fail("cannot open " + path);
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  return readCsvText(contents.str());
}

bool PointReader::convertRows(const std::vector<double>& values, size_t rows, size_t cols) {
  if (cols < layout_.min_columns || cols <= layout_.onset_column ||
      cols <= layout_.pitch_column) {
    return fail("expected at least " + std::to_string(layout_.min_columns) + " columns, found " +
                std::to_string(cols));
  }
  if (values.size() != rows * cols) {
    return fail("buffer is not rectangular");
  }

  for (size_t row = 0; row < rows; ++row) {
    double onset = values[row * cols + layout_.onset_column];
    double pitch = values[row * cols + layout_.pitch_column];
    if (!std::isfinite(onset) || !std::isfinite(pitch)) {
      return fail("row " + std::to_string(row) + ": non-finite coordinate");
    }
    if (std::fabs(onset) > kMaxOnsetMagnitude) {
      return fail("row " + std::to_string(row) + ": onset out of range");
    }
  }

  points_.clear();
  points_.reserve(rows);
  for (size_t row = 0; row < rows; ++row) {
    double onset = values[row * cols + layout_.onset_column];
    double pitch = values[row * cols + layout_.pitch_column];
    points_.emplace_back(onsetFromDouble(onset, onset_tolerance_), pitch);
  }
  error_.clear();
  return true;
}

}  // namespace repat
