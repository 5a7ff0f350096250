/// @file
/// @brief Row flattening and pattern-occurrence JSON export.

#include "io/pattern_writer.h"

#include <cstdio>
#include <fstream>
#include <utility>

namespace repat {

std::vector<double> patternToRows(const Pattern& pattern) {
  std::vector<double> rows;
  rows.reserve(pattern.size() * 2);
  for (const auto& point : pattern) {
    rows.push_back(onsetToDouble(point.onset));
    rows.push_back(point.pitch);
  }
  return rows;
}

std::vector<double> vectorsToRows(const std::vector<Vector>& vectors) {
  std::vector<double> rows;
  rows.reserve(vectors.size() * 2);
  for (const auto& vec : vectors) {
    rows.push_back(onsetToDouble(vec.onset));
    rows.push_back(vec.pitch);
  }
  return rows;
}

std::string discoverySourceLabel(double max_ioi) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "SIATEC-C (%g)", max_ioi);
  return buf;
}

PatternJsonWriter::PatternJsonWriter(std::string piece) : piece_(std::move(piece)) {
  writer_.beginArray();
}

void PatternJsonWriter::writePattern(const Pattern& pattern, const std::string& source) {
  writer_.beginObject();
  writer_.key("label");
  writer_.value("");
  writer_.key("source");
  writer_.value(source);
  writer_.key("data_type");
  writer_.value("point_set");
  writer_.key("data");
  writer_.beginArray();
  for (const auto& point : pattern) {
    writer_.pair(onsetToDouble(point.onset), point.pitch);
  }
  writer_.endArray();
  writer_.endObject();
}

void PatternJsonWriter::addTec(const Tec& tec, const std::string& source) {
  addOccurrences(tec.pattern, tec.occurrences(), source);
}

void PatternJsonWriter::addOccurrences(const Pattern& query, const std::vector<Pattern>& occurrences,
                                       const std::string& source) {
  writer_.beginObject();
  writer_.key("piece");
  writer_.value(piece_);
  writer_.key("pattern");
  writePattern(query, source);
  writer_.key("occurrences");
  writer_.beginArray();
  for (const auto& occurrence : occurrences) {
    writePattern(occurrence, source);
  }
  writer_.endArray();
  writer_.endObject();
  ++entry_count_;
}

std::string PatternJsonWriter::finish(bool pretty) {
  if (!finished_) {
    writer_.endArray();
    finished_ = true;
  }
  return pretty ? writer_.toPrettyString() : writer_.toString();
}

bool writeTextFile(const std::string& path, const std::string& text) {
  std::ofstream file(path);
  if (!file.is_open()) return false;
  file << text;
  file.close();
  return !file.fail();
}

}  // namespace repat
