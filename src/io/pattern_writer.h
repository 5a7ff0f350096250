// Output boundary: flat numeric rows and pattern-occurrence JSON exports.

#ifndef REPAT_IO_PATTERN_WRITER_H
#define REPAT_IO_PATTERN_WRITER_H

#include <cstddef>
#include <string>
#include <vector>

#include "core/json_writer.h"
#include "core/pattern.h"
#include "core/point.h"
#include "core/tec.h"

namespace repat {

/// @brief Flatten a pattern to row-major (onset, pitch) pairs.
std::vector<double> patternToRows(const Pattern& pattern);

/// @brief Flatten vectors to row-major (onset, pitch) pairs.
std::vector<double> vectorsToRows(const std::vector<Vector>& vectors);

/// @brief Source label for discovery output, e.g. "SIATEC-C (4)".
std::string discoverySourceLabel(double max_ioi);

/// Source label for matcher output.
constexpr const char* kMatchingSource = "GeometricMatching";

/// @brief Streams pattern-occurrence entries into a JSON array.
///
/// Each entry has the layout used by repeated-pattern evaluation tools:
/// @code
///   {"piece": ..., "pattern": {"label", "source", "data_type", "data"},
///    "occurrences": [{...}, ...]}
/// @endcode
/// where "data" is a list of [onset, pitch] pairs. Entries can be added one
/// at a time from a discovery or matching sink.
class PatternJsonWriter {
 public:
  /// @param piece Piece name written into every entry.
  explicit PatternJsonWriter(std::string piece);

  /// @brief Add one TEC: its pattern plus every occurrence.
  void addTec(const Tec& tec, const std::string& source);

  /// @brief Add a query with the occurrences found for it.
  void addOccurrences(const Pattern& query, const std::vector<Pattern>& occurrences,
                      const std::string& source);

  /// @brief Number of entries written.
  size_t entryCount() const { return entry_count_; }

  /// @brief Close the array and return the (pretty-printed) JSON text.
  std::string finish(bool pretty = true);

 private:
  void writePattern(const Pattern& pattern, const std::string& source);

  std::string piece_;
  JsonWriter writer_;
  size_t entry_count_ = 0;
  bool finished_ = false;
};

/// @brief Write @p text to @p path.
/// @return False if the file could not be written.
bool writeTextFile(const std::string& path, const std::string& text);

}  // namespace repat

#endif  // REPAT_IO_PATTERN_WRITER_H
