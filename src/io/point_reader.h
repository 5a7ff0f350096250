// Point ingestion from row-major numeric buffers and CSV point-set files.

#ifndef REPAT_IO_POINT_READER_H
#define REPAT_IO_POINT_READER_H

#include <cstddef>
#include <string>
#include <vector>

#include "core/onset.h"
#include "core/point.h"

namespace repat {

/// @brief Which buffer columns carry the point coordinates.
///
/// The default matches exported point-set tables of the form
/// (rounded onset, pitch, raw onset): column 2 is the exact onset source,
/// column 1 the pitch, column 0 is ignored.
struct ColumnLayout {
  size_t pitch_column = 1;
  size_t onset_column = 2;
  size_t min_columns = 3;
};

/// @brief Converts tabular numeric input into points.
///
/// Rejects empty, non-rectangular or too-narrow tables and non-finite or
/// out-of-range values. All checks run before any point is produced, so a
/// failed read leaves no partial result.
class PointReader {
 public:
  PointReader() = default;
  explicit PointReader(const ColumnLayout& layout) : layout_(layout) {}

  /// @brief Read a row-major buffer of rows x cols doubles.
  /// @return True on success. On failure, call getError() for details.
  bool readBuffer(const double* data, size_t rows, size_t cols);

  /// @brief Read comma-separated rows from text ('#' starts a comment line).
  /// @return True on success. On failure, call getError() for details.
  bool readCsvText(const std::string& text);

  /// @brief Read a CSV point-set file from disk.
  /// @return True on success. On failure, call getError() for details.
  bool readCsv(const std::string& path);

  /// @brief Points in input order (valid after a successful read).
  const std::vector<Point>& getPoints() const { return points_; }

  /// @brief Error message from the last failed read.
  const std::string& getError() const { return error_; }

  /// @brief Tolerance used for onset conversion (default kDefaultOnsetTolerance).
  void setOnsetTolerance(double tolerance) { onset_tolerance_ = tolerance; }

 private:
  ColumnLayout layout_;
  double onset_tolerance_ = kDefaultOnsetTolerance;
  std::vector<Point> points_;
  std::string error_;

  /// Shared validation + conversion for a parsed table.
  bool convertRows(const std::vector<double>& values, size_t rows, size_t cols);

  bool fail(const std::string& message);
};

}  // namespace repat

#endif  // REPAT_IO_POINT_READER_H
