// Implementation of C API for FFI bindings.

#include "repat_c.h"

#include <string>
#include <vector>

#include "core/pattern.h"
#include "core/point_set.h"
#include "discovery/tec_discovery.h"
#include "io/pattern_writer.h"
#include "io/point_reader.h"
#include "search/exact_matcher.h"

namespace {

constexpr const char* kVersion = "0.3.0";

}  // namespace

extern "C" {

RepatError repat_discover_tecs(const double* points, size_t rows, size_t cols, double max_ioi,
                               RepatTecCallback callback, void* user_data) {
  if (callback == nullptr) return REPAT_ERROR_INVALID_PARAM;

  repat::DiscoveryConfig config;
  config.max_ioi = max_ioi;
  std::string error;
  if (!repat::validateDiscoveryConfig(config, error)) return REPAT_ERROR_INVALID_PARAM;

  repat::PointReader reader;
  if (!reader.readBuffer(points, rows, cols)) return REPAT_ERROR_MALFORMED_INPUT;

  repat::PointSet point_set(reader.getPoints());
  repat::DiscoveryStatus status =
      repat::discoverTecsStreaming(point_set, config, [&](const repat::Tec& tec) {
        std::vector<double> pattern_rows = repat::patternToRows(tec.pattern);
        std::vector<double> translator_rows = repat::vectorsToRows(tec.translators);
        callback(pattern_rows.data(), tec.pattern.size(), translator_rows.data(),
                 tec.translators.size(), user_data);
      });
  return status.success ? REPAT_OK : REPAT_ERROR_INVALID_PARAM;
}

RepatError repat_find_occurrences(const double* query, size_t query_rows, size_t query_cols,
                                  const double* points, size_t rows, size_t cols,
                                  RepatPatternCallback callback, void* user_data) {
  if (callback == nullptr) return REPAT_ERROR_INVALID_PARAM;
  if (query == nullptr || query_rows == 0) return REPAT_ERROR_EMPTY_QUERY;

  repat::PointReader query_reader;
  if (!query_reader.readBuffer(query, query_rows, query_cols)) return REPAT_ERROR_MALFORMED_INPUT;

  std::string error;
  if (!repat::validatePattern(query_reader.getPoints(), error)) return REPAT_ERROR_INVALID_QUERY;

  repat::PointReader reader;
  if (!reader.readBuffer(points, rows, cols)) return REPAT_ERROR_MALFORMED_INPUT;

  repat::PointSet point_set(reader.getPoints());
  repat::Pattern pattern(query_reader.getPoints());
  repat::MatchStatus status =
      repat::findOccurrences(pattern, point_set, [&](const repat::Pattern& occurrence) {
        std::vector<double> occurrence_rows = repat::patternToRows(occurrence);
        callback(occurrence_rows.data(), occurrence.size(), user_data);
      });
  return status.success ? REPAT_OK : REPAT_ERROR_INVALID_QUERY;
}

const char* repat_error_string(RepatError error) {
  switch (error) {
    case REPAT_OK:
      return "OK";
    case REPAT_ERROR_INVALID_PARAM:
      return "Invalid parameter";
    case REPAT_ERROR_MALFORMED_INPUT:
      return "Malformed point table";
    case REPAT_ERROR_EMPTY_QUERY:
      return "Query pattern is empty";
    case REPAT_ERROR_INVALID_QUERY:
      return "Query pattern has duplicate or non-finite points";
  }
  return "Unknown error";
}

const char* repat_version(void) { return kVersion; }

}  // extern "C"
