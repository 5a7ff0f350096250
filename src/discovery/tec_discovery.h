// Repeated-pattern discovery: consolidates bounded MTPs into translational
// equivalence classes (SIATEC-C style).

#ifndef REPAT_DISCOVERY_TEC_DISCOVERY_H
#define REPAT_DISCOVERY_TEC_DISCOVERY_H

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "core/onset.h"
#include "core/point_set.h"
#include "core/tec.h"

namespace repat {

/// Receives each TEC as soon as it is finalized. Invoked synchronously on the
/// discovering thread; the TEC must not be retained by reference.
using TecSink = std::function<void(const Tec&)>;

/// @brief Parameters for TEC discovery.
struct DiscoveryConfig {
  /// Largest onset gap between two points that seeds a repetition: a
  /// translator is examined only if some pair of points at most max_ioi
  /// apart recurs under it. Must be finite and non-negative.
  double max_ioi = 0.0;

  /// MTPs with fewer points are not consolidated (1 keeps everything).
  size_t min_pattern_size = 1;

  /// Tolerance used when converting max_ioi to an exact onset.
  double onset_tolerance = kDefaultOnsetTolerance;

  /// Log sweep statistics to stderr.
  bool verbose = false;
};

/// @brief Counters collected during one discovery run.
struct DiscoveryStats {
  size_t point_count = 0;
  size_t mtp_count = 0;
  size_t tec_count = 0;
  size_t duplicate_shapes = 0;  ///< MTPs whose shape was already emitted.
  size_t skipped_small = 0;     ///< MTPs below min_pattern_size.
  size_t translator_candidates = 0;  ///< Translations tried while building TECs.
};

/// @brief Bulk discovery output.
struct DiscoveryResult {
  bool success = false;
  std::string error_message;
  std::vector<Tec> tecs;
  DiscoveryStats stats;
};

/// @brief Streaming discovery outcome (TECs went to the sink).
struct DiscoveryStatus {
  bool success = false;
  std::string error_message;
  DiscoveryStats stats;
};

/// @brief Check discovery parameters before any computation.
/// @param config Parameters to check.
/// @param error Receives the reason on failure.
/// @return True if @p config is usable.
bool validateDiscoveryConfig(const DiscoveryConfig& config, std::string& error);

/// @brief Discover all TECs and deliver each one to @p sink when finalized.
///
/// Steps:
///   1. Index forward vectors between points at most max_ioi apart and derive
///      the candidate translators (see candidateTranslators()).
///   2. For each candidate in ascending order, expand its MTP and skip it if
///      its shape (pattern minus its first point) was already handled.
///   3. Find every translator of the pattern (see patternTranslators(): the
///      candidates come from the local vector index), rebase the pattern
///      onto its earliest occurrence and emit the TEC.
///
/// Every emitted TEC is sound and maximal: its translators are exactly the
/// vectors that map the whole pattern into the set (zero vector included),
/// and no two emitted patterns are translates of one another. Only the set
/// of handled shapes is retained between emissions.
///
/// Invalid parameters fail before the sink is called.
///
/// @param point_set Input point set (may be empty).
/// @param config Discovery parameters.
/// @param sink Called once per TEC.
/// @return Status and statistics.
DiscoveryStatus discoverTecsStreaming(const PointSet& point_set, const DiscoveryConfig& config,
                                      const TecSink& sink);

/// @brief Discover all TECs and return them together.
///
/// Same TECs in the same order as discoverTecsStreaming().
DiscoveryResult discoverTecs(const PointSet& point_set, const DiscoveryConfig& config);

/// @brief Bulk discovery with default parameters and the given bound.
DiscoveryResult discoverTecs(const PointSet& point_set, double max_ioi);

}  // namespace repat

#endif  // REPAT_DISCOVERY_TEC_DISCOVERY_H
