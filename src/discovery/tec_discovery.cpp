/// @file
/// @brief TEC consolidation on top of bounded MTP computation.

#include "discovery/tec_discovery.h"

#include <cmath>
#include <cstdio>
#include <set>

#include "discovery/mtp_builder.h"

namespace repat {

namespace {

/// @brief Build the TEC of @p pattern, anchored at its earliest occurrence.
///
/// @p pattern must be a subset of @p point_set, so the translator list is
/// never empty and its first element is the earliest occurrence.
Tec buildCanonicalTec(const Pattern& pattern, const PointSet& point_set,
                      const LocalVectorIndex& local_index, DiscoveryStats& stats) {
  std::vector<Vector> translators =
      patternTranslators(pattern, point_set, local_index, stats.translator_candidates);
  const Vector earliest = translators.front();

  Tec tec;
  tec.pattern = pattern.translate(earliest);
  tec.translators.reserve(translators.size());
  for (const auto& translator : translators) {
    tec.translators.push_back(translator - earliest);
  }
  return tec;
}

}  // namespace

bool validateDiscoveryConfig(const DiscoveryConfig& config, std::string& error) {
  if (!std::isfinite(config.max_ioi)) {
    error = "max_ioi must be finite";
    return false;
  }
  if (config.max_ioi < 0.0) {
    error = "max_ioi must be non-negative";
    return false;
  }
  if (config.max_ioi > kMaxOnsetMagnitude) {
    error = "max_ioi is out of range";
    return false;
  }
  if (config.min_pattern_size < 1) {
    error = "min_pattern_size must be at least 1";
    return false;
  }
  if (!std::isfinite(config.onset_tolerance) || config.onset_tolerance <= 0.0) {
    error = "onset_tolerance must be finite and positive";
    return false;
  }
  return true;
}

DiscoveryStatus discoverTecsStreaming(const PointSet& point_set, const DiscoveryConfig& config,
                                      const TecSink& sink) {
  DiscoveryStatus status;
  if (!validateDiscoveryConfig(config, status.error_message)) {
    return status;
  }

  const Onset max_ioi = onsetFromDouble(config.max_ioi, config.onset_tolerance);
  status.stats.point_count = point_set.size();

  LocalVectorIndex local_index = buildLocalVectorIndex(point_set, max_ioi);
  std::vector<Vector> translators = candidateTranslators(point_set, local_index);
  status.stats.mtp_count = translators.size();

  // MTPs are expanded one at a time so only handled shapes stay resident.
  std::set<ShapeKey> handled_shapes;
  for (const auto& translator : translators) {
    Pattern mtp = maximalTranslatablePattern(point_set, translator);
    if (mtp.size() < config.min_pattern_size) {
      ++status.stats.skipped_small;
      continue;
    }
    if (!handled_shapes.insert(mtp.normalized()).second) {
      ++status.stats.duplicate_shapes;
      continue;
    }

    sink(buildCanonicalTec(mtp, point_set, local_index, status.stats));
    ++status.stats.tec_count;
  }

  if (config.verbose) {
    std::fprintf(stderr,
                 "[SiatecC] points=%zu max_ioi=%s mtps=%zu tecs=%zu duplicate_shapes=%zu "
                 "skipped_small=%zu translator_candidates=%zu\n",
                 status.stats.point_count, formatOnset(max_ioi).c_str(), status.stats.mtp_count,
                 status.stats.tec_count, status.stats.duplicate_shapes,
                 status.stats.skipped_small, status.stats.translator_candidates);
  }

  status.success = true;
  return status;
}

DiscoveryResult discoverTecs(const PointSet& point_set, const DiscoveryConfig& config) {
  DiscoveryResult result;
  DiscoveryStatus status = discoverTecsStreaming(
      point_set, config, [&result](const Tec& tec) { result.tecs.push_back(tec); });

  result.success = status.success;
  result.error_message = status.error_message;
  result.stats = status.stats;
  return result;
}

DiscoveryResult discoverTecs(const PointSet& point_set, double max_ioi) {
  DiscoveryConfig config;
  config.max_ioi = max_ioi;
  return discoverTecs(point_set, config);
}

}  // namespace repat
