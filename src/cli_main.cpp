/// @file
/// @brief CLI entry point for repeated-pattern discovery and matching.

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "core/json_parser.h"
#include "core/pattern.h"
#include "core/point_set.h"
#include "core/point_set_generator.h"
#include "discovery/tec_discovery.h"
#include "io/pattern_writer.h"
#include "io/point_reader.h"
#include "repat_c.h"
#include "search/exact_matcher.h"

namespace {

enum class Command { None, Discover, Match, Generate };

/// @brief Command-line options parsed from argv.
struct CliOptions {
  Command command = Command::None;
  std::string points_path;
  std::string query_path;
  std::string config_path;
  std::string output;
  std::string piece = "piece";
  repat::DiscoveryConfig discovery;
  bool max_ioi_specified = false;
  bool min_size_specified = false;
  size_t generate_count = 100;
  uint32_t seed = 1;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("repat_cli - repeated pattern discovery for point-set music representations\n\n");
  std::printf("Usage: repat_cli <command> [options]\n\n");
  std::printf("Commands:\n");
  std::printf("  discover         Find all translational equivalence classes\n");
  std::printf("  match            Find exact occurrences of a query pattern\n");
  std::printf("  generate         Write a synthetic point set as CSV\n");
  std::printf("\nOptions:\n");
  std::printf("  --points FILE    Point-set CSV (onset in column 2, pitch in column 1)\n");
  std::printf("  --query FILE     Query pattern CSV (same layout), for match\n");
  std::printf("  --max-ioi X      Largest onset gap inside a repetition (discover)\n");
  std::printf("  --min-size N     Smallest pattern size to report (discover)\n");
  std::printf("  --config FILE    Flat JSON config (max_ioi, min_pattern_size,\n");
  std::printf("                   onset_tolerance, verbose, piece)\n");
  std::printf("  --piece NAME     Piece name written to the JSON output\n");
  std::printf("  --count N        Point count (generate)\n");
  std::printf("  --seed N         Random seed (generate)\n");
  std::printf("  --verbose        Log discovery statistics to stderr\n");
  std::printf("  -o FILE          Output file path (stdout if omitted)\n");
  std::printf("  --version        Show version\n");
  std::printf("  --help           Show this help\n");
}

/// @brief Parse command-line arguments into CliOptions.
/// @return False if help/version was requested or arguments are unusable.
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
  for (int idx = 1; idx < argc; ++idx) {
    if (std::strcmp(argv[idx], "--help") == 0 || std::strcmp(argv[idx], "-h") == 0) {
      printUsage();
      return false;
    }
    if (std::strcmp(argv[idx], "--version") == 0) {
      std::printf("repat_cli v%s\n", repat_version());
      return false;
    }
    if (std::strcmp(argv[idx], "discover") == 0) {
      opts.command = Command::Discover;
    } else if (std::strcmp(argv[idx], "match") == 0) {
      opts.command = Command::Match;
    } else if (std::strcmp(argv[idx], "generate") == 0) {
      opts.command = Command::Generate;
    } else if (std::strcmp(argv[idx], "--points") == 0 && idx + 1 < argc) {
      opts.points_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "--query") == 0 && idx + 1 < argc) {
      opts.query_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "--config") == 0 && idx + 1 < argc) {
      opts.config_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "--max-ioi") == 0 && idx + 1 < argc) {
      opts.discovery.max_ioi = std::atof(argv[++idx]);
      opts.max_ioi_specified = true;
    } else if (std::strcmp(argv[idx], "--min-size") == 0 && idx + 1 < argc) {
      opts.discovery.min_pattern_size = static_cast<size_t>(std::atoi(argv[++idx]));
      opts.min_size_specified = true;
    } else if (std::strcmp(argv[idx], "--piece") == 0 && idx + 1 < argc) {
      opts.piece = argv[++idx];
    } else if (std::strcmp(argv[idx], "--count") == 0 && idx + 1 < argc) {
      opts.generate_count = static_cast<size_t>(std::atoi(argv[++idx]));
    } else if (std::strcmp(argv[idx], "--seed") == 0 && idx + 1 < argc) {
      opts.seed = static_cast<uint32_t>(std::atoi(argv[++idx]));
    } else if (std::strcmp(argv[idx], "--verbose") == 0) {
      opts.discovery.verbose = true;
    } else if (std::strcmp(argv[idx], "-o") == 0 && idx + 1 < argc) {
      opts.output = argv[++idx];
    } else {
      std::fprintf(stderr, "Warning: ignoring unknown argument '%s'\n", argv[idx]);
    }
  }

  if (opts.command == Command::None) {
    printUsage();
    return false;
  }
  return true;
}

/// @brief Apply a flat JSON config file; command-line values take precedence.
bool applyConfigFile(CliOptions& opts) {
  std::ifstream file(opts.config_path);
  if (!file.is_open()) {
    std::fprintf(stderr, "Error: cannot open config %s\n", opts.config_path.c_str());
    return false;
  }
  std::ostringstream text;
  text << file.rdbuf();

  repat::JsonObject config;
  std::string error;
  if (!repat::parseJsonObject(text.str(), config, error)) {
    std::fprintf(stderr, "Error: %s: %s\n", opts.config_path.c_str(), error.c_str());
    return false;
  }

  auto it = config.find("max_ioi");
  if (it != config.end() && !opts.max_ioi_specified) {
    opts.discovery.max_ioi = it->second.asDouble(opts.discovery.max_ioi);
    opts.max_ioi_specified = it->second.type == repat::JsonValue::Number;
  }
  it = config.find("min_pattern_size");
  if (it != config.end() && !opts.min_size_specified &&
      it->second.type == repat::JsonValue::Number) {
    opts.discovery.min_pattern_size = static_cast<size_t>(it->second.asInt(1));
  }
  it = config.find("onset_tolerance");
  if (it != config.end()) {
    opts.discovery.onset_tolerance = it->second.asDouble(opts.discovery.onset_tolerance);
  }
  it = config.find("verbose");
  if (it != config.end()) {
    opts.discovery.verbose = opts.discovery.verbose || it->second.asBool(false);
  }
  it = config.find("piece");
  if (it != config.end()) {
    opts.piece = it->second.asString(opts.piece);
  }
  return true;
}

/// @brief Print @p text to stdout or write it to opts.output.
int emitOutput(const CliOptions& opts, const std::string& text) {
  if (opts.output.empty()) {
    std::printf("%s\n", text.c_str());
    return 0;
  }
  if (!repat::writeTextFile(opts.output, text)) {
    std::fprintf(stderr, "Error: failed to write %s\n", opts.output.c_str());
    return 1;
  }
  std::printf("Output:    %s\n", opts.output.c_str());
  return 0;
}

/// @brief Read a point CSV, reporting failures.
bool readPoints(const std::string& path, double onset_tolerance, std::vector<repat::Point>& out) {
  if (path.empty()) {
    std::fprintf(stderr, "Error: missing input file\n");
    return false;
  }
  repat::PointReader reader;
  reader.setOnsetTolerance(onset_tolerance);
  if (!reader.readCsv(path)) {
    std::fprintf(stderr, "Error: %s: %s\n", path.c_str(), reader.getError().c_str());
    return false;
  }
  out = reader.getPoints();
  return true;
}

int runDiscover(const CliOptions& opts) {
  if (!opts.max_ioi_specified) {
    std::fprintf(stderr, "Error: --max-ioi is required for discover\n");
    return 1;
  }
  std::string error;
  if (!repat::validateDiscoveryConfig(opts.discovery, error)) {
    std::fprintf(stderr, "Error: %s\n", error.c_str());
    return 1;
  }

  std::vector<repat::Point> points;
  if (!readPoints(opts.points_path, opts.discovery.onset_tolerance, points)) return 1;
  repat::PointSet point_set(std::move(points));

  repat::PatternJsonWriter json(opts.piece);
  const std::string source = repat::discoverySourceLabel(opts.discovery.max_ioi);
  repat::DiscoveryStatus status = repat::discoverTecsStreaming(
      point_set, opts.discovery, [&](const repat::Tec& tec) { json.addTec(tec, source); });

  if (!status.success) {
    std::fprintf(stderr, "Error: %s\n", status.error_message.c_str());
    return 1;
  }

  if (!opts.output.empty()) {
    std::printf("Points:    %zu\n", status.stats.point_count);
    std::printf("MTPs:      %zu\n", status.stats.mtp_count);
    std::printf("TECs:      %zu\n", status.stats.tec_count);
  }
  return emitOutput(opts, json.finish());
}

int runMatch(const CliOptions& opts) {
  std::vector<repat::Point> query_points;
  if (!readPoints(opts.query_path, opts.discovery.onset_tolerance, query_points)) return 1;
  std::string error;
  if (!repat::validatePattern(query_points, error)) {
    std::fprintf(stderr, "Error: invalid query: %s\n", error.c_str());
    return 1;
  }

  std::vector<repat::Point> points;
  if (!readPoints(opts.points_path, opts.discovery.onset_tolerance, points)) return 1;
  repat::PointSet point_set(std::move(points));
  repat::Pattern query(std::move(query_points));

  std::vector<repat::Pattern> occurrences;
  repat::MatchStatus status = repat::findOccurrences(
      query, point_set, [&](const repat::Pattern& occ) { occurrences.push_back(occ); });
  if (!status.success) {
    std::fprintf(stderr, "Error: %s\n", status.error_message.c_str());
    return 1;
  }

  repat::PatternJsonWriter json(opts.piece);
  json.addOccurrences(query, occurrences, repat::kMatchingSource);
  if (!opts.output.empty()) {
    std::printf("Occurrences: %zu\n", status.occurrence_count);
  }
  return emitOutput(opts, json.finish());
}

int runGenerate(const CliOptions& opts) {
  repat::generator::RepeatedPatternParams params;
  params.point_count = opts.generate_count;
  params.seed = opts.seed;
  std::vector<repat::Point> points = repat::generator::randomRepeatedPatterns(params);

  // Same (onset, pitch, raw onset) layout that the reader expects.
  std::string csv = "# onset, pitch, raw_onset\n";
  char line[96];
  for (const auto& point : points) {
    double onset = repat::onsetToDouble(point.onset);
    std::snprintf(line, sizeof(line), "%.17g, %.17g, %.17g\n", onset, point.pitch, onset);
    csv += line;
  }
  return emitOutput(opts, csv);
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  if (!parseArgs(argc, argv, opts)) {
    return 0;
  }
  if (!opts.config_path.empty() && !applyConfigFile(opts)) {
    return 1;
  }

  switch (opts.command) {
    case Command::Discover:
      return runDiscover(opts);
    case Command::Match:
      return runMatch(opts);
    case Command::Generate:
      return runGenerate(opts);
    case Command::None:
      break;
  }
  return 0;
}
