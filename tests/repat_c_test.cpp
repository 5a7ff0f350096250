// Tests for the C API (repat_c.h).

#include "repat_c.h"

#include <gtest/gtest.h>

#include <cmath>
#include <cstring>
#include <vector>

namespace {

// (rounded onset, pitch, raw onset) rows of the two-bar motif.
const double kMotifTable[] = {0, 60, 0,  //
                              1, 62, 1,  //
                              4, 60, 4,  //
                              5, 62, 5};

struct TecCapture {
  std::vector<std::vector<double>> patterns;
  std::vector<std::vector<double>> translators;
};

void captureTec(const double* pattern, size_t pattern_rows, const double* translators,
                size_t translator_count, void* user_data) {
  auto* capture = static_cast<TecCapture*>(user_data);
  capture->patterns.emplace_back(pattern, pattern + pattern_rows * 2);
  capture->translators.emplace_back(translators, translators + translator_count * 2);
}

void capturePattern(const double* pattern, size_t rows, void* user_data) {
  auto* capture = static_cast<std::vector<std::vector<double>>*>(user_data);
  capture->emplace_back(pattern, pattern + rows * 2);
}

TEST(RepatCTest, DiscoverMotif) {
  TecCapture capture;
  ASSERT_EQ(repat_discover_tecs(kMotifTable, 4, 3, 2.0, captureTec, &capture), REPAT_OK);
  ASSERT_EQ(capture.patterns.size(), 2u);
  EXPECT_EQ(capture.patterns[1], (std::vector<double>{0, 60, 1, 62}));
  EXPECT_EQ(capture.translators[1], (std::vector<double>{0, 0, 4, 0}));
}

TEST(RepatCTest, DiscoverRejectsBadParameters) {
  TecCapture capture;
  EXPECT_EQ(repat_discover_tecs(kMotifTable, 4, 3, -1.0, captureTec, &capture),
            REPAT_ERROR_INVALID_PARAM);
  EXPECT_EQ(repat_discover_tecs(kMotifTable, 4, 3, std::nan(""), captureTec, &capture),
            REPAT_ERROR_INVALID_PARAM);
  EXPECT_EQ(repat_discover_tecs(kMotifTable, 4, 3, 2.0, nullptr, &capture),
            REPAT_ERROR_INVALID_PARAM);
  EXPECT_TRUE(capture.patterns.empty());
}

TEST(RepatCTest, DiscoverRejectsMalformedTables) {
  TecCapture capture;
  EXPECT_EQ(repat_discover_tecs(nullptr, 0, 3, 2.0, captureTec, &capture),
            REPAT_ERROR_MALFORMED_INPUT);
  EXPECT_EQ(repat_discover_tecs(kMotifTable, 6, 2, 2.0, captureTec, &capture),
            REPAT_ERROR_MALFORMED_INPUT);

  const double with_nan[] = {0, 60, 0, 1, NAN, 1};
  EXPECT_EQ(repat_discover_tecs(with_nan, 2, 3, 2.0, captureTec, &capture),
            REPAT_ERROR_MALFORMED_INPUT);
  EXPECT_TRUE(capture.patterns.empty());
}

TEST(RepatCTest, FindOccurrences) {
  const double query[] = {0, 60, 0, 1, 62, 1};
  std::vector<std::vector<double>> found;
  ASSERT_EQ(repat_find_occurrences(query, 2, 3, kMotifTable, 4, 3, capturePattern, &found),
            REPAT_OK);
  ASSERT_EQ(found.size(), 2u);
  EXPECT_EQ(found[0], (std::vector<double>{0, 60, 1, 62}));
  EXPECT_EQ(found[1], (std::vector<double>{4, 60, 5, 62}));
}

TEST(RepatCTest, FindOccurrencesErrors) {
  std::vector<std::vector<double>> found;
  EXPECT_EQ(repat_find_occurrences(nullptr, 0, 3, kMotifTable, 4, 3, capturePattern, &found),
            REPAT_ERROR_EMPTY_QUERY);

  const double duplicate[] = {0, 60, 0, 0, 60, 0};
  EXPECT_EQ(repat_find_occurrences(duplicate, 2, 3, kMotifTable, 4, 3, capturePattern, &found),
            REPAT_ERROR_INVALID_QUERY);

  const double query[] = {0, 60, 0};
  EXPECT_EQ(repat_find_occurrences(query, 1, 3, kMotifTable, 4, 3, nullptr, &found),
            REPAT_ERROR_INVALID_PARAM);
  EXPECT_EQ(repat_find_occurrences(query, 1, 3, nullptr, 0, 3, capturePattern, &found),
            REPAT_ERROR_MALFORMED_INPUT);
  EXPECT_TRUE(found.empty());
}

TEST(RepatCTest, ErrorStringsAndVersion) {
  EXPECT_STREQ(repat_error_string(REPAT_OK), "OK");
  EXPECT_GT(std::strlen(repat_error_string(REPAT_ERROR_INVALID_QUERY)), 0u);
  EXPECT_STREQ(repat_version(), "0.3.0");
}

}  // namespace
