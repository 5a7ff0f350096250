// C API for FFI bindings (Python/numpy, WASM).

#ifndef REPAT_C_H
#define REPAT_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Error Definitions
// ============================================================================

/// @brief Error codes returned by API functions.
typedef enum {
  REPAT_OK = 0,
  REPAT_ERROR_INVALID_PARAM = 1,
  REPAT_ERROR_MALFORMED_INPUT = 2,
  REPAT_ERROR_EMPTY_QUERY = 3,
  REPAT_ERROR_INVALID_QUERY = 4,
} RepatError;

// ============================================================================
// Callbacks
// ============================================================================

/// @brief Receives one discovered TEC.
///
/// All arrays are row-major (onset, pitch) pairs and are only valid during
/// the call.
///
/// @param pattern Pattern rows (pattern_rows x 2).
/// @param pattern_rows Number of pattern points.
/// @param translators Translator rows (translator_count x 2), zero vector first.
/// @param translator_count Number of translators.
/// @param user_data Pointer passed through from the caller.
typedef void (*RepatTecCallback)(const double* pattern, size_t pattern_rows,
                                 const double* translators, size_t translator_count,
                                 void* user_data);

/// @brief Receives one occurrence (rows x 2, valid only during the call).
typedef void (*RepatPatternCallback)(const double* pattern, size_t rows, void* user_data);

// ============================================================================
// Discovery and Matching
// ============================================================================

/// @brief Discover all TECs in a point table.
///
/// The table has @p rows rows of @p cols doubles (cols >= 3); column 2 is
/// the onset and column 1 the pitch. TECs are delivered to @p callback as
/// they are finalized.
///
/// @param points Row-major point table.
/// @param rows Row count (> 0).
/// @param cols Column count (>= 3).
/// @param max_ioi Largest onset gap between two points inside repeated
///        material (finite, >= 0). Distances between repeats are unbounded.
/// @param callback Receives each TEC (must not be NULL).
/// @param user_data Forwarded to @p callback.
/// @return REPAT_OK on success; nothing is delivered on failure.
RepatError repat_discover_tecs(const double* points, size_t rows, size_t cols, double max_ioi,
                               RepatTecCallback callback, void* user_data);

/// @brief Find every exact translated occurrence of a query in a point table.
///
/// Both tables use the same column layout as repat_discover_tecs().
///
/// @return REPAT_OK on success; nothing is delivered on failure.
RepatError repat_find_occurrences(const double* query, size_t query_rows, size_t query_cols,
                                  const double* points, size_t rows, size_t cols,
                                  RepatPatternCallback callback, void* user_data);

// ============================================================================
// Error Handling / Utilities
// ============================================================================

/// @brief Get error message for error code.
/// @return Error message (static, do not free)
const char* repat_error_string(RepatError error);

/// @brief Get library version string.
const char* repat_version(void);

#ifdef __cplusplus
}
#endif

#endif  // REPAT_C_H
