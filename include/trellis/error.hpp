#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling; domain codes extend the base ranges.
 * - Human-readable message and originating component for diagnostics.
 * - Earlier failures that led to this one are kept in `suppressed`.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace trellis::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  io_eof = 1002,
  io_error = 1003,
  config_invalid = 2001,
  legacy_layout = 2002,
  data_integrity = 3001,
  store_mismatch = 3002,
  precondition_failed = 4001,
  resource_exhausted = 5001,
  out_of_memory = 5002,
  not_found = 6001,
  missing_files = 6002,
  logs_missing = 6003,
  unavailable = 7001,
  cancelled = 8001,
  start_aborted = 8002,
  timed_out = 8003,
  internal = 9001,
  invalid_argument = 9002,
  not_initialized = 9003,
  out_of_range = 9004,
  unsupported = 9005,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "wal.io" */
  std::vector<error> suppressed{};         /**< earlier errors superseded by this one */
};

/** \brief Short stable name of a code, e.g. "logs_missing". */
auto to_string(error_code code) -> std::string_view;

/** \brief "component: message (code)" followed by any suppressed errors. */
auto describe(const error& e) -> std::string;

/** \brief Attach `cause` to `e` as a suppressed error and return `e`. */
inline auto with_suppressed(error e, error cause) -> error {
  e.suppressed.push_back(std::move(cause));
  return e;
}

} // namespace trellis::core
