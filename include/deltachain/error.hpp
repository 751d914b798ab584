#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling.
 * - Human-readable message and originating component for diagnostics.
 * - Two code families are fatal to a chain run: source read errors
 *   (io_failed, not_found) and malformed headers (header_*).
 *   A token mismatch is not an error.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace deltachain::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  config_invalid = 2001,
  data_integrity = 3001,
  header_truncated = 3002,      /**< fewer than two header lines */
  header_token_missing = 3003,  /**< header line without a trailing token */
  header_line_too_long = 3004,  /**< header line exceeds the line guard */
  not_found = 6001,
  internal = 9001,
  invalid_argument = 9002,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "header.extract" */
};

/** \brief True for codes raised when a byte source cannot be opened or read. */
constexpr bool is_source_read_error(error_code ec) noexcept {
  return ec == error_code::io_failed || ec == error_code::not_found;
}

/** \brief True for codes raised when a file's two header lines are unusable. */
constexpr bool is_malformed_header(error_code ec) noexcept {
  return ec == error_code::header_truncated
      || ec == error_code::header_token_missing
      || ec == error_code::header_line_too_long;
}

constexpr std::string_view to_string(error_code ec) noexcept {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::header_truncated: return "header_truncated";
    case error_code::header_token_missing: return "header_token_missing";
    case error_code::header_line_too_long: return "header_line_too_long";
    case error_code::not_found: return "not_found";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
  }
  return "unknown";
}

} // namespace deltachain::core
