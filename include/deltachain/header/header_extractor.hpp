#pragma once

/** \file header_extractor.hpp
 *  \brief Lazy extraction of the two header lines of an incremental file.
 *
 * Header format:
 *   line 1: "<current_prefix> <token>"   e.g. "-- Increment timestamp: 20160129_192339"
 *   line 2: "<previous_prefix> <token>"  e.g. "-- Previous timestamp: 20160128_192500"
 * The token is the text after the last space of the line, whitespace-trimmed.
 * Lines end in "\n" or "\r\n".
 *
 * Memory is bounded by chunk_bytes + max_line_bytes regardless of the file size:
 * chunks are pulled only until the second line terminator is seen, then the source
 * is closed without reading the remainder.
 */

#include <array>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

#include "deltachain/error.hpp"
#include "deltachain/io/byte_source.hpp"

namespace deltachain::header {

struct HeaderPair {
  std::string current_token;   // line 1
  std::string previous_token;  // line 2
};

struct HeaderFormat {
  std::string current_prefix{"-- Increment timestamp:"};
  std::string previous_prefix{"-- Previous timestamp:"};
  bool require_prefix{false};  /**< reject lines not starting with their prefix */
};

struct ExtractOptions {
  std::size_t chunk_bytes{4096};         /**< upper bound of a single read request */
  std::size_t max_line_bytes{64 * 1024}; /**< guard per header line */
  HeaderFormat format{};
};

/** Pulls the first two lines from src, then closes it. The source is closed on every path. */
[[nodiscard]] auto read_header_lines(io::ByteSource& src, const ExtractOptions& opts = {})
    -> std::expected<std::array<std::string, 2>, core::error>;

/** Token after the last space of line, whitespace-trimmed; header_token_missing if none. */
[[nodiscard]] auto parse_token(std::string_view line) -> std::expected<std::string, core::error>;

[[nodiscard]] auto extract_header(io::ByteSource& src, const ExtractOptions& opts = {})
    -> std::expected<HeaderPair, core::error>;

} // namespace deltachain::header
