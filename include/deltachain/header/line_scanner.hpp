#pragma once

/** \file line_scanner.hpp
 *  \brief Incremental line splitter over pushed byte chunks.
 *
 * State machine: accumulate partial line -> emit on '\n' -> count -> done.
 * A single '\r' before the terminator is stripped, so "\n" and "\r\n" both work.
 * Once max_lines lines are complete, feed() consumes nothing further; bytes past
 * the last wanted terminator are never copied.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "deltachain/error.hpp"

namespace deltachain::header {

class LineScanner {
public:
  LineScanner(std::size_t max_lines, std::size_t max_line_bytes);

  /** Scans chunk and returns the number of bytes consumed (less than chunk.size() only once done()). */
  auto feed(std::span<const std::uint8_t> chunk) -> std::expected<std::size_t, core::error>;

  /** End of input: a non-empty unterminated partial line becomes the final line. */
  auto finish() -> std::expected<void, core::error>;

  bool done() const noexcept { return lines_.size() >= max_lines_; }
  const std::vector<std::string>& lines() const noexcept { return lines_; }
  std::vector<std::string> take_lines() { return std::move(lines_); }

  /** Bytes held for the current partial line. */
  std::size_t buffered_bytes() const noexcept { return partial_.size(); }

private:
  auto complete_line() -> std::expected<void, core::error>;

  std::size_t max_lines_;
  std::size_t max_line_bytes_;
  std::string partial_;
  std::vector<std::string> lines_;
};

} // namespace deltachain::header
