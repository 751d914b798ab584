#include "deltachain/header/line_scanner.hpp"

#include <algorithm>
#include <utility>

namespace deltachain::header {

namespace {
core::error line_too_long(std::size_t line_no, std::size_t limit) {
  return core::error{core::error_code::header_line_too_long,
    "header line " + std::to_string(line_no) + " exceeds " + std::to_string(limit) + " bytes",
    "header.scan"};
}
}

LineScanner::LineScanner(std::size_t max_lines, std::size_t max_line_bytes)
  : max_lines_(max_lines), max_line_bytes_(max_line_bytes) {
  lines_.reserve(max_lines_);
}

auto LineScanner::feed(std::span<const std::uint8_t> chunk) -> std::expected<std::size_t, core::error> {
  std::size_t pos = 0;
  while (!done() && pos < chunk.size()) {
    const auto* begin = chunk.data() + pos;
    const auto* end = chunk.data() + chunk.size();
    const auto* nl = std::find(begin, end, static_cast<std::uint8_t>('\n'));
    const std::size_t seg = static_cast<std::size_t>(nl - begin);
    // +1 leaves room for the '\r' of a "\r\n" pair
    if (partial_.size() + seg > max_line_bytes_ + 1) {
      return std::unexpected(line_too_long(lines_.size() + 1, max_line_bytes_));
    }
    partial_.append(reinterpret_cast<const char*>(begin), seg);
    pos += seg;
    if (nl == end) break;
    ++pos; // terminator
    if (auto r = complete_line(); !r) return std::unexpected(r.error());
  }
  return pos;
}

auto LineScanner::finish() -> std::expected<void, core::error> {
  if (done() || partial_.empty()) return {};
  return complete_line();
}

auto LineScanner::complete_line() -> std::expected<void, core::error> {
  if (!partial_.empty() && partial_.back() == '\r') partial_.pop_back();
  if (partial_.size() > max_line_bytes_) {
    return std::unexpected(line_too_long(lines_.size() + 1, max_line_bytes_));
  }
  lines_.push_back(std::move(partial_));
  partial_.clear();
  return {};
}

} // namespace deltachain::header
