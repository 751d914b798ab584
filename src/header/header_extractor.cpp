#include "deltachain/header/header_extractor.hpp"
#include "deltachain/header/line_scanner.hpp"

#include <cstdint>
#include <vector>

namespace {

bool is_ws(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v'; }

std::string_view trim(std::string_view s) {
  while (!s.empty() && is_ws(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_ws(s.back())) s.remove_suffix(1);
  return s;
}

// Closes the source on scope exit, whichever way extraction ends.
struct CloseGuard {
  deltachain::io::ByteSource& src;
  ~CloseGuard() { src.close(); }
};

} // namespace

namespace deltachain::header {

auto read_header_lines(io::ByteSource& src, const ExtractOptions& opts)
    -> std::expected<std::array<std::string, 2>, core::error> {
  using core::error; using core::error_code;
  CloseGuard guard{src};
  if (opts.chunk_bytes == 0 || opts.max_line_bytes == 0) {
    return std::unexpected(error{error_code::invalid_argument, "chunk_bytes and max_line_bytes must be > 0", "header.extract"});
  }

  LineScanner scanner(2, opts.max_line_bytes);
  std::vector<std::uint8_t> chunk(opts.chunk_bytes);
  while (!scanner.done()) {
    auto n = src.read(chunk);
    if (!n) {
      auto e = n.error();
      if (e.code != error_code::not_found) e.code = error_code::io_failed;
      e.message = "source read failed before header complete: " + e.message;
      return std::unexpected(std::move(e));
    }
    if (*n == 0) {
      if (auto f = scanner.finish(); !f) return std::unexpected(f.error());
      break;
    }
    auto used = scanner.feed(std::span<const std::uint8_t>(chunk.data(), *n));
    if (!used) {
      auto e = used.error();
      e.message = src.name() + ": " + e.message;
      return std::unexpected(std::move(e));
    }
  }

  if (!scanner.done()) {
    return std::unexpected(error{error_code::header_truncated,
      src.name() + ": expected 2 header lines, found " + std::to_string(scanner.lines().size()),
      "header.extract"});
  }
  auto lines = scanner.take_lines();
  return std::array<std::string, 2>{std::move(lines[0]), std::move(lines[1])};
}

auto parse_token(std::string_view line) -> std::expected<std::string, core::error> {
  using core::error; using core::error_code;
  const auto body = trim(line);
  const auto sep = body.rfind(' ');
  if (sep == std::string_view::npos) {
    return std::unexpected(error{error_code::header_token_missing, "no token separator in header line", "header.parse"});
  }
  const auto token = trim(body.substr(sep + 1));
  if (token.empty()) {
    return std::unexpected(error{error_code::header_token_missing, "empty token in header line", "header.parse"});
  }
  return std::string(token);
}

auto extract_header(io::ByteSource& src, const ExtractOptions& opts)
    -> std::expected<HeaderPair, core::error> {
  using core::error; using core::error_code;
  const std::string name = src.name();
  auto lines = read_header_lines(src, opts);
  if (!lines) return std::unexpected(lines.error());

  const auto& fmt = opts.format;
  const std::string_view prefixes[2] = {fmt.current_prefix, fmt.previous_prefix};
  std::string tokens[2];
  for (int i = 0; i < 2; ++i) {
    const auto& line = (*lines)[i];
    if (fmt.require_prefix && std::string_view(line).rfind(prefixes[i], 0) != 0) {
      return std::unexpected(error{error_code::header_token_missing,
        name + ": header line " + std::to_string(i + 1) + " does not start with \"" + std::string(prefixes[i]) + "\"",
        "header.parse"});
    }
    auto tok = parse_token(line);
    if (!tok) {
      auto e = tok.error();
      e.message = name + ": line " + std::to_string(i + 1) + ": " + e.message;
      return std::unexpected(std::move(e));
    }
    tokens[i] = std::move(*tok);
  }
  return HeaderPair{std::move(tokens[0]), std::move(tokens[1])};
}

} // namespace deltachain::header
