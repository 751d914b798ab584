#include "deltachain/config.hpp"
#include "deltachain/core/platform_utils.hpp"

#include <charconv>
#include <utility>

namespace deltachain {

namespace {

auto parse_size(const char* name, const std::string& v) -> std::expected<std::size_t, core::error> {
  using core::error; using core::error_code;
  const char* beg = v.data(); const char* end = beg + v.size();
  unsigned long long tmp = 0;
  auto [ptr, ec] = std::from_chars(beg, end, tmp, 10);
  if (ec != std::errc() || ptr != end || tmp == 0) {
    return std::unexpected(error{error_code::config_invalid, std::string(name) + "=\"" + v + "\" is not a positive integer", "config"});
  }
  return static_cast<std::size_t>(tmp);
}

} // namespace

auto load_config_from_env(Config base) -> std::expected<Config, core::error> {
  using core::error; using core::error_code; using core::safe_getenv;
  Config c = std::move(base);

  if (auto v = safe_getenv("DELTACHAIN_DIR"); v && !v->empty()) c.dir = *v;
  if (auto v = safe_getenv("DELTACHAIN_BASELINE")) {
    if (v->empty()) c.baseline.reset(); else c.baseline = *v;
  }
  if (auto v = safe_getenv("DELTACHAIN_BASELINE_FILE"); v && !v->empty()) c.baseline_file = *v;
  if (auto v = safe_getenv("DELTACHAIN_IGNORE_PATTERN")) c.options.ignore_pattern = *v;
  if (auto v = safe_getenv("DELTACHAIN_POLICY")) {
    if (*v == "skip") c.options.policy = chain::MismatchPolicy::Skip;
    else if (*v == "stop") c.options.policy = chain::MismatchPolicy::Stop;
    else return std::unexpected(error{error_code::config_invalid, "DELTACHAIN_POLICY=\"" + *v + "\" (expected skip|stop)", "config"});
  }
  if (auto v = safe_getenv("DELTACHAIN_CHUNK_BYTES")) {
    auto n = parse_size("DELTACHAIN_CHUNK_BYTES", *v); if (!n) return std::unexpected(n.error());
    c.options.extract.chunk_bytes = *n;
  }
  if (auto v = safe_getenv("DELTACHAIN_MAX_LINE_BYTES")) {
    auto n = parse_size("DELTACHAIN_MAX_LINE_BYTES", *v); if (!n) return std::unexpected(n.error());
    c.options.extract.max_line_bytes = *n;
  }
  if (auto v = safe_getenv("DELTACHAIN_REQUIRE_PREFIX")) {
    if (*v == "1") c.options.extract.format.require_prefix = true;
    else if (*v == "0") c.options.extract.format.require_prefix = false;
    else return std::unexpected(error{error_code::config_invalid, "DELTACHAIN_REQUIRE_PREFIX=\"" + *v + "\" (expected 0|1)", "config"});
  }
  if (core::env_flag_enabled("DELTACHAIN_DEBUG")) c.options.trace = true;
  return c;
}

} // namespace deltachain
