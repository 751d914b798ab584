#include "deltachain/chain/baseline.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <string_view>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace deltachain::chain {

namespace {
constexpr std::string_view kHeader = "deltachain-baseline v1";
constexpr std::string_view kKey = "latest_token=";

bool valid_token(std::string_view t) {
  for (unsigned char c : t) { if (c <= 0x20 || c == 0x7F) return false; }
  return true;
}
}

auto load_baseline(const std::filesystem::path& path)
    -> std::expected<std::optional<std::string>, core::error> {
  using core::error; using core::error_code;
  // Only ENOENT means "no baseline yet"; ENOTDIR, EACCES and friends are failures
  struct ::stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    const int err = errno;
    if (err == ENOENT) return std::unexpected(error{error_code::not_found, "baseline missing: " + path.string(), "chain.baseline"});
    return std::unexpected(error{error_code::io_failed, "baseline stat failed: " + path.string() + ": " + std::strerror(err), "chain.baseline"});
  }
  std::ifstream in(path);
  if (!in.good()) return std::unexpected(error{error_code::io_failed, "baseline open failed: " + path.string(), "chain.baseline"});
  std::string header; std::getline(in, header);
  if (header != kHeader) {
    return std::unexpected(error{error_code::data_integrity, "bad baseline header", "chain.baseline"});
  }
  std::string line; std::getline(in, line);
  if (!line.empty() && line.back() == '\r') line.pop_back();
  if (line.rfind(kKey, 0) != 0) {
    return std::unexpected(error{error_code::data_integrity, "missing latest_token", "chain.baseline"});
  }
  auto token = line.substr(kKey.size());
  if (!valid_token(token)) {
    return std::unexpected(error{error_code::data_integrity, "malformed latest_token", "chain.baseline"});
  }
  if (token.empty()) return std::optional<std::string>{};
  return std::optional<std::string>{std::move(token)};
}

auto save_baseline(const std::filesystem::path& path, const std::optional<std::string>& token)
    -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (token && (token->empty() || !valid_token(*token))) {
    return std::unexpected(error{error_code::invalid_argument, "token must be non-empty without whitespace or control characters", "chain.baseline"});
  }
  auto tmp = path; tmp += ".tmp";
  // 1) Write tmp
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.good()) return std::unexpected(error{error_code::io_failed, "baseline tmp write failed", "chain.baseline"});
    out << kHeader << "\n";
    out << kKey << token.value_or("") << "\n";
    out.flush();
    if (!out.good()) {
      out.close();
      std::error_code rec; (void)std::filesystem::remove(tmp, rec);
      return std::unexpected(error{error_code::io_failed, "baseline tmp write failed", "chain.baseline"});
    }
  }
  // 2) Ensure tmp contents durable
  {
    int fd = ::open(tmp.c_str(), O_RDONLY);
    if (fd < 0) {
      std::error_code rec; (void)std::filesystem::remove(tmp, rec);
      return std::unexpected(error{error_code::io_failed, "baseline tmp fsync open failed", "chain.baseline"});
    }
    (void)::fsync(fd);
    (void)::close(fd);
  }
  // 3) Atomic replace
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::error_code rec; (void)std::filesystem::remove(tmp, rec);
    return std::unexpected(error{error_code::io_failed, "baseline rename failed: " + ec.message(), "chain.baseline"});
  }
  // 4) Best-effort directory flush
  auto dir = path.parent_path();
  if (dir.empty()) dir = ".";
  int dfd = ::open(dir.c_str(), O_RDONLY);
  if (dfd >= 0) { (void)::fsync(dfd); (void)::close(dfd); }
  return {};
}

} // namespace deltachain::chain
