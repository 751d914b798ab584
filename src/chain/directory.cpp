#include "deltachain/chain/directory.hpp"
#include "deltachain/io/byte_source.hpp"

#include <algorithm>
#include <utility>

namespace deltachain::chain {

auto list_directory(const std::filesystem::path& dir)
    -> std::expected<std::vector<std::string>, core::error> {
  using core::error; using core::error_code;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return std::unexpected(error{error_code::not_found, "not a directory: " + dir.string(), "chain.directory"});
  }
  std::vector<std::string> names;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    return std::unexpected(error{error_code::io_failed, "list failed: " + dir.string() + ": " + ec.message(), "chain.directory"});
  }
  for (const std::filesystem::directory_iterator end{}; it != end; it.increment(ec)) {
    if (ec) break;
    std::error_code fec;
    if (!it->is_regular_file(fec) || fec) continue;
    names.push_back(it->path().filename().string());
  }
  if (ec) {
    return std::unexpected(error{error_code::io_failed, "list failed: " + dir.string() + ": " + ec.message(), "chain.directory"});
  }
  std::sort(names.begin(), names.end());
  return names;
}

auto validate_directory(const std::filesystem::path& dir,
                        std::optional<std::string> baseline,
                        const ValidateOptions& opts)
    -> std::expected<ValidationResult, core::error> {
  auto names = list_directory(dir);
  if (!names) return std::unexpected(names.error());
  return validate_chain(std::move(*names), std::move(baseline), io::directory_source_factory(dir), opts);
}

} // namespace deltachain::chain
