#pragma once

/** \file config.hpp
 *  \brief Run configuration with environment overrides.
 *
 * Variables (all optional):
 *   DELTACHAIN_DIR             directory of incremental files
 *   DELTACHAIN_BASELINE        baseline token; empty means no baseline
 *   DELTACHAIN_BASELINE_FILE   baseline store (see baseline.hpp); used when DELTACHAIN_BASELINE is unset
 *   DELTACHAIN_IGNORE_PATTERN  regex of names to skip; empty disables
 *   DELTACHAIN_POLICY          "skip" | "stop"
 *   DELTACHAIN_CHUNK_BYTES     read request size (> 0)
 *   DELTACHAIN_MAX_LINE_BYTES  header line guard (> 0)
 *   DELTACHAIN_REQUIRE_PREFIX  "0" | "1"
 *   DELTACHAIN_DEBUG           sets options.trace unless it starts with '0'
 */

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include "deltachain/chain/chain_validator.hpp"
#include "deltachain/error.hpp"

namespace deltachain {

struct Config {
  std::filesystem::path dir{"incrementals"};
  std::optional<std::string> baseline{};
  std::filesystem::path baseline_file{};
  chain::ValidateOptions options{};
};

/** Applies the environment on top of base; malformed values are config_invalid. */
[[nodiscard]] auto load_config_from_env(Config base = {}) -> std::expected<Config, core::error>;

} // namespace deltachain
