#pragma once

/** \file directory.hpp
 *  \brief Filename enumeration and whole-directory chain runs.
 */

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "deltachain/chain/chain_validator.hpp"
#include "deltachain/error.hpp"

namespace deltachain::chain {

/** Names of the regular files directly inside dir, sorted ascending. */
[[nodiscard]] auto list_directory(const std::filesystem::path& dir)
    -> std::expected<std::vector<std::string>, core::error>;

/** list_directory + validate_chain with files opened from dir. */
[[nodiscard]] auto validate_directory(const std::filesystem::path& dir,
                                      std::optional<std::string> baseline,
                                      const ValidateOptions& opts = {})
    -> std::expected<ValidationResult, core::error>;

} // namespace deltachain::chain
