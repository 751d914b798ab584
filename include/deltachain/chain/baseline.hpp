#pragma once

/** \file baseline.hpp
 *  \brief File-backed baseline token store.
 *
 * Format (v1):
 *   deltachain-baseline v1\n
 *   latest_token=<token>\n
 * An empty token means "no baseline": the first file of the next run is accepted unchecked.
 *
 * Atomic, durable save (POSIX):
 * - Write contents to a temporary sibling file (<name>.tmp)
 * - fsync(tmp)
 * - rename(tmp, path), replacing any existing file
 * - Best-effort fsync of the parent directory
 * - On failure, the tmp file is removed and an io_failed error is returned.
 */

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include "deltachain/error.hpp"

namespace deltachain::chain {

auto load_baseline(const std::filesystem::path& path)
    -> std::expected<std::optional<std::string>, core::error>;

auto save_baseline(const std::filesystem::path& path, const std::optional<std::string>& token)
    -> std::expected<void, core::error>;

} // namespace deltachain::chain
