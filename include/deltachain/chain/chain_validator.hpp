#pragma once

/** \file chain_validator.hpp
 *  \brief Sequential validation of incremental files against a token chain.
 *
 * Names are sorted lexicographically ascending and processed strictly one at a
 * time; the decision for file N fixes the token file N+1 is compared against.
 *
 * Per file:
 *  1. names matching ignore_pattern are skipped; state is untouched
 *  2. cancellation is checked (between files only)
 *  3. the source is opened; failure halts the run (source read error)
 *  4. the two header lines are extracted and the source released; a malformed
 *     header halts the run, keeping the accepted prefix
 *  5. accepted iff latest_token is unset or equals previous_token; an accepted
 *     file sets latest_token := current_token, a rejected file changes nothing
 *
 * Mismatch policy:
 *  - Skip: rejected files are recorded and scanning continues (default)
 *  - Stop: the first mismatch ends the run normally; later files are not opened
 */

#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "deltachain/error.hpp"
#include "deltachain/header/header_extractor.hpp"
#include "deltachain/io/byte_source.hpp"

namespace deltachain::chain {

/** Mutable run state; owned by a single validate_chain call. */
struct ChainState {
  std::optional<std::string> latest_token;
};

enum class MismatchPolicy : std::uint8_t { Skip, Stop };

enum class Disposition : std::uint8_t { Accepted, Rejected, Ignored };

struct FileOutcome {
  std::string file;
  Disposition disposition{Disposition::Ignored};
  std::string current_token;                     // empty when ignored
  std::string previous_token;                    // empty when ignored
  std::optional<std::string> expected_previous;  // latest_token at decision time
};

struct ValidateOptions {
  std::string ignore_pattern{"^\\.gitkeep$"};  /**< ECMAScript regex on the file name; empty disables */
  MismatchPolicy policy{MismatchPolicy::Skip};
  header::ExtractOptions extract{};
  std::function<bool()> cancel_requested{};    /**< polled once per file, before it is opened */
  std::function<void(const FileOutcome&)> on_outcome{};
  bool trace{false};                           /**< trace decisions to stderr; DELTACHAIN_DEBUG also enables it */
};

/** File and reason of a fatal stop. */
struct ChainHalt {
  std::string file;
  core::error reason;
};

struct ValidationResult {
  std::vector<std::string> accepted;      /**< processing order == sort order */
  std::vector<FileOutcome> rejected;
  std::vector<std::string> ignored;
  std::optional<std::string> final_token; /**< latest_token after the last decision */
  std::optional<ChainHalt> halt;
  bool cancelled{false};
  bool stopped_at_mismatch{false};

  bool completed() const noexcept { return !halt.has_value() && !cancelled; }
};

/** Runs the chain over names. Fails only on invalid options; per-file failures are reported via halt. */
[[nodiscard]] auto validate_chain(std::vector<std::string> names,
                                  std::optional<std::string> baseline,
                                  const io::SourceFactory& open_source,
                                  const ValidateOptions& opts = {})
    -> std::expected<ValidationResult, core::error>;

const char* to_string(Disposition d) noexcept;

} // namespace deltachain::chain
