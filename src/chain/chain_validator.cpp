#include "deltachain/chain/chain_validator.hpp"
#include "deltachain/core/platform_utils.hpp"

#include <algorithm>
#include <iostream>
#include <regex>
#include <utility>

namespace deltachain::chain {

namespace {

enum class Step : std::uint8_t { Continue, Stop };

struct Run {
  ChainState state;
  ValidationResult result;
  const ValidateOptions& opts;
  const io::SourceFactory& open_source;
  bool dbg;

  void report(const FileOutcome& o) {
    if (dbg) {
      std::cerr << "[CHAIN][validate] " << to_string(o.disposition) << " " << o.file;
      if (o.disposition != Disposition::Ignored) {
        std::cerr << " current=" << o.current_token << " previous=" << o.previous_token
                  << " expected=" << o.expected_previous.value_or("<none>");
      }
      std::cerr << std::endl;
    }
    if (opts.on_outcome) opts.on_outcome(o);
  }

  Step halt(const std::string& file, core::error e) {
    if (dbg) {
      std::cerr << "[CHAIN][validate] halt at " << file << ": " << core::to_string(e.code)
                << " (" << e.message << ")" << std::endl;
    }
    result.halt = ChainHalt{file, std::move(e)};
    return Step::Stop;
  }

  // One file, start to finish. The source is released before returning.
  Step process(const std::string& file) {
    auto src = open_source(file);
    if (!src) return halt(file, src.error());
    if (!*src) {
      return halt(file, core::error{core::error_code::internal, "source factory returned null", "chain.validate"});
    }

    auto hdr = header::extract_header(**src, opts.extract);
    src->reset();
    if (!hdr) return halt(file, hdr.error());

    FileOutcome o{file, Disposition::Accepted, std::move(hdr->current_token),
                  std::move(hdr->previous_token), state.latest_token};
    if (state.latest_token && *state.latest_token != o.previous_token) {
      o.disposition = Disposition::Rejected;
      report(o);
      result.rejected.push_back(std::move(o));
      if (opts.policy == MismatchPolicy::Stop) {
        result.stopped_at_mismatch = true;
        return Step::Stop;
      }
      return Step::Continue;
    }

    state.latest_token = o.current_token;
    result.accepted.push_back(file);
    report(o);
    return Step::Continue;
  }
};

} // namespace

const char* to_string(Disposition d) noexcept {
  switch (d) {
    case Disposition::Accepted: return "accepted";
    case Disposition::Rejected: return "rejected";
    case Disposition::Ignored: return "ignored";
  }
  return "unknown";
}

auto validate_chain(std::vector<std::string> names,
                    std::optional<std::string> baseline,
                    const io::SourceFactory& open_source,
                    const ValidateOptions& opts)
    -> std::expected<ValidationResult, core::error> {
  using core::error; using core::error_code;
  if (!open_source) {
    return std::unexpected(error{error_code::invalid_argument, "source factory is empty", "chain.validate"});
  }
  std::optional<std::regex> ignore_rx;
  if (!opts.ignore_pattern.empty()) {
    try {
      ignore_rx.emplace(opts.ignore_pattern);
    } catch (const std::regex_error& e) {
      return std::unexpected(error{error_code::config_invalid,
        "invalid ignore pattern \"" + opts.ignore_pattern + "\": " + e.what(), "chain.validate"});
    }
  }

  std::sort(names.begin(), names.end());
  if (baseline && baseline->empty()) baseline.reset(); // empty baseline == no baseline

  Run run{ChainState{std::move(baseline)}, ValidationResult{}, opts, open_source,
          opts.trace || core::env_flag_enabled("DELTACHAIN_DEBUG")};
  if (run.dbg) {
    std::cerr << "[CHAIN][validate] " << names.size() << " file(s), baseline="
              << run.state.latest_token.value_or("<none>") << std::endl;
  }

  for (const auto& file : names) {
    if (ignore_rx && std::regex_search(file, *ignore_rx)) {
      run.result.ignored.push_back(file);
      run.report(FileOutcome{file, Disposition::Ignored, {}, {}, run.state.latest_token});
      continue;
    }
    if (opts.cancel_requested && opts.cancel_requested()) {
      run.result.cancelled = true;
      break;
    }
    if (run.process(file) == Step::Stop) break;
  }

  run.result.final_token = run.state.latest_token;
  if (run.dbg) {
    std::cerr << "[CHAIN][validate] done: accepted=" << run.result.accepted.size()
              << " rejected=" << run.result.rejected.size()
              << " final=" << run.result.final_token.value_or("<none>") << std::endl;
  }
  return std::move(run.result);
}

} // namespace deltachain::chain
