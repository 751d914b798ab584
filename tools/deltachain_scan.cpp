#include "deltachain/chain/baseline.hpp"
#include "deltachain/chain/directory.hpp"
#include "deltachain/config.hpp"
#include "deltachain/core/platform_utils.hpp"

#include <iostream>
#include <optional>
#include <string>

using deltachain::chain::ValidationResult;

namespace {

void print_usage() {
    std::cout << "deltachain_scan: list the incremental files that chain from the baseline\n"
              << "Usage: deltachain_scan [dir]\n"
              << "Environment: DELTACHAIN_DIR DELTACHAIN_BASELINE DELTACHAIN_BASELINE_FILE\n"
              << "             DELTACHAIN_IGNORE_PATTERN DELTACHAIN_POLICY=skip|stop\n"
              << "             DELTACHAIN_CHUNK_BYTES DELTACHAIN_MAX_LINE_BYTES\n"
              << "             DELTACHAIN_REQUIRE_PREFIX=0|1 DELTACHAIN_DEBUG=1\n";
}

void print_report(const ValidationResult& r) {
    for (const auto& f : r.accepted) std::cout << f << "\n";
    for (const auto& o : r.rejected) {
        std::cerr << "rejected " << o.file << ": previous=" << o.previous_token
                  << " expected=" << o.expected_previous.value_or("<none>") << "\n";
    }
    if (r.stopped_at_mismatch) std::cerr << "stopped at first mismatch\n";
    if (r.halt) {
        std::cerr << "halted at " << r.halt->file << ": "
                  << deltachain::core::to_string(r.halt->reason.code) << ": "
                  << r.halt->reason.message << "\n";
    }
    std::cerr << "final token: " << r.final_token.value_or("<none>") << "\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 2) { print_usage(); return 2; }
    if (argc == 2) {
        std::string a(argv[1]);
        if (a == "--help" || a == "-h") { print_usage(); return 0; }
    }

    auto cfg = deltachain::load_config_from_env();
    if (!cfg) {
        std::cerr << "config: " << cfg.error().message << "\n";
        return 2;
    }
    if (argc == 2) cfg->dir = argv[1];

    const bool baseline_from_env = deltachain::core::safe_getenv("DELTACHAIN_BASELINE").has_value();
    if (!baseline_from_env && !cfg->baseline_file.empty()) {
        auto b = deltachain::chain::load_baseline(cfg->baseline_file);
        if (b) {
            cfg->baseline = *b;
        } else if (b.error().code != deltachain::core::error_code::not_found) {
            std::cerr << "baseline: " << b.error().message << "\n";
            return 2;
        }
    }

    auto r = deltachain::chain::validate_directory(cfg->dir, cfg->baseline, cfg->options);
    if (!r) {
        std::cerr << r.error().component << ": " << r.error().message << "\n";
        return 2;
    }
    print_report(*r);
    if (!r->completed()) return 1;

    if (!cfg->baseline_file.empty() && r->final_token != cfg->baseline) {
        if (auto s = deltachain::chain::save_baseline(cfg->baseline_file, r->final_token); !s) {
            std::cerr << "baseline: " << s.error().message << "\n";
            return 2;
        }
    }
    return 0;
}
