#pragma once

#include <cstdlib>
#include <optional>
#include <string>

namespace deltachain::core {

// Returns std::nullopt if the variable is not set. If set but empty, returns an
// engaged optional with an empty string.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
}

// Debug tracing switch: set and not starting with '0'.
inline bool env_flag_enabled(const char* name) noexcept {
    auto v = safe_getenv(name);
    return v && !v->empty() && ((*v)[0] != '0');
}

} // namespace deltachain::core
