#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <optional>
#include <string>
#include "deltachain/core/platform_utils.hpp"

using deltachain::core::env_flag_enabled;
using deltachain::core::safe_getenv;

TEST_CASE("safe_getenv returns nullopt when unset", "[platform][env]") {
    const char* key = "DELTACHAIN_TEST_SAFE_GETENV_UNSET";
    unsetenv(key);
    REQUIRE_FALSE(safe_getenv(key).has_value());
    REQUIRE_FALSE(safe_getenv(nullptr).has_value());
    REQUIRE_FALSE(safe_getenv("").has_value());
}

TEST_CASE("safe_getenv returns value and empty string when set", "[platform][env]") {
    const char* key = "DELTACHAIN_TEST_SAFE_GETENV_VALUE";
    setenv(key, "hello_world", 1);
    auto v = safe_getenv(key);
    REQUIRE(v.has_value());
    REQUIRE(*v == std::string("hello_world"));
    setenv(key, "", 1);
    v = safe_getenv(key);
    REQUIRE(v.has_value());
    REQUIRE(v->empty());
    unsetenv(key);
}

TEST_CASE("env_flag_enabled treats unset, empty and 0-prefixed values as off", "[platform][env]") {
    const char* key = "DELTACHAIN_TEST_FLAG";
    unsetenv(key);
    REQUIRE_FALSE(env_flag_enabled(key));
    setenv(key, "", 1);
    REQUIRE_FALSE(env_flag_enabled(key));
    setenv(key, "0", 1);
    REQUIRE_FALSE(env_flag_enabled(key));
    setenv(key, "1", 1);
    REQUIRE(env_flag_enabled(key));
    unsetenv(key);
}
