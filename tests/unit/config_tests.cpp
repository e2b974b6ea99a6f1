#include <doctest/doctest.h>
#include <cardkit/config.hpp>

#include "test_helpers.hpp"

#include <algorithm>
#include <cstdlib>

using namespace cardkit;
using namespace cardkit::test;

namespace {

bool has_warning(const std::vector<std::string>& warnings, const std::string& text) {
    return std::find(warnings.begin(), warnings.end(), text) != warnings.end();
}

#ifndef _WIN32
// Sets an environment variable for the lifetime of the object
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~ScopedEnv() { unsetenv(name_); }

private:
    const char* name_;
};
#endif

} // namespace

TEST_CASE("parse_config reads every field") {
    auto result = parse_config(R"({
        "storage_path": "/var/lib/cards",
        "limits": {"max_png_size_mb": 8, "warn_png_size_mb": 3.5},
        "uri": {"allow_http": true, "allow_file": false},
        "log_level": "debug"
    })", "/etc/cardkit.json");

    REQUIRE(result.ok);
    CHECK(result.warnings.empty());
    CHECK(result.config.storage_path == "/var/lib/cards");
    CHECK(result.config.limits.max_mb == doctest::Approx(8.0));
    CHECK(result.config.limits.warn_mb == doctest::Approx(3.5));
    CHECK(result.config.uri.allow_http);
    CHECK_FALSE(result.config.uri.allow_file);
    CHECK(result.config.log_level == spdlog::level::debug);
    CHECK(result.config.source_path == "/etc/cardkit.json");
}

TEST_CASE("parse_config defaults") {
    auto result = parse_config("{}");
    REQUIRE(result.ok);
    CHECK(result.config.storage_path == ".");
    CHECK(result.config.limits.max_mb == doctest::Approx(4.0));
    CHECK(result.config.limits.warn_mb == doctest::Approx(2.0));
    CHECK_FALSE(result.config.uri.allow_http);
    CHECK_FALSE(result.config.uri.allow_file);
    CHECK(result.config.log_level == spdlog::level::warn);
}

TEST_CASE("parse_config warns on unknown keys") {
    auto result = parse_config(R"({"storage": "/x", "limits": {"max_mb": 1}})");
    REQUIRE(result.ok);
    CHECK(has_warning(result.warnings, "unknown_key:storage"));
    CHECK(has_warning(result.warnings, "unknown_key:limits.max_mb"));
}

TEST_CASE("parse_config keeps defaults for invalid values") {
    auto result = parse_config(R"({
        "storage_path": 42,
        "limits": {"max_png_size_mb": -1, "warn_png_size_mb": "big"},
        "uri": {"allow_http": "yes"},
        "log_level": "loud"
    })");
    REQUIRE(result.ok);
    CHECK(result.config.storage_path == ".");
    CHECK(result.config.limits.max_mb == doctest::Approx(4.0));
    CHECK(result.config.limits.warn_mb == doctest::Approx(2.0));
    CHECK_FALSE(result.config.uri.allow_http);
    CHECK(result.config.log_level == spdlog::level::warn);
    CHECK(has_warning(result.warnings, "invalid_configuration:storage_path"));
    CHECK(has_warning(result.warnings, "invalid_configuration:limits.max_png_size_mb"));
    CHECK(has_warning(result.warnings, "invalid_configuration:limits.warn_png_size_mb"));
    CHECK(has_warning(result.warnings, "invalid_configuration:uri.allow_http"));
    CHECK(has_warning(result.warnings, "invalid_configuration:log_level"));
}

TEST_CASE("parse_config rejects malformed documents") {
    CHECK_FALSE(parse_config("not json").ok);
    CHECK_FALSE(parse_config("[1, 2]").ok);
}

TEST_CASE("parse_log_level") {
    CHECK(parse_log_level("TRACE") == spdlog::level::trace);
    CHECK(parse_log_level("warning") == spdlog::level::warn);
    CHECK(parse_log_level(" error ") == spdlog::level::err);
    CHECK(parse_log_level("off") == spdlog::level::off);
    CHECK_FALSE(parse_log_level("verbose").has_value());
}

TEST_CASE("load_config reads an explicit file") {
    TempDir temp;
    temp.write("config.json", std::string(R"({"storage_path": "/cards"})"));

    auto result = load_config(temp.file("config.json"));
    REQUIRE(result.ok);
    CHECK(result.config.storage_path == "/cards");
    CHECK(result.config.source_path == temp.file("config.json"));
}

TEST_CASE("load_config fails on a missing explicit file") {
    auto result = load_config(std::string("/nonexistent/cardkit/config.json"));
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.error.empty());
}

#ifndef _WIN32
TEST_CASE("environment overrides config values") {
    ScopedEnv storage("CARDKIT_STORAGE_PATH", "/env/storage");
    ScopedEnv max_mb("CARDKIT_MAX_PNG_SIZE_MB", "10");
    ScopedEnv warn_mb("CARDKIT_WARN_PNG_SIZE_MB", "zero");
    ScopedEnv level("CARDKIT_LOG_LEVEL", "info");

    Config config;
    std::vector<std::string> warnings;
    apply_env_overrides(config, warnings);

    CHECK(config.storage_path == "/env/storage");
    CHECK(config.limits.max_mb == doctest::Approx(10.0));
    CHECK(config.limits.warn_mb == doctest::Approx(2.0));
    CHECK(config.log_level == spdlog::level::info);
    CHECK(has_warning(warnings, "invalid_configuration:CARDKIT_WARN_PNG_SIZE_MB"));
}

TEST_CASE("load_config falls back to CARDKIT_CONFIG") {
    TempDir temp;
    temp.write("env.json", std::string(R"({"log_level": "error"})"));
    ScopedEnv config_path("CARDKIT_CONFIG", temp.file("env.json").c_str());

    auto result = load_config();
    REQUIRE(result.ok);
    CHECK(result.config.log_level == spdlog::level::err);
    CHECK(result.config.source_path == temp.file("env.json"));
}
#endif
