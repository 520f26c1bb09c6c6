#include <doctest/doctest.h>
#include <filerix/config.hpp>
#include <filerix/log.hpp>

#include "test_support.hpp"

#include <cstdlib>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

using namespace filerix;

namespace {

#ifndef _WIN32
// Set an environment variable for the lifetime of the guard
class EnvGuard {
public:
    EnvGuard(const char* name, const std::string& value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            old_ = old;
        }
        setenv(name, value.c_str(), 1);
    }

    ~EnvGuard() {
        if (old_) {
            setenv(name_, old_->c_str(), 1);
        } else {
            unsetenv(name_);
        }
    }

private:
    const char* name_;
    std::optional<std::string> old_;
};
#endif

} // namespace

TEST_CASE("builtin config defaults") {
    auto config = get_builtin_config();
    CHECK(config.schema == CONFIG_SCHEMA);
    CHECK(config.log_level == "info");
    CHECK(config.create.overwrite);
    CHECK_FALSE(config.create.compact);
    CHECK(config.create.encoding == "utf-8");
    CHECK(config.read.encoding == "utf-8");
    CHECK(config.temp.prefix == "tmp_");
    CHECK(config.temp.suffix == ".tmp");
    CHECK_FALSE(config.temp.directory.has_value());
    CHECK(config.temp.close_immediately);
}

TEST_CASE("config parses all sections") {
    const char* json = R"({
        "$schema": "filerix.config.v1",
        "log_level": "debug",
        "create": { "overwrite": false, "compact": true, "encoding": "ascii" },
        "read": { "encoding": "latin-1" },
        "temp": { "prefix": "job_", "suffix": ".part", "directory": "~/scratch", "close_immediately": false }
    })";
    auto result = parse_config_full(json, "test.json");
    REQUIRE(result.ok);
    CHECK(result.warnings.empty());
    CHECK(result.config.source_path == "test.json");
    CHECK(result.config.log_level == "debug");
    CHECK_FALSE(result.config.create.overwrite);
    CHECK(result.config.create.compact);
    CHECK(result.config.create.encoding == "ascii");
    CHECK(result.config.read.encoding == "latin-1");
    CHECK(result.config.temp.prefix == "job_");
    CHECK(result.config.temp.suffix == ".part");
    REQUIRE(result.config.temp.directory.has_value());
    CHECK(*result.config.temp.directory == "~/scratch");
    CHECK_FALSE(result.config.temp.close_immediately);
}

TEST_CASE("config missing sections keep defaults") {
    auto result = parse_config_full(R"({"$schema": "filerix.config.v1"})");
    REQUIRE(result.ok);
    CHECK(result.config.create.overwrite);
    CHECK(result.config.temp.prefix == "tmp_");
}

TEST_CASE("config schema errors") {
    SUBCASE("missing schema") {
        auto result = parse_config_full(R"({"log_level": "info"})");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "$schema missing");
    }

    SUBCASE("mismatched schema") {
        auto result = parse_config_full(R"({"$schema": "filerix.config.v0"})");
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("mismatch") != std::string::npos);
    }

    SUBCASE("not an object") {
        auto result = parse_config_full("[1, 2]");
        CHECK_FALSE(result.ok);
    }

    SUBCASE("malformed JSON") {
        auto result = parse_config_full("{ not json");
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("JSON parse error") == 0);
    }
}

TEST_CASE("config invalid values fall back with warnings") {
    const char* json = R"({
        "$schema": "filerix.config.v1",
        "log_level": "chatty",
        "create": { "encoding": "klingon" }
    })";
    auto result = parse_config_full(json);
    REQUIRE(result.ok);
    CHECK(result.config.log_level == "info");
    CHECK(result.config.create.encoding == "utf-8");
    REQUIRE(result.warnings.size() == 2);
    CHECK(result.warnings[0] == "invalid_configuration:log_level");
    CHECK(result.warnings[1] == "invalid_configuration:create.encoding");
}

TEST_CASE("load config from file") {
    TempTestDir temp_dir;

    SUBCASE("existing file") {
        std::string path = temp_dir.write("filerix.json",
                                          R"({"$schema": "filerix.config.v1", "log_level": "warn"})");
        auto result = load_config(path);
        REQUIRE(result.ok);
        CHECK(result.config.log_level == "warn");
        CHECK(result.config.source_path == path);
    }

    SUBCASE("missing file") {
        auto result = load_config(temp_dir.file("absent.json"));
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("[not_found]") == 0);
    }
}

#ifndef _WIN32
TEST_CASE("resolve config from environment") {
    TempTestDir temp_dir;
    std::string path = temp_dir.write("env.json",
                                      R"({"$schema": "filerix.config.v1", "create": {"compact": true}})");
    EnvGuard config_env(CONFIG_ENV_VAR, path);

    SUBCASE("config file from FILERIX_CONFIG") {
        EnvGuard level_env(LOG_LEVEL_ENV_VAR, "");
        auto result = resolve_config();
        REQUIRE(result.ok);
        CHECK(result.config.create.compact);
        CHECK(result.config.log_level == "info");
    }

    SUBCASE("FILERIX_LOG_LEVEL overrides") {
        EnvGuard level_env(LOG_LEVEL_ENV_VAR, "error");
        auto result = resolve_config();
        REQUIRE(result.ok);
        CHECK(result.config.log_level == "error");
    }
}
#endif

TEST_CASE("log level names") {
    CHECK(is_known_log_level("debug"));
    CHECK(is_known_log_level("WARN"));
    CHECK(is_known_log_level("off"));
    CHECK_FALSE(is_known_log_level("loud"));

    auto before = spdlog::get_level();
    CHECK_FALSE(set_log_level("loud"));
    CHECK(spdlog::get_level() == before);

    CHECK(set_log_level("error"));
    CHECK(spdlog::get_level() == spdlog::level::err);
    spdlog::set_level(before);
}
