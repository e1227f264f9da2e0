// tests/test_config.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "tmpltool/core/config.h"
#include "tmpltool/core/errors.h"
#include "test_helpers.h"
#include <cstdlib>
#include <stdexcept>

using namespace tmpltool;
using tmpltool::testing::ScopedCwd;
using tmpltool::testing::TempDir;
using Catch::Matchers::StartsWith;

TEST_CASE("No arguments reads stdin untrusted", "[config][cli]") {
    RenderOptions opts = parse_cli_args({});
    REQUIRE(opts.reads_stdin());
    REQUIRE_FALSE(opts.trust);
    REQUIRE_FALSE(opts.output_path.has_value());
    REQUIRE(opts.ide == IdeFormat::NONE);
}

TEST_CASE("All options are recognised", "[config][cli]") {
    RenderOptions opts =
        parse_cli_args({"page.tmpl", "-o", "out.html", "--trust", "--verbose", "--config", "cfg.json"});
    REQUIRE(opts.template_path == std::optional<std::string>("page.tmpl"));
    REQUIRE_FALSE(opts.reads_stdin());
    REQUIRE(opts.output_path == std::optional<std::string>("out.html"));
    REQUIRE(opts.trust);
    REQUIRE(opts.verbose);
    REQUIRE(opts.config_path == std::optional<std::string>("cfg.json"));

    RenderOptions eq = parse_cli_args({"--output=x.txt", "--ide=yaml", "-"});
    REQUIRE(eq.output_path == std::optional<std::string>("x.txt"));
    REQUIRE(eq.ide == IdeFormat::YAML);
    REQUIRE(eq.reads_stdin());

    REQUIRE(parse_cli_args({"--help"}).show_help);
    REQUIRE(parse_cli_args({"--version"}).show_version);
}

TEST_CASE("Bad command lines are rejected", "[config][cli]") {
    REQUIRE_THROWS_AS(parse_cli_args({"--bogus"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_cli_args({"-o"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_cli_args({"a.tmpl", "b.tmpl"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_cli_args({"--ide", "toml"}), std::invalid_argument);
}

TEST_CASE("Config values override defaults", "[config]") {
    Value j = Value::parse(R"({"verbose": true, "exec": {"default_timeout": 12, "max_output_bytes": 2048, "max_concurrent": 4}})");
    ToolConfig config = config_from_json(j);
    REQUIRE(config.verbose);
    REQUIRE(config.exec.default_timeout == 12);
    REQUIRE(config.exec.max_output_bytes == 2048);
    REQUIRE(config.exec.max_concurrent == 4);
}

TEST_CASE("Invalid config values fall back to defaults", "[config]") {
    Value j = Value::parse(R"({"verbose": "yes", "exec": {"default_timeout": -1, "max_output_bytes": "big", "max_concurrent": 0}})");
    ToolConfig config = config_from_json(j);
    REQUIRE_FALSE(config.verbose);
    REQUIRE(config.exec.default_timeout == kDefaultExecTimeoutSec);
    REQUIRE(config.exec.max_output_bytes == kDefaultMaxOutputBytes);
    REQUIRE(config.exec.max_concurrent == kDefaultMaxConcurrentCommands);

    ToolConfig clamped = config_from_json(Value::parse(R"({"exec": {"default_timeout": 900}})"));
    REQUIRE(clamped.exec.default_timeout == kMaxExecTimeoutSec);
}

TEST_CASE("Config file lookup order", "[config]") {
    TempDir dir;
    dir.write("explicit.json", R"({"exec": {"default_timeout": 5}})");
    dir.write(".tmpltool.json", R"({"exec": {"default_timeout": 7}})");
    dir.write("broken.json", "{ nope");
    ScopedCwd cwd(dir.path());
    ::unsetenv(kConfigEnvVar);

    REQUIRE(load_config(std::string("explicit.json")).exec.default_timeout == 5);
    ToolConfig fallback = load_config(std::nullopt);
    REQUIRE(fallback.exec.default_timeout == 7);
    REQUIRE(fallback.source.has_value());

    ::setenv(kConfigEnvVar, "explicit.json", 1);
    REQUIRE(load_config(std::nullopt).exec.default_timeout == 5);
    ::unsetenv(kConfigEnvVar);

    REQUIRE_THROWS_WITH(load_config(std::string("broken.json")), StartsWith("Failed to parse config file"));
    REQUIRE_THROWS_AS(load_config(std::string("absent.json")), FileAccessError);
}

TEST_CASE("Missing default config is not an error", "[config]") {
    TempDir dir;
    ScopedCwd cwd(dir.path());
    ::unsetenv(kConfigEnvVar);

    ToolConfig config = load_config(std::nullopt);
    REQUIRE_FALSE(config.source.has_value());
    REQUIRE(config.exec.default_timeout == kDefaultExecTimeoutSec);
}
