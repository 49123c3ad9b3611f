#include <catch2/catch.hpp>
#include <pkglint/config.hpp>
#include "test_helpers.hpp"

using namespace pkglint;

TEST_CASE("Defaults", "[config]") {
    Config cfg;
    REQUIRE(cfg.endpoint == kDefaultEndpoint);
    REQUIRE(cfg.network == NetworkName::Testnet);
    REQUIRE(cfg.compiler.command == "leo-compiler");
    REQUIRE(cfg.compiler.dce);
    REQUIRE(cfg.log_level == log::Info);
    REQUIRE_FALSE(cfg.log_color.has_value());
}

TEST_CASE("Parse every section", "[config]") {
    auto r = Config::parse(R"(
[network]
endpoint = "http://localhost:3030"
name = "canary"

[compiler]
command = "/opt/leo/bin/compile"
args = ["--quiet", "--json"]
timeout = 30
dce = false

[log]
level = "debug"
color = false
)");
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();
    REQUIRE(cfg.endpoint == "http://localhost:3030");
    REQUIRE(cfg.network == NetworkName::Canary);
    REQUIRE(cfg.compiler.command == "/opt/leo/bin/compile");
    REQUIRE(cfg.compiler.args == std::vector<std::string>{"--quiet", "--json"});
    REQUIRE(cfg.compiler.timeout_seconds == 30);
    REQUIRE_FALSE(cfg.compiler.dce);
    REQUIRE(cfg.log_level == log::Debug);
    REQUIRE(cfg.log_color == false);
}

TEST_CASE("Invalid values are config errors", "[config]") {
    REQUIRE(Config::parse("[network]\nname = \"moon\"\n").error().code == LintError::Config);
    REQUIRE(Config::parse("[compiler]\ntimeout = 0\n").error().code == LintError::Config);
    REQUIRE(Config::parse("[compiler]\nargs = [1, 2]\n").error().code == LintError::Config);
    REQUIRE(Config::parse("[log]\nlevel = \"chatty\"\n").error().code == LintError::Config);
    REQUIRE(Config::parse("[network]\nendpoint = \"\"\n").error().code == LintError::Config);
    REQUIRE(Config::parse("[[[").error().code == LintError::Parse);
}

TEST_CASE("Merge overrides only explicitly set fields", "[config]") {
    auto global = Config::parse(R"(
[network]
endpoint = "http://global"
name = "mainnet"
[compiler]
command = "global-cc"
timeout = 10
)").value();
    auto local = Config::parse(R"(
[compiler]
command = "local-cc"
[log]
level = "warn"
)").value();

    Config eff = Config::effective(global, local);
    REQUIRE(eff.endpoint == "http://global");
    REQUIRE(eff.network == NetworkName::Mainnet);
    REQUIRE(eff.compiler.command == "local-cc");
    REQUIRE(eff.compiler.timeout_seconds == 10);
    REQUIRE(eff.log_level == log::Warn);
}

TEST_CASE("Effective config with missing layers", "[config]") {
    Config eff = Config::effective(std::nullopt, std::nullopt);
    REQUIRE(eff.endpoint == kDefaultEndpoint);
}

TEST_CASE("load_optional tolerates a missing file", "[config]") {
    TempDir td;
    auto missing = Config::load_optional(td.path / "config.toml");
    REQUIRE(missing.is_ok());
    REQUIRE_FALSE(missing.value().has_value());

    td.write_file("config.toml", "[network]\nname = \"mainnet\"\n");
    auto present = Config::load_optional(td.path / "config.toml");
    REQUIRE(present.is_ok());
    REQUIRE(present.value()->network == NetworkName::Mainnet);

    td.write_file("bad.toml", "[log]\nlevel = \"nope\"\n");
    auto bad = Config::load_optional(td.path / "bad.toml");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().file == (td.path / "bad.toml").string());
}

TEST_CASE("Config file locations", "[config]") {
    REQUIRE(global_config_path("/home/u/.pkglint") == fs::path("/home/u/.pkglint/config.toml"));
    REQUIRE(global_config_path("").empty());
    REQUIRE(local_config_path("/src/pkg") == fs::path("/src/pkg/pkglint.toml"));
}
