#include <catch2/catch.hpp>
#include <pkglint/manifest.hpp>
#include "test_helpers.hpp"

using namespace pkglint;

static const char* FULL_MANIFEST = R"(
[package]
program = "token.aleo"
version = "1.2.0"
description = "A token"
license = "MIT"

[dependencies]
math = { location = "local", path = "../math" }
credits = { location = "network", network = "mainnet" }
)";

TEST_CASE("Parse a full manifest", "[manifest]") {
    auto r = Manifest::parse(FULL_MANIFEST);
    REQUIRE(r.is_ok());
    const auto& m = r.value();
    REQUIRE(m.package.program == "token.aleo");
    REQUIRE(m.package.version == "1.2.0");
    REQUIRE(m.package.description == "A token");
    REQUIRE(m.package.license == "MIT");
    REQUIRE(m.program_id().value().name() == "token");

    REQUIRE(m.dependencies.size() == 2);
    const Dependency* math = nullptr;
    const Dependency* credits = nullptr;
    for (const auto& d : m.dependencies) {
        if (d.name == "math") math = &d;
        if (d.name == "credits") credits = &d;
    }
    REQUIRE(math);
    REQUIRE(math->location == Dependency::Location::Local);
    REQUIRE(math->path.value() == "../math");
    REQUIRE(credits);
    REQUIRE(credits->location == Dependency::Location::Network);
    REQUIRE(credits->network.value() == NetworkName::Mainnet);
}

TEST_CASE("Location defaults to local", "[manifest]") {
    auto r = Manifest::parse(R"(
[package]
program = "a.aleo"

[dependencies]
b = { path = "../b" }
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().dependencies[0].location == Dependency::Location::Local);
    REQUIRE(r.value().package.version == "0.1.0");
}

TEST_CASE("Missing [package] or program is an error", "[manifest]") {
    auto none = Manifest::parse("[dependencies]\n");
    REQUIRE(none.is_err());
    REQUIRE(none.error().code == LintError::Manifest);

    auto no_program = Manifest::parse("[package]\nversion = \"1.0.0\"\n");
    REQUIRE(no_program.is_err());
    REQUIRE(no_program.error().message.find("program") != std::string::npos);
}

TEST_CASE("Invalid program id in manifest", "[manifest]") {
    auto r = Manifest::parse("[package]\nprogram = \"not-valid.aleo\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LintError::ProgramId);
}

TEST_CASE("Dependency validation", "[manifest]") {
    auto no_path = Manifest::parse(R"(
[package]
program = "a.aleo"
[dependencies]
b = { location = "local" }
)");
    REQUIRE(no_path.is_err());
    REQUIRE(no_path.error().code == LintError::Manifest);

    auto net_with_path = Manifest::parse(R"(
[package]
program = "a.aleo"
[dependencies]
b = { location = "network", path = "../b" }
)");
    REQUIRE(net_with_path.is_err());

    auto bad_location = Manifest::parse(R"(
[package]
program = "a.aleo"
[dependencies]
b = { location = "git" }
)");
    REQUIRE(bad_location.is_err());
    REQUIRE(bad_location.error().message.find("unknown location") != std::string::npos);

    auto bad_name = Manifest::parse(R"(
[package]
program = "a.aleo"
[dependencies]
"b-c" = { path = "../b" }
)");
    REQUIRE(bad_name.is_err());
    REQUIRE(bad_name.error().code == LintError::Manifest);

    auto not_table = Manifest::parse(R"(
[package]
program = "a.aleo"
[dependencies]
b = "../b"
)");
    REQUIRE(not_table.is_err());
}

TEST_CASE("TOML syntax errors carry a line number", "[manifest]") {
    auto r = Manifest::parse("[package]\nprogram = \n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LintError::Parse);
    REQUIRE(r.error().line == 2);
}

TEST_CASE("read_from_dir", "[manifest]") {
    TempDir td;
    auto missing = Manifest::read_from_dir(td.path);
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == LintError::NotFound);

    td.write_file("program.toml", FULL_MANIFEST);
    auto r = Manifest::read_from_dir(td.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().package.program == "token.aleo");

    td.write_file("program.toml", "[package\n");
    auto broken = Manifest::read_from_dir(td.path);
    REQUIRE(broken.is_err());
    REQUIRE(broken.error().file == (td.path / "program.toml").string());
}

TEST_CASE("to_toml output parses back", "[manifest]") {
    auto original = Manifest::parse(FULL_MANIFEST).value();
    auto again = Manifest::parse(original.to_toml());
    REQUIRE(again.is_ok());
    REQUIRE(again.value().package.program == "token.aleo");
    REQUIRE(again.value().package.license == "MIT");
    REQUIRE(again.value().dependencies.size() == 2);
}
