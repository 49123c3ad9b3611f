#include <catch2/catch.hpp>
#include <pkglint/process.hpp>
#include "test_helpers.hpp"

using namespace pkglint;

TEST_CASE("Capture stdout and stderr", "[process]") {
    auto r = run_process({"/bin/sh", "-c", "printf out; printf err >&2"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().success());
    REQUIRE(r.value().out == "out");
    REQUIRE(r.value().err == "err");
}

TEST_CASE("Non-zero exit code is returned, not an error", "[process]") {
    auto r = run_process({"/bin/sh", "-c", "exit 3"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 3);
    REQUIRE_FALSE(r.value().success());
}

TEST_CASE("Missing executable exits 127", "[process]") {
    auto r = run_process({"pkglint-definitely-not-a-command"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 127);
}

TEST_CASE("Working directory", "[process]") {
    TempDir td;
    ProcessOptions opts;
    opts.working_dir = td.path.string();
    auto r = run_process({"/bin/sh", "-c", "pwd"}, opts);
    REQUIRE(r.is_ok());
    REQUIRE(fs::equivalent(fs::path(r.value().out.substr(0, r.value().out.size() - 1)),
                           td.path));
}

TEST_CASE("Large output is drained", "[process]") {
    auto r = run_process({"/bin/sh", "-c",
        "i=0; while [ $i -lt 20000 ]; do echo 0123456789; i=$((i+1)); done"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().out.size() == 20000u * 11u);
}

TEST_CASE("Timeout kills the child", "[process]") {
    ProcessOptions opts;
    opts.timeout_seconds = 1;
    auto r = run_process({"/bin/sh", "-c", "sleep 10"}, opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LintError::IO);
    REQUIRE(r.error().message.find("timed out") != std::string::npos);
}

TEST_CASE("Empty argv is rejected", "[process]") {
    auto r = run_process({});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LintError::InvalidArg);
}
