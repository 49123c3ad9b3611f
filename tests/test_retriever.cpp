#include <catch2/catch.hpp>
#include <pkglint/retriever.hpp>
#include "test_helpers.hpp"

#include <type_traits>

using namespace pkglint;

static std::string local_dep(const std::string& name) {
    return name + " = { location = \"local\", path = \"../" + name + "\" }\n";
}

static std::unique_ptr<PackageRetriever> make_retriever(const TempDir& td,
                                                        const std::string& main) {
    auto r = PackageRetriever::create(Symbol::intern(main), td.path / main,
                                      td.path / "home", "http://127.0.0.1:1");
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

static std::vector<std::string> names(const std::vector<Symbol>& syms) {
    std::vector<std::string> out;
    for (auto s : syms) out.push_back(s.str());
    return out;
}

// Retrievers are only built through create(), which checks the manifest
static_assert(!std::is_constructible<PackageRetriever, Symbol, fs::path,
                                     Registry, NetworkName>::value,
              "PackageRetriever must be built through create()");

TEST_CASE("create owns a retriever rooted at the package", "[retriever]") {
    TempDir td;
    write_package(td, "app", "", simple_program("app"));

    auto created = PackageRetriever::create(Symbol::intern("app"), td.path / "app",
                                            td.path / "home", "http://127.0.0.1:1");
    REQUIRE(created.is_ok());
    std::unique_ptr<Retriever> r = std::move(created).value();
    REQUIRE(r != nullptr);
    auto deps = r->retrieve();
    REQUIRE(deps.is_ok());
    REQUIRE(deps.value().empty());
}

TEST_CASE("Chain of local dependencies, deepest first", "[retriever]") {
    TempDir td;
    write_package(td, "app", local_dep("lib"), simple_program("app", "import lib.aleo;\n"));
    write_package(td, "lib", local_dep("base"), simple_program("lib", "import base.aleo;\n"));
    write_package(td, "base", "", simple_program("base"));

    auto r = make_retriever(td, "app");
    auto deps = r->retrieve();
    REQUIRE(deps.is_ok());
    REQUIRE(names(deps.value()) == std::vector<std::string>{"base", "lib"});
}

TEST_CASE("Diamond dependencies appear once", "[retriever]") {
    TempDir td;
    write_package(td, "app", local_dep("left") + local_dep("right"), simple_program("app"));
    write_package(td, "left", local_dep("base"), simple_program("left"));
    write_package(td, "right", local_dep("base"), simple_program("right"));
    write_package(td, "base", "", simple_program("base"));

    auto deps = make_retriever(td, "app")->retrieve();
    REQUIRE(deps.is_ok());
    auto order = names(deps.value());
    REQUIRE(order.size() == 3);
    REQUIRE(order.front() == "base");
}

TEST_CASE("Dependency cycle is an error", "[retriever]") {
    TempDir td;
    write_package(td, "app", local_dep("b"), simple_program("app"));
    write_package(td, "b", local_dep("c"), simple_program("b"));
    write_package(td, "c", local_dep("b"), simple_program("c"));

    auto deps = make_retriever(td, "app")->retrieve();
    REQUIRE(deps.is_err());
    REQUIRE(deps.error().code == LintError::Cycle);
}

TEST_CASE("Missing dependency directory", "[retriever]") {
    TempDir td;
    write_package(td, "app", local_dep("ghost"), simple_program("app"));

    auto deps = make_retriever(td, "app")->retrieve();
    REQUIRE(deps.is_err());
    REQUIRE(deps.error().code == LintError::NotFound);
    REQUIRE(deps.error().message.find("ghost") != std::string::npos);
}

TEST_CASE("Dependency key must match its program name", "[retriever]") {
    TempDir td;
    write_package(td, "app", "b = { path = \"../other\" }\n", simple_program("app"));
    write_package(td, "other", "", simple_program("other"));

    auto deps = make_retriever(td, "app")->retrieve();
    REQUIRE(deps.is_err());
    REQUIRE(deps.error().code == LintError::Dependency);
}

TEST_CASE("Main program must match the manifest", "[retriever]") {
    TempDir td;
    write_package(td, "app", "", simple_program("app"));

    auto r = PackageRetriever::create(Symbol::intern("wrong"), td.path / "app",
                                      td.path / "home", "http://127.0.0.1:1");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LintError::Dependency);

    auto bad_name = PackageRetriever::create(Symbol::intern("1bad"), td.path / "app",
                                             td.path / "home", "http://127.0.0.1:1");
    REQUIRE(bad_name.is_err());
    REQUIRE(bad_name.error().code == LintError::ProgramId);
}

TEST_CASE("Stubs of transitive dependencies", "[retriever]") {
    TempDir td;
    write_package(td, "app", local_dep("lib"), simple_program("app", "import lib.aleo;\n"));
    write_package(td, "lib", local_dep("base"), simple_program("lib", "import base.aleo;\n"));
    write_package(td, "base", "", simple_program("base"));

    auto r = make_retriever(td, "app");
    REQUIRE(r->retrieve().is_ok());

    auto lib = r->prepare_local(Symbol::intern("lib"));
    REQUIRE(lib.is_ok());
    REQUIRE(fs::equivalent(lib.value().path, td.path / "lib"));
    REQUIRE(lib.value().stubs.size() == 1);
    const Stub* base = lib.value().stubs.find(Symbol::intern("base"));
    REQUIRE(base);
    REQUIRE(base->program == "base.aleo");
    REQUIRE(base->find("main"));

    auto app = r->prepare_local(Symbol::intern("app"));
    REQUIRE(app.is_ok());
    REQUIRE(app.value().stubs.size() == 2);
    REQUIRE(app.value().stubs.begin()->first == Symbol::intern("base"));

    auto leaf = r->prepare_local(Symbol::intern("base"));
    REQUIRE(leaf.value().stubs.empty());
}

TEST_CASE("prepare_local misuse", "[retriever]") {
    TempDir td;
    write_package(td, "app", "", simple_program("app"));
    auto r = make_retriever(td, "app");

    auto early = r->prepare_local(Symbol::intern("app"));
    REQUIRE(early.is_err());
    REQUIRE(early.error().code == LintError::InvalidArg);

    REQUIRE(r->retrieve().is_ok());
    auto unknown = r->prepare_local(Symbol::intern("nope"));
    REQUIRE(unknown.is_err());
    REQUIRE(unknown.error().code == LintError::NotFound);
}

TEST_CASE("Sources declaring the wrong program", "[retriever]") {
    TempDir td;
    write_package(td, "app", local_dep("lib"), simple_program("app"));
    write_package(td, "lib", "", simple_program("imposter"));

    auto r = make_retriever(td, "app");
    REQUIRE(r->retrieve().is_ok());
    auto app = r->prepare_local(Symbol::intern("app"));
    REQUIRE(app.is_err());
    REQUIRE(app.error().code == LintError::Dependency);
}

TEST_CASE("Network dependencies come from the registry cache", "[retriever]") {
    TempDir td;
    write_package(td, "app",
        "token = { location = \"network\" }\n",
        simple_program("app", "import token.aleo;\n"));
    td.write_file("home/registry/testnet/token/token.aleo",
        "import credits.aleo;\n"
        "program token.aleo;\n\n"
        "function mint:\n"
        "    input r0 as u64.public;\n"
        "    output r0 as u64.public;\n");
    td.write_file("home/registry/testnet/credits/credits.aleo",
        "program credits.aleo;\n\n"
        "mapping account:\n"
        "    key as address.public;\n"
        "    value as u64.public;\n");

    auto r = make_retriever(td, "app");
    auto deps = r->retrieve();
    REQUIRE(deps.is_ok());
    REQUIRE(deps.value().empty());

    auto app = r->prepare_local(Symbol::intern("app"));
    REQUIRE(app.is_ok());
    REQUIRE(app.value().stubs.size() == 2);
    REQUIRE(app.value().stubs.begin()->first == Symbol::intern("credits"));
    REQUIRE(app.value().stubs.find(Symbol::intern("token"))->find("mint"));

    auto token = r->prepare_local(Symbol::intern("token"));
    REQUIRE(token.is_err());
    REQUIRE(token.error().code == LintError::Dependency);
}

TEST_CASE("Conflicting sources for one dependency", "[retriever]") {
    TempDir td;
    write_package(td, "app",
        local_dep("lib") + "base = { location = \"network\" }\n",
        simple_program("app"));
    write_package(td, "lib", local_dep("base"), simple_program("lib"));
    write_package(td, "base", "", simple_program("base"));
    td.write_file("home/registry/testnet/base/base.aleo", "program base.aleo;\n");

    auto deps = make_retriever(td, "app")->retrieve();
    REQUIRE(deps.is_err());
    REQUIRE(deps.error().code == LintError::Dependency);
    REQUIRE(deps.error().message.find("conflicting") != std::string::npos);
}
