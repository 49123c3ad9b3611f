#include <catch2/catch.hpp>
#include <pkglint/stub.hpp>

using namespace pkglint;

static const char* MATH_SOURCE = R"(
// Arithmetic helpers
import base.aleo;

program math.aleo {
    struct Pair {
        left: u32,
        right: u32,
    }

    record Token { owner: address, amount: u64 }

    mapping balances: address => u64;

    const LIMIT: u32 = 10u32;

    /* entry point { with a brace in a comment */
    @noupgrade
    async transition add(a: u32, b: u32) -> u32 {
        if a > b { return a; }
        return a + b;
    }

    inline double(x: u32) -> u32 {
        return x * 2u32;
    }

    function helper(p: Pair) -> u32 { return p.left; }
}
)";

TEST_CASE("Source stub keeps signatures and drops bodies", "[stub]") {
    auto r = extract_source_stub(MATH_SOURCE);
    REQUIRE(r.is_ok());
    const Stub& s = r.value();
    REQUIRE(s.program == "math.aleo");
    REQUIRE(s.imports == std::vector<std::string>{"base.aleo"});
    REQUIRE(s.declarations.size() == 6);

    auto pair = s.find("Pair");
    REQUIRE(pair);
    REQUIRE(pair->kind == Declaration::Kind::Struct);
    REQUIRE(pair->signature == "struct Pair { left: u32, right: u32, }");

    auto token = s.find("Token");
    REQUIRE(token->kind == Declaration::Kind::Record);
    REQUIRE(token->signature == "record Token { owner: address, amount: u64 }");

    REQUIRE(s.find("balances")->signature == "mapping balances: address => u64;");
    REQUIRE(s.find("LIMIT") == nullptr);

    auto add = s.find("add");
    REQUIRE(add->kind == Declaration::Kind::Transition);
    REQUIRE(add->signature == "async transition add(a: u32, b: u32) -> u32;");

    REQUIRE(s.find("double")->kind == Declaration::Kind::Inline);
    REQUIRE(s.find("helper")->signature == "function helper(p: Pair) -> u32;");
}

TEST_CASE("Render stub text", "[stub]") {
    Stub s;
    s.program = "a.aleo";
    s.imports = {"b.aleo"};
    s.declarations.push_back({Declaration::Kind::Function, "f", "function f(x: u8) -> u8;"});
    REQUIRE(s.render() ==
        "import b.aleo;\n"
        "stub a.aleo {\n"
        "    function f(x: u8) -> u8;\n"
        "}\n");
}

TEST_CASE("Malformed sources are parse errors", "[stub]") {
    REQUIRE(extract_source_stub("").error().code == LintError::Parse);
    REQUIRE(extract_source_stub("import a.aleo;").error().message.find("no program") != std::string::npos);
    REQUIRE(extract_source_stub("program a.aleo { transition f() {").is_err());
    REQUIRE(extract_source_stub("let x = 1;").error().hint.find("import") != std::string::npos);
    REQUIRE(extract_source_stub("import a.aleo").is_err());
}

static const char* CREDITS_BYTECODE = R"(import base.aleo;
program credits.aleo;

mapping account:
    key as address.public;
    value as u64.public;

record credits:
    owner as address.private;
    microcredits as u64.private;

function transfer_public:
    input r0 as address.public;
    input r1 as u64.public;
    async transfer_public r0 r1 into r2;
    output r2 as credits.aleo/transfer_public.future;

finalize transfer_public:
    input r0 as address.public;
    get.or_use account[r0] 0u64 into r1;

closure helper:
    input r0 as u8;
    add r0 r0 into r1;
    output r1 as u8;
)";

TEST_CASE("Bytecode stub keeps interface lines", "[stub]") {
    auto r = extract_bytecode_stub(CREDITS_BYTECODE);
    REQUIRE(r.is_ok());
    const Stub& s = r.value();
    REQUIRE(s.program == "credits.aleo");
    REQUIRE(s.imports == std::vector<std::string>{"base.aleo"});
    REQUIRE(s.declarations.size() == 4);

    REQUIRE(s.find("account")->signature ==
            "mapping account: key as address.public; value as u64.public;");
    REQUIRE(s.find("credits")->kind == Declaration::Kind::Record);
    REQUIRE(s.find("transfer_public")->signature ==
            "function transfer_public: input r0 as address.public; "
            "input r1 as u64.public; "
            "output r2 as credits.aleo/transfer_public.future;");
    REQUIRE(s.find("helper")->signature ==
            "closure helper: input r0 as u8; output r1 as u8;");
}

TEST_CASE("Bytecode without a program line", "[stub]") {
    REQUIRE(extract_bytecode_stub("function f:\n").is_err());
}

TEST_CASE("StubSet keeps insertion order", "[stub]") {
    StubSet set;
    Stub a; a.program = "a.aleo";
    Stub b; b.program = "b.aleo";
    Stub a2; a2.program = "a2.aleo";

    set.insert(Symbol::intern("a"), a);
    set.insert(Symbol::intern("b"), b);
    set.insert(Symbol::intern("a"), a2);

    REQUIRE(set.size() == 2);
    REQUIRE(set.begin()->first == Symbol::intern("a"));
    REQUIRE(set.find(Symbol::intern("a"))->program == "a2.aleo");
    REQUIRE(set.contains(Symbol::intern("b")));
    REQUIRE_FALSE(set.contains(Symbol::intern("c")));
}
