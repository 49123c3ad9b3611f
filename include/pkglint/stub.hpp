#pragma once

#include <pkglint/result.hpp>
#include <pkglint/symbol.hpp>
#include <string>
#include <utility>
#include <vector>

namespace pkglint {

// One externally visible item of a program, without its body
struct Declaration {
    enum class Kind { Struct, Record, Mapping, Transition, Function, Inline, Closure };

    Kind kind;
    std::string name;
    std::string signature;   // whitespace-normalized header text

    static const char* kind_name(Kind k);
};

// Signature-only interface of a dependency program
struct Stub {
    std::string program;                  // e.g. "math.aleo"
    std::vector<std::string> imports;     // e.g. "credits.aleo"
    std::vector<Declaration> declarations;

    const Declaration* find(const std::string& name) const;

    // Text form handed to the compiler
    std::string render() const;
};

// Insertion-ordered map from dependency symbol to stub
class StubSet {
public:
    using Entry = std::pair<Symbol, Stub>;

    // Replaces an existing entry in place, keeping its position
    void insert(Symbol name, Stub stub);

    const Stub* find(Symbol name) const;
    bool contains(Symbol name) const { return find(name) != nullptr; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<Entry>::const_iterator end() const { return entries_.end(); }

private:
    std::vector<Entry> entries_;
};

// Scan program source for its imports and top-level items. Function bodies
// are dropped at their opening brace; struct and record fields are kept.
Result<Stub> extract_source_stub(const std::string& source);

// Scan compiled program text (as served by the network registry)
Result<Stub> extract_bytecode_stub(const std::string& bytecode);

} // namespace pkglint
