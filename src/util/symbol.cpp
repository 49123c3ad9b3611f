#include <pkglint/symbol.hpp>
#include <mutex>
#include <unordered_set>

namespace pkglint {

namespace {

struct Interner {
    std::mutex mu;
    // unordered_set never moves its elements, so pointers stay valid
    std::unordered_set<std::string> strings;
};

Interner& interner() {
    static Interner* table = new Interner();
    return *table;
}

} // namespace

Symbol::Symbol() : Symbol(intern(std::string())) {}

Symbol Symbol::intern(const std::string& s) {
    auto& table = interner();
    std::lock_guard<std::mutex> lock(table.mu);
    auto it = table.strings.insert(s).first;
    return Symbol(&*it);
}

} // namespace pkglint
