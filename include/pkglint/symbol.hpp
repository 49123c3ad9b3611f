#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace pkglint {

// Interned program name. Two symbols are equal iff they were interned from
// the same string; comparison and hashing never touch the characters.
class Symbol {
public:
    Symbol();

    static Symbol intern(const std::string& s);

    const std::string& str() const { return *str_; }
    bool empty() const { return str_->empty(); }

    bool operator==(const Symbol& o) const { return str_ == o.str_; }
    bool operator!=(const Symbol& o) const { return str_ != o.str_; }
    // Lexicographic, for deterministic ordering in maps and output
    bool operator<(const Symbol& o) const { return *str_ < *o.str_; }

    size_t hash() const { return std::hash<const std::string*>{}(str_); }

private:
    explicit Symbol(const std::string* s) : str_(s) {}

    const std::string* str_;
};

} // namespace pkglint

namespace std {
template<>
struct hash<pkglint::Symbol> {
    size_t operator()(const pkglint::Symbol& s) const noexcept {
        return s.hash();
    }
};
} // namespace std
