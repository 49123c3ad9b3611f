#include <pkglint/stub.hpp>
#include <pkglint/log.hpp>

#include <cctype>
#include <optional>
#include <sstream>

namespace pkglint {

// ---------------------------------------------------------------------------
// Declaration / Stub / StubSet
// ---------------------------------------------------------------------------

const char* Declaration::kind_name(Kind k) {
    switch (k) {
        case Kind::Struct:     return "struct";
        case Kind::Record:     return "record";
        case Kind::Mapping:    return "mapping";
        case Kind::Transition: return "transition";
        case Kind::Function:   return "function";
        case Kind::Inline:     return "inline";
        case Kind::Closure:    return "closure";
    }
    return "unknown";
}

const Declaration* Stub::find(const std::string& name) const {
    for (const auto& d : declarations) {
        if (d.name == name) return &d;
    }
    return nullptr;
}

std::string Stub::render() const {
    std::string out;
    for (const auto& imp : imports) {
        out += "import " + imp + ";\n";
    }
    out += "stub " + program + " {\n";
    for (const auto& d : declarations) {
        out += "    " + d.signature + "\n";
    }
    out += "}\n";
    return out;
}

void StubSet::insert(Symbol name, Stub stub) {
    for (auto& e : entries_) {
        if (e.first == name) {
            e.second = std::move(stub);
            return;
        }
    }
    entries_.emplace_back(name, std::move(stub));
}

const Stub* StubSet::find(Symbol name) const {
    for (const auto& e : entries_) {
        if (e.first == name) return &e.second;
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// Text helpers
// ---------------------------------------------------------------------------

namespace {

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Collapse whitespace runs to one space, trim both ends
std::string squeeze(const std::string& s) {
    std::string out;
    bool pending_space = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out.push_back(' ');
        pending_space = false;
        out.push_back(c);
    }
    return out;
}

std::string leading_ident(const std::string& s) {
    size_t n = 0;
    while (n < s.size() && is_ident_char(s[n])) ++n;
    return s.substr(0, n);
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::string strip_semicolon(std::string s) {
    while (!s.empty() && (s.back() == ';' || s.back() == ' ')) s.pop_back();
    return s;
}

std::optional<Declaration::Kind> source_kind(const std::string& kw) {
    using K = Declaration::Kind;
    if (kw == "struct")     return K::Struct;
    if (kw == "record")     return K::Record;
    if (kw == "mapping")    return K::Mapping;
    if (kw == "transition") return K::Transition;
    if (kw == "function")   return K::Function;
    if (kw == "inline")     return K::Inline;
    return std::nullopt;
}

std::optional<Declaration::Kind> bytecode_kind(const std::string& kw) {
    using K = Declaration::Kind;
    if (kw == "struct")   return K::Struct;
    if (kw == "record")   return K::Record;
    if (kw == "mapping")  return K::Mapping;
    if (kw == "function") return K::Function;
    if (kw == "closure")  return K::Closure;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Source scanner
// ---------------------------------------------------------------------------

class SourceScanner {
public:
    explicit SourceScanner(const std::string& source)
        : text_(strip_comments(source)) {}

    Result<Stub> run() {
        Stub stub;
        bool seen_program = false;

        while (true) {
            skip_ws();
            if (pos_ >= text_.size()) break;

            std::string w = word();
            if (w == "import") {
                size_t semi = text_.find(';', pos_);
                if (semi == std::string::npos) {
                    return LintError{LintError::Parse, "unterminated import"};
                }
                stub.imports.push_back(squeeze(text_.substr(pos_, semi - pos_)));
                pos_ = semi + 1;
            } else if (w == "program") {
                size_t open = text_.find('{', pos_);
                if (open == std::string::npos) {
                    return LintError{LintError::Parse,
                        "program declaration has no body"};
                }
                size_t close = match_brace(open);
                if (close == std::string::npos) {
                    return LintError{LintError::Parse,
                        "unbalanced braces in program block"};
                }
                stub.program = squeeze(text_.substr(pos_, open - pos_));
                pos_ = open + 1;
                PKGLINT_TRY(items(stub, close));
                pos_ = close + 1;
                seen_program = true;
            } else {
                std::string got = w.empty() ? std::string(1, text_[pos_]) : w;
                return LintError{LintError::Parse,
                    "unexpected '" + got + "' at top level",
                    "expected 'import' or 'program'"};
            }
        }

        if (!seen_program) {
            return LintError{LintError::Parse, "no program block found"};
        }
        return Result<Stub>::ok(std::move(stub));
    }

private:
    std::string text_;
    size_t pos_ = 0;

    // Comments are replaced by a space; newlines are kept
    static std::string strip_comments(const std::string& src) {
        std::string out;
        out.reserve(src.size());
        size_t i = 0;
        while (i < src.size()) {
            if (src.compare(i, 2, "//") == 0) {
                while (i < src.size() && src[i] != '\n') ++i;
            } else if (src.compare(i, 2, "/*") == 0) {
                size_t end = src.find("*/", i + 2);
                i = end == std::string::npos ? src.size() : end + 2;
                out.push_back(' ');
            } else {
                out.push_back(src[i++]);
            }
        }
        return out;
    }

    void skip_ws() {
        while (pos_ < text_.size() &&
               std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    std::string word() {
        size_t start = pos_;
        while (pos_ < text_.size() && is_ident_char(text_[pos_])) ++pos_;
        return text_.substr(start, pos_ - start);
    }

    size_t match_brace(size_t open) const {
        int depth = 0;
        for (size_t i = open; i < text_.size(); ++i) {
            if (text_[i] == '{') {
                ++depth;
            } else if (text_[i] == '}') {
                if (--depth == 0) return i;
            }
        }
        return std::string::npos;
    }

    Status items(Stub& stub, size_t end) {
        while (true) {
            skip_ws();
            if (pos_ >= end) return ok_status();

            // Annotation: @name or @name(...)
            if (text_[pos_] == '@') {
                ++pos_;
                word();
                skip_ws();
                if (pos_ < end && text_[pos_] == '(') {
                    size_t close = text_.find(')', pos_);
                    if (close == std::string::npos || close > end) {
                        return LintError{LintError::Parse,
                            "unterminated annotation arguments"};
                    }
                    pos_ = close + 1;
                }
                continue;
            }

            size_t stop = text_.find_first_of("{;", pos_);
            if (stop == std::string::npos || stop > end) {
                return LintError{LintError::Parse,
                    "unterminated item in program block"};
            }
            std::string header = squeeze(text_.substr(pos_, stop - pos_));
            size_t item_end = stop;
            if (text_[stop] == '{') {
                item_end = match_brace(stop);
                if (item_end == std::string::npos || item_end > end) {
                    return LintError{LintError::Parse,
                        "unbalanced braces in '" + header + "'"};
                }
            }

            std::istringstream words(header);
            std::string kw;
            words >> kw;
            if (kw == "async") words >> kw;

            auto kind = source_kind(kw);
            if (!kind) {
                log::trace("stub: skipping '%s'", header.c_str());
                pos_ = item_end + 1;
                continue;
            }

            std::string rest;
            words >> rest;
            Declaration decl{*kind, leading_ident(rest), ""};
            if (decl.name.empty()) {
                return LintError{LintError::Parse,
                    std::string("missing name after '") + kw + "'"};
            }

            if (*kind == Declaration::Kind::Struct ||
                *kind == Declaration::Kind::Record) {
                if (text_[stop] != '{') {
                    return LintError{LintError::Parse,
                        kw + " '" + decl.name + "' has no field list"};
                }
                std::string fields =
                    squeeze(text_.substr(stop + 1, item_end - stop - 1));
                decl.signature = header + " { " + fields + " }";
            } else {
                decl.signature = header + ";";
            }
            stub.declarations.push_back(std::move(decl));
            pos_ = item_end + 1;
        }
    }
};

} // namespace

Result<Stub> extract_source_stub(const std::string& source) {
    return SourceScanner(source).run();
}

// ---------------------------------------------------------------------------
// Bytecode scanner
// ---------------------------------------------------------------------------

Result<Stub> extract_bytecode_stub(const std::string& bytecode) {
    Stub stub;
    std::istringstream in(bytecode);
    std::string raw;

    // Index into stub.declarations of the block being read, if any
    std::optional<size_t> current;

    while (std::getline(in, raw)) {
        auto comment = raw.find("//");
        if (comment != std::string::npos) raw.erase(comment);
        std::string line = squeeze(raw);
        if (line.empty()) continue;

        if (starts_with(line, "import ")) {
            stub.imports.push_back(strip_semicolon(line.substr(7)));
            current.reset();
            continue;
        }
        if (starts_with(line, "program ")) {
            stub.program = strip_semicolon(line.substr(8));
            current.reset();
            continue;
        }

        if (line.back() == ':') {
            std::istringstream words(line);
            std::string kw, name;
            words >> kw >> name;
            auto kind = bytecode_kind(kw);
            if (!name.empty() && name.back() == ':') name.pop_back();
            if (kind && !name.empty()) {
                stub.declarations.push_back(Declaration{*kind, name, line});
                current = stub.declarations.size() - 1;
            } else {
                // finalize blocks, constructors: not part of the interface
                current.reset();
            }
            continue;
        }

        if (!current) continue;
        auto& decl = stub.declarations[*current];
        bool is_callable = decl.kind == Declaration::Kind::Function ||
                           decl.kind == Declaration::Kind::Closure;
        if (!is_callable || starts_with(line, "input ") ||
            starts_with(line, "output ")) {
            decl.signature += " " + line;
        }
    }

    if (stub.program.empty()) {
        return LintError{LintError::Parse,
            "no program declaration in compiled program"};
    }
    return Result<Stub>::ok(std::move(stub));
}

} // namespace pkglint
