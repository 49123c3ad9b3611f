#include <pkglint/fs.hpp>

#include <cstdint>
#include <fstream>
#include <sstream>

namespace pkglint {

namespace fs = std::filesystem;

Result<std::string> read_text(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return LintError{LintError::IO, "cannot read file", "",
                         path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return LintError{LintError::IO, "read failed", "", path.string()};
    }
    return Result<std::string>::ok(ss.str());
}

Status write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return LintError{LintError::IO, "cannot open file for writing", "",
                         path.string()};
    }
    file << text;
    file.flush();
    if (!file) {
        return LintError{LintError::IO, "write failed", "", path.string()};
    }
    return ok_status();
}

Status remove_tree(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        return LintError{LintError::IO,
            "failed to remove " + path.string() + ": " + ec.message(),
            "check permissions, or whether another process is using it"};
    }
    return ok_status();
}

bool is_valid_utf8(const std::string& bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(bytes[i]);
        size_t len;
        uint32_t cp;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates, out of range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

} // namespace pkglint
