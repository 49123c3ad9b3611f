#pragma once

#include <pkglint/result.hpp>
#include <filesystem>
#include <string>

namespace pkglint {

// Whole-file read, binary mode
Result<std::string> read_text(const std::filesystem::path& path);

// Truncate and write
Status write_text(const std::filesystem::path& path, const std::string& text);

// Recursive removal; a missing path is not an error
Status remove_tree(const std::filesystem::path& path);

bool is_valid_utf8(const std::string& bytes);

} // namespace pkglint
