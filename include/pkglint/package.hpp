#pragma once

#include <pkglint/result.hpp>
#include <pkglint/fs.hpp>
#include <pkglint/program_id.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace pkglint {

// Package layout, relative to the package root
inline constexpr const char* kSourceDir = "src";
inline constexpr const char* kBuildDir = "build";
inline constexpr const char* kOutputsDir = "outputs";
inline constexpr const char* kSourceExtension = ".leo";

// <package>/src
struct SourceDirectory {
    static Result<std::filesystem::path> create(const std::filesystem::path& package);

    // Every regular file under <package>/src, recursively, sorted by path
    static Result<std::vector<std::filesystem::path>> files(
        const std::filesystem::path& package);

    // Each file must have the source extension and hold valid UTF-8
    static Status check_files(const std::vector<std::filesystem::path>& files);
};

// <package>/build
struct BuildDirectory {
    static Result<std::filesystem::path> create(const std::filesystem::path& package);
};

// <package>/outputs
struct OutputsDirectory {
    static Result<std::filesystem::path> create(const std::filesystem::path& package);
};

struct Package {
    // Fresh scaffold at build_path: program.toml and main.aleo. Fails if
    // build_path already exists.
    static Status create(const std::filesystem::path& build_path,
                         const ProgramId& program_id);
};

// Build and outputs directories of one dependency. Owned for the duration of
// that dependency's compilation; removed on release() or, failing that, when
// the object goes out of scope.
class ScratchSpace {
public:
    // Removes stale directories left at either location, then creates both
    static Result<ScratchSpace> create(const std::filesystem::path& package);

    ScratchSpace(ScratchSpace&& other) noexcept;
    ScratchSpace& operator=(ScratchSpace&&) = delete;
    ScratchSpace(const ScratchSpace&) = delete;
    ScratchSpace& operator=(const ScratchSpace&) = delete;
    ~ScratchSpace();

    const std::filesystem::path& build() const { return build_; }
    const std::filesystem::path& outputs() const { return outputs_; }

    // Remove both directories, reporting the first failure
    Status release();

private:
    ScratchSpace() = default;

    std::filesystem::path build_;
    std::filesystem::path outputs_;
    bool released_ = false;
};

} // namespace pkglint
