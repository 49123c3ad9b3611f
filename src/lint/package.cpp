#include <pkglint/package.hpp>
#include <pkglint/manifest.hpp>
#include <pkglint/log.hpp>

#include <algorithm>

namespace pkglint {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Directories
// ---------------------------------------------------------------------------

static Result<fs::path> make_dir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return LintError{LintError::IO,
            "failed to create directory " + dir.string() + ": " + ec.message()};
    }
    return Result<fs::path>::ok(dir);
}

Result<fs::path> SourceDirectory::create(const fs::path& package) {
    return make_dir(package / kSourceDir);
}

Result<std::vector<fs::path>> SourceDirectory::files(const fs::path& package) {
    fs::path dir = package / kSourceDir;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return LintError{LintError::NotFound,
            "source directory does not exist: " + dir.string()};
    }

    std::vector<fs::path> result;
    for (fs::recursive_directory_iterator it(dir, ec), end; it != end;
         it.increment(ec)) {
        if (ec) break;
        if (it->is_regular_file(ec)) {
            result.push_back(it->path());
        }
    }
    if (ec) {
        return LintError{LintError::IO,
            "failed to list " + dir.string() + ": " + ec.message()};
    }

    std::sort(result.begin(), result.end());
    return Result<std::vector<fs::path>>::ok(std::move(result));
}

Status SourceDirectory::check_files(const std::vector<fs::path>& files) {
    for (const auto& f : files) {
        if (f.extension() != kSourceExtension) {
            return LintError{LintError::IO,
                "invalid file extension '" + f.extension().string() + "'",
                std::string("source files must end in ") + kSourceExtension,
                f.string()};
        }
        auto text = read_text(f);
        if (text.is_err()) return std::move(text).error();
        if (!is_valid_utf8(text.value())) {
            return LintError{LintError::IO, "file is not valid UTF-8", "",
                             f.string()};
        }
    }
    return ok_status();
}

Result<fs::path> BuildDirectory::create(const fs::path& package) {
    return make_dir(package / kBuildDir);
}

Result<fs::path> OutputsDirectory::create(const fs::path& package) {
    return make_dir(package / kOutputsDir);
}

Status Package::create(const fs::path& build_path, const ProgramId& program_id) {
    std::error_code ec;
    if (fs::exists(build_path, ec)) {
        return LintError{LintError::IO,
            "package directory already exists: " + build_path.string()};
    }
    PKGLINT_TRY(make_dir(build_path));

    Manifest manifest;
    manifest.package.program = program_id.to_string();
    manifest.package.version = "0.1.0";
    PKGLINT_TRY(write_text(build_path / kManifestFile, manifest.to_toml()));
    PKGLINT_TRY(write_text(build_path / ("main." + program_id.network()),
                           "program " + program_id.to_string() + ";\n"));

    log::debug("created package scaffold %s", build_path.string().c_str());
    return ok_status();
}

// ---------------------------------------------------------------------------
// ScratchSpace
// ---------------------------------------------------------------------------

Result<ScratchSpace> ScratchSpace::create(const fs::path& package) {
    ScratchSpace space;
    space.build_ = package / kBuildDir;
    space.outputs_ = package / kOutputsDir;

    for (const auto* dir : {&space.outputs_, &space.build_}) {
        std::error_code ec;
        if (fs::exists(*dir, ec)) {
            log::debug("clearing stale %s", dir->string().c_str());
            PKGLINT_TRY(remove_tree(*dir));
        }
    }

    PKGLINT_TRY(OutputsDirectory::create(package));
    PKGLINT_TRY(BuildDirectory::create(package));
    return Result<ScratchSpace>::ok(std::move(space));
}

ScratchSpace::ScratchSpace(ScratchSpace&& other) noexcept
    : build_(std::move(other.build_)),
      outputs_(std::move(other.outputs_)),
      released_(other.released_) {
    other.released_ = true;
}

ScratchSpace::~ScratchSpace() {
    if (released_) return;
    auto st = release();
    if (st.is_err()) {
        log::warn("%s", st.error().message.c_str());
    }
}

Status ScratchSpace::release() {
    released_ = true;
    auto build = remove_tree(build_);
    auto outputs = remove_tree(outputs_);
    if (build.is_err()) return build;
    return outputs;
}

} // namespace pkglint
