#include <pkglint/linter.hpp>
#include <pkglint/fs.hpp>
#include <pkglint/log.hpp>
#include <pkglint/normalizer.hpp>
#include <pkglint/package.hpp>

namespace pkglint {

namespace fs = std::filesystem;

Linter::Linter(ProgramId program_id,
               std::string endpoint,
               fs::path package_path,
               fs::path home_path,
               Compiler& compiler)
    : program_id_(std::move(program_id)),
      endpoint_(std::move(endpoint)),
      package_path_(std::move(package_path)),
      home_path_(std::move(home_path)),
      compiler_(compiler) {}

Result<std::unique_ptr<Retriever>> Linter::make_retriever(Symbol main_symbol) {
    if (retriever_factory_) {
        return retriever_factory_(main_symbol, package_path_, home_path_, endpoint_);
    }
    auto r = PackageRetriever::create(main_symbol, package_path_, home_path_,
                                      endpoint_, network_);
    if (r.is_err()) return std::move(r).error();
    return Result<std::unique_ptr<Retriever>>::ok(std::move(r).value());
}

static LintError retrieval_error(LintError err) {
    err.message = "failed to retrieve dependencies: " + err.message;
    return err;
}

// ---------------------------------------------------------------------------
// lint()
// ---------------------------------------------------------------------------

Status Linter::lint() {
    fs::path build_dir = package_path_ / kBuildDir;

    std::error_code ec;
    if (fs::exists(build_dir, ec)) {
        log::debug("removing %s", build_dir.string().c_str());
        auto removed = remove_tree(build_dir);
        if (removed.is_err()) {
            LintError err = std::move(removed).error();
            err.message = "failed to remove build directory: " + err.message;
            return err;
        }
    }
    PKGLINT_TRY(Package::create(build_dir, program_id_));

    Symbol main_symbol = Symbol::intern(program_id_.name());

    auto retriever = make_retriever(main_symbol);
    if (retriever.is_err()) return retrieval_error(std::move(retriever).error());

    auto deps = retriever.value()->retrieve();
    if (deps.is_err()) return retrieval_error(std::move(deps).error());

    std::vector<Symbol> order = std::move(deps).value();
    order.push_back(main_symbol);

    log::info("linting %s (%zu programs)", program_id_.to_string().c_str(),
              order.size());

    size_t files_formatted = 0;
    for (Symbol dep : order) {
        PKGLINT_TRY(lint_dependency(*retriever.value(), dep, files_formatted));
    }

    log::info("formatted %zu files", files_formatted);
    return ok_status();
}

// ---------------------------------------------------------------------------
// Per dependency
// ---------------------------------------------------------------------------

Status Linter::lint_dependency(Retriever& retriever, Symbol dependency,
                               size_t& files_formatted) {
    auto local = retriever.prepare_local(dependency);
    if (local.is_err()) return std::move(local).error();

    auto id = ProgramId::from_name(dependency.str());
    if (id.is_err()) {
        LintError err = std::move(id).error();
        err.message = "cannot build program id for dependency '" +
                      dependency.str() + "': " + err.message;
        return err;
    }

    log::info("checking %s", id.value().to_string().c_str());

    std::vector<fs::path> files;
    PKGLINT_TRY(check_files(id.value(), local.value(), files));

    PKGLINT_TRY(rewrite_files(files));
    files_formatted += files.size();
    return ok_status();
}

Status Linter::check_files(const ProgramId& id,
                           const LocalPackage& local,
                           std::vector<fs::path>& files) {
    auto scratch = ScratchSpace::create(local.path);
    if (scratch.is_err()) return std::move(scratch).error();

    auto listed = SourceDirectory::files(local.path);
    if (listed.is_err()) return std::move(listed).error();
    PKGLINT_TRY(SourceDirectory::check_files(listed.value()));

    for (const auto& file : listed.value()) {
        CompileUnit unit;
        unit.program_name = id.name();
        unit.network = id.network();
        unit.file = file;
        unit.outputs = scratch.value().outputs();
        unit.options = options_;
        unit.stubs = &local.stubs;

        log::debug("compiling %s", file.string().c_str());
        auto artifact = compiler_.compile(unit);
        if (artifact.is_err()) {
            return std::move(artifact).with_file(file.string()).error();
        }
    }

    PKGLINT_TRY(scratch.value().release());
    files = std::move(listed).value();
    return ok_status();
}

Status Linter::rewrite_files(const std::vector<fs::path>& files) {
    for (const auto& file : files) {
        auto text = read_text(file);
        if (text.is_err()) return std::move(text).error();

        PKGLINT_TRY(write_text(file, normalize(text.value())));
        log::debug("formatted %s", file.string().c_str());
    }
    return ok_status();
}

} // namespace pkglint
