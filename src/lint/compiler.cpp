#include <pkglint/compiler.hpp>
#include <pkglint/fs.hpp>
#include <pkglint/log.hpp>
#include <pkglint/process.hpp>

namespace pkglint {

namespace fs = std::filesystem;

ProcessCompiler::ProcessCompiler(CompilerConfig config)
    : config_(std::move(config)) {}

std::vector<std::string> ProcessCompiler::command_line(
    const CompileUnit& unit,
    const std::vector<std::string>& stub_files) const
{
    std::vector<std::string> argv;
    argv.push_back(config_.command);
    argv.insert(argv.end(), config_.args.begin(), config_.args.end());
    argv.insert(argv.end(), {"--name", unit.program_name,
                             "--network", unit.network,
                             "--outputs", unit.outputs.string()});
    if (!unit.options.dce_enabled) argv.push_back("--no-dce");
    for (const auto& f : stub_files) {
        argv.push_back("--stub");
        argv.push_back(f);
    }
    argv.push_back(unit.file.string());
    return argv;
}

Result<std::vector<std::string>> ProcessCompiler::write_stubs(
    const CompileUnit& unit) const
{
    std::vector<std::string> files;
    if (!unit.stubs || unit.stubs->empty()) {
        return Result<std::vector<std::string>>::ok(std::move(files));
    }

    fs::path dir = unit.outputs / "stubs";
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return LintError{LintError::IO,
            "failed to create " + dir.string() + ": " + ec.message()};
    }

    for (const auto& [name, stub] : *unit.stubs) {
        fs::path p = dir / (name.str() + ".stub");
        PKGLINT_TRY(write_text(p, stub.render()));
        files.push_back(p.string());
    }
    return Result<std::vector<std::string>>::ok(std::move(files));
}

Result<std::string> ProcessCompiler::compile(const CompileUnit& unit) {
    auto stub_files = write_stubs(unit);
    if (stub_files.is_err()) return std::move(stub_files).error();

    auto argv = command_line(unit, stub_files.value());

    ProcessOptions opts;
    opts.timeout_seconds = config_.timeout_seconds;
    auto res = run_process(argv, opts);
    if (res.is_err()) {
        return LintError{LintError::Compile,
            "failed to run compiler '" + config_.command + "': " +
            res.error().message, "", unit.file.string()};
    }

    const auto& out = res.value();
    if (out.exit_code == 127 && out.out.empty()) {
        return LintError{LintError::Compile,
            "compiler '" + config_.command + "' could not be started",
            "set [compiler] command in config.toml or pass --compiler",
            unit.file.string()};
    }
    if (!out.success()) {
        std::string diag = out.err.empty() ? out.out : out.err;
        while (!diag.empty() && (diag.back() == '\n' || diag.back() == ' ')) {
            diag.pop_back();
        }
        return LintError{LintError::Compile,
            "compilation of '" + unit.program_name + "' failed" +
            (diag.empty() ? std::string() : ":\n" + diag),
            "", unit.file.string()};
    }

    log::trace("compiled %s (%zu bytes of instructions)",
               unit.file.string().c_str(), out.out.size());
    return Result<std::string>::ok(out.out);
}

} // namespace pkglint
