#include <pkglint/cli.hpp>
#include <pkglint/config.hpp>
#include <pkglint/linter.hpp>
#include <pkglint/log.hpp>
#include <pkglint/manifest.hpp>
#include <pkglint/normalizer.hpp>

#include <filesystem>
#include <istream>
#include <iterator>
#include <optional>
#include <ostream>
#include <string>

namespace pkglint {

namespace fs = std::filesystem;

namespace {

struct CliArgs {
    std::optional<fs::path> path;
    std::optional<fs::path> home;
    std::optional<std::string> endpoint;
    std::optional<std::string> network;
    std::optional<std::string> compiler;
    int verbosity = 0;            // -1 quiet, 1 verbose, 2 trace
    bool stdin_mode = false;
    bool help = false;
};

const char* kUsage =
    "usage: pkglint [options]\n"
    "\n"
    "Compile-check every source file of a package and its local\n"
    "dependencies, then rewrite each file in canonical form.\n"
    "\n"
    "options:\n"
    "  --path DIR        package directory (default: current directory)\n"
    "  --home DIR        home directory for config and registry cache\n"
    "                    (default: ~/.pkglint)\n"
    "  --endpoint URL    network endpoint for remote dependencies\n"
    "  --network NAME    testnet, mainnet or canary\n"
    "  --compiler CMD    compiler executable\n"
    "  --stdin           normalize standard input to standard output\n"
    "  -v, --verbose     debug logging (repeat for trace)\n"
    "  -q, --quiet       errors only\n"
    "  -h, --help        show this help\n";

Result<CliArgs> parse_args(int argc, char** argv) {
    CliArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        auto take = [&](const char* flag) -> Result<std::string> {
            if (i + 1 >= argc) {
                return LintError{LintError::InvalidArg,
                    std::string(flag) + " requires a value"};
            }
            return Result<std::string>::ok(argv[++i]);
        };

        if (a == "-h" || a == "--help") {
            args.help = true;
        } else if (a == "-v" || a == "--verbose") {
            args.verbosity = args.verbosity < 0 ? 1 : args.verbosity + 1;
        } else if (a == "-q" || a == "--quiet") {
            args.verbosity = -1;
        } else if (a == "--stdin") {
            args.stdin_mode = true;
        } else if (a == "--path" || a == "--home" || a == "--endpoint" ||
                   a == "--network" || a == "--compiler") {
            auto v = take(a.c_str());
            if (v.is_err()) return std::move(v).error();
            if (a == "--path") args.path = fs::path(v.value());
            else if (a == "--home") args.home = fs::path(v.value());
            else if (a == "--endpoint") args.endpoint = v.value();
            else if (a == "--network") args.network = v.value();
            else args.compiler = v.value();
        } else {
            return LintError{LintError::InvalidArg,
                "unknown argument '" + a + "'", "see pkglint --help"};
        }
    }
    return Result<CliArgs>::ok(std::move(args));
}

Result<Config> load_config(const fs::path& home, const fs::path& package) {
    auto global = Config::load_optional(global_config_path(home));
    if (global.is_err()) return std::move(global).error();
    auto local = Config::load_optional(local_config_path(package));
    if (local.is_err()) return std::move(local).error();
    return Result<Config>::ok(Config::effective(global.value(), local.value()));
}

Status apply_overrides(const CliArgs& args, Config& cfg) {
    if (args.endpoint) cfg.endpoint = *args.endpoint;
    if (args.network) {
        auto n = parse_network(*args.network);
        if (n.is_err()) return std::move(n).error();
        cfg.network = n.value();
    }
    if (args.compiler) cfg.compiler.command = *args.compiler;
    switch (args.verbosity) {
        case -1: cfg.log_level = log::Error; break;
        case 0:  break;
        case 1:  cfg.log_level = log::Debug; break;
        default: cfg.log_level = log::Trace; break;
    }
    return ok_status();
}

} // namespace

int run_cli(int argc, char** argv, std::istream& in, std::ostream& out,
            std::ostream& err) {
    // The terminal error bypasses the log level
    auto fail = [&err](const LintError& e) {
        err << e.format() << "\n";
        return 1;
    };

    auto parsed = parse_args(argc, argv);
    if (parsed.is_err()) {
        err << parsed.error().format() << "\n";
        return 2;
    }
    const CliArgs& args = parsed.value();

    if (args.help) {
        out << kUsage;
        return 0;
    }

    if (args.stdin_mode) {
        std::string input{std::istreambuf_iterator<char>(in),
                          std::istreambuf_iterator<char>()};
        out << normalize(input) << "\n";
        return 0;
    }

    std::error_code ec;
    fs::path package = args.path ? *args.path : fs::current_path(ec);
    if (ec) return fail(LintError{LintError::IO, "cannot determine current directory"});
    fs::path home = args.home ? *args.home : default_home_path();
    if (home.empty()) {
        return fail(LintError{LintError::Config,
            "cannot determine home directory", "pass --home or set HOME"});
    }

    auto cfg = load_config(home, package);
    if (cfg.is_err()) return fail(cfg.error());
    auto st = apply_overrides(args, cfg.value());
    if (st.is_err()) {
        err << st.error().format() << "\n";
        return 2;
    }

    log::set_level(cfg.value().log_level);
    if (cfg.value().log_color) log::set_color_enabled(*cfg.value().log_color);

    auto manifest = Manifest::read_from_dir(package);
    if (manifest.is_err()) return fail(manifest.error());
    auto program_id = manifest.value().program_id();
    if (program_id.is_err()) return fail(program_id.error());

    ProcessCompiler compiler(cfg.value().compiler);
    Linter linter(program_id.value(), cfg.value().endpoint, package, home, compiler);
    linter.set_network(cfg.value().network);
    CompilerOptions options;
    options.dce_enabled = cfg.value().compiler.dce;
    linter.set_compiler_options(options);

    auto result = linter.lint();
    if (result.is_err()) return fail(result.error());
    return 0;
}

} // namespace pkglint
