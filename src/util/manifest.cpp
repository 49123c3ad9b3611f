#include <pkglint/manifest.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace pkglint {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Dependency
// ---------------------------------------------------------------------------

Status Dependency::validate() const {
    auto name_ok = ProgramId::check_name(name);
    if (name_ok.is_err()) {
        return LintError{LintError::Manifest,
            "invalid dependency name '" + name + "': " + name_ok.error().message,
            name_ok.error().hint};
    }

    if (location == Location::Local) {
        if (!path.has_value() || path->empty()) {
            return LintError{LintError::Manifest,
                "local dependency '" + name + "' has no path",
                "add path = \"<dir>\" to the dependency"};
        }
        if (network.has_value()) {
            return LintError{LintError::Manifest,
                "local dependency '" + name + "' must not set a network"};
        }
    } else {
        if (path.has_value()) {
            return LintError{LintError::Manifest,
                "network dependency '" + name + "' must not set a path",
                "use location = \"local\" for path dependencies"};
        }
    }

    return ok_status();
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

static Result<Dependency> parse_dependency(const std::string& name,
                                           const toml::node& node) {
    const toml::table* tbl = node.as_table();
    if (!tbl) {
        return LintError{LintError::Manifest,
            "dependency '" + name + "' must be a table",
            "example: " + name + " = { location = \"local\", path = \"../" +
            name + "\" }"};
    }

    Dependency dep;
    dep.name = name;

    std::string location = (*tbl)["location"].value_or(std::string("local"));
    if (location == "local") {
        dep.location = Dependency::Location::Local;
    } else if (location == "network") {
        dep.location = Dependency::Location::Network;
    } else {
        return LintError{LintError::Manifest,
            "dependency '" + name + "' has unknown location '" + location + "'",
            "location must be \"local\" or \"network\""};
    }

    if (auto p = (*tbl)["path"].value<std::string>()) {
        dep.path = *p;
    }
    if (auto n = (*tbl)["network"].value<std::string>()) {
        auto net = parse_network(*n);
        if (net.is_err()) {
            return LintError{LintError::Manifest,
                "dependency '" + name + "': " + net.error().message,
                net.error().hint};
        }
        dep.network = net.value();
    }

    PKGLINT_TRY(dep.validate());
    return Result<Dependency>::ok(std::move(dep));
}

Result<Manifest> Manifest::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return LintError{LintError::Parse,
            std::string("manifest TOML parse error: ") +
            std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    Manifest m;

    auto pkg = doc["package"].as_table();
    if (!pkg) {
        return LintError{LintError::Manifest,
            "manifest has no [package] section"};
    }
    auto program = (*pkg)["program"].value<std::string>();
    if (!program) {
        return LintError{LintError::Manifest,
            "[package] is missing 'program'",
            "example: program = \"token.aleo\""};
    }
    m.package.program = *program;
    m.package.version = (*pkg)["version"].value_or(std::string("0.1.0"));
    m.package.description = (*pkg)["description"].value_or(std::string());
    m.package.license = (*pkg)["license"].value_or(std::string());

    auto id = m.program_id();
    if (id.is_err()) return std::move(id).error();

    if (auto deps = doc["dependencies"].as_table()) {
        for (const auto& [key, val] : *deps) {
            auto dep = parse_dependency(std::string(key.str()), val);
            if (dep.is_err()) return std::move(dep).error();
            m.dependencies.push_back(std::move(dep).value());
        }
    }

    return Result<Manifest>::ok(std::move(m));
}

Result<Manifest> Manifest::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return LintError{LintError::IO,
            "cannot open manifest: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Manifest::parse(ss.str()).with_file(path.string());
}

Result<Manifest> Manifest::read_from_dir(const fs::path& dir) {
    fs::path manifest_path = dir / kManifestFile;
    std::error_code ec;
    if (!fs::exists(manifest_path, ec)) {
        return LintError{LintError::NotFound,
            std::string("no ") + kManifestFile + " in " + dir.string(),
            "is this a package directory?"};
    }
    return load(manifest_path);
}

Result<ProgramId> Manifest::program_id() const {
    return ProgramId::parse(package.program);
}

std::string Manifest::to_toml() const {
    toml::table pkg;
    pkg.insert_or_assign("program", package.program);
    pkg.insert_or_assign("version", package.version);
    if (!package.description.empty())
        pkg.insert_or_assign("description", package.description);
    if (!package.license.empty())
        pkg.insert_or_assign("license", package.license);

    toml::table deps;
    for (const auto& dep : dependencies) {
        toml::table entry;
        if (dep.location == Dependency::Location::Local) {
            entry.insert_or_assign("location", "local");
            entry.insert_or_assign("path", dep.path.value_or(""));
        } else {
            entry.insert_or_assign("location", "network");
            entry.insert_or_assign("network", std::string(network_str(
                dep.network.value_or(NetworkName::Testnet))));
        }
        deps.insert_or_assign(dep.name, std::move(entry));
    }

    toml::table doc;
    doc.insert_or_assign("package", std::move(pkg));
    if (!deps.empty()) doc.insert_or_assign("dependencies", std::move(deps));

    std::ostringstream ss;
    ss << doc << "\n";
    return ss.str();
}

} // namespace pkglint
