#pragma once

#include <pkglint/result.hpp>
#include <pkglint/program_id.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pkglint {

// File name of the package manifest, at the package root
inline constexpr const char* kManifestFile = "program.toml";

// [package] section
struct PackageInfo {
    std::string program;          // e.g. "token.aleo"
    std::string version;
    std::string description;
    std::string license;
};

// One entry of [dependencies]
struct Dependency {
    enum class Location { Local, Network };

    std::string name;             // program name without the network suffix
    Location location = Location::Local;
    std::optional<std::string> path;          // local only
    std::optional<NetworkName> network;       // network only, default testnet

    Status validate() const;
};

struct Manifest {
    PackageInfo package;
    std::vector<Dependency> dependencies;

    static Result<Manifest> parse(const std::string& toml_str);
    static Result<Manifest> load(const std::filesystem::path& path);

    // Load <dir>/program.toml
    static Result<Manifest> read_from_dir(const std::filesystem::path& dir);

    // Parsed [package].program
    Result<ProgramId> program_id() const;

    // Serialize back to TOML
    std::string to_toml() const;
};

} // namespace pkglint
