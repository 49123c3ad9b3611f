#pragma once

#include <pkglint/result.hpp>
#include <pkglint/log.hpp>
#include <pkglint/program_id.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pkglint {

inline constexpr const char* kDefaultEndpoint = "https://api.explorer.aleo.org/v1";

// [compiler] section
struct CompilerConfig {
    std::string command = "leo-compiler";
    std::vector<std::string> args;
    int timeout_seconds = 120;
    bool dce = true;
};

// Layered configuration: global (<home>/config.toml) then package-local
// (<package>/pkglint.toml). Later layers override earlier ones, field by field.
struct Config {
    std::string endpoint = kDefaultEndpoint;
    NetworkName network = NetworkName::Testnet;
    CompilerConfig compiler;
    log::Level log_level = log::Info;
    std::optional<bool> log_color;   // unset = detect from the terminal

    // Which fields a file set explicitly (for merge)
    bool endpoint_set = false;
    bool network_set = false;
    bool command_set = false;
    bool args_set = false;
    bool timeout_set = false;
    bool dce_set = false;
    bool log_level_set = false;

    static Result<Config> parse(const std::string& toml_str);
    static Result<Config> load(const std::filesystem::path& path);

    // Load path if it exists; a missing file is not an error
    static Result<std::optional<Config>> load_optional(const std::filesystem::path& path);

    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);
};

// ~/.pkglint, or empty if HOME is unset
std::filesystem::path default_home_path();

std::filesystem::path global_config_path(const std::filesystem::path& home);
std::filesystem::path local_config_path(const std::filesystem::path& package);

} // namespace pkglint
