#include <pkglint/config.hpp>
#include <toml++/toml.hpp>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace pkglint {

namespace fs = std::filesystem;

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return LintError{LintError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [network]
    if (auto net = doc["network"].as_table()) {
        if (auto v = (*net)["endpoint"].value<std::string>()) {
            if (v->empty()) {
                return LintError{LintError::Config, "[network] endpoint is empty"};
            }
            cfg.endpoint = *v;
            cfg.endpoint_set = true;
        }
        if (auto v = (*net)["name"].value<std::string>()) {
            auto n = parse_network(*v);
            if (n.is_err()) {
                return LintError{LintError::Config,
                    "[network] " + n.error().message, n.error().hint};
            }
            cfg.network = n.value();
            cfg.network_set = true;
        }
    }

    // [compiler]
    if (auto comp = doc["compiler"].as_table()) {
        if (auto v = (*comp)["command"].value<std::string>()) {
            cfg.compiler.command = *v;
            cfg.command_set = true;
        }
        if (auto arr = (*comp)["args"].as_array()) {
            for (const auto& elem : *arr) {
                auto s = elem.value<std::string>();
                if (!s) {
                    return LintError{LintError::Config,
                        "[compiler] args must be an array of strings"};
                }
                cfg.compiler.args.push_back(*s);
            }
            cfg.args_set = true;
        }
        if (auto v = (*comp)["timeout"].value<int64_t>()) {
            if (*v <= 0) {
                return LintError{LintError::Config,
                    "[compiler] timeout must be positive"};
            }
            cfg.compiler.timeout_seconds = static_cast<int>(*v);
            cfg.timeout_set = true;
        }
        if (auto v = (*comp)["dce"].value<bool>()) {
            cfg.compiler.dce = *v;
            cfg.dce_set = true;
        }
    }

    // [log]
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.log_color = *v;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return LintError{LintError::IO,
            "cannot open config file: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str()).with_file(path.string());
}

Result<std::optional<Config>> Config::load_optional(const fs::path& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    auto cfg = load(path);
    if (cfg.is_err()) return std::move(cfg).error();
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

void Config::merge(const Config& other) {
    if (other.endpoint_set) {
        endpoint = other.endpoint;
        endpoint_set = true;
    }
    if (other.network_set) {
        network = other.network;
        network_set = true;
    }
    if (other.command_set) {
        compiler.command = other.compiler.command;
        command_set = true;
    }
    if (other.args_set) {
        compiler.args = other.compiler.args;
        args_set = true;
    }
    if (other.timeout_set) {
        compiler.timeout_seconds = other.compiler.timeout_seconds;
        timeout_set = true;
    }
    if (other.dce_set) {
        compiler.dce = other.compiler.dce;
        dce_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color.has_value()) {
        log_color = other.log_color;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

fs::path default_home_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return {};
    return fs::path(home) / ".pkglint";
}

fs::path global_config_path(const fs::path& home) {
    if (home.empty()) return {};
    return home / "config.toml";
}

fs::path local_config_path(const fs::path& package) {
    return package / "pkglint.toml";
}

} // namespace pkglint
