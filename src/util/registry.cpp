#include <pkglint/registry.hpp>
#include <pkglint/fs.hpp>
#include <pkglint/process.hpp>
#include <pkglint/log.hpp>

namespace pkglint {

namespace fs = std::filesystem;

Registry::Registry(fs::path home_path, std::string endpoint)
    : home_path_(std::move(home_path)), endpoint_(std::move(endpoint)) {
    while (!endpoint_.empty() && endpoint_.back() == '/') endpoint_.pop_back();
}

fs::path Registry::program_path(NetworkName network,
                                const ProgramId& program) const {
    return home_path_ / "registry" / network_str(network) / program.name() /
           program.to_string();
}

std::string Registry::program_url(NetworkName network,
                                  const ProgramId& program) const {
    return endpoint_ + "/" + network_str(network) + "/program/" +
           program.to_string();
}

Result<std::string> Registry::decode_response(const std::string& body) {
    size_t first = body.find_first_not_of(" \t\r\n");
    if (first == std::string::npos || body[first] != '"') {
        return Result<std::string>::ok(body);
    }

    std::string out;
    size_t i = first + 1;
    for (; i < body.size(); ++i) {
        char c = body[i];
        if (c == '"') break;
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (++i >= body.size()) break;
        switch (body[i]) {
            case 'n':  out.push_back('\n'); break;
            case 't':  out.push_back('\t'); break;
            case 'r':  out.push_back('\r'); break;
            case '"':  out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/':  out.push_back('/'); break;
            default:
                return LintError{LintError::Network,
                    std::string("unsupported escape '\\") + body[i] +
                    "' in registry response"};
        }
    }
    if (i >= body.size()) {
        return LintError{LintError::Network,
            "unterminated string in registry response"};
    }
    return Result<std::string>::ok(std::move(out));
}

Result<std::string> Registry::fetch(NetworkName network, const ProgramId& program) {
    fs::path cached = program_path(network, program);
    std::error_code ec;
    if (fs::exists(cached, ec)) {
        log::debug("using cached %s", cached.string().c_str());
        return read_text(cached);
    }

    std::string url = program_url(network, program);
    log::info("fetching %s", url.c_str());

    ProcessOptions opts;
    opts.timeout_seconds = timeout_seconds_;
    auto res = run_process({"curl", "-fsSL", url}, opts);
    if (res.is_err()) {
        return LintError{LintError::Network,
            "failed to fetch " + program.to_string() + ": " + res.error().message};
    }
    if (!res.value().success()) {
        return LintError{LintError::Network,
            "failed to fetch " + program.to_string() + " from " + url,
            res.value().err.empty() ? "is curl installed and the endpoint reachable?"
                                    : res.value().err};
    }

    auto text = decode_response(res.value().out);
    if (text.is_err()) return std::move(text).error();

    fs::create_directories(cached.parent_path(), ec);
    if (ec) {
        return LintError{LintError::IO,
            "failed to create registry directory " +
            cached.parent_path().string() + ": " + ec.message()};
    }
    PKGLINT_TRY(write_text(cached, text.value()));
    return text;
}

} // namespace pkglint
