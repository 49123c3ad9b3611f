#pragma once

#include <pkglint/result.hpp>
#include <pkglint/program_id.hpp>
#include <filesystem>
#include <string>

namespace pkglint {

// Local cache of programs deployed on a network.
//
// Layout:
//   <home>/registry/<network>/<name>/<name>.aleo
class Registry {
public:
    Registry(std::filesystem::path home_path, std::string endpoint);

    std::filesystem::path program_path(NetworkName network,
                                       const ProgramId& program) const;

    // Return the cached program text, fetching it from the endpoint first if
    // it is not cached yet
    Result<std::string> fetch(NetworkName network, const ProgramId& program);

    // <endpoint>/<network>/program/<id>
    std::string program_url(NetworkName network, const ProgramId& program) const;

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }

    // Explorer responses are JSON strings; plain text passes through
    static Result<std::string> decode_response(const std::string& body);

private:
    std::filesystem::path home_path_;
    std::string endpoint_;
    int timeout_seconds_ = 60;
};

} // namespace pkglint
