#pragma once

#include <pkglint/result.hpp>
#include <string>
#include <vector>

namespace pkglint {

struct ProcessOptions {
    std::string working_dir;      // empty = inherit
    int timeout_seconds = 60;
};

struct ProcessOutput {
    int exit_code = -1;           // -1 if the child was killed by a signal
    std::string out;
    std::string err;

    bool success() const { return exit_code == 0; }
};

// Fork/exec argv[0] (PATH lookup), capture stdout and stderr.
// A missing executable yields exit code 127. Errors only on pipe/fork
// failure or timeout.
Result<ProcessOutput> run_process(const std::vector<std::string>& argv,
                                  const ProcessOptions& options = {});

} // namespace pkglint
