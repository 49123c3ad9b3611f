#pragma once

#include <iosfwd>

namespace pkglint {

// Entry point of the pkglint command. Returns the process exit code:
// 0 on success, 1 on a lint error, 2 on bad usage. Errors are written to
// `err` whatever the configured log level.
int run_cli(int argc, char** argv, std::istream& in, std::ostream& out,
            std::ostream& err);

} // namespace pkglint
