#pragma once

#include <pkglint/result.hpp>
#include <pkglint/config.hpp>
#include <pkglint/stub.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace pkglint {

struct CompilerOptions {
    bool dce_enabled = true;      // dead code elimination
};

// Everything the compiler needs to check one source file
struct CompileUnit {
    std::string program_name;     // e.g. "token"
    std::string network;          // network tag of the program id, e.g. "aleo"
    std::filesystem::path file;
    std::filesystem::path outputs;
    CompilerOptions options;
    const StubSet* stubs = nullptr;
};

class Compiler {
public:
    virtual ~Compiler() = default;

    // Compiled instructions on success, a Compile error otherwise
    virtual Result<std::string> compile(const CompileUnit& unit) = 0;
};

// Runs an external compiler executable:
//   <command> <args...> --name <program> --network <tag> --outputs <dir>
//             [--no-dce] [--stub <file>]... <file>
// Stubs are written to <outputs>/stubs/<name>.stub first.
class ProcessCompiler : public Compiler {
public:
    explicit ProcessCompiler(CompilerConfig config);

    Result<std::string> compile(const CompileUnit& unit) override;

    // Exposed for tests
    std::vector<std::string> command_line(const CompileUnit& unit,
                                          const std::vector<std::string>& stub_files) const;

private:
    CompilerConfig config_;

    Result<std::vector<std::string>> write_stubs(const CompileUnit& unit) const;
};

} // namespace pkglint
