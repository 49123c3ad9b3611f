#pragma once

#include <pkglint/result.hpp>
#include <pkglint/compiler.hpp>
#include <pkglint/program_id.hpp>
#include <pkglint/retriever.hpp>
#include <pkglint/symbol.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace pkglint {

using RetrieverFactory = std::function<Result<std::unique_ptr<Retriever>>(
    Symbol main_symbol,
    const std::filesystem::path& package_path,
    const std::filesystem::path& home_path,
    const std::string& endpoint)>;

// Lint/format pass over a package and its local dependency closure.
//
// For each dependency (the package itself last): compile every source file
// to check it, then rewrite every source file in canonical form. The first
// error aborts the pass; files already rewritten stay rewritten.
class Linter {
public:
    Linter(ProgramId program_id,
           std::string endpoint,
           std::filesystem::path package_path,
           std::filesystem::path home_path,
           Compiler& compiler);

    void set_network(NetworkName network) { network_ = network; }
    void set_compiler_options(const CompilerOptions& options) { options_ = options; }

    // Replaces the default PackageRetriever
    void set_retriever_factory(RetrieverFactory factory) {
        retriever_factory_ = std::move(factory);
    }

    Status lint();

private:
    ProgramId program_id_;
    std::string endpoint_;
    std::filesystem::path package_path_;
    std::filesystem::path home_path_;
    Compiler& compiler_;
    NetworkName network_ = NetworkName::Testnet;
    CompilerOptions options_;
    RetrieverFactory retriever_factory_;

    Result<std::unique_ptr<Retriever>> make_retriever(Symbol main_symbol);

    Status lint_dependency(Retriever& retriever, Symbol dependency,
                           size_t& files_formatted);

    Status check_files(const ProgramId& id,
                       const LocalPackage& local,
                       std::vector<std::filesystem::path>& files);

    static Status rewrite_files(const std::vector<std::filesystem::path>& files);
};

} // namespace pkglint
