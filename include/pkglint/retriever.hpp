#pragma once

#include <pkglint/result.hpp>
#include <pkglint/symbol.hpp>
#include <pkglint/stub.hpp>
#include <pkglint/graph.hpp>
#include <pkglint/manifest.hpp>
#include <pkglint/registry.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace pkglint {

// A dependency staged on disk, with the stubs of everything it imports
struct LocalPackage {
    std::filesystem::path path;
    StubSet stubs;
};

// Resolves the dependency closure of a package
class Retriever {
public:
    virtual ~Retriever() = default;

    // Local dependencies of the main program, dependencies before their
    // dependents. The main program itself is not included.
    virtual Result<std::vector<Symbol>> retrieve() = 0;

    // Package directory of a local dependency and the stubs of every program
    // it transitively imports. Only valid after retrieve().
    virtual Result<LocalPackage> prepare_local(Symbol name) = 0;
};

// Retriever over program.toml manifests on disk, with network dependencies
// served from the registry cache under the home directory
class PackageRetriever : public Retriever {
    struct Token { explicit Token() = default; };

public:
    static Result<std::unique_ptr<PackageRetriever>> create(
        Symbol main_symbol,
        const std::filesystem::path& package_path,
        const std::filesystem::path& home_path,
        const std::string& endpoint,
        NetworkName network = NetworkName::Testnet);

    // Only reachable through create()
    PackageRetriever(Token, Symbol main_symbol,
                     std::filesystem::path package_path, Registry registry,
                     NetworkName network);

    Result<std::vector<Symbol>> retrieve() override;
    Result<LocalPackage> prepare_local(Symbol name) override;

    Registry& registry() { return registry_; }

private:
    struct Node {
        Symbol name;
        bool is_local = true;
        std::filesystem::path path;          // local only
        NetworkName network = NetworkName::Testnet;  // network only
    };

    Symbol main_;
    std::filesystem::path package_path_;
    Registry registry_;
    NetworkName network_;

    std::unordered_map<Symbol, Node> nodes_;
    std::unordered_map<Symbol, Stub> stubs_;
    GraphMap graph_;
    bool retrieved_ = false;

    // Register a node reached from `from`, or check it against the existing one
    Result<bool> add_node(const Node& node, Symbol from);

    Status visit_local(const Node& node, std::vector<Symbol>& queue);
    Status visit_network(const Node& node, std::vector<Symbol>& queue);

    Result<Stub> local_stub(const Node& node);
};

} // namespace pkglint
