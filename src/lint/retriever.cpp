#include <pkglint/retriever.hpp>
#include <pkglint/package.hpp>
#include <pkglint/log.hpp>

namespace pkglint {

namespace fs = std::filesystem;

static fs::path canonical_or_absolute(const fs::path& p) {
    std::error_code ec;
    fs::path c = fs::canonical(p, ec);
    if (ec) return fs::absolute(p, ec);
    return c;
}

// ---------------------------------------------------------------------------
// create()
// ---------------------------------------------------------------------------

PackageRetriever::PackageRetriever(Token, Symbol main_symbol,
                                   fs::path package_path, Registry registry,
                                   NetworkName network)
    : main_(main_symbol),
      package_path_(std::move(package_path)),
      registry_(std::move(registry)),
      network_(network) {}

Result<std::unique_ptr<PackageRetriever>> PackageRetriever::create(
    Symbol main_symbol,
    const fs::path& package_path,
    const fs::path& home_path,
    const std::string& endpoint,
    NetworkName network)
{
    PKGLINT_TRY(ProgramId::check_name(main_symbol.str()));

    fs::path root = canonical_or_absolute(package_path);
    auto manifest = Manifest::read_from_dir(root);
    if (manifest.is_err()) return std::move(manifest).error();

    auto id = manifest.value().program_id();
    if (id.is_err()) return std::move(id).error();
    if (id.value().name() != main_symbol.str()) {
        return LintError{LintError::Dependency,
            "manifest declares program '" + id.value().to_string() +
            "', expected '" + main_symbol.str() + "'",
            "", (root / kManifestFile).string()};
    }

    auto r = std::make_unique<PackageRetriever>(
        Token{}, main_symbol, root, Registry(home_path, endpoint), network);
    return Result<std::unique_ptr<PackageRetriever>>::ok(std::move(r));
}

// ---------------------------------------------------------------------------
// retrieve(): breadth-first walk over manifests and network imports
// ---------------------------------------------------------------------------

Result<bool> PackageRetriever::add_node(const Node& node, Symbol from) {
    graph_.add_edge(node.name.str(), from.str());

    auto it = nodes_.find(node.name);
    if (it == nodes_.end()) {
        nodes_.emplace(node.name, node);
        return Result<bool>::ok(true);
    }

    const Node& seen = it->second;
    if (seen.is_local != node.is_local ||
        (node.is_local && seen.path != node.path) ||
        (!node.is_local && seen.network != node.network)) {
        std::string a = seen.is_local ? "path " + seen.path.string()
                                      : std::string("network ") + network_str(seen.network);
        std::string b = node.is_local ? "path " + node.path.string()
                                      : std::string("network ") + network_str(node.network);
        return LintError{LintError::Dependency,
            "conflicting sources for dependency '" + node.name.str() +
            "': " + a + " vs " + b};
    }
    return Result<bool>::ok(false);
}

Status PackageRetriever::visit_local(const Node& node, std::vector<Symbol>& queue) {
    auto manifest = Manifest::read_from_dir(node.path);
    if (manifest.is_err()) return std::move(manifest).error();

    auto id = manifest.value().program_id();
    if (id.is_err()) return std::move(id).error();
    if (id.value().name() != node.name.str()) {
        return LintError{LintError::Dependency,
            "dependency '" + node.name.str() + "' at " + node.path.string() +
            " declares program '" + id.value().to_string() + "'",
            "the dependency key must match the program name"};
    }

    for (const auto& dep : manifest.value().dependencies) {
        Node child;
        child.name = Symbol::intern(dep.name);
        if (dep.location == Dependency::Location::Local) {
            fs::path p(*dep.path);
            if (p.is_relative()) p = node.path / p;
            std::error_code ec;
            if (!fs::is_directory(p, ec)) {
                return LintError{LintError::NotFound,
                    "local dependency '" + dep.name +
                    "': directory does not exist: " + p.string(),
                    "", (node.path / kManifestFile).string()};
            }
            child.path = canonical_or_absolute(p);
        } else {
            child.is_local = false;
            child.network = dep.network.value_or(network_);
        }

        auto added = add_node(child, node.name);
        if (added.is_err()) return std::move(added).error();
        if (added.value()) queue.push_back(child.name);
    }
    return ok_status();
}

Status PackageRetriever::visit_network(const Node& node, std::vector<Symbol>& queue) {
    auto id = ProgramId::from_name(node.name.str());
    if (id.is_err()) return std::move(id).error();

    auto text = registry_.fetch(node.network, id.value());
    if (text.is_err()) return std::move(text).error();

    auto stub = extract_bytecode_stub(text.value());
    if (stub.is_err()) {
        return LintError{LintError::Dependency,
            "cannot read program " + id.value().to_string() + ": " +
            stub.error().message,
            "", registry_.program_path(node.network, id.value()).string()};
    }

    for (const auto& imp : stub.value().imports) {
        auto imp_id = ProgramId::parse(imp);
        if (imp_id.is_err()) return std::move(imp_id).error();

        Node child;
        child.name = Symbol::intern(imp_id.value().name());
        child.is_local = false;
        child.network = node.network;

        // A network program may import something the package also has
        // locally; the local copy wins
        auto existing = nodes_.find(child.name);
        if (existing != nodes_.end() && existing->second.is_local) {
            graph_.add_edge(child.name.str(), node.name.str());
            continue;
        }

        auto added = add_node(child, node.name);
        if (added.is_err()) return std::move(added).error();
        if (added.value()) queue.push_back(child.name);
    }

    stubs_[node.name] = std::move(stub).value();
    return ok_status();
}

Result<std::vector<Symbol>> PackageRetriever::retrieve() {
    nodes_.clear();
    stubs_.clear();
    graph_ = GraphMap();
    retrieved_ = false;

    Node root;
    root.name = main_;
    root.path = package_path_;
    nodes_.emplace(main_, root);
    graph_.add_node(main_.str());

    std::vector<Symbol> queue{main_};
    for (size_t i = 0; i < queue.size(); ++i) {
        Node node = nodes_.at(queue[i]);
        log::trace("retrieve: visiting %s", node.name.str().c_str());
        if (node.is_local) {
            PKGLINT_TRY(visit_local(node, queue));
        } else {
            PKGLINT_TRY(visit_network(node, queue));
        }
    }

    auto order = graph_.topological_sort();
    if (order.is_err()) return std::move(order).error();

    std::vector<Symbol> locals;
    for (const auto& name : order.value()) {
        Symbol s = Symbol::intern(name);
        if (s == main_) continue;
        if (nodes_.at(s).is_local) locals.push_back(s);
    }

    retrieved_ = true;
    log::debug("retrieved %zu local dependencies of %s (%zu programs total)",
               locals.size(), main_.str().c_str(), nodes_.size());
    return Result<std::vector<Symbol>>::ok(std::move(locals));
}

// ---------------------------------------------------------------------------
// prepare_local()
// ---------------------------------------------------------------------------

Result<Stub> PackageRetriever::local_stub(const Node& node) {
    auto cached = stubs_.find(node.name);
    if (cached != stubs_.end()) return Result<Stub>::ok(cached->second);

    auto files = SourceDirectory::files(node.path);
    if (files.is_err()) return std::move(files).error();

    Stub merged;
    for (const auto& f : files.value()) {
        if (f.extension() != kSourceExtension) continue;
        auto text = read_text(f);
        if (text.is_err()) return std::move(text).error();

        auto stub = extract_source_stub(text.value());
        if (stub.is_err()) return std::move(stub).with_file(f.string()).error();

        auto& s = stub.value();
        if (merged.program.empty()) merged.program = s.program;
        for (auto& imp : s.imports) merged.imports.push_back(std::move(imp));
        for (auto& d : s.declarations) merged.declarations.push_back(std::move(d));
    }

    std::string expected = node.name.str() + "." + ProgramId::kNetworkSuffix;
    if (merged.program != expected) {
        return LintError{LintError::Dependency,
            "sources of '" + node.name.str() + "' declare program '" +
            merged.program + "', expected '" + expected + "'",
            "", (node.path / kSourceDir).string()};
    }

    stubs_[node.name] = merged;
    return Result<Stub>::ok(std::move(merged));
}

Result<LocalPackage> PackageRetriever::prepare_local(Symbol name) {
    if (!retrieved_) {
        return LintError{LintError::InvalidArg,
            "prepare_local('" + name.str() + "') called before retrieve()"};
    }

    auto it = nodes_.find(name);
    if (it == nodes_.end()) {
        return LintError{LintError::NotFound,
            "'" + name.str() + "' is not a dependency of " + main_.str()};
    }
    if (!it->second.is_local) {
        return LintError{LintError::Dependency,
            "'" + name.str() + "' is a network dependency and has no local sources"};
    }

    auto deps = graph_.ancestors_sorted(name.str());
    if (deps.is_err()) return std::move(deps).error();

    LocalPackage pkg;
    pkg.path = it->second.path;
    for (const auto& dep_name : deps.value()) {
        Symbol s = Symbol::intern(dep_name);
        const Node& dep = nodes_.at(s);
        if (dep.is_local) {
            auto stub = local_stub(dep);
            if (stub.is_err()) return std::move(stub).error();
            pkg.stubs.insert(s, std::move(stub).value());
        } else {
            pkg.stubs.insert(s, stubs_.at(s));
        }
    }

    log::debug("prepared %s: %zu stubs", name.str().c_str(), pkg.stubs.size());
    return Result<LocalPackage>::ok(std::move(pkg));
}

} // namespace pkglint
