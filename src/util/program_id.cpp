#include <pkglint/program_id.hpp>
#include <cctype>

namespace pkglint {

Result<NetworkName> parse_network(const std::string& raw) {
    if (raw == "testnet") return Result<NetworkName>::ok(NetworkName::Testnet);
    if (raw == "mainnet") return Result<NetworkName>::ok(NetworkName::Mainnet);
    if (raw == "canary")  return Result<NetworkName>::ok(NetworkName::Canary);
    return LintError{LintError::InvalidArg,
        "unknown network '" + raw + "'",
        "expected one of: testnet, mainnet, canary"};
}

const char* network_str(NetworkName n) {
    switch (n) {
        case NetworkName::Testnet: return "testnet";
        case NetworkName::Mainnet: return "mainnet";
        case NetworkName::Canary:  return "canary";
    }
    return "unknown";
}

Status ProgramId::check_name(const std::string& name) {
    if (name.empty()) {
        return LintError{LintError::ProgramId, "empty program name"};
    }
    if (name.size() > kMaxNameLength) {
        return LintError{LintError::ProgramId,
            "program name '" + name + "' is too long",
            "program names are limited to " + std::to_string(kMaxNameLength) +
            " characters"};
    }
    if (!std::isalpha(static_cast<unsigned char>(name[0]))) {
        return LintError{LintError::ProgramId,
            "invalid program name '" + name + "'",
            "program names must start with a letter"};
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return LintError{LintError::ProgramId,
                "invalid character '" + std::string(1, c) +
                "' in program name '" + name + "'",
                "allowed: [a-zA-Z0-9_]"};
        }
    }
    if (name.find("__") != std::string::npos) {
        return LintError{LintError::ProgramId,
            "invalid program name '" + name + "'",
            "program names must not contain a double underscore"};
    }
    return ok_status();
}

Result<ProgramId> ProgramId::parse(const std::string& raw) {
    auto dot = raw.rfind('.');
    if (dot == std::string::npos) {
        return LintError{LintError::ProgramId,
            "program id '" + raw + "' has no network suffix",
            std::string("expected <name>.") + kNetworkSuffix};
    }

    std::string name = raw.substr(0, dot);
    std::string network = raw.substr(dot + 1);
    if (network != kNetworkSuffix) {
        return LintError{LintError::ProgramId,
            "program id '" + raw + "' has invalid network '" + network + "'",
            std::string("expected <name>.") + kNetworkSuffix};
    }
    PKGLINT_TRY(check_name(name));

    ProgramId id;
    id.name_ = std::move(name);
    id.network_ = std::move(network);
    return Result<ProgramId>::ok(std::move(id));
}

Result<ProgramId> ProgramId::from_name(const std::string& name) {
    return parse(name + "." + kNetworkSuffix);
}

} // namespace pkglint
