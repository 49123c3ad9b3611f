#pragma once

#include <pkglint/result.hpp>
#include <string>

namespace pkglint {

// Deployment networks a program can be fetched from
enum class NetworkName { Testnet, Mainnet, Canary };

Result<NetworkName> parse_network(const std::string& raw);
const char* network_str(NetworkName n);

// Network-qualified program identifier: <name>.<network>, e.g. "token.aleo".
// Name: [a-zA-Z][a-zA-Z0-9_]*, at most 31 chars, no "__".
class ProgramId {
public:
    static constexpr const char* kNetworkSuffix = "aleo";
    static constexpr size_t kMaxNameLength = 31;

    static Result<ProgramId> parse(const std::string& raw);
    static Result<ProgramId> from_name(const std::string& name);

    // Validate a bare program name without the network suffix
    static Status check_name(const std::string& name);

    const std::string& name() const { return name_; }
    const std::string& network() const { return network_; }
    std::string to_string() const { return name_ + "." + network_; }

    bool operator==(const ProgramId& o) const {
        return name_ == o.name_ && network_ == o.network_;
    }
    bool operator!=(const ProgramId& o) const { return !(*this == o); }

private:
    std::string name_;
    std::string network_;
};

} // namespace pkglint
