#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace webblock {

namespace {

// iptables limits chain names to 28 characters
constexpr std::size_t kMaxChainLength = 28;

bool isValidChainName(const std::string& chain) {
    if (chain.empty() || chain.length() > kMaxChainLength || chain.front() == '-') {
        return false;
    }
    for (char c : chain) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

bool isValidPrefix(const std::string& prefix) {
    if (prefix.empty() || prefix.front() == '.' || prefix.back() == '.') {
        return false;
    }
    return std::all_of(prefix.begin(), prefix.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.';
    });
}

} // namespace

std::string applyModeToString(ApplyMode mode) {
    switch (mode) {
        case ApplyMode::Transaction:
            return "transaction";
        case ApplyMode::Sequential:
            return "sequential";
        default:
            throw std::runtime_error("Unknown apply mode");
    }
}

bool Config::isBuiltinChain(const std::string& chain) {
    return chain == "INPUT" || chain == "OUTPUT" || chain == "FORWARD";
}

bool Config::isValid() const {
    return getErrorMessage().empty();
}

std::string Config::getErrorMessage() const {
    if (!isValidChainName(chain)) {
        return "Invalid chain name '" + chain +
               "': use at most 28 alphanumeric, underscore, hyphen or dot characters, not starting with a hyphen";
    }
    // Built-in chains other than OUTPUT never see locally generated outbound traffic
    if (isBuiltinChain(chain) && chain != "OUTPUT") {
        return "Chain '" + chain + "' does not carry outbound traffic; use OUTPUT or a custom chain";
    }
    if (rules_file.empty()) {
        return "'rules_file' cannot be empty";
    }
    if (ipv6 && rules_file_v6.empty()) {
        return "'rules_file_v6' cannot be empty when 'ipv6' is enabled";
    }
    if (ipv6 && rules_file_v6 == rules_file) {
        return "'rules_file' and 'rules_file_v6' must be different files";
    }
    if (resolve_timeout_ms == 0) {
        return "'resolve_timeout_ms' must be greater than zero";
    }
    if (lock_file.empty()) {
        return "'lock_file' cannot be empty";
    }
    for (const auto& prefix : subdomain_prefixes) {
        if (!isValidPrefix(prefix)) {
            return "Invalid subdomain prefix: '" + prefix + "'";
        }
    }
    return "";
}

} // namespace webblock

namespace YAML {

using namespace webblock;

// ApplyMode conversion
Node convert<ApplyMode>::encode(const ApplyMode& mode) {
    return Node(applyModeToString(mode));
}

bool convert<ApplyMode>::decode(const Node& node, ApplyMode& mode) {
    if (!node.IsScalar()) return false;

    std::string value = node.as<std::string>();
    if (value == "transaction") {
        mode = ApplyMode::Transaction;
    } else if (value == "sequential") {
        mode = ApplyMode::Sequential;
    } else {
        return false;
    }
    return true;
}

// LogLevel conversion
Node convert<LogLevel>::encode(const LogLevel& level) {
    return Node(Logger::levelToString(level));
}

bool convert<LogLevel>::decode(const Node& node, LogLevel& level) {
    if (!node.IsScalar()) return false;

    try {
        level = Logger::levelFromString(node.as<std::string>());
    } catch (const std::invalid_argument&) {
        return false;
    }
    return true;
}

// Config conversion
Node convert<Config>::encode(const Config& config) {
    Node node;

    node["domains_file"] = config.domains_file;
    node["chain"] = config.chain;
    node["apply_mode"] = config.apply_mode;
    node["ipv6"] = config.ipv6;
    node["rules_file"] = config.rules_file;
    node["rules_file_v6"] = config.rules_file_v6;
    node["resolve_timeout_ms"] = config.resolve_timeout_ms;
    node["lock_file"] = config.lock_file;
    if (!config.subdomain_prefixes.empty()) {
        node["subdomain_prefixes"] = config.subdomain_prefixes;
    }
    node["comment_tag"] = config.comment_tag;
    node["log_level"] = config.log_level;

    return node;
}

bool convert<Config>::decode(const Node& node, Config& config) {
    // An empty document is a valid configuration that keeps every default
    if (node.IsNull()) return true;
    if (!node.IsMap()) return false;

    static const std::set<std::string> known_keys = {
        "domains_file", "chain", "apply_mode", "ipv6", "rules_file", "rules_file_v6",
        "resolve_timeout_ms", "lock_file", "subdomain_prefixes", "comment_tag", "log_level"
    };
    for (const auto& item : node) {
        std::string key = item.first.as<std::string>();
        if (known_keys.find(key) == known_keys.end()) {
            throw YAML::ParserException(item.first.Mark(), "unknown configuration key '" + key + "'");
        }
    }

    if (node["domains_file"]) {
        config.domains_file = node["domains_file"].as<std::string>();
    }
    if (node["chain"]) {
        config.chain = node["chain"].as<std::string>();
    }
    if (node["apply_mode"]) {
        config.apply_mode = node["apply_mode"].as<ApplyMode>();
    }
    if (node["ipv6"]) {
        config.ipv6 = node["ipv6"].as<bool>();
    }
    if (node["rules_file"]) {
        config.rules_file = node["rules_file"].as<std::string>();
    }
    if (node["rules_file_v6"]) {
        config.rules_file_v6 = node["rules_file_v6"].as<std::string>();
    }
    if (node["resolve_timeout_ms"]) {
        config.resolve_timeout_ms = node["resolve_timeout_ms"].as<uint32_t>();
    }
    if (node["lock_file"]) {
        config.lock_file = node["lock_file"].as<std::string>();
    }
    if (node["subdomain_prefixes"]) {
        config.subdomain_prefixes = node["subdomain_prefixes"].as<std::vector<std::string>>();
    }
    if (node["comment_tag"]) {
        config.comment_tag = node["comment_tag"].as<std::string>();
    }
    if (node["log_level"]) {
        config.log_level = node["log_level"].as<LogLevel>();
    }

    return true;
}

} // namespace YAML
