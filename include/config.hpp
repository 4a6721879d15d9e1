/**
 * @file config.hpp
 * @brief Configuration structure and YAML serialization for web-blocker
 * @author web-blocker Development Team
 * @date 2026
 *
 * This file contains the runtime configuration of web-blocker and the
 * yaml-cpp template specializations that read it from a YAML document.
 * Every key is optional; missing keys keep the defaults below.
 */

#pragma once

#include "logger.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace webblock {

/**
 * @enum ApplyMode
 * @brief How the target chain is replaced
 */
enum class ApplyMode {
    Transaction, ///< Flush and appends submitted as one iptables-restore transaction
    Sequential   ///< iptables -F followed by one iptables -A per rule
};

std::string applyModeToString(ApplyMode mode);

/**
 * @struct Config
 * @brief Runtime configuration
 *
 * Passed explicitly to the components that need it; there is no global
 * configuration state.
 */
struct Config {
    std::string domains_file = "/etc/web-blocker/sites.conf";  ///< One domain per line
    std::string chain = "OUTPUT";                              ///< Chain owned by web-blocker
    ApplyMode apply_mode = ApplyMode::Transaction;             ///< Chain replacement strategy
    bool ipv6 = false;                                         ///< Also resolve AAAA and drive ip6tables
    std::string rules_file = "/etc/iptables/rules.v4";         ///< IPv4 persisted ruleset
    std::string rules_file_v6 = "/etc/iptables/rules.v6";      ///< IPv6 persisted ruleset
    uint32_t resolve_timeout_ms = 5000;                        ///< Per-domain resolution bound
    std::string lock_file = "/run/web-blocker.lock";           ///< Serializes invocations
    std::vector<std::string> subdomain_prefixes;               ///< e.g. ["www", "api"]
    std::string comment_tag = "web-blocker";                   ///< Prefix of every rule comment
    LogLevel log_level = LogLevel::Info;                       ///< Console verbosity

    /**
     * @brief Validate the configuration
     * @return true if every field holds a usable value
     */
    bool isValid() const;

    /**
     * @brief Get detailed error message for invalid configurations
     * @return Human-readable error description or empty string if valid
     */
    std::string getErrorMessage() const;

    /**
     * @brief Check if a chain name is one of the built-in filter chains
     */
    static bool isBuiltinChain(const std::string& chain);
};

} // namespace webblock

namespace YAML {

/**
 * @brief YAML conversion for ApplyMode enum
 *
 * - ApplyMode::Transaction <-> "transaction"
 * - ApplyMode::Sequential <-> "sequential"
 */
template<>
struct convert<webblock::ApplyMode> {
    static Node encode(const webblock::ApplyMode& mode);
    static bool decode(const Node& node, webblock::ApplyMode& mode);
};

/**
 * @brief YAML conversion for LogLevel enum
 */
template<>
struct convert<webblock::LogLevel> {
    static Node encode(const webblock::LogLevel& level);
    static bool decode(const Node& node, webblock::LogLevel& level);
};

/**
 * @brief YAML conversion for Config struct
 *
 * Unknown keys are rejected so that typos do not silently fall back to
 * defaults.
 */
template<>
struct convert<webblock::Config> {
    static Node encode(const webblock::Config& config);
    static bool decode(const Node& node, webblock::Config& config);
};

} // namespace YAML
