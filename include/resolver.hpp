/**
 * @file resolver.hpp
 * @brief Forward DNS resolution of blocked domains
 * @author web-blocker Development Team
 * @date 2026
 *
 * This file contains the Resolver interface used by the synchronizer and
 * SystemResolver, which performs A/AAAA lookups through the system
 * resolver with a per-domain timeout.
 */

#pragma once

#include "rule.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace webblock {

/**
 * @struct HostAddress
 * @brief One address returned by a lookup
 */
struct HostAddress {
    std::string address;   ///< Textual address, e.g. "93.184.216.34" or "2606:2800::1"
    AddressFamily family;  ///< Address family

    bool operator==(const HostAddress& other) const {
        return address == other.address && family == other.family;
    }
};

/**
 * @struct ResolveResult
 * @brief Outcome of resolving one domain
 */
struct ResolveResult {
    bool success = false;                ///< Lookup completed without error
    std::vector<HostAddress> addresses;  ///< Distinct addresses in resolver order
    std::string error;                   ///< Reason for failure, empty on success

    /**
     * @brief Check if the lookup produced at least one address
     */
    bool isSuccess() const {
        return success && !addresses.empty();
    }

    static ResolveResult failure(const std::string& reason) {
        ResolveResult result;
        result.error = reason;
        return result;
    }
};

/**
 * @class Resolver
 * @brief Abstract forward resolver
 */
class Resolver {
public:
    virtual ~Resolver() = default;

    /**
     * @brief Resolve a domain to its addresses
     * @param domain Host name to look up
     * @return ResolveResult; failures are reported in the result, never thrown
     */
    virtual ResolveResult resolve(const std::string& domain) = 0;
};

/**
 * @class SystemResolver
 * @brief Resolver backed by the system's getaddrinfo configuration
 *
 * Uses glibc's asynchronous getaddrinfo_a() so that a hung lookup can be
 * abandoned after the configured timeout instead of blocking the run.
 */
class SystemResolver : public Resolver {
public:
    /**
     * @brief Construct a resolver
     * @param timeout Upper bound for a single domain lookup
     * @param include_ipv6 Also return AAAA results
     */
    SystemResolver(std::chrono::milliseconds timeout, bool include_ipv6);

    ResolveResult resolve(const std::string& domain) override;

private:
    std::chrono::milliseconds timeout_;
    bool include_ipv6_;
};

} // namespace webblock
