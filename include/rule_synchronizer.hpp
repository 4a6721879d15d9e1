/**
 * @file rule_synchronizer.hpp
 * @brief Synchronization of a firewall chain with a list of blocked domains
 * @author web-blocker Development Team
 * @date 2026
 *
 * This file contains the RuleSynchronizer, which resolves a set of domains,
 * replaces the contents of the owned firewall chain with DROP rules for the
 * resulting addresses, and persists the complete ruleset so that it
 * survives a reboot.
 */

#pragma once

#include "config.hpp"
#include "firewall_backend.hpp"
#include "resolver.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace webblock {

/**
 * @enum SyncError
 * @brief Fatal outcomes of a synchronization run
 */
enum class SyncError {
    None,                ///< Run completed
    NoTargets,           ///< Empty domain set; nothing was touched
    NoAddressesResolved, ///< No domain resolved; nothing was touched
    ApplyFailed,         ///< The chain could not be replaced; nothing was persisted
    PersistFailed        ///< Chain replaced, but the rules file could not be written
};

std::string syncErrorToString(SyncError error);

/**
 * @struct ResolutionWarning
 * @brief A domain that yielded no address; not fatal on its own
 */
struct ResolutionWarning {
    std::string domain;  ///< Domain that failed
    std::string reason;  ///< Resolver error text
};

/**
 * @struct ResolvedAddress
 * @brief A distinct address to block and the domains that map to it
 */
struct ResolvedAddress {
    std::string address;               ///< Textual address
    AddressFamily family;              ///< Address family
    std::vector<std::string> domains;  ///< Domains resolving to this address, in input order
};

/**
 * @struct SyncResult
 * @brief Outcome of RuleSynchronizer::synchronize()
 *
 * rule_count is the number of rules placed in the chain. It is also set
 * when the run fails with PersistFailed, because those rules are active.
 */
struct SyncResult {
    SyncError error = SyncError::None;           ///< None on success
    std::size_t rule_count = 0;                  ///< Rules in the chain after the run
    std::vector<ResolvedAddress> addresses;      ///< De-duplicated addresses, first-seen order
    std::vector<ResolutionWarning> warnings;     ///< Domains that did not resolve
    std::string detail;                          ///< Backend error text for ApplyFailed/PersistFailed

    bool isSuccess() const {
        return error == SyncError::None;
    }

    /**
     * @brief Get a human-readable description of the failure
     * @return Error message or empty string if successful
     */
    std::string getErrorMessage() const;
};

/**
 * @class RuleSynchronizer
 * @brief Replaces the owned chain with DROP rules for a domain set
 *
 * A run has three steps:
 * 1. every domain is resolved; failures become warnings;
 * 2. for each enabled address family the chain is replaced with one TCP
 *    and one UDP DROP rule per address, in address-then-protocol order;
 * 3. the complete ruleset of each family is written to its rules file.
 *
 * The firewall is not touched unless step 1 produced at least one address.
 * A persistence failure does not undo step 2. Running twice with the same
 * addresses leaves the same chain behind.
 */
class RuleSynchronizer {
public:
    /**
     * @brief Construct a synchronizer
     * @param config Chain, rules files, families and comment tag to use
     * @param resolver Resolver used in step 1
     * @param backend Firewall used in steps 2 and 3
     *
     * The resolver and backend must outlive the synchronizer.
     */
    RuleSynchronizer(const Config& config, Resolver& resolver, FirewallBackend& backend);

    /**
     * @brief Synchronize the chain with a domain set
     * @param domains Domains to block; duplicates are ignored
     * @return SyncResult with the rule count or the error
     */
    SyncResult synchronize(const std::vector<std::string>& domains);

    /**
     * @brief Resolve the domains and compute the rules without touching the firewall
     * @param domains Domains to block
     * @param rules Receives the rules that synchronize() would install
     * @return SyncResult; only NoTargets and NoAddressesResolved can occur
     */
    SyncResult preview(const std::vector<std::string>& domains, RuleList& rules);

    /**
     * @brief Build the chain contents for one address family
     * @param addresses Resolved addresses; other families are skipped
     * @param family Family to build rules for
     * @param chain Chain the rules belong to
     * @param comment_tag Prefix of each rule's comment
     * @return Two rules per address, TCP then UDP
     */
    static RuleList buildRules(const std::vector<ResolvedAddress>& addresses,
                               AddressFamily family,
                               const std::string& chain,
                               const std::string& comment_tag);

private:
    /**
     * @brief Step 1: resolve domains into result.addresses and result.warnings
     * @return false with result.error set if the run cannot proceed
     */
    bool resolveAll(const std::vector<std::string>& domains, SyncResult& result);

    std::vector<AddressFamily> enabledFamilies() const;
    const std::string& rulesFileFor(AddressFamily family) const;
    void reportWarnings(const SyncResult& result) const;

    Config config_;
    Resolver& resolver_;
    FirewallBackend& backend_;
};

} // namespace webblock
