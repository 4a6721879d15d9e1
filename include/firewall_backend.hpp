/**
 * @file firewall_backend.hpp
 * @brief Firewall control surface used by the rule synchronizer
 * @author web-blocker Development Team
 * @date 2026
 *
 * This file contains the FirewallBackend interface and IptablesBackend,
 * its implementation on top of the iptables command line tools.
 */

#pragma once

#include "command_executor.hpp"
#include "config.hpp"
#include "rule.hpp"
#include <memory>
#include <string>
#include <vector>

namespace webblock {

using RuleList = std::vector<std::shared_ptr<Rule>>;

/**
 * @class FirewallBackend
 * @brief Abstract packet-filter operations needed to synchronize a chain
 */
class FirewallBackend {
public:
    virtual ~FirewallBackend() = default;

    /**
     * @brief Replace every rule of a chain with the given rules
     * @param family Address family whose ruleset is modified
     * @param chain Chain to replace
     * @param rules New chain contents in order; may be empty
     * @return CommandResult describing the outcome
     */
    virtual CommandResult replaceChain(AddressFamily family,
                                       const std::string& chain,
                                       const RuleList& rules) = 0;

    /**
     * @brief Export the complete ruleset of a family to a file
     * @param family Address family to export
     * @param path Destination file, overwritten
     * @return CommandResult describing the outcome
     */
    virtual CommandResult persist(AddressFamily family, const std::string& path) = 0;
};

/**
 * @class IptablesBackend
 * @brief FirewallBackend driving iptables and ip6tables
 *
 * In ApplyMode::Transaction the flush and all appends are fed to
 * iptables-restore --noflush as one table commit, so the chain is never
 * observed empty. In ApplyMode::Sequential the chain is flushed with
 * iptables -F and rules are appended one by one; between the flush and the
 * last append the chain is incomplete, and a failed append leaves it that
 * way.
 *
 * A chain other than the built-in OUTPUT chain is created when missing and
 * reached through a jump rule at the top of OUTPUT.
 *
 * A missing iptables-restore or iptables-save is reported as a failed
 * result before the chain is touched.
 */
class IptablesBackend : public FirewallBackend {
public:
    explicit IptablesBackend(ApplyMode mode);

    CommandResult replaceChain(AddressFamily family,
                               const std::string& chain,
                               const RuleList& rules) override;

    CommandResult persist(AddressFamily family, const std::string& path) override;

    /**
     * @brief Build the iptables-restore input that replaces a chain
     * @param chain Chain to replace
     * @param rules New chain contents
     * @return Filter table section ending with COMMIT
     *
     * Custom chains are declared so that they are created if missing.
     * Built-in chains are not declared, because a declaration would also
     * reset their policy.
     */
    static std::string buildRestorePayload(const std::string& chain, const RuleList& rules);

    /**
     * @brief Write a saved ruleset to a file through a temporary sibling
     * @param content Ruleset text
     * @param path Destination file
     * @return Empty string on success, error description otherwise
     *
     * Missing parent directories are created. The old file is replaced by
     * rename(), so readers see either the old or the new ruleset.
     */
    static std::string writeRulesFile(const std::string& content, const std::string& path);

private:
    CommandResult replaceWithRestore(AddressFamily family,
                                     const std::string& chain,
                                     const RuleList& rules);
    CommandResult replaceSequentially(AddressFamily family,
                                      const std::string& chain,
                                      const RuleList& rules);

    /**
     * @brief Create a custom chain if it does not exist yet
     */
    CommandResult ensureChainExists(AddressFamily family, const std::string& chain);

    /**
     * @brief Make OUTPUT jump to a custom chain if it does not already
     */
    CommandResult ensureJumpFromOutput(AddressFamily family, const std::string& chain);

    ApplyMode mode_;
};

} // namespace webblock
