/**
 * @file rule.hpp
 * @brief Base rule class and common enumerations for web-blocker
 * @author web-blocker Development Team
 * @date 2026
 *
 * This file contains the abstract Rule base class, the DropRule used to
 * block traffic towards a resolved address, and the enumerations shared
 * by the firewall layer.
 */

#pragma once

#include <string>
#include <vector>

namespace webblock {

/**
 * @enum Protocol
 * @brief Network protocols blocked per address
 */
enum class Protocol {
    Tcp, ///< TCP protocol
    Udp  ///< UDP protocol
};

/**
 * @enum AddressFamily
 * @brief IP family of an address, selects iptables or ip6tables
 */
enum class AddressFamily {
    IPv4, ///< Handled by iptables
    IPv6  ///< Handled by ip6tables
};

/// Protocols a blocked address receives rules for, in insertion order
const std::vector<Protocol>& blockedProtocols();

std::string protocolToString(Protocol protocol);
std::string familyToString(AddressFamily family);

/**
 * @class Rule
 * @brief Abstract base class for firewall rules
 *
 * A Rule knows the chain and address family it belongs to and the comment
 * attached to it. Derived classes provide the match part of the rule;
 * the base class assembles full iptables argument vectors and the
 * iptables-restore line from it.
 */
class Rule {
public:
    virtual ~Rule() = default;

    /**
     * @brief Build the match and target arguments for this rule
     * @return Arguments without the "-A CHAIN" prefix
     *
     * Shared by the sequential backend (prepends "-A CHAIN") and the
     * transaction backend (renders a restore line).
     */
    virtual std::vector<std::string> buildRuleSpec() const = 0;

    /**
     * @brief Short human-readable description, e.g. "DROP out tcp dst=1.2.3.4"
     */
    virtual std::string describe() const = 0;

    /**
     * @brief Build the complete iptables argument vector for appending this rule
     * @return Arguments for iptables/ip6tables, without the program name
     */
    std::vector<std::string> buildIptablesCommand() const;

    /**
     * @brief Render the rule as a line of iptables-restore input
     * @return Line like "-A OUTPUT -d 1.2.3.4 -p tcp ... -j DROP"
     */
    std::string toRestoreLine() const;

    const std::string& getChain() const { return chain_; }
    AddressFamily getFamily() const { return family_; }
    const std::string& getComment() const { return comment_; }

protected:
    /**
     * @brief Protected constructor for derived classes
     * @param chain Chain the rule is appended to
     * @param family Address family (selects iptables or ip6tables)
     * @param comment Comment attached with the comment match module
     */
    Rule(std::string chain, AddressFamily family, std::string comment);

    /**
     * @brief Add comment arguments to an iptables command
     * @param args Reference to argument vector to modify
     *
     * Does nothing when the comment is empty.
     */
    void addCommentArgs(std::vector<std::string>& args) const;

    std::string chain_;       ///< Target chain
    AddressFamily family_;    ///< Address family
    std::string comment_;     ///< Sanitized rule comment
};

/**
 * @class DropRule
 * @brief Drops outbound TCP or UDP traffic to one destination address
 */
class DropRule : public Rule {
public:
    /**
     * @brief Construct a drop rule
     * @param chain Chain the rule is appended to
     * @param address Destination address in textual form
     * @param family Address family of the destination
     * @param protocol Protocol to match
     * @param comment Comment naming what the rule blocks (sanitized and truncated)
     */
    DropRule(const std::string& chain,
             const std::string& address,
             AddressFamily family,
             Protocol protocol,
             const std::string& comment = "");

    std::vector<std::string> buildRuleSpec() const override;
    std::string describe() const override;

    const std::string& getAddress() const { return address_; }
    Protocol getProtocol() const { return protocol_; }

private:
    std::string address_;  ///< Destination address
    Protocol protocol_;    ///< Matched protocol
};

/**
 * @brief Make a string safe for use as an iptables comment
 * @param comment Raw comment text
 * @return Comment restricted to [A-Za-z0-9._:,-] and at most 255 bytes
 */
std::string sanitizeComment(const std::string& comment);

} // namespace webblock
