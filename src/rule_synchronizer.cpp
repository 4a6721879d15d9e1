#include "rule_synchronizer.hpp"
#include "logger.hpp"
#include <set>
#include <unordered_map>

namespace webblock {

namespace {

const char* const kComponent = "RuleSynchronizer";

std::string joinDomains(const std::vector<std::string>& domains) {
    std::string joined;
    for (const auto& domain : domains) {
        if (!joined.empty()) {
            joined += ",";
        }
        joined += domain;
    }
    return joined;
}

} // namespace

std::string syncErrorToString(SyncError error) {
    switch (error) {
        case SyncError::None:
            return "None";
        case SyncError::NoTargets:
            return "NoTargets";
        case SyncError::NoAddressesResolved:
            return "NoAddressesResolved";
        case SyncError::ApplyFailed:
            return "ApplyFailed";
        case SyncError::PersistFailed:
            return "PersistFailed";
        default:
            return "Unknown";
    }
}

std::string SyncResult::getErrorMessage() const {
    switch (error) {
        case SyncError::None:
            return "";
        case SyncError::NoTargets:
            return "No domains to block; refusing to clear the firewall chain";
        case SyncError::NoAddressesResolved:
            return "None of the " + std::to_string(warnings.size()) +
                   " domain(s) resolved to an address; firewall left unchanged";
        case SyncError::ApplyFailed:
            return "Failed to replace the firewall chain: " + detail;
        case SyncError::PersistFailed:
            return "Rules are active but could not be saved and will not survive a reboot: " + detail;
        default:
            return "Unknown synchronization error";
    }
}

RuleSynchronizer::RuleSynchronizer(const Config& config, Resolver& resolver, FirewallBackend& backend)
    : config_(config)
    , resolver_(resolver)
    , backend_(backend) {}

SyncResult RuleSynchronizer::synchronize(const std::vector<std::string>& domains) {
    SyncResult result;
    if (!resolveAll(domains, result)) {
        reportWarnings(result);
        return result;
    }

    // Step 2: replace the chain of every enabled family. A family without
    // addresses gets an empty chain so rules from earlier runs go away.
    for (AddressFamily family : enabledFamilies()) {
        RuleList rules = buildRules(result.addresses, family, config_.chain, config_.comment_tag);
        CommandResult applied = backend_.replaceChain(family, config_.chain, rules);
        if (!applied.isSuccess()) {
            result.error = SyncError::ApplyFailed;
            result.detail = applied.getErrorMessage();
            Logger::error(kComponent, result.getErrorMessage());
            reportWarnings(result);
            return result;
        }
        result.rule_count += rules.size();
    }

    Logger::info(kComponent, "Installed " + std::to_string(result.rule_count) + " rule(s) for " +
                 std::to_string(result.addresses.size()) + " address(es) in chain " + config_.chain);

    // Step 3: persist; a failure leaves the kernel state as it is
    std::string persist_errors;
    for (AddressFamily family : enabledFamilies()) {
        CommandResult saved = backend_.persist(family, rulesFileFor(family));
        if (!saved.isSuccess()) {
            if (!persist_errors.empty()) {
                persist_errors += "; ";
            }
            persist_errors += saved.getErrorMessage();
        }
    }
    if (!persist_errors.empty()) {
        result.error = SyncError::PersistFailed;
        result.detail = persist_errors;
        Logger::error(kComponent, result.getErrorMessage());
    }

    reportWarnings(result);
    return result;
}

SyncResult RuleSynchronizer::preview(const std::vector<std::string>& domains, RuleList& rules) {
    SyncResult result;
    rules.clear();
    if (resolveAll(domains, result)) {
        for (AddressFamily family : enabledFamilies()) {
            RuleList family_rules = buildRules(result.addresses, family, config_.chain, config_.comment_tag);
            rules.insert(rules.end(), family_rules.begin(), family_rules.end());
        }
        result.rule_count = rules.size();
    }
    reportWarnings(result);
    return result;
}

RuleList RuleSynchronizer::buildRules(const std::vector<ResolvedAddress>& addresses,
                                      AddressFamily family,
                                      const std::string& chain,
                                      const std::string& comment_tag) {
    RuleList rules;
    for (const auto& resolved : addresses) {
        if (resolved.family != family) {
            continue;
        }
        std::string comment = comment_tag;
        if (!resolved.domains.empty()) {
            comment += (comment.empty() ? "" : ":") + joinDomains(resolved.domains);
        }
        for (Protocol protocol : blockedProtocols()) {
            rules.push_back(std::make_shared<DropRule>(chain, resolved.address, family, protocol, comment));
        }
    }
    return rules;
}

bool RuleSynchronizer::resolveAll(const std::vector<std::string>& domains, SyncResult& result) {
    std::vector<std::string> targets;
    std::set<std::string> seen;
    for (const auto& domain : domains) {
        if (!domain.empty() && seen.insert(domain).second) {
            targets.push_back(domain);
        }
    }

    if (targets.empty()) {
        result.error = SyncError::NoTargets;
        Logger::error(kComponent, result.getErrorMessage());
        return false;
    }

    Logger::info(kComponent, "Resolving " + std::to_string(targets.size()) + " domain(s)");

    std::unordered_map<std::string, std::size_t> index;
    for (const auto& domain : targets) {
        ResolveResult resolved = resolver_.resolve(domain);

        std::size_t usable = 0;
        for (const auto& host : resolved.addresses) {
            if (host.family == AddressFamily::IPv6 && !config_.ipv6) {
                continue;
            }
            ++usable;

            auto found = index.find(host.address);
            if (found == index.end()) {
                index.emplace(host.address, result.addresses.size());
                result.addresses.push_back(ResolvedAddress{host.address, host.family, {domain}});
            } else {
                auto& owners = result.addresses[found->second].domains;
                if (owners.empty() || owners.back() != domain) {
                    owners.push_back(domain);
                }
            }
        }

        if (!resolved.isSuccess() || usable == 0) {
            std::string reason = resolved.error.empty() ? "no usable addresses returned" : resolved.error;
            result.warnings.push_back(ResolutionWarning{domain, reason});
            Logger::debug(kComponent, "Could not resolve " + domain + ": " + reason);
            continue;
        }

        Logger::debug(kComponent, domain + ": " + std::to_string(usable) + " address(es)");
    }

    if (result.addresses.empty()) {
        result.error = SyncError::NoAddressesResolved;
        Logger::error(kComponent, result.getErrorMessage());
        return false;
    }
    return true;
}

std::vector<AddressFamily> RuleSynchronizer::enabledFamilies() const {
    if (config_.ipv6) {
        return {AddressFamily::IPv4, AddressFamily::IPv6};
    }
    return {AddressFamily::IPv4};
}

const std::string& RuleSynchronizer::rulesFileFor(AddressFamily family) const {
    return family == AddressFamily::IPv6 ? config_.rules_file_v6 : config_.rules_file;
}

void RuleSynchronizer::reportWarnings(const SyncResult& result) const {
    if (result.warnings.empty()) {
        return;
    }
    Logger::warning(kComponent, std::to_string(result.warnings.size()) + " domain(s) could not be resolved:");
    for (const auto& warning : result.warnings) {
        Logger::warning(kComponent, "  " + warning.domain + ": " + warning.reason);
    }
}

} // namespace webblock
