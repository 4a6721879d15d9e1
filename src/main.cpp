#include <chrono>
#include <iostream>
#include <string>
#include <vector>
#include "cli_parser.hpp"
#include "command_executor.hpp"
#include "config_parser.hpp"
#include "domain_list.hpp"
#include "firewall_backend.hpp"
#include "logger.hpp"
#include "resolver.hpp"
#include "rule_synchronizer.hpp"
#include "run_lock.hpp"

namespace {

void printSummary(const webblock::SyncResult& result, const std::vector<std::string>& domains) {
    std::cout << "Blocked " << result.addresses.size() << " address(es) with "
              << result.rule_count << " rule(s). Sites:";
    for (const auto& domain : domains) {
        std::cout << " " << domain;
    }
    std::cout << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        auto options = webblock::CLIParser::parse(argc, argv);

        if (options.help) {
            webblock::CLIParser::printUsage(argv[0]);
            return 0;
        }

        // A configuration file given explicitly must exist; the default one may not
        webblock::Config config = options.config_file
            ? webblock::ConfigParser::loadFromFile(*options.config_file)
            : webblock::ConfigParser::loadOptional(webblock::ConfigParser::kDefaultConfigPath);

        // Only the built-in default domain file may be absent
        bool use_default_domains = !options.domains_file &&
                                   config.domains_file == webblock::Config().domains_file;
        if (options.domains_file) {
            config.domains_file = *options.domains_file;
        }

        webblock::Logger::setLevel(config.log_level);
        if (options.verbose) {
            webblock::Logger::setLevel(webblock::LogLevel::Debug);
        } else if (options.quiet) {
            webblock::Logger::setLevel(webblock::LogLevel::Error);
        }

        auto domains = webblock::DomainList::expand(
            webblock::DomainList::load(config.domains_file, use_default_domains), config.subdomain_prefixes);

        webblock::SystemResolver resolver(std::chrono::milliseconds(config.resolve_timeout_ms), config.ipv6);
        webblock::IptablesBackend backend(config.apply_mode);
        webblock::RuleSynchronizer synchronizer(config, resolver, backend);

        if (options.dry_run) {
            webblock::RuleList rules;
            auto result = synchronizer.preview(domains, rules);
            if (!result.isSuccess()) {
                std::cerr << "Error: " << result.getErrorMessage() << std::endl;
                return 1;
            }
            for (const auto& rule : rules) {
                std::cout << webblock::CommandExecutor::toolName(rule->getFamily()) << " "
                          << rule->toRestoreLine() << std::endl;
            }
            std::cout << "Dry run: " << rules.size() << " rule(s) computed, firewall not modified." << std::endl;
            return 0;
        }

        // Held until the end of the run
        webblock::RunLock lock(config.lock_file);

        auto result = synchronizer.synchronize(domains);
        if (!result.isSuccess()) {
            std::cerr << "Error: " << result.getErrorMessage() << std::endl;
            return 1;
        }

        printSummary(result, domains);
        return 0;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Use --help for usage information." << std::endl;
        return 1;
    } catch (const std::runtime_error& e) {
        // Configuration, domain file and lock errors
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
