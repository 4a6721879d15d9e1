#include "cli_parser.hpp"
#include <getopt.h>
#include <iostream>
#include <stdexcept>

namespace webblock {

CLIParser::Options CLIParser::parse(int argc, char* argv[]) {
    Options options;

    // Long options for getopt_long; both -c FILE and --config FILE are accepted
    static struct option long_options[] = {
        {"config",  required_argument, 0, 'c'},  // YAML configuration file
        {"sites",   required_argument, 0, 's'},  // Domain list file
        {"dry-run", no_argument,       0, 'n'},  // Resolve and print, leave the firewall alone
        {"verbose", no_argument,       0, 'v'},  // Debug logging
        {"quiet",   no_argument,       0, 'q'},  // Errors only
        {"help",    no_argument,       0, 'h'},  // Show usage help
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;

    // glibc reinitializes getopt when optind is 0, so parse() can run more than once
    optind = 0;
    opterr = 1;

    // The leading '+' stops at the first non-option argument
    while ((c = getopt_long(argc, argv, "+c:s:nvqh", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                options.config_file = std::string(optarg);
                break;
            case 's':
                options.domains_file = std::string(optarg);
                break;
            case 'n':
                options.dry_run = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'h':
                options.help = true;
                break;
            case '?':
                // getopt_long has already printed the reason to stderr
                throw std::invalid_argument("Unknown option or missing option argument");
            default:
                throw std::invalid_argument("Invalid argument parsing");
        }
    }

    // The run takes no positional arguments; domains come from the domain file
    if (optind < argc) {
        throw std::invalid_argument("Unexpected argument: " + std::string(argv[optind]));
    }

    validateOptions(options);

    return options;
}

void CLIParser::validateOptions(const Options& options) {
    if (options.verbose && options.quiet) {
        throw std::invalid_argument("--verbose conflicts with --quiet");
    }
    if (options.config_file && options.config_file->empty()) {
        throw std::invalid_argument("--config requires a non-empty path");
    }
    if (options.domains_file && options.domains_file->empty()) {
        throw std::invalid_argument("--sites requires a non-empty path");
    }
}

void CLIParser::printUsage(const std::string& program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Block a list of domains by dropping outbound traffic to their addresses\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE  YAML configuration (default /etc/web-blocker/config.yaml)\n";
    std::cout << "  -s, --sites FILE   Domain list, one domain per line\n";
    std::cout << "  -n, --dry-run      Resolve and print the rules without changing the firewall\n";
    std::cout << "  -v, --verbose      Debug output\n";
    std::cout << "  -q, --quiet        Only report errors\n";
    std::cout << "  -h, --help         Show this help message\n\n";
    std::cout << "Exit status is 0 on success and 1 on any failure.\n";
}

} // namespace webblock
