/**
 * @file cli_parser.hpp
 * @brief Command line argument parsing for web-blocker
 * @author web-blocker Development Team
 * @date 2026
 *
 * This file contains the CLIParser class responsible for parsing and validating
 * command line arguments for the web-blocker application.
 */

#pragma once

#include <optional>
#include <string>

namespace webblock {

/**
 * @class CLIParser
 * @brief Command line interface parser for web-blocker
 *
 * The CLIParser class provides static methods for parsing command line
 * arguments and displaying help information. It uses getopt_long and
 * supports long and short option formats.
 */
class CLIParser {
public:
    /**
     * @struct Options
     * @brief Container for parsed command line options
     */
    struct Options {
        std::optional<std::string> config_file;   ///< YAML configuration file
        std::optional<std::string> domains_file;  ///< Overrides domains_file from the configuration
        bool dry_run = false;                     ///< Resolve and print rules only
        bool verbose = false;                     ///< Debug logging
        bool quiet = false;                       ///< Errors only
        bool help = false;                        ///< Display help information
    };

    /**
     * @brief Parse command line arguments into Options structure
     * @param argc Number of command line arguments
     * @param argv Array of command line argument strings
     * @return Parsed options structure
     * @throws std::invalid_argument if argument parsing or validation fails
     */
    static Options parse(int argc, char* argv[]);

    /**
     * @brief Print usage information to stdout
     * @param program_name Name of the program executable
     */
    static void printUsage(const std::string& program_name);

private:
    /**
     * @brief Validate parsed options for logical consistency
     * @param options The options structure to validate
     * @throws std::invalid_argument if options are inconsistent
     */
    static void validateOptions(const Options& options);
};

} // namespace webblock
