/**
 * @file command_executor.hpp
 * @brief Command execution engine for web-blocker
 * @author web-blocker Development Team
 * @date 2026
 *
 * This file contains the CommandExecutor class which provides the interface
 * for executing the iptables family of tools. It includes error handling,
 * logging, output capture, stdin feeding for iptables-restore, and
 * specialized methods for the operations the firewall backend needs.
 */

#pragma once

#include "logger.hpp"
#include "rule.hpp"
#include <string>
#include <vector>

namespace webblock {

/**
 * @struct CommandResult
 * @brief Structure representing the result of a command execution
 *
 * Contains exit status, output streams, and helper methods for result
 * analysis. Returned by all CommandExecutor methods.
 */
struct CommandResult {
    bool success = false;           ///< Whether the command executed without errors
    int exit_code = -1;             ///< Process exit code (0 = success)
    std::string stdout_output;      ///< Standard output from the command
    std::string stderr_output;      ///< Standard error output from the command
    std::string command;            ///< The actual command that was executed

    /**
     * @brief Check if the command executed successfully
     * @return true if exit code is 0 and success flag is true
     */
    bool isSuccess() const {
        return success && exit_code == 0;
    }

    /**
     * @brief Get error message if command failed
     * @return Error message string or empty string if successful
     *
     * Includes the command, exit code, and stderr output when the
     * command fails.
     */
    std::string getErrorMessage() const {
        if (isSuccess()) {
            return "";
        }

        std::string error = "Command failed: " + command;
        error += " (exit code: " + std::to_string(exit_code) + ")";

        if (!stderr_output.empty()) {
            error += "\nError output: " + stderr_output;
        }

        return error;
    }
};

/**
 * @class CommandExecutor
 * @brief Command executor with structured results and logging
 *
 * All methods are static, making the class a utility interface that can be
 * used throughout the application without instantiation. Commands are run
 * through the shell with every argument escaped.
 */
class CommandExecutor {
public:
    /**
     * @brief Execute a command given as an argument vector
     * @param args Command arguments (first is the command, rest are arguments)
     * @return CommandResult with stdout and stderr captured separately
     *
     * An empty vector yields a failed result with "No command specified".
     */
    static CommandResult execute(const std::vector<std::string>& args);

    /**
     * @brief Execute a command and write data to its standard input
     * @param args Command arguments (first is the command, rest are arguments)
     * @param input Data written to the command's stdin before it is closed
     * @return CommandResult; combined stdout/stderr is placed in stderr_output
     *
     * Used for iptables-restore, which reads its ruleset from stdin.
     */
    static CommandResult executeWithInput(const std::vector<std::string>& args,
                                          const std::string& input);

    /**
     * @brief Execute iptables or ip6tables with the given arguments
     * @param family Selects iptables (IPv4) or ip6tables (IPv6)
     * @param args Arguments without the program name
     * @return CommandResult with execution details
     *
     * Adds "-w" so the call waits for the xtables lock instead of failing
     * when another program is modifying the ruleset.
     */
    static CommandResult executeIptables(AddressFamily family,
                                         const std::vector<std::string>& args);

    /**
     * @brief Run an iptables query whose non-zero exit is an expected answer
     * @param family Selects iptables (IPv4) or ip6tables (IPv6)
     * @param args Arguments without the program name, e.g. {"-C", "OUTPUT", ...}
     * @return true if the command exited with status 0
     *
     * Failures are logged at debug level only.
     */
    static bool checkIptables(AddressFamily family, const std::vector<std::string>& args);

    /**
     * @brief Flush all rules from a chain
     * @param family Address family
     * @param table Iptables table name
     * @param chain Chain name
     * @return CommandResult with flush status
     */
    static CommandResult flushChain(AddressFamily family,
                                    const std::string& table,
                                    const std::string& chain);

    /**
     * @brief Feed a ruleset to iptables-restore without flushing other chains
     * @param family Selects iptables-restore or ip6tables-restore
     * @param payload Complete restore input, ending with COMMIT
     * @return CommandResult with restore status
     *
     * The restore tool applies each table section in a single kernel
     * transaction.
     */
    static CommandResult restore(AddressFamily family, const std::string& payload);

    /**
     * @brief Export the complete current ruleset
     * @param family Selects iptables-save or ip6tables-save
     * @return CommandResult whose stdout_output holds the saved ruleset
     */
    static CommandResult saveRuleset(AddressFamily family);

    /**
     * @brief Check if a command is available in the system PATH
     * @param command Name of the command to check
     * @return true if the command can be found
     */
    static bool isCommandAvailable(const std::string& command);

    /**
     * @brief Name of an iptables tool for the given family
     * @param family Address family
     * @param suffix "" for iptables, "-save" or "-restore" for the companions
     * @return e.g. "ip6tables-restore" for IPv6 and "-restore"
     */
    static std::string toolName(AddressFamily family, const std::string& suffix = "");

    /**
     * @brief Escape shell argument for safe execution
     * @param arg Argument string to escape
     * @return Escaped argument safe for shell execution
     *
     * Uses single quotes with proper escape handling when the argument
     * contains shell metacharacters.
     */
    static std::string escapeShellArg(const std::string& arg);

    /**
     * @brief Convert vector of arguments to command string
     * @param args Command arguments vector
     * @return Properly escaped command string
     */
    static std::string argsToCommand(const std::vector<std::string>& args);

private:
    /**
     * @brief Core execution method used by execute()
     * @param command Command string to execute
     * @param failure_level Level used to log a non-zero exit
     * @return CommandResult with execution details
     *
     * Stdout is read through popen(); stderr is redirected to a private
     * temporary file and read back once the process has exited.
     */
    static CommandResult executeInternal(const std::string& command,
                                         LogLevel failure_level = LogLevel::Error);

    /**
     * @brief Create an empty private temporary file
     * @return Path of the file, or empty string on failure
     */
    static std::string makeTempFile();

    /**
     * @brief Read a whole file and remove it
     */
    static std::string slurpAndRemove(const std::string& path);

    /**
     * @brief Decode a status returned by pclose()
     */
    static int decodeExitStatus(int status);
};

} // namespace webblock
