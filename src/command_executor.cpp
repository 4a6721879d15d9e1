#include "command_executor.hpp"
#include "logger.hpp"
#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace webblock {

namespace {

const char* const kComponent = "CommandExecutor";

void trimTrailingNewline(std::string& text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
}

} // namespace

CommandResult CommandExecutor::execute(const std::vector<std::string>& args) {
    if (args.empty()) {
        CommandResult result;
        result.success = false;
        result.exit_code = -1;
        result.stderr_output = "No command specified";
        result.command = "";
        return result;
    }

    return executeInternal(argsToCommand(args));
}

CommandResult CommandExecutor::executeWithInput(const std::vector<std::string>& args,
                                                const std::string& input) {
    CommandResult result;
    if (args.empty()) {
        result.stderr_output = "No command specified";
        return result;
    }

    result.command = argsToCommand(args);
    Logger::debug(kComponent, "Executing command with " + std::to_string(input.size()) +
                  " bytes of input: " + result.command);

    // A write-mode pipe cannot also read the child's output, so both output
    // streams are collected in a temporary file
    std::string output_path = makeTempFile();
    if (output_path.empty()) {
        result.stderr_output = "Failed to create temporary file for command output";
        Logger::error(kComponent, result.stderr_output);
        return result;
    }

    std::string shell_command = result.command + " >" + escapeShellArg(output_path) + " 2>&1";
    FILE* pipe = popen(shell_command.c_str(), "w");
    if (pipe == nullptr) {
        slurpAndRemove(output_path);
        result.stderr_output = "Failed to execute command: " + result.command;
        Logger::error(kComponent, result.stderr_output);
        return result;
    }

    std::size_t written = std::fwrite(input.data(), 1, input.size(), pipe);
    int status = pclose(pipe);

    result.exit_code = decodeExitStatus(status);
    result.stderr_output = slurpAndRemove(output_path);
    trimTrailingNewline(result.stderr_output);

    if (written != input.size() && result.exit_code == 0) {
        result.exit_code = -1;
        result.stderr_output = "Short write to command input";
    }
    result.success = (result.exit_code == 0);

    if (result.success) {
        Logger::debug(kComponent, "Command completed successfully");
    } else {
        Logger::error(kComponent, "Command failed with exit code: " + std::to_string(result.exit_code));
        if (!result.stderr_output.empty()) {
            Logger::error(kComponent, "Output: " + result.stderr_output);
        }
    }
    return result;
}

CommandResult CommandExecutor::executeIptables(AddressFamily family,
                                               const std::vector<std::string>& args) {
    std::vector<std::string> full_args = {toolName(family), "-w"};
    full_args.insert(full_args.end(), args.begin(), args.end());
    return execute(full_args);
}

bool CommandExecutor::checkIptables(AddressFamily family, const std::vector<std::string>& args) {
    std::vector<std::string> full_args = {toolName(family), "-w"};
    full_args.insert(full_args.end(), args.begin(), args.end());
    return executeInternal(argsToCommand(full_args), LogLevel::Debug).isSuccess();
}

CommandResult CommandExecutor::flushChain(AddressFamily family,
                                          const std::string& table,
                                          const std::string& chain) {
    return executeIptables(family, {"-t", table, "-F", chain});
}

CommandResult CommandExecutor::restore(AddressFamily family, const std::string& payload) {
    // --noflush keeps every chain not named in the payload untouched
    return executeWithInput({toolName(family, "-restore"), "-w", "--noflush"}, payload);
}

CommandResult CommandExecutor::saveRuleset(AddressFamily family) {
    return execute({toolName(family, "-save")});
}

bool CommandExecutor::isCommandAvailable(const std::string& command) {
    // 'command -v' is POSIX and does not depend on which(1) being installed
    std::string check = "command -v " + escapeShellArg(command) + " >/dev/null 2>&1";
    return std::system(check.c_str()) == 0;
}

std::string CommandExecutor::toolName(AddressFamily family, const std::string& suffix) {
    return (family == AddressFamily::IPv6 ? "ip6tables" : "iptables") + suffix;
}

CommandResult CommandExecutor::executeInternal(const std::string& command, LogLevel failure_level) {
    CommandResult result;
    result.command = command;

    Logger::debug(kComponent, "Executing command: " + command);

    std::string stderr_path = makeTempFile();
    if (stderr_path.empty()) {
        result.stderr_output = "Failed to create temporary file for command output";
        Logger::error(kComponent, result.stderr_output);
        return result;
    }

    std::string shell_command = command + " 2>" + escapeShellArg(stderr_path);
    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(shell_command.c_str(), "r"), pclose);
    if (!pipe) {
        slurpAndRemove(stderr_path);
        result.success = false;
        result.exit_code = -1;
        result.stderr_output = "Failed to execute command";
        Logger::error(kComponent, "Failed to create pipe for command: " + command);
        return result;
    }

    // Read stdout in fixed-size chunks
    std::array<char, 4096> buffer;
    std::string stdout_result;
    std::size_t count = 0;
    while ((count = std::fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
        stdout_result.append(buffer.data(), count);
    }

    // pclose() returns the wait status of the shell
    int status = pclose(pipe.release());
    result.exit_code = decodeExitStatus(status);
    result.success = (result.exit_code == 0);

    result.stdout_output = stdout_result;
    result.stderr_output = slurpAndRemove(stderr_path);
    trimTrailingNewline(result.stderr_output);

    if (result.success) {
        Logger::debug(kComponent, "Command completed successfully (output: " +
                      std::to_string(result.stdout_output.size()) + " bytes)");
    } else {
        Logger::log(failure_level, kComponent, "Command failed with exit code: " + std::to_string(result.exit_code));
        if (!result.stderr_output.empty()) {
            Logger::log(failure_level, kComponent, "Stderr: " + result.stderr_output);
        }
    }

    return result;
}

std::string CommandExecutor::makeTempFile() {
    const char* tmpdir = std::getenv("TMPDIR");
    std::string pattern = std::string(tmpdir != nullptr && *tmpdir != '\0' ? tmpdir : "/tmp") +
                          "/web-blocker.XXXXXX";

    std::vector<char> path(pattern.begin(), pattern.end());
    path.push_back('\0');

    int fd = mkstemp(path.data());
    if (fd < 0) {
        return "";
    }
    close(fd);
    return std::string(path.data());
}

std::string CommandExecutor::slurpAndRemove(const std::string& path) {
    std::string content;
    {
        std::ifstream file(path);
        if (file.is_open()) {
            std::ostringstream buffer;
            buffer << file.rdbuf();
            content = buffer.str();
        }
    }
    if (unlink(path.c_str()) != 0) {
        Logger::debug(kComponent, "Could not remove temporary file: " + path);
    }
    return content;
}

int CommandExecutor::decodeExitStatus(int status) {
    if (status == -1) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    // Killed by a signal; report it the way the shell does
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::string CommandExecutor::argsToCommand(const std::vector<std::string>& args) {
    if (args.empty()) {
        return "";
    }

    std::ostringstream command;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            command << " ";
        }
        command << escapeShellArg(args[i]);
    }

    return command.str();
}

std::string CommandExecutor::escapeShellArg(const std::string& arg) {
    if (arg.empty()) {
        return "''";
    }

    // If argument contains no special characters, return as-is
    if (arg.find_first_of(" \t\n\r\"'\\$`|&;<>(){}[]?*~#!") == std::string::npos) {
        return arg;
    }

    // Escape argument with single quotes
    std::string escaped = "'";
    for (char c : arg) {
        if (c == '\'') {
            escaped += "'\"'\"'";  // End quote, escaped single quote, start quote
        } else {
            escaped += c;
        }
    }
    escaped += "'";

    return escaped;
}

} // namespace webblock
