#include "firewall_backend.hpp"
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace webblock {

namespace {

const char* const kComponent = "IptablesBackend";
const char* const kTable = "filter";

bool isOutputChain(const std::string& chain) {
    return chain == "OUTPUT";
}

CommandResult failedResult(const std::string& command, const std::string& error) {
    CommandResult result;
    result.success = false;
    result.exit_code = -1;
    result.command = command;
    result.stderr_output = error;
    return result;
}

// Empty string if the tool is on PATH, otherwise the reason it cannot be used
std::string missingTool(const std::string& tool, const std::string& hint) {
    if (CommandExecutor::isCommandAvailable(tool)) {
        return "";
    }
    return tool + " not found in PATH" + hint;
}

CommandResult succeededResult(const std::string& command) {
    CommandResult result;
    result.success = true;
    result.exit_code = 0;
    result.command = command;
    return result;
}

} // namespace

IptablesBackend::IptablesBackend(ApplyMode mode)
    : mode_(mode) {}

CommandResult IptablesBackend::replaceChain(AddressFamily family,
                                            const std::string& chain,
                                            const RuleList& rules) {
    Logger::info(kComponent, "Replacing " + CommandExecutor::toolName(family) + " chain " + chain +
                 " with " + std::to_string(rules.size()) + " rule(s) (" + applyModeToString(mode_) + ")");

    CommandResult result = mode_ == ApplyMode::Transaction
        ? replaceWithRestore(family, chain, rules)
        : replaceSequentially(family, chain, rules);
    if (!result.isSuccess()) {
        return result;
    }

    if (!isOutputChain(chain)) {
        return ensureJumpFromOutput(family, chain);
    }
    return result;
}

CommandResult IptablesBackend::persist(AddressFamily family, const std::string& path) {
    std::string missing = missingTool(CommandExecutor::toolName(family, "-save"), "");
    if (!missing.empty()) {
        return failedResult(CommandExecutor::toolName(family, "-save"), missing);
    }

    CommandResult saved = CommandExecutor::saveRuleset(family);
    if (!saved.isSuccess()) {
        return saved;
    }
    if (saved.stdout_output.empty()) {
        return failedResult(saved.command, "ruleset export produced no output");
    }

    std::string error = writeRulesFile(saved.stdout_output, path);
    if (!error.empty()) {
        return failedResult(saved.command + " > " + path, error);
    }

    Logger::info(kComponent, "Saved " + familyToString(family) + " ruleset to " + path);
    return succeededResult(saved.command + " > " + path);
}

std::string IptablesBackend::buildRestorePayload(const std::string& chain, const RuleList& rules) {
    std::ostringstream payload;
    payload << "*" << kTable << "\n";
    if (!Config::isBuiltinChain(chain)) {
        payload << ":" << chain << " - [0:0]\n";
    }
    payload << "-F " << chain << "\n";
    for (const auto& rule : rules) {
        payload << rule->toRestoreLine() << "\n";
    }
    payload << "COMMIT\n";
    return payload.str();
}

std::string IptablesBackend::writeRulesFile(const std::string& content, const std::string& path) {
    namespace fs = std::filesystem;

    fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return "cannot create directory " + target.parent_path().string() + ": " + ec.message();
        }
    }

    fs::path temp = target;
    temp += ".tmp." + std::to_string(getpid());

    {
        std::ofstream file(temp, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            return "unable to open " + temp.string() + " for writing";
        }
        file << content;
        if (!content.empty() && content.back() != '\n') {
            file << '\n';
        }
        file.flush();
        if (!file) {
            file.close();
            fs::remove(temp, ec);
            return "error writing " + temp.string();
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::string error = "cannot replace " + path + ": " + ec.message();
        std::error_code ignored;
        fs::remove(temp, ignored);
        return error;
    }
    return "";
}

CommandResult IptablesBackend::replaceWithRestore(AddressFamily family,
                                                  const std::string& chain,
                                                  const RuleList& rules) {
    std::string tool = CommandExecutor::toolName(family, "-restore");
    std::string missing = missingTool(tool, "; install it or set apply_mode: sequential");
    if (!missing.empty()) {
        Logger::error(kComponent, missing);
        return failedResult(tool, missing);
    }

    std::string payload = buildRestorePayload(chain, rules);
    Logger::debug(kComponent, "Restore payload:\n" + payload);
    return CommandExecutor::restore(family, payload);
}

CommandResult IptablesBackend::replaceSequentially(AddressFamily family,
                                                   const std::string& chain,
                                                   const RuleList& rules) {
    if (!Config::isBuiltinChain(chain)) {
        CommandResult created = ensureChainExists(family, chain);
        if (!created.isSuccess()) {
            return created;
        }
    }

    CommandResult result = CommandExecutor::flushChain(family, kTable, chain);
    if (!result.isSuccess()) {
        return result;
    }

    // From here until the last append the chain is incomplete
    for (const auto& rule : rules) {
        std::vector<std::string> args = {"-t", kTable};
        auto command = rule->buildIptablesCommand();
        args.insert(args.end(), command.begin(), command.end());

        result = CommandExecutor::executeIptables(family, args);
        if (!result.isSuccess()) {
            Logger::error(kComponent, "Failed to append rule: " + rule->describe());
            return result;
        }
    }

    return result;
}

CommandResult IptablesBackend::ensureChainExists(AddressFamily family, const std::string& chain) {
    // -S exits non-zero when the chain does not exist
    if (CommandExecutor::checkIptables(family, {"-t", kTable, "-S", chain})) {
        return succeededResult("chain " + chain + " exists");
    }

    Logger::info(kComponent, "Creating chain " + chain);
    return CommandExecutor::executeIptables(family, {"-t", kTable, "-N", chain});
}

CommandResult IptablesBackend::ensureJumpFromOutput(AddressFamily family, const std::string& chain) {
    // -C exits non-zero when no identical rule exists
    if (CommandExecutor::checkIptables(family, {"-t", kTable, "-C", "OUTPUT", "-j", chain})) {
        return succeededResult("jump to " + chain + " present");
    }

    Logger::info(kComponent, "Linking chain " + chain + " from OUTPUT");
    return CommandExecutor::executeIptables(family, {"-t", kTable, "-I", "OUTPUT", "1", "-j", chain});
}

} // namespace webblock
