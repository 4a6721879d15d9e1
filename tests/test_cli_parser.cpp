#include "cli_parser.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace webblock;

namespace {

// getopt_long may permute argv, so each call gets its own writable copy
CLIParser::Options parseArgs(std::vector<std::string> args) {
    args.insert(args.begin(), "web-blocker");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);
    return CLIParser::parse(static_cast<int>(args.size()), argv.data());
}

} // namespace

TEST(CLIParserTest, DefaultsWithoutArguments) {
    auto options = parseArgs({});

    EXPECT_FALSE(options.config_file.has_value());
    EXPECT_FALSE(options.domains_file.has_value());
    EXPECT_FALSE(options.dry_run);
    EXPECT_FALSE(options.verbose);
    EXPECT_FALSE(options.quiet);
    EXPECT_FALSE(options.help);
}

TEST(CLIParserTest, LongOptions) {
    auto options = parseArgs({"--config", "/tmp/c.yaml", "--sites", "/tmp/sites.conf", "--dry-run", "--verbose"});

    EXPECT_EQ(options.config_file.value(), "/tmp/c.yaml");
    EXPECT_EQ(options.domains_file.value(), "/tmp/sites.conf");
    EXPECT_TRUE(options.dry_run);
    EXPECT_TRUE(options.verbose);
}

TEST(CLIParserTest, ShortOptions) {
    auto options = parseArgs({"-c", "/tmp/c.yaml", "-s", "/tmp/sites.conf", "-n", "-q"});

    EXPECT_EQ(options.config_file.value(), "/tmp/c.yaml");
    EXPECT_EQ(options.domains_file.value(), "/tmp/sites.conf");
    EXPECT_TRUE(options.dry_run);
    EXPECT_TRUE(options.quiet);
}

TEST(CLIParserTest, Help) {
    EXPECT_TRUE(parseArgs({"-h"}).help);
    EXPECT_TRUE(parseArgs({"--help"}).help);
}

TEST(CLIParserTest, VerboseConflictsWithQuiet) {
    EXPECT_THROW(parseArgs({"-v", "-q"}), std::invalid_argument);
}

TEST(CLIParserTest, RejectsPositionalArguments) {
    EXPECT_THROW(parseArgs({"example.com"}), std::invalid_argument);
}

TEST(CLIParserTest, RejectsUnknownOption) {
    EXPECT_THROW(parseArgs({"--flush-all"}), std::invalid_argument);
}

TEST(CLIParserTest, RejectsMissingOptionArgument) {
    EXPECT_THROW(parseArgs({"--config"}), std::invalid_argument);
}

TEST(CLIParserTest, RejectsEmptyPath) {
    EXPECT_THROW(parseArgs({"--sites", ""}), std::invalid_argument);
}
