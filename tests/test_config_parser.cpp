#include "config_parser.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace webblock;

class ConfigParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setLevel(LogLevel::None);
    }
};

TEST_F(ConfigParserTest, EmptyDocumentKeepsDefaults) {
    Config config = ConfigParser::loadFromString("");

    EXPECT_EQ(config.chain, "OUTPUT");
    EXPECT_EQ(config.apply_mode, ApplyMode::Transaction);
    EXPECT_FALSE(config.ipv6);
    EXPECT_EQ(config.rules_file, "/etc/iptables/rules.v4");
    EXPECT_EQ(config.resolve_timeout_ms, 5000u);
    EXPECT_EQ(config.lock_file, "/run/web-blocker.lock");
    EXPECT_TRUE(config.subdomain_prefixes.empty());
    EXPECT_EQ(config.log_level, LogLevel::Info);
}

TEST_F(ConfigParserTest, ParsesAllKeys) {
    const std::string yaml = R"(
domains_file: /srv/sites.conf
chain: WEB_BLOCKER
apply_mode: sequential
ipv6: true
rules_file: /var/lib/fw/rules.v4
rules_file_v6: /var/lib/fw/rules.v6
resolve_timeout_ms: 1500
lock_file: /tmp/wb.lock
subdomain_prefixes: [www, api]
comment_tag: blocked
log_level: debug
)";

    Config config = ConfigParser::loadFromString(yaml);

    EXPECT_EQ(config.domains_file, "/srv/sites.conf");
    EXPECT_EQ(config.chain, "WEB_BLOCKER");
    EXPECT_EQ(config.apply_mode, ApplyMode::Sequential);
    EXPECT_TRUE(config.ipv6);
    EXPECT_EQ(config.rules_file, "/var/lib/fw/rules.v4");
    EXPECT_EQ(config.rules_file_v6, "/var/lib/fw/rules.v6");
    EXPECT_EQ(config.resolve_timeout_ms, 1500u);
    EXPECT_EQ(config.lock_file, "/tmp/wb.lock");
    EXPECT_EQ(config.subdomain_prefixes, (std::vector<std::string>{"www", "api"}));
    EXPECT_EQ(config.comment_tag, "blocked");
    EXPECT_EQ(config.log_level, LogLevel::Debug);
}

TEST_F(ConfigParserTest, RejectsUnknownKey) {
    EXPECT_THROW(ConfigParser::loadFromString("chian: OUTPUT\n"), std::runtime_error);
}

TEST_F(ConfigParserTest, RejectsUnknownApplyMode) {
    EXPECT_THROW(ConfigParser::loadFromString("apply_mode: atomic\n"), std::runtime_error);
}

TEST_F(ConfigParserTest, RejectsInputChain) {
    try {
        ConfigParser::loadFromString("chain: INPUT\n");
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("outbound"), std::string::npos);
    }
}

TEST_F(ConfigParserTest, RejectsInvalidChainName) {
    EXPECT_THROW(ConfigParser::loadFromString("chain: \"-bad\"\n"), std::runtime_error);
    EXPECT_THROW(ConfigParser::loadFromString("chain: has space\n"), std::runtime_error);
    EXPECT_THROW(ConfigParser::loadFromString("chain: ABCDEFGHIJKLMNOPQRSTUVWXYZ0123\n"), std::runtime_error);
}

TEST_F(ConfigParserTest, RejectsZeroTimeout) {
    EXPECT_THROW(ConfigParser::loadFromString("resolve_timeout_ms: 0\n"), std::runtime_error);
}

TEST_F(ConfigParserTest, RejectsSharedRulesFileWithIPv6) {
    EXPECT_THROW(ConfigParser::loadFromString(
                     "ipv6: true\nrules_file: /tmp/rules\nrules_file_v6: /tmp/rules\n"),
                 std::runtime_error);
}

TEST_F(ConfigParserTest, RejectsInvalidPrefix) {
    EXPECT_THROW(ConfigParser::loadFromString("subdomain_prefixes: [\"bad prefix\"]\n"), std::runtime_error);
}

TEST_F(ConfigParserTest, RejectsNonMapDocument) {
    EXPECT_THROW(ConfigParser::loadFromString("- a\n- b\n"), std::runtime_error);
}

TEST_F(ConfigParserTest, LoadOptionalReturnsDefaultsWhenMissing) {
    Config config = ConfigParser::loadOptional("/nonexistent/web-blocker/config.yaml");

    EXPECT_EQ(config.chain, "OUTPUT");
}

TEST_F(ConfigParserTest, LoadFromFileFailsWhenMissing) {
    EXPECT_THROW(ConfigParser::loadFromFile("/nonexistent/web-blocker/config.yaml"), std::runtime_error);
}

TEST_F(ConfigParserTest, LoadFromFileReadsYaml) {
    auto path = std::filesystem::temp_directory_path() /
                ("web-blocker-config-" + std::to_string(getpid()) + ".yaml");
    std::ofstream(path) << "chain: WEB_BLOCKER\nlog_level: warn\n";

    Config config = ConfigParser::loadFromFile(path.string());
    std::filesystem::remove(path);

    EXPECT_EQ(config.chain, "WEB_BLOCKER");
    EXPECT_EQ(config.log_level, LogLevel::Warning);
}

TEST_F(ConfigParserTest, EncodeDecodeKeepsValues) {
    Config original;
    original.chain = "WEB_BLOCKER";
    original.apply_mode = ApplyMode::Sequential;
    original.subdomain_prefixes = {"www"};

    YAML::Node node;
    node = original;
    Config decoded = ConfigParser::loadFromString(YAML::Dump(node));

    EXPECT_EQ(decoded.chain, "WEB_BLOCKER");
    EXPECT_EQ(decoded.apply_mode, ApplyMode::Sequential);
    EXPECT_EQ(decoded.subdomain_prefixes, original.subdomain_prefixes);
}
