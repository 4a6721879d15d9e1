#include "rule.hpp"
#include <gtest/gtest.h>

using namespace webblock;

TEST(DropRuleTest, BuildsAppendCommand) {
    DropRule rule("OUTPUT", "93.184.216.34", AddressFamily::IPv4, Protocol::Tcp, "web-blocker:example.test");

    std::vector<std::string> expected = {
        "-A", "OUTPUT", "-d", "93.184.216.34", "-p", "tcp",
        "-m", "comment", "--comment", "web-blocker:example.test", "-j", "DROP"};
    EXPECT_EQ(rule.buildIptablesCommand(), expected);
}

TEST(DropRuleTest, OmitsCommentMatchWhenEmpty) {
    DropRule rule("OUTPUT", "10.0.0.1", AddressFamily::IPv4, Protocol::Udp);

    EXPECT_EQ(rule.toRestoreLine(), "-A OUTPUT -d 10.0.0.1 -p udp -j DROP");
}

TEST(DropRuleTest, DescribeNamesProtocolAndDestination) {
    DropRule rule("OUTPUT", "2001:db8::1", AddressFamily::IPv6, Protocol::Udp);

    EXPECT_EQ(rule.describe(), "DROP out udp dst=2001:db8::1");
    EXPECT_EQ(rule.getFamily(), AddressFamily::IPv6);
    EXPECT_EQ(rule.getAddress(), "2001:db8::1");
}

TEST(DropRuleTest, RejectsEmptyAddress) {
    EXPECT_THROW(DropRule("OUTPUT", "", AddressFamily::IPv4, Protocol::Tcp), std::invalid_argument);
}

TEST(DropRuleTest, CommentIsSanitized) {
    DropRule rule("OUTPUT", "10.0.0.1", AddressFamily::IPv4, Protocol::Tcp, "tag: a b\"c");

    EXPECT_EQ(rule.getComment(), "tag__a_b_c");
}

TEST(SanitizeCommentTest, TruncatesLongComments) {
    std::string comment(400, 'a');

    EXPECT_EQ(sanitizeComment(comment).size(), 255u);
}

TEST(SanitizeCommentTest, KeepsDomainCharacters) {
    EXPECT_EQ(sanitizeComment("web-blocker:a.test,b_c.test"), "web-blocker:a.test,b_c.test");
}

TEST(RuleEnumTest, BlockedProtocolsAreTcpThenUdp) {
    const auto& protocols = blockedProtocols();

    ASSERT_EQ(protocols.size(), 2u);
    EXPECT_EQ(protocols[0], Protocol::Tcp);
    EXPECT_EQ(protocols[1], Protocol::Udp);
    EXPECT_EQ(protocolToString(Protocol::Tcp), "tcp");
    EXPECT_EQ(familyToString(AddressFamily::IPv6), "ipv6");
}
