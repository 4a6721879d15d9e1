#include "domain_list.hpp"
#include "logger.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace webblock;

class DomainListTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setLevel(LogLevel::None);
        dir_ = std::filesystem::temp_directory_path() /
               ("web-blocker-domains-" + std::to_string(getpid()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream(path) << content;
        return path.string();
    }

    std::filesystem::path dir_;
};

TEST_F(DomainListTest, ParseSkipsBlankLinesAndComments) {
    auto domains = DomainList::parse("# social\nfacebook.com\n\n   \ntwitter.com  # trailing\n");

    EXPECT_EQ(domains, (std::vector<std::string>{"facebook.com", "twitter.com"}));
}

TEST_F(DomainListTest, ParseRemovesDuplicatesKeepingFirstOccurrence) {
    auto domains = DomainList::parse("b.test\na.test\nB.TEST\nb.test.\n");

    EXPECT_EQ(domains, (std::vector<std::string>{"b.test", "a.test"}));
}

TEST_F(DomainListTest, ParseHandlesCrLfLineEndings) {
    auto domains = DomainList::parse("a.test\r\nb.test\r\n");

    EXPECT_EQ(domains, (std::vector<std::string>{"a.test", "b.test"}));
}

TEST_F(DomainListTest, Normalize) {
    EXPECT_EQ(DomainList::normalize("  Example.COM.  "), "example.com");
    EXPECT_EQ(DomainList::normalize("#example.com"), "");
    EXPECT_EQ(DomainList::normalize("\t"), "");
    EXPECT_EQ(DomainList::normalize("example.com#note"), "example.com");
}

TEST_F(DomainListTest, MissingFileFallsBackToDefaults) {
    auto domains = DomainList::load((dir_ / "absent.conf").string());

    EXPECT_EQ(domains, DomainList::kDefaultDomains);
    EXPECT_FALSE(domains.empty());
}

TEST_F(DomainListTest, MissingExplicitFileIsAnError) {
    auto path = (dir_ / "absent.conf").string();

    try {
        DomainList::load(path, false);
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find(path), std::string::npos);
    }
}

TEST_F(DomainListTest, ExplicitFileIsReadWhenPresent) {
    auto path = writeFile("explicit.conf", "a.test\n");

    EXPECT_EQ(DomainList::load(path, false), (std::vector<std::string>{"a.test"}));
}

TEST_F(DomainListTest, EmptyFileYieldsEmptyList) {
    auto path = writeFile("empty.conf", "# nothing blocked\n");

    EXPECT_TRUE(DomainList::load(path).empty());
}

TEST_F(DomainListTest, LoadReadsFile) {
    auto path = writeFile("sites.conf", "reddit.com\nyoutube.com\n");

    EXPECT_EQ(DomainList::load(path), (std::vector<std::string>{"reddit.com", "youtube.com"}));
}

TEST_F(DomainListTest, ExpandAddsPrefixedNamesAfterEachDomain) {
    auto expanded = DomainList::expand({"a.test", "b.test"}, {"www", "m"});

    EXPECT_EQ(expanded, (std::vector<std::string>{
        "a.test", "www.a.test", "m.a.test",
        "b.test", "www.b.test", "m.b.test"}));
}

TEST_F(DomainListTest, ExpandWithoutPrefixesIsIdentity) {
    std::vector<std::string> domains = {"a.test", "b.test"};

    EXPECT_EQ(DomainList::expand(domains, {}), domains);
}

TEST_F(DomainListTest, ExpandSkipsNamesAlreadyListed) {
    auto expanded = DomainList::expand({"a.test", "www.a.test"}, {"www"});

    EXPECT_EQ(expanded, (std::vector<std::string>{"a.test", "www.a.test", "www.www.a.test"}));
}
