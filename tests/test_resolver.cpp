#include "logger.hpp"
#include "resolver.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace webblock;

class SystemResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setLevel(LogLevel::None);
    }
};

TEST_F(SystemResolverTest, ResolvesLocalhostFromHostsFile) {
    SystemResolver resolver(std::chrono::milliseconds(2000), false);

    auto result = resolver.resolve("localhost");

    ASSERT_TRUE(result.isSuccess()) << result.error;
    EXPECT_TRUE(std::all_of(result.addresses.begin(), result.addresses.end(),
                            [](const HostAddress& host) { return host.family == AddressFamily::IPv4; }));
    EXPECT_NE(std::find(result.addresses.begin(), result.addresses.end(),
                        HostAddress{"127.0.0.1", AddressFamily::IPv4}),
              result.addresses.end());
}

TEST_F(SystemResolverTest, EmptyNameFails) {
    SystemResolver resolver(std::chrono::milliseconds(2000), false);

    auto result = resolver.resolve("");

    EXPECT_FALSE(result.isSuccess());
    EXPECT_EQ(result.error, "empty domain name");
}

TEST_F(SystemResolverTest, UnresolvableNameFailsWithinTimeout) {
    SystemResolver resolver(std::chrono::milliseconds(2000), false);

    auto start = std::chrono::steady_clock::now();
    auto result = resolver.resolve("no-such-host.invalid");
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.isSuccess());
    EXPECT_FALSE(result.error.empty());
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST_F(SystemResolverTest, ExpiredDeadlineReportsTimeoutOrCompletedAnswer) {
    // With a zero budget the lookup is abandoned unless it has already
    // finished by the time it is cancelled; both outcomes must be clean
    SystemResolver resolver(std::chrono::milliseconds(0), false);

    for (int i = 0; i < 20; ++i) {
        auto result = resolver.resolve("localhost");
        if (result.isSuccess()) {
            EXPECT_NE(std::find(result.addresses.begin(), result.addresses.end(),
                                HostAddress{"127.0.0.1", AddressFamily::IPv4}),
                      result.addresses.end());
        } else {
            EXPECT_EQ(result.error, "lookup timed out after 0 ms");
            EXPECT_TRUE(result.addresses.empty());
        }
    }
}
