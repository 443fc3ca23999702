#include "config.hpp"
#include "utils.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>

TEST(ParseSize, AcceptsPlainDecimalsOnly) {
    EXPECT_EQ(parseSize("--threads", "8"), 8u);
    EXPECT_EQ(parseSize("--max-compressed", "5000000"), 5000000u);
    EXPECT_THROW(parseSize("--threads", ""), std::invalid_argument);
    EXPECT_THROW(parseSize("--threads", "-1"), std::invalid_argument);
    EXPECT_THROW(parseSize("--threads", "4k"), std::invalid_argument);
    EXPECT_THROW(parseSize("--threads", "99999999999999999999999"), std::invalid_argument);
}

TEST(Config, EnvironmentOverridesDefaults) {
    setenv("CCSIFT_DATA_BASE", "http://127.0.0.1:8080", 1);
    setenv("CCSIFT_LOG_LEVEL", "debug", 1);
    Config cfg;
    cfg.applyEnvironment();
    EXPECT_EQ(cfg.data_base, "http://127.0.0.1:8080");
    EXPECT_EQ(cfg.log_level, Utils::LogLevel::Debug);
    EXPECT_EQ(cfg.index_base, "https://index.commoncrawl.org");
    EXPECT_EQ(cfg.retry.retries, 3u);

    setenv("CCSIFT_RETRIES", "5", 1);
    Config retrying;
    retrying.applyEnvironment();
    EXPECT_EQ(retrying.retry.retries, 5u);
    unsetenv("CCSIFT_RETRIES");

    setenv("CCSIFT_LOG_LEVEL", "loud", 1);
    Config bad;
    EXPECT_THROW(bad.applyEnvironment(), std::invalid_argument);

    unsetenv("CCSIFT_DATA_BASE");
    unsetenv("CCSIFT_LOG_LEVEL");
}

TEST(TextHelpers, CaseInsensitiveHelpers) {
    EXPECT_TRUE(Utils::containsIgnoreCase("Text/HTML; charset=UTF-8", "text/html"));
    EXPECT_EQ(Utils::findIgnoreCase("abcDEF", "def"), 3u);
    EXPECT_EQ(Utils::trim("  \tx y \r\n"), "x y");
    EXPECT_EQ(Utils::urlEncode("a b/c:d"), "a%20b%2Fc%3Ad");
}
