#include <gtest/gtest.h>
#include <cstdlib>
#include "engine/Config.hpp"

using namespace std;

namespace {
const char *kVars[] = {
    "QUOTA_DB_PATH", "QUOTA_LOG_PATH", "QUOTA_ENABLED", "QUOTA_RATES",
    "QUOTA_DEFAULT_GRANT", "QUOTA_MINIMUM_TO_START", "QUOTA_STALE_MINUTES",
};
}

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char *v : kVars) unsetenv(v);
    }
};

TEST_F(ConfigTest, DefaultsWithEmptyEnvironment) {
    QuotaConfig cfg;
    string err;
    ASSERT_TRUE(load_quota_config(cfg, err)) << err;
    EXPECT_EQ(cfg.db_path, "./quota.db");
    EXPECT_TRUE(cfg.enabled);
    EXPECT_EQ(cfg.rates.size(), 1u);
    EXPECT_EQ(cfg.rates.at("cpu"), 1);
    EXPECT_EQ(cfg.default_grant, 0);
    EXPECT_EQ(cfg.stale_minutes, 480);
}

TEST_F(ConfigTest, ReadsEnvironmentOverrides) {
    setenv("QUOTA_DB_PATH", "/tmp/q.db", 1);
    setenv("QUOTA_ENABLED", "off", 1);
    setenv("QUOTA_RATES", "cpu=1, gpu=10", 1);
    setenv("QUOTA_DEFAULT_GRANT", "250", 1);
    setenv("QUOTA_STALE_MINUTES", "60", 1);

    QuotaConfig cfg;
    string err;
    ASSERT_TRUE(load_quota_config(cfg, err)) << err;
    EXPECT_EQ(cfg.db_path, "/tmp/q.db");
    EXPECT_FALSE(cfg.enabled);
    EXPECT_EQ(cfg.rates.at("gpu"), 10);
    EXPECT_EQ(cfg.default_grant, 250);
    EXPECT_EQ(cfg.stale_minutes, 60);
}

TEST_F(ConfigTest, MalformedValuesFailTheLoad) {
    QuotaConfig cfg;
    string err;

    setenv("QUOTA_DEFAULT_GRANT", "lots", 1);
    EXPECT_FALSE(load_quota_config(cfg, err));
    EXPECT_NE(err.find("QUOTA_DEFAULT_GRANT"), string::npos);
    unsetenv("QUOTA_DEFAULT_GRANT");

    err.clear();
    setenv("QUOTA_RATES", "gpu", 1);
    EXPECT_FALSE(load_quota_config(cfg, err));
    EXPECT_NE(err.find("QUOTA_RATES"), string::npos);
    unsetenv("QUOTA_RATES");

    err.clear();
    setenv("QUOTA_STALE_MINUTES", "0", 1);
    EXPECT_FALSE(load_quota_config(cfg, err));
}

TEST(RatesTest, ParseAndFormat) {
    RateTable rates;
    string err;
    ASSERT_TRUE(parse_rates("gpu=10,cpu=1", rates, err)) << err;
    EXPECT_EQ(format_rates(rates), "cpu=1,gpu=10");

    EXPECT_FALSE(parse_rates("gpu=-1", rates, err));
    EXPECT_FALSE(parse_rates("=3", rates, err));
    EXPECT_FALSE(parse_rates("", rates, err));
    // Failed parses leave the table alone
    EXPECT_EQ(rates.size(), 2u);
}
