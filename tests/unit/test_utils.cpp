#include <gtest/gtest.h>
#include "common/Utils.hpp"
#include "engine/Types.hpp"

using namespace std;

TEST(UtilsTest, ToLowerAndTrim) {
    EXPECT_EQ(utils::to_lower("AliCE"), "alice");
    EXPECT_EQ(utils::trim("  bob \t"), "bob");
    EXPECT_EQ(utils::trim("   "), "");
}

TEST(UtilsTest, SplitDropsEmptyParts) {
    auto parts = utils::split(" a, ,b ,", ',');
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "b");

    auto tokens = utils::split_tokens("SET  alice\t100");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[2], "100");
}

TEST(UtilsTest, ParseInt64IsStrict) {
    int64_t v = 0;
    EXPECT_TRUE(utils::parse_int64("-42", v));
    EXPECT_EQ(v, -42);
    EXPECT_FALSE(utils::parse_int64("", v));
    EXPECT_FALSE(utils::parse_int64("12abc", v));
    EXPECT_FALSE(utils::parse_int64("99999999999999999999", v));
}

TEST(UtilsTest, ParseBool) {
    bool b = false;
    EXPECT_TRUE(utils::parse_bool("ON", b));
    EXPECT_TRUE(b);
    EXPECT_TRUE(utils::parse_bool("false", b));
    EXPECT_FALSE(b);
    EXPECT_FALSE(utils::parse_bool("maybe", b));
}

TEST(UtilsTest, UtcTimestamps) {
    time_t t = 0;
    ASSERT_TRUE(utils::parse_utc("2024-03-01 12:30:05", t));
    EXPECT_EQ(t, static_cast<time_t>(1709296205));
    EXPECT_EQ(utils::format_utc(t), "2024-03-01 12:30:05");

    EXPECT_FALSE(utils::parse_utc("2024-03-01T12:30:05", t));
    EXPECT_FALSE(utils::parse_utc("2024-03-01 12:30:05 extra", t));
    EXPECT_FALSE(utils::parse_utc("", t));
}

TEST(UtilsTest, ParentDir) {
    EXPECT_EQ(utils::parent_dir("data/quota.db"), "data");
    EXPECT_EQ(utils::parent_dir("/quota.db"), "/");
    EXPECT_EQ(utils::parent_dir("quota.db"), "");
}

TEST(RateTableTest, FallsBackToCpuThenOne) {
    RateTable rates = {{"cpu", 2}, {"gpu", 10}};
    EXPECT_EQ(rate_for(rates, "gpu"), 10);
    EXPECT_EQ(rate_for(rates, "npu"), 2);
    EXPECT_EQ(rate_for(RateTable(), "gpu"), 1);
    EXPECT_EQ(rate_for({{"gpu", 0}}, "gpu"), 0);
}

TEST(TypesTest, NamesParseBack) {
    TxType t;
    ASSERT_TRUE(parse_tx_type("auto_refresh", t));
    EXPECT_EQ(t, TxType::AutoRefresh);
    EXPECT_FALSE(parse_tx_type("refund", t));

    SessionStatus s;
    ASSERT_TRUE(parse_session_status("cleaned_up", s));
    EXPECT_EQ(s, SessionStatus::CleanedUp);
    EXPECT_STREQ(session_status_name(SessionStatus::Completed), "completed");
}
