#include "EngineFixture.hpp"

using namespace std;

class ReclaimerTest : public EngineTest {
protected:
    vector<ReclaimedSession> reclaim(int64_t max_minutes) {
        vector<ReclaimedSession> out;
        string err;
        EXPECT_TRUE(engine->reclaimer().reclaim(max_minutes, out, err)) << err;
        return out;
    }
};

TEST_F(ReclaimerTest, ClosesOnlySessionsPastTheLimit) {
    set_balance("alice", 100);
    int64_t stale = backdated_session("alice", "gpu", 600);
    int64_t fresh = backdated_session("bob", "cpu", 5);

    auto out = reclaim(480);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].session_id, stale);
    EXPECT_EQ(out[0].username, "alice");
    EXPECT_EQ(out[0].resource_type, "gpu");
    EXPECT_EQ(out[0].duration_minutes, 480);

    UsageSession s = session(stale);
    EXPECT_EQ(s.status, SessionStatus::CleanedUp);
    EXPECT_EQ(s.duration_minutes, 480);
    EXPECT_EQ(s.quota_consumed, 0);
    EXPECT_FALSE(s.end_time.empty());

    EXPECT_EQ(session(fresh).status, SessionStatus::Active);
}

TEST_F(ReclaimerTest, ReclaimNeverCharges) {
    set_balance("carol", 100);
    backdated_session("carol", "gpu", 1000);
    reclaim(60);
    EXPECT_EQ(balance("carol"), 100);
    EXPECT_EQ(count_type("carol", TxType::Usage), 0u);
}

TEST_F(ReclaimerTest, ReclaimedSessionCannotBeEndedAfterwards) {
    set_balance("dan", 100);
    int64_t id = backdated_session("dan", "cpu", 120);
    ASSERT_EQ(reclaim(60).size(), 1u);

    int64_t duration = -1, consumed = -1;
    string err;
    ASSERT_TRUE(engine->sessions().end_session(id, {{"cpu", 1}}, duration, consumed, err)) << err;
    EXPECT_EQ(duration, 0);
    EXPECT_EQ(consumed, 0);
    EXPECT_EQ(balance("dan"), 100);
    EXPECT_EQ(session(id).status, SessionStatus::CleanedUp);
}

TEST_F(ReclaimerTest, CompletedSessionsAreLeftAlone) {
    set_balance("erin", 100);
    int64_t id = backdated_session("erin", "cpu", 120);
    int64_t duration = 0, consumed = 0;
    string err;
    ASSERT_TRUE(engine->sessions().end_session(id, {{"cpu", 1}}, duration, consumed, err)) << err;

    EXPECT_TRUE(reclaim(60).empty());
    EXPECT_EQ(session(id).status, SessionStatus::Completed);
}

TEST_F(ReclaimerTest, SecondPassFindsNothing) {
    backdated_session("fred", "cpu", 100);
    EXPECT_EQ(reclaim(30).size(), 1u);
    EXPECT_TRUE(reclaim(30).empty());

    int64_t count = -1;
    string err;
    ASSERT_TRUE(engine->sessions().active_session_count(count, err)) << err;
    EXPECT_EQ(count, 0);
}

TEST_F(ReclaimerTest, NonPositiveLimitIsAnError) {
    vector<ReclaimedSession> out;
    string err;
    EXPECT_FALSE(engine->reclaimer().reclaim(0, out, err));
    EXPECT_FALSE(err.empty());
}
