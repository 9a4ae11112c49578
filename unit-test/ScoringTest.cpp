#include "battle/leaderboard.hpp"
#include "battle/scoring.hpp"
#include "gtest/gtest.h"
#include "store/memory_store.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace nlohmann;
using namespace arena;
using namespace arena::battle;

static submission_summary summary(const string &user, int passed, int total, size_t code_length) {
    submission_summary s;
    s.user_id = user;
    s.passed = passed;
    s.total = total;
    s.code_length = code_length;
    return s;
}

class ScoringTest : public ::testing::Test {
protected:
    scoring_config config;
    map<string, submission_summary> existing;
};

TEST_F(ScoringTest, FirstPerfectSubmission) {
    auto result = score(4, 4, 250, 100, existing, false, config);
    EXPECT_EQ(result.correctness, 100);
    EXPECT_EQ(result.speed, 18);
    EXPECT_EQ(result.brevity, 10);
    EXPECT_EQ(result.first_correct, 10);
    EXPECT_EQ(result.total, 100);
}

TEST_F(ScoringTest, PartialSubmission) {
    existing["alice"] = summary("alice", 1, 4, 100);
    auto result = score(2, 4, 0, 120, existing, false, config);
    EXPECT_EQ(result.correctness, 50);
    EXPECT_EQ(result.speed, 20);
    EXPECT_EQ(result.brevity, 5);
    EXPECT_EQ(result.first_correct, 0);
    EXPECT_EQ(result.total, 75);
}

TEST_F(ScoringTest, FirstCorrectBonusIsAwardedOnce) {
    existing["alice"] = summary("alice", 3, 3, 100);
    auto result = score(3, 3, 5000, 200, existing, true, config);
    EXPECT_EQ(result.first_correct, 0);
    EXPECT_EQ(result.speed, 0);
    EXPECT_EQ(result.brevity, 0);
    EXPECT_EQ(result.total, 100);
}

TEST_F(ScoringTest, FirstCorrectDependsOnAwardNotSummaries) {
    // 首个全对的参与者之后提交了更差的代码，摘要中已经没有全对的记录
    existing["alice"] = summary("alice", 1, 3, 100);
    EXPECT_EQ(score(3, 3, 0, 100, existing, true, config).first_correct, 0);
    EXPECT_EQ(score(3, 3, 0, 100, existing, false, config).first_correct, 10);
}

TEST_F(ScoringTest, CorrectnessIsRounded) {
    auto result = score(1, 3, 1999, 50, existing, false, config);
    EXPECT_EQ(result.correctness, 33);
    EXPECT_EQ(result.speed, 1);
    EXPECT_EQ(result.total, 44);

    EXPECT_EQ(score(2, 3, 0, 50, existing, false, config).correctness, 67);
    EXPECT_EQ(score(0, 0, 0, 50, existing, false, config).correctness, 0);
}

TEST_F(ScoringTest, TotalIsCapped) {
    config.max_score = 90;
    EXPECT_EQ(score(4, 4, 0, 10, existing, false, config).total, 90);
}

TEST_F(ScoringTest, BreakdownJson) {
    json j = score(4, 4, 0, 10, existing, false, config);
    EXPECT_JSON_EQ(j, json({{"correctness", 100}, {"speed", 20}, {"brevity", 10}, {"firstCorrect", 10}, {"total", 100}}));
}

TEST(LeaderboardTest, RanksBestScores) {
    store::memory_leaderboard_store backend;
    leaderboard ranking(backend);

    EXPECT_TRUE(ranking.offer("alice", BATTLE_CATEGORY, 70, {{"roomId", "r1"}}, 1));
    EXPECT_TRUE(ranking.offer("bob", BATTLE_CATEGORY, 85, {{"roomId", "r1"}}, 2));
    EXPECT_FALSE(ranking.offer("bob", BATTLE_CATEGORY, 60, {{"roomId", "r2"}}, 3));
    EXPECT_TRUE(ranking.offer("alice", BATTLE_CATEGORY, 95, {{"roomId", "r2"}}, 4));

    json list = ranking.list(BATTLE_CATEGORY);
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0]["userId"], "alice");
    EXPECT_EQ(list[0]["rank"], 1);
    EXPECT_EQ(list[0]["details"]["roomId"], "r2");
    EXPECT_EQ(list[1]["userId"], "bob");
    EXPECT_EQ(list[1]["score"], 85);
    EXPECT_EQ(list[1]["rank"], 2);

    EXPECT_EQ(ranking.list(BATTLE_CATEGORY, 1).size(), 1u);
}
