#include <limits>
#include <nlohmann/json.hpp>
#include "battle/battle_service.hpp"
#include "evaluator/python_evaluator.hpp"
#include "gtest/gtest.h"
#include "server/http_server.hpp"
#include "store/memory_store.hpp"
#include "test/assertions.hpp"
#include "test/mock_runtime.hpp"

using namespace std;
using namespace nlohmann;
using namespace arena;
using namespace arena::battle;
using namespace arena::server;

class HttpServerTest : public ::testing::Test {
protected:
    HttpServerTest()
        : checker(10 * 1024),
          box(runtime, checker, sandbox_config()),
          evaluator(evaluator_config()),
          runner(evaluator),
          actors(2),
          rooms(primary, durable, actors, battle_config()),
          ranking(ranking_store),
          battles(rooms, timers, sequencer, problems, runner, submissions, ranking,
                  battle_config(), scoring_config(), evaluator_config()),
          limiter(100, 60000, 5),
          server(http_config(), box, battles, limiter) {
        runtime.images.insert("python:3.11-alpine");
    }

    void TearDown() override {
        timers.stop();
    }

    httplib::Response post(const string &path, const json &body, const string &user = "") {
        httplib::Headers headers;
        if (!user.empty()) headers.emplace("X-User-Id", user);
        return server.dispatch("POST", path, body.dump(), headers);
    }

    httplib::Response get(const string &path) {
        return server.dispatch("GET", path, "");
    }

    static json body_of(const httplib::Response &res) {
        return json::parse(res.body);
    }

    sandbox::mock::runtime runtime;
    sandbox::validator checker;
    sandbox::sandbox box;
    evaluator::python_evaluator evaluator;
    in_process_runner runner;
    store::memory_room_store primary;
    store::memory_room_store durable;
    store::memory_submission_store submissions;
    store::memory_leaderboard_store ranking_store;
    room_actor_pool actors;
    room_manager rooms;
    commit_sequencer sequencer;
    problem_registry problems;
    leaderboard ranking;
    scheduler timers;
    battle_service battles;
    rate_limiter limiter;
    http_server server;
};

TEST(ParseMemoryLimitTest, Units) {
    EXPECT_EQ(parse_memory_limit(json(128)), 128ll << 20);
    EXPECT_EQ(parse_memory_limit(json("256m")), 256ll << 20);
    EXPECT_EQ(parse_memory_limit(json("64MB")), 64ll << 20);
    EXPECT_EQ(parse_memory_limit(json("512k")), 512ll << 10);
    EXPECT_EQ(parse_memory_limit(json("1g")), 1ll << 30);
    EXPECT_EQ(parse_memory_limit(json("1000b")), 1000);
    EXPECT_EQ(parse_memory_limit(json("lots")), 0);
    EXPECT_EQ(parse_memory_limit(json("12t")), 0);
    EXPECT_EQ(parse_memory_limit(json(nullptr)), 0);
}

TEST(ParseMemoryLimitTest, RejectsNonPositive) {
    EXPECT_EQ(parse_memory_limit(json(-1)), 0);
    EXPECT_EQ(parse_memory_limit(json(0)), 0);
    EXPECT_EQ(parse_memory_limit(json(numeric_limits<int64_t>::min())), 0);
    EXPECT_EQ(parse_memory_limit(json("0m")), 0);
}

TEST(ParseMemoryLimitTest, SaturatesHugeValues) {
    const int64_t max = numeric_limits<int64_t>::max();
    EXPECT_EQ(parse_memory_limit(json(max)), max);
    EXPECT_EQ(parse_memory_limit(json(numeric_limits<uint64_t>::max())), max);
    EXPECT_EQ(parse_memory_limit(json((int64_t)1 << 43)), max);
    EXPECT_EQ(parse_memory_limit(json("999999999999g")), max);
    EXPECT_EQ(parse_memory_limit(json("999999999999")), 999999999999ll << 20);
}

TEST_F(HttpServerTest, Health) {
    auto res = get("/health");
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(body_of(res)["status"], "ok");
    EXPECT_EQ(body_of(res)["liveContainers"], 0);
}

TEST_F(HttpServerTest, Languages) {
    auto res = get("/api/languages");
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(body_of(res)["languages"].size(), sandbox::supported_languages().size());
}

TEST_F(HttpServerTest, Execute) {
    runtime.next.log = sandbox::mock::frame(1, "3\n");
    auto res = post("/api/execute", {{"language", "python"}, {"code", "print(1 + 2)"}, {"timeoutMs", 60000}, {"memoryLimit", "128m"}});
    EXPECT_EQ(res.status, 200);
    json body = body_of(res);
    EXPECT_TRUE(body["success"].get<bool>());
    EXPECT_EQ(body["data"]["stdout"], "3\n");

    const auto &spec = runtime.specs.begin()->second;
    EXPECT_EQ(spec.memory_bytes, 128ll << 20);
}

TEST_F(HttpServerTest, ExecuteMemoryLimitOutOfRange) {
    runtime.next.log = sandbox::mock::frame(1, "1\n");
    EXPECT_EQ(post("/api/execute", {{"language", "python"}, {"code", "print(1)"}, {"memoryLimit", -64}}).status, 200);
    EXPECT_EQ(post("/api/execute", {{"language", "python"}, {"code", "print(1)"}, {"memoryLimit", numeric_limits<int64_t>::max()}}).status, 200);
    EXPECT_EQ(post("/api/execute", {{"language", "python"}, {"code", "print(1)"}, {"memoryLimit", "999999999999g"}}).status, 200);

    ASSERT_EQ(runtime.specs.size(), 3u);
    EXPECT_EQ(runtime.specs.at("container1").memory_bytes, box.default_limits().memory_bytes);
    EXPECT_EQ(runtime.specs.at("container2").memory_bytes, sandbox_config().max_memory_bytes);
    EXPECT_EQ(runtime.specs.at("container3").memory_bytes, sandbox_config().max_memory_bytes);
}

TEST_F(HttpServerTest, ExecuteRejectsDeniedCode) {
    auto res = post("/api/execute", {{"language", "python"}, {"code", "import os"}});
    EXPECT_EQ(res.status, 400);
    EXPECT_EQ(body_of(res)["error"]["type"], "ValidationError");
    EXPECT_EQ(runtime.created, 0);

    res = post("/api/execute", {{"language", "fortran"}, {"code", "print *, 1"}});
    EXPECT_EQ(res.status, 400);
}

TEST_F(HttpServerTest, ExecuteIsRateLimited) {
    for (int i = 0; i < 5; ++i)
        EXPECT_EQ(post("/api/execute", {{"language", "python"}, {"code", "print(1)"}}).status, 200);
    auto res = post("/api/execute", {{"language", "python"}, {"code", "print(1)"}});
    EXPECT_EQ(res.status, 429);
    EXPECT_EQ(body_of(res)["error"]["type"], "RateLimitError");
}

TEST_F(HttpServerTest, MalformedBody) {
    auto res = server.dispatch("POST", "/api/battle/create", "{not json", {{"X-User-Id", "alice"}});
    EXPECT_EQ(res.status, 400);
    EXPECT_FALSE(body_of(res)["success"].get<bool>());
}

TEST_F(HttpServerTest, UnknownRoute) {
    EXPECT_EQ(get("/api/nothing").status, 404);
    EXPECT_EQ(get("/api/battle/not-a-room/lobby").status, 404);
}

TEST_F(HttpServerTest, BattleFlow) {
    auto created = post("/api/battle/create", {{"difficulty", "Easy"}, {"problemId", "two-sum"}, {"battleTime", 5}}, "alice");
    ASSERT_EQ(created.status, 201);
    json room = body_of(created);
    string room_id = room["roomId"].get<string>();
    EXPECT_EQ(room["durationMinutes"], 5);

    EXPECT_EQ(post("/api/battle/join", {{"roomCode", room["roomCode"]}, {"userId", "bob"}}).status, 200);
    EXPECT_EQ(post("/api/battle/join", {{"roomCode", "NOPE1234"}}, "carol").status, 404);

    EXPECT_EQ(post("/api/battle/" + room_id + "/start", json::object(), "bob").status, 403);
    EXPECT_EQ(post("/api/battle/" + room_id + "/submit", {{"code", "def twoSum(n, t):\n    return []\n"}}, "bob").status, 409);
    EXPECT_EQ(post("/api/battle/" + room_id + "/start", json::object(), "alice").status, 200);

    string code = "def twoSum(nums, target):\n    seen = {}\n    for i, n in enumerate(nums):\n"
                  "        if target - n in seen:\n            return [seen[target - n], i]\n"
                  "        seen[n] = i\n";
    auto submitted = post("/api/battle/" + room_id + "/submit", {{"code", code}, {"language", "python"}}, "alice");
    ASSERT_EQ(submitted.status, 200);
    json result = body_of(submitted);
    EXPECT_EQ(result["passed"], result["total"]);

    auto lobby = server.dispatch("GET", "/api/battle/" + room_id + "/lobby", "", {{"X-User-Id", "bob"}});
    EXPECT_EQ(lobby.status, 200);
    EXPECT_EQ(body_of(lobby)["battle"]["submissions"], 1);

    auto results = get("/api/battle/" + room_id + "/results");
    EXPECT_EQ(body_of(results)["results"][0]["userId"], "alice");

    auto board = get("/api/leaderboard/battle?limit=5");
    EXPECT_EQ(board.status, 200);
    EXPECT_EQ(body_of(board)["entries"][0]["userId"], "alice");
    EXPECT_EQ(get("/api/leaderboard/battle?limit=many").status, 400);

    string history = "/api/battle/" + room_id + "/submissions";
    auto own = server.dispatch("GET", history, "", {{"X-User-Id", "alice"}});
    ASSERT_EQ(own.status, 200);
    ASSERT_EQ(body_of(own)["submissions"].size(), 1u);
    EXPECT_EQ(body_of(own)["submissions"][0]["code"], code);
    auto other = server.dispatch("GET", history, "", {{"X-User-Id", "bob"}});
    EXPECT_EQ(body_of(other)["submissions"][0]["userId"], "alice");
    EXPECT_FALSE(body_of(other)["submissions"][0].contains("code"));
    EXPECT_EQ(server.dispatch("GET", history, "", {{"X-User-Id", "carol"}}).status, 403);

    EXPECT_EQ(post("/api/battle/" + room_id + "/end", json::object(), "alice").status, 200);
    EXPECT_EQ(post("/api/battle/" + room_id + "/submit", {{"code", code}}, "alice").status, 409);
    other = server.dispatch("GET", history, "", {{"X-User-Id", "bob"}});
    EXPECT_EQ(body_of(other)["submissions"][0]["code"], code);
}

TEST_F(HttpServerTest, MissingRoom) {
    EXPECT_EQ(get("/api/battle/0123456789abcdef01234567/results").status, 404);
}

TEST_F(HttpServerTest, ProblemsByDifficulty) {
    auto res = get("/api/battle/problems?difficulty=Hard");
    EXPECT_EQ(res.status, 200);
    for (auto &p : body_of(res)["problems"])
        EXPECT_EQ(p["difficulty"], "Hard");
}
