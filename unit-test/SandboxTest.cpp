#include <future>
#include <vector>
#include "common/status.hpp"
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"
#include "sandbox/stream_demuxer.hpp"
#include "test/mock_runtime.hpp"

using namespace std;
using namespace arena;
using namespace arena::sandbox;

class SandboxTest : public ::testing::Test {
protected:
    SandboxTest() : checker(10 * 1024) {
        config.timeout_ms = 200;
        config.max_timeout_ms = 1000;
        config.max_output_size = 64;
        runtime.images.insert("python:3.11-alpine");
    }

    execution_request request(const string &code, const string &language = "python") {
        execution_request req;
        req.language = language;
        req.code = code;
        req.limits = sandbox_ptr()->default_limits();
        return req;
    }

    arena::sandbox::sandbox *sandbox_ptr() {
        if (!box) box = make_unique<arena::sandbox::sandbox>(runtime, checker, config);
        return box.get();
    }

    mock::runtime runtime;
    validator checker;
    sandbox_config config;
    unique_ptr<arena::sandbox::sandbox> box;
};

TEST_F(SandboxTest, SuccessfulExecutionCollectsBothStreams) {
    runtime.next.log = mock::frame(1, "hello\n") + mock::frame(2, "warning\n") + mock::frame(1, "world\n");
    auto result = sandbox_ptr()->execute(request("print('hello')"));

    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.stdout_data, "hello\nworld\n");
    EXPECT_EQ(result.stderr_data, "warning\n");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(runtime.removed.count(result.container_id), 1u);
    EXPECT_TRUE(sandbox_ptr()->live_containers().empty());
}

TEST_F(SandboxTest, ContainerIsConfiguredWithLimits) {
    auto req = request("print(1)");
    req.input = "42";
    req.limits = sandbox_ptr()->clamp(500, 64ll << 20);
    auto result = sandbox_ptr()->execute(req);
    ASSERT_TRUE(result.success());

    const container_spec &spec = runtime.specs.at(result.container_id);
    EXPECT_EQ(spec.image, "python:3.11-alpine");
    EXPECT_EQ(spec.memory_bytes, 64ll << 20);
    EXPECT_EQ(spec.user, "nobody");
    EXPECT_EQ(spec.env.at("ARENA_CODE"), "print(1)");
    EXPECT_EQ(spec.env.at("ARENA_INPUT"), "42");
    EXPECT_EQ(spec.labels.at(MANAGED_LABEL), "true");
}

TEST_F(SandboxTest, ClampLimitsToConfiguredMaximum) {
    auto limits = sandbox_ptr()->clamp(60000, 4ll << 30);
    EXPECT_EQ(limits.timeout_ms, config.max_timeout_ms);
    EXPECT_EQ(limits.memory_bytes, config.max_memory_bytes);

    limits = sandbox_ptr()->clamp(0, 1024);
    EXPECT_EQ(limits.timeout_ms, config.timeout_ms);
    EXPECT_EQ(limits.memory_bytes, 6ll << 20);
}

TEST_F(SandboxTest, TimeoutKillsAndRemovesContainer) {
    runtime.next.log = mock::frame(1, "partial");
    runtime.next.hang = true;
    auto result = sandbox_ptr()->execute(request("while True: pass"));

    EXPECT_FALSE(result.success());
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.error, error_type::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(result.stdout_data, "partial");
    EXPECT_EQ(runtime.killed.count(result.container_id), 1u);
    EXPECT_EQ(runtime.removed.count(result.container_id), 1u);
    EXPECT_TRUE(sandbox_ptr()->live_containers().empty());
    EXPECT_GE(result.duration_ms, config.timeout_ms);
}

TEST_F(SandboxTest, DeniedCodeNeverCreatesContainer) {
    auto result = sandbox_ptr()->execute(request("import os\nos.system('ls')"));

    EXPECT_EQ(result.error, error_type::VALIDATION_ERROR);
    EXPECT_FALSE(result.violations.empty());
    EXPECT_EQ(runtime.created, 0);
    EXPECT_EQ(runtime.pulls, 0);
}

TEST_F(SandboxTest, OversizedInputIsRejected) {
    auto req = request("print(input())");
    req.input = string(config.max_input_size + 1, 'a');
    auto result = sandbox_ptr()->execute(req);

    EXPECT_EQ(result.error, error_type::VALIDATION_ERROR);
    EXPECT_EQ(runtime.created, 0);
}

TEST_F(SandboxTest, OutOfMemoryIsReported) {
    runtime.next.oom_killed = true;
    runtime.next.exit_code = 137;
    auto result = sandbox_ptr()->execute(request("a = [0] * 10 ** 10"));

    EXPECT_TRUE(result.memory_exceeded);
    EXPECT_EQ(result.error, error_type::MEMORY_LIMIT_EXCEEDED);
    EXPECT_EQ(runtime.removed.count(result.container_id), 1u);
}

TEST_F(SandboxTest, NonZeroExitIsCrash) {
    runtime.next.log = mock::frame(2, "Traceback (most recent call last):\nZeroDivisionError\n");
    runtime.next.exit_code = 1;
    auto result = sandbox_ptr()->execute(request("print(1 / 0)"));

    EXPECT_TRUE(result.crashed);
    EXPECT_EQ(result.error, error_type::CRASHED);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.stderr_data.find("ZeroDivisionError"), string::npos);
}

TEST_F(SandboxTest, PullFailureIsProvisioningError) {
    runtime.images.clear();
    runtime.pull_fails = true;
    auto result = sandbox_ptr()->execute(request("print(1)"));

    EXPECT_EQ(result.error, error_type::PROVISIONING_ERROR);
    EXPECT_EQ(runtime.created, 0);

    // 失败之后下次调用会重新尝试拉取
    runtime.pull_fails = false;
    result = sandbox_ptr()->execute(request("print(1)"));
    EXPECT_TRUE(result.success());
    EXPECT_EQ(runtime.pulls, 2);
}

TEST_F(SandboxTest, CreateFailureIsProvisioningError) {
    runtime.next.fail_create = true;
    auto result = sandbox_ptr()->execute(request("print(1)"));

    EXPECT_EQ(result.error, error_type::PROVISIONING_ERROR);
    EXPECT_TRUE(sandbox_ptr()->live_containers().empty());
}

TEST_F(SandboxTest, ConcurrentExecutionsPullImageOnce) {
    runtime.images.clear();
    runtime.pull_delay = chrono::milliseconds(100);

    vector<future<execution_result>> results;
    for (int i = 0; i < 8; ++i)
        results.push_back(async(launch::async, [this] { return sandbox_ptr()->execute(request("print(1)")); }));
    for (auto &f : results)
        EXPECT_TRUE(f.get().success());

    EXPECT_EQ(runtime.pulls, 1);
    EXPECT_EQ(runtime.created, 8);
    EXPECT_TRUE(sandbox_ptr()->live_containers().empty());
}

TEST_F(SandboxTest, OutputIsTruncated) {
    runtime.next.log = mock::frame(1, string(1000, 'x'));
    auto result = sandbox_ptr()->execute(request("print('x' * 1000)"));

    EXPECT_TRUE(result.success());
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_FALSE(result.stderr_truncated);
    EXPECT_EQ(result.stdout_data, string(config.max_output_size, 'x') + TRUNCATION_MARKER);
}

TEST_F(SandboxTest, ResultJsonReportsErrorType) {
    runtime.next.exit_code = 2;
    nlohmann::json j = sandbox_ptr()->execute(request("raise SystemExit(2)"));

    EXPECT_FALSE(j["success"].get<bool>());
    EXPECT_EQ(j["error"]["type"], "CrashError");
    EXPECT_EQ(j["data"]["exit_code"], 2);
    EXPECT_TRUE(j["execution"]["crashed"].get<bool>());
}
