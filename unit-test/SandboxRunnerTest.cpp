#include <nlohmann/json.hpp>
#include "battle/runner.hpp"
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"
#include "test/assertions.hpp"
#include "test/mock_runtime.hpp"

using namespace std;
using namespace nlohmann;
using namespace arena;
using namespace arena::battle;

static const char *ADD = "def add(a, b):\n    return a + b\n";

class SandboxRunnerTest : public ::testing::Test {
protected:
    SandboxRunnerTest() : checker(10 * 1024), box(runtime, checker, make_config()), runner(box) {
        runtime.images.insert("python:3.11-alpine");
        runtime.images.insert("node:18-alpine");
    }

    static sandbox_config make_config() {
        sandbox_config config;
        config.timeout_ms = 100;
        return config;
    }

    const sandbox::container_spec &last_spec() {
        return runtime.specs.rbegin()->second;
    }

    sandbox::mock::runtime runtime;
    sandbox::validator checker;
    sandbox::sandbox box;
    sandbox_runner runner;
};

TEST_F(SandboxRunnerTest, ReturnsLastLineOfOutput) {
    runtime.next.log = sandbox::mock::frame(1, "debugging\n\n3\n");
    EXPECT_JSON_EQ(runner.call("python", ADD, "add", json::array({1, 2})), json(3));

    const auto &spec = last_spec();
    EXPECT_EQ(spec.env.at("ARENA_INPUT"), "[1,2]");
    const string &program = spec.env.at("ARENA_CODE");
    EXPECT_EQ(program.rfind(ADD, 0), 0u);
    EXPECT_NE(program.find("_arena_entry('add')"), string::npos);
    EXPECT_EQ(program.find("%ENTRY%"), string::npos);
}

TEST_F(SandboxRunnerTest, WrongAnswerIsReturnedAsValue) {
    runtime.next.log = sandbox::mock::frame(1, "\n[1, 0]\n");
    json actual = runner.call("python", "def add(a, b):\n    return [1, 0]\n", "add", json::array({2, 2}));
    EXPECT_JSON_EQ(actual, json::parse("[1, 0]"));
    EXPECT_NE(actual, json(4));
}

TEST_F(SandboxRunnerTest, JavascriptHarnessUsesEntryPoint) {
    runtime.next.log = sandbox::mock::frame(1, "\n\"cba\"\n");
    EXPECT_JSON_EQ(runner.call("javascript", "function reverse(s) { return s.split('').reverse().join(''); }",
                               "reverse", json::array({"abc"})),
                   json("cba"));
    EXPECT_NE(last_spec().env.at("ARENA_CODE").find("typeof reverse !== 'function'"), string::npos);
}

TEST_F(SandboxRunnerTest, MalformedOutputIsAnError) {
    runtime.next.log = sandbox::mock::frame(1, "3\nnot json\n");
    EXPECT_THROW(runner.call("python", ADD, "add", json::array({1, 2})), evaluation_error);
}

TEST_F(SandboxRunnerTest, MissingOutputIsAnError) {
    runtime.next.log = "";
    try {
        runner.call("python", ADD, "add", json::array({1, 2}));
        FAIL() << "empty output should fail";
    } catch (evaluation_error &e) {
        EXPECT_NE(string(e.what()).find("add"), string::npos) << e.what();
    }
}

TEST_F(SandboxRunnerTest, TimeoutIsMapped) {
    runtime.next.hang = true;
    EXPECT_THROW(runner.call("python", ADD, "add", json::array({1, 2})), evaluation_timeout);
    EXPECT_TRUE(box.live_containers().empty());
}

TEST_F(SandboxRunnerTest, OutOfMemoryIsMapped) {
    runtime.next.oom_killed = true;
    runtime.next.exit_code = 137;
    try {
        runner.call("python", ADD, "add", json::array({1, 2}));
        FAIL() << "out of memory should fail";
    } catch (evaluation_timeout &) {
        FAIL() << "out of memory is not a timeout";
    } catch (evaluation_error &e) {
        EXPECT_EQ(string(e.what()).rfind("MemoryError: ", 0), 0u) << e.what();
    }
}

TEST_F(SandboxRunnerTest, CrashReportsLastStderrLine) {
    runtime.next.log = sandbox::mock::frame(2, "Traceback (most recent call last):\nZeroDivisionError: division by zero\n");
    runtime.next.exit_code = 1;
    try {
        runner.call("python", "def add(a, b):\n    return a / 0\n", "add", json::array({1, 2}));
        FAIL() << "crash should fail";
    } catch (evaluation_error &e) {
        EXPECT_EQ(string(e.what()), "CrashError: ZeroDivisionError: division by zero");
    }
}

TEST_F(SandboxRunnerTest, RejectedCodeIsValidationError) {
    EXPECT_THROW(runner.call("python", "import os\ndef add(a, b):\n    return 0\n", "add", json::array({1, 2})),
                 validation_error);
    EXPECT_EQ(runtime.created, 0);
}

TEST_F(SandboxRunnerTest, LanguageWithoutHarnessIsRejected) {
    EXPECT_THROW(runner.call("cpp", "int main() {}", "add", json::array()), validation_error);
    EXPECT_THROW(runner.call("cobol", "", "add", json::array()), validation_error);
    EXPECT_EQ(runtime.created, 0);
}
