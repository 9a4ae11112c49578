#include <future>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/python.hpp"
#include "evaluator/python_evaluator.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"

using namespace std;
using namespace nlohmann;
using namespace arena;
using namespace arena::evaluator;

static const char *TWO_SUM = R"(
def twoSum(nums, target):
    seen = {}
    for i, n in enumerate(nums):
        if target - n in seen:
            return [seen[target - n], i]
        seen[n] = i
    return []
)";

class PythonEvaluatorTest : public ::testing::Test {
protected:
    PythonEvaluatorTest() : evaluator(make_config()) {}

    static evaluator_config make_config() {
        evaluator_config config;
        config.timeout_ms = 300;
        config.max_result_size = 256;
        config.max_argument_size = 128;
        return config;
    }

    python_evaluator evaluator;
};

TEST_F(PythonEvaluatorTest, CallsFunction) {
    EXPECT_JSON_EQ(evaluator.run(TWO_SUM, "twoSum", json::parse("[[2, 7, 11, 15], 9]")), json::parse("[0, 1]"));
    EXPECT_JSON_EQ(evaluator.run(TWO_SUM, "twoSum", json::parse("[[3, 2, 4], 6]")), json::parse("[1, 2]"));
}

TEST_F(PythonEvaluatorTest, WrongAnswerIsReturnedAsValue) {
    const char *code = "def twoSum(nums, target):\n    return [1, 0]\n";
    EXPECT_JSON_EQ(evaluator.run(code, "twoSum", json::parse("[[2, 7], 9]")), json::parse("[1, 0]"));
}

TEST_F(PythonEvaluatorTest, CallsSolutionMethod) {
    const char *code = R"(
class Solution:
    def isPalindrome(self, x):
        s = str(x)
        return s == s[::-1]
)";
    EXPECT_JSON_EQ(evaluator.run(code, "isPalindrome", json::array({121})), json(true));
    EXPECT_JSON_EQ(evaluator.run(code, "isPalindrome", json::array({-121})), json(false));
}

TEST_F(PythonEvaluatorTest, FallsBackToFirstFunction) {
    const char *code = "def solve(s):\n    return s[::-1]\n";
    EXPECT_JSON_EQ(evaluator.run(code, "reverseString", json::array({"abc"})), json("cba"));
}

TEST_F(PythonEvaluatorTest, ConvertsNestedValues) {
    const char *code = R"(
from collections import Counter
def count(words):
    return {"counts": dict(Counter(words)), "unique": sorted(set(words)), "ratio": 0.5, "none": None}
)";
    json expected = {{"counts", {{"a", 2}, {"b", 1}}}, {"unique", {"a", "b"}}, {"ratio", 0.5}, {"none", nullptr}};
    EXPECT_JSON_EQ(evaluator.run(code, "count", json::parse(R"([["a", "b", "a"]])")), expected);
}

TEST_F(PythonEvaluatorTest, AllowedModulesCanBeImported) {
    const char *code = "import heapq\nimport math\ndef f(xs):\n    heapq.heapify(xs)\n    return [heapq.heappop(xs), math.gcd(12, 18)]\n";
    EXPECT_JSON_EQ(evaluator.run(code, "f", json::parse("[[5, 3, 4]]")), json::parse("[3, 6]"));
}

TEST_F(PythonEvaluatorTest, BlockedImportFails) {
    const char *code = "import os\ndef f():\n    return os.getcwd()\n";
    try {
        evaluator.run(code, "f", json::array());
        FAIL() << "import os should fail";
    } catch (evaluation_error &e) {
        EXPECT_NE(string(e.what()).find("ImportError"), string::npos) << e.what();
    }
}

TEST_F(PythonEvaluatorTest, BuiltinsOutsideWhitelistAreMissing) {
    EXPECT_THROW(evaluator.run("def f():\n    return open('/etc/passwd').read()\n", "f", json::array()), evaluation_error);
    EXPECT_THROW(evaluator.run("def f():\n    return eval('1')\n", "f", json::array()), evaluation_error);
}

TEST_F(PythonEvaluatorTest, DunderAccessIsRejected) {
    const char *code = "def f():\n    return ().__class__.__bases__[0].__subclasses__()\n";
    EXPECT_THROW(evaluator.run(code, "f", json::array()), validation_error);
}

TEST_F(PythonEvaluatorTest, ModuleInternalsAreUnreachable) {
    const char *via_collections = R"(
import collections
def f():
    return collections._sys.modules["os"].popen("echo escaped").read()
)";
    EXPECT_THROW(evaluator.run(via_collections, "f", json::array()), validation_error);

    const char *via_import = "from collections import _sys\ndef f():\n    return 1\n";
    EXPECT_THROW(evaluator.run(via_import, "f", json::array()), validation_error);

    // collections 只导出部分对象
    const char *via_subset = R"(
import collections
def f():
    try:
        return collections.namedtuple
    except AttributeError:
        return "missing"
)";
    EXPECT_JSON_EQ(evaluator.run(via_subset, "f", json::array()), json("missing"));
}

TEST_F(PythonEvaluatorTest, FormatAttributeLookupIsRejected) {
    const char *via_formatter = R"(
import string
def f():
    name = "_" * 2 + "class" + "_" * 2
    return string.Formatter().get_field("0." + name, [()], {})
)";
    EXPECT_THROW(evaluator.run(via_formatter, "f", json::array()), evaluation_error);

    const char *via_format = R"(
def f():
    name = "_" * 2 + "class" + "_" * 2
    return ("{0." + name + "}").format(())
)";
    EXPECT_THROW(evaluator.run(via_format, "f", json::array()), validation_error);
}

TEST_F(PythonEvaluatorTest, PrivateAttributesAreRejected) {
    const char *code = R"(
import functools
def f():
    return functools._lru_cache_wrapper
)";
    EXPECT_THROW(evaluator.run(code, "f", json::array()), validation_error);
}

TEST_F(PythonEvaluatorTest, SubsetModulesStillWork) {
    const char *code = R"(
from collections import deque
from functools import reduce
import string
def f(xs):
    q = deque(xs)
    q.rotate(1)
    return [list(q), reduce(lambda a, b: a + b, xs), string.digits[:3]]
)";
    EXPECT_JSON_EQ(evaluator.run(code, "f", json::parse("[[1, 2, 3]]")), json::parse(R"([[3, 1, 2], 6, "012"])"));
}

TEST(AuditHookTest, ProcessCreationIsDenied) {
    GIL_guard gil;
    py_object globals(PyDict_New());
    PyDict_SetItemString(globals.get(), "__builtins__", PyEval_GetBuiltins());
    py_object result(PyRun_String("import os\nos.system('true')\n", Py_file_input, globals.get(), globals.get()));
    ASSERT_FALSE(result);
    EXPECT_TRUE(PyErr_ExceptionMatches(PyExc_PermissionError));
    PyErr_Clear();
}

TEST_F(PythonEvaluatorTest, ExceptionIsReportedWithType) {
    try {
        evaluator.run("def f(x):\n    return 1 // x\n", "f", json::array({0}));
        FAIL() << "division by zero should fail";
    } catch (evaluation_error &e) {
        EXPECT_EQ(string(e.what()).rfind("ZeroDivisionError", 0), 0u) << e.what();
    }
}

TEST_F(PythonEvaluatorTest, InfiniteLoopTimesOut) {
    EXPECT_THROW(evaluator.run("def f():\n    while True:\n        pass\n", "f", json::array()), evaluation_timeout);
}

TEST_F(PythonEvaluatorTest, SwallowedTimeoutStillTimesOut) {
    const char *code = R"(
def f():
    try:
        while True:
            pass
    except Exception:
        pass
    while True:
        pass
)";
    EXPECT_THROW(evaluator.run(code, "f", json::array(), 200), evaluation_timeout);
}

TEST_F(PythonEvaluatorTest, OversizedArgumentIsRejected) {
    json args = json::array({string(200, 'a')});
    EXPECT_THROW(evaluator.run("def f(s):\n    return s\n", "f", args), validation_error);
}

TEST_F(PythonEvaluatorTest, OversizedResultIsRejected) {
    EXPECT_THROW(evaluator.run("def f():\n    return list(range(1000))\n", "f", json::array()), evaluation_error);
}

TEST_F(PythonEvaluatorTest, ConcurrentCallsAreIsolated) {
    vector<future<json>> results;
    for (int i = 0; i < 4; ++i)
        results.push_back(async(launch::async, [this, i] {
            return evaluator.run("counter = 0\ndef f(x):\n    global counter\n    counter += 1\n    return counter + x\n",
                                 "f", json::array({i}));
        }));
    for (int i = 0; i < 4; ++i)
        EXPECT_JSON_EQ(results[i].get(), json(i + 1));
}
