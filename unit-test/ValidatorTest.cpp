#include <algorithm>
#include "gtest/gtest.h"
#include "sandbox/language.hpp"
#include "sandbox/validator.hpp"

using namespace std;
using namespace arena::sandbox;

class ValidatorTest : public ::testing::Test {
protected:
    ValidatorTest() : checker(1024) {}

    static bool contains(const validation_result &result, const string &message) {
        return find(result.violations.begin(), result.violations.end(), message) != result.violations.end();
    }

    validator checker;
};

TEST_F(ValidatorTest, AcceptsPlainCode) {
    EXPECT_TRUE(checker.validate("def twoSum(nums, target):\n    return [0, 1]\n", "python").ok);
    EXPECT_TRUE(checker.validate("console.log([1, 2].map(x => x * 2));", "javascript").ok);
    EXPECT_TRUE(checker.validate("#include <iostream>\nint main() { std::cout << 1; }", "cpp").ok);
    EXPECT_TRUE(checker.validate("puts 'héllo wörld'", "ruby").ok);
}

TEST_F(ValidatorTest, RejectsUnsupportedLanguage) {
    auto result = checker.validate("print(1)", "brainfuck");
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result, "unsupported language: brainfuck"));
}

TEST_F(ValidatorTest, RejectsEmptyAndOversizedCode) {
    EXPECT_TRUE(contains(checker.validate("", "python"), "code is empty"));
    EXPECT_TRUE(contains(checker.validate(string(1025, 'a'), "python"), "code exceeds 1024 bytes"));
}

TEST_F(ValidatorTest, RejectsControlCharactersAndBadEncoding) {
    EXPECT_TRUE(contains(checker.validate(string("print(1)\0", 9), "python"), "code contains null bytes"));
    EXPECT_TRUE(contains(checker.validate("print(1)\x1b[2J", "python"), "code contains control characters"));
    EXPECT_TRUE(contains(checker.validate("print('\xc3\x28')", "python"), "code is not valid UTF-8"));
}

TEST_F(ValidatorTest, PythonDenylist) {
    EXPECT_FALSE(checker.validate("import subprocess", "python").ok);
    EXPECT_FALSE(checker.validate("from os.path import join", "python").ok);
    EXPECT_FALSE(checker.validate("__import__('os')", "python").ok);
    EXPECT_FALSE(checker.validate("eval('1 + 1')", "python").ok);
    EXPECT_FALSE(checker.validate("open('/etc/passwd')", "python").ok);
    EXPECT_FALSE(checker.validate("().__class__.__bases__", "python").ok);
    // 标识符中包含黑名单词语的情况不应误判
    EXPECT_TRUE(checker.validate("reopen_count = 1\nimport osmosis_helper", "python").ok);
}

TEST_F(ValidatorTest, JavaScriptDenylist) {
    EXPECT_FALSE(checker.validate("require('child_process').execSync('ls')", "javascript").ok);
    EXPECT_FALSE(checker.validate("process.exit(1)", "javascript").ok);
    EXPECT_FALSE(checker.validate("new Function('return 1')()", "javascript").ok);
    EXPECT_TRUE(checker.validate("const lodash = require('lodash');", "javascript").ok);
}

TEST_F(ValidatorTest, ViolationsAreReportedOnce) {
    auto result = checker.validate("import os\nimport sys", "python");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(count(result.violations.begin(), result.violations.end(), "importing system modules is not allowed"), 1);
}

TEST_F(ValidatorTest, EveryLanguageHasDenylist) {
    for (auto &lang : supported_languages()) {
        EXPECT_FALSE(lang.denylist.empty()) << lang.id;
        EXPECT_FALSE(lang.image.empty()) << lang.id;
    }
    EXPECT_EQ(find_language("pascal"), nullptr);
}
