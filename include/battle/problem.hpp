#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace arena::battle {

struct test_case {
    /**
     * @brief 传给入口函数的参数列表，是一个 JSON 数组
     */
    nlohmann::json args = nlohmann::json::array();
    nlohmann::json expected;

    /**
     * @brief 隐藏的测试用例只在正式提交时运行
     */
    bool hidden = false;
};

/**
 * @brief 对战题目
 */
struct problem {
    std::string id;
    std::string title;

    /**
     * @brief Easy、Medium 或 Hard
     */
    std::string difficulty;

    /**
     * @brief 选手代码中需要实现的函数名
     */
    std::string entry_point;
    std::vector<test_case> tests;
};

void from_json(const nlohmann::json &j, test_case &tc);
void from_json(const nlohmann::json &j, problem &p);

/**
 * @brief 将难度规范化为 Easy、Medium、Hard 之一，无法识别时返回 Easy
 */
std::string sanitize_difficulty(const std::string &difficulty);

/**
 * @brief 对战题目集
 * 构造时包含内置题目，可以从 JSON 文件中加载更多题目，同 id 的题目会被覆盖。
 * 加载完成后只读，可以并发访问。
 */
class problem_registry {
public:
    problem_registry();

    /**
     * @brief 从 JSON 文件加载题目，文件内容是题目数组
     */
    void load_file(const std::filesystem::path &path);

    void add(const problem &p);

    const problem *find(const std::string &id) const;

    /**
     * @brief 列出题目
     * @param difficulty 为空时列出所有题目
     */
    std::vector<const problem *> list(const std::string &difficulty = "") const;

    /**
     * @brief 随机选取一道该难度的题目，没有该难度的题目时返回 nullptr
     */
    const problem *random(const std::string &difficulty) const;

private:
    std::map<std::string, problem> problems;
};

}  // namespace arena::battle
