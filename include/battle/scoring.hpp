#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include "battle/room.hpp"
#include "config.hpp"

namespace arena::battle {

/**
 * @brief 综合得分的各个组成部分
 */
struct score_breakdown {
    /**
     * @brief 正确性得分，通过率乘 100 后四舍五入
     */
    int correctness = 0;

    /**
     * @brief 速度加分，总运行时间越短越高
     */
    int speed = 0;

    /**
     * @brief 代码长度加分，与本场对战最短代码比较
     */
    int brevity = 0;

    /**
     * @brief 本场对战第一个全部通过的提交的加分
     */
    int first_correct = 0;

    /**
     * @brief 总分，不超过 scoring_config::max_score
     */
    int total = 0;
};

void to_json(nlohmann::json &j, const score_breakdown &breakdown);

/**
 * @brief 计算一次提交的综合得分
 * @param passed 通过的测试用例数
 * @param total 测试用例总数
 * @param total_time_ms 所有测试用例的运行时间之和
 * @param code_length 代码长度
 * @param existing 本场对战中已经写入的提交摘要，包括本次提交者之前的摘要
 * @param first_correct_awarded 本场对战是否已经有人拿到了首个全对加分
 */
score_breakdown score(int passed, int total, int64_t total_time_ms, size_t code_length,
                      const std::map<std::string, submission_summary> &existing,
                      bool first_correct_awarded, const scoring_config &config);

}  // namespace arena::battle
