#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "battle/commit_sequencer.hpp"
#include "battle/leaderboard.hpp"
#include "battle/problem.hpp"
#include "battle/room_manager.hpp"
#include "battle/runner.hpp"
#include "battle/scheduler.hpp"
#include "config.hpp"
#include "store/store.hpp"

namespace arena::battle {

struct create_request {
    std::string user_id;
    std::string name;
    std::string difficulty;

    /**
     * @brief 为空时随机选择该难度的题目
     */
    std::string problem_id;

    /**
     * @brief 对战时长（分钟），不大于 0 时使用默认值
     */
    int duration_minutes = 0;
};

/**
 * @brief 单个测试用例的评测结果
 */
struct case_result {
    nlohmann::json args;
    nlohmann::json expected;
    nlohmann::json actual;
    bool passed = false;

    /**
     * @brief 为空表示没有错误
     */
    std::string error;
    int64_t time_ms = 0;
};

void to_json(nlohmann::json &j, const case_result &result);

/**
 * @brief 对战服务，实现对战的生命周期
 * 所有返回 JSON 的函数返回值即为 REST 接口的响应体。
 * 出错时抛出 validation_error、not_found_error、forbidden_error 或 conflict_error。
 */
class battle_service {
public:
    battle_service(room_manager &rooms, scheduler &timers, commit_sequencer &sequencer,
                   const problem_registry &problems, solution_runner &runner,
                   store::submission_store &submissions, leaderboard &ranking,
                   const battle_config &config, const scoring_config &scoring,
                   const evaluator_config &limits);

    nlohmann::json list_problems(const std::string &difficulty) const;

    nlohmann::json create(const create_request &request);

    nlohmann::json join(const std::string &code, const std::string &user_id);

    nlohmann::json leave(const std::string &room_id, const std::string &user_id);

    /**
     * @brief 设置参与者的准备状态
     */
    nlohmann::json ready(const std::string &room_id, const std::string &user_id, bool is_ready);

    /**
     * @brief 开始对战，只有房主可以开始，重复调用不会重置开始时间
     */
    nlohmann::json start(const std::string &room_id, const std::string &user_id);

    /**
     * @brief 用公开的测试用例运行代码，不计分
     */
    nlohmann::json test(const std::string &room_id, const std::string &user_id,
                        const std::string &code, const std::string &language);

    /**
     * @brief 正式提交，运行所有测试用例并计分
     * 同一房间的提交按到达顺序写入结果。写入后如果所有活跃参与者都全部通过，对战结束。
     */
    nlohmann::json submit(const std::string &room_id, const std::string &user_id,
                          const std::string &code, const std::string &language);

    /**
     * @brief 房主手动结束对战
     */
    nlohmann::json end(const std::string &room_id, const std::string &user_id);

    nlohmann::json lobby(const std::string &room_id, const std::string &user_id);

    /**
     * @brief 按综合得分排名的结果
     */
    nlohmann::json results(const std::string &room_id);

    /**
     * @brief 按提交时间列出房间中的全部提交
     * 对战结束之前，其他参与者提交的代码不会返回
     */
    nlohmann::json submission_history(const std::string &room_id, const std::string &user_id);

    nlohmann::json leaderboard_list(size_t limit);

    /**
     * @brief 截止时间到达时的回调，对战已经结束时什么也不做
     */
    void expire(const std::string &room_id);

    /**
     * @brief 归档已经结束的对战房间
     */
    void archive(const std::string &room_id);

    /**
     * @brief 从持久化存储恢复房间并重新设置定时器
     */
    void recover();

    /**
     * @brief 定期清理不活跃的参与者和过期的房间
     */
    void schedule_maintenance();

private:
    room_state require_room(const std::string &room_id);
    const problem &require_problem(const battle_state &battle) const;
    void check_code(const std::string &code, const std::string &language) const;
    std::vector<case_result> evaluate(const problem &p, const std::string &code,
                                      const std::string &language, bool include_hidden);
    void arm_deadline(const room_state &state);
    void arm_archive(const room_state &state);
    nlohmann::json end_battle(const std::string &room_id, const std::string &reason,
                              const std::string &user_id);

    room_manager &rooms;
    scheduler &timers;
    commit_sequencer &sequencer;
    const problem_registry &problems;
    solution_runner &runner;
    store::submission_store &submissions;
    leaderboard &ranking;
    battle_config config;
    scoring_config scoring;
    evaluator_config limits;
};

}  // namespace arena::battle
