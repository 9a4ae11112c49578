#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "battle/room.hpp"

namespace arena::store {

/**
 * @brief 房间状态的存储
 * 主存储（Redis 或进程内存）保存所有活跃房间，持久化存储（MySQL）用于重启后恢复。
 * 实现必须是线程安全的。
 */
struct room_store {
    virtual ~room_store();

    /**
     * @brief 读取房间状态
     * @return 房间不存在或已过期时返回空
     */
    virtual std::optional<battle::room_state> load(const std::string &room_id) = 0;

    /**
     * @brief 写入房间状态
     * 存储中已有更新的版本时忽略本次写入
     * @return 是否写入成功
     */
    virtual bool store(const battle::room_state &state) = 0;

    /**
     * @brief 仅当房间不存在时写入，用于从持久化存储回填主存储
     * @return 是否写入成功
     */
    virtual bool restore(const battle::room_state &state) = 0;

    /**
     * @brief 根据房间码查找房间 id
     * @param code 已经规范化（大写）的房间码
     */
    virtual std::optional<std::string> find_by_code(const std::string &code) = 0;

    virtual void remove(const std::string &room_id) = 0;

    /**
     * @brief 列出所有未归档、未过期的房间，用于启动时恢复
     */
    virtual std::vector<battle::room_state> load_unfinished() = 0;
};

/**
 * @brief 一次正式提交的完整记录
 */
struct submission_record {
    std::string id;
    std::string room_id;
    std::string user_id;
    std::string problem_id;
    std::string language;
    std::string code;
    int passed = 0;
    int total = 0;
    int64_t total_time_ms = 0;
    int score = 0;
    int64_t submitted_at = 0;

    /**
     * @brief 每个测试用例的评测结果
     */
    nlohmann::json results = nlohmann::json::array();
};

void to_json(nlohmann::json &j, const submission_record &record);
void from_json(const nlohmann::json &j, submission_record &record);

struct submission_store {
    virtual ~submission_store();

    virtual void add(const submission_record &record) = 0;

    /**
     * @brief 按提交时间顺序列出房间中的所有提交
     */
    virtual std::vector<submission_record> list_by_room(const std::string &room_id) = 0;
};

struct leaderboard_entry {
    std::string user_id;
    std::string category;
    int score = 0;

    /**
     * @brief 获得该分数的提交信息，比如房间、题目、通过数
     */
    nlohmann::json details = nlohmann::json::object();
    int64_t updated_at = 0;
};

void to_json(nlohmann::json &j, const leaderboard_entry &entry);
void from_json(const nlohmann::json &j, leaderboard_entry &entry);

struct leaderboard_store {
    virtual ~leaderboard_store();

    /**
     * @brief 提交一个分数，只有严格大于已有分数时才替换
     * @return 是否替换了已有记录（或创建了新记录）
     */
    virtual bool offer(const leaderboard_entry &entry) = 0;

    /**
     * @brief 按分数从高到低列出某个类别的记录
     * @param limit 最多返回多少条
     */
    virtual std::vector<leaderboard_entry> list(const std::string &category, size_t limit) = 0;
};

}  // namespace arena::store
