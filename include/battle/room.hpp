#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace arena::battle {

enum class room_mode {
    BATTLE,
    COLLABORATION
};

enum class participant_role {
    HOST,
    PARTICIPANT
};

/**
 * @brief 房间的生命周期状态，只会从 ACTIVE 变为 ARCHIVED 或 EXPIRED
 */
enum class room_status {
    ACTIVE,
    ARCHIVED,
    EXPIRED
};

/**
 * @brief 客户端看到的对战阶段，由 started/ended 和时间戳推导得到
 */
enum class battle_phase {
    /**
     * @brief 只有房主在房间中
     */
    WAITING,

    /**
     * @brief 有其他参与者加入，但还没有开始
     */
    LOBBY,

    /**
     * @brief 已经开始，但还没到开始时间
     */
    COUNTDOWN,

    ACTIVE,

    ENDED
};

NLOHMANN_JSON_SERIALIZE_ENUM(room_mode, {
    {room_mode::BATTLE, "battle"},
    {room_mode::COLLABORATION, "collaboration"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(participant_role, {
    {participant_role::HOST, "host"},
    {participant_role::PARTICIPANT, "participant"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(room_status, {
    {room_status::ACTIVE, "active"},
    {room_status::ARCHIVED, "archived"},
    {room_status::EXPIRED, "expired"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(battle_phase, {
    {battle_phase::WAITING, "WAITING"},
    {battle_phase::LOBBY, "LOBBY"},
    {battle_phase::COUNTDOWN, "COUNTDOWN"},
    {battle_phase::ACTIVE, "ACTIVE"},
    {battle_phase::ENDED, "ENDED"},
})

struct participant {
    std::string user_id;
    participant_role role = participant_role::PARTICIPANT;
    bool active = true;
    int64_t joined_at = 0;
    int64_t last_seen = 0;
};

/**
 * @brief 一个参与者在一场对战中最近一次评测的结果
 */
struct submission_summary {
    std::string user_id;
    int passed = 0;
    int total = 0;
    size_t code_length = 0;
    int64_t total_time_ms = 0;
    int composite_score = 0;
    int64_t submitted_at = 0;

    /**
     * @brief 是否通过了全部测试用例
     */
    bool perfect() const;
};

/**
 * @brief 嵌入在房间状态中的对战状态
 * ended 只会从 false 变为 true 一次，started_at 至多设置一次
 */
struct battle_state {
    std::string problem_id;
    std::string difficulty;
    std::string host;
    int duration_minutes = 10;
    int64_t duration_ms = 0;

    bool started = false;
    int64_t started_at = 0;
    bool ended = false;
    int64_t ended_at = 0;

    /**
     * @brief 结束的原因：timer、all_perfect 或 host
     */
    std::string end_reason;

    /**
     * @brief 第一个全部通过的参与者，设置后不再改变，为空表示还没有人全部通过
     */
    std::string first_correct_user;

    std::map<std::string, submission_summary> submissions;
    std::map<std::string, bool> ready;

    /**
     * @brief 对战的截止时间（毫秒时间戳）
     */
    int64_t deadline() const;
};

/**
 * @brief 房间的身份信息，创建后不再改变
 */
struct room_info {
    std::string id;

    /**
     * @brief 便于手动输入的房间码
     */
    std::string code;
    std::string name;
    room_mode mode = room_mode::BATTLE;
    std::string created_by;
    bool temporary = true;
    int64_t created_at = 0;

    /**
     * @brief 临时房间的过期时间，0 表示不过期
     */
    int64_t expires_at = 0;
};

/**
 * @brief 一个房间的完整状态，是主存储和持久化存储中保存的对象
 */
struct room_state {
    room_info room;
    std::vector<participant> participants;
    room_status status = room_status::ACTIVE;
    std::optional<battle_state> battle;

    /**
     * @brief 每次合并更新后递增，持久化存储只接受更新的版本
     */
    uint64_t version = 0;
    int64_t updated_at = 0;

    const participant *find_participant(const std::string &user_id) const;

    std::vector<std::string> active_participants() const;
};

/**
 * @brief 对房间状态的部分更新
 * 只在顶层字段上合并：给出的字段整体替换原有的值，未给出的字段保持不变。
 * 调用者需要读取、修改并写回整个嵌套对象。
 */
struct room_state_patch {
    std::optional<std::vector<participant>> participants;
    std::optional<room_status> status;
    std::optional<battle_state> battle;

    bool empty() const;
};

/**
 * @brief 将部分更新合并到当前状态
 * 合并时保证：已经结束的对战不会重新开始，结束时间和开始时间不会被改写，
 * 第一个全部通过的参与者一旦确定就不会被替换；
 * 已经归档或者过期的房间不会恢复为活跃状态。
 * @param now 更新时间
 * @return 合并后的状态，version 加一
 */
room_state merge(const room_state &current, const room_state_patch &patch, int64_t now);

battle_phase phase_of(const room_state &state, int64_t now);

void to_json(nlohmann::json &j, const participant &p);
void from_json(const nlohmann::json &j, participant &p);
void to_json(nlohmann::json &j, const submission_summary &summary);
void from_json(const nlohmann::json &j, submission_summary &summary);
void to_json(nlohmann::json &j, const battle_state &battle);
void from_json(const nlohmann::json &j, battle_state &battle);
void to_json(nlohmann::json &j, const room_info &room);
void from_json(const nlohmann::json &j, room_info &room);
void to_json(nlohmann::json &j, const room_state &state);
void from_json(const nlohmann::json &j, room_state &state);

}  // namespace arena::battle
