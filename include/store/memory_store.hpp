#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include "store/store.hpp"

namespace arena::store {

/**
 * @brief 保存在进程内存中的房间存储
 * 没有配置 Redis 或 MySQL 时使用，也用于测试。
 * 记录在 ttl_ms 之后过期，超过容量时淘汰最久没有更新的房间。
 */
class memory_room_store : public room_store {
public:
    /**
     * @param ttl_ms 记录的存活时间，0 表示不过期
     * @param capacity 最多保存多少个房间，0 表示不限制
     */
    explicit memory_room_store(int64_t ttl_ms = 0, size_t capacity = 0);

    std::optional<battle::room_state> load(const std::string &room_id) override;
    bool store(const battle::room_state &state) override;
    bool restore(const battle::room_state &state) override;
    std::optional<std::string> find_by_code(const std::string &code) override;
    void remove(const std::string &room_id) override;
    std::vector<battle::room_state> load_unfinished() override;

    size_t size();

private:
    struct record {
        battle::room_state state;
        int64_t expires_at;
        int64_t touched_at;
    };

    void put(const battle::room_state &state, int64_t now);
    void erase(std::unordered_map<std::string, record>::iterator it);
    bool expired(const record &r, int64_t now) const;

    int64_t ttl_ms;
    size_t capacity;

    std::mutex mut;
    std::unordered_map<std::string, record> rooms;
    std::unordered_map<std::string, std::string> codes;
};

class memory_submission_store : public submission_store {
public:
    void add(const submission_record &record) override;
    std::vector<submission_record> list_by_room(const std::string &room_id) override;

private:
    std::mutex mut;
    std::vector<submission_record> records;
};

class memory_leaderboard_store : public leaderboard_store {
public:
    bool offer(const leaderboard_entry &entry) override;
    std::vector<leaderboard_entry> list(const std::string &category, size_t limit) override;

private:
    std::mutex mut;
    // category -> user_id -> entry
    std::map<std::string, std::map<std::string, leaderboard_entry>> entries;
};

}  // namespace arena::store
