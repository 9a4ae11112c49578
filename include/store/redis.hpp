#pragma once

#include <cpp_redis/cpp_redis>
#include <functional>
#include <mutex>
#include <vector>
#include "config.hpp"
#include "store/store.hpp"

namespace arena::store {

/**
 * @brief 表示一个 Redis 连接
 */
struct redis_conn {
    /**
     * @brief 根据 Redis 配置初始化 Redis 服务器连接
     */
    void init(const redis_config &config) noexcept;

    /**
     * @brief 在 callback 内发送 Redis 的操作
     * 该函数负责确保 Redis 连接会被建立。
     * 如果 Redis 服务器主动断开连接，那么这个函数将尝试重新创建连接，
     * 如果重试次数过多则抛出异常。
     * @param callback 你可以在 callback 内完成 Redis 的操作，并将 future 放入 replies 中
     * @return 按顺序排列的 replies 的结果
     */
    std::vector<cpp_redis::reply> execute(std::function<void(cpp_redis::client &, std::vector<std::future<cpp_redis::reply>> &)> callback);

    /**
     * @brief 尝试重连
     * @param force 真时强制重连
     */
    void reconnect(bool force = false);

private:
    redis_config config;
    std::mutex mut;
    cpp_redis::client redis_client;
};

/**
 * @brief 以 Redis 为主存储的房间存储
 * 房间状态以 JSON 保存在 room:<id>，房间码映射保存在 roomcode:<code>，
 * 两个键的过期时间都是 redis_config::state_ttl。
 */
class redis_room_store : public room_store {
public:
    explicit redis_room_store(const redis_config &config);

    std::optional<battle::room_state> load(const std::string &room_id) override;
    bool store(const battle::room_state &state) override;
    bool restore(const battle::room_state &state) override;
    std::optional<std::string> find_by_code(const std::string &code) override;
    void remove(const std::string &room_id) override;
    std::vector<battle::room_state> load_unfinished() override;

private:
    redis_config config;
    redis_conn conn;
};

}  // namespace arena::store
