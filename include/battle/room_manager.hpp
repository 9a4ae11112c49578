#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "battle/actor.hpp"
#include "battle/room.hpp"
#include "config.hpp"
#include "store/store.hpp"

namespace arena::battle {

/**
 * @brief 创建房间的参数
 */
struct room_options {
    std::string name;
    room_mode mode = room_mode::BATTLE;
    std::string created_by;
    bool temporary = true;
    std::optional<battle_state> battle;
};

/**
 * @brief 房间状态的读写入口
 * 所有修改都通过房间的串行执行器完成：读取当前状态、计算部分更新、合并，
 * 然后先写入主存储，再写入持久化存储。持久化存储写入失败只记录日志。
 */
class room_manager {
public:
    using mutator = std::function<std::optional<room_state_patch>(const room_state &)>;

    room_manager(store::room_store &primary, store::room_store &durable,
                 room_actor_pool &actors, const battle_config &config);

    /**
     * @brief 创建房间，创建者成为房主
     */
    room_state create_room(const room_options &options);

    /**
     * @brief 通过房间码加入房间
     * 重复加入是幂等的，已经离开的参与者会重新变为活跃状态。
     * @throw validation_error 房间码为空
     * @throw not_found_error 房间码不存在
     * @throw conflict_error 房间已满、已归档或对战已经结束
     */
    room_state join_room_by_code(const std::string &code, const std::string &user_id);

    /**
     * @brief 将参与者标记为不活跃
     */
    room_state leave_room(const std::string &room_id, const std::string &user_id);

    /**
     * @brief 更新参与者的最近活动时间
     */
    room_state touch(const std::string &room_id, const std::string &user_id, int64_t now);

    /**
     * @brief 合并部分更新到房间状态
     * @throw not_found_error 房间不存在
     */
    room_state update_room_state(const std::string &room_id, const room_state_patch &patch);

    /**
     * @brief 在房间的串行执行器上执行读-改-写
     * fn 返回空或空更新时不写入。fn 抛出的异常会传递给调用者。
     * @return 修改后的房间状态
     */
    room_state mutate(const std::string &room_id, mutator fn);

    /**
     * @brief 读取房间状态，主存储中不存在时从持久化存储读取并回填主存储
     */
    std::optional<room_state> get_room_state(const std::string &room_id);

    /**
     * @brief 从持久化存储恢复所有活跃房间到主存储
     * @return 恢复的房间，调用者需要重新设置它们的定时器
     */
    std::vector<room_state> recover();

    /**
     * @brief 将超过 max_idle_ms 没有活动的参与者标记为不活跃
     * @return 被标记的参与者数
     */
    size_t prune_inactive(int64_t max_idle_ms, int64_t now);

    /**
     * @brief 将超过过期时间的临时房间标记为过期
     * @return 过期的房间数
     */
    size_t expire_rooms(int64_t now);

    /**
     * @brief 规范化用户输入的房间码：去掉首尾空白，转为大写，最多 8 个字符
     */
    static std::string normalize_code(const std::string &code);

private:
    void persist(const room_state &state);

    store::room_store &primary;
    store::room_store &durable;
    room_actor_pool &actors;
    battle_config config;
};

}  // namespace arena::battle
