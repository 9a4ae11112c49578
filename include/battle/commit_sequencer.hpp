#pragma once

#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>

namespace arena::battle {

/**
 * @brief 按到达顺序提交评测结果
 * 提交到达时领取号码，评测可以并行进行，但写入结果时必须等待同一房间中
 * 所有更早领取号码的提交先写入或放弃。
 */
class commit_sequencer {
public:
    struct ticket {
        std::string room_id;
        uint64_t number;
    };

    /**
     * @brief 领取号码
     */
    ticket enter(const std::string &room_id);

    /**
     * @brief 阻塞直到该号码是房间中最小的未完成号码
     */
    void wait_turn(const ticket &t);

    /**
     * @brief 归还号码，无论提交成功与否都必须调用
     */
    void leave(const ticket &t);

    /**
     * @brief 房间中尚未归还的号码数
     */
    size_t outstanding(const std::string &room_id);

private:
    std::mutex mut;
    std::condition_variable cond;
    uint64_t next_number = 0;
    std::map<std::string, std::set<uint64_t>> pending;
};

}  // namespace arena::battle
