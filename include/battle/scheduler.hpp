#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace arena::battle {

/**
 * @brief 对战截止时间的定时器
 * 只有一个定时线程，按截止时间顺序触发回调。
 * 没有取消接口：回调触发时必须自行检查房间状态，过期的触发应当什么也不做。
 */
class scheduler {
public:
    using callback = std::function<void(const std::string &room_id)>;

    scheduler();
    ~scheduler();

    /**
     * @brief 在 deadline_ms（Unix 毫秒时间戳）到达时调用 cb
     * 截止时间已经过去时会尽快触发
     */
    void arm(const std::string &room_id, int64_t deadline_ms, callback cb);

    /**
     * @brief 停止定时线程，尚未触发的定时器被丢弃
     */
    void stop();

    size_t pending();

    /**
     * @brief 最早的尚未触发的截止时间
     */
    std::optional<int64_t> next_deadline();

private:
    struct timer {
        int64_t deadline_ms;
        uint64_t sequence;
        std::string room_id;
        callback cb;

        bool operator>(const timer &other) const;
    };

    void run();

    std::mutex mut;
    std::condition_variable cond;
    bool stopped = false;
    uint64_t sequence = 0;
    std::priority_queue<timer, std::vector<timer>, std::greater<timer>> timers;
    std::thread thread;
};

}  // namespace arena::battle
