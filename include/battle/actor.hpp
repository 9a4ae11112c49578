#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"

namespace arena::battle {

/**
 * @brief 房间的串行执行器
 * 每个房间 id 固定映射到一个工作线程的队列上，同一个房间的所有修改按投递顺序依次执行，
 * 不同房间的修改可以在不同线程上并行执行。
 * 投递的任务不能再向同一个执行器投递任务并等待结果，否则可能死锁。
 */
class room_actor_pool {
public:
    explicit room_actor_pool(size_t threads);
    ~room_actor_pool();

    room_actor_pool(const room_actor_pool &) = delete;
    room_actor_pool &operator=(const room_actor_pool &) = delete;

    /**
     * @brief 将任务投递到房间对应的队列中
     * @return 任务的结果，任务抛出的异常会在 get() 时重新抛出
     */
    template <typename Func>
    auto post(const std::string &key, Func &&func) -> std::future<decltype(func())> {
        using result_type = decltype(func());
        auto task = std::make_shared<std::packaged_task<result_type()>>(std::forward<Func>(func));
        auto future = task->get_future();
        queue_of(key).push([task]() { (*task)(); });
        return future;
    }

    /**
     * @brief 停止所有工作线程，已经投递的任务会先执行完成
     */
    void stop();

private:
    concurrent_queue<std::function<void()>> &queue_of(const std::string &key);

    void worker_loop(size_t index);

    std::vector<std::unique_ptr<concurrent_queue<std::function<void()>>>> queues;
    std::vector<std::thread> workers;
};

}  // namespace arena::battle
