#include "battle/actor.hpp"
#include <glog/logging.h>

namespace arena::battle {
using namespace std;

room_actor_pool::room_actor_pool(size_t threads) {
    if (threads == 0) threads = 1;
    for (size_t i = 0; i < threads; ++i)
        queues.push_back(make_unique<concurrent_queue<function<void()>>>());
    for (size_t i = 0; i < threads; ++i)
        workers.emplace_back(&room_actor_pool::worker_loop, this, i);
}

room_actor_pool::~room_actor_pool() {
    stop();
}

void room_actor_pool::stop() {
    if (workers.empty()) return;
    // 空任务表示停止
    for (auto &queue : queues) queue->push(function<void()>());
    for (auto &worker : workers) worker.join();
    workers.clear();
}

concurrent_queue<function<void()>> &room_actor_pool::queue_of(const string &key) {
    return *queues[hash<string>()(key) % queues.size()];
}

void room_actor_pool::worker_loop(size_t index) {
    DLOG(INFO) << "Room actor " << index << " started";
    auto &queue = *queues[index];
    while (true) {
        function<void()> task = queue.pop();
        if (!task) break;
        // packaged_task 会捕获任务中的异常
        task();
    }
    DLOG(INFO) << "Room actor " << index << " stopped";
}

}  // namespace arena::battle
