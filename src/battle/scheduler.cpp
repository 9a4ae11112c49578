#include "battle/scheduler.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <chrono>
#include "common/utils.hpp"

namespace arena::battle {
using namespace std;

bool scheduler::timer::operator>(const timer &other) const {
    if (deadline_ms != other.deadline_ms) return deadline_ms > other.deadline_ms;
    return sequence > other.sequence;
}

scheduler::scheduler()
    : thread(&scheduler::run, this) {}

scheduler::~scheduler() {
    stop();
}

void scheduler::arm(const string &room_id, int64_t deadline_ms, callback cb) {
    {
        lock_guard<mutex> guard(mut);
        if (stopped) return;
        timers.push({deadline_ms, sequence++, room_id, move(cb)});
    }
    DLOG(INFO) << "Scheduler: armed timer for room " << room_id << " at " << deadline_ms;
    cond.notify_all();
}

void scheduler::stop() {
    {
        lock_guard<mutex> guard(mut);
        if (stopped) return;
        stopped = true;
    }
    cond.notify_all();
    if (thread.joinable()) thread.join();
}

size_t scheduler::pending() {
    lock_guard<mutex> guard(mut);
    return timers.size();
}

optional<int64_t> scheduler::next_deadline() {
    lock_guard<mutex> guard(mut);
    if (timers.empty()) return nullopt;
    return timers.top().deadline_ms;
}

void scheduler::run() {
    unique_lock<mutex> lock(mut);
    while (!stopped) {
        if (timers.empty()) {
            cond.wait(lock);
            continue;
        }
        int64_t now = now_ms();
        int64_t deadline = timers.top().deadline_ms;
        if (deadline > now) {
            cond.wait_for(lock, chrono::milliseconds(deadline - now));
            continue;
        }

        timer fired = timers.top();
        timers.pop();
        lock.unlock();
        try {
            fired.cb(fired.room_id);
        } catch (std::exception &e) {
            LOG(ERROR) << "Scheduler: timer of room " << fired.room_id << " failed, "
                       << boost::diagnostic_information(e);
        }
        lock.lock();
    }
}

}  // namespace arena::battle
