#include "battle/commit_sequencer.hpp"

namespace arena::battle {
using namespace std;

commit_sequencer::ticket commit_sequencer::enter(const string &room_id) {
    lock_guard<mutex> guard(mut);
    uint64_t number = next_number++;
    pending[room_id].insert(number);
    return {room_id, number};
}

void commit_sequencer::wait_turn(const ticket &t) {
    unique_lock<mutex> lock(mut);
    cond.wait(lock, [&] {
        auto it = pending.find(t.room_id);
        return it == pending.end() || it->second.empty() || *it->second.begin() == t.number;
    });
}

void commit_sequencer::leave(const ticket &t) {
    {
        lock_guard<mutex> guard(mut);
        auto it = pending.find(t.room_id);
        if (it != pending.end()) {
            it->second.erase(t.number);
            if (it->second.empty()) pending.erase(it);
        }
    }
    cond.notify_all();
}

size_t commit_sequencer::outstanding(const string &room_id) {
    lock_guard<mutex> guard(mut);
    auto it = pending.find(room_id);
    return it == pending.end() ? 0 : it->second.size();
}

}  // namespace arena::battle
