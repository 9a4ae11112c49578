#include "store/memory_store.hpp"
#include <algorithm>
#include "common/utils.hpp"

namespace arena::store {
using namespace std;

memory_room_store::memory_room_store(int64_t ttl_ms, size_t capacity)
    : ttl_ms(ttl_ms), capacity(capacity) {}

bool memory_room_store::expired(const record &r, int64_t now) const {
    return r.expires_at > 0 && r.expires_at <= now;
}

void memory_room_store::erase(unordered_map<string, record>::iterator it) {
    auto code = codes.find(it->second.state.room.code);
    if (code != codes.end() && code->second == it->first)
        codes.erase(code);
    rooms.erase(it);
}

void memory_room_store::put(const battle::room_state &state, int64_t now) {
    if (capacity > 0 && !rooms.count(state.room.id)) {
        for (auto it = rooms.begin(); it != rooms.end();) {
            auto current = it++;
            if (expired(current->second, now)) erase(current);
        }
        while (rooms.size() >= capacity) {
            auto oldest = min_element(rooms.begin(), rooms.end(), [](auto &a, auto &b) {
                return a.second.touched_at < b.second.touched_at;
            });
            erase(oldest);
        }
    }
    rooms[state.room.id] = {state, ttl_ms > 0 ? now + ttl_ms : 0, now};
    codes[state.room.code] = state.room.id;
}

optional<battle::room_state> memory_room_store::load(const string &room_id) {
    lock_guard<mutex> guard(mut);
    auto it = rooms.find(room_id);
    if (it == rooms.end()) return {};
    if (expired(it->second, now_ms())) {
        erase(it);
        return {};
    }
    return it->second.state;
}

bool memory_room_store::store(const battle::room_state &state) {
    lock_guard<mutex> guard(mut);
    int64_t now = now_ms();
    auto it = rooms.find(state.room.id);
    if (it != rooms.end() && !expired(it->second, now) && it->second.state.version > state.version)
        return false;
    put(state, now);
    return true;
}

bool memory_room_store::restore(const battle::room_state &state) {
    lock_guard<mutex> guard(mut);
    int64_t now = now_ms();
    auto it = rooms.find(state.room.id);
    if (it != rooms.end() && !expired(it->second, now))
        return false;
    put(state, now);
    return true;
}

optional<string> memory_room_store::find_by_code(const string &code) {
    lock_guard<mutex> guard(mut);
    auto it = codes.find(code);
    if (it == codes.end()) return {};
    auto room = rooms.find(it->second);
    if (room == rooms.end()) return {};
    if (expired(room->second, now_ms())) {
        erase(room);
        return {};
    }
    return room->first;
}

void memory_room_store::remove(const string &room_id) {
    lock_guard<mutex> guard(mut);
    auto it = rooms.find(room_id);
    if (it != rooms.end()) erase(it);
}

vector<battle::room_state> memory_room_store::load_unfinished() {
    lock_guard<mutex> guard(mut);
    int64_t now = now_ms();
    vector<battle::room_state> result;
    for (auto &[id, r] : rooms)
        if (!expired(r, now) && r.state.status == battle::room_status::ACTIVE)
            result.push_back(r.state);
    return result;
}

size_t memory_room_store::size() {
    lock_guard<mutex> guard(mut);
    return rooms.size();
}

void memory_submission_store::add(const submission_record &record) {
    lock_guard<mutex> guard(mut);
    records.push_back(record);
}

vector<submission_record> memory_submission_store::list_by_room(const string &room_id) {
    lock_guard<mutex> guard(mut);
    vector<submission_record> result;
    for (auto &record : records)
        if (record.room_id == room_id)
            result.push_back(record);
    stable_sort(result.begin(), result.end(), [](auto &a, auto &b) {
        return a.submitted_at < b.submitted_at;
    });
    return result;
}

bool memory_leaderboard_store::offer(const leaderboard_entry &entry) {
    lock_guard<mutex> guard(mut);
    auto &category = entries[entry.category];
    auto it = category.find(entry.user_id);
    if (it != category.end() && it->second.score >= entry.score)
        return false;
    category[entry.user_id] = entry;
    return true;
}

vector<leaderboard_entry> memory_leaderboard_store::list(const string &category, size_t limit) {
    lock_guard<mutex> guard(mut);
    vector<leaderboard_entry> result;
    auto it = entries.find(category);
    if (it == entries.end()) return result;
    for (auto &[user, entry] : it->second)
        result.push_back(entry);
    stable_sort(result.begin(), result.end(), [](auto &a, auto &b) {
        return a.score > b.score;
    });
    if (result.size() > limit) result.resize(limit);
    return result;
}

}  // namespace arena::store
