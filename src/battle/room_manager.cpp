#include "battle/room_manager.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace arena::battle {
using namespace std;

// 心跳间隔内的重复访问不写入存储
static const int64_t TOUCH_INTERVAL_MS = 30000;

room_manager::room_manager(store::room_store &primary, store::room_store &durable,
                           room_actor_pool &actors, const battle_config &config)
    : primary(primary), durable(durable), actors(actors), config(config) {}

string room_manager::normalize_code(const string &code) {
    string result = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(code));
    if (result.size() > 8) result.resize(8);
    return result;
}

void room_manager::persist(const room_state &state) {
    primary.store(state);
    try {
        durable.store(state);
    } catch (std::exception &e) {
        LOG(WARNING) << "Room " << state.room.id << ": failed to persist version " << state.version
                     << ", " << boost::diagnostic_information(e);
    }
}

room_state room_manager::create_room(const room_options &options) {
    int64_t now = now_ms();
    room_state state;
    state.room.id = random_hex_id();
    for (int attempt = 0; attempt < 10; ++attempt) {
        state.room.code = random_room_code();
        if (!primary.find_by_code(state.room.code)) break;
    }
    state.room.name = options.name.empty() ? "Battle " + state.room.code : options.name;
    state.room.mode = options.mode;
    state.room.created_by = options.created_by;
    state.room.temporary = options.temporary;
    state.room.created_at = now;
    if (options.temporary)
        state.room.expires_at = now + (int64_t)config.room_ttl_hours * 3600 * 1000;

    participant host;
    host.user_id = options.created_by;
    host.role = participant_role::HOST;
    host.joined_at = host.last_seen = now;
    state.participants.push_back(host);

    state.battle = options.battle;
    state.version = 1;
    state.updated_at = now;

    return actors.post(state.room.id, [&] {
               persist(state);
               LOG(INFO) << "Room " << state.room.id << ": created by " << options.created_by
                         << " with code " << state.room.code;
               return state;
           })
        .get();
}

room_state room_manager::join_room_by_code(const string &code, const string &user_id) {
    string normalized = normalize_code(code);
    if (normalized.empty())
        BOOST_THROW_EXCEPTION(validation_error("Room code is required"));

    auto room_id = primary.find_by_code(normalized);
    if (!room_id) {
        try {
            room_id = durable.find_by_code(normalized);
        } catch (std::exception &e) {
            LOG(WARNING) << "Unable to look up room code " << normalized << ", " << boost::diagnostic_information(e);
        }
    }
    if (!room_id)
        BOOST_THROW_EXCEPTION(not_found_error("Room not found"));

    return mutate(*room_id, [&](const room_state &state) -> optional<room_state_patch> {
        if (state.status != room_status::ACTIVE)
            BOOST_THROW_EXCEPTION(conflict_error("Room is no longer active"));
        if (state.battle && state.battle->ended)
            BOOST_THROW_EXCEPTION(conflict_error("Battle has already ended"));

        int64_t now = now_ms();
        vector<participant> participants = state.participants;
        auto it = find_if(participants.begin(), participants.end(), [&](auto &p) { return p.user_id == user_id; });
        if (it != participants.end()) {
            if (it->active) return {};
            it->active = true;
            it->last_seen = now;
        } else {
            if (state.active_participants().size() >= config.max_participants)
                BOOST_THROW_EXCEPTION(conflict_error("Room is full"));
            participant p;
            p.user_id = user_id;
            p.joined_at = p.last_seen = now;
            participants.push_back(p);
        }
        LOG(INFO) << "Room " << state.room.id << ": " << user_id << " joined";
        room_state_patch patch;
        patch.participants = move(participants);
        return patch;
    });
}

room_state room_manager::leave_room(const string &room_id, const string &user_id) {
    return mutate(room_id, [&](const room_state &state) -> optional<room_state_patch> {
        const participant *p = state.find_participant(user_id);
        if (!p) BOOST_THROW_EXCEPTION(forbidden_error("Not a participant of this room"));
        if (!p->active) return {};

        vector<participant> participants = state.participants;
        for (auto &item : participants)
            if (item.user_id == user_id) item.active = false;
        LOG(INFO) << "Room " << room_id << ": " << user_id << " left";
        room_state_patch patch;
        patch.participants = move(participants);
        return patch;
    });
}

room_state room_manager::touch(const string &room_id, const string &user_id, int64_t now) {
    return mutate(room_id, [&](const room_state &state) -> optional<room_state_patch> {
        const participant *p = state.find_participant(user_id);
        if (!p || !p->active || p->last_seen + TOUCH_INTERVAL_MS > now) return {};
        vector<participant> participants = state.participants;
        for (auto &item : participants)
            if (item.user_id == user_id) item.last_seen = now;
        room_state_patch patch;
        patch.participants = move(participants);
        return patch;
    });
}

room_state room_manager::update_room_state(const string &room_id, const room_state_patch &patch) {
    return mutate(room_id, [&](const room_state &) { return optional<room_state_patch>(patch); });
}

room_state room_manager::mutate(const string &room_id, mutator fn) {
    return actors.post(room_id, [&]() -> room_state {
                     auto current = get_room_state(room_id);
                     if (!current)
                         BOOST_THROW_EXCEPTION(not_found_error("Room not found"));
                     auto patch = fn(*current);
                     if (!patch || patch->empty()) return *current;
                     room_state next = merge(*current, *patch, now_ms());
                     persist(next);
                     return next;
                 })
        .get();
}

optional<room_state> room_manager::get_room_state(const string &room_id) {
    if (auto state = primary.load(room_id))
        return state;

    optional<room_state> state;
    try {
        state = durable.load(room_id);
    } catch (std::exception &e) {
        LOG(WARNING) << "Room " << room_id << ": durable store unavailable, " << boost::diagnostic_information(e);
        return {};
    }
    if (state) {
        DLOG(INFO) << "Room " << room_id << ": repopulating primary store from durable store";
        primary.restore(*state);
    }
    return state;
}

vector<room_state> room_manager::recover() {
    vector<room_state> recovered;
    for (auto &state : durable.load_unfinished()) {
        primary.restore(state);
        recovered.push_back(state);
    }
    LOG(INFO) << "Recovered " << recovered.size() << " active rooms";
    return recovered;
}

size_t room_manager::prune_inactive(int64_t max_idle_ms, int64_t now) {
    size_t pruned = 0;
    for (auto &state : primary.load_unfinished()) {
        mutate(state.room.id, [&](const room_state &current) -> optional<room_state_patch> {
            vector<participant> participants = current.participants;
            size_t count = 0;
            for (auto &p : participants)
                if (p.active && p.last_seen + max_idle_ms < now)
                    p.active = false, ++count;
            if (count == 0) return {};
            pruned += count;
            room_state_patch patch;
            patch.participants = move(participants);
            return patch;
        });
    }
    return pruned;
}

size_t room_manager::expire_rooms(int64_t now) {
    size_t expired = 0;
    for (auto &state : primary.load_unfinished()) {
        if (state.room.expires_at == 0 || state.room.expires_at > now) continue;
        mutate(state.room.id, [&](const room_state &current) -> optional<room_state_patch> {
            if (current.status != room_status::ACTIVE) return {};
            ++expired;
            LOG(INFO) << "Room " << current.room.id << ": expired";
            room_state_patch patch;
            patch.status = room_status::EXPIRED;
            return patch;
        });
    }
    return expired;
}

}  // namespace arena::battle
