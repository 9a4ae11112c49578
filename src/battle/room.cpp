#include "battle/room.hpp"
#include "common/json_utils.hpp"

namespace arena::battle {
using namespace std;
using namespace nlohmann;

bool submission_summary::perfect() const {
    return total > 0 && passed == total;
}

int64_t battle_state::deadline() const {
    return started_at + duration_ms;
}

const participant *room_state::find_participant(const string &user_id) const {
    for (auto &p : participants)
        if (p.user_id == user_id)
            return &p;
    return nullptr;
}

vector<string> room_state::active_participants() const {
    vector<string> result;
    for (auto &p : participants)
        if (p.active)
            result.push_back(p.user_id);
    return result;
}

bool room_state_patch::empty() const {
    return !participants && !status && !battle;
}

room_state merge(const room_state &current, const room_state_patch &patch, int64_t now) {
    room_state merged = current;
    if (patch.participants)
        merged.participants = *patch.participants;

    if (patch.status && (current.status == room_status::ACTIVE || *patch.status != room_status::ACTIVE))
        merged.status = *patch.status;

    if (patch.battle) {
        battle_state incoming = *patch.battle;
        if (current.battle) {
            const battle_state &previous = *current.battle;
            if (previous.started) {
                incoming.started = true;
                incoming.started_at = previous.started_at;
                incoming.duration_ms = previous.duration_ms;
            }
            if (!previous.first_correct_user.empty())
                incoming.first_correct_user = previous.first_correct_user;
            if (previous.ended) {
                incoming.ended = true;
                incoming.ended_at = previous.ended_at;
                incoming.end_reason = previous.end_reason;
            }
        }
        merged.battle = move(incoming);
    }

    merged.version = current.version + 1;
    merged.updated_at = now;
    return merged;
}

battle_phase phase_of(const room_state &state, int64_t now) {
    if (state.battle) {
        const battle_state &battle = *state.battle;
        if (battle.ended) return battle_phase::ENDED;
        if (battle.started)
            return now < battle.started_at ? battle_phase::COUNTDOWN : battle_phase::ACTIVE;
    }
    return state.active_participants().size() > 1 ? battle_phase::LOBBY : battle_phase::WAITING;
}

void to_json(json &j, const participant &p) {
    j = {{"userId", p.user_id},
         {"role", p.role},
         {"active", p.active},
         {"joinedAt", p.joined_at},
         {"lastSeen", p.last_seen}};
}

void from_json(const json &j, participant &p) {
    j.at("userId").get_to(p.user_id);
    assign_optional(j, p.role, "role");
    assign_optional(j, p.active, "active");
    assign_optional(j, p.joined_at, "joinedAt");
    assign_optional(j, p.last_seen, "lastSeen");
}

void to_json(json &j, const submission_summary &summary) {
    j = {{"userId", summary.user_id},
         {"passed", summary.passed},
         {"total", summary.total},
         {"codeLength", summary.code_length},
         {"totalTimeMs", summary.total_time_ms},
         {"compositeScore", summary.composite_score},
         {"submittedAt", summary.submitted_at}};
}

void from_json(const json &j, submission_summary &summary) {
    j.at("userId").get_to(summary.user_id);
    j.at("passed").get_to(summary.passed);
    j.at("total").get_to(summary.total);
    assign_optional(j, summary.code_length, "codeLength");
    assign_optional(j, summary.total_time_ms, "totalTimeMs");
    assign_optional(j, summary.composite_score, "compositeScore");
    assign_optional(j, summary.submitted_at, "submittedAt");
}

void to_json(json &j, const battle_state &battle) {
    j = {{"problemId", battle.problem_id},
         {"difficulty", battle.difficulty},
         {"host", battle.host},
         {"durationMinutes", battle.duration_minutes},
         {"durationMs", battle.duration_ms},
         {"started", battle.started},
         {"startedAt", battle.started_at},
         {"ended", battle.ended},
         {"endedAt", battle.ended_at},
         {"endReason", battle.end_reason},
         {"firstCorrectUser", battle.first_correct_user},
         {"submissions", battle.submissions},
         {"ready", battle.ready}};
}

void from_json(const json &j, battle_state &battle) {
    assign_optional(j, battle.problem_id, "problemId");
    assign_optional(j, battle.difficulty, "difficulty");
    assign_optional(j, battle.host, "host");
    assign_optional(j, battle.duration_minutes, "durationMinutes");
    assign_optional(j, battle.duration_ms, "durationMs");
    assign_optional(j, battle.started, "started");
    assign_optional(j, battle.started_at, "startedAt");
    assign_optional(j, battle.ended, "ended");
    assign_optional(j, battle.ended_at, "endedAt");
    assign_optional(j, battle.end_reason, "endReason");
    assign_optional(j, battle.first_correct_user, "firstCorrectUser");
    if (exists(j, "submissions")) j.at("submissions").get_to(battle.submissions);
    if (exists(j, "ready")) j.at("ready").get_to(battle.ready);
}

void to_json(json &j, const room_info &room) {
    j = {{"id", room.id},
         {"code", room.code},
         {"name", room.name},
         {"mode", room.mode},
         {"createdBy", room.created_by},
         {"temporary", room.temporary},
         {"createdAt", room.created_at},
         {"expiresAt", room.expires_at}};
}

void from_json(const json &j, room_info &room) {
    j.at("id").get_to(room.id);
    j.at("code").get_to(room.code);
    assign_optional(j, room.name, "name");
    assign_optional(j, room.mode, "mode");
    assign_optional(j, room.created_by, "createdBy");
    assign_optional(j, room.temporary, "temporary");
    assign_optional(j, room.created_at, "createdAt");
    assign_optional(j, room.expires_at, "expiresAt");
}

void to_json(json &j, const room_state &state) {
    j = {{"room", state.room},
         {"participants", state.participants},
         {"status", state.status},
         {"version", state.version},
         {"updatedAt", state.updated_at}};
    if (state.battle)
        j["battle"] = *state.battle;
    else
        j["battle"] = nullptr;
}

void from_json(const json &j, room_state &state) {
    j.at("room").get_to(state.room);
    if (exists(j, "participants")) j.at("participants").get_to(state.participants);
    assign_optional(j, state.status, "status");
    if (exists(j, "battle"))
        state.battle = j.at("battle").get<battle_state>();
    else
        state.battle.reset();
    assign_optional(j, state.version, "version");
    assign_optional(j, state.updated_at, "updatedAt");
}

}  // namespace arena::battle
