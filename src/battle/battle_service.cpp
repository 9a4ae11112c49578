#include "battle/battle_service.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include "battle/scoring.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "sandbox/language.hpp"

namespace arena::battle {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const case_result &result) {
    j = {{"args", result.args},
         {"expected", result.expected},
         {"actual", result.actual},
         {"isPassed", result.passed},
         {"timeMs", result.time_ms}};
    if (result.error.empty())
        j["error"] = nullptr;
    else
        j["error"] = result.error;
}

battle_service::battle_service(room_manager &rooms, scheduler &timers, commit_sequencer &sequencer,
                               const problem_registry &problems, solution_runner &runner,
                               store::submission_store &submissions, leaderboard &ranking,
                               const battle_config &config, const scoring_config &scoring,
                               const evaluator_config &limits)
    : rooms(rooms), timers(timers), sequencer(sequencer), problems(problems), runner(runner),
      submissions(submissions), ranking(ranking), config(config), scoring(scoring), limits(limits) {}

static json problem_brief(const problem &p) {
    return {{"id", p.id}, {"title", p.title}, {"difficulty", p.difficulty}};
}

room_state battle_service::require_room(const string &room_id) {
    if (!is_hex_id(room_id))
        BOOST_THROW_EXCEPTION(validation_error("Invalid roomId"));
    auto state = rooms.get_room_state(room_id);
    if (!state)
        BOOST_THROW_EXCEPTION(not_found_error("Room not found"));
    return *state;
}

const problem &battle_service::require_problem(const battle_state &battle) const {
    const problem *p = problems.find(battle.problem_id);
    if (!p)
        BOOST_THROW_EXCEPTION(not_found_error("Unknown battle problem " + battle.problem_id));
    return *p;
}

static const battle_state &require_battle(const room_state &state) {
    if (!state.battle)
        BOOST_THROW_EXCEPTION(not_found_error("Battle not found"));
    return *state.battle;
}

static void require_participant(const room_state &state, const string &user_id) {
    const participant *p = state.find_participant(user_id);
    if (!p || !p->active)
        BOOST_THROW_EXCEPTION(forbidden_error("Not a participant of this battle"));
}

static void require_host(const room_state &state, const string &user_id) {
    const participant *p = state.find_participant(user_id);
    bool is_host = state.room.created_by == user_id || (p && p->role == participant_role::HOST);
    if (!is_host)
        BOOST_THROW_EXCEPTION(forbidden_error("Only the host can do this"));
}

void battle_service::check_code(const string &code, const string &language) const {
    if (code.empty())
        BOOST_THROW_EXCEPTION(validation_error("Code is required"));
    if (code.size() > limits.max_code_size)
        BOOST_THROW_EXCEPTION(validation_error("Code too large"));
    if (!sandbox::find_language(language))
        BOOST_THROW_EXCEPTION(validation_error("Language " + language + " is not supported"));
}

vector<case_result> battle_service::evaluate(const problem &p, const string &code,
                                             const string &language, bool include_hidden) {
    vector<case_result> results;
    for (auto &tc : p.tests) {
        if (tc.hidden && !include_hidden) continue;
        case_result result;
        result.args = tc.args;
        result.expected = tc.expected;
        elapsed_time timer;
        try {
            result.actual = runner.call(language, code, p.entry_point, tc.args);
        } catch (validation_error &e) {
            result.error = e.what();
        } catch (evaluation_error &e) {
            result.error = e.what();
        }
        result.time_ms = timer.duration<chrono::milliseconds>().count();
        result.passed = result.error.empty() && result.actual == tc.expected;
        results.push_back(move(result));
    }
    return results;
}

void battle_service::arm_deadline(const room_state &state) {
    timers.arm(state.room.id, state.battle->deadline(), [this](const string &room_id) {
        expire(room_id);
    });
}

void battle_service::arm_archive(const room_state &state) {
    int64_t at = state.battle->ended_at + (int64_t)config.archive_grace_minutes * 60000;
    timers.arm(state.room.id, at, [this](const string &room_id) {
        archive(room_id);
    });
}

json battle_service::list_problems(const string &difficulty) const {
    json list = json::array();
    for (const problem *p : problems.list(difficulty))
        list.push_back(problem_brief(*p));
    return {{"success", true}, {"problems", list}};
}

json battle_service::create(const create_request &request) {
    if (request.user_id.empty())
        BOOST_THROW_EXCEPTION(validation_error("userId is required"));

    string difficulty = sanitize_difficulty(request.difficulty);
    const problem *p = nullptr;
    if (!request.problem_id.empty()) {
        p = problems.find(request.problem_id);
        if (!p) BOOST_THROW_EXCEPTION(validation_error("Unknown battle problem"));
        difficulty = p->difficulty;
    } else {
        p = problems.random(difficulty);
        if (!p) BOOST_THROW_EXCEPTION(not_found_error("No problems for difficulty " + difficulty));
    }

    int minutes = request.duration_minutes > 0 ? request.duration_minutes : config.default_duration_minutes;
    minutes = clamp(minutes, config.min_duration_minutes, config.max_duration_minutes);

    battle_state battle;
    battle.problem_id = p->id;
    battle.difficulty = difficulty;
    battle.host = request.user_id;
    battle.duration_minutes = minutes;
    battle.duration_ms = (int64_t)minutes * 60000;

    room_options options;
    options.name = request.name;
    options.created_by = request.user_id;
    options.battle = battle;
    room_state state = rooms.create_room(options);
    LOG(INFO) << "Battle " << state.room.id << ": created with problem " << p->id << " for " << minutes << " minutes";

    return {{"success", true},
            {"roomId", state.room.id},
            {"roomCode", state.room.code},
            {"problem", problem_brief(*p)},
            {"durationMinutes", minutes},
            {"state", phase_of(state, now_ms())}};
}

json battle_service::join(const string &code, const string &user_id) {
    if (user_id.empty())
        BOOST_THROW_EXCEPTION(validation_error("userId is required"));
    room_state state = rooms.join_room_by_code(code, user_id);
    const participant *p = state.find_participant(user_id);
    return {{"success", true},
            {"roomId", state.room.id},
            {"roomCode", state.room.code},
            {"state", phase_of(state, now_ms())},
            {"role", p ? p->role : participant_role::PARTICIPANT}};
}

json battle_service::leave(const string &room_id, const string &user_id) {
    require_room(room_id);
    room_state state = rooms.leave_room(room_id, user_id);
    return {{"success", true}, {"state", phase_of(state, now_ms())}};
}

json battle_service::ready(const string &room_id, const string &user_id, bool is_ready) {
    require_room(room_id);
    room_state state = rooms.mutate(room_id, [&](const room_state &current) -> optional<room_state_patch> {
        require_participant(current, user_id);
        battle_state battle = require_battle(current);
        if (battle.started)
            BOOST_THROW_EXCEPTION(conflict_error("Battle already started"));
        auto it = battle.ready.find(user_id);
        if (it != battle.ready.end() && it->second == is_ready) return {};
        battle.ready[user_id] = is_ready;
        room_state_patch patch;
        patch.battle = battle;
        return patch;
    });
    size_t num_ready = 0;
    for (auto &[user, flag] : state.battle->ready)
        if (flag) ++num_ready;
    return {{"success", true}, {"ready", is_ready}, {"numReady", num_ready}};
}

json battle_service::start(const string &room_id, const string &user_id) {
    require_room(room_id);
    bool newly_started = false;
    room_state state = rooms.mutate(room_id, [&](const room_state &current) -> optional<room_state_patch> {
        require_host(current, user_id);
        battle_state battle = require_battle(current);
        if (battle.ended)
            BOOST_THROW_EXCEPTION(conflict_error("Battle has already ended"));
        if (battle.started) return {};

        battle.started = true;
        battle.started_at = now_ms() + config.countdown_ms;
        battle.duration_ms = (int64_t)battle.duration_minutes * 60000;
        newly_started = true;
        room_state_patch patch;
        patch.battle = battle;
        return patch;
    });

    const battle_state &battle = *state.battle;
    if (!newly_started)
        return {{"success", true}, {"message", "Battle already started"},
                {"startedAt", battle.started_at}, {"durationMinutes", battle.duration_minutes}};

    arm_deadline(state);
    LOG(INFO) << "Battle " << room_id << ": started by " << user_id << ", deadline " << battle.deadline();
    return {{"success", true}, {"startedAt", battle.started_at}, {"durationMinutes", battle.duration_minutes}};
}

json battle_service::test(const string &room_id, const string &user_id,
                          const string &code, const string &language) {
    room_state state = require_room(room_id);
    const battle_state &battle = require_battle(state);
    require_participant(state, user_id);
    if (battle.ended)
        BOOST_THROW_EXCEPTION(conflict_error("Battle has already ended"));
    check_code(code, language);

    const problem &p = require_problem(battle);
    vector<case_result> results = evaluate(p, code, language, false);
    int passed = count_if(results.begin(), results.end(), [](auto &r) { return r.passed; });
    int64_t total_time = 0;
    for (auto &r : results) total_time += r.time_ms;
    DLOG(INFO) << "Battle " << room_id << ": " << user_id << " tested " << passed << "/" << results.size();
    return {{"success", true},
            {"total", results.size()},
            {"passed", passed},
            {"totalTimeMs", total_time},
            {"results", results}};
}

json battle_service::submit(const string &room_id, const string &user_id,
                            const string &code, const string &language) {
    room_state state = require_room(room_id);
    const battle_state &battle = require_battle(state);
    require_participant(state, user_id);
    if (battle.ended)
        BOOST_THROW_EXCEPTION(conflict_error("Battle has already ended"));
    if (!battle.started || now_ms() < battle.started_at)
        BOOST_THROW_EXCEPTION(conflict_error("Battle has not started"));
    if (now_ms() >= battle.deadline()) {
        // 截止定时器可能延迟或者丢失
        end_battle(room_id, "timer", "");
        BOOST_THROW_EXCEPTION(conflict_error("Battle time is up"));
    }
    check_code(code, language);

    commit_sequencer::ticket ticket = sequencer.enter(room_id);
    defer { sequencer.leave(ticket); };

    const problem &p = require_problem(battle);
    vector<case_result> results = evaluate(p, code, language, true);
    int total = (int)results.size();
    int passed = count_if(results.begin(), results.end(), [](auto &r) { return r.passed; });
    int64_t total_time = 0;
    for (auto &r : results) total_time += r.time_ms;

    sequencer.wait_turn(ticket);

    score_breakdown breakdown;
    bool ended_now = false;
    int64_t submitted_at = now_ms();
    room_state committed = rooms.mutate(room_id, [&](const room_state &current) -> optional<room_state_patch> {
        battle_state next = require_battle(current);
        if (next.ended)
            BOOST_THROW_EXCEPTION(conflict_error("Battle has already ended"));

        breakdown = score(passed, total, total_time, code.size(), next.submissions,
                          !next.first_correct_user.empty(), scoring);
        if (next.first_correct_user.empty() && total > 0 && passed == total)
            next.first_correct_user = user_id;
        submission_summary summary;
        summary.user_id = user_id;
        summary.passed = passed;
        summary.total = total;
        summary.code_length = code.size();
        summary.total_time_ms = total_time;
        summary.composite_score = breakdown.total;
        summary.submitted_at = submitted_at;
        next.submissions[user_id] = summary;

        auto active = current.active_participants();
        bool all_perfect = !active.empty() && all_of(active.begin(), active.end(), [&](auto &user) {
            auto it = next.submissions.find(user);
            return it != next.submissions.end() && it->second.perfect();
        });
        if (all_perfect) {
            next.ended = true;
            next.ended_at = submitted_at;
            next.end_reason = "all_perfect";
            ended_now = true;
        }
        room_state_patch patch;
        patch.battle = next;
        return patch;
    });

    LOG(INFO) << "Battle " << room_id << ": " << user_id << " submitted " << passed << "/" << total
              << " in " << total_time << "ms, score " << breakdown.total;

    store::submission_record record;
    record.id = random_hex_id();
    record.room_id = room_id;
    record.user_id = user_id;
    record.problem_id = p.id;
    record.language = language;
    record.code = code;
    record.passed = passed;
    record.total = total;
    record.total_time_ms = total_time;
    record.score = breakdown.total;
    record.submitted_at = submitted_at;
    record.results = results;
    try {
        submissions.add(record);
    } catch (std::exception &e) {
        LOG(WARNING) << "Battle " << room_id << ": unable to save submission " << record.id << ", "
                     << boost::diagnostic_information(e);
    }

    try {
        json details = {{"roomId", room_id}, {"problemId", p.id}, {"passed", passed}, {"total", total}, {"timeMs", total_time}};
        ranking.offer(user_id, BATTLE_CATEGORY, breakdown.total, details, submitted_at);
    } catch (std::exception &e) {
        LOG(WARNING) << "Battle " << room_id << ": unable to update leaderboard, " << boost::diagnostic_information(e);
    }

    if (ended_now) {
        LOG(INFO) << "Battle " << room_id << ": ended, every participant passed all tests";
        arm_archive(committed);
    }

    return {{"success", true},
            {"total", total},
            {"passed", passed},
            {"results", results},
            {"score", breakdown.total},
            {"scoreBreakdown", breakdown},
            {"timeMs", total_time},
            {"submissionId", record.id},
            {"ended", committed.battle->ended}};
}

json battle_service::end_battle(const string &room_id, const string &reason, const string &user_id) {
    bool ended_now = false;
    room_state state = rooms.mutate(room_id, [&](const room_state &current) -> optional<room_state_patch> {
        if (!user_id.empty()) require_host(current, user_id);
        battle_state battle = require_battle(current);
        if (battle.ended) return {};
        // 定时器触发时对战一定已经开始
        if (reason == "timer" && !battle.started) return {};
        battle.ended = true;
        battle.ended_at = now_ms();
        battle.end_reason = reason;
        ended_now = true;
        room_state_patch patch;
        patch.battle = battle;
        return patch;
    });

    if (!ended_now)
        return {{"success", true}, {"message", "Battle already ended"}};

    LOG(INFO) << "Battle " << room_id << ": ended, reason " << reason;
    arm_archive(state);
    return {{"success", true}, {"message", "Battle ended successfully"}, {"endedAt", state.battle->ended_at}};
}

json battle_service::end(const string &room_id, const string &user_id) {
    require_room(room_id);
    return end_battle(room_id, "host", user_id);
}

void battle_service::expire(const string &room_id) {
    end_battle(room_id, "timer", "");
}

void battle_service::archive(const string &room_id) {
    rooms.mutate(room_id, [&](const room_state &current) -> optional<room_state_patch> {
        if (current.status != room_status::ACTIVE || !current.battle || !current.battle->ended) return {};
        LOG(INFO) << "Battle " << room_id << ": archived";
        room_state_patch patch;
        patch.status = room_status::ARCHIVED;
        return patch;
    });
}

json battle_service::lobby(const string &room_id, const string &user_id) {
    room_state state = require_room(room_id);
    int64_t now = now_ms();
    if (!user_id.empty() && state.find_participant(user_id))
        state = rooms.touch(room_id, user_id, now);

    json participants = json::array();
    for (auto &p : state.participants) {
        bool is_ready = false;
        if (state.battle) {
            auto it = state.battle->ready.find(p.user_id);
            is_ready = it != state.battle->ready.end() && it->second;
        }
        participants.push_back({{"userId", p.user_id},
                                {"role", p.role},
                                {"active", p.active},
                                {"ready", is_ready},
                                {"joinedAt", p.joined_at},
                                {"submitted", state.battle && state.battle->submissions.count(p.user_id) > 0}});
    }

    json battle = nullptr;
    if (state.battle) {
        const battle_state &b = *state.battle;
        size_t num_ready = 0;
        for (auto &[user, flag] : b.ready)
            if (flag) ++num_ready;
        const problem *p = problems.find(b.problem_id);
        battle = {{"started", b.started},
                  {"ended", b.ended},
                  {"durationMinutes", b.duration_minutes},
                  {"problemId", b.problem_id},
                  {"problem", p ? problem_brief(*p) : json(nullptr)},
                  {"difficulty", b.difficulty},
                  {"host", b.host},
                  {"startedAt", b.started ? json(b.started_at) : json(nullptr)},
                  {"endedAt", b.ended ? json(b.ended_at) : json(nullptr)},
                  {"deadline", b.started ? json(b.deadline()) : json(nullptr)},
                  {"endReason", b.end_reason},
                  {"numReady", num_ready},
                  {"total", state.active_participants().size()},
                  {"submissions", b.submissions.size()}};
    }

    json room = {{"id", state.room.id},
                 {"code", state.room.code},
                 {"name", state.room.name},
                 {"mode", state.room.mode},
                 {"createdBy", state.room.created_by},
                 {"status", state.status}};
    return {{"success", true},
            {"room", room},
            {"participants", participants},
            {"battle", battle},
            {"state", phase_of(state, now)},
            {"serverTime", now}};
}

json battle_service::results(const string &room_id) {
    room_state state = require_room(room_id);
    const battle_state &battle = require_battle(state);

    vector<submission_summary> ranked;
    for (auto &[user, summary] : battle.submissions)
        ranked.push_back(summary);
    stable_sort(ranked.begin(), ranked.end(), [](auto &a, auto &b) {
        if (a.composite_score != b.composite_score) return a.composite_score > b.composite_score;
        return a.submitted_at < b.submitted_at;
    });

    json list = json::array();
    int rank = 0;
    for (auto &summary : ranked) {
        ++rank;
        list.push_back({{"userId", summary.user_id},
                        {"score", summary.composite_score},
                        {"passed", summary.passed},
                        {"total", summary.total},
                        {"timeMs", summary.total_time_ms},
                        {"codeLength", summary.code_length},
                        {"rank", rank},
                        {"isWinner", rank == 1}});
    }

    json info = {{"difficulty", battle.difficulty},
                 {"durationMinutes", battle.duration_minutes},
                 {"problemId", battle.problem_id},
                 {"started", battle.started},
                 {"ended", battle.ended},
                 {"endedAt", battle.ended ? json(battle.ended_at) : json(nullptr)},
                 {"endReason", battle.end_reason}};
    return {{"success", true}, {"results", list}, {"battleInfo", info}};
}

json battle_service::submission_history(const string &room_id, const string &user_id) {
    room_state state = require_room(room_id);
    const battle_state &battle = require_battle(state);
    require_participant(state, user_id);

    json list = json::array();
    for (auto &record : submissions.list_by_room(room_id)) {
        json item = record;
        if (!battle.ended && record.user_id != user_id)
            item.erase("code");
        list.push_back(move(item));
    }
    return {{"success", true}, {"submissions", list}};
}

json battle_service::leaderboard_list(size_t limit) {
    return {{"success", true}, {"category", BATTLE_CATEGORY}, {"entries", ranking.list(BATTLE_CATEGORY, limit)}};
}

void battle_service::recover() {
    size_t armed = 0;
    for (auto &state : rooms.recover()) {
        if (!state.battle) continue;
        if (state.battle->started && !state.battle->ended)
            arm_deadline(state), ++armed;
        else if (state.battle->ended)
            arm_archive(state), ++armed;
    }
    LOG(INFO) << "Re-armed " << armed << " battle timers";
}

void battle_service::schedule_maintenance() {
    timers.arm("", now_ms() + config.maintenance_interval_ms, [this](const string &) {
        int64_t now = now_ms();
        try {
            size_t pruned = rooms.prune_inactive((int64_t)config.inactive_minutes * 60000, now);
            size_t expired = rooms.expire_rooms(now);
            if (pruned || expired)
                LOG(INFO) << "Maintenance: " << pruned << " participants marked inactive, " << expired << " rooms expired";
        } catch (std::exception &e) {
            LOG(ERROR) << "Maintenance failed, " << boost::diagnostic_information(e);
        }
        schedule_maintenance();
    });
}

}  // namespace arena::battle
