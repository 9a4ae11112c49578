#include "store/mysql_store.hpp"
#include <glog/logging.h>
#include "common/utils.hpp"

namespace arena::store {
using namespace std;
using namespace nlohmann;
using namespace ormpp;

// clang-format off
static const char *SCHEMA[] = {
    "CREATE TABLE IF NOT EXISTS room_state ("
    "  room_id VARCHAR(24) NOT NULL PRIMARY KEY,"
    "  room_code VARCHAR(8) NOT NULL,"
    "  status VARCHAR(16) NOT NULL,"
    "  payload MEDIUMTEXT NOT NULL,"
    "  updated_at BIGINT NOT NULL,"
    "  version BIGINT NOT NULL,"
    "  INDEX idx_room_code (room_code)"
    ")",
    "CREATE TABLE IF NOT EXISTS battle_submission ("
    "  id VARCHAR(24) NOT NULL PRIMARY KEY,"
    "  room_id VARCHAR(24) NOT NULL,"
    "  user_id VARCHAR(64) NOT NULL,"
    "  problem_id VARCHAR(64) NOT NULL,"
    "  language VARCHAR(16) NOT NULL,"
    "  code MEDIUMTEXT NOT NULL,"
    "  passed INT NOT NULL,"
    "  total INT NOT NULL,"
    "  total_time_ms BIGINT NOT NULL,"
    "  score INT NOT NULL,"
    "  submitted_at BIGINT NOT NULL,"
    "  results MEDIUMTEXT NOT NULL,"
    "  INDEX idx_room (room_id, submitted_at)"
    ")",
    "CREATE TABLE IF NOT EXISTS leaderboard_entry ("
    "  user_id VARCHAR(64) NOT NULL,"
    "  category VARCHAR(32) NOT NULL,"
    "  score INT NOT NULL,"
    "  details TEXT NOT NULL,"
    "  updated_at BIGINT NOT NULL,"
    "  PRIMARY KEY (user_id, category),"
    "  INDEX idx_category_score (category, score)"
    ")"
};
// clang-format on

mysql_conn::mysql_conn(const database_config &config)
    : config(config) {}

void mysql_conn::connect() {
    LOG(INFO) << "MySQL: connecting to " << config.host << "/" << config.database;
    if (!db.connect(config.host.c_str(), config.user.c_str(), config.password.c_str(), config.database.c_str()))
        throw runtime_error("unable to connect to " + config.host);
}

void mysql_conn::init_schema() {
    execute([](dbng<mysql> &db) {
        for (const char *sql : SCHEMA)
            db.execute(sql);
    });
}

static optional<battle::room_state> parse_state(const string &payload) {
    try {
        return json::parse(payload).get<battle::room_state>();
    } catch (json::exception &e) {
        LOG(WARNING) << "MySQL: dropping malformed room state: " << e.what();
        return {};
    }
}

static string status_name(battle::room_status status) {
    return json(status).get<string>();
}

mysql_room_store::mysql_room_store(mysql_conn &conn)
    : conn(conn) {}

optional<battle::room_state> mysql_room_store::load(const string &room_id) {
    auto rows = conn.execute([&](dbng<mysql> &db) {
        return db.query<tuple<string>>("SELECT payload FROM room_state WHERE room_id=?", room_id);
    });
    if (rows.empty()) return {};
    return parse_state(get<0>(rows[0]));
}

bool mysql_room_store::store(const battle::room_state &state) {
    string payload = json(state).dump();
    conn.execute([&](dbng<mysql> &db) {
        // version 必须最后更新，前面的 IF 比较的是旧版本号
        db.execute(
            "INSERT INTO room_state (room_id, room_code, status, payload, updated_at, version) VALUES (?, ?, ?, ?, ?, ?) "
            "ON DUPLICATE KEY UPDATE "
            "room_code=IF(VALUES(version)>version, VALUES(room_code), room_code), "
            "status=IF(VALUES(version)>version, VALUES(status), status), "
            "payload=IF(VALUES(version)>version, VALUES(payload), payload), "
            "updated_at=IF(VALUES(version)>version, VALUES(updated_at), updated_at), "
            "version=IF(VALUES(version)>version, VALUES(version), version)",
            state.room.id, state.room.code, status_name(state.status), payload, state.updated_at, (int64_t)state.version);
    });
    return true;
}

bool mysql_room_store::restore(const battle::room_state &state) {
    string payload = json(state).dump();
    conn.execute([&](dbng<mysql> &db) {
        db.execute("INSERT IGNORE INTO room_state (room_id, room_code, status, payload, updated_at, version) VALUES (?, ?, ?, ?, ?, ?)",
                   state.room.id, state.room.code, status_name(state.status), payload, state.updated_at, (int64_t)state.version);
    });
    return true;
}

optional<string> mysql_room_store::find_by_code(const string &code) {
    auto rows = conn.execute([&](dbng<mysql> &db) {
        return db.query<tuple<string>>(
            "SELECT room_id FROM room_state WHERE room_code=? AND status='active' ORDER BY updated_at DESC LIMIT 1", code);
    });
    if (rows.empty()) return {};
    return get<0>(rows[0]);
}

void mysql_room_store::remove(const string &room_id) {
    conn.execute([&](dbng<mysql> &db) {
        db.execute("DELETE FROM room_state WHERE room_id=?", room_id);
    });
}

vector<battle::room_state> mysql_room_store::load_unfinished() {
    auto rows = conn.execute([&](dbng<mysql> &db) {
        return db.query<tuple<string>>("SELECT payload FROM room_state WHERE status='active'");
    });
    vector<battle::room_state> result;
    for (auto &row : rows)
        if (auto state = parse_state(get<0>(row)))
            result.push_back(*state);
    return result;
}

mysql_submission_store::mysql_submission_store(mysql_conn &conn)
    : conn(conn) {}

void mysql_submission_store::add(const submission_record &record) {
    string results = record.results.dump();
    conn.execute([&](dbng<mysql> &db) {
        db.execute(
            "INSERT INTO battle_submission (id, room_id, user_id, problem_id, language, code, passed, total, total_time_ms, score, submitted_at, results) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
            record.id, record.room_id, record.user_id, record.problem_id, record.language, record.code,
            record.passed, record.total, record.total_time_ms, record.score, record.submitted_at, results);
    });
}

vector<submission_record> mysql_submission_store::list_by_room(const string &room_id) {
    auto rows = conn.execute([&](dbng<mysql> &db) {
        return db.query<tuple<string, string, string, string, int, int, int64_t, int, int64_t, string>>(
            "SELECT id, user_id, problem_id, language, passed, total, total_time_ms, score, submitted_at, results "
            "FROM battle_submission WHERE room_id=? ORDER BY submitted_at",
            room_id);
    });
    vector<submission_record> result;
    for (auto &[id, user_id, problem_id, language, passed, total, total_time_ms, score, submitted_at, results] : rows) {
        submission_record record;
        record.id = id;
        record.room_id = room_id;
        record.user_id = user_id;
        record.problem_id = problem_id;
        record.language = language;
        record.passed = passed;
        record.total = total;
        record.total_time_ms = total_time_ms;
        record.score = score;
        record.submitted_at = submitted_at;
        record.results = json::parse(results, nullptr, false);
        if (record.results.is_discarded()) record.results = json::array();
        result.push_back(move(record));
    }
    return result;
}

mysql_leaderboard_store::mysql_leaderboard_store(mysql_conn &conn)
    : conn(conn) {}

bool mysql_leaderboard_store::offer(const leaderboard_entry &entry) {
    string details = entry.details.dump();
    return conn.execute([&](dbng<mysql> &db) {
        // score 必须最后更新
        db.execute(
            "INSERT INTO leaderboard_entry (user_id, category, score, details, updated_at) VALUES (?, ?, ?, ?, ?) "
            "ON DUPLICATE KEY UPDATE "
            "details=IF(VALUES(score)>score, VALUES(details), details), "
            "updated_at=IF(VALUES(score)>score, VALUES(updated_at), updated_at), "
            "score=IF(VALUES(score)>score, VALUES(score), score)",
            entry.user_id, entry.category, entry.score, details, entry.updated_at);
        auto rows = db.query<tuple<int64_t>>(
            "SELECT updated_at FROM leaderboard_entry WHERE user_id=? AND category=?", entry.user_id, entry.category);
        return !rows.empty() && get<0>(rows[0]) == entry.updated_at;
    });
}

vector<leaderboard_entry> mysql_leaderboard_store::list(const string &category, size_t limit) {
    auto rows = conn.execute([&](dbng<mysql> &db) {
        return db.query<tuple<string, int, string, int64_t>>(
            "SELECT user_id, score, details, updated_at FROM leaderboard_entry WHERE category=? ORDER BY score DESC LIMIT ?",
            category, (int64_t)limit);
    });
    vector<leaderboard_entry> result;
    for (auto &[user_id, score, details, updated_at] : rows) {
        leaderboard_entry entry;
        entry.user_id = user_id;
        entry.category = category;
        entry.score = score;
        entry.details = json::parse(details, nullptr, false);
        if (entry.details.is_discarded()) entry.details = json::object();
        entry.updated_at = updated_at;
        result.push_back(move(entry));
    }
    return result;
}

}  // namespace arena::store
