#include "store/store.hpp"
#include "common/json_utils.hpp"

namespace arena::store {
using namespace std;
using namespace nlohmann;

room_store::~room_store() = default;
submission_store::~submission_store() = default;
leaderboard_store::~leaderboard_store() = default;

void to_json(json &j, const submission_record &record) {
    j = {{"id", record.id},
         {"roomId", record.room_id},
         {"userId", record.user_id},
         {"problemId", record.problem_id},
         {"language", record.language},
         {"code", record.code},
         {"passed", record.passed},
         {"total", record.total},
         {"totalTimeMs", record.total_time_ms},
         {"score", record.score},
         {"submittedAt", record.submitted_at},
         {"results", record.results}};
}

void from_json(const json &j, submission_record &record) {
    j.at("id").get_to(record.id);
    j.at("roomId").get_to(record.room_id);
    j.at("userId").get_to(record.user_id);
    assign_optional(j, record.problem_id, "problemId");
    assign_optional(j, record.language, "language");
    assign_optional(j, record.code, "code");
    assign_optional(j, record.passed, "passed");
    assign_optional(j, record.total, "total");
    assign_optional(j, record.total_time_ms, "totalTimeMs");
    assign_optional(j, record.score, "score");
    assign_optional(j, record.submitted_at, "submittedAt");
    record.results = get_value_def(j, json::array(), "results");
}

void to_json(json &j, const leaderboard_entry &entry) {
    j = {{"userId", entry.user_id},
         {"category", entry.category},
         {"score", entry.score},
         {"details", entry.details},
         {"updatedAt", entry.updated_at}};
}

void from_json(const json &j, leaderboard_entry &entry) {
    j.at("userId").get_to(entry.user_id);
    j.at("category").get_to(entry.category);
    j.at("score").get_to(entry.score);
    entry.details = get_value_def(j, json::object(), "details");
    assign_optional(j, entry.updated_at, "updatedAt");
}

}  // namespace arena::store
