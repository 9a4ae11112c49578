#include "battle/leaderboard.hpp"
#include <glog/logging.h>

namespace arena::battle {
using namespace std;
using namespace nlohmann;

const char *BATTLE_CATEGORY = "battle";

leaderboard::leaderboard(store::leaderboard_store &backend)
    : backend(backend) {}

bool leaderboard::offer(const string &user_id, const string &category, int score,
                        const json &details, int64_t now) {
    store::leaderboard_entry entry;
    entry.user_id = user_id;
    entry.category = category;
    entry.score = score;
    entry.details = details;
    entry.updated_at = now;
    bool replaced = backend.offer(entry);
    if (replaced)
        LOG(INFO) << "Leaderboard: " << user_id << " reached " << score << " in " << category;
    return replaced;
}

json leaderboard::list(const string &category, size_t limit) {
    json entries = json::array();
    int rank = 0;
    for (auto &entry : backend.list(category, limit)) {
        json item = entry;
        item["rank"] = ++rank;
        entries.push_back(item);
    }
    return entries;
}

}  // namespace arena::battle
