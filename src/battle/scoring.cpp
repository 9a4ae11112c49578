#include "battle/scoring.hpp"
#include <algorithm>
#include <cmath>

namespace arena::battle {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const score_breakdown &breakdown) {
    j = {{"correctness", breakdown.correctness},
         {"speed", breakdown.speed},
         {"brevity", breakdown.brevity},
         {"firstCorrect", breakdown.first_correct},
         {"total", breakdown.total}};
}

score_breakdown score(int passed, int total, int64_t total_time_ms, size_t code_length,
                      const map<string, submission_summary> &existing,
                      bool first_correct_awarded, const scoring_config &config) {
    score_breakdown result;
    if (total > 0)
        result.correctness = (int)lround((double)passed / total * 100);

    if (config.speed_step_ms > 0)
        result.speed = (int)max<int64_t>(0, config.speed_bonus_max - total_time_ms / config.speed_step_ms);

    size_t shortest = code_length;
    for (auto &[user, summary] : existing)
        if (summary.code_length > 0)
            shortest = min(shortest, summary.code_length);
    if (shortest > 0) {
        double ratio = (double)code_length / shortest;
        if (ratio <= config.brevity_ratio_high)
            result.brevity = config.brevity_bonus_high;
        else if (ratio <= config.brevity_ratio_low)
            result.brevity = config.brevity_bonus_low;
    }

    bool perfect = total > 0 && passed == total;
    if (perfect && !first_correct_awarded)
        result.first_correct = config.first_correct_bonus;

    result.total = min(config.max_score, result.correctness + result.speed + result.brevity + result.first_correct);
    return result;
}

}  // namespace arena::battle
