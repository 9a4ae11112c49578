#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "store/store.hpp"

namespace arena::battle {

/**
 * @brief 排行榜中对战类别的名称
 */
extern const char *BATTLE_CATEGORY;

/**
 * @brief 每个用户在每个类别下只保留最高分
 */
class leaderboard {
public:
    explicit leaderboard(store::leaderboard_store &backend);

    /**
     * @brief 提交一个分数
     * @return 分数严格大于已有记录时返回真
     */
    bool offer(const std::string &user_id, const std::string &category, int score,
               const nlohmann::json &details, int64_t now);

    /**
     * @brief 按分数从高到低列出前 limit 名，带有从 1 开始的名次
     */
    nlohmann::json list(const std::string &category, size_t limit = 50);

private:
    store::leaderboard_store &backend;
};

}  // namespace arena::battle
