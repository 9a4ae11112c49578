#pragma once

#include <cstdint>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

namespace arena {

/**
 * @brief 固定窗口的限流器
 * 每个 key 在 window_ms 毫秒的窗口内至多允许 limit 次请求。
 * 记录的 key 数目不会超过 capacity：过期的记录会在访问时被清理，
 * 容量不足时淘汰最久没有访问的记录。
 */
class rate_limiter {
public:
    rate_limiter(size_t capacity, int64_t window_ms, size_t limit);

    /**
     * @brief 记录一次请求
     * @param key 通常是客户端地址
     * @param now 当前时间戳（毫秒）
     * @return 本次请求是否被允许
     */
    bool try_acquire(const std::string &key, int64_t now);
    bool try_acquire(const std::string &key);

    /**
     * @brief 当前记录的 key 的数量
     */
    size_t size() const;

private:
    struct entry {
        std::string key;
        int64_t window_start;
        size_t count;
    };

    void evict_expired(int64_t now);

    size_t capacity;
    int64_t window_ms;
    size_t limit;

    mutable std::mutex mut;
    // 按最近访问时间排序，表头为最近访问的记录
    std::list<entry> entries;
    std::unordered_map<std::string, std::list<entry>::iterator> index;
};

}  // namespace arena
