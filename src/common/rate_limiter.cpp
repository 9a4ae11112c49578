#include "common/rate_limiter.hpp"
#include "common/utils.hpp"

namespace arena {
using namespace std;

rate_limiter::rate_limiter(size_t capacity, int64_t window_ms, size_t limit)
    : capacity(capacity == 0 ? 1 : capacity), window_ms(window_ms), limit(limit) {}

void rate_limiter::evict_expired(int64_t now) {
    // 表尾是最久没有访问的记录，只要表尾过期就继续清理
    while (!entries.empty() && now - entries.back().window_start >= window_ms) {
        index.erase(entries.back().key);
        entries.pop_back();
    }
}

bool rate_limiter::try_acquire(const string &key, int64_t now) {
    lock_guard<mutex> lock(mut);
    evict_expired(now);

    auto it = index.find(key);
    if (it == index.end()) {
        if (entries.size() >= capacity) {
            index.erase(entries.back().key);
            entries.pop_back();
        }
        entries.push_front({key, now, 1});
        index[key] = entries.begin();
        return limit > 0;
    }

    entries.splice(entries.begin(), entries, it->second);
    entry &e = *it->second;
    if (now - e.window_start >= window_ms) {
        e.window_start = now;
        e.count = 0;
    }
    if (e.count >= limit) return false;
    ++e.count;
    return true;
}

bool rate_limiter::try_acquire(const string &key) {
    return try_acquire(key, now_ms());
}

size_t rate_limiter::size() const {
    lock_guard<mutex> lock(mut);
    return entries.size();
}

}  // namespace arena
