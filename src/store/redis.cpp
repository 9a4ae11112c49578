#include "store/redis.hpp"
#include <glog/logging.h>
#include <thread>
#include "common/exceptions.hpp"

namespace arena::store {
using namespace std;
using namespace nlohmann;

static bool connect_to_server(cpp_redis::client &redis_client, const redis_config &config) {
    LOG(INFO) << "Redis: Setup connection with server " << config.host << ":" << config.port;
    redis_client.connect(config.host, config.port,
                         [](const string &host, size_t port, cpp_redis::connect_state status) {
                             if (status == cpp_redis::connect_state::dropped)
                                 LOG(INFO) << "Redis: client disconnected from " << host << ":" << port;
                         });
    if (!config.password.empty()) {
        auto future = redis_client.auth(config.password);
        redis_client.sync_commit();
        LOG(INFO) << "Redis: Auth Reply: " << future.get();
    }
    if (redis_client.is_connected()) {
        LOG(INFO) << "Redis: Connecting to redis server succeeded " << config.host << ":" << config.port;
        return true;
    } else {
        LOG(ERROR) << "Redis: Unable to connect to redis server " << config.host << ":" << config.port;
        return false;
    }
}

void redis_conn::reconnect(bool force) {
    int fail = 0;
    if (force)
        connect_to_server(redis_client, config);
    for (; !redis_client.is_connected() && fail < 5; ++fail) {
        LOG(INFO) << "Redis: Lost connection, trying to reconnect";
        if (fail > 0)
            this_thread::sleep_for(chrono::milliseconds(config.retry_interval));
        connect_to_server(redis_client, config);
    }
    if (fail >= 5) {
        BOOST_THROW_EXCEPTION(database_error("unable to connect to redis server"));
    }
}

void redis_conn::init(const redis_config &config) noexcept {
    this->config = config;
}

vector<cpp_redis::reply> redis_conn::execute(function<void(cpp_redis::client &, vector<future<cpp_redis::reply>> &)> callback) {
    lock_guard<mutex> guard(mut);
    // cpp_redis 的 is_connected 在连接断开后仍可能为真，操作失败时强制重连
    reconnect(false);
    string message;
    for (int fail = 0; fail < 5; ++fail) {
        bool reconn = false;
        vector<future<cpp_redis::reply>> futures;
        callback(redis_client, futures);
        redis_client.sync_commit();
        vector<cpp_redis::reply> replies;
        for (auto &future : futures) {
            replies.push_back(future.get());
            if (replies.back().is_error()) reconn = true, message = replies.back().error();
        }
        if (!reconn) return replies;
        reconnect(true);
    }
    BOOST_THROW_EXCEPTION(database_error("Redis: unable to finish execution: " + message));
}

static string room_key(const string &room_id) {
    return "room:" + room_id;
}

static string code_key(const string &code) {
    return "roomcode:" + code;
}

static optional<battle::room_state> parse_state(const cpp_redis::reply &reply) {
    if (!reply.is_string()) return {};
    try {
        return json::parse(reply.as_string()).get<battle::room_state>();
    } catch (json::exception &e) {
        LOG(WARNING) << "Redis: dropping malformed room state: " << e.what();
        return {};
    }
}

redis_room_store::redis_room_store(const redis_config &config)
    : config(config) {
    conn.init(config);
}

optional<battle::room_state> redis_room_store::load(const string &room_id) {
    auto replies = conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(redis.get(room_key(room_id)));
    });
    return parse_state(replies[0]);
}

bool redis_room_store::store(const battle::room_state &state) {
    // 写入由房间的处理线程串行化，这里不再比较版本
    string payload = json(state).dump();
    conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(redis.set_advanced(room_key(state.room.id), payload, true, config.state_ttl));
        futures.push_back(redis.set_advanced(code_key(state.room.code), state.room.id, true, config.state_ttl));
    });
    return true;
}

bool redis_room_store::restore(const battle::room_state &state) {
    string payload = json(state).dump();
    auto replies = conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(redis.set_advanced(room_key(state.room.id), payload, true, config.state_ttl, false, 0, true));
        futures.push_back(redis.set_advanced(code_key(state.room.code), state.room.id, true, config.state_ttl, false, 0, true));
    });
    // NX 未生效时返回空回复
    return !replies[0].is_null();
}

optional<string> redis_room_store::find_by_code(const string &code) {
    auto replies = conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(redis.get(code_key(code)));
    });
    if (!replies[0].is_string()) return {};
    return replies[0].as_string();
}

void redis_room_store::remove(const string &room_id) {
    auto state = load(room_id);
    conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        vector<string> keys = {room_key(room_id)};
        if (state) keys.push_back(code_key(state->room.code));
        futures.push_back(redis.del(keys));
    });
}

vector<battle::room_state> redis_room_store::load_unfinished() {
    auto replies = conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(redis.keys("room:*"));
    });
    vector<battle::room_state> result;
    if (!replies[0].is_array()) return result;
    for (auto &key : replies[0].as_array()) {
        if (!key.is_string()) continue;
        auto state = load(key.as_string().substr(5));
        if (state && state->status == battle::room_status::ACTIVE)
            result.push_back(*state);
    }
    return result;
}

}  // namespace arena::store
