#include "common/utils.hpp"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <cstdlib>
#include <mutex>
#include <random>

namespace arena {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

int64_t now_ms() {
    return chrono::duration_cast<chrono::milliseconds>(chrono::system_clock::now().time_since_epoch()).count();
}

static mutex random_mutex;
static boost::uuids::random_generator uuid_generator;

string random_hex_id() {
    static const char *digits = "0123456789abcdef";
    boost::uuids::uuid uuid;
    {
        lock_guard<mutex> lock(random_mutex);
        uuid = uuid_generator();
    }
    string id;
    // uuid 有 16 字节，取前 12 字节得到 24 个十六进制字符
    for (size_t i = 0; i < 12; ++i) {
        id += digits[(uuid.data[i] >> 4) & 0xF];
        id += digits[uuid.data[i] & 0xF];
    }
    return id;
}

string random_room_code(size_t length) {
    static const string alphabet = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
    static mt19937 engine(random_device{}());
    uniform_int_distribution<size_t> dist(0, alphabet.size() - 1);
    lock_guard<mutex> lock(random_mutex);
    string code;
    for (size_t i = 0; i < length; ++i)
        code += alphabet[dist(engine)];
    return code;
}

bool is_hex_id(const string &id) {
    if (id.size() != 24) return false;
    for (char c : id)
        if (!isxdigit((unsigned char)c)) return false;
    return true;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace arena
