#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace arena {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 当前 Unix 时间戳（毫秒）
 */
int64_t now_ms();

/**
 * @brief 生成 24 位十六进制的随机标识符，用作房间 id 和提交 id
 */
std::string random_hex_id();

/**
 * @brief 生成房间码，只使用不易混淆的大写字母和数字
 * @param length 房间码长度
 */
std::string random_room_code(size_t length = 6);

/**
 * @brief 是否为 24 位十六进制字符串
 */
bool is_hex_id(const std::string &id);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace arena
