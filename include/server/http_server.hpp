#pragma once

#include <httplib.h>
#include <functional>
#include <nlohmann/json.hpp>
#include <regex>
#include <string>
#include <vector>
#include "battle/battle_service.hpp"
#include "common/rate_limiter.hpp"
#include "config.hpp"
#include "sandbox/sandbox.hpp"

namespace arena::server {

/**
 * @brief 解析请求中的内存限制
 * 数字表示 MB，字符串可以带单位，比如 "256MB"、"512m"、"1g"
 * @return 字节数，无法解析时返回 0
 */
int64_t parse_memory_limit(const nlohmann::json &value);

/**
 * @brief REST 服务
 * 响应体都是 JSON。出错时返回 {success: false, error: {type, message}}，
 * HTTP 状态码由异常类型决定。
 */
class http_server {
public:
    http_server(const http_config &config, sandbox::sandbox &box, battle::battle_service &battles,
                 rate_limiter &limiter);

    /**
     * @brief 监听端口，阻塞直到 stop 被调用
     * @return 监听失败时返回 false
     */
    bool run();

    void stop();

    /**
     * @brief 处理一个请求，不经过网络，用于测试
     */
    httplib::Response dispatch(const std::string &method, const std::string &path,
                               const std::string &body, const httplib::Headers &headers = {});

private:
    using handler = std::function<nlohmann::json(const httplib::Request &, httplib::Response &)>;

    void route(const std::string &method, const std::string &pattern, handler h);
    void setup_routes();

    http_config config;
    sandbox::sandbox &box;
    battle::battle_service &battles;
    rate_limiter &limiter;

    struct route_entry {
        std::string method;
        std::regex pattern;
        handler h;
    };
    std::vector<route_entry> routes;
    httplib::Server server;
};

}  // namespace arena::server
