#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace arena {

/**
 * @brief 调试模式，打开时会输出更多日志
 */
extern bool DEBUG;

/**
 * @brief REST 服务的监听配置
 */
struct http_config {
    std::string host = "0.0.0.0";
    int port = 5000;

    /**
     * @brief 处理请求的线程数
     */
    int threads = 16;

    /**
     * @brief 请求体的最大字节数
     */
    size_t max_body_size = 1 << 20;
};

void from_json(const nlohmann::json &j, http_config &config);

/**
 * @brief 容器守护进程（Docker Engine API）的连接配置
 */
struct docker_config {
    /**
     * @brief 守护进程监听的 unix socket
     */
    std::string socket = "/var/run/docker.sock";

    /**
     * @brief Engine API 的版本前缀，比如 v1.41
     */
    std::string api_version = "v1.41";

    /**
     * @brief 普通请求（非日志流）的超时时间，毫秒
     */
    int request_timeout_ms = 30000;

    /**
     * @brief 拉取镜像的超时时间，毫秒
     */
    int pull_timeout_ms = 600000;
};

void from_json(const nlohmann::json &j, docker_config &config);

/**
 * @brief 每个执行容器的资源限制默认值与上限
 */
struct sandbox_config {
    int timeout_ms = 3000;
    int max_timeout_ms = 10000;
    int64_t memory_bytes = 256ll << 20;
    int64_t max_memory_bytes = 512ll << 20;
    int64_t cpu_period = 100000;
    int64_t cpu_quota = 50000;
    int pids_limit = 50;
    int nofile_limit = 64;
    int nproc_limit = 50;

    /**
     * @brief stdout 和 stderr 分别最多保留多少字节
     */
    size_t max_output_size = 10000;

    /**
     * @brief 标准输入的最大字节数
     */
    size_t max_input_size = 1024;

    /**
     * @brief /tmp 可写临时目录的大小，tmpfs 的 size 参数
     */
    std::string scratch_size = "64m";

    /**
     * @brief 容器内运行用户程序的身份
     */
    std::string user = "nobody";
};

void from_json(const nlohmann::json &j, sandbox_config &config);

struct validator_config {
    /**
     * @brief 执行接口接受的最大代码字节数
     */
    size_t max_code_size = 10 * 1024;
};

void from_json(const nlohmann::json &j, validator_config &config);

/**
 * @brief 进程内求值器的限制
 */
struct evaluator_config {
    size_t max_code_size = 50 * 1024;
    size_t max_argument_size = 5 * 1024;
    size_t max_result_size = 10 * 1024;
    int timeout_ms = 1500;
};

void from_json(const nlohmann::json &j, evaluator_config &config);

/**
 * @brief 对战与房间的配置
 */
struct battle_config {
    int default_duration_minutes = 10;
    int min_duration_minutes = 1;
    int max_duration_minutes = 180;

    /**
     * @brief 开始对战后的倒计时，毫秒。为 0 时立即开始
     */
    int64_t countdown_ms = 0;

    /**
     * @brief 对战结束后多久归档房间，分钟
     */
    int archive_grace_minutes = 30;

    /**
     * @brief 临时房间的存活时间，小时
     */
    int room_ttl_hours = 24;

    size_t max_participants = 50;

    /**
     * @brief 参与者超过多少分钟没有活动后被标记为不活跃
     */
    int inactive_minutes = 30;

    /**
     * @brief 清理不活跃参与者和过期房间的间隔，毫秒
     */
    int64_t maintenance_interval_ms = 60000;

    /**
     * @brief 为真时 python 提交使用进程内求值器，否则使用容器沙箱
     */
    bool in_process = true;

    /**
     * @brief 对战提交使用的语言
     */
    std::string language = "python";

    /**
     * @brief 房间状态写入主存储时使用的处理线程数
     */
    int actor_threads = 4;

    /**
     * @brief 题目集文件，为空时使用内置题目
     */
    std::string problems;
};

void from_json(const nlohmann::json &j, battle_config &config);

/**
 * @brief 综合评分中各项加分的参数
 */
struct scoring_config {
    int speed_bonus_max = 20;
    int speed_step_ms = 100;
    int brevity_bonus_high = 10;
    double brevity_ratio_high = 1.1;
    int brevity_bonus_low = 5;
    double brevity_ratio_low = 1.3;
    int first_correct_bonus = 10;
    int max_score = 100;
};

void from_json(const nlohmann::json &j, scoring_config &config);

struct rate_limit_config {
    size_t capacity = 10000;
    int64_t window_ms = 60000;
    size_t max_requests = 10;
};

void from_json(const nlohmann::json &j, rate_limit_config &config);

struct redis_config {
    std::string host;
    int port = 6379;
    std::string password;

    /**
     * @brief 重连间隔，毫秒
     */
    int retry_interval = 1000;

    /**
     * @brief 房间状态在 Redis 中的过期时间，秒
     */
    int state_ttl = 86400;
};

void from_json(const nlohmann::json &j, redis_config &config);

/**
 * @brief 描述一个 MySQL 数据库连接信息
 */
struct database_config {
    /**
     * @brief 数据库服务器的地址
     */
    std::string host;

    /**
     * @brief 数据库服务器的账号
     */
    std::string user;

    /**
     * @brief 数据库服务器的密码
     */
    std::string password;

    /**
     * @brief 使用连接到的数据库服务器的哪一个数据库
     */
    std::string database;
};

void from_json(const nlohmann::json &j, database_config &config);

/**
 * @brief 整个服务的配置，对应一个 JSON 配置文件
 */
struct configuration {
    http_config http;
    docker_config docker;
    sandbox_config sandbox;
    validator_config validator;
    evaluator_config evaluator;
    battle_config battle;
    scoring_config scoring;
    rate_limit_config rate_limit;

    /**
     * @brief 未配置时，房间主存储使用进程内存
     */
    std::optional<redis_config> redis;

    /**
     * @brief 未配置时，持久化存储使用进程内存
     */
    std::optional<database_config> database;

    /**
     * @brief 从 JSON 文件读取配置
     */
    static configuration load(const std::filesystem::path &config_path);
};

void from_json(const nlohmann::json &j, configuration &config);

}  // namespace arena
