#include "config.hpp"
#include <fstream>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace arena {
using namespace std;
using namespace nlohmann;

bool DEBUG = false;

void from_json(const json &j, http_config &config) {
    assign_optional(j, config.host, "host");
    assign_optional(j, config.port, "port");
    assign_optional(j, config.threads, "threads");
    assign_optional(j, config.max_body_size, "maxBodySize");
}

void from_json(const json &j, docker_config &config) {
    assign_optional(j, config.socket, "socket");
    assign_optional(j, config.api_version, "apiVersion");
    assign_optional(j, config.request_timeout_ms, "requestTimeout");
    assign_optional(j, config.pull_timeout_ms, "pullTimeout");
}

void from_json(const json &j, sandbox_config &config) {
    assign_optional(j, config.timeout_ms, "timeout");
    assign_optional(j, config.max_timeout_ms, "maxTimeout");
    assign_optional(j, config.memory_bytes, "memory");
    assign_optional(j, config.max_memory_bytes, "maxMemory");
    assign_optional(j, config.cpu_period, "cpuPeriod");
    assign_optional(j, config.cpu_quota, "cpuQuota");
    assign_optional(j, config.pids_limit, "pidsLimit");
    assign_optional(j, config.nofile_limit, "nofile");
    assign_optional(j, config.nproc_limit, "nproc");
    assign_optional(j, config.max_output_size, "maxOutputSize");
    assign_optional(j, config.max_input_size, "maxInputSize");
    assign_optional(j, config.scratch_size, "scratchSize");
    assign_optional(j, config.user, "user");
}

void from_json(const json &j, validator_config &config) {
    assign_optional(j, config.max_code_size, "maxCodeSize");
}

void from_json(const json &j, evaluator_config &config) {
    assign_optional(j, config.max_code_size, "maxCodeSize");
    assign_optional(j, config.max_argument_size, "maxArgumentSize");
    assign_optional(j, config.max_result_size, "maxResultSize");
    assign_optional(j, config.timeout_ms, "timeout");
}

void from_json(const json &j, battle_config &config) {
    assign_optional(j, config.default_duration_minutes, "defaultDuration");
    assign_optional(j, config.min_duration_minutes, "minDuration");
    assign_optional(j, config.max_duration_minutes, "maxDuration");
    assign_optional(j, config.countdown_ms, "countdown");
    assign_optional(j, config.archive_grace_minutes, "archiveGraceMinutes");
    assign_optional(j, config.room_ttl_hours, "roomTtlHours");
    assign_optional(j, config.max_participants, "maxParticipants");
    assign_optional(j, config.inactive_minutes, "inactiveMinutes");
    assign_optional(j, config.maintenance_interval_ms, "maintenanceInterval");
    assign_optional(j, config.in_process, "inProcess");
    assign_optional(j, config.language, "language");
    assign_optional(j, config.actor_threads, "actorThreads");
    assign_optional(j, config.problems, "problems");
}

void from_json(const json &j, scoring_config &config) {
    assign_optional(j, config.speed_bonus_max, "speedBonus");
    assign_optional(j, config.speed_step_ms, "speedStep");
    assign_optional(j, config.brevity_bonus_high, "brevityBonusHigh");
    assign_optional(j, config.brevity_ratio_high, "brevityRatioHigh");
    assign_optional(j, config.brevity_bonus_low, "brevityBonusLow");
    assign_optional(j, config.brevity_ratio_low, "brevityRatioLow");
    assign_optional(j, config.first_correct_bonus, "firstCorrectBonus");
    assign_optional(j, config.max_score, "maxScore");
}

void from_json(const json &j, rate_limit_config &config) {
    assign_optional(j, config.capacity, "capacity");
    assign_optional(j, config.window_ms, "window");
    assign_optional(j, config.max_requests, "maxRequests");
}

void from_json(const json &j, redis_config &config) {
    j.at("host").get_to(config.host);
    j.at("port").get_to(config.port);
    if (j.count("password"))
        j.at("password").get_to(config.password);
    else
        config.password = "";
    assign_optional(j, config.retry_interval, "retryInterval");
    assign_optional(j, config.state_ttl, "stateTtl");
}

void from_json(const json &j, database_config &config) {
    j.at("host").get_to(config.host);
    j.at("user").get_to(config.user);
    j.at("password").get_to(config.password);
    j.at("database").get_to(config.database);
}

void from_json(const json &j, configuration &config) {
    if (j.count("http")) j.at("http").get_to(config.http);
    if (j.count("docker")) j.at("docker").get_to(config.docker);
    if (j.count("sandbox")) j.at("sandbox").get_to(config.sandbox);
    if (j.count("validator")) j.at("validator").get_to(config.validator);
    if (j.count("evaluator")) j.at("evaluator").get_to(config.evaluator);
    if (j.count("battle")) j.at("battle").get_to(config.battle);
    if (j.count("scoring")) j.at("scoring").get_to(config.scoring);
    if (j.count("rateLimit")) j.at("rateLimit").get_to(config.rate_limit);
    if (exists(j, "redis")) config.redis = j.at("redis").get<redis_config>();
    if (exists(j, "database")) config.database = j.at("database").get<database_config>();
}

configuration configuration::load(const filesystem::path &config_path) {
    if (!filesystem::exists(config_path))
        BOOST_THROW_EXCEPTION(arena_exception("Unable to find configuration file ") << config_path.string());
    ifstream fin(config_path);
    json config;
    fin >> config;
    return config.get<configuration>();
}

}  // namespace arena
