#pragma once

#include <future>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "config.hpp"
#include "sandbox/container_runtime.hpp"
#include "sandbox/validator.hpp"

namespace arena::sandbox {

/**
 * @brief 单次执行的资源限制
 */
struct execution_limits {
    int timeout_ms = 3000;
    int64_t memory_bytes = 256ll << 20;
    int64_t cpu_period = 100000;
    int64_t cpu_quota = 50000;
    int pids_limit = 50;
    int nofile_limit = 64;
    int nproc_limit = 50;
    size_t max_output_size = 10000;
    std::string scratch_size = "64m";
};

struct execution_request {
    std::string language;
    std::string code;

    /**
     * @brief 程序的标准输入
     */
    std::string input;

    /**
     * @brief 通过静态检查之后拼接在代码末尾的驱动代码，不参与检查
     */
    std::string harness;

    execution_limits limits;
};

/**
 * @brief 一次执行的结果，不会被持久化
 * 所有的失败都通过 error 和各个标记表示，调用者总能拿到失败之前收集到的输出
 */
struct execution_result {
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = 0;
    int64_t duration_ms = 0;

    bool timed_out = false;
    bool memory_exceeded = false;
    bool crashed = false;
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    error_type error = error_type::NONE;
    std::string error_message;

    /**
     * @brief 静态检查失败时的违规项
     */
    std::vector<std::string> violations;

    std::string container_id;

    bool success() const;
};

/**
 * @brief 序列化为执行接口的响应格式
 * { success, data: { stdout, stderr, exit_code }, execution: {...}, error?: { type, message } }
 */
void to_json(nlohmann::json &j, const execution_result &result);

/**
 * @brief 在一次性的容器中执行不受信任的代码
 * 
 * 每次执行占用一个容器，多个执行之间除了镜像准备以外没有共享的锁。
 * 容器在任何退出路径上都会被删除，包括超时和读取输出时抛出异常。
 */
class sandbox {
public:
    sandbox(container_runtime &runtime, const validator &checker, const sandbox_config &config);

    /**
     * @brief 配置中的默认资源限制
     */
    execution_limits default_limits() const;

    /**
     * @brief 把请求中的限制裁剪到配置允许的范围内
     */
    execution_limits clamp(int timeout_ms, int64_t memory_bytes) const;

    execution_result execute(const execution_request &request);

    /**
     * @brief 准备镜像，若镜像不存在则拉取
     * 多个线程同时准备同一个镜像时只会拉取一次，失败后下次调用会重试
     * @throw provisioning_error
     */
    void ensure_image(const std::string &image);

    /**
     * @brief 列出所有由沙箱创建且还没有被删除的容器
     */
    std::vector<std::string> live_containers();

    container_runtime &get_runtime();

private:
    void cleanup(const std::string &id);

    container_runtime &runtime;
    const validator &checker;
    sandbox_config config;

    std::mutex image_mutex;
    std::set<std::string> ready_images;
    std::map<std::string, std::shared_future<void>> pulling_images;
};

/**
 * @brief 沙箱创建的容器都带有该标签
 */
extern const char *MANAGED_LABEL;

}  // namespace arena::sandbox
