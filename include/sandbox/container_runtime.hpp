#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace arena::sandbox {

/**
 * @brief 创建一个执行容器所需的全部参数
 */
struct container_spec {
    std::string image;
    std::vector<std::string> command;
    std::map<std::string, std::string> env;
    std::map<std::string, std::string> labels;

    /**
     * @brief 容器内的执行身份，必须是非特权用户
     */
    std::string user = "nobody";
    std::string working_dir = "/tmp";

    int64_t memory_bytes = 0;
    int64_t cpu_period = 0;
    int64_t cpu_quota = 0;
    int pids_limit = 0;
    int nofile_limit = 0;
    int nproc_limit = 0;

    /**
     * @brief 可写的 /tmp 的大小，如 64m
     */
    std::string scratch_size;
};

/**
 * @brief 容器退出后的状态
 */
struct container_state {
    bool running = false;
    bool oom_killed = false;
    int exit_code = 0;
    std::string error;
};

/**
 * @brief 容器运行时的抽象接口
 * 沙箱只通过这个接口与容器守护进程交互，测试中可以替换为假的实现。
 * 除 stream_logs 以外的方法失败时抛出 docker_error。
 */
class container_runtime {
public:
    virtual ~container_runtime();

    /**
     * @brief 检查守护进程是否可用
     */
    virtual bool ping() = 0;

    virtual bool image_exists(const std::string &image) = 0;

    /**
     * @brief 拉取镜像，阻塞直到拉取完成
     */
    virtual void pull_image(const std::string &image) = 0;

    /**
     * @brief 创建容器（不启动）
     * @return 容器 id
     */
    virtual std::string create_container(const container_spec &spec) = 0;

    virtual void start_container(const std::string &id) = 0;

    /**
     * @brief 读取容器的多路复用输出流，阻塞直到流关闭或 aborted 为真
     * @param on_data 每收到一段原始数据都会调用，数据可能在帧的任意位置截断
     * @param aborted 由其他线程置为真时放弃读取
     */
    virtual void stream_logs(const std::string &id,
                             const std::function<void(const char *, size_t)> &on_data,
                             const std::atomic<bool> &aborted) = 0;

    /**
     * @brief 阻塞等待容器退出
     * @return 容器的退出码
     */
    virtual int wait_container(const std::string &id) = 0;

    virtual container_state inspect_container(const std::string &id) = 0;

    virtual void kill_container(const std::string &id) = 0;

    /**
     * @brief 强制删除容器及其匿名卷
     */
    virtual void remove_container(const std::string &id) = 0;

    /**
     * @brief 列出带有指定标签的容器（包括已经停止的）
     * @param label 形如 key=value
     */
    virtual std::vector<std::string> list_containers(const std::string &label) = 0;
};

}  // namespace arena::sandbox
