#pragma once

#include <nlohmann/json.hpp>
#include "config.hpp"
#include "sandbox/container_runtime.hpp"

namespace arena::sandbox {

/**
 * @brief 通过 unix socket 调用 Docker Engine API 的容器运行时
 * 每个请求使用独立的 CURL 句柄，因此可以被多个线程同时使用
 */
class docker_client : public container_runtime {
public:
    explicit docker_client(const docker_config &config);

    bool ping() override;
    bool image_exists(const std::string &image) override;
    void pull_image(const std::string &image) override;
    std::string create_container(const container_spec &spec) override;
    void start_container(const std::string &id) override;
    void stream_logs(const std::string &id,
                     const std::function<void(const char *, size_t)> &on_data,
                     const std::atomic<bool> &aborted) override;
    int wait_container(const std::string &id) override;
    container_state inspect_container(const std::string &id) override;
    void kill_container(const std::string &id) override;
    void remove_container(const std::string &id) override;
    std::vector<std::string> list_containers(const std::string &label) override;

private:
    struct http_response {
        long status = 0;
        std::string body;
    };

    http_response request(const std::string &method, const std::string &path,
                          const std::string &body, long timeout_ms);

    std::string url(const std::string &path) const;

    docker_config config;
};

/**
 * @brief 将容器参数转换为 POST /containers/create 的请求体
 */
nlohmann::json to_create_body(const container_spec &spec);

}  // namespace arena::sandbox
