#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include "sandbox/container_runtime.hpp"

namespace arena::sandbox::mock {

/**
 * @brief 按守护进程日志流的格式封装一帧输出
 */
inline std::string frame(int stream, const std::string &payload) {
    std::string header(8, '\0');
    header[0] = (char)stream;
    uint32_t size = payload.size();
    header[4] = (char)((size >> 24) & 0xff);
    header[5] = (char)((size >> 16) & 0xff);
    header[6] = (char)((size >> 8) & 0xff);
    header[7] = (char)(size & 0xff);
    return header + payload;
}

/**
 * @brief 进程内模拟的容器运行时
 * 所有新建容器的行为由 next 决定，日志流按 chunk_size 切块发送以模拟跨越网络包的帧。
 */
struct runtime : public container_runtime {
    struct behavior {
        std::string log;
        bool hang = false;
        bool oom_killed = false;
        int exit_code = 0;
        bool fail_create = false;
    };

    behavior next;
    size_t chunk_size = 3;
    bool pull_fails = false;
    std::chrono::milliseconds pull_delay{0};

    std::mutex mut;
    std::set<std::string> images;
    int pulls = 0;
    int created = 0;
    std::map<std::string, container_spec> specs;
    std::map<std::string, behavior> behaviors;
    std::set<std::string> live;
    std::set<std::string> killed;
    std::set<std::string> removed;

    bool ping() override {
        return true;
    }

    bool image_exists(const std::string &image) override {
        std::lock_guard<std::mutex> guard(mut);
        return images.count(image) > 0;
    }

    void pull_image(const std::string &image) override {
        std::this_thread::sleep_for(pull_delay);
        std::lock_guard<std::mutex> guard(mut);
        ++pulls;
        if (pull_fails) throw std::runtime_error("manifest for " + image + " not found");
        images.insert(image);
    }

    std::string create_container(const container_spec &spec) override {
        std::lock_guard<std::mutex> guard(mut);
        if (next.fail_create) throw std::runtime_error("no space left on device");
        std::string id = "container" + std::to_string(++created);
        specs[id] = spec;
        behaviors[id] = next;
        live.insert(id);
        return id;
    }

    void start_container(const std::string &) override {}

    void stream_logs(const std::string &id, const std::function<void(const char *, size_t)> &on_data,
                     const std::atomic<bool> &aborted) override {
        behavior b;
        {
            std::lock_guard<std::mutex> guard(mut);
            b = behaviors.at(id);
        }
        for (size_t i = 0; i < b.log.size() && !aborted; i += chunk_size)
            on_data(b.log.data() + i, std::min(chunk_size, b.log.size() - i));
        if (!b.hang) return;
        while (!aborted) {
            {
                std::lock_guard<std::mutex> guard(mut);
                if (killed.count(id)) return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    int wait_container(const std::string &id) override {
        std::lock_guard<std::mutex> guard(mut);
        if (killed.count(id)) return 137;
        return behaviors.at(id).exit_code;
    }

    container_state inspect_container(const std::string &id) override {
        std::lock_guard<std::mutex> guard(mut);
        container_state state;
        state.running = live.count(id) && !killed.count(id);
        state.oom_killed = behaviors.at(id).oom_killed;
        state.exit_code = killed.count(id) ? 137 : behaviors.at(id).exit_code;
        return state;
    }

    void kill_container(const std::string &id) override {
        std::lock_guard<std::mutex> guard(mut);
        killed.insert(id);
    }

    void remove_container(const std::string &id) override {
        std::lock_guard<std::mutex> guard(mut);
        live.erase(id);
        removed.insert(id);
    }

    std::vector<std::string> list_containers(const std::string &label) override {
        std::lock_guard<std::mutex> guard(mut);
        std::vector<std::string> result;
        for (auto &id : live)
            if (specs.at(id).labels.count(label.substr(0, label.find('='))))
                result.push_back(id);
        return result;
    }
};

}  // namespace arena::sandbox::mock
