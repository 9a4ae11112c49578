#include "sandbox/sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <atomic>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "sandbox/language.hpp"
#include "sandbox/stream_demuxer.hpp"

namespace arena::sandbox {
using namespace std;
using namespace nlohmann;

const char *MANAGED_LABEL = "arena.managed";

// Docker 要求容器内存至少为 6MB
static const int64_t MIN_MEMORY_BYTES = 6ll << 20;

bool execution_result::success() const {
    return error == error_type::NONE;
}

void to_json(json &j, const execution_result &result) {
    j = {{"success", result.success()},
         {"data", {{"stdout", result.stdout_data}, {"stderr", result.stderr_data}, {"exit_code", result.exit_code}}},
         {"execution", {{"duration_ms", result.duration_ms},
                        {"timeout_occurred", result.timed_out},
                        {"memory_exceeded", result.memory_exceeded},
                        {"crashed", result.crashed},
                        {"stdout_truncated", result.stdout_truncated},
                        {"stderr_truncated", result.stderr_truncated}}}};
    if (!result.success()) {
        j["error"] = {{"type", get_display_message(result.error)}, {"message", result.error_message}};
        if (!result.violations.empty())
            j["error"]["violations"] = result.violations;
    }
}

sandbox::sandbox(container_runtime &runtime, const validator &checker, const sandbox_config &config)
    : runtime(runtime), checker(checker), config(config) {}

container_runtime &sandbox::get_runtime() {
    return runtime;
}

execution_limits sandbox::default_limits() const {
    execution_limits limits;
    limits.timeout_ms = config.timeout_ms;
    limits.memory_bytes = config.memory_bytes;
    limits.cpu_period = config.cpu_period;
    limits.cpu_quota = config.cpu_quota;
    limits.pids_limit = config.pids_limit;
    limits.nofile_limit = config.nofile_limit;
    limits.nproc_limit = config.nproc_limit;
    limits.max_output_size = config.max_output_size;
    limits.scratch_size = config.scratch_size;
    return limits;
}

execution_limits sandbox::clamp(int timeout_ms, int64_t memory_bytes) const {
    execution_limits limits = default_limits();
    if (timeout_ms > 0)
        limits.timeout_ms = min(timeout_ms, config.max_timeout_ms);
    if (memory_bytes > 0)
        limits.memory_bytes = max(MIN_MEMORY_BYTES, min(memory_bytes, config.max_memory_bytes));
    return limits;
}

void sandbox::ensure_image(const string &image) {
    promise<void> pulled;
    shared_future<void> pending;
    bool owner = false;
    {
        lock_guard<mutex> lock(image_mutex);
        if (ready_images.count(image)) return;
        auto it = pulling_images.find(image);
        if (it != pulling_images.end()) {
            pending = it->second;
        } else {
            pending = pulled.get_future().share();
            pulling_images.emplace(image, pending);
            owner = true;
        }
    }

    if (!owner) {
        // 等待其他线程完成拉取，拉取失败时会在这里抛出同样的异常
        pending.get();
        return;
    }

    try {
        if (!runtime.image_exists(image))
            runtime.pull_image(image);
    } catch (std::exception &e) {
        LOG(ERROR) << "Sandbox: unable to provision image " << image << ": " << e.what();
        auto error = make_exception_ptr(provisioning_error(fmt::format("unable to provision image {}: {}", image, e.what())));
        {
            lock_guard<mutex> lock(image_mutex);
            pulling_images.erase(image);
        }
        pulled.set_exception(error);
        rethrow_exception(error);
    }

    {
        lock_guard<mutex> lock(image_mutex);
        ready_images.insert(image);
        pulling_images.erase(image);
    }
    pulled.set_value();
}

void sandbox::cleanup(const string &id) {
    try {
        runtime.remove_container(id);
    } catch (std::exception &e) {
        LOG(ERROR) << "Sandbox: unable to remove container " << id << ": " << e.what();
    }
}

vector<string> sandbox::live_containers() {
    return runtime.list_containers(string(MANAGED_LABEL) + "=true");
}

static void fail(execution_result &result, error_type type, const string &message) {
    result.error = type;
    result.error_message = message;
}

execution_result sandbox::execute(const execution_request &request) {
    elapsed_time timer;
    execution_result result;
    const execution_limits &limits = request.limits;

    validation_result check = checker.validate(request.code, request.language);
    if (check.ok && request.input.size() > config.max_input_size)
        check.ok = false, check.violations.push_back(fmt::format("input exceeds {} bytes", config.max_input_size));
    if (!check.ok) {
        result.violations = check.violations;
        fail(result, error_type::VALIDATION_ERROR, boost::algorithm::join(check.violations, "; "));
        return result;
    }

    const language &lang = *find_language(request.language);
    try {
        ensure_image(lang.image);
    } catch (provisioning_error &e) {
        fail(result, error_type::PROVISIONING_ERROR, e.what());
        result.duration_ms = timer.duration<chrono::milliseconds>().count();
        return result;
    }

    container_spec spec;
    spec.image = lang.image;
    spec.command = {"sh", "-c", build_command(lang)};
    spec.env = lang.env;
    spec.env["ARENA_CODE"] = request.code + request.harness;
    spec.env["ARENA_INPUT"] = request.input;
    spec.labels = {{MANAGED_LABEL, "true"}, {"arena.language", lang.id}};
    spec.user = config.user;
    spec.memory_bytes = limits.memory_bytes;
    spec.cpu_period = limits.cpu_period;
    spec.cpu_quota = limits.cpu_quota;
    spec.pids_limit = limits.pids_limit;
    spec.nofile_limit = limits.nofile_limit;
    spec.nproc_limit = limits.nproc_limit;
    spec.scratch_size = limits.scratch_size;

    string id;
    try {
        id = runtime.create_container(spec);
    } catch (std::exception &e) {
        LOG(ERROR) << "Sandbox: unable to create container for " << lang.id << ": " << e.what();
        fail(result, error_type::PROVISIONING_ERROR, fmt::format("unable to create container: {}", e.what()));
        result.duration_ms = timer.duration<chrono::milliseconds>().count();
        return result;
    }
    result.container_id = id;

    output_buffer out(limits.max_output_size), err(limits.max_output_size);
    stream_demuxer demux(out, err);
    atomic<bool> aborted{false};
    future<void> streaming;
    // 无论以何种方式离开，都要停止读取并删除容器
    defer {
        aborted = true;
        cleanup(id);
    };

    try {
        runtime.start_container(id);
        streaming = async(launch::async, [&] {
            runtime.stream_logs(
                id, [&](const char *data, size_t size) { demux.feed(data, size); }, aborted);
        });

        if (streaming.wait_for(chrono::milliseconds(limits.timeout_ms)) == future_status::timeout) {
            result.timed_out = true;
            fail(result, error_type::TIME_LIMIT_EXCEEDED, fmt::format("execution exceeded {} ms", limits.timeout_ms));
            aborted = true;
            runtime.kill_container(id);
            streaming.wait();
        } else {
            streaming.get();
            if (demux.incomplete())
                LOG(WARNING) << "Sandbox: output stream of " << id << " ended inside a frame";
            result.exit_code = runtime.wait_container(id);
            container_state state = runtime.inspect_container(id);
            if (state.oom_killed) {
                result.memory_exceeded = true;
                fail(result, error_type::MEMORY_LIMIT_EXCEEDED, fmt::format("memory limit of {} bytes exceeded", limits.memory_bytes));
            } else if (result.exit_code != 0) {
                result.crashed = true;
                if (result.exit_code > 128)
                    fail(result, error_type::CRASHED, fmt::format("process killed by signal {}", result.exit_code - 128));
                else
                    fail(result, error_type::CRASHED, fmt::format("process exited with code {}", result.exit_code));
            }
        }
    } catch (std::exception &e) {
        LOG(ERROR) << "Sandbox: execution in container " << id << " failed: " << e.what();
        aborted = true;
        if (streaming.valid()) streaming.wait();
        if (result.error == error_type::NONE) {
            result.crashed = true;
            fail(result, error_type::CRASHED, fmt::format("execution failed: {}", e.what()));
        }
    }

    result.stdout_data = out.str();
    result.stderr_data = err.str();
    result.stdout_truncated = out.truncated();
    result.stderr_truncated = err.truncated();
    result.duration_ms = timer.duration<chrono::milliseconds>().count();

    LOG(INFO) << "Sandbox: " << lang.id << " in container " << id.substr(0, 12) << " finished in "
              << result.duration_ms << "ms: " << get_display_message(result.error);
    return result;
}

}  // namespace arena::sandbox
