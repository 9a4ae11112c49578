#include "sandbox/docker_client.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <sstream>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace arena::sandbox {
using namespace std;
using namespace nlohmann;

static size_t write_to_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *body = static_cast<string *>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

struct stream_context {
    const function<void(const char *, size_t)> *on_data;
    const atomic<bool> *aborted;
};

static size_t write_to_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *context = static_cast<stream_context *>(userdata);
    if (*context->aborted) return 0;  // 返回 0 会让 CURL 中断传输
    (*context->on_data)(ptr, size * nmemb);
    return size * nmemb;
}

static int abort_on_flag(void *userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto *context = static_cast<stream_context *>(userdata);
    return *context->aborted ? 1 : 0;
}

static string escape(const string &value) {
    string result;
    if (CURL *curl = curl_easy_init()) {
        if (char *escaped = curl_easy_escape(curl, value.c_str(), (int)value.size())) {
            result = escaped;
            curl_free(escaped);
        }
        curl_easy_cleanup(curl);
    }
    return result;
}

json to_create_body(const container_spec &spec) {
    json env = json::array();
    for (auto &[key, value] : spec.env)
        env.push_back(key + "=" + value);

    json host_config = {
        {"Memory", spec.memory_bytes},
        {"MemorySwap", spec.memory_bytes},  // 与 Memory 相同表示不允许使用 swap
        {"CpuPeriod", spec.cpu_period},
        {"CpuQuota", spec.cpu_quota},
        {"PidsLimit", spec.pids_limit},
        {"NetworkMode", "none"},
        {"ReadonlyRootfs", true},
        {"Privileged", false},
        {"AutoRemove", false},
        {"CapDrop", {"ALL"}},
        {"SecurityOpt", {"no-new-privileges"}},
        {"Tmpfs", {{"/tmp", fmt::format("rw,exec,nosuid,nodev,size={},mode=1777", spec.scratch_size)}}},
        {"Ulimits", {{{"Name", "nofile"}, {"Soft", spec.nofile_limit}, {"Hard", spec.nofile_limit}},
                     {{"Name", "nproc"}, {"Soft", spec.nproc_limit}, {"Hard", spec.nproc_limit}}}}};

    return {
        {"Image", spec.image},
        {"Cmd", spec.command},
        {"Env", env},
        {"Labels", spec.labels},
        {"User", spec.user},
        {"WorkingDir", spec.working_dir},
        {"NetworkDisabled", true},
        {"AttachStdin", false},
        {"AttachStdout", true},
        {"AttachStderr", true},
        {"OpenStdin", false},
        {"Tty", false},
        {"HostConfig", host_config}};
}

docker_client::docker_client(const docker_config &config)
    : config(config) {}

string docker_client::url(const string &path) const {
    // 通过 unix socket 访问时主机名无关紧要
    return "http://localhost/" + config.api_version + path;
}

docker_client::http_response docker_client::request(const string &method, const string &path,
                                                    const string &body, long timeout_ms) {
    http_response response;
    CURL *curl = curl_easy_init();
    if (!curl)
        BOOST_THROW_EXCEPTION(docker_error("unable to initialize curl"));

    string target = url(path);
    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, config.socket.c_str());
    curl_easy_setopt(curl, CURLOPT_URL, target.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (timeout_ms > 0)
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    if (method == "POST" || !body.empty()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());
    }

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK)
        BOOST_THROW_EXCEPTION(docker_error(fmt::format("{} {} failed: {}", method, path, curl_easy_strerror(res))));
    DLOG(INFO) << "Docker: " << method << " " << path << " -> " << response.status;
    return response;
}

static string error_message(const string &body) {
    try {
        return get_value_def<string>(json::parse(body), body, "message");
    } catch (json::exception &) {
        return body;
    }
}

bool docker_client::ping() {
    try {
        return request("GET", "/_ping", "", config.request_timeout_ms).status == 200;
    } catch (docker_error &e) {
        LOG(WARNING) << "Docker: ping failed: " << e.what();
        return false;
    }
}

bool docker_client::image_exists(const string &image) {
    auto response = request("GET", "/images/" + image + "/json", "", config.request_timeout_ms);
    if (response.status == 200) return true;
    if (response.status == 404) return false;
    BOOST_THROW_EXCEPTION(docker_error(fmt::format("inspect image {} failed: {}", image, error_message(response.body))));
}

void docker_client::pull_image(const string &image) {
    // 不带 tag 拉取会拉下所有 tag，因此显式拆分
    string name = image, tag = "latest";
    size_t colon = image.rfind(':');
    if (colon != string::npos && image.find('/', colon) == string::npos) {
        name = image.substr(0, colon);
        tag = image.substr(colon + 1);
    }

    LOG(INFO) << "Docker: pulling image " << image;
    auto response = request("POST", "/images/create?fromImage=" + escape(name) + "&tag=" + escape(tag), "", config.pull_timeout_ms);
    if (response.status != 200)
        BOOST_THROW_EXCEPTION(docker_error(fmt::format("pull image {} failed: {}", image, error_message(response.body))));

    // 拉取进度以多行 JSON 返回，出错时某一行带有 error 字段
    istringstream lines(response.body);
    string line;
    while (getline(lines, line)) {
        if (line.empty()) continue;
        try {
            json progress = json::parse(line);
            if (progress.count("error"))
                BOOST_THROW_EXCEPTION(docker_error(fmt::format("pull image {} failed: {}", image, progress.at("error").get<string>())));
        } catch (json::exception &e) {
            LOG(WARNING) << "Docker: unrecognized pull progress: " << line;
        }
    }
    LOG(INFO) << "Docker: pulled image " << image;
}

string docker_client::create_container(const container_spec &spec) {
    auto response = request("POST", "/containers/create", to_create_body(spec).dump(), config.request_timeout_ms);
    if (response.status != 201)
        BOOST_THROW_EXCEPTION(docker_error(fmt::format("create container failed ({}): {}", response.status, error_message(response.body))));
    return json::parse(response.body).at("Id").get<string>();
}

void docker_client::start_container(const string &id) {
    auto response = request("POST", "/containers/" + id + "/start", "", config.request_timeout_ms);
    if (response.status != 204 && response.status != 304)
        BOOST_THROW_EXCEPTION(docker_error(fmt::format("start container {} failed: {}", id, error_message(response.body))));
}

void docker_client::stream_logs(const string &id,
                                const function<void(const char *, size_t)> &on_data,
                                const atomic<bool> &aborted) {
    CURL *curl = curl_easy_init();
    if (!curl)
        BOOST_THROW_EXCEPTION(docker_error("unable to initialize curl"));

    stream_context context{&on_data, &aborted};
    string target = url("/containers/" + id + "/logs?follow=1&stdout=1&stderr=1");
    curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, config.socket.c_str());
    curl_easy_setopt(curl, CURLOPT_URL, target.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_on_flag);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &context);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    if (aborted) return;
    if (res != CURLE_OK)
        BOOST_THROW_EXCEPTION(docker_error(fmt::format("read logs of {} failed: {}", id, curl_easy_strerror(res))));
    if (status != 200)
        BOOST_THROW_EXCEPTION(docker_error(fmt::format("read logs of {} failed with status {}", id, status)));
}

int docker_client::wait_container(const string &id) {
    auto response = request("POST", "/containers/" + id + "/wait", "", config.request_timeout_ms);
    if (response.status != 200)
        BOOST_THROW_EXCEPTION(docker_error(fmt::format("wait container {} failed: {}", id, error_message(response.body))));
    return json::parse(response.body).at("StatusCode").get<int>();
}

container_state docker_client::inspect_container(const string &id) {
    auto response = request("GET", "/containers/" + id + "/json", "", config.request_timeout_ms);
    if (response.status != 200)
        BOOST_THROW_EXCEPTION(docker_error(fmt::format("inspect container {} failed: {}", id, error_message(response.body))));
    json j = json::parse(response.body);
    container_state state;
    state.running = get_value_def(j, false, "State", "Running");
    state.oom_killed = get_value_def(j, false, "State", "OOMKilled");
    state.exit_code = get_value_def(j, 0, "State", "ExitCode");
    state.error = get_value_def<string>(j, "", "State", "Error");
    return state;
}

void docker_client::kill_container(const string &id) {
    auto response = request("POST", "/containers/" + id + "/kill", "", config.request_timeout_ms);
    // 404: 容器已经被删除，409: 容器已经停止
    if (response.status != 204 && response.status != 404 && response.status != 409)
        BOOST_THROW_EXCEPTION(docker_error(fmt::format("kill container {} failed: {}", id, error_message(response.body))));
}

void docker_client::remove_container(const string &id) {
    auto response = request("DELETE", "/containers/" + id + "?force=true&v=true", "", config.request_timeout_ms);
    if (response.status != 204 && response.status != 404)
        BOOST_THROW_EXCEPTION(docker_error(fmt::format("remove container {} failed: {}", id, error_message(response.body))));
}

vector<string> docker_client::list_containers(const string &label) {
    json filters = {{"label", {label}}};
    auto response = request("GET", "/containers/json?all=true&filters=" + escape(filters.dump()), "", config.request_timeout_ms);
    if (response.status != 200)
        BOOST_THROW_EXCEPTION(docker_error(fmt::format("list containers failed: {}", error_message(response.body))));
    vector<string> ids;
    for (auto &container : json::parse(response.body))
        ids.push_back(container.at("Id").get<string>());
    return ids;
}

}  // namespace arena::sandbox
