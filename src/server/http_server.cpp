#include "server/http_server.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <limits>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "sandbox/language.hpp"

namespace arena::server {
using namespace std;
using namespace nlohmann;

static const char *ROOM_ID = "([0-9a-fA-F]{24})";

/**
 * @brief amount << shift，非正数返回 0，溢出时取 int64_t 的最大值
 */
static int64_t scale(int64_t amount, int shift) {
    if (amount <= 0) return 0;
    if (amount > (numeric_limits<int64_t>::max() >> shift)) return numeric_limits<int64_t>::max();
    return amount << shift;
}

int64_t parse_memory_limit(const json &value) {
    if (value.is_number_unsigned()) {
        uint64_t amount = value.get<uint64_t>();
        if (amount > (uint64_t)numeric_limits<int64_t>::max()) return numeric_limits<int64_t>::max();
        return scale((int64_t)amount, 20);
    }
    if (value.is_number_integer())
        return scale(value.get<int64_t>(), 20);
    if (!value.is_string()) return 0;

    string text = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(value.get<string>()));
    size_t digits = 0;
    while (digits < text.size() && isdigit((unsigned char)text[digits])) ++digits;
    if (digits == 0 || digits > 12) return 0;
    int64_t amount = stoll(text.substr(0, digits));
    string unit = text.substr(digits);
    if (unit.empty() || unit == "m" || unit == "mb") return scale(amount, 20);
    if (unit == "k" || unit == "kb") return scale(amount, 10);
    if (unit == "g" || unit == "gb") return scale(amount, 30);
    if (unit == "b") return scale(amount, 0);
    return 0;
}

static json error_body(const string &type, const string &message) {
    return {{"success", false}, {"error", {{"type", type}, {"message", message}}}};
}

static json parse_body(const httplib::Request &req) {
    if (req.body.empty()) return json::object();
    json body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object())
        BOOST_THROW_EXCEPTION(validation_error("Request body must be a JSON object"));
    return body;
}

/**
 * @brief 当前用户，由前置的认证层通过 X-User-Id 传入，也可以放在请求体中
 */
static string user_of(const httplib::Request &req, const json &body) {
    string user = req.get_header_value("X-User-Id");
    if (user.empty()) user = get_value_def<string>(body, "", "userId");
    return user;
}

static string client_of(const httplib::Request &req) {
    string forwarded = req.get_header_value("X-Forwarded-For");
    if (!forwarded.empty()) return boost::algorithm::trim_copy(forwarded.substr(0, forwarded.find(',')));
    return req.remote_addr;
}

http_server::http_server(const http_config &config, sandbox::sandbox &box, battle::battle_service &battles,
                         rate_limiter &limiter)
    : config(config), box(box), battles(battles), limiter(limiter) {
    server.set_payload_max_length(config.max_body_size);
    int threads = config.threads;
    server.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    setup_routes();
}

void http_server::route(const string &method, const string &pattern, handler h) {
    auto wrapped = [h](const httplib::Request &req, httplib::Response &res) {
        json body;
        try {
            res.status = 200;
            body = h(req, res);
        } catch (validation_error &e) {
            res.status = 400, body = error_body("ValidationError", e.what());
        } catch (forbidden_error &e) {
            res.status = 403, body = error_body("ForbiddenError", e.what());
        } catch (not_found_error &e) {
            res.status = 404, body = error_body("NotFoundError", e.what());
        } catch (conflict_error &e) {
            res.status = 409, body = error_body("ConflictError", e.what());
        } catch (json::exception &e) {
            res.status = 400, body = error_body("ValidationError", e.what());
        } catch (boost::bad_lexical_cast &e) {
            res.status = 400, body = error_body("ValidationError", e.what());
        } catch (std::exception &e) {
            LOG(ERROR) << req.method << " " << req.path << " failed, " << boost::diagnostic_information(e);
            res.status = 500, body = error_body("InternalError", e.what());
        }
        res.set_content(body.dump(), "application/json");
    };
    routes.push_back({method, regex(pattern), wrapped});
    if (method == "GET")
        server.Get(pattern, wrapped);
    else
        server.Post(pattern, wrapped);
}

void http_server::setup_routes() {
    route("GET", "/health", [this](const httplib::Request &, httplib::Response &res) -> json {
        bool docker = false;
        size_t live = 0;
        try {
            docker = box.get_runtime().ping();
            if (docker) live = box.live_containers().size();
        } catch (std::exception &e) {
            LOG(WARNING) << "Health check: container daemon unavailable, " << e.what();
        }
        if (!docker) res.status = 503;
        return {{"status", docker ? "ok" : "degraded"}, {"docker", docker}, {"liveContainers", live}};
    });

    route("GET", "/api/languages", [](const httplib::Request &, httplib::Response &) -> json {
        json languages = json::array();
        for (auto &lang : sandbox::supported_languages())
            languages.push_back({{"id", lang.id}, {"name", lang.display_name}, {"image", lang.image}});
        return {{"success", true}, {"languages", languages}};
    });

    route("POST", "/api/execute", [this](const httplib::Request &req, httplib::Response &res) -> json {
        if (!limiter.try_acquire(client_of(req))) {
            res.status = 429;
            return error_body("RateLimitError", "Too many requests");
        }
        json body = parse_body(req);
        sandbox::execution_request request;
        request.language = get_value_def<string>(body, "", "language");
        request.code = get_value_def<string>(body, "", "code");
        request.input = get_value_def<string>(body, "", "input");
        if (!sandbox::find_language(request.language))
            BOOST_THROW_EXCEPTION(validation_error("Unsupported language: " + request.language));
        int timeout = get_value_def<int>(body, 0, "timeoutMs");
        if (timeout == 0) timeout = get_value_def<int>(body, 0, "timeout");
        request.limits = box.clamp(timeout, parse_memory_limit(access_optional(body, "memoryLimit")));

        sandbox::execution_result result = box.execute(request);
        if (result.error == error_type::VALIDATION_ERROR) res.status = 400;
        return result;
    });

    route("GET", "/api/battle/problems", [this](const httplib::Request &req, httplib::Response &) {
        return battles.list_problems(req.get_param_value("difficulty"));
    });

    route("POST", "/api/battle/create", [this](const httplib::Request &req, httplib::Response &res) {
        json body = parse_body(req);
        battle::create_request request;
        request.user_id = user_of(req, body);
        request.name = get_value_def<string>(body, "", "name");
        request.difficulty = get_value_def<string>(body, "Easy", "difficulty");
        request.problem_id = get_value_def<string>(body, "", "problemId");
        request.duration_minutes = get_value_def<int>(body, 0, "battleTime");
        json result = battles.create(request);
        res.status = 201;
        return result;
    });

    route("POST", "/api/battle/join", [this](const httplib::Request &req, httplib::Response &) {
        json body = parse_body(req);
        return battles.join(get_value_def<string>(body, "", "roomCode"), user_of(req, body));
    });

    route("POST", string("/api/battle/") + ROOM_ID + "/leave", [this](const httplib::Request &req, httplib::Response &) {
        json body = parse_body(req);
        return battles.leave(req.matches[1], user_of(req, body));
    });

    route("POST", string("/api/battle/") + ROOM_ID + "/ready", [this](const httplib::Request &req, httplib::Response &) {
        json body = parse_body(req);
        return battles.ready(req.matches[1], user_of(req, body), get_value_def<bool>(body, true, "ready"));
    });

    route("POST", string("/api/battle/") + ROOM_ID + "/start", [this](const httplib::Request &req, httplib::Response &) {
        json body = parse_body(req);
        return battles.start(req.matches[1], user_of(req, body));
    });

    route("POST", string("/api/battle/") + ROOM_ID + "/test", [this](const httplib::Request &req, httplib::Response &res) {
        if (!limiter.try_acquire(client_of(req))) {
            res.status = 429;
            return error_body("RateLimitError", "Too many requests");
        }
        json body = parse_body(req);
        return battles.test(req.matches[1], user_of(req, body), get_value_def<string>(body, "", "code"),
                            get_value_def<string>(body, "python", "language"));
    });

    route("POST", string("/api/battle/") + ROOM_ID + "/submit", [this](const httplib::Request &req, httplib::Response &res) {
        if (!limiter.try_acquire(client_of(req))) {
            res.status = 429;
            return error_body("RateLimitError", "Too many requests");
        }
        json body = parse_body(req);
        return battles.submit(req.matches[1], user_of(req, body), get_value_def<string>(body, "", "code"),
                              get_value_def<string>(body, "python", "language"));
    });

    route("POST", string("/api/battle/") + ROOM_ID + "/end", [this](const httplib::Request &req, httplib::Response &) {
        json body = parse_body(req);
        return battles.end(req.matches[1], user_of(req, body));
    });

    route("GET", string("/api/battle/") + ROOM_ID + "/lobby", [this](const httplib::Request &req, httplib::Response &) {
        return battles.lobby(req.matches[1], req.get_header_value("X-User-Id"));
    });

    route("GET", string("/api/battle/") + ROOM_ID + "/results", [this](const httplib::Request &req, httplib::Response &) {
        return battles.results(req.matches[1]);
    });

    route("GET", string("/api/battle/") + ROOM_ID + "/submissions", [this](const httplib::Request &req, httplib::Response &) {
        return battles.submission_history(req.matches[1], req.get_header_value("X-User-Id"));
    });

    route("GET", "/api/leaderboard/battle", [this](const httplib::Request &req, httplib::Response &) {
        size_t limit = 50;
        if (req.has_param("limit"))
            limit = clamp<size_t>(boost::lexical_cast<size_t>(req.get_param_value("limit")), 1, 200);
        return battles.leaderboard_list(limit);
    });
}

httplib::Response http_server::dispatch(const string &method, const string &path,
                                        const string &body, const httplib::Headers &headers) {
    httplib::Request req;
    req.method = method;
    req.body = body;
    req.headers = headers;
    req.remote_addr = "127.0.0.1";
    auto query = path.find('?');
    req.path = path.substr(0, query);
    if (query != string::npos)
        httplib::detail::parse_query_text(path.substr(query + 1), req.params);

    httplib::Response res;
    for (auto &entry : routes) {
        if (entry.method == method && regex_match(req.path, req.matches, entry.pattern)) {
            entry.h(req, res);
            return res;
        }
    }
    res.status = 404;
    res.set_content(error_body("NotFoundError", "No route for " + method + " " + req.path).dump(), "application/json");
    return res;
}

bool http_server::run() {
    LOG(INFO) << "Listening on " << config.host << ":" << config.port;
    return server.listen(config.host.c_str(), config.port);
}

void http_server::stop() {
    server.stop();
}

}  // namespace arena::server
