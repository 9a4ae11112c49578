#include <curl/curl.h>
#include <glog/logging.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <memory>
#include "battle/actor.hpp"
#include "battle/battle_service.hpp"
#include "battle/commit_sequencer.hpp"
#include "battle/leaderboard.hpp"
#include "battle/problem.hpp"
#include "battle/room_manager.hpp"
#include "battle/runner.hpp"
#include "battle/scheduler.hpp"
#include "common/defer.hpp"
#include "common/python.hpp"
#include "common/rate_limiter.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "evaluator/python_evaluator.hpp"
#include "sandbox/docker_client.hpp"
#include "sandbox/sandbox.hpp"
#include "sandbox/validator.hpp"
#include "server/http_server.hpp"
#include "store/memory_store.hpp"
#include "store/mysql_store.hpp"
#include "store/redis.hpp"
using namespace std;
using namespace arena;

static arena::server::http_server *running_server = nullptr;

void sigintHandler(int /* signum */) {
    LOG(ERROR) << "Received SIGINT, stopping server";
    if (running_server) running_server->stop();
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    wchar_t *progname = Py_DecodeLocale(argv[0], NULL);
    Py_SetProgramName(progname);
    evaluator::install_audit_hook();
    Py_Initialize();
    // 主线程释放 GIL，求值器在请求线程中各自获取
    PyThread_guard guard;

    curl_global_init(CURL_GLOBAL_ALL);

    namespace po = boost::program_options;
    po::options_description desc("arena-server options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "set the configuration file path. You can either pass it from environ ARENA_CONFIG")
        ("port", po::value<int>(), "set the port of the REST server. You can either pass it from environ ARENA_PORT")
        ("docker-socket", po::value<string>(), "set the unix socket of the container daemon. You can either pass it from environ DOCKER_SOCKET")
        ("problems", po::value<string>(), "load battle problems from the JSON file. You can either pass it from environ ARENA_PROBLEMS")
        ("debug", "turn on the debug mode to print more logs")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "Arena: run untrusted code in containers and host live coding battles" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "arena-server 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        arena::DEBUG = true;
    }

    configuration config;
    string config_path = vm.count("config") ? vm.at("config").as<string>() : get_env("ARENA_CONFIG", "");
    if (!config_path.empty()) {
        CHECK(filesystem::is_regular_file(config_path))
            << "Configuration file " << config_path << " does not exist";
        config = configuration::load(config_path);
    } else {
        LOG(WARNING) << "No configuration file given, using defaults";
    }

    if (vm.count("port")) {
        config.http.port = vm.at("port").as<int>();
    } else if (getenv("ARENA_PORT")) {
        config.http.port = boost::lexical_cast<int>(getenv("ARENA_PORT"));
    }

    if (vm.count("docker-socket")) {
        config.docker.socket = vm.at("docker-socket").as<string>();
    } else if (getenv("DOCKER_SOCKET")) {
        config.docker.socket = getenv("DOCKER_SOCKET");
    }

    if (vm.count("problems")) {
        config.battle.problems = vm.at("problems").as<string>();
    } else if (getenv("ARENA_PROBLEMS")) {
        config.battle.problems = getenv("ARENA_PROBLEMS");
    }

    try {
        sandbox::docker_client docker(config.docker);
        if (!docker.ping())
            LOG(WARNING) << "Container daemon at " << config.docker.socket << " is not reachable, execution requests will fail";
        sandbox::validator checker(config.validator.max_code_size);
        sandbox::sandbox box(docker, checker, config.sandbox);
        evaluator::python_evaluator evaluator(config.evaluator);

        unique_ptr<store::room_store> primary;
        if (config.redis) {
            primary = make_unique<store::redis_room_store>(*config.redis);
        } else {
            LOG(WARNING) << "Redis is not configured, room states are kept in memory";
            primary = make_unique<store::memory_room_store>((int64_t)config.battle.room_ttl_hours * 3600 * 1000, 100000);
        }

        unique_ptr<store::mysql_conn> database;
        unique_ptr<store::room_store> durable;
        unique_ptr<store::submission_store> submissions;
        unique_ptr<store::leaderboard_store> leaderboard_backend;
        if (config.database) {
            database = make_unique<store::mysql_conn>(*config.database);
            database->init_schema();
            durable = make_unique<store::mysql_room_store>(*database);
            submissions = make_unique<store::mysql_submission_store>(*database);
            leaderboard_backend = make_unique<store::mysql_leaderboard_store>(*database);
        } else {
            LOG(WARNING) << "Database is not configured, battle results will be lost on restart";
            durable = make_unique<store::memory_room_store>();
            submissions = make_unique<store::memory_submission_store>();
            leaderboard_backend = make_unique<store::memory_leaderboard_store>();
        }

        battle::problem_registry problems;
        if (!config.battle.problems.empty())
            problems.load_file(config.battle.problems);

        unique_ptr<battle::solution_runner> runner;
        if (config.battle.in_process)
            runner = make_unique<battle::in_process_runner>(evaluator);
        else
            runner = make_unique<battle::sandbox_runner>(box);

        battle::room_actor_pool actors(config.battle.actor_threads);
        battle::room_manager rooms(*primary, *durable, actors, config.battle);
        battle::commit_sequencer sequencer;
        battle::leaderboard ranking(*leaderboard_backend);
        battle::scheduler timers;
        battle::battle_service battles(rooms, timers, sequencer, problems, *runner, *submissions, ranking,
                                       config.battle, config.scoring, config.evaluator);
        // 定时线程和房间线程会回调 battles，必须在它析构之前停止
        defer {
            timers.stop();
            actors.stop();
        };
        battles.recover();
        battles.schedule_maintenance();

        rate_limiter limiter(config.rate_limit.capacity, config.rate_limit.window_ms, config.rate_limit.max_requests);
        server::http_server http(config.http, box, battles, limiter);
        running_server = &http;
        signal(SIGINT, sigintHandler);
        signal(SIGTERM, sigintHandler);

        bool listened = http.run();
        running_server = nullptr;
        if (!listened) {
            LOG(ERROR) << "Unable to listen on " << config.http.host << ":" << config.http.port;
            return EXIT_FAILURE;
        }
    } catch (std::exception &e) {
        LOG(ERROR) << "Arena server crashed, " << boost::diagnostic_information(e);
        return EXIT_FAILURE;
    }

    curl_global_cleanup();
    return EXIT_SUCCESS;
}
