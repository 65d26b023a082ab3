#include <glog/logging.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <iostream>
#include <thread>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "diagnosis/diagnosis_client.hpp"
#include "monitor/metrics.hpp"
#include "sandbox/docker_sandbox.hpp"
#include "sandbox/process_sandbox.hpp"
#include "server/http_server.hpp"
#include "service/job_service.hpp"
#include "store/memory_store.hpp"
#include "store/redis_store.hpp"
#include "worker.hpp"
using namespace std;

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_alsologtostderr = true;

    namespace po = boost::program_options;
    po::options_description desc("orbit-judge options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load configuration from the given JSON file. Options given on command line or by environment variables take precedence.")
        ("workers", po::value<size_t>(), "set the number of worker threads, default to 5. You can either pass it from environ ORBIT_WORKERS")
        ("backend", po::value<string>(), "set the job store and queue backend, memory or redis, default to redis. You can either pass it from environ ORBIT_BACKEND")
        ("sandbox", po::value<string>(), "set the sandbox to run user code, process or docker, default to docker. You can either pass it from environ ORBIT_SANDBOX")
        ("redis-host", po::value<string>(), "set the host of redis server, default to localhost. You can either pass it from environ REDIS_HOST")
        ("redis-port", po::value<int>(), "set the port of redis server, default to 6379. You can either pass it from environ REDIS_PORT")
        ("listen", po::value<string>(), "set the address the HTTP server listens on, default to 0.0.0.0")
        ("port", po::value<unsigned short>(), "set the port the HTTP server listens on, default to 8080")
        ("work-dir", po::value<string>(), "set the directory to store temporary run directories of user code. You can either pass it from environ ORBIT_WORK_DIR")
        ("image", po::value<string>(), "set the docker image to run user code in, default to python:alpine")
        ("diagnosis-url", po::value<string>(), "set the URL of the diagnosis service, empty to disable. You can either pass it from environ ORBIT_DIAGNOSIS_URL")
        ("debug", "turn on the debug mode to log everything to stderr")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "Orbit Judge: Accept code submissions, run them in sandboxes and judge the output" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "orbit-judge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        FLAGS_logtostderr = true;
        FLAGS_minloglevel = 0;
    }

    orbit::configuration config;
    try {
        if (vm.count("config"))
            config = orbit::load_configuration(vm.at("config").as<string>());
        orbit::apply_environment(config);

        if (vm.count("workers")) config.workers = vm.at("workers").as<size_t>();
        if (vm.count("backend")) config.backend = vm.at("backend").as<string>();
        if (vm.count("sandbox")) config.sandbox.type = vm.at("sandbox").as<string>();
        if (vm.count("redis-host")) config.redis.host = vm.at("redis-host").as<string>();
        if (vm.count("redis-port")) config.redis.port = vm.at("redis-port").as<int>();
        if (vm.count("listen")) config.http.listen = vm.at("listen").as<string>();
        if (vm.count("port")) config.http.port = vm.at("port").as<unsigned short>();
        if (vm.count("work-dir")) config.sandbox.work_dir = vm.at("work-dir").as<string>();
        if (vm.count("image")) config.sandbox.docker.image = vm.at("image").as<string>();
        if (vm.count("diagnosis-url")) config.diagnosis.url = vm.at("diagnosis-url").as<string>();

        orbit::validate_configuration(config);
    } catch (orbit::configuration_error& ex) {
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    }

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    filesystem::create_directories(config.sandbox.work_dir);
    CHECK(filesystem::is_directory(config.sandbox.work_dir))
        << "Work directory " << config.sandbox.work_dir << " does not exist";

    unique_ptr<orbit::store::job_store> store;
    unique_ptr<orbit::store::job_queue> queue;
    if (config.backend == "redis") {
        LOG(INFO) << "Using redis backend " << config.redis.host << ":" << config.redis.port;
        store = make_unique<orbit::store::redis_job_store>(config.redis);
        queue = make_unique<orbit::store::redis_job_queue>(config.redis);
    } else {
        LOG(WARNING) << "Using in-memory backend, jobs will be lost when the process exits";
        store = make_unique<orbit::store::memory_job_store>();
        queue = make_unique<orbit::store::memory_job_queue>();
    }

    unique_ptr<orbit::sandbox> runner;
    if (config.sandbox.type == "docker") {
        LOG(INFO) << "Using docker sandbox with image " << config.sandbox.docker.image;
        runner = make_unique<orbit::docker_sandbox>(config.sandbox.work_dir, config.sandbox.docker);
    } else {
        LOG(INFO) << "Using process sandbox with interpreter " << config.sandbox.interpreter;
        runner = make_unique<orbit::process_sandbox>(config.sandbox.work_dir, config.sandbox.interpreter);
    }

    orbit::http_diagnosis_client diagnosis(config.diagnosis);
    auto metrics = make_shared<orbit::metrics_monitor>();

    orbit::worker_options options;
    options.limits = config.sandbox.limits;
    options.job_ttl = config.job_ttl;
    orbit::worker_pool pool(*store, *queue, *runner, diagnosis, options);
    pool.register_monitor(metrics);

    orbit::job_service service(*store, *queue, config.job_ttl);

    unique_ptr<orbit::server::http_server> server;
    try {
        server = make_unique<orbit::server::http_server>(service, *metrics, config.http);
    } catch (std::exception& ex) {
        LOG(ERROR) << "Unable to start HTTP server on " << config.http.listen << ":" << config.http.port << ", " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        return EXIT_FAILURE;
    }

    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signum) {
        if (ec) return;
        LOG(WARNING) << "Received signal " << signum << ", stopping workers";
        pool.stop();
        server->stop();
    });
    thread signal_thread([&] { signal_context.run(); });

    pool.start(config.workers);
    server->run();

    pool.stop();
    pool.join();
    signal_context.stop();
    signal_thread.join();
    LOG(INFO) << "Orbit Judge stopped";
    return EXIT_SUCCESS;
}
