#include "config.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace orbit {
using namespace std;
using namespace nlohmann;

template <typename T>
static void get_optional(const json &j, const char *key, T &value) {
    if (j.count(key))
        j.at(key).get_to(value);
}

static void get_optional(const json &j, const char *key, chrono::milliseconds &value) {
    if (j.count(key))
        value = chrono::milliseconds(j.at(key).get<int64_t>());
}

void from_json(const json &j, redis_config &config) {
    get_optional(j, "host", config.host);
    get_optional(j, "port", config.port);
    get_optional(j, "retry_interval", config.retry_interval);
    get_optional(j, "password", config.password);
}

void from_json(const json &j, diagnosis_config &config) {
    get_optional(j, "url", config.url);
    get_optional(j, "timeout", config.timeout);
    get_optional(j, "connect_timeout", config.connect_timeout);
}

void from_json(const json &j, http_config &config) {
    get_optional(j, "listen", config.listen);
    get_optional(j, "port", config.port);
}

static void from_json(const json &j, docker_config &config) {
    get_optional(j, "socket", config.socket);
    get_optional(j, "api_version", config.api_version);
    get_optional(j, "image", config.image);
    get_optional(j, "interpreter", config.interpreter);
}

void from_json(const json &j, sandbox_config &config) {
    get_optional(j, "type", config.type);
    if (j.count("work_dir"))
        config.work_dir = j.at("work_dir").get<string>();
    get_optional(j, "interpreter", config.interpreter);
    get_optional(j, "memory_limit", config.limits.memory_limit);
    get_optional(j, "wall_limit", config.limits.wall_limit);
    get_optional(j, "file_limit", config.limits.file_limit);
    get_optional(j, "output_limit", config.limits.output_limit);
    get_optional(j, "no_network", config.limits.no_network);
    if (j.count("docker"))
        from_json(j.at("docker"), config.docker);
}

void from_json(const json &j, configuration &config) {
    get_optional(j, "workers", config.workers);
    get_optional(j, "backend", config.backend);
    if (j.count("job_ttl"))
        config.job_ttl = chrono::seconds(j.at("job_ttl").get<int64_t>());
    if (j.count("redis"))
        j.at("redis").get_to(config.redis);
    if (j.count("sandbox"))
        j.at("sandbox").get_to(config.sandbox);
    if (j.count("diagnosis"))
        j.at("diagnosis").get_to(config.diagnosis);
    if (j.count("http"))
        j.at("http").get_to(config.http);
}

configuration load_configuration(const filesystem::path &path) {
    string content;
    try {
        content = read_file_content(path);
    } catch (system_error &ex) {
        throw configuration_error(fmt::format("unable to open configuration file {}: {}", path.string(), ex.what()));
    }

    configuration config;
    try {
        json::parse(content).get_to(config);
    } catch (json::exception &ex) {
        throw configuration_error(fmt::format("malformed configuration file {}: {}", path.string(), ex.what()));
    }
    LOG(INFO) << "Loaded configuration from " << path;
    return config;
}

template <typename T>
static void env_override(const char *key, T &value) {
    const char *env = getenv(key);
    if (!env) return;
    try {
        value = boost::lexical_cast<T>(env);
    } catch (boost::bad_lexical_cast &) {
        throw configuration_error(fmt::format("invalid value of environment variable {}: {}", key, env));
    }
}

void apply_environment(configuration &config) {
    env_override("ORBIT_WORKERS", config.workers);
    env_override("ORBIT_BACKEND", config.backend);
    env_override("ORBIT_SANDBOX", config.sandbox.type);
    env_override("ORBIT_DIAGNOSIS_URL", config.diagnosis.url);
    env_override("REDIS_HOST", config.redis.host);
    env_override("REDIS_PORT", config.redis.port);
    env_override("REDIS_PASSWORD", config.redis.password);

    string work_dir = get_env("ORBIT_WORK_DIR", "");
    if (!work_dir.empty()) config.sandbox.work_dir = work_dir;

    string docker_host = get_env("DOCKER_HOST", "");
    if (!docker_host.empty()) {
        const string scheme = "unix://";
        if (docker_host.compare(0, scheme.size(), scheme) != 0)
            throw configuration_error("only unix:// addresses are supported in DOCKER_HOST, got " + docker_host);
        config.sandbox.docker.socket = docker_host.substr(scheme.size());
    }
}

void validate_configuration(const configuration &config) {
    if (config.workers == 0)
        throw configuration_error("number of workers must be positive");
    if (config.backend != "memory" && config.backend != "redis")
        throw configuration_error("unknown backend " + config.backend + ", expected memory or redis");
    if (config.sandbox.type != "process" && config.sandbox.type != "docker")
        throw configuration_error("unknown sandbox " + config.sandbox.type + ", expected process or docker");
    if (config.job_ttl.count() <= 0)
        throw configuration_error("job_ttl must be positive");
    if (config.sandbox.limits.wall_limit.count() <= 0)
        throw configuration_error("sandbox wall_limit must be positive");
    if (config.sandbox.limits.memory_limit <= 0)
        throw configuration_error("sandbox memory_limit must be positive");
}

}  // namespace orbit
