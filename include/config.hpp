#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <string>
#include "sandbox/docker_sandbox.hpp"
#include "sandbox/sandbox.hpp"

namespace orbit {

/**
 * redis 的登录情况
 */
struct redis_config {
    /**
     * @brief redis 服务器地址
     */
    std::string host = "localhost";

    /**
     * @brief redis 服务器端口
     */
    int port = 6379;

    /**
     * @brief 重试时间间隔，单位毫秒
     */
    unsigned retry_interval = 1000;

    /**
     * @brief 密码，若不为空，则使用该密码登录
     */
    std::string password;
};

void from_json(const nlohmann::json &j, redis_config &config);

/**
 * @brief 诊断服务的地址和超时时间
 */
struct diagnosis_config {
    /**
     * @brief 诊断接口的完整地址，为空时不请求诊断服务，直接返回占位文本
     */
    std::string url = "http://localhost:5001/analyze";

    std::chrono::milliseconds timeout{10000};

    std::chrono::milliseconds connect_timeout{2000};
};

void from_json(const nlohmann::json &j, diagnosis_config &config);

struct http_config {
    std::string listen = "0.0.0.0";
    unsigned short port = 8080;
};

void from_json(const nlohmann::json &j, http_config &config);

struct sandbox_config {
    /**
     * @brief 沙箱类型，可选 process, docker
     */
    std::string type = "docker";

    /**
     * @brief 存放临时运行目录的文件夹
     */
    std::filesystem::path work_dir = std::filesystem::temp_directory_path() / "orbit";

    /**
     * @brief process 沙箱使用的解释器
     */
    std::string interpreter = "python3";

    resource_limits limits;

    docker_config docker;
};

void from_json(const nlohmann::json &j, sandbox_config &config);

/**
 * @brief 评测系统的全部配置
 * 配置的优先级从高到低为：命令行参数、环境变量、配置文件、默认值
 */
struct configuration {
    /**
     * @brief worker 线程数
     */
    std::size_t workers = 5;

    /**
     * @brief 任务存储和任务队列的实现，可选 memory, redis
     * memory 只适用于单进程运行，进程退出后数据丢失
     */
    std::string backend = "redis";

    /**
     * @brief 提交记录在最后一次写入后保留的时间
     */
    std::chrono::seconds job_ttl{3600};

    redis_config redis;

    sandbox_config sandbox;

    diagnosis_config diagnosis;

    http_config http;
};

void from_json(const nlohmann::json &j, configuration &config);

/**
 * @brief 从 JSON 配置文件读取配置，文件中没有出现的项保持默认值
 * @throw configuration_error 若文件无法读取或者格式不正确
 */
configuration load_configuration(const std::filesystem::path &path);

/**
 * @brief 用环境变量覆盖配置
 * 支持 ORBIT_WORKERS, ORBIT_BACKEND, ORBIT_SANDBOX, ORBIT_WORK_DIR, ORBIT_DIAGNOSIS_URL,
 * REDIS_HOST, REDIS_PORT, REDIS_PASSWORD, DOCKER_HOST (仅支持 unix:// 地址)
 * @throw configuration_error 若环境变量的值不合法
 */
void apply_environment(configuration &config);

/**
 * @brief 检查配置是否合法
 * @throw configuration_error 若配置不合法，比如 worker 数为 0 或者后端类型未知
 */
void validate_configuration(const configuration &config);

}  // namespace orbit
