#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include "common/http_client.hpp"
#include "sandbox/sandbox.hpp"

namespace orbit {

/**
 * @brief 连接 Docker 守护进程所需的参数
 */
struct docker_config {
    /**
     * @brief Docker 守护进程监听的 UNIX 套接字
     */
    std::string socket = "/var/run/docker.sock";

    /**
     * @brief Docker Engine API 版本，会作为路径前缀，比如 /v1.45/containers/create
     */
    std::string api_version = "v1.45";

    /**
     * @brief 运行用户代码的镜像，需要提前拉取
     */
    std::string image = "python:alpine";

    /**
     * @brief 镜像中的解释器命令
     */
    std::string interpreter = "python";
};

/**
 * @brief 将 Docker 日志接口返回的多路复用数据流拆分成 stdout 和 stderr
 * 每一帧由 8 字节的帧头和数据组成：第 0 字节为流类型（1 为 stdout，2 为 stderr），
 * 第 4 至 7 字节为大端序的数据长度。
 * 若数据不符合帧格式（比如容器启用了 TTY），剩余部分全部视为 stdout。
 */
void demultiplex_docker_stream(const std::string &raw, std::string &output, std::string &error);

/**
 * @brief 在一次性的 Docker 容器中运行用户代码
 * 源文件写入 work_dir 下唯一命名的运行目录，该目录以只读方式挂载到容器的 /app。
 * 容器禁用网络，内存与交换空间的上限相同，运行结束后（包括超时和出错）强制删除。
 * work_dir 必须是 Docker 守护进程所在主机上的路径。
 */
struct docker_sandbox : public sandbox {
    docker_sandbox(const std::filesystem::path &work_dir, const docker_config &config);

    sandbox_result run(const std::string &source, const resource_limits &limits) override;

    std::size_t active_environments() const override;

private:
    std::filesystem::path work_dir;
    docker_config config;
    std::atomic<std::size_t> active{0};

    /**
     * @brief 调用 Docker Engine API
     * @param path 不含版本前缀的路径，比如 /containers/create
     * @param timeout 请求超时时间，0 表示不限制
     * @throw sandbox_error 若守护进程返回了错误状态码
     * @throw network_error 若无法连接守护进程
     */
    http_response call(const std::string &method, const std::string &path, const std::string &body,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    void remove_container(const std::string &container_id);
};

}  // namespace orbit
