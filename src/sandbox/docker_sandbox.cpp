#include "sandbox/docker_sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <csignal>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace orbit {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

const size_t FRAME_HEADER_SIZE = 8;
const int STREAM_STDOUT = 1;
const int STREAM_STDERR = 2;

// 容器内挂载运行目录的位置
const char *const CONTAINER_APP_DIR = "/app";

// 创建、启动、删除容器以及读取日志的请求超时时间
const chrono::milliseconds docker_request_timeout(30000);

void demultiplex_docker_stream(const string &raw, string &output, string &error) {
    size_t pos = 0;
    while (pos < raw.size()) {
        if (raw.size() - pos < FRAME_HEADER_SIZE || (unsigned char)raw[pos] > STREAM_STDERR) {
            output.append(raw, pos, string::npos);
            return;
        }

        int stream = (unsigned char)raw[pos];
        size_t length = ((size_t)(unsigned char)raw[pos + 4] << 24) |
                        ((size_t)(unsigned char)raw[pos + 5] << 16) |
                        ((size_t)(unsigned char)raw[pos + 6] << 8) |
                        ((size_t)(unsigned char)raw[pos + 7]);
        pos += FRAME_HEADER_SIZE;
        length = min(length, raw.size() - pos);

        if (stream == STREAM_STDERR)
            error.append(raw, pos, length);
        else if (stream == STREAM_STDOUT)
            output.append(raw, pos, length);
        pos += length;
    }
}

docker_sandbox::docker_sandbox(const fs::path &work_dir, const docker_config &config)
    : work_dir(work_dir), config(config) {}

size_t docker_sandbox::active_environments() const {
    return active.load();
}

http_response docker_sandbox::call(const string &method, const string &path, const string &body, chrono::milliseconds timeout) {
    http_options options;
    options.unix_socket = config.socket;
    options.timeout = timeout;

    string url = fmt::format("http://localhost/{}{}", config.api_version, path);
    http_response response = body.empty()
                                 ? http_request(method, url, body, {}, options)
                                 : http_request(method, url, body, {{"Content-Type", "application/json"}}, options);

    if (response.status >= 400) {
        string message = response.body;
        try {
            json j = json::parse(response.body);
            if (j.count("message")) message = j.at("message").get<string>();
        } catch (json::exception &) {
            // 守护进程返回的不是 JSON，直接使用原始响应体
        }
        throw sandbox_error(fmt::format("docker {} {} returned {}: {}", method, path, response.status, trim(message)));
    }
    return response;
}

void docker_sandbox::remove_container(const string &container_id) {
    try {
        call("DELETE", fmt::format("/containers/{}?force=1", container_id), "", docker_request_timeout);
        --active;
        DLOG(INFO) << "Docker: removed container " << container_id;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Docker: unable to remove container " << container_id << ": " << ex.what();
    }
}

sandbox_result docker_sandbox::run(const string &source, const resource_limits &limits) {
    fs::path rundir = work_dir / unique_artifact_name("job");
    {
        error_code ec;
        fs::create_directories(rundir, ec);
        if (ec) throw sandbox_error(fmt::format("unable to create run directory {}: {}", rundir.string(), ec.message()));
    }
    defer {
        error_code ec;
        fs::remove_all(rundir, ec);
        if (ec) LOG(WARNING) << "Docker: unable to remove run directory " << rundir << ": " << ec.message();
    };

    string filename = "main.py";
    try {
        write_file_content(rundir / filename, source, fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read);
    } catch (std::exception &ex) {
        throw sandbox_error(fmt::format("unable to write source file: {}", ex.what()));
    }

    json request = {
        {"Image", config.image},
        {"Cmd", json::array({config.interpreter, "-u", fmt::format("{}/{}", CONTAINER_APP_DIR, filename)})},
        {"WorkingDir", CONTAINER_APP_DIR},
        {"Env", json::array({"PYTHONDONTWRITEBYTECODE=1"})},
        {"AttachStdout", false},
        {"AttachStderr", false},
        {"Tty", false},
        {"NetworkDisabled", limits.no_network},
        {"HostConfig", {
            {"Memory", limits.memory_limit},
            {"MemorySwap", limits.memory_limit},
            {"Mounts", json::array({json{
                {"Type", "bind"},
                {"Source", fs::absolute(rundir).string()},
                {"Target", CONTAINER_APP_DIR},
                {"ReadOnly", true}
            }})}
        }}
    };
    if (limits.no_network)
        request["HostConfig"]["NetworkMode"] = "none";

    string container_id;
    try {
        http_response created = call("POST", "/containers/create", dump_json(request), docker_request_timeout);
        container_id = json::parse(created.body).at("Id").get<string>();
    } catch (sandbox_error &) {
        throw;
    } catch (std::exception &ex) {
        throw sandbox_error(fmt::format("unable to create container from image {}: {}", config.image, ex.what()));
    }
    ++active;
    defer { remove_container(container_id); };
    DLOG(INFO) << "Docker: created container " << container_id;

    elapsed_time timer;
    try {
        call("POST", fmt::format("/containers/{}/start", container_id), "", docker_request_timeout);
    } catch (sandbox_error &) {
        throw;
    } catch (std::exception &ex) {
        throw sandbox_error(fmt::format("unable to start container {}: {}", container_id, ex.what()));
    }

    sandbox_result result;
    try {
        // 等待请求的超时时间就是用户程序剩余的时钟时间
        auto remaining = limits.wall_limit - timer.duration<chrono::milliseconds>();
        http_response waited = call("POST", fmt::format("/containers/{}/wait?condition=not-running", container_id), "",
                                    max(remaining, chrono::milliseconds(1)));
        result.exitcode = json::parse(waited.body).at("StatusCode").get<int>();
        result.kind = result.exitcode == 0 ? exit_kind::NORMAL : exit_kind::CRASHED;
    } catch (timeout_error &) {
        LOG(WARNING) << "Docker: time limit exceeded (" << limits.wall_limit.count() << "ms), killing container " << container_id;
        result.kind = exit_kind::TIMED_OUT;
        result.signal = SIGKILL;
        try {
            call("POST", fmt::format("/containers/{}/kill?signal=SIGKILL", container_id), "", docker_request_timeout);
        } catch (std::exception &ex) {
            // 容器可能恰好已经退出，删除时会强制清理
            LOG(WARNING) << "Docker: unable to kill container " << container_id << ": " << ex.what();
        }
    } catch (sandbox_error &) {
        throw;
    } catch (std::exception &ex) {
        throw sandbox_error(fmt::format("unable to wait for container {}: {}", container_id, ex.what()));
    }
    result.wall_time = timer.duration<chrono::microseconds>().count() / 1e6;

    try {
        http_response logs = call("GET", fmt::format("/containers/{}/logs?stdout=1&stderr=1", container_id), "", docker_request_timeout);
        demultiplex_docker_stream(logs.body, result.output, result.error);
    } catch (std::exception &ex) {
        // 已经得到了退出状态，日志读取失败时保留空输出
        LOG(ERROR) << "Docker: unable to read logs of container " << container_id << ": " << ex.what();
    }

    if (result.output.size() > limits.output_limit) result.output.resize(limits.output_limit);
    if (result.error.size() > limits.output_limit) result.error.resize(limits.output_limit);

    DLOG(INFO) << fmt::format("Docker: container {} finished, exitcode {}, wall time {:.3f}s",
                              container_id, result.exitcode, result.wall_time);
    return result;
}

}  // namespace orbit
