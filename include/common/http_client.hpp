#pragma once

#include <chrono>
#include <map>
#include <string>

namespace orbit {

/**
 * @brief 一次 HTTP 请求的连接参数
 */
struct http_options {
    /**
     * @brief 若非空，则通过该 UNIX 套接字连接服务器（比如 Docker 守护进程）
     */
    std::string unix_socket;

    /**
     * @brief 整个请求的超时时间，0 表示不限制
     */
    std::chrono::milliseconds timeout{0};

    /**
     * @brief 建立连接的超时时间，0 表示使用 CURL 的默认值
     */
    std::chrono::milliseconds connect_timeout{0};
};

struct http_response {
    long status = 0;
    std::string body;
};

/**
 * @brief 通过 CURL 发送一个 HTTP 请求
 * 该函数可以被多个线程并发调用，每次调用使用独立的 CURL 句柄。
 * @param method HTTP 方法，比如 GET、POST、DELETE
 * @param url 请求地址，使用 UNIX 套接字时主机名部分会被忽略
 * @param body 请求体，为空时不发送请求体
 * @param headers 额外的请求头
 * @param options 连接参数
 * @return 服务器的响应，任何状态码都会正常返回
 * @throw timeout_error 若请求超过了 options.timeout
 * @throw network_error 若无法完成请求
 */
http_response http_request(const std::string &method, const std::string &url, const std::string &body,
                           const std::map<std::string, std::string> &headers, const http_options &options);

/**
 * @brief 发送一个以 JSON 为请求体的 POST 请求
 */
http_response http_post_json(const std::string &url, const std::string &json_body, const http_options &options);

}  // namespace orbit
