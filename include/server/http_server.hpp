#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <condition_variable>
#include <mutex>
#include <string>
#include "config.hpp"
#include "monitor/metrics.hpp"
#include "service/job_service.hpp"

namespace orbit::server {

/**
 * @brief 路由处理后得到的 HTTP 响应
 */
struct http_reply {
    unsigned status = 200;
    std::string content_type = "application/json";
    std::string body;
};

/**
 * @brief 评测系统的 HTTP 接口
 * POST /submit        {"code": ..., "expected_output": ...} -> 202 {"job_id": ..., "message": "Job queued"}
 * GET  /status/<id>   -> 200 提交记录，或 404 {"error": "Job not found"}
 * GET  /metrics       -> Prometheus 文本格式的指标
 *
 * 每个连接由一个独立的线程同步处理，每个连接只处理一个请求。
 */
struct http_server {
    http_server(job_service &service, metrics_monitor &metrics, const http_config &config);

    /**
     * @brief 处理一个请求，不涉及网络传输
     * @param method HTTP 方法
     * @param target 请求路径，可以带有查询字符串
     * @param body 请求体
     */
    http_reply handle(const std::string &method, const std::string &target, const std::string &body);

    /**
     * @brief 在当前线程接受连接，直到 stop 被调用为止
     * 返回前会等待所有正在处理的连接结束。
     */
    void run();

    /**
     * @brief 停止接受新的连接，可以在任何线程中调用
     */
    void stop();

    /**
     * @brief 实际监听的端口，配置的端口为 0 时由系统分配
     */
    unsigned short port() const;

private:
    job_service &service;
    metrics_monitor &metrics;

    boost::asio::io_context ioc;
    boost::asio::ip::tcp::acceptor acceptor;

    std::size_t connections = 0;
    std::mutex connections_mut;
    std::condition_variable connections_cond;

    void accept();

    void serve(boost::asio::ip::tcp::socket socket);

    http_reply submit(const std::string &body);

    http_reply status(const std::string &id);
};

}  // namespace orbit::server
