#include "server/http_server.hpp"
#include <sys/socket.h>
#include <sys/time.h>
#include <glog/logging.h>
#include <boost/asio/ip/address.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <thread>
#include "common/json_utils.hpp"

namespace orbit::server {
using namespace std;
using namespace nlohmann;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

// 请求体的大小上限
const uint64_t MAX_BODY_SIZE = 1 << 20;

const int READ_TIMEOUT_SECONDS = 30;

const char *const METRICS_CONTENT_TYPE = "text/plain; version=0.0.4";

static http_reply json_reply(unsigned status, const json &body) {
    http_reply reply;
    reply.status = status;
    reply.body = dump_json(body);
    return reply;
}

static http_reply error_reply(unsigned status, const string &message) {
    return json_reply(status, {{"error", message}});
}

http_server::http_server(job_service &service, metrics_monitor &metrics, const http_config &config)
    : service(service), metrics(metrics), acceptor(ioc) {
    tcp::endpoint endpoint(asio::ip::make_address(config.listen), config.port);
    acceptor.open(endpoint.protocol());
    acceptor.set_option(asio::socket_base::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen(asio::socket_base::max_listen_connections);
    LOG(INFO) << "HTTP: listening on " << config.listen << ":" << port();
}

unsigned short http_server::port() const {
    return acceptor.local_endpoint().port();
}

http_reply http_server::submit(const string &body) {
    string code, expected_output;
    try {
        json j = json::parse(body);
        if (!j.is_object()) return error_reply(400, "Invalid JSON");
        j.at("code").get_to(code);
        if (j.count("expected_output"))
            j.at("expected_output").get_to(expected_output);
    } catch (json::exception &) {
        return error_reply(400, "Invalid JSON");
    }

    try {
        string id = service.submit(code, expected_output);
        return json_reply(202, {{"job_id", id}, {"message", "Job queued"}});
    } catch (std::exception &ex) {
        LOG(ERROR) << "HTTP: unable to queue job, " << ex.what();
        return error_reply(500, "Unable to queue job");
    }
}

http_reply http_server::status(const string &id) {
    try {
        optional<job> record = service.status(id);
        if (!record) return error_reply(404, "Job not found");
        return json_reply(200, *record);
    } catch (std::exception &ex) {
        LOG(ERROR) << "HTTP: unable to read job " << id << ", " << ex.what();
        return error_reply(500, "Unable to read job");
    }
}

http_reply http_server::handle(const string &method, const string &target, const string &body) {
    string path = target.substr(0, target.find('?'));
    const string status_prefix = "/status/";

    if (path == "/submit") {
        if (method != "POST") return error_reply(405, "Method not allowed");
        return submit(body);
    } else if (path.compare(0, status_prefix.size(), status_prefix) == 0) {
        if (method != "GET") return error_reply(405, "Method not allowed");
        string id = path.substr(status_prefix.size());
        if (id.empty() || id.find('/') != string::npos) return error_reply(404, "Job not found");
        return status(id);
    } else if (path == "/metrics") {
        if (method != "GET") return error_reply(405, "Method not allowed");
        http_reply reply;
        reply.content_type = METRICS_CONTENT_TYPE;
        reply.body = metrics.render();
        return reply;
    }
    return error_reply(404, "Not found");
}

void http_server::serve(tcp::socket socket) {
    beast::error_code ec;
    beast::flat_buffer buffer;
    http::request_parser<http::string_body> parser;
    parser.body_limit(MAX_BODY_SIZE);

    // 客户端迟迟不发送请求时放弃该连接，避免停止服务器时无限等待
    struct timeval timeout = {READ_TIMEOUT_SECONDS, 0};
    setsockopt(socket.native_handle(), SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    http_reply reply;
    unsigned version = 11;
    http::read(socket, buffer, parser, ec);
    if (ec == http::error::body_limit) {
        reply = error_reply(413, "Request body too large");
    } else if (ec) {
        if (ec != http::error::end_of_stream)
            LOG(WARNING) << "HTTP: unable to read request, " << ec.message();
        return;
    } else {
        auto &request = parser.get();
        version = request.version();
        reply = handle(string(request.method_string()), string(request.target()), request.body());
        DLOG(INFO) << "HTTP: " << request.method_string() << " " << request.target() << " " << reply.status;
    }

    http::response<http::string_body> response{static_cast<http::status>(reply.status), version};
    response.set(http::field::server, "orbit-judge");
    response.set(http::field::content_type, reply.content_type);
    response.keep_alive(false);
    response.body() = move(reply.body);
    response.prepare_payload();

    http::write(socket, response, ec);
    if (ec) LOG(WARNING) << "HTTP: unable to write response, " << ec.message();
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

void http_server::accept() {
    acceptor.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec != asio::error::operation_aborted)
                LOG(WARNING) << "HTTP: unable to accept connection, " << ec.message();
        } else {
            {
                scoped_lock guard(connections_mut);
                ++connections;
            }
            thread([this, socket = move(socket)]() mutable {
                try {
                    serve(move(socket));
                } catch (std::exception &ex) {
                    LOG(ERROR) << "HTTP: connection crashed, " << ex.what();
                }
                scoped_lock guard(connections_mut);
                --connections;
                connections_cond.notify_all();
            }).detach();
        }
        if (acceptor.is_open()) accept();
    });
}

void http_server::run() {
    accept();
    ioc.run();

    beast::error_code ec;
    acceptor.close(ec);

    unique_lock<mutex> lock(connections_mut);
    connections_cond.wait(lock, [this] { return connections == 0; });
    LOG(INFO) << "HTTP: server stopped";
}

void http_server::stop() {
    ioc.stop();
}

}  // namespace orbit::server
