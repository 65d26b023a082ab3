#include "server/redis.hpp"
#include <glog/logging.h>
#include <thread>
#include "common/exceptions.hpp"

namespace orbit::server {
using namespace std;

const int MAX_ATTEMPTS = 5;

static bool connect_to_server(cpp_redis::client &client, const redis_config &config) {
    LOG(INFO) << "Redis: Setup connection with server " << config.host << ":" << config.port;
    try {
        client.connect(config.host, config.port,
                       [](const string &host, size_t port, cpp_redis::connect_state status) {
                           if (status == cpp_redis::connect_state::dropped)
                               LOG(INFO) << "Redis: client disconnected from " << host << ":" << port;
                       });
    } catch (cpp_redis::redis_error &ex) {
        LOG(ERROR) << "Redis: Unable to connect to redis server " << config.host << ":" << config.port << ": " << ex.what();
        return false;
    }
    if (!config.password.empty()) {
        LOG(INFO) << "Redis: Trying to Auth";
        auto future = client.auth(config.password);
        client.sync_commit();
        cpp_redis::reply reply = future.get();
        if (reply.is_error()) {
            LOG(ERROR) << "Redis: Auth failed: " << reply.error();
            return false;
        }
    }
    if (client.is_connected()) {
        LOG(INFO) << "Redis: Connecting to redis server succeeded " << config.host << ":" << config.port;
        return true;
    } else {
        LOG(ERROR) << "Redis: Unable to connect to redis server " << config.host << ":" << config.port;
        return false;
    }
}

redis_conn::redis_conn(const redis_config &config) : config(config) {}

void redis_conn::reconnect(bool force) {
    int fail = 0;
    if (force) {
        if (client.is_connected()) client.disconnect(true);
        if (connect_to_server(client, config)) return;
        ++fail;
    }
    for (; !client.is_connected() && fail < MAX_ATTEMPTS; ++fail) {
        if (fail > 0) {
            LOG(INFO) << "Redis: Lost connection, trying to reconnect";
            this_thread::sleep_for(chrono::milliseconds(config.retry_interval));
        }
        connect_to_server(client, config);
    }
    if (!client.is_connected()) {
        throw store_error("unable to connect to redis server " + config.host + ":" + to_string(config.port));
    }
}

vector<cpp_redis::reply> redis_conn::execute(function<void(cpp_redis::client &, vector<future<cpp_redis::reply>> &)> callback) {
    lock_guard<mutex> guard(mut);

    // cpp_redis 的 is_connected 似乎有问题，最后执行操作时的 reply 仍然是 network error
    // 因此操作失败时也做个强制重连。
    reconnect(false);
    string message;
    for (int fail = 0; fail < MAX_ATTEMPTS; ++fail) {
        bool reconn = false;
        vector<future<cpp_redis::reply>> futures;
        vector<cpp_redis::reply> replies;
        try {
            callback(client, futures);
            client.sync_commit();
            for (auto &future : futures) {  // 阻塞到所有操作完成为止
                cpp_redis::reply reply = future.get();
                // 如果有操作失败，则标记重试并保存错误信息
                if (reply.is_error()) reconn = true, message = reply.error();
                replies.push_back(move(reply));
            }
        } catch (cpp_redis::redis_error &ex) {
            reconn = true, message = ex.what();
        }
        if (!reconn) return replies;
        LOG(WARNING) << "Redis: operation failed (" << message << "), reconnecting";
        reconnect(true);
    }
    // 失败次数过多，取消操作
    throw store_error("Redis: unable to finish execution: " + message);
}

}  // namespace orbit::server
