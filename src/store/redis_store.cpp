#include "store/redis_store.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace orbit::store {
using namespace std;
using namespace nlohmann;

const char *const JOB_KEY_PREFIX = "job:";
const char *const JOB_QUEUE_KEY = "job_queue";

static string job_key(const string &id) {
    return JOB_KEY_PREFIX + id;
}

redis_job_store::redis_job_store(const redis_config &config) : conn(config) {}

void redis_job_store::set(const string &id, const job &record, chrono::seconds ttl) {
    string payload = dump_json(record);
    conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(client.setex(job_key(id), (int)ttl.count(), payload));
    });
}

optional<job> redis_job_store::get(const string &id) {
    auto replies = conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(client.get(job_key(id)));
    });

    cpp_redis::reply &reply = replies.at(0);
    if (reply.is_null()) return nullopt;
    if (!reply.is_string())
        throw store_error(fmt::format("unexpected redis reply type for {}", job_key(id)));

    try {
        return json::parse(reply.as_string()).get<job>();
    } catch (std::exception &ex) {
        throw store_error(fmt::format("malformed record {}: {}", job_key(id), ex.what()));
    }
}

redis_job_queue::redis_job_queue(const redis_config &config) : config(config), push_conn(config) {}

void redis_job_queue::push(const string &id) {
    push_conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(client.rpush(JOB_QUEUE_KEY, {id}));
    });
}

server::redis_conn &redis_job_queue::connection_of_current_thread() {
    scoped_lock guard(pop_conns_mut);
    auto &conn = pop_conns[this_thread::get_id()];
    if (!conn) {
        DLOG(INFO) << "Redis: creating blocking connection for thread " << this_thread::get_id();
        conn = make_unique<server::redis_conn>(config);
    }
    return *conn;
}

optional<string> redis_job_queue::pop(chrono::milliseconds timeout) {
    // BLPOP 的超时单位为秒，且 0 表示永久阻塞
    int seconds = max<int>(1, (int)((timeout.count() + 999) / 1000));
    auto replies = connection_of_current_thread().execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(client.blpop({JOB_QUEUE_KEY}, seconds));
    });

    cpp_redis::reply &reply = replies.at(0);
    if (reply.is_null()) return nullopt;
    // BLPOP 返回 [列表名, 元素]
    if (!reply.is_array() || reply.as_array().size() != 2 || !reply.as_array()[1].is_string())
        throw store_error("unexpected redis reply of BLPOP");
    return reply.as_array()[1].as_string();
}

}  // namespace orbit::store
