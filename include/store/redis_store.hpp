#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include "server/redis.hpp"
#include "store/job_store.hpp"

namespace orbit::store {

/**
 * @brief Redis 中保存提交记录的键名前缀，完整的键为 job:<id>
 */
extern const char *const JOB_KEY_PREFIX;

/**
 * @brief Redis 中保存等待评测的提交 id 的列表名
 */
extern const char *const JOB_QUEUE_KEY;

/**
 * @brief 将提交记录以 JSON 形式保存在 Redis 中，通过 SETEX 设置过期时间
 */
struct redis_job_store : public job_store {
    explicit redis_job_store(const redis_config &config);

    void set(const std::string &id, const job &record, std::chrono::seconds ttl) override;

    std::optional<job> get(const std::string &id) override;

private:
    server::redis_conn conn;
};

/**
 * @brief 基于 Redis 列表的任务队列，RPUSH 入队，BLPOP 出队
 * BLPOP 会阻塞整个连接，因此每个调用 pop 的线程使用自己的连接，
 * push 使用一个共享的连接。
 */
struct redis_job_queue : public job_queue {
    explicit redis_job_queue(const redis_config &config);

    void push(const std::string &id) override;

    std::optional<std::string> pop(std::chrono::milliseconds timeout) override;

private:
    redis_config config;
    server::redis_conn push_conn;
    std::map<std::thread::id, std::unique_ptr<server::redis_conn>> pop_conns;
    std::mutex pop_conns_mut;

    server::redis_conn &connection_of_current_thread();
};

}  // namespace orbit::store
