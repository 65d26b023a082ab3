#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include "store/job_store.hpp"

namespace orbit {

/**
 * @brief 接收提交并查询提交状态
 * 提交先以 pending 状态写入存储，再放入队列，因此 worker 取到 id 时记录一定已经存在。
 */
struct job_service {
    typedef std::function<int64_t()> timestamp_function;

    /**
     * @param timestamp 获取当前 Unix 时间戳的函数，作为提交的 created_at
     */
    job_service(store::job_store &store, store::job_queue &queue, std::chrono::seconds ttl,
                timestamp_function timestamp = unix_timestamp_now);

    /**
     * @brief 创建一个新的提交并放入队列
     * @return 新提交的 id
     * @throw store_error 若存储或队列无法访问
     */
    std::string submit(const std::string &code, const std::string &expected_output);

    /**
     * @brief 查询提交
     * @return 提交不存在或已经过期时返回空
     * @throw store_error 若存储无法访问
     */
    std::optional<job> status(const std::string &id);

private:
    store::job_store &store;
    store::job_queue &queue;
    std::chrono::seconds ttl;
    timestamp_function timestamp;

    static int64_t unix_timestamp_now();
};

}  // namespace orbit
