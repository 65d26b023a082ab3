#pragma once

#include <functional>
#include <map>
#include <mutex>
#include "common/concurrent_queue.hpp"
#include "store/job_store.hpp"

namespace orbit::store {

/**
 * @brief 保存在进程内存中的提交记录存储
 * 过期的记录在下一次被读取时删除。
 */
struct memory_job_store : public job_store {
    typedef std::function<std::chrono::steady_clock::time_point()> clock_function;

    /**
     * @param clock 获取当前时间的函数，测试时可以替换成可控的时钟
     */
    explicit memory_job_store(clock_function clock = std::chrono::steady_clock::now);

    void set(const std::string &id, const job &record, std::chrono::seconds ttl) override;

    std::optional<job> get(const std::string &id) override;

    /**
     * @brief 还没有被清理的记录数，包括已经过期但还没被读取的记录
     */
    std::size_t size();

private:
    struct entry {
        job record;
        std::chrono::steady_clock::time_point expires_at;
    };

    clock_function clock;
    std::map<std::string, entry> records;
    std::mutex mut;
};

struct memory_job_queue : public job_queue {
    void push(const std::string &id) override;

    std::optional<std::string> pop(std::chrono::milliseconds timeout) override;

    std::size_t size();

private:
    concurrent_queue<std::string> ids;
};

}  // namespace orbit::store
