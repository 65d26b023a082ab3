#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "job.hpp"

namespace orbit::store {

/**
 * @brief 提交记录的存储
 * 实现必须是线程安全的，每个操作都是一次原子的写入或读取。
 */
struct job_store {
    virtual ~job_store();

    /**
     * @brief 写入提交记录，覆盖同 id 的旧记录
     * @param id 提交 id
     * @param record 完整的提交记录
     * @param ttl 记录从本次写入开始的保留时间，过期后 get 将找不到该记录
     * @throw store_error 若存储无法访问
     */
    virtual void set(const std::string &id, const job &record, std::chrono::seconds ttl) = 0;

    /**
     * @brief 读取提交记录
     * @return 记录不存在或已经过期时返回空
     * @throw store_error 若存储无法访问，或者记录无法解析
     */
    virtual std::optional<job> get(const std::string &id) = 0;
};

/**
 * @brief 等待评测的提交 id 队列，先进先出
 * 一个 id 只会被一个 pop 的调用者取走。
 */
struct job_queue {
    virtual ~job_queue();

    /**
     * @brief 将提交 id 放入队尾
     * @throw store_error 若队列无法访问
     */
    virtual void push(const std::string &id) = 0;

    /**
     * @brief 从队头取出一个提交 id，队列为空时阻塞等待
     * @param timeout 最长等待时间，worker 在两次等待之间检查是否需要停止
     * @return 超时时返回空
     * @throw store_error 若队列无法访问
     */
    virtual std::optional<std::string> pop(std::chrono::milliseconds timeout) = 0;
};

}  // namespace orbit::store
