#pragma once

#include <string>
#include "job.hpp"
#include "monitor/worker_state.hpp"

namespace orbit {

/**
 * @brief 执行监控行为
 * 所有函数默认什么也不做，实现只需要覆盖关心的事件。
 * 这些函数会被多个 worker 线程并发调用。
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报当前某个 Worker 的状态
     * @param worker_id Worker 编号
     * @param state Worker 的新状态
     * @param information 如果 Worker 崩溃，则为错误原因，用于日志记录
     */
    virtual void worker_state_changed(int worker_id, worker_state state, const std::string &information);

    /**
     * @brief 监控上报某个 Worker 已经取到一个提交，并将其标记为 processing
     */
    virtual void start_job(int worker_id, const job &record);

    /**
     * @brief 监控上报某个提交已经进入终止状态，并写入了存储
     * @param record 最终的提交记录，状态为 completed 或 failed
     */
    virtual void end_job(int worker_id, const job &record);

    /**
     * @brief 监控上报 Worker 为一个运行时错误请求了诊断
     */
    virtual void diagnosis_requested(int worker_id, const job &record);

    /**
     * @brief 向监控报告评测系统自身的错误
     */
    virtual void report_error(const std::string &message);
};

}  // namespace orbit
