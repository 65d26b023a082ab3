#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "diagnosis/diagnosis_client.hpp"
#include "monitor/monitor.hpp"
#include "sandbox/sandbox.hpp"
#include "store/job_store.hpp"

/**
 * 评测 worker 相关
 * 每个 worker 是一个长期运行的线程，不断从任务队列中取出提交 id，
 * 从存储中读出提交，在沙箱中运行选手代码，判定结果，必要时请求诊断，
 * 最后把终止状态的提交写回存储。
 *
 * 一个提交 id 只会被一个 worker 取到，因此同一个提交不会被并发修改。
 * worker 只在等待队列时检查停止标记，所以正在处理的提交总会处理完成。
 */
namespace orbit {

struct worker_options {
    /**
     * @brief 每次运行选手代码的资源限制
     */
    resource_limits limits;

    /**
     * @brief 每次写入提交记录时设置的保留时间
     */
    std::chrono::seconds job_ttl{3600};

    /**
     * @brief 每次等待队列的最长时间，也是响应停止请求的最长延迟
     */
    std::chrono::milliseconds poll_interval{1000};
};

struct worker_pool {
    /**
     * @param store 提交记录的存储
     * @param queue 等待评测的提交 id 队列
     * @param runner 运行选手代码的沙箱
     * @param diagnosis 运行时错误的诊断服务
     * 这些对象由调用者持有，必须比 worker_pool 活得更久
     */
    worker_pool(store::job_store &store, store::job_queue &queue, sandbox &runner,
                diagnosis_client &diagnosis, const worker_options &options);

    /**
     * @brief 停止并等待所有 worker 退出
     */
    ~worker_pool();

    worker_pool(const worker_pool &) = delete;
    worker_pool &operator=(const worker_pool &) = delete;

    /**
     * @brief 注册监控器
     * 必须在 start 之前调用
     */
    void register_monitor(std::shared_ptr<monitor> monitor);

    /**
     * @brief 启动 worker 线程，只能调用一次
     * @param workers worker 线程数
     */
    void start(std::size_t workers);

    /**
     * @brief 请求停止所有的 worker
     * 调用该函数后，worker 不再从队列中取新的提交，正在处理的提交会处理完成后退出。
     * 该函数不会阻塞。
     */
    void stop();

    /**
     * @brief 等待所有 worker 线程退出
     */
    void join();

    bool stopping() const;

    /**
     * @brief 处理一个提交
     * 存储中找不到提交（比如已经过期）或者提交不处于 pending 状态时，跳过该提交。
     * 沙箱无法运行时，提交被标记为 failed，错误原因保存在 actual_output 中。
     * @param worker_id 处理该提交的 worker 编号，用于日志和监控
     * @param id 提交 id
     * @return 提交是否被处理并进入了终止状态
     * @throw store_error 若存储无法访问
     */
    bool process(int worker_id, const std::string &id);

private:
    store::job_store &store;
    store::job_queue &queue;
    sandbox &runner;
    diagnosis_client &diagnosis;
    worker_options options;

    std::vector<std::shared_ptr<monitor>> monitors;
    std::vector<std::thread> threads;

    std::atomic<bool> stop_requested{false};
    std::mutex stop_mut;
    std::condition_variable stop_cond;

    void worker_loop(int worker_id);

    void call_monitor(int worker_id, const std::function<void(monitor &)> &callback);

    /**
     * @brief 等待一段时间，收到停止请求时提前返回
     */
    void wait_for_stop(std::chrono::milliseconds duration);
};

}  // namespace orbit
