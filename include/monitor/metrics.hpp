#pragma once

#include <atomic>
#include <cstdint>
#include "monitor/monitor.hpp"

namespace orbit {

/**
 * @brief 在进程内累计评测指标，并以 Prometheus 文本格式导出
 * orbit_jobs_processed_total: 进入终止状态的提交数，不包括存储中找不到而被跳过的提交
 * orbit_ai_diagnosis_total: 请求诊断的次数
 * orbit_active_workers: 正在处理提交的 worker 数
 */
struct metrics_monitor : public monitor {
    void worker_state_changed(int worker_id, worker_state state, const std::string &information) override;

    void end_job(int worker_id, const job &record) override;

    void diagnosis_requested(int worker_id, const job &record) override;

    void report_error(const std::string &message) override;

    uint64_t jobs_processed() const;

    uint64_t diagnoses_requested() const;

    int64_t active_workers() const;

    uint64_t errors_reported() const;

    /**
     * @brief 以 Prometheus 文本格式（text/plain; version=0.0.4）输出所有指标
     */
    std::string render() const;

private:
    std::atomic<uint64_t> processed{0};
    std::atomic<uint64_t> diagnoses{0};
    std::atomic<int64_t> active{0};
    std::atomic<uint64_t> errors{0};
};

}  // namespace orbit
