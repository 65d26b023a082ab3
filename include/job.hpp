#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include "common/status.hpp"

namespace orbit {

/**
 * @brief 表示一个提交以及它的评测结果
 * 提交由 job_service 创建，之后只会被取到该提交 id 的唯一一个 worker 修改。
 */
struct job {
    /**
     * @brief 提交的唯一 id，由提交时刻的纳秒时间戳生成
     */
    std::string id;

    /**
     * @brief 选手代码，创建后不可修改
     */
    std::string code;

    /**
     * @brief 期望输出，创建后不可修改
     */
    std::string expected_output;

    /**
     * @brief 沙箱捕获的输出，或者 failed 时的错误原因
     * 只在转移到终止状态时写入一次
     */
    std::string actual_output;

    verdict result = verdict::UNSET;

    /**
     * @brief 诊断服务对运行时错误给出的分析
     * 只有 result 为 RUNTIME_ERROR 时才可能非空
     */
    std::string ai_diagnosis;

    job_status status = job_status::PENDING;

    /**
     * @brief 创建时间，Unix 时间戳（秒）
     */
    int64_t created_at = 0;
};

void to_json(nlohmann::json &j, const job &job);

void from_json(const nlohmann::json &j, job &job);

/**
 * @brief 生成一个新的提交 id
 * id 为十进制的纳秒时间戳，同一进程内保证严格递增，因此不会重复
 */
std::string generate_job_id();

}  // namespace orbit
