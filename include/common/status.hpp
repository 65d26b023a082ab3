#pragma once

#include <string>

namespace orbit {

/**
 * @brief 表示提交的处理状态
 * 状态只会按照 PENDING -> PROCESSING -> {COMPLETED, FAILED} 的顺序转移，
 * 永远不会回退。
 */
enum class job_status {
    /**
     * @brief 提交已经写入存储并放入队列，还没有 worker 取走
     */
    PENDING = 0,

    /**
     * @brief 某个 worker 已经取走提交，正在沙箱中运行
     */
    PROCESSING = 1,

    /**
     * @brief 用户程序已经运行完毕并得到了评测结果
     * 运行时错误也属于正常完成的评测，不是系统错误
     */
    COMPLETED = 2,

    /**
     * @brief 评测系统自身出错，比如无法创建沙箱
     * 此时 actual_output 中保存错误原因
     */
    FAILED = 3
};

/**
 * @brief 表示提交的评测结果
 */
enum class verdict {
    /**
     * @brief 还没有评测结果
     */
    UNSET = 0,

    /**
     * @brief 去除首尾空白字符后输出与期望输出完全一致
     */
    PASSED = 1,

    /**
     * @brief 输出与期望输出不一致
     */
    FAILED = 2,

    /**
     * @brief 用户程序崩溃、超时，或者沙箱无法运行
     */
    RUNTIME_ERROR = 3
};

/**
 * @brief 返回存储和接口中使用的状态字符串，比如 "pending"
 */
const char *get_display_message(job_status);

/**
 * @brief 返回存储和接口中使用的评测结果字符串，比如 "Passed"，未评测时为空串
 */
const char *get_display_message(verdict);

/**
 * @brief 从状态字符串解析出状态
 * @throw std::invalid_argument 若字符串不是合法的状态
 */
job_status parse_job_status(const std::string &text);

/**
 * @brief 从评测结果字符串解析出评测结果
 * @throw std::invalid_argument 若字符串不是合法的评测结果
 */
verdict parse_verdict(const std::string &text);

/**
 * @brief 判断状态是否为终止状态（completed 或 failed）
 */
bool is_terminal(job_status status);

}  // namespace orbit
