#pragma once

#include <string>
#include "config.hpp"

namespace orbit {

/**
 * @brief 诊断服务不可用时返回的文本的前缀
 */
extern const char *const DIAGNOSIS_UNAVAILABLE;

/**
 * @brief 对运行时错误给出自然语言分析的服务
 * 诊断只是锦上添花：任何失败都不能影响提交的评测结果。
 */
struct diagnosis_client {
    virtual ~diagnosis_client();

    /**
     * @brief 请求对一次运行时错误的分析
     * 该函数不会抛出异常，失败时返回以 DIAGNOSIS_UNAVAILABLE 开头的占位文本。
     * @param code 用户代码
     * @param error_output 沙箱的输出，包括 stderr 和超时标记
     * @return 分析文本，不会为空
     */
    virtual std::string diagnose(const std::string &code, const std::string &error_output) noexcept = 0;
};

/**
 * @brief 通过 HTTP 调用诊断服务
 * 请求为 POST {"code": ..., "error": ...}，响应为 {"analysis": ...}。
 * 连接失败、超时、非 2xx 状态码、响应不是 JSON 或者缺少 analysis 字段都会返回占位文本。
 */
struct http_diagnosis_client : public diagnosis_client {
    explicit http_diagnosis_client(const diagnosis_config &config);

    std::string diagnose(const std::string &code, const std::string &error_output) noexcept override;

private:
    diagnosis_config config;
};

}  // namespace orbit
