#pragma once

#include <string>
#include "common/status.hpp"

namespace orbit {

/**
 * @brief 标志 Python 解释器崩溃的输出片段
 * 这是一个启发式规则：只要输出（包括 stderr）中出现其中任意一个片段，
 * 就认为用户程序出现了运行时错误，而不去解析解释器的退出码。
 */
extern const char *const CRASH_MARKERS[2];

/**
 * @brief 判断输出中是否包含解释器崩溃的标志
 */
bool contains_crash_marker(const std::string &output);

/**
 * @brief 根据沙箱的输出判定评测结果
 * 按优先级：
 * 1. 沙箱运行出错、超时，或输出包含崩溃标志，为 RUNTIME_ERROR；
 * 2. 否则去掉首尾空白字符后比较实际输出和期望输出，完全相同为 PASSED，否则为 FAILED。
 * 比较是纯文本的：不忽略中间的空白字符和大小写，也不做数值容差。
 * 
 * @param actual_output 按 compose_output 拼接好的沙箱输出
 * @param expected_output 期望输出
 * @param run_error 沙箱是否报告了运行错误
 * @param timed_out 用户程序是否因为超时被杀死
 */
verdict judge_output(const std::string &actual_output, const std::string &expected_output, bool run_error, bool timed_out);

}  // namespace orbit
