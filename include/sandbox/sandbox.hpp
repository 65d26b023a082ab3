#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace orbit {

/**
 * @brief 沙箱的资源限制
 */
struct resource_limits {
    /**
     * @brief 内存上限，单位为字节，默认 128MB
     */
    int64_t memory_limit = 128ll << 20;

    /**
     * @brief 时钟时间限制，超过后沙箱将被强制杀死
     */
    std::chrono::milliseconds wall_limit{5000};

    /**
     * @brief 用户程序能写入的单个文件的大小上限，单位为字节
     */
    int64_t file_limit = 16ll << 20;

    /**
     * @brief stdout 和 stderr 各自最多保留多少字节，超出部分被丢弃
     */
    std::size_t output_limit = 1 << 20;

    /**
     * @brief 为真时沙箱内不能访问网络
     */
    bool no_network = true;
};

/**
 * @brief 用户程序的结束方式
 */
enum class exit_kind {
    /**
     * @brief 用户程序正常退出，且返回值为 0
     */
    NORMAL,

    /**
     * @brief 用户程序超过时钟时间限制，被 SIGKILL 杀死
     */
    TIMED_OUT,

    /**
     * @brief 用户程序返回值非 0，或者被信号杀死
     */
    CRASHED
};

/**
 * @brief 一次沙箱运行的结果，只在一次评测中使用，不会被持久化
 */
struct sandbox_result {
    /**
     * @brief 捕获的 stdout 内容，超时时为被杀死前的部分输出
     */
    std::string output;

    /**
     * @brief 捕获的 stderr 内容
     */
    std::string error;

    exit_kind kind = exit_kind::NORMAL;

    int exitcode = -1;

    /**
     * @brief 杀死用户程序的信号，正常退出时为 -1
     */
    int signal = -1;

    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = -1;

    bool timed_out() const;
};

/**
 * @brief stderr 在拼接输出中的分隔行
 */
extern const char *const STDERR_SEPARATOR;

/**
 * @brief 超时标记，总是拼接在输出的最后
 */
extern const char *const TIME_LIMIT_MARKER;

/**
 * @brief 将沙箱结果拼接成提交的 actual_output
 * 先是 stdout；若 stderr 非空，接着是分隔行和 stderr；若超时，最后是超时标记。
 * judge_output 依赖这个拼接顺序。
 */
std::string compose_output(const sandbox_result &result);

/**
 * @brief 生成一个不会与其他并发运行冲突的文件名
 * 由纳秒时间戳、进程 id 和进程内递增计数器组成
 * @param prefix 文件名前缀，比如 "job"
 */
std::string unique_artifact_name(const std::string &prefix);

/**
 * @brief 表示一种隔离运行用户代码的方式
 * 实现必须是线程安全的：多个 worker 会同时调用 run。
 */
struct sandbox {
    virtual ~sandbox();

    /**
     * @brief 在新创建的隔离环境中运行用户代码
     * 无论正常结束、超时还是出错，返回前都会销毁隔离环境并删除临时文件。
     * 销毁失败只记录日志，不会抛出异常。
     * @param source 用户代码
     * @param limits 资源限制
     * @return 运行结果
     * @throw sandbox_error 若无法创建或启动隔离环境
     */
    virtual sandbox_result run(const std::string &source, const resource_limits &limits) = 0;

    /**
     * @brief 当前还没有被销毁的隔离环境数量
     */
    virtual std::size_t active_environments() const = 0;
};

}  // namespace orbit
