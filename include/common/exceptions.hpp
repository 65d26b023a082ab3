#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace orbit {

struct orbit_exception : std::exception {
    orbit_exception();
    explicit orbit_exception(const std::string &message);

    /**
     * @brief 输出异常信息以及抛出异常时的调用栈
     */
    friend std::ostream &operator<<(std::ostream &os, const orbit_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示沙箱环境无法创建或启动
 * 比如 Docker 守护进程无法访问、fork 失败、临时文件无法写入。
 * worker 遇到该错误时将提交标记为 failed，不会重试。
 */
struct sandbox_error : public orbit_exception {
    sandbox_error();
    explicit sandbox_error(const std::string &message);
};

/**
 * @brief 表示任务存储或任务队列无法访问，通常由 Redis 产生
 */
struct store_error : public orbit_exception {
    store_error();
    explicit store_error(const std::string &message);
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 */
struct network_error : public orbit_exception {
    network_error();
    explicit network_error(const std::string &message);
};

/**
 * @brief 表示网络请求超时
 * Docker 沙箱利用该异常判断等待容器结束是否超过了时间限制
 */
struct timeout_error : public network_error {
    timeout_error();
    explicit timeout_error(const std::string &message);
};

/**
 * @brief 表示配置文件或命令行参数不合法
 */
struct configuration_error : public orbit_exception {
    configuration_error();
    explicit configuration_error(const std::string &message);
};

}  // namespace orbit
