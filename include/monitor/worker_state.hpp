#pragma once

namespace orbit {

/**
 * @brief worker 线程的状态
 */
enum class worker_state {
    /**
     * @brief worker 线程已经启动
     */
    START,

    /**
     * @brief worker 正在处理一个提交
     */
    JUDGING,

    /**
     * @brief worker 处理完一个提交，正在等待下一个提交
     */
    IDLE,

    /**
     * @brief worker 收到停止请求后正常退出
     */
    STOPPED,

    /**
     * @brief worker 处理提交时遇到了意外的异常，处理完异常后会继续运行
     */
    CRASHED
};

}  // namespace orbit
