#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include "sandbox/sandbox.hpp"

namespace orbit {

/**
 * @brief 在本机子进程中运行用户代码的沙箱
 * 每次运行的流程：
 * 1. 在 work_dir 下创建唯一命名的运行目录，写入只读的 main.py
 * 2. 创建 stdout、stderr 管道，以及用于报告子进程初始化失败的状态管道
 * 3. fork 出子进程，子进程：
 *    1. 移入以自己为组长的新进程组，以便超时时通过 SIGKILL 杀死整个进程树
 *    2. 通过 rlimit 限制地址空间（内存）、文件大小、CPU 时间，禁止 core dump
 *    3. 需要禁止网络时，通过 unshare 进入新的网络命名空间（非特权时同时创建用户命名空间）
 *    4. 重定向标准输入输出，清空环境变量，以 -u 参数启动解释器
 * 4. 父进程通过 poll 读取输出，直到进程结束或超过时钟时间限制，超时则杀死进程组
 * 5. 无论如何结束，都会杀死并回收进程组，删除运行目录
 */
struct process_sandbox : public sandbox {
    /**
     * @param work_dir 存放临时运行目录的文件夹，不存在时自动创建
     * @param interpreter 解释器，会在 PATH 中查找，比如 python3
     */
    process_sandbox(const std::filesystem::path &work_dir, const std::string &interpreter = "python3");

    sandbox_result run(const std::string &source, const resource_limits &limits) override;

    std::size_t active_environments() const override;

private:
    std::filesystem::path work_dir;
    std::string interpreter;
    std::atomic<std::size_t> active{0};
};

}  // namespace orbit
