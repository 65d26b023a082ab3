#include "sandbox/process_sandbox.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace orbit {
using namespace std;
namespace fs = std::filesystem;

const int PIPE_OUT = 0;
const int PIPE_IN = 1;

const int BUF_SIZE = 4096;

// 超时杀死进程组后，最多再等待这么久来读完管道中剩余的输出
const chrono::milliseconds kill_drain_time(500);

// 没有输出时检查子进程是否结束的间隔
const int poll_interval_ms = 20;

enum setup_stage {
    STAGE_PROCESS_GROUP = 1,
    STAGE_RLIMIT,
    STAGE_UNSHARE,
    STAGE_REDIRECT,
    STAGE_CHDIR,
    STAGE_EXEC
};

/**
 * @brief 子进程在 exec 之前失败时，通过状态管道发送给父进程的信息
 */
struct setup_failure {
    int err;
    int stage;
};

static const char *stage_name(int stage) {
    switch (stage) {
        case STAGE_PROCESS_GROUP: return "setpgid";
        case STAGE_RLIMIT: return "setrlimit";
        case STAGE_UNSHARE: return "unshare network namespace";
        case STAGE_REDIRECT: return "redirect standard streams";
        case STAGE_CHDIR: return "chdir";
        case STAGE_EXEC: return "exec interpreter";
        default: return "unknown stage";
    }
}

[[noreturn]] static void report_setup_failure(int status_fd, int stage) {
    setup_failure failure = {errno, stage};
    ssize_t wrote = write(status_fd, &failure, sizeof(failure));
    (void)wrote;
    _exit(127);
}

static bool set_rlimit(int resource, int64_t value) {
    struct rlimit lim;
    lim.rlim_cur = lim.rlim_max = value > 0 ? (rlim_t)value : RLIM_INFINITY;
    return setrlimit(resource, &lim) == 0;
}

/**
 * @brief 子进程在 fork 之后、exec 之前执行的部分
 * 这里只能调用异步信号安全的系统调用，参数必须在 fork 之前准备好
 */
[[noreturn]] static void exec_child(const char *rundir, char *const argv[], char *const envp[],
                                    int out_fd, int err_fd, int status_fd, const resource_limits &limits) {
    // 移入新的进程组，以便通过 kill(-pid) 杀死用户程序 fork 出来的所有进程
    if (setpgid(0, 0) != 0)
        report_setup_failure(status_fd, STAGE_PROCESS_GROUP);

    int64_t cpu_seconds = (limits.wall_limit.count() + 999) / 1000 + 1;
    if (!set_rlimit(RLIMIT_AS, limits.memory_limit) ||
        !set_rlimit(RLIMIT_FSIZE, limits.file_limit) ||
        !set_rlimit(RLIMIT_CPU, cpu_seconds) ||
        !set_rlimit(RLIMIT_CORE, 0))
        report_setup_failure(status_fd, STAGE_RLIMIT);

    if (limits.no_network) {
        // 新的网络命名空间中只有一个未启用的 lo 设备，因此无法访问网络。
        // 非特权进程需要同时创建用户命名空间才能创建网络命名空间。
        if (unshare(CLONE_NEWNET) != 0 && unshare(CLONE_NEWUSER | CLONE_NEWNET) != 0)
            report_setup_failure(status_fd, STAGE_UNSHARE);
    }

    int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd < 0 ||
        dup2(null_fd, STDIN_FILENO) < 0 ||
        dup2(out_fd, STDOUT_FILENO) < 0 ||
        dup2(err_fd, STDERR_FILENO) < 0)
        report_setup_failure(status_fd, STAGE_REDIRECT);

    if (chdir(rundir) != 0)
        report_setup_failure(status_fd, STAGE_CHDIR);

    execvpe(argv[0], argv, envp);
    report_setup_failure(status_fd, STAGE_EXEC);
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static void append_limited(string &target, const char *data, size_t size, size_t limit) {
    if (target.size() >= limit) return;
    target.append(data, min(size, limit - target.size()));
}

process_sandbox::process_sandbox(const fs::path &work_dir, const string &interpreter)
    : work_dir(work_dir), interpreter(interpreter) {}

size_t process_sandbox::active_environments() const {
    return active.load();
}

sandbox_result process_sandbox::run(const string &source, const resource_limits &limits) {
    fs::path rundir = work_dir / unique_artifact_name("job");
    {
        error_code ec;
        fs::create_directories(rundir, ec);
        if (ec) throw sandbox_error(fmt::format("unable to create run directory {}: {}", rundir.string(), ec.message()));
    }
    defer {
        error_code ec;
        fs::remove_all(rundir, ec);
        if (ec) LOG(WARNING) << "Sandbox: unable to remove run directory " << rundir << ": " << ec.message();
    };

    fs::path artifact = rundir / "main.py";
    try {
        write_file_content(artifact, source, fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read);
    } catch (std::exception &ex) {
        throw sandbox_error(fmt::format("unable to write source file: {}", ex.what()));
    }

    int out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, status_pipe[2] = {-1, -1};
    defer {
        for (int *p : {out_pipe, err_pipe, status_pipe}) {
            close_fd(p[PIPE_OUT]);
            close_fd(p[PIPE_IN]);
        }
    };
    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 || pipe2(status_pipe, O_CLOEXEC) != 0)
        throw sandbox_error(fmt::format("unable to create pipes: {}", strerror(errno)));

    // fork 之后子进程不能分配内存，所以参数和环境变量都要提前准备好
    string rundir_string = rundir.string();
    vector<string> args = {interpreter, "-u", artifact.filename().string()};
    vector<string> envs = {
        "PATH=" + get_env("PATH", "/usr/local/bin:/usr/bin:/bin"),
        "HOME=" + rundir_string,
        "LANG=C.UTF-8",
        "PYTHONUNBUFFERED=1",
        "PYTHONDONTWRITEBYTECODE=1"};
    vector<char *> argv, envp;
    for (auto &arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);
    for (auto &env : envs) envp.push_back(env.data());
    envp.push_back(nullptr);

    elapsed_time timer;
    pid_t pid = fork();
    if (pid < 0)
        throw sandbox_error(fmt::format("unable to fork sandboxed process: {}", strerror(errno)));
    if (pid == 0)
        exec_child(rundir_string.c_str(), argv.data(), envp.data(),
                   out_pipe[PIPE_IN], err_pipe[PIPE_IN], status_pipe[PIPE_IN], limits);

    // 与子进程中的 setpgid 竞争，保证之后的 kill(-pid) 一定能找到进程组
    setpgid(pid, pid);
    ++active;

    bool reaped = false;
    int wait_status = 0;
    defer {
        if (!reaped) {
            if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
                LOG(WARNING) << "Sandbox: unable to kill process group " << pid << ": " << strerror(errno);
            if (waitpid(pid, &wait_status, 0) < 0)
                LOG(WARNING) << "Sandbox: unable to reap process " << pid << ": " << strerror(errno);
        }
        --active;
    };

    close_fd(out_pipe[PIPE_IN]);
    close_fd(err_pipe[PIPE_IN]);
    close_fd(status_pipe[PIPE_IN]);

    {
        // exec 成功时状态管道因为 O_CLOEXEC 被关闭，read 返回 0
        setup_failure failure;
        ssize_t nread;
        do {
            nread = read(status_pipe[PIPE_OUT], &failure, sizeof(failure));
        } while (nread < 0 && errno == EINTR);
        if (nread == (ssize_t)sizeof(failure)) {
            waitpid(pid, &wait_status, 0);
            reaped = true;
            throw sandbox_error(fmt::format("unable to start sandboxed process, {} failed: {}",
                                            stage_name(failure.stage), strerror(failure.err)));
        }
    }

    sandbox_result result;
    char buf[BUF_SIZE];
    auto deadline = chrono::steady_clock::now() + limits.wall_limit;
    chrono::steady_clock::time_point drain_deadline;
    bool exited = false, timed_out = false, group_killed = false;

    auto kill_group = [&](chrono::steady_clock::time_point now) {
        if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
            LOG(WARNING) << "Sandbox: unable to kill process group " << pid << ": " << strerror(errno);
        group_killed = true;
        drain_deadline = now + kill_drain_time;
    };

    while (true) {
        if (!exited) {
            // WNOWAIT 使进程保持僵尸状态，保证进程组 id 在我们杀死整个进程组前不会被复用
            siginfo_t info;
            memset(&info, 0, sizeof(info));
            if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) == 0 && info.si_pid == pid)
                exited = true;
        }

        bool pipes_open = out_pipe[PIPE_OUT] >= 0 || err_pipe[PIPE_OUT] >= 0;
        if (exited && !pipes_open) break;

        auto now = chrono::steady_clock::now();
        if (!group_killed) {
            if (exited) {
                // 主进程已经退出，但管道仍被用户程序 fork 出的后台进程持有
                kill_group(now);
            } else if (now >= deadline) {
                LOG(WARNING) << "Sandbox: time limit exceeded (" << limits.wall_limit.count() << "ms), killing process group " << pid;
                timed_out = true;
                kill_group(now);
            }
        }
        if (group_killed && now >= drain_deadline) {
            LOG(WARNING) << "Sandbox: output pipes of process group " << pid << " are still open after kill";
            break;
        }

        auto until = group_killed ? drain_deadline : deadline;
        int timeout_ms = (int)clamp<int64_t>(chrono::duration_cast<chrono::milliseconds>(until - now).count(), 1, poll_interval_ms);

        struct pollfd fds[2];
        string *targets[2];
        int *owners[2];
        nfds_t nfds = 0;
        if (out_pipe[PIPE_OUT] >= 0) {
            fds[nfds] = {out_pipe[PIPE_OUT], POLLIN, 0};
            targets[nfds] = &result.output;
            owners[nfds++] = &out_pipe[PIPE_OUT];
        }
        if (err_pipe[PIPE_OUT] >= 0) {
            fds[nfds] = {err_pipe[PIPE_OUT], POLLIN, 0};
            targets[nfds] = &result.error;
            owners[nfds++] = &err_pipe[PIPE_OUT];
        }

        int ready = poll(fds, nfds, timeout_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw sandbox_error(fmt::format("unable to poll sandbox output: {}", strerror(errno)));
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t nread = read(fds[i].fd, buf, BUF_SIZE);
            if (nread > 0) {
                append_limited(*targets[i], buf, (size_t)nread, limits.output_limit);
            } else if (nread == 0 || (errno != EINTR && errno != EAGAIN)) {
                // EOF 或读取出错，不再监听这个管道
                close_fd(*owners[i]);
            }
        }
    }

    // 杀死进程组中可能残留的进程，然后回收子进程
    if (!group_killed) kill_group(chrono::steady_clock::now());
    if (waitpid(pid, &wait_status, 0) < 0)
        LOG(WARNING) << "Sandbox: unable to reap process " << pid << ": " << strerror(errno);
    reaped = true;

    result.wall_time = timer.duration<chrono::microseconds>().count() / 1e6;
    if (WIFEXITED(wait_status))
        result.exitcode = WEXITSTATUS(wait_status);
    else if (WIFSIGNALED(wait_status))
        result.signal = WTERMSIG(wait_status);

    if (timed_out)
        result.kind = exit_kind::TIMED_OUT;
    else if (result.exitcode != 0)
        result.kind = exit_kind::CRASHED;
    else
        result.kind = exit_kind::NORMAL;

    DLOG(INFO) << fmt::format("Sandbox: process {} finished, exitcode {}, signal {}, wall time {:.3f}s",
                              pid, result.exitcode, result.signal, result.wall_time);
    return result;
}

}  // namespace orbit
