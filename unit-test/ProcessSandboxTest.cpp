#include <unistd.h>
#include <filesystem>
#include <thread>
#include <vector>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "judge/judger.hpp"
#include "sandbox/process_sandbox.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace std::filesystem;
using namespace orbit;

class ProcessSandboxTest : public ::testing::Test {
protected:
    path work_dir;
    resource_limits limits;

    void SetUp() override {
        if (!test::python3_available())
            GTEST_SKIP() << "python3 is not available";
        work_dir = test::make_test_directory("process_sandbox");
        // 容器等受限环境中可能无法创建网络命名空间
        limits.no_network = false;
        limits.wall_limit = chrono::milliseconds(2000);
    }
};

TEST_F(ProcessSandboxTest, HelloWorld) {
    process_sandbox sandbox(work_dir);
    sandbox_result result = sandbox.run("print('hello')", limits);
    EXPECT_EQ(result.kind, exit_kind::NORMAL);
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.output, "hello\n");
    EXPECT_TRUE(result.error.empty());
    EXPECT_EQ(judge_output(compose_output(result), "hello", false, result.timed_out()), verdict::PASSED);
    EXPECT_EQ(sandbox.active_environments(), 0u);
    EXPECT_EQ(count_files_in_directory(work_dir), 0u);
}

TEST_F(ProcessSandboxTest, DivisionByZeroCrashes) {
    process_sandbox sandbox(work_dir);
    sandbox_result result = sandbox.run("print('before')\nprint(1/0)", limits);
    EXPECT_EQ(result.kind, exit_kind::CRASHED);
    EXPECT_NE(result.exitcode, 0);
    EXPECT_EQ(result.output, "before\n");
    EXPECT_NE(result.error.find("ZeroDivisionError"), string::npos);
    EXPECT_EQ(judge_output(compose_output(result), "before", true, false), verdict::RUNTIME_ERROR);
}

TEST_F(ProcessSandboxTest, TimeLimitKillsProcessAndKeepsPartialOutput) {
    process_sandbox sandbox(work_dir);
    limits.wall_limit = chrono::milliseconds(500);
    sandbox_result result = sandbox.run("print('started')\nwhile True:\n    pass\n", limits);
    EXPECT_TRUE(result.timed_out());
    EXPECT_EQ(result.output, "started\n");
    EXPECT_LT(result.wall_time, 3.0);

    string composed = compose_output(result);
    EXPECT_EQ(composed, "started\nTime Limit Exceeded");
    EXPECT_EQ(judge_output(composed, "started", false, true), verdict::RUNTIME_ERROR);
    EXPECT_EQ(sandbox.active_environments(), 0u);
    EXPECT_EQ(count_files_in_directory(work_dir), 0u);
}

TEST_F(ProcessSandboxTest, TimeLimitKillsChildProcesses) {
    process_sandbox sandbox(work_dir);
    limits.wall_limit = chrono::milliseconds(500);
    // 子进程继承了 stdout，若没有被杀死，沙箱会一直等待管道关闭
    sandbox_result result = sandbox.run(R"(import os, time
if os.fork() == 0:
    time.sleep(60)
else:
    time.sleep(60)
)", limits);
    EXPECT_TRUE(result.timed_out());
    EXPECT_LT(result.wall_time, 3.0);
    EXPECT_EQ(sandbox.active_environments(), 0u);
}

TEST_F(ProcessSandboxTest, SourceIsReadOnly) {
    process_sandbox sandbox(work_dir);
    sandbox_result result = sandbox.run(R"(import os
try:
    open('main.py', 'w')
    print('writable')
except OSError:
    print('read-only')
)", limits);
    // root 用户可以无视文件权限
    if (geteuid() != 0)
        EXPECT_EQ(result.output, "read-only\n");
    EXPECT_EQ(result.kind, exit_kind::NORMAL);
}

TEST_F(ProcessSandboxTest, MemoryLimit) {
    process_sandbox sandbox(work_dir);
    limits.memory_limit = 100ll << 20;
    sandbox_result result = sandbox.run("x = bytearray(512 * 1024 * 1024)\nprint(len(x))", limits);
    EXPECT_EQ(result.kind, exit_kind::CRASHED);
    EXPECT_NE(result.error.find("MemoryError"), string::npos);
}

TEST_F(ProcessSandboxTest, OutputLimit) {
    process_sandbox sandbox(work_dir);
    limits.output_limit = 1024;
    sandbox_result result = sandbox.run("print('x' * 100000)", limits);
    EXPECT_EQ(result.output, string(1024, 'x'));
    EXPECT_EQ(result.kind, exit_kind::NORMAL);
}

TEST_F(ProcessSandboxTest, OutputLimitCanSplitCharacter) {
    process_sandbox sandbox(work_dir);
    limits.output_limit = 1024;
    // 每个字符占 3 个字节，1024 字节的上限落在第 342 个字符的中间
    sandbox_result result = sandbox.run("print('\\u4f60' * 1000)", limits);
    ASSERT_EQ(result.output.size(), 1024u);
    EXPECT_EQ(result.output.substr(0, 3), "\xe4\xbd\xa0");
    EXPECT_EQ(result.output.substr(1020), "\xe4\xbd\xa0\xe4");
}

TEST_F(ProcessSandboxTest, InvalidUtf8OutputIsKeptAsBytes) {
    process_sandbox sandbox(work_dir);
    sandbox_result result = sandbox.run("import sys\nsys.stdout.buffer.write(b'caf\\xe9\\n')", limits);
    EXPECT_EQ(result.kind, exit_kind::NORMAL);
    EXPECT_EQ(result.output, "caf\xe9\n");
}

TEST_F(ProcessSandboxTest, ConcurrentRunsLeaveNothingBehind) {
    process_sandbox sandbox(work_dir);
    const int N = 8;
    vector<sandbox_result> results(N);
    vector<thread> threads;
    for (int i = 0; i < N; ++i) {
        threads.emplace_back([&, i] {
            results[i] = sandbox.run("print(" + to_string(i) + ")", limits);
        });
    }
    for (auto &thd : threads) thd.join();

    for (int i = 0; i < N; ++i) {
        EXPECT_EQ(results[i].kind, exit_kind::NORMAL);
        EXPECT_EQ(results[i].output, to_string(i) + "\n");
    }
    EXPECT_EQ(sandbox.active_environments(), 0u);
    EXPECT_EQ(count_files_in_directory(work_dir), 0u);
}

TEST_F(ProcessSandboxTest, MissingInterpreterIsSandboxError) {
    process_sandbox sandbox(work_dir, "orbit-no-such-interpreter");
    EXPECT_THROW(sandbox.run("print('hello')", limits), sandbox_error);
    EXPECT_EQ(sandbox.active_environments(), 0u);
    EXPECT_EQ(count_files_in_directory(work_dir), 0u);
}

TEST_F(ProcessSandboxTest, NoNetwork) {
    process_sandbox sandbox(work_dir);
    limits.no_network = true;
    sandbox_result result;
    try {
        result = sandbox.run(R"(import socket
s = socket.socket()
s.settimeout(1)
try:
    s.connect(('1.1.1.1', 80))
    print('connected')
except OSError:
    print('offline')
)", limits);
    } catch (sandbox_error &ex) {
        GTEST_SKIP() << "network namespaces are not available: " << ex.what();
    }
    EXPECT_EQ(result.output, "offline\n");
}
