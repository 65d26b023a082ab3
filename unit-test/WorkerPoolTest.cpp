#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "common/json_utils.hpp"
#include "monitor/metrics.hpp"
#include "service/job_service.hpp"
#include "store/memory_store.hpp"
#include "test/scripted_sandbox.hpp"
#include "worker.hpp"

using namespace std;
using namespace orbit;
using namespace orbit::store;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

/**
 * 记录每次写入存储的提交，用于检查状态的转移顺序
 * 与 Redis 存储一样，写入的提交先序列化为 JSON 再解析回来
 */
struct recording_store : public memory_job_store {
    void set(const string &id, const job &record, chrono::seconds ttl) override {
        {
            scoped_lock guard(history_mut);
            history[id].push_back(record);
        }
        memory_job_store::set(id, nlohmann::json::parse(dump_json(record)).get<job>(), ttl);
    }

    vector<job> writes_of(const string &id) {
        scoped_lock guard(history_mut);
        return history[id];
    }

private:
    map<string, vector<job>> history;
    mutex history_mut;
};

class WorkerPoolTest : public ::testing::Test {
protected:
    recording_store store;
    memory_job_queue queue;
    test::scripted_sandbox sandbox;
    NiceMock<test::mock_diagnosis_client> diagnosis;
    shared_ptr<metrics_monitor> metrics = make_shared<metrics_monitor>();
    worker_options options;

    void SetUp() override {
        options.poll_interval = chrono::milliseconds(20);
        ON_CALL(diagnosis, diagnose(_, _)).WillByDefault(Return("Check your code."));
    }

    string submit(const string &code, const string &expected) {
        job_service service(store, queue, options.job_ttl);
        return service.submit(code, expected);
    }

    /**
     * @brief 不启动线程，直接处理队列中的下一个提交
     */
    bool process_next(worker_pool &pool) {
        auto id = queue.pop(chrono::milliseconds(0));
        EXPECT_TRUE(id);
        return id && pool.process(1, *id);
    }
};

TEST_F(WorkerPoolTest, PassedJob) {
    sandbox.will_return(test::make_result("hello\n"));
    worker_pool pool(store, queue, sandbox, diagnosis, options);
    pool.register_monitor(metrics);
    EXPECT_CALL(diagnosis, diagnose(_, _)).Times(0);

    string id = submit("print('hello')", "hello");
    EXPECT_TRUE(process_next(pool));

    auto record = store.get(id);
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, job_status::COMPLETED);
    EXPECT_EQ(record->result, verdict::PASSED);
    EXPECT_EQ(record->actual_output, "hello\n");
    EXPECT_TRUE(record->ai_diagnosis.empty());
    EXPECT_EQ(metrics->jobs_processed(), 1u);
    EXPECT_EQ(sandbox.sources(), vector<string>{"print('hello')"});
}

TEST_F(WorkerPoolTest, StatusMovesForwardOnly) {
    sandbox.will_return(test::make_result("6\n"));
    worker_pool pool(store, queue, sandbox, diagnosis, options);

    string id = submit("print(6)", "5");
    EXPECT_TRUE(process_next(pool));

    auto writes = store.writes_of(id);
    ASSERT_EQ(writes.size(), 3u);
    EXPECT_EQ(writes[0].status, job_status::PENDING);
    EXPECT_EQ(writes[1].status, job_status::PROCESSING);
    EXPECT_EQ(writes[2].status, job_status::COMPLETED);
    // 评测结果和输出只在写入终止状态时出现
    EXPECT_EQ(writes[1].result, verdict::UNSET);
    EXPECT_TRUE(writes[1].actual_output.empty());
    EXPECT_EQ(writes[2].result, verdict::FAILED);
    EXPECT_EQ(writes[2].actual_output, "6\n");
}

TEST_F(WorkerPoolTest, RuntimeErrorIsDiagnosed) {
    sandbox.will_return(test::make_result("", "Traceback (most recent call last):\nZeroDivisionError: division by zero\n",
                                          exit_kind::CRASHED, 1));
    worker_pool pool(store, queue, sandbox, diagnosis, options);
    pool.register_monitor(metrics);
    EXPECT_CALL(diagnosis, diagnose("print(1/0)", HasSubstr("ZeroDivisionError")))
        .WillOnce(Return("Division by zero on line 1."));

    string id = submit("print(1/0)", "");
    EXPECT_TRUE(process_next(pool));

    auto record = store.get(id);
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, job_status::COMPLETED);
    EXPECT_EQ(record->result, verdict::RUNTIME_ERROR);
    EXPECT_EQ(record->ai_diagnosis, "Division by zero on line 1.");
    EXPECT_EQ(metrics->diagnoses_requested(), 1u);
}

TEST_F(WorkerPoolTest, TimeoutIsRuntimeErrorWithMarker) {
    sandbox.will_return(test::make_result("partial\n", "", exit_kind::TIMED_OUT));
    worker_pool pool(store, queue, sandbox, diagnosis, options);

    string id = submit("while True: pass", "partial");
    EXPECT_TRUE(process_next(pool));

    auto record = store.get(id);
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, job_status::COMPLETED);
    EXPECT_EQ(record->result, verdict::RUNTIME_ERROR);
    EXPECT_EQ(record->actual_output, "partial\nTime Limit Exceeded");
    EXPECT_FALSE(record->ai_diagnosis.empty());
}

TEST_F(WorkerPoolTest, SandboxErrorMarksJobFailed) {
    sandbox.will_fail("docker daemon is not reachable");
    worker_pool pool(store, queue, sandbox, diagnosis, options);
    pool.register_monitor(metrics);
    EXPECT_CALL(diagnosis, diagnose(_, _)).Times(0);

    string id = submit("print(1)", "1");
    EXPECT_TRUE(process_next(pool));

    auto record = store.get(id);
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, job_status::FAILED);
    EXPECT_EQ(record->result, verdict::RUNTIME_ERROR);
    EXPECT_THAT(record->actual_output, HasSubstr("docker daemon is not reachable"));
    EXPECT_EQ(metrics->jobs_processed(), 1u);
    EXPECT_EQ(metrics->errors_reported(), 1u);
}

TEST_F(WorkerPoolTest, MissingRecordIsSkipped) {
    worker_pool pool(store, queue, sandbox, diagnosis, options);
    pool.register_monitor(metrics);

    queue.push("404");
    EXPECT_FALSE(process_next(pool));
    EXPECT_TRUE(sandbox.sources().empty());
    EXPECT_FALSE(store.get("404"));
    EXPECT_EQ(metrics->jobs_processed(), 0u);
}

TEST_F(WorkerPoolTest, TerminalRecordIsNotProcessedAgain) {
    sandbox.will_return(test::make_result("1\n"));
    worker_pool pool(store, queue, sandbox, diagnosis, options);

    string id = submit("print(1)", "1");
    queue.push(id);
    EXPECT_TRUE(process_next(pool));
    EXPECT_FALSE(process_next(pool));
    EXPECT_EQ(sandbox.sources().size(), 1u);
    EXPECT_EQ(store.get(id)->status, job_status::COMPLETED);
}

TEST_F(WorkerPoolTest, WorkersDrainQueueAndStop) {
    const int N = 20;
    for (int i = 0; i < N; ++i)
        sandbox.will_return(test::make_result("ok\n"));

    worker_pool pool(store, queue, sandbox, diagnosis, options);
    pool.register_monitor(metrics);
    vector<string> ids;
    for (int i = 0; i < N; ++i)
        ids.push_back(submit("print('ok')", "ok"));

    pool.start(4);
    auto deadline = chrono::steady_clock::now() + chrono::seconds(10);
    while (metrics->jobs_processed() < (uint64_t)N && chrono::steady_clock::now() < deadline)
        this_thread::sleep_for(chrono::milliseconds(10));
    pool.stop();
    pool.join();

    EXPECT_EQ(metrics->jobs_processed(), (uint64_t)N);
    EXPECT_EQ(metrics->active_workers(), 0);
    for (auto &id : ids) {
        auto record = store.get(id);
        ASSERT_TRUE(record);
        EXPECT_EQ(record->status, job_status::COMPLETED);
        EXPECT_EQ(record->result, verdict::PASSED);
    }
}

TEST_F(WorkerPoolTest, StopWithEmptyQueue) {
    worker_pool pool(store, queue, sandbox, diagnosis, options);
    pool.start(3);
    auto start = chrono::steady_clock::now();
    pool.stop();
    pool.join();
    EXPECT_TRUE(pool.stopping());
    EXPECT_LT(chrono::steady_clock::now() - start, chrono::seconds(2));
}

TEST_F(WorkerPoolTest, InvalidUtf8OutputCompletes) {
    // 输出中的 \xe9 后面没有续字节，\xe4\xbd 是被输出上限截断的 "你"
    sandbox.will_return(test::make_result("caf\xe9\n\xe4\xbd"));
    worker_pool pool(store, queue, sandbox, diagnosis, options);
    pool.register_monitor(metrics);

    string id = submit("import sys; sys.stdout.buffer.write(b'caf\\xe9\\n')", "cafe");
    EXPECT_TRUE(process_next(pool));

    auto record = store.get(id);
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, job_status::COMPLETED);
    EXPECT_EQ(record->result, verdict::FAILED);
    EXPECT_EQ(record->actual_output.rfind("caf", 0), 0u);
    EXPECT_NE(record->actual_output.find("\xef\xbf\xbd"), string::npos);
    EXPECT_EQ(metrics->jobs_processed(), 1u);
}
