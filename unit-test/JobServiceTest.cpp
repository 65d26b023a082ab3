#include <nlohmann/json.hpp>
#include <set>
#include "gtest/gtest.h"
#include "monitor/metrics.hpp"
#include "server/http_server.hpp"
#include "service/job_service.hpp"
#include "store/memory_store.hpp"
#include "test/scripted_sandbox.hpp"
#include "worker.hpp"

using namespace std;
using namespace nlohmann;
using namespace orbit;
using namespace orbit::store;

TEST(JobServiceTest, SubmitStoresPendingJobAndQueuesId) {
    memory_job_store store;
    memory_job_queue queue;
    job_service service(store, queue, chrono::seconds(3600), [] { return (int64_t)1700000000; });

    string id = service.submit("print('hello')", "hello");
    EXPECT_FALSE(id.empty());
    EXPECT_EQ(queue.pop(chrono::milliseconds(0)), id);

    auto record = service.status(id);
    ASSERT_TRUE(record);
    EXPECT_EQ(record->id, id);
    EXPECT_EQ(record->code, "print('hello')");
    EXPECT_EQ(record->expected_output, "hello");
    EXPECT_EQ(record->status, job_status::PENDING);
    EXPECT_EQ(record->result, verdict::UNSET);
    EXPECT_EQ(record->created_at, 1700000000);
}

TEST(JobServiceTest, SubmissionsGetDistinctIds) {
    memory_job_store store;
    memory_job_queue queue;
    job_service service(store, queue, chrono::seconds(3600));

    set<string> ids;
    for (int i = 0; i < 100; ++i) ids.insert(service.submit("print(1)", "1"));
    EXPECT_EQ(ids.size(), 100u);
    EXPECT_EQ(queue.size(), 100u);
}

TEST(JobServiceTest, UnknownJob) {
    memory_job_store store;
    memory_job_queue queue;
    job_service service(store, queue, chrono::seconds(3600));
    EXPECT_FALSE(service.status("42"));
}

class HttpServerTest : public ::testing::Test {
protected:
    memory_job_store store;
    memory_job_queue queue;
    job_service service{store, queue, chrono::seconds(3600)};
    metrics_monitor metrics;
    http_config config;

    void SetUp() override {
        config.listen = "127.0.0.1";
        config.port = 0;
    }
};

TEST_F(HttpServerTest, SubmitAndPollStatus) {
    server::http_server server(service, metrics, config);
    server::http_reply reply = server.handle("POST", "/submit", R"json({"code": "print(1)", "expected_output": "1"})json");
    EXPECT_EQ(reply.status, 202u);
    json body = json::parse(reply.body);
    EXPECT_EQ(body.at("message"), "Job queued");
    string id = body.at("job_id").get<string>();

    reply = server.handle("GET", "/status/" + id, "");
    EXPECT_EQ(reply.status, 200u);
    json status = json::parse(reply.body);
    EXPECT_EQ(status.at("id"), id);
    EXPECT_EQ(status.at("status"), "pending");
    EXPECT_EQ(status.at("code"), "print(1)");
}

TEST_F(HttpServerTest, InvalidBody) {
    server::http_server server(service, metrics, config);
    for (const char *body : {"not json", "[1, 2]", R"({"expected_output": "1"})", R"({"code": 42})"}) {
        server::http_reply reply = server.handle("POST", "/submit", body);
        EXPECT_EQ(reply.status, 400u) << body;
        EXPECT_EQ(json::parse(reply.body).at("error"), "Invalid JSON");
    }
    EXPECT_EQ(queue.size(), 0u);
}

TEST_F(HttpServerTest, UnknownJob) {
    server::http_server server(service, metrics, config);
    server::http_reply reply = server.handle("GET", "/status/12345", "");
    EXPECT_EQ(reply.status, 404u);
    EXPECT_EQ(json::parse(reply.body).at("error"), "Job not found");
}

TEST_F(HttpServerTest, Metrics) {
    server::http_server server(service, metrics, config);
    job record;
    metrics.end_job(1, record);
    metrics.diagnosis_requested(1, record);
    server::http_reply reply = server.handle("GET", "/metrics", "");
    EXPECT_EQ(reply.status, 200u);
    EXPECT_EQ(reply.content_type.rfind("text/plain", 0), 0u);
    EXPECT_NE(reply.body.find("# TYPE orbit_jobs_processed_total counter\norbit_jobs_processed_total 1\n"), string::npos);
    EXPECT_NE(reply.body.find("orbit_ai_diagnosis_total 1\n"), string::npos);
    EXPECT_NE(reply.body.find("# TYPE orbit_active_workers gauge\norbit_active_workers 0\n"), string::npos);
}

TEST_F(HttpServerTest, UnknownRoute) {
    server::http_server server(service, metrics, config);
    EXPECT_EQ(server.handle("GET", "/", "").status, 404u);
    EXPECT_EQ(server.handle("GET", "/submit", "").status, 405u);
    EXPECT_EQ(server.handle("DELETE", "/status/1", "").status, 405u);
}

TEST_F(HttpServerTest, StatusOfJobWithInvalidUtf8Output) {
    test::scripted_sandbox sandbox;
    ::testing::NiceMock<test::mock_diagnosis_client> diagnosis;
    worker_pool pool(store, queue, sandbox, diagnosis, worker_options());
    server::http_server server(service, metrics, config);

    sandbox.will_return(test::make_result("caf\xe9\n\xe4\xbd"));
    string id = json::parse(server.handle("POST", "/submit", R"json({"code": "print(1)", "expected_output": "1"})json").body)
                    .at("job_id").get<string>();
    auto popped = queue.pop(chrono::milliseconds(0));
    ASSERT_EQ(popped, id);
    EXPECT_TRUE(pool.process(1, id));

    server::http_reply reply = server.handle("GET", "/status/" + id, "");
    ASSERT_EQ(reply.status, 200u);
    json status = json::parse(reply.body);
    EXPECT_EQ(status.at("status"), "completed");
    EXPECT_EQ(status.at("verdict"), "Failed");
    EXPECT_EQ(status.at("actual_output").get<string>().rfind("caf\xef\xbf\xbd", 0), 0u);
}
