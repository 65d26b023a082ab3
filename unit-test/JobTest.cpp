#include <set>
#include <thread>
#include <vector>
#include "gtest/gtest.h"
#include "common/json_utils.hpp"
#include "job.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace nlohmann;
using namespace orbit;

TEST(JobTest, SerializeCompletedJob) {
    job record;
    record.id = "1712000000000000000";
    record.code = "print(1/0)";
    record.expected_output = "";
    record.actual_output = "--- stderr ---\nZeroDivisionError: division by zero";
    record.result = verdict::RUNTIME_ERROR;
    record.ai_diagnosis = "Do not divide by zero.";
    record.status = job_status::COMPLETED;
    record.created_at = 1712000000;

    json expected = {
        {"id", "1712000000000000000"},
        {"code", "print(1/0)"},
        {"expected_output", ""},
        {"actual_output", "--- stderr ---\nZeroDivisionError: division by zero"},
        {"verdict", "RuntimeError"},
        {"ai_diagnosis", "Do not divide by zero."},
        {"status", "completed"},
        {"created_at", 1712000000}};
    EXPECT_JSON_EQ(json(record), expected);

    job parsed = expected.get<job>();
    EXPECT_EQ(parsed.result, verdict::RUNTIME_ERROR);
    EXPECT_EQ(parsed.status, job_status::COMPLETED);
    EXPECT_EQ(parsed.ai_diagnosis, record.ai_diagnosis);
}

TEST(JobTest, PendingJobHasEmptyVerdict) {
    job record;
    record.id = "1";
    record.code = "print(1)";
    EXPECT_EQ(json(record).at("verdict"), "");
    EXPECT_EQ(json(record).at("status"), "pending");
}

TEST(JobTest, ParseRecordWithoutOptionalFields) {
    job parsed = json{{"id", "1"}, {"code", "print(1)"}, {"status", "pending"}}.get<job>();
    EXPECT_EQ(parsed.result, verdict::UNSET);
    EXPECT_TRUE(parsed.actual_output.empty());
}

TEST(JobTest, RejectUnknownStatus) {
    EXPECT_THROW((json{{"id", "1"}, {"code", ""}, {"status", "running"}}.get<job>()), invalid_argument);
}

TEST(JobTest, StatusOrdering) {
    EXPECT_FALSE(is_terminal(job_status::PENDING));
    EXPECT_FALSE(is_terminal(job_status::PROCESSING));
    EXPECT_TRUE(is_terminal(job_status::COMPLETED));
    EXPECT_TRUE(is_terminal(job_status::FAILED));
}

TEST(JobTest, GeneratedIdsAreUniqueAndIncreasing) {
    const int THREADS = 4, PER_THREAD = 2000;
    vector<vector<string>> ids(THREADS);
    vector<thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < PER_THREAD; ++i)
                ids[t].push_back(generate_job_id());
        });
    }
    for (auto &thd : threads) thd.join();

    set<string> all;
    for (auto &list : ids) {
        for (size_t i = 1; i < list.size(); ++i)
            EXPECT_LT(stoll(list[i - 1]), stoll(list[i]));
        all.insert(list.begin(), list.end());
    }
    EXPECT_EQ(all.size(), (size_t)THREADS * PER_THREAD);
}

TEST(JobTest, InvalidUtf8IsReplacedWhenDumped) {
    job record;
    record.id = "1";
    record.code = "import sys; sys.stdout.buffer.write(b'caf\\xe9\\n')";
    record.actual_output = "caf\xe9\n";
    record.result = verdict::FAILED;
    record.status = job_status::COMPLETED;

    EXPECT_THROW(json(record).dump(), json::type_error);

    string dumped;
    ASSERT_NO_THROW(dumped = dump_json(record));
    job loaded = json::parse(dumped).get<job>();
    EXPECT_EQ(loaded.actual_output.rfind("caf\xef\xbf\xbd", 0), 0u);
    EXPECT_EQ(loaded.status, job_status::COMPLETED);
    EXPECT_EQ(loaded.result, verdict::FAILED);
}

TEST(JobTest, CharacterCutByOutputLimitIsReplacedWhenDumped) {
    job record;
    record.id = "1";
    record.code = "print('\u4f60' * 1000)";
    record.actual_output = string("\xe4\xbd\xa0\xe4\xbd");
    record.status = job_status::COMPLETED;

    job loaded = json::parse(dump_json(record)).get<job>();
    EXPECT_EQ(loaded.actual_output, "\xe4\xbd\xa0\xef\xbf\xbd");
}
