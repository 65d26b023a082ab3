#include "job.hpp"
#include <chrono>
#include <mutex>

namespace orbit {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const job &job) {
    j = json{
        {"id", job.id},
        {"code", job.code},
        {"expected_output", job.expected_output},
        {"actual_output", job.actual_output},
        {"verdict", get_display_message(job.result)},
        {"ai_diagnosis", job.ai_diagnosis},
        {"status", get_display_message(job.status)},
        {"created_at", job.created_at}};
}

void from_json(const json &j, job &job) {
    j.at("id").get_to(job.id);
    j.at("code").get_to(job.code);
    job.expected_output = j.value("expected_output", "");
    job.actual_output = j.value("actual_output", "");
    job.result = parse_verdict(j.value("verdict", ""));
    job.ai_diagnosis = j.value("ai_diagnosis", "");
    job.status = parse_job_status(j.at("status").get<string>());
    job.created_at = j.value("created_at", (int64_t)0);
}

string generate_job_id() {
    static mutex id_mutex;
    static int64_t last_id = 0;

    int64_t now = chrono::duration_cast<chrono::nanoseconds>(chrono::system_clock::now().time_since_epoch()).count();
    scoped_lock guard(id_mutex);
    last_id = max(now, last_id + 1);
    return to_string(last_id);
}

}  // namespace orbit
