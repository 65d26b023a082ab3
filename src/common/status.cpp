#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace orbit {
using namespace std;

// clang-format off
static const unordered_map<job_status, const char *> status_string = boost::assign::map_list_of
    (job_status::PENDING, "pending")
    (job_status::PROCESSING, "processing")
    (job_status::COMPLETED, "completed")
    (job_status::FAILED, "failed");

static const unordered_map<verdict, const char *> verdict_string = boost::assign::map_list_of
    (verdict::UNSET, "")
    (verdict::PASSED, "Passed")
    (verdict::FAILED, "Failed")
    (verdict::RUNTIME_ERROR, "RuntimeError");
// clang-format on

const char *get_display_message(job_status stat) {
    return status_string.at(stat);
}

const char *get_display_message(verdict v) {
    return verdict_string.at(v);
}

job_status parse_job_status(const string &text) {
    for (auto &[stat, name] : status_string)
        if (text == name) return stat;
    throw invalid_argument("unrecognized job status " + text);
}

verdict parse_verdict(const string &text) {
    for (auto &[v, name] : verdict_string)
        if (text == name) return v;
    throw invalid_argument("unrecognized verdict " + text);
}

bool is_terminal(job_status status) {
    return status == job_status::COMPLETED || status == job_status::FAILED;
}

}  // namespace orbit
