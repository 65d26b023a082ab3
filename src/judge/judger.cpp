#include "judge/judger.hpp"
#include "common/utils.hpp"

namespace orbit {
using namespace std;

const char *const CRASH_MARKERS[2] = {
    "Traceback (most recent call last)",
    "Error:"};

bool contains_crash_marker(const string &output) {
    for (const char *marker : CRASH_MARKERS)
        if (output.find(marker) != string::npos)
            return true;
    return false;
}

verdict judge_output(const string &actual_output, const string &expected_output, bool run_error, bool timed_out) {
    if (run_error || timed_out || contains_crash_marker(actual_output))
        return verdict::RUNTIME_ERROR;

    if (trim(actual_output) == trim(expected_output))
        return verdict::PASSED;
    else
        return verdict::FAILED;
}

}  // namespace orbit
