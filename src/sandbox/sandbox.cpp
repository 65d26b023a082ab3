#include "sandbox/sandbox.hpp"
#include <fmt/core.h>
#include <unistd.h>
#include <atomic>

namespace orbit {
using namespace std;

const char *const STDERR_SEPARATOR = "--- stderr ---";
const char *const TIME_LIMIT_MARKER = "Time Limit Exceeded";

bool sandbox_result::timed_out() const {
    return kind == exit_kind::TIMED_OUT;
}

static void ensure_newline(string &text) {
    if (!text.empty() && text.back() != '\n')
        text += '\n';
}

string compose_output(const sandbox_result &result) {
    string composed = result.output;
    if (!result.error.empty()) {
        ensure_newline(composed);
        composed += STDERR_SEPARATOR;
        composed += '\n';
        composed += result.error;
    }
    if (result.timed_out()) {
        ensure_newline(composed);
        composed += TIME_LIMIT_MARKER;
    }
    return composed;
}

string unique_artifact_name(const string &prefix) {
    static atomic<uint64_t> counter{0};
    auto nanos = chrono::duration_cast<chrono::nanoseconds>(chrono::system_clock::now().time_since_epoch()).count();
    return fmt::format("{}_{}_{}_{}", prefix, nanos, getpid(), counter++);
}

sandbox::~sandbox() {}

}  // namespace orbit
