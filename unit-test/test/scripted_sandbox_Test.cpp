#include "test/scripted_sandbox.hpp"
#include "common/exceptions.hpp"

namespace orbit::test {
using namespace std;

void scripted_sandbox::will_return(const sandbox_result &result) {
    scoped_lock guard(mut);
    script.push_back([result] { return result; });
}

void scripted_sandbox::will_fail(const string &message) {
    scoped_lock guard(mut);
    script.push_back([message]() -> sandbox_result { throw sandbox_error(message); });
}

sandbox_result scripted_sandbox::run(const string &source, const resource_limits &) {
    function<sandbox_result()> next;
    {
        scoped_lock guard(mut);
        received.push_back(source);
        if (script.empty()) return make_result("");
        next = move(script.front());
        script.pop_front();
    }
    return next();
}

size_t scripted_sandbox::active_environments() const {
    return 0;
}

vector<string> scripted_sandbox::sources() {
    scoped_lock guard(mut);
    return received;
}

sandbox_result make_result(const string &output, const string &error, exit_kind kind, int exitcode) {
    sandbox_result result;
    result.output = output;
    result.error = error;
    result.kind = kind;
    result.exitcode = exitcode;
    result.wall_time = 0.01;
    return result;
}

}  // namespace orbit::test
