#include "common/utils.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <cstdlib>

namespace orbit {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

string trim(const string &str) {
    return boost::algorithm::trim_copy(str);
}

int64_t unix_timestamp() {
    return chrono::duration_cast<chrono::seconds>(chrono::system_clock::now().time_since_epoch()).count();
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace orbit
