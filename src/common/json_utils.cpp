#include "common/json_utils.hpp"

namespace orbit {
using namespace std;
using namespace nlohmann;

string dump_json(const json &j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace orbit
