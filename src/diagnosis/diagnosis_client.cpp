#include "diagnosis/diagnosis_client.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include "common/http_client.hpp"
#include "common/json_utils.hpp"

namespace orbit {
using namespace std;
using namespace nlohmann;

const char *const DIAGNOSIS_UNAVAILABLE = "AI diagnosis unavailable";

static string unavailable(const string &reason) {
    return fmt::format("{}: {}", DIAGNOSIS_UNAVAILABLE, reason);
}

diagnosis_client::~diagnosis_client() {}

http_diagnosis_client::http_diagnosis_client(const diagnosis_config &config) : config(config) {}

string http_diagnosis_client::diagnose(const string &code, const string &error_output) noexcept {
    if (config.url.empty())
        return unavailable("diagnosis service is not configured");

    try {
        http_options options;
        options.timeout = config.timeout;
        options.connect_timeout = config.connect_timeout;

        string request = dump_json({{"code", code}, {"error", error_output}});
        http_response response = http_post_json(config.url, request, options);
        if (response.status < 200 || response.status >= 300) {
            LOG(WARNING) << "Diagnosis: service returned status " << response.status;
            return unavailable(fmt::format("service returned status {}", response.status));
        }

        json j = json::parse(response.body);
        if (!j.is_object() || !j.count("analysis") || !j.at("analysis").is_string()) {
            LOG(WARNING) << "Diagnosis: response does not contain analysis";
            return unavailable("malformed response");
        }
        string analysis = j.at("analysis").get<string>();
        if (analysis.empty()) return unavailable("empty analysis");
        return analysis;
    } catch (json::exception &ex) {
        LOG(WARNING) << "Diagnosis: malformed response: " << ex.what();
        return unavailable("malformed response");
    } catch (std::exception &ex) {
        LOG(WARNING) << "Diagnosis: request failed: " << ex.what();
        return unavailable(ex.what());
    }
}

}  // namespace orbit
