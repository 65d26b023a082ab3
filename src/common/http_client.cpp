#include "common/http_client.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <mutex>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace orbit {
using namespace std;

static size_t write_to_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *buffer = static_cast<string *>(userdata);
    buffer->append(ptr, size * nmemb);
    return size * nmemb;
}

static void ensure_curl_initialized() {
    // curl_global_init 不是线程安全的，必须在第一次使用 CURL 前只调用一次
    static once_flag flag;
    call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK)
            throw network_error("unable to initialize libcurl");
    });
}

http_response http_request(const string &method, const string &url, const string &body,
                           const map<string, string> &headers, const http_options &options) {
    ensure_curl_initialized();

    CURL *curl = curl_easy_init();
    if (!curl) throw network_error("unable to create curl handle for " + url);
    defer { curl_easy_cleanup(curl); };

    struct curl_slist *header_list = nullptr;
    defer { curl_slist_free_all(header_list); };
    for (auto &[key, value] : headers)
        header_list = curl_slist_append(header_list, fmt::format("{}: {}", key, value).c_str());

    http_response response;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    // 多线程环境下 CURL 不能使用信号来实现超时
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (header_list)
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    if (!body.empty()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());
    }
    if (!options.unix_socket.empty())
        curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, options.unix_socket.c_str());
    if (options.timeout.count() > 0)
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long)options.timeout.count());
    if (options.connect_timeout.count() > 0)
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, (long)options.connect_timeout.count());

    DLOG(INFO) << "HTTP: " << method << " " << url;
    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw timeout_error(fmt::format("{} {} timed out: {}", method, url, error_buffer));
    } else if (res != CURLE_OK) {
        throw network_error(fmt::format("{} {} failed: {}", method, url,
                                        error_buffer[0] ? error_buffer : curl_easy_strerror(res)));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

http_response http_post_json(const string &url, const string &json_body, const http_options &options) {
    return http_request("POST", url, json_body, {{"Content-Type", "application/json"}}, options);
}

}  // namespace orbit
