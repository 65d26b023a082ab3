#include "service/job_service.hpp"
#include <glog/logging.h>
#include "common/utils.hpp"

namespace orbit {
using namespace std;

job_service::job_service(store::job_store &store, store::job_queue &queue, chrono::seconds ttl, timestamp_function timestamp)
    : store(store), queue(queue), ttl(ttl), timestamp(move(timestamp)) {}

int64_t job_service::unix_timestamp_now() {
    return unix_timestamp();
}

string job_service::submit(const string &code, const string &expected_output) {
    job record;
    record.id = generate_job_id();
    record.code = code;
    record.expected_output = expected_output;
    record.status = job_status::PENDING;
    record.created_at = timestamp();

    store.set(record.id, record, ttl);
    queue.push(record.id);
    LOG(INFO) << "Job " << record.id << " queued";
    return record.id;
}

optional<job> job_service::status(const string &id) {
    return store.get(id);
}

}  // namespace orbit
