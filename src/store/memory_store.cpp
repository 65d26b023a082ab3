#include "store/memory_store.hpp"

namespace orbit::store {
using namespace std;

memory_job_store::memory_job_store(clock_function clock) : clock(move(clock)) {}

void memory_job_store::set(const string &id, const job &record, chrono::seconds ttl) {
    auto expires_at = clock() + ttl;
    scoped_lock guard(mut);
    records[id] = {record, expires_at};
}

optional<job> memory_job_store::get(const string &id) {
    auto now = clock();
    scoped_lock guard(mut);
    auto it = records.find(id);
    if (it == records.end()) return nullopt;
    if (it->second.expires_at <= now) {
        records.erase(it);
        return nullopt;
    }
    return it->second.record;
}

size_t memory_job_store::size() {
    scoped_lock guard(mut);
    return records.size();
}

void memory_job_queue::push(const string &id) {
    ids.push(id);
}

optional<string> memory_job_queue::pop(chrono::milliseconds timeout) {
    string id;
    if (ids.pop_for(id, timeout)) return id;
    return nullopt;
}

size_t memory_job_queue::size() {
    return ids.size();
}

}  // namespace orbit::store
