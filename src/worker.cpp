#include "worker.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <functional>
#include "common/exceptions.hpp"
#include "judge/judger.hpp"

namespace orbit {
using namespace std;

worker_pool::worker_pool(store::job_store &store, store::job_queue &queue, sandbox &runner,
                         diagnosis_client &diagnosis, const worker_options &options)
    : store(store), queue(queue), runner(runner), diagnosis(diagnosis), options(options) {}

worker_pool::~worker_pool() {
    stop();
    join();
}

void worker_pool::register_monitor(shared_ptr<monitor> monitor) {
    CHECK(threads.empty()) << "Monitors must be registered before workers start";
    monitors.push_back(move(monitor));
}

void worker_pool::call_monitor(int worker_id, const function<void(monitor &)> &callback) {
    for (auto &monitor : monitors) {
        try {
            callback(*monitor);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when reporting monitoring information, " << ex.what();
        }
    }
}

void worker_pool::start(size_t workers) {
    CHECK(threads.empty()) << "Workers have already been started";
    LOG(INFO) << "Starting " << workers << " workers";
    for (size_t i = 0; i < workers; ++i) {
        int worker_id = (int)i + 1;
        threads.emplace_back([this, worker_id] { worker_loop(worker_id); });
    }
}

void worker_pool::stop() {
    {
        scoped_lock guard(stop_mut);
        if (stop_requested) return;
        stop_requested = true;
    }
    LOG(INFO) << "Stopping workers";
    stop_cond.notify_all();
}

void worker_pool::join() {
    for (auto &thread : threads)
        if (thread.joinable()) thread.join();
}

bool worker_pool::stopping() const {
    return stop_requested.load();
}

void worker_pool::wait_for_stop(chrono::milliseconds duration) {
    unique_lock<mutex> lock(stop_mut);
    stop_cond.wait_for(lock, duration, [this] { return stop_requested.load(); });
}

bool worker_pool::process(int worker_id, const string &id) {
    optional<job> record = store.get(id);
    if (!record) {
        // 提交已经过期，或者队列和存储不同步
        LOG(WARNING) << "Worker " << worker_id << ": job " << id << " not found in store, skipping";
        return false;
    }
    if (record->status != job_status::PENDING) {
        LOG(WARNING) << "Worker " << worker_id << ": job " << id << " is already " << get_display_message(record->status) << ", skipping";
        return false;
    }

    record->status = job_status::PROCESSING;
    store.set(id, *record, options.job_ttl);
    call_monitor(worker_id, [&](monitor &m) { m.start_job(worker_id, *record); });
    DLOG(INFO) << "Worker " << worker_id << ": job " << id << " -> processing";

    try {
        sandbox_result result = runner.run(record->code, options.limits);
        record->actual_output = compose_output(result);
        record->result = judge_output(record->actual_output, record->expected_output,
                                      result.kind == exit_kind::CRASHED, result.timed_out());
        if (record->result == verdict::RUNTIME_ERROR) {
            call_monitor(worker_id, [&](monitor &m) { m.diagnosis_requested(worker_id, *record); });
            record->ai_diagnosis = diagnosis.diagnose(record->code, record->actual_output);
        }
        record->status = job_status::COMPLETED;
    } catch (std::exception &ex) {
        // 评测系统自身的错误，不是选手代码的错误，因此不请求诊断
        LOG(ERROR) << "Worker " << worker_id << ": unable to run job " << id << ", " << ex.what();
        call_monitor(worker_id, [&](monitor &m) { m.report_error(ex.what()); });
        record->status = job_status::FAILED;
        record->result = verdict::RUNTIME_ERROR;
        record->actual_output = fmt::format("Sandbox error: {}", ex.what());
        record->ai_diagnosis.clear();
    }

    store.set(id, *record, options.job_ttl);
    call_monitor(worker_id, [&](monitor &m) { m.end_job(worker_id, *record); });
    LOG(INFO) << fmt::format("Worker {}: job {} -> {} ({})", worker_id, id,
                             get_display_message(record->result), get_display_message(record->status));
    return true;
}

void worker_pool::worker_loop(int worker_id) {
    LOG(INFO) << "Worker " << worker_id << " started";
    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::START, ""); });

    while (!stop_requested) {
        optional<string> id;
        try {
            id = queue.pop(options.poll_interval);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << ": unable to pop from job queue, " << ex.what();
            call_monitor(worker_id, [&](monitor &m) { m.report_error(ex.what()); });
            wait_for_stop(options.poll_interval);
            continue;
        }
        if (!id) continue;

        auto crashed = [&](const char *message) {
            call_monitor(worker_id, [&](monitor &m) {
                m.worker_state_changed(worker_id, worker_state::CRASHED, message);
                m.report_error(message);
            });
        };

        call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::JUDGING, ""); });
        try {
            process(worker_id, *id);
            call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::IDLE, ""); });
        } catch (orbit_exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when processing job " << *id << ", " << ex;
            crashed(ex.what());
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when processing job " << *id << ", " << ex.what() << endl
                       << boost::diagnostic_information(ex);
            crashed(ex.what());
        }
    }

    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::STOPPED, ""); });
    LOG(INFO) << "Worker " << worker_id << " stopped";
}

}  // namespace orbit
