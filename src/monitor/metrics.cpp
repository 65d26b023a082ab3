#include "monitor/metrics.hpp"
#include <fmt/format.h>
#include <iterator>

namespace orbit {
using namespace std;

template <typename T>
static void render_metric(fmt::memory_buffer &buf, const char *name, const char *type, const char *help, T value) {
    fmt::format_to(back_inserter(buf), "# HELP {} {}\n", name, help);
    fmt::format_to(back_inserter(buf), "# TYPE {} {}\n", name, type);
    fmt::format_to(back_inserter(buf), "{} {}\n", name, value);
}

void metrics_monitor::worker_state_changed(int, worker_state state, const string &) {
    switch (state) {
        case worker_state::JUDGING:
            ++active;
            break;
        case worker_state::IDLE:
        case worker_state::CRASHED:
            --active;
            break;
        default:
            break;
    }
}

void metrics_monitor::end_job(int, const job &) {
    ++processed;
}

void metrics_monitor::diagnosis_requested(int, const job &) {
    ++diagnoses;
}

void metrics_monitor::report_error(const string &) {
    ++errors;
}

uint64_t metrics_monitor::jobs_processed() const {
    return processed.load();
}

uint64_t metrics_monitor::diagnoses_requested() const {
    return diagnoses.load();
}

int64_t metrics_monitor::active_workers() const {
    return active.load();
}

uint64_t metrics_monitor::errors_reported() const {
    return errors.load();
}

string metrics_monitor::render() const {
    fmt::memory_buffer buf;
    render_metric(buf, "orbit_jobs_processed_total", "counter", "The total number of processed jobs", jobs_processed());
    render_metric(buf, "orbit_ai_diagnosis_total", "counter", "The total number of AI diagnosis requests", diagnoses_requested());
    render_metric(buf, "orbit_active_workers", "gauge", "The number of workers currently processing a job", active_workers());
    render_metric(buf, "orbit_errors_total", "counter", "The total number of internal errors reported by workers", errors_reported());
    return fmt::to_string(buf);
}

}  // namespace orbit
