#include "monitor/monitor.hpp"

namespace orbit {
using namespace std;

monitor::~monitor() {}

void monitor::worker_state_changed(int, worker_state, const string &) {}

void monitor::start_job(int, const job &) {}

void monitor::end_job(int, const job &) {}

void monitor::diagnosis_requested(int, const job &) {}

void monitor::report_error(const string &) {}

}  // namespace orbit
