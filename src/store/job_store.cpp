#include "store/job_store.hpp"

namespace orbit::store {

job_store::~job_store() {}

job_queue::~job_queue() {}

}  // namespace orbit::store
