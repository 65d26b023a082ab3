#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace orbit {
using namespace std;

orbit_exception::orbit_exception()
    : orbit_exception("") {}

orbit_exception::orbit_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *orbit_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const orbit_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

sandbox_error::sandbox_error()
    : orbit_exception() {}

sandbox_error::sandbox_error(const string &message)
    : orbit_exception(message) {}

store_error::store_error()
    : orbit_exception() {}

store_error::store_error(const string &message)
    : orbit_exception(message) {}

network_error::network_error()
    : orbit_exception() {}

network_error::network_error(const string &message)
    : orbit_exception(message) {}

timeout_error::timeout_error()
    : network_error() {}

timeout_error::timeout_error(const string &message)
    : network_error(message) {}

configuration_error::configuration_error()
    : orbit_exception() {}

configuration_error::configuration_error(const string &message)
    : orbit_exception(message) {}

}  // namespace orbit
