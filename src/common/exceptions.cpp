#include "common/exceptions.hpp"
#include <fmt/core.h>
#include <boost/exception/diagnostic_information.hpp>
#include <cstring>

namespace atst {
using namespace std;

atst_exception::atst_exception()
    : atst_exception("") {}

atst_exception::atst_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *atst_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const atst_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : atst_exception() {}

internal_error::internal_error(const string &message)
    : atst_exception(message) {}

configuration_error::configuration_error(const string &message)
    : atst_exception("Invalid configuration: " + message) {}

environment_error::environment_error(const string &message)
    : atst_exception(message) {}

spawn_error::spawn_error(const string &command, int err)
    : atst_exception(fmt::format("error executing '{}' (not installed?): {}", command, strerror(err))),
      command(command),
      error_code(err) {}

}  // namespace atst
