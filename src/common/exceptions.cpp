#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace pysandbox {
using namespace std;

sandbox_exception::sandbox_exception()
    : sandbox_exception("") {}

sandbox_exception::sandbox_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *sandbox_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

sandbox_error::sandbox_error()
    : sandbox_exception() {}

sandbox_error::sandbox_error(const string &message)
    : sandbox_exception(message) {}

execution_cancelled::execution_cancelled()
    : sandbox_exception("execution cancelled") {}

execution_cancelled::execution_cancelled(const string &message)
    : sandbox_exception(message) {}

config_error::config_error()
    : sandbox_exception() {}

config_error::config_error(const string &message)
    : sandbox_exception(message) {}

}  // namespace pysandbox
