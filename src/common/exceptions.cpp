#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace codejudge {
using namespace std;

engine_exception::engine_exception()
    : engine_exception("") {}

engine_exception::engine_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *engine_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const engine_exception &ex) {
    os << boost::diagnostic_information(ex) << endl
       << *ex.stacktrace;
    return os;
}

invalid_submission::invalid_submission()
    : engine_exception() {}

invalid_submission::invalid_submission(const string &message)
    : engine_exception(message) {}

overloaded::overloaded()
    : engine_exception() {}

overloaded::overloaded(const string &message)
    : engine_exception(message) {}

sandbox_error::sandbox_error()
    : engine_exception() {}

sandbox_error::sandbox_error(const string &message)
    : engine_exception(message) {}

}  // namespace codejudge
