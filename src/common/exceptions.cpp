#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace arbiter {
using namespace std;

judge_exception::judge_exception()
    : judge_exception("") {}

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

client_error::client_error()
    : judge_exception() {}

client_error::client_error(const string &message)
    : judge_exception(message) {}

infrastructure_error::infrastructure_error()
    : judge_exception() {}

infrastructure_error::infrastructure_error(const string &message)
    : judge_exception(message) {}

sandbox_unavailable::sandbox_unavailable()
    : infrastructure_error() {}

sandbox_unavailable::sandbox_unavailable(const string &message)
    : infrastructure_error(message) {}

judge_timeout::judge_timeout()
    : infrastructure_error() {}

judge_timeout::judge_timeout(const string &message)
    : infrastructure_error(message) {}

internal_error::internal_error()
    : infrastructure_error() {}

internal_error::internal_error(const string &message)
    : infrastructure_error(message) {}

}  // namespace arbiter
