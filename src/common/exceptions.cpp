#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace grader {
using namespace std;

grader_exception::grader_exception()
    : grader_exception("") {}

grader_exception::grader_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *grader_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const grader_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

acquisition_error::acquisition_error(error_kind kind, const string &message)
    : grader_exception(message), reason(kind) {}

error_kind acquisition_error::kind() const noexcept {
    return reason;
}

sandbox_infrastructure_error::sandbox_infrastructure_error()
    : grader_exception() {}

sandbox_infrastructure_error::sandbox_infrastructure_error(const string &message)
    : grader_exception(message) {}

criterion_evaluation_error::criterion_evaluation_error()
    : grader_exception() {}

criterion_evaluation_error::criterion_evaluation_error(const string &message)
    : grader_exception(message) {}

aggregation_error::aggregation_error()
    : grader_exception() {}

aggregation_error::aggregation_error(const string &message)
    : grader_exception(message) {}

configuration_error::configuration_error()
    : grader_exception() {}

configuration_error::configuration_error(const string &message)
    : grader_exception(message) {}

cancelled_error::cancelled_error()
    : grader_exception("grading cancelled") {}

cancelled_error::cancelled_error(const string &message)
    : grader_exception(message) {}

}  // namespace grader
