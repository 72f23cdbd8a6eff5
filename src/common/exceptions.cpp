#include "common/exceptions.hpp"
#include <string.h>
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

internal_error::internal_error()
    : grader_exception() {}

internal_error::internal_error(const string &message)
    : grader_exception(message) {}

sandbox_error::sandbox_error()
    : grader_exception() {}

sandbox_error::sandbox_error(const string &message)
    : grader_exception(message) {}

sandbox_error::sandbox_error(int err, const string &message)
    : grader_exception(message + ": " + strerror(err)), err(err) {}

int sandbox_error::code() const noexcept {
    return err;
}

configuration_error::configuration_error()
    : grader_exception() {}

configuration_error::configuration_error(const string &message)
    : grader_exception(message) {}

unsupported_language::unsupported_language(const string &language)
    : configuration_error("Unsupported language: " + language), language(language) {}

already_in_progress::already_in_progress(const string &sub_id)
    : grader_exception("Submission " + sub_id + " is already being judged"), sub_id(sub_id) {}

}  // namespace grader
