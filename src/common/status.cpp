#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::PENDING, "Pending")
    (status::COMPILING, "Compiling")
    (status::RUNNING, "Running")
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::PARTIAL_CORRECT, "Partial Correct")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::COMPILATION_ERROR, "Compilation Error");

static const unordered_map<status, const char *> status_wire_name = boost::assign::map_list_of
    (status::PENDING, "pending")
    (status::COMPILING, "compiling")
    (status::RUNNING, "running")
    (status::ACCEPTED, "accepted")
    (status::WRONG_ANSWER, "wrong-answer")
    (status::PARTIAL_CORRECT, "partial-correct")
    (status::TIME_LIMIT_EXCEEDED, "time-limit-exceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "memory-limit-exceeded")
    (status::RUNTIME_ERROR, "runtime-error")
    (status::COMPILATION_ERROR, "compilation-error");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_wire_name(status stat) {
    return status_wire_name.at(stat);
}

status parse_status(const string &name) {
    for (auto &[stat, wire] : status_wire_name)
        if (name == wire) return stat;
    throw invalid_argument("Unrecognized status " + name);
}

bool is_terminal(status stat) {
    return stat != status::PENDING && stat != status::COMPILING && stat != status::RUNNING;
}

}  // namespace grader
