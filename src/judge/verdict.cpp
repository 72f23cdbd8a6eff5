#include "judge/verdict.hpp"

namespace grader {
using namespace std;
using sandbox::outcome_kind;

verdict resolve_verdict(const vector<test_case_result> &results, bool build_failed) {
    verdict v;
    v.total = results.size();

    bool timed_out = false, memory_exceeded = false, crashed = false;
    for (auto &result : results) {
        v.max_score += result.points;
        v.score += result.score;
        if (result.passed) ++v.passed;

        switch (result.outcome) {
            case outcome_kind::TIMED_OUT: timed_out = true; break;
            case outcome_kind::MEMORY_EXCEEDED: memory_exceeded = true; break;
            case outcome_kind::RUNTIME_ERROR: crashed = true; break;
            case outcome_kind::COMPLETED: break;
        }
    }

    if (build_failed)
        v.status = status::COMPILATION_ERROR;
    else if (timed_out)
        v.status = status::TIME_LIMIT_EXCEEDED;
    else if (memory_exceeded)
        v.status = status::MEMORY_LIMIT_EXCEEDED;
    else if (crashed)
        v.status = status::RUNTIME_ERROR;
    else if (v.score <= 0)
        v.status = status::WRONG_ANSWER;
    else if (v.score < v.max_score)
        v.status = status::PARTIAL_CORRECT;
    else
        v.status = status::ACCEPTED;
    return v;
}

}  // namespace grader
