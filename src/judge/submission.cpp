#include "judge/submission.hpp"
#include <cmath>
#include "common/utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

static int64_t to_millis(double seconds) {
    return llround(seconds * 1000);
}

void to_json(json &j, const test_case_result &result) {
    j = {{"testCaseId", result.test_case_id},
         {"passed", result.passed},
         {"timeTaken", to_millis(result.time)},
         {"memoryUsed", result.memory / 1024},
         {"error", result.error},
         {"score", result.score},
         {"isHidden", result.hidden}};
    if (!result.hidden) {
        j["input"] = result.input;
        j["expectedOutput"] = result.expected_output;
        j["output"] = result.output;
    }
}

void to_json(json &j, const compilation_info &info) {
    j = {{"success", info.success},
         {"output", info.output},
         {"error", info.error},
         {"compilationTime", to_millis(info.time)}};
}

void to_json(json &j, const judge_result &result) {
    j = {{"submissionId", result.sub_id},
         {"userId", result.user_id},
         {"problemId", result.prob_id},
         {"status", get_wire_name(result.verdict.status)},
         {"score", result.verdict.score},
         {"maxScore", result.verdict.max_score},
         {"testCasesPassed", result.verdict.passed},
         {"totalTestCases", result.verdict.total},
         {"timeTaken", to_millis(result.time)},
         {"memoryUsed", result.memory / 1024},
         {"testCaseResults", result.results},
         {"executionInfo", {{"startTime", format_time(result.start_time)},
                            {"endTime", format_time(result.end_time)},
                            {"totalTime", chrono::duration_cast<chrono::milliseconds>(result.end_time - result.start_time).count()}}},
         {"firstAcceptance", result.first_acceptance}};
    if (result.compilation)
        j["compilationInfo"] = *result.compilation;
}

}  // namespace grader
