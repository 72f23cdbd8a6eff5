#include <nlohmann/json.hpp>
#include "common/status.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "judge/submission.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace grader;
using namespace nlohmann;

static chrono::system_clock::time_point at(int64_t millis) {
    return chrono::system_clock::time_point(chrono::milliseconds(millis));
}

TEST(SubmissionJsonTest, VisibleTestCase) {
    test_case_result result;
    result.test_case_id = "1";
    result.passed = true;
    result.time = 0.1234;
    result.memory = 2048 * 1024;
    result.input = "1 2\n";
    result.expected_output = "3\n";
    result.output = "3";
    result.points = result.score = 10;

    json expected = {{"testCaseId", "1"},
                     {"passed", true},
                     {"timeTaken", 123},
                     {"memoryUsed", 2048},
                     {"error", ""},
                     {"score", 10.0},
                     {"isHidden", false},
                     {"input", "1 2\n"},
                     {"expectedOutput", "3\n"},
                     {"output", "3"}};
    EXPECT_JSON_EQ(json(result), expected);
}

TEST(SubmissionJsonTest, HiddenTestCase) {
    test_case_result result;
    result.test_case_id = "2";
    result.hidden = true;
    result.error = "Time limit exceeded (1.500s)";
    result.outcome = sandbox::outcome_kind::TIMED_OUT;

    json j = result;
    EXPECT_FALSE(j.contains("input"));
    EXPECT_FALSE(j.contains("expectedOutput"));
    EXPECT_FALSE(j.contains("output"));
    EXPECT_EQ(j["isHidden"].get<bool>(), true);
    EXPECT_EQ(j["error"].get<string>(), "Time limit exceeded (1.500s)");
}

TEST(SubmissionJsonTest, JudgeResult) {
    judge_result result;
    result.sub_id = "s1";
    result.user_id = "u1";
    result.prob_id = "p1";
    result.verdict.status = status::PARTIAL_CORRECT;
    result.verdict.score = 10;
    result.verdict.max_score = 20;
    result.verdict.passed = 1;
    result.verdict.total = 2;
    result.time = 0.5;
    result.memory = 1024 * 1024;
    result.start_time = at(1577836800000);
    result.end_time = at(1577836801250);

    json j = result;
    EXPECT_EQ(j["submissionId"].get<string>(), "s1");
    EXPECT_EQ(j["status"].get<string>(), "partial-correct");
    EXPECT_EQ(j["score"].get<double>(), 10);
    EXPECT_EQ(j["maxScore"].get<double>(), 20);
    EXPECT_EQ(j["testCasesPassed"].get<int>(), 1);
    EXPECT_EQ(j["totalTestCases"].get<int>(), 2);
    EXPECT_EQ(j["timeTaken"].get<int>(), 500);
    EXPECT_EQ(j["memoryUsed"].get<int>(), 1024);
    EXPECT_FALSE(j["firstAcceptance"].get<bool>());
    EXPECT_FALSE(j.contains("compilationInfo"));

    json execution = {{"startTime", "2020-01-01T00:00:00.000Z"},
                      {"endTime", "2020-01-01T00:00:01.250Z"},
                      {"totalTime", 1250}};
    EXPECT_JSON_EQ(j["executionInfo"], execution);
}

TEST(SubmissionJsonTest, CompilationInfo) {
    judge_result result;
    result.verdict.status = status::COMPILATION_ERROR;
    compilation_info info;
    info.success = false;
    info.output = "solution.cpp:1:1: error";
    info.error = "Compilation failed: exit code 1";
    info.time = 0.25;
    result.compilation = info;

    json expected = {{"success", false},
                     {"output", "solution.cpp:1:1: error"},
                     {"error", "Compilation failed: exit code 1"},
                     {"compilationTime", 250}};
    json j = result;
    EXPECT_EQ(j["status"].get<string>(), "compilation-error");
    EXPECT_JSON_EQ(j["compilationInfo"], expected);
}

TEST(SubmissionJsonTest, StatusNames) {
    for (status st : {status::ACCEPTED, status::WRONG_ANSWER, status::PARTIAL_CORRECT,
                      status::TIME_LIMIT_EXCEEDED, status::MEMORY_LIMIT_EXCEEDED,
                      status::RUNTIME_ERROR, status::COMPILATION_ERROR}) {
        EXPECT_EQ(parse_status(get_wire_name(st)), st);
        EXPECT_TRUE(is_terminal(st));
    }
    EXPECT_FALSE(is_terminal(status::RUNNING));
    EXPECT_STREQ(get_display_message(status::TIME_LIMIT_EXCEEDED), "Time Limit Exceeded");
    EXPECT_THROW(parse_status("unknown"), invalid_argument);
}
