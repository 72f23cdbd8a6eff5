#include <filesystem>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "judge/test_runner.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace grader;
namespace fs = std::filesystem;

class TestRunnerTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    void SetUp() override {
        dir = make_unique<scoped_directory>(RUN_DIR, "runner-test");
        fs::create_directories(dir->path() / "compile");
    }

    prepared_program prepare(const language &lang, const string &code) {
        return lang.prepare(dir->path() / "compile", code);
    }

    static test_case make_case(const string &id, const string &input, const string &expected, bool hidden = false) {
        test_case tc;
        tc.id = id;
        tc.input = input;
        tc.expected_output = expected;
        tc.hidden = hidden;
        return tc;
    }

    unique_ptr<scoped_directory> dir;
};

TEST_F(TestRunnerTest, EchoProgram) {
    prepared_program program = prepare(shell_language(), "cat");
    test_runner runner(dir->path());
    vector<test_case> cases = {make_case("a", "1 2\n", "1 2"),
                               make_case("b", "hello\n", "hello\n\n\n"),
                               make_case("c", "x y\n", "x  y\n")};

    test_run run = runner.run_all(program, nullopt, cases, 2, 256LL << 20);
    EXPECT_FALSE(run.build_failed);
    EXPECT_FALSE(run.compilation.has_value());
    ASSERT_EQ(run.results.size(), 3);

    EXPECT_EQ(run.results[0].test_case_id, "a");
    EXPECT_TRUE(run.results[0].passed);
    EXPECT_EQ(run.results[0].score, 10);
    EXPECT_EQ(run.results[0].output, "1 2");
    EXPECT_EQ(run.results[0].input, "1 2\n");

    EXPECT_TRUE(run.results[1].passed);

    EXPECT_FALSE(run.results[2].passed);
    EXPECT_EQ(run.results[2].score, 0);
    EXPECT_EQ(run.results[2].outcome, sandbox::outcome_kind::COMPLETED);
}

TEST_F(TestRunnerTest, DefaultTestCaseId) {
    prepared_program program = prepare(shell_language(), "cat");
    test_runner runner(dir->path());
    test_run run = runner.run_all(program, nullopt, {make_case("", "", ""), make_case("", "", "")}, 2, 256LL << 20);
    ASSERT_EQ(run.results.size(), 2);
    EXPECT_EQ(run.results[0].test_case_id, "1");
    EXPECT_EQ(run.results[1].test_case_id, "2");
}

TEST_F(TestRunnerTest, HiddenCaseRedacted) {
    prepared_program program = prepare(shell_language(), "cat; echo secret >&2; exit 1");
    test_runner runner(dir->path());
    test_run run = runner.run_all(program, nullopt,
                                  {make_case("visible", "in\n", "in\n"), make_case("hidden", "in\n", "in\n", true)},
                                  2, 256LL << 20);
    ASSERT_EQ(run.results.size(), 2);

    const test_case_result &visible = run.results[0];
    EXPECT_EQ(visible.outcome, sandbox::outcome_kind::RUNTIME_ERROR);
    EXPECT_NE(visible.error.find("secret"), string::npos);
    EXPECT_EQ(visible.output, "in");

    const test_case_result &hidden = run.results[1];
    EXPECT_TRUE(hidden.hidden);
    EXPECT_EQ(hidden.input, "");
    EXPECT_EQ(hidden.expected_output, "");
    EXPECT_EQ(hidden.output, "");
    EXPECT_EQ(hidden.error, "Runtime error: exit code 1");
}

TEST_F(TestRunnerTest, FailureDoesNotStopOtherCases) {
    prepared_program program = prepare(shell_language(), R"(read x
if [ "$x" = "slow" ]; then sleep 30; fi
if [ "$x" = "crash" ]; then exit 2; fi
echo "$x")");
    test_runner runner(dir->path());
    test_run run = runner.run_all(program, nullopt,
                                  {make_case("1", "slow\n", "slow"),
                                   make_case("2", "crash\n", "crash"),
                                   make_case("3", "ok\n", "ok")},
                                  0.5, 256LL << 20);
    ASSERT_EQ(run.results.size(), 3);
    EXPECT_EQ(run.results[0].outcome, sandbox::outcome_kind::TIMED_OUT);
    EXPECT_EQ(run.results[1].outcome, sandbox::outcome_kind::RUNTIME_ERROR);
    EXPECT_EQ(run.results[2].outcome, sandbox::outcome_kind::COMPLETED);
    EXPECT_TRUE(run.results[2].passed);
}

TEST_F(TestRunnerTest, ParallelKeepsOrder) {
    prepared_program program = prepare(shell_language(), "read x; sleep 0.$((9 - x)); echo $x");
    test_runner runner(dir->path(), 4);
    vector<test_case> cases;
    for (int i = 0; i < 8; ++i)
        cases.push_back(make_case(to_string(i), to_string(i) + "\n", to_string(i)));

    test_run run = runner.run_all(program, nullopt, cases, 3, 256LL << 20);
    ASSERT_EQ(run.results.size(), cases.size());
    for (size_t i = 0; i < cases.size(); ++i) {
        EXPECT_EQ(run.results[i].test_case_id, to_string(i));
        EXPECT_TRUE(run.results[i].passed) << run.results[i].output;
    }
}

TEST_F(TestRunnerTest, InputFilesRemoved) {
    prepared_program program = prepare(shell_language(), "cat");
    test_runner runner(dir->path());
    runner.run_all(program, nullopt, {make_case("1", "a", "a"), make_case("2", "b", "b")}, 2, 256LL << 20);
    EXPECT_EQ(count_entries(dir->path() / "input"), 0);
    EXPECT_EQ(count_entries(dir->path(), "sandbox-"), 0);
}

TEST_F(TestRunnerTest, BuildSucceeded) {
    prepared_program program = prepare(checked_shell_language(), "cat");
    ASSERT_TRUE(program.build.has_value());
    test_runner runner(dir->path());

    compilation_info info = runner.build(program);
    EXPECT_TRUE(info.success);
    EXPECT_EQ(info.error, "");

    test_run run = runner.run_all(program, info, {make_case("1", "a", "a")}, 2, 256LL << 20);
    EXPECT_FALSE(run.build_failed);
    ASSERT_TRUE(run.compilation.has_value());
    ASSERT_EQ(run.results.size(), 1);
    EXPECT_TRUE(run.results[0].passed);
}

TEST_F(TestRunnerTest, BuildFailureSkipsTestCases) {
    prepared_program program = prepare(checked_shell_language(), "if then fi (");
    test_runner runner(dir->path());

    compilation_info info = runner.build(program);
    EXPECT_FALSE(info.success);
    EXPECT_FALSE(info.output.empty());
    EXPECT_EQ(info.error.rfind("Compilation failed", 0), 0);

    test_run run = runner.run_all(program, info, {make_case("1", "a", "a")}, 2, 256LL << 20);
    EXPECT_TRUE(run.build_failed);
    EXPECT_TRUE(run.results.empty());
    EXPECT_FALSE(fs::exists(dir->path() / "input"));
}
