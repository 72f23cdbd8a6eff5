#include "config.hpp"
#include "gtest/gtest.h"
#include "judge/orchestrator.hpp"
#include "test/environment.hpp"
#include "test/mock_submission_store.hpp"

using namespace std;
using namespace grader;
using ::testing::NiceMock;

class MultiLanguageTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    static void TearDownTestCase() {
    }

    submission prepare(const string &language, const string &source) {
        submission submit;
        submit.sub_id = "lang-" + language;
        submit.user_id = "mock";
        submit.prob_id = "1234";
        submit.language = language;
        submit.code = source;
        // Java, JavaScript 这类有 GC 的语言启动较慢，时间限制放宽
        submit.time_limit = 5;
        submit.memory_limit = 256LL << 20;

        test_case tc;
        tc.id = "0";
        tc.input = "";
        tc.expected_output = "hello world\n";
        submit.test_cases.push_back(tc);
        return submit;
    }

    void test(const string &language, const string &tool, const string &source) {
        if (!has_program(tool)) GTEST_SKIP() << tool << " is not installed";

        NiceMock<server::mock::submission_store> store;
        language_registry languages = language_registry::defaults();
        judging_orchestrator orchestrator(store, languages);

        judge_result result = orchestrator.submit(prepare(language, source));
        ASSERT_EQ(result.verdict.status, status::ACCEPTED)
            << (result.compilation ? result.compilation->output + result.compilation->error : "")
            << (result.results.empty() ? "" : result.results[0].error);
        EXPECT_EQ(result.verdict.score, 10);
    }
};

TEST_F(MultiLanguageTest, CTest) {
    test("c", "gcc", R"(
#include <stdio.h>
int main() { puts("hello world"); })");
}

TEST_F(MultiLanguageTest, CppTest) {
    test("cpp", "g++", R"(
#include <iostream>
int main() { std::cout << "hello world" << std::endl; })");
}

TEST_F(MultiLanguageTest, PythonTest) {
    test("python", "python3", R"(print("hello world"))");
}

TEST_F(MultiLanguageTest, JavaTest) {
    test("java", "javac", R"(
public class Solution {
    public static void main(String[] args) {
        System.out.println("hello world");
    }
})");
}

TEST_F(MultiLanguageTest, JavaScriptTest) {
    test("javascript", "node", R"(console.log("hello world");)");
}

TEST_F(MultiLanguageTest, CppCompilationError) {
    if (!has_program("g++")) GTEST_SKIP() << "g++ is not installed";

    NiceMock<server::mock::submission_store> store;
    language_registry languages = language_registry::defaults();
    judging_orchestrator orchestrator(store, languages);

    judge_result result = orchestrator.submit(prepare("cpp", "int main() { return undefined_symbol; }"));
    EXPECT_EQ(result.verdict.status, status::COMPILATION_ERROR);
    ASSERT_TRUE(result.compilation.has_value());
    EXPECT_NE(result.compilation->output.find("undefined_symbol"), string::npos);
}

TEST_F(MultiLanguageTest, PythonRuntimeError) {
    if (!has_program("python3")) GTEST_SKIP() << "python3 is not installed";

    NiceMock<server::mock::submission_store> store;
    language_registry languages = language_registry::defaults();
    judging_orchestrator orchestrator(store, languages);

    judge_result result = orchestrator.submit(prepare("python", "raise ValueError('boom')"));
    EXPECT_EQ(result.verdict.status, status::RUNTIME_ERROR);
    ASSERT_EQ(result.results.size(), 1);
    EXPECT_NE(result.results[0].error.find("ValueError"), string::npos);
}
