#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 一个测试点
 */
struct test_case {
    /**
     * @brief 测试点编号
     * string 可以兼容一切情况
     */
    std::string id;

    std::string input;

    std::string expected_output;

    /**
     * @brief 测试点的分值，默认为 10 分
     */
    double points = 10;

    /**
     * @brief 隐藏的测试点不向选手展示输入、标准输出和程序输出
     */
    bool hidden = false;
};

/**
 * @brief 一个选手提交
 */
struct submission {
    /**
     * @brief 选手代码提交的 id
     * string 可以兼容一切情况
     */
    std::string sub_id;

    /**
     * @brief 选手用户 id
     */
    std::string user_id;

    /**
     * @brief 选手代码提交的题目 id
     */
    std::string prob_id;

    /**
     * @brief 选手的源代码
     */
    std::string code;

    /**
     * @brief 源代码的语言标识，如 cpp、python
     */
    std::string language;

    /**
     * @brief 时间限制，单位为秒
     */
    double time_limit = -1;

    /**
     * @brief 内存限制，单位为字节
     */
    int64_t memory_limit = -1;

    std::vector<test_case> test_cases;

    /**
     * @brief 题目允许使用的语言，为空表示允许所有已注册的语言
     */
    std::vector<std::string> allowed_languages;
};

template <typename T>
T &operator<<(T &os, const submission &submit) {
    os << "Submission[" << submit.language << ":" << submit.prob_id << "-" << submit.sub_id << "]";
    return os;
}

/**
 * @brief 一个测试点的评测结果，生成后不再修改
 */
struct test_case_result {
    std::string test_case_id;

    bool passed = false;

    /**
     * @brief 运行时间，单位为秒
     */
    double time = 0;

    /**
     * @brief 峰值内存，单位为字节，无法统计时为 0
     */
    int64_t memory = 0;

    bool hidden = false;

    /**
     * @brief 测试点输入和标准输出，隐藏测试点为空
     */
    std::string input;
    std::string expected_output;

    /**
     * @brief 规范化之后的程序输出，隐藏测试点为空
     */
    std::string output;

    /**
     * @brief 运行失败的原因以及程序的标准错误输出
     * 隐藏测试点只包含运行结果的描述
     */
    std::string error;

    sandbox::outcome_kind outcome = sandbox::outcome_kind::COMPLETED;

    /**
     * @brief 测试点的分值
     */
    double points = 0;

    /**
     * @brief 得分，通过时等于 points，否则为 0
     */
    double score = 0;
};

/**
 * @brief 编译信息
 */
struct compilation_info {
    bool success = true;

    /**
     * @brief 编译器的标准输出和标准错误输出
     */
    std::string output;

    /**
     * @brief 编译失败或者评测系统内部错误的描述
     */
    std::string error;

    /**
     * @brief 编译时间，单位为秒
     */
    double time = 0;
};

/**
 * @brief 一次评测的总体结果
 */
struct verdict {
    grader::status status = grader::status::WRONG_ANSWER;
    double score = 0;
    double max_score = 0;
    std::size_t passed = 0;
    std::size_t total = 0;
};

/**
 * @brief 返回给提交方的评测结果
 */
struct judge_result {
    std::string sub_id;
    std::string user_id;
    std::string prob_id;

    grader::verdict verdict;

    /**
     * @brief 按测试点顺序排列的结果
     */
    std::vector<test_case_result> results;

    /**
     * @brief 编译信息，没有编译步骤并且评测正常结束时为空
     */
    std::optional<compilation_info> compilation;

    /**
     * @brief 所有测试点中最长的运行时间，单位为秒
     */
    double time = 0;

    /**
     * @brief 所有测试点中最大的内存，单位为字节
     */
    int64_t memory = 0;

    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;

    /**
     * @brief 是否是该用户第一次通过该题
     */
    bool first_acceptance = false;
};

void to_json(nlohmann::json &j, const test_case_result &result);

void to_json(nlohmann::json &j, const compilation_info &info);

void to_json(nlohmann::json &j, const judge_result &result);

}  // namespace grader
