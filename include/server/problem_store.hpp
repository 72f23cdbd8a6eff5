#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "judge/submission.hpp"

namespace grader::server {

/**
 * @brief 题目的评测配置
 */
struct problem {
    std::string prob_id;

    /**
     * @brief 时间限制，单位为秒
     */
    double time_limit = 1;

    /**
     * @brief 内存限制，单位为字节
     */
    int64_t memory_limit = 256LL << 20;

    std::vector<test_case> test_cases;

    /**
     * @brief 允许使用的语言，为空表示不限制
     */
    std::vector<std::string> allowed_languages;
};

/**
 * @brief 表示保存题目和测试数据的外部系统
 */
struct problem_store {
    virtual ~problem_store();

    /**
     * @brief 获取题目
     * @throw configuration_error 题目不存在或者格式不正确
     */
    virtual problem get_problem(const std::string &prob_id) = 0;
};

}  // namespace grader::server
