#pragma once

#include <string>
#include "common/status.hpp"
#include "judge/submission.hpp"

namespace grader::server {

/**
 * @brief 表示保存提交记录的外部系统
 * 评测过程中的每次状态转移以及最终的评测结果都会发送给 submission_store。
 * 多个提交可能同时在评测，实现必须是线程安全的。
 */
struct submission_store {
    virtual ~submission_store();

    /**
     * @brief 更新提交的评测状态
     * 评测系统只会发送 COMPILING 和 RUNNING，终止状态通过 report_result 发送
     * @param sub_id 提交编号
     * @param st 新的状态
     */
    virtual void update_status(const std::string &sub_id, status st) = 0;

    /**
     * @brief 发送最终的评测结果，结果中带有终止状态
     */
    virtual void report_result(const judge_result &result) = 0;
};

}  // namespace grader::server
