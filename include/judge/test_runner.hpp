#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "judge/language.hpp"
#include "judge/submission.hpp"

namespace grader {

/**
 * @brief 规范化程序输出
 * 按行分割，去掉每行末尾的空白字符，删除空行，再以 '\n' 连接。
 * 行末空白、末尾换行以及空行不影响比较结果，行内空白的差异会导致不匹配。
 * 对已经规范化的字符串再次规范化不会改变结果。
 */
std::string normalize_output(const std::string &text);

/**
 * @brief 一个提交所有测试点的运行结果
 */
struct test_run {
    /**
     * @brief 编译失败时为真，此时没有运行任何测试点
     */
    bool build_failed = false;

    /**
     * @brief 编译信息，没有编译步骤时为空
     */
    std::optional<compilation_info> compilation;

    /**
     * @brief 按测试点顺序排列的结果
     */
    std::vector<test_case_result> results;
};

/**
 * @brief 在沙箱中运行一个提交的所有测试点
 * 每个测试点的输入数据写入 work_dir/input 中，运行结束后立即删除
 */
struct test_runner {
    /**
     * @param work_dir 本次评测的目录，沙箱的工作目录也创建在这里
     * @param workers 同时运行的测试点数量，为 1 时按顺序运行
     */
    explicit test_runner(const std::filesystem::path &work_dir, std::size_t workers = TEST_WORKERS);

    /**
     * @brief 在沙箱中执行编译命令
     * 编译器返回值非零、超时或者内存超限都视为编译失败
     * @param program 必须带有编译命令
     * @throw sandbox_error 无法启动编译器
     */
    compilation_info build(const prepared_program &program) const;

    /**
     * @brief 运行所有测试点
     * 如果 build 表示编译失败，直接返回，不运行任何测试点。
     * 单个测试点的失败不影响其他测试点，评测系统的内部错误会在已开始的测试点结束后抛出。
     * @param program 已准备好的程序
     * @param build 编译信息，没有编译步骤时为空
     * @param test_cases 测试点
     * @param time_limit 时间限制，单位为秒
     * @param memory_limit 内存限制，单位为字节
     * @throw sandbox_error, internal_error 评测系统内部错误
     */
    test_run run_all(const prepared_program &program,
                     const std::optional<compilation_info> &build,
                     const std::vector<test_case> &test_cases,
                     double time_limit,
                     int64_t memory_limit) const;

    /**
     * @brief 运行一个测试点并与标准输出比较
     * @param index 测试点在列表中的位置，用于生成输入文件名和缺省的测试点编号
     */
    test_case_result run_one(const prepared_program &program,
                             const test_case &tc,
                             std::size_t index,
                             double time_limit,
                             int64_t memory_limit) const;

private:
    std::filesystem::path work_dir;
    std::size_t workers;
};

}  // namespace grader
