#pragma once

#include <filesystem>
#include <string>
#include "judge/language.hpp"

namespace grader {

/**
 * @brief 设置测试使用的全局配置
 * 评测目录为 /tmp/grader-test/run，设置环境变量 DEBUG 可以保留评测目录
 */
void setup_test_environment();

/**
 * @brief PATH 中是否存在该程序，用于跳过依赖编译器的测试
 */
bool has_program(const std::string &name);

/**
 * @brief 用 sh 解释执行源代码的语言，标识为 sh
 */
language shell_language();

/**
 * @brief 用 sh -n 检查语法作为编译步骤的语言，标识为 checked-sh
 */
language checked_shell_language();

/**
 * @brief 目录中名称以 prefix 开头的文件数量
 */
std::size_t count_entries(const std::filesystem::path &dir, const std::string &prefix = "");

}  // namespace grader
