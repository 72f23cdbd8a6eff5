#pragma once

#include <vector>
#include "judge/submission.hpp"

namespace grader {

/**
 * @brief 根据所有测试点的结果计算总体评测结果
 * 编译失败时为 COMPILATION_ERROR。否则只要有一个测试点超时即为 TIME_LIMIT_EXCEEDED，
 * 其次是内存超限 MEMORY_LIMIT_EXCEEDED，再次是运行错误 RUNTIME_ERROR，
 * 与测试点的顺序无关。都没有发生时根据得分判断：
 * 0 分为 WRONG_ANSWER，满分为 ACCEPTED，其余为 PARTIAL_CORRECT。
 * 没有测试点时满分为 0，结果为 WRONG_ANSWER。
 */
verdict resolve_verdict(const std::vector<test_case_result> &results, bool build_failed);

}  // namespace grader
