#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include "server/problem_store.hpp"
#include "server/submission_store.hpp"

namespace grader::server {

/**
 * @brief 从本地目录读取题目，题目 id 为 prob 的题目保存在 dir/prob.json 中
 * 文件格式：
 * {
 *     "timeLimit": 1,            // 时间限制，单位为秒，必须提供
 *     "memoryLimit": 256,        // 内存限制，单位为 MB，必须提供
 *     "allowedLanguages": ["cpp", "python"],
 *     "testCases": [
 *         {"id": "1", "input": "1 2\n", "output": "3\n", "points": 10, "isHidden": false}
 *     ]
 * }
 */
struct local_problem_store : public problem_store {
    explicit local_problem_store(const std::filesystem::path &dir);

    problem get_problem(const std::string &prob_id) override;

private:
    std::filesystem::path dir;
};

/**
 * @brief 从 JSON 解析题目，缺省值与 local_problem_store 相同
 * @throw configuration_error 格式不正确
 */
problem parse_problem(const std::string &prob_id, const nlohmann::json &j);

/**
 * @brief 将评测状态和评测结果写入本地目录，提交 sub 的结果保存在 dir/sub.json 中
 * 状态转移时写入 {"submissionId": ..., "status": ..., "history": [...]}，
 * 评测结束后写入完整的评测结果，并保留状态转移的历史
 */
struct local_submission_store : public submission_store {
    explicit local_submission_store(const std::filesystem::path &dir);

    void update_status(const std::string &sub_id, status st) override;

    void report_result(const judge_result &result) override;

private:
    std::filesystem::path dir;
    std::mutex mut;
    std::map<std::string, nlohmann::json> history;
};

/**
 * @brief 读取本地的提交文件，并从题目中补充时间限制、内存限制和测试点
 * 文件格式：
 * {"id": "s1", "userId": "u1", "problemId": "p1", "language": "cpp", "code": "..."}
 * @throw configuration_error 文件无法读取、格式不正确或者题目不存在
 */
submission load_submission(const std::filesystem::path &path, problem_store &problems);

}  // namespace grader::server
