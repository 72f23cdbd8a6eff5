#pragma once

#include <future>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include "judge/language.hpp"
#include "judge/submission.hpp"
#include "server/submission_store.hpp"

namespace grader {

/**
 * @brief 记录哪些用户已经通过了哪些题目
 * 用于判断一次通过是否是该用户第一次通过该题，插入和查询在同一把锁下完成，
 * 同一个用户同时通过同一题的两个提交只会有一个被判为第一次通过
 */
struct acceptance_registry {
    /**
     * @brief 记录用户通过了题目
     * @return 若之前没有记录，返回 true
     */
    bool record(const std::string &user_id, const std::string &prob_id);

    bool contains(const std::string &user_id, const std::string &prob_id) const;

private:
    mutable std::mutex mut;
    std::set<std::pair<std::string, std::string>> accepted;
};

/**
 * @brief 评测一个提交的完整流程：编译、运行测试点、计算评测结果、报告结果
 *
 * 状态转移：PENDING -> COMPILING -> RUNNING -> 终止状态，只会单向转移，不会自动重试。
 * COMPILING 和 RUNNING 在进入该阶段之前通过 submission_store::update_status 发送，
 * 终止状态随评测结果通过 submission_store::report_result 发送。
 *
 * 每个提交编号同时只能有一个评测过程。评测目录 RUN_DIR/<提交编号>-<uuid>
 * 在评测结束时（无论结果如何）都会被删除。
 */
struct judging_orchestrator {
    /**
     * @param store 接收状态转移和评测结果
     * @param languages 已经注册好的语言，评测期间不能再修改
     */
    judging_orchestrator(server::submission_store &store, const language_registry &languages);

    /**
     * @brief 在当前线程评测一个提交
     * @return 评测结果，与发送给 submission_store 的结果相同
     * @throw configuration_error 语言不支持、题目不允许该语言、时间或内存限制不合法，
     *        此时不会启动任何进程，也不会通知 submission_store
     * @throw already_in_progress 该提交正在评测
     */
    judge_result submit(const submission &submit);

    /**
     * @brief 在新线程中评测一个提交
     * 参数检查和并发检查在当前线程同步完成，异常的含义与 submit 相同
     */
    std::future<judge_result> submit_async(const submission &submit);

    /**
     * @brief 该提交是否正在评测
     */
    bool in_flight(const std::string &sub_id) const;

    acceptance_registry &acceptances();

private:
    void admit(const submission &submit) const;
    void claim(const std::string &sub_id);
    void release(const std::string &sub_id);
    judge_result judge(const submission &submit);

    server::submission_store &store;
    const language_registry &languages;
    acceptance_registry accepted;

    mutable std::mutex mut;
    std::set<std::string> running;
};

}  // namespace grader
