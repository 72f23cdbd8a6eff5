#pragma once

#include <atomic>
#include <filesystem>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "judge/orchestrator.hpp"
#include "server/problem_store.hpp"

/**
 * 命令行评测相关函数
 * 主线程将所有提交文件放入 submission_queue 之后关闭队列，
 * 每个 worker 从队列中取出提交文件，读取题目配置，交给 judging_orchestrator 评测。
 * 队列为空时 worker 退出。
 */
namespace grader {

/**
 * @brief worker 的统计信息，多个 worker 共享
 */
struct worker_stats {
    std::atomic<std::size_t> judged{0};

    /**
     * @brief 无法评测的提交数量，比如提交文件格式错误、题目不存在、语言不支持
     */
    std::atomic<std::size_t> rejected{0};
};

/**
 * @brief 停止所有的 worker
 * 调用该函数后，worker 不再从队列中获取新提交，当前提交评测完成后退出。
 */
void stop_workers();

/**
 * @brief 启动评测 worker 线程
 * @param worker_id worker 编号，用于日志
 * @param submission_queue 提交文件的队列
 * @param orchestrator 评测提交
 * @param problems 读取提交对应的题目
 * @param stats 统计信息
 * @return 产生的线程
 */
std::thread start_worker(std::size_t worker_id,
                         concurrent_queue<std::filesystem::path> &submission_queue,
                         judging_orchestrator &orchestrator,
                         server::problem_store &problems,
                         worker_stats &stats);

}  // namespace grader
