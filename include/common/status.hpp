#pragma once

#include <string>

namespace grader {

/**
 * @brief 表示提交的评测状态
 * 状态只能单向转移：PENDING -> COMPILING -> RUNNING -> 终止状态
 * 终止状态之后不会再发生任何转移，评测系统也不会自动重试
 */
enum class status {
    /**
     * @brief 提交已被接受，还未开始编译
     */
    PENDING = 0,

    /**
     * @brief 评测系统正在编译程序
     * 对于解释型语言，这个状态会立即转移到 RUNNING
     */
    COMPILING = 1,

    /**
     * @brief 编译完成，测试点正在运行
     */
    RUNNING = 2,

    /**
     * @brief 所有测试点都通过，得到满分
     */
    ACCEPTED = 3,

    /**
     * @brief 没有任何测试点得分
     * 没有测试点的题目也会返回该结果
     */
    WRONG_ANSWER = 4,

    /**
     * @brief 部分测试点得分
     */
    PARTIAL_CORRECT = 5,

    /**
     * @brief 至少有一个测试点运行超时
     * 优先级高于其他所有的运行结果
     */
    TIME_LIMIT_EXCEEDED = 6,

    /**
     * @brief 至少有一个测试点内存超限（并且没有测试点超时）
     */
    MEMORY_LIMIT_EXCEEDED = 7,

    /**
     * @brief 至少有一个测试点以非零返回值退出或者被信号终止
     * 评测系统内部错误（无法创建目录、无法启动进程等）也会以该状态返回
     */
    RUNTIME_ERROR = 8,

    /**
     * @brief 选手程序无法通过编译
     */
    COMPILATION_ERROR = 9
};

/**
 * @brief 获得状态的展示名称，比如 "Time Limit Exceeded"
 */
const char *get_display_message(status);

/**
 * @brief 获得状态在结果报告中使用的名称，比如 "time-limit-exceeded"
 */
const char *get_wire_name(status);

/**
 * @brief 根据结果报告中使用的名称解析状态
 * @throw std::invalid_argument 名称不存在
 */
status parse_status(const std::string &name);

/**
 * @brief 状态是否为终止状态
 */
bool is_terminal(status);

}  // namespace grader
