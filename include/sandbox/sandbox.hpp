#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "config.hpp"

namespace grader::sandbox {

/**
 * @brief 需要在沙箱中执行的命令
 */
struct command {
    /**
     * @brief 命令行参数，argv[0] 按 PATH 查找
     */
    std::vector<std::string> argv;

    /**
     * @brief 额外传入的环境变量，子进程的环境变量只有 PATH 和这些变量
     */
    std::map<std::string, std::string> env;
};

/**
 * @brief 沙箱的运行选项，默认值来自 config.hpp 中的全局配置
 */
struct sandbox_options {
    /**
     * @brief 沙箱在此目录下为进程创建独立的工作目录
     */
    std::filesystem::path work_parent = RUN_DIR;

    /**
     * @brief 超过时间限制后额外等待的时间，单位为秒
     */
    double grace_period = GRACE_PERIOD;

    std::size_t output_limit = OUTPUT_LIMIT;
    std::size_t error_limit = ERROR_LIMIT;

    /**
     * @brief 是否通过 RLIMIT_AS 限制内存
     * JVM、Node.js 启动时会预留大量虚拟地址空间，这些语言不能使用地址空间限制
     */
    bool limit_address_space = true;

    int64_t file_limit = FILE_LIMIT;
    int process_limit = PROCESS_LIMIT;
    bool use_cgroup = USE_CGROUP;
    bool use_seccomp = USE_SECCOMP;

    /**
     * @brief 若为真，进程结束后不删除工作目录
     */
    bool keep_work_dir = DEBUG;
};

enum class outcome_kind {
    COMPLETED,
    TIMED_OUT,
    MEMORY_EXCEEDED,
    RUNTIME_ERROR  // 返回值非零或者被信号终止
};

const char *get_display_message(outcome_kind kind);

/**
 * @brief 一次进程运行的结果
 */
struct execution_outcome {
    outcome_kind kind = outcome_kind::COMPLETED;

    std::string output;
    std::string error;
    bool output_truncated = false;
    bool error_truncated = false;

    /**
     * @brief 墙上时间，单位为秒
     */
    double wall_time = 0;

    /**
     * @brief CPU 时间（用户态加内核态），单位为秒
     */
    double cpu_time = 0;

    /**
     * @brief 峰值内存，单位为字节，无法统计时为 0
     */
    int64_t memory = 0;

    /**
     * @brief 进程的返回值，被信号终止时为 128 + 信号
     */
    int exitcode = 0;

    /**
     * @brief 终止进程的信号，正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 进程是否因为超过硬时间限制被沙箱强制终止
     */
    bool killed = false;

    /**
     * @brief 生成描述运行结果的文字，如 "Runtime error: exit code 3"
     */
    std::string describe() const;
};

/**
 * @brief 在沙箱中运行一个进程
 * 进程运行在独立的工作目录、独立的进程组中，标准输入来自 stdin_path，
 * 标准输出和标准错误输出被截断后保存在结果中。
 * 该函数是线程安全的，不修改全局的信号处理函数和计时器。
 *
 * @param cmd 需要运行的命令
 * @param stdin_path 标准输入文件，为空时使用 /dev/null
 * @param time_limit 时间限制，单位为秒，运行时间超过该值判为超时，
 *        超过 time_limit + grace_period 时进程树将被强制终止
 * @param memory_limit 内存限制，单位为字节，小于等于 0 表示不限制
 * @param opts 运行选项
 * @return 运行结果，选手程序的任何异常行为都通过返回值表示
 * @throw sandbox_error 无法创建工作目录、管道，fork 失败，exec 失败，子进程无法设置资源限制
 */
execution_outcome run(const command &cmd,
                      const std::filesystem::path &stdin_path,
                      double time_limit,
                      int64_t memory_limit,
                      const sandbox_options &opts = sandbox_options());

}  // namespace grader::sandbox
