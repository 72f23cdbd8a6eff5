#pragma once

#include <linux/filter.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <cstdint>
#include <string>
#include <vector>
#include "common/exceptions.hpp"

namespace grader::sandbox {

/**
 * @brief 子进程中需要设置的一项资源限制
 */
struct rlimit_entry {
    int resource;
    rlim_t cur, max;
};

/**
 * @brief 子进程在 exec 之前需要完成的全部设置
 * 所有内容都在 fork 之前由父进程准备好，子进程中只做系统调用，
 * 不分配内存也不加锁，因此可以在多线程的评测进程中安全地 fork。
 */
struct child_setup {
    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;

    /**
     * @brief 父进程完成 cgroup 设置之后向该管道写入一个字节，子进程读到后才继续
     */
    int start_fd = -1;

    /**
     * @brief 子进程设置失败或 exec 失败时，向该管道写入 child_failure
     */
    int error_fd = -1;

    const char *work_dir = nullptr;
    std::vector<rlimit_entry> limits;
    char **argv = nullptr;
    char **envp = nullptr;

    /**
     * @brief 已编译好的 seccomp BPF 程序，为 nullptr 时不加载
     */
    const struct sock_fprog *seccomp_prog = nullptr;
};

/**
 * @brief 子进程设置失败的阶段，用于在父进程中生成错误信息
 */
enum class child_stage : int {
    WAIT_START,
    SETSID,
    CHDIR,
    REDIRECT,
    SETRLIMIT,
    SECCOMP,
    EXEC
};

struct child_failure {
    child_stage stage;
    int err;
};

const char *describe_stage(child_stage stage);

/**
 * @brief 计算选手程序需要设置的资源限制
 * @param time_limit 时间限制，单位为秒，CPU 时间限制设为 ceil(time_limit) + 1 秒
 * @param memory_limit 地址空间限制，单位为字节，小于等于 0 表示不限制
 * @param file_limit 最多写入的文件大小，小于 0 表示不限制
 * @param nproc 最多同时存在的进程数，小于 0 表示不限制
 */
std::vector<rlimit_entry> make_rlimits(double time_limit, int64_t memory_limit, int64_t file_limit, int nproc);

/**
 * Runs in the forked child: applies restrictions and execs the command.
 * Never returns; on failure reports through setup.error_fd and exits with 127.
 */
[[noreturn]] void exec_child(const child_setup &setup) noexcept;

/**
 * @brief 禁止系统管理类系统调用的 seccomp 过滤器
 * 除 mount、ptrace、reboot、加载内核模块等调用外全部放行，被禁止的调用返回 EPERM。
 * setsid 和 setpgid 也被禁止，子进程在加载过滤器之前已经建立了自己的会话，
 * 选手程序无法再脱离这个进程组。
 *
 * 过滤器在构造时即编译为 BPF 程序，子进程中只需要调用 prctl 安装。
 */
struct seccomp_filter {
    seccomp_filter();

    seccomp_filter(const seccomp_filter &) = delete;
    seccomp_filter &operator=(const seccomp_filter &) = delete;

    const struct sock_fprog *program() const;

private:
    std::vector<struct sock_filter> instructions;
    struct sock_fprog prog;
};

/**
 * Error reported by libcgroup, the message carries the failed operation.
 */
struct cgroup_error : public sandbox_error {
    cgroup_error(const std::string &op, int ret);
};

/**
 * @brief 创建 cgroup 并设置内存限制
 * @param memory_limit 内存限制，单位为字节，小于等于 0 表示不限制
 */
void cgroup_create(const std::string &cgroup_name, int64_t memory_limit);

/**
 * Move process pid to the control group.
 */
void cgroup_attach(const std::string &cgroup_name, pid_t pid);

struct cgroup_usage {
    int64_t memory = 0;   // bytes
    double cpu_time = 0;  // seconds
    bool oom = false;
};

/**
 * @brief 读取 cgroup 统计的峰值内存、CPU 时间以及是否触发了 OOM
 */
cgroup_usage cgroup_summarize(const std::string &cgroup_name);

/**
 * Kill all processes in the control group.
 *
 * No child process may survive longer than the monitored process.
 */
void cgroup_kill(const std::string &cgroup_name);

void cgroup_delete(const std::string &cgroup_name);

}  // namespace grader::sandbox
