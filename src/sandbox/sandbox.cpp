#include "sandbox/sandbox.hpp"
#include <errno.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <algorithm>
#include <memory>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "sandbox/limits.hpp"

namespace grader::sandbox {
using namespace std;
namespace fs = std::filesystem;

const struct timespec killdelay = {0, 100000000L};  // 0.1s

/**
 * @brief 子进程被回收后继续读取管道的最长时间，单位为秒
 */
const double drain_timeout = 0.5;

const int BUF_SIZE = 65536;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

/**
 * @brief 运行失败时标准错误输出中常见的内存不足提示
 */
static const char *oom_markers[] = {
    "MemoryError",
    "OutOfMemoryError",
    "std::bad_alloc",
    "JavaScript heap out of memory"};

const char *get_display_message(outcome_kind kind) {
    switch (kind) {
        case outcome_kind::COMPLETED: return "Completed";
        case outcome_kind::TIMED_OUT: return "Time limit exceeded";
        case outcome_kind::MEMORY_EXCEEDED: return "Memory limit exceeded";
        case outcome_kind::RUNTIME_ERROR: return "Runtime error";
    }
    return "Unknown";
}

string execution_outcome::describe() const {
    switch (kind) {
        case outcome_kind::TIMED_OUT:
            return fmt::format("{} ({:.3f}s)", get_display_message(kind), wall_time);
        case outcome_kind::RUNTIME_ERROR:
            if (signal != 0)
                return fmt::format("{}: killed by signal {} ({})", get_display_message(kind), signal, strsignal(signal));
            else
                return fmt::format("{}: exit code {}", get_display_message(kind), exitcode);
        default:
            return get_display_message(kind);
    }
}

/**
 * @brief 文件描述符，析构时关闭
 */
struct file_descriptor {
    int fd = -1;

    file_descriptor() = default;
    explicit file_descriptor(int fd) : fd(fd) {}
    file_descriptor(const file_descriptor &) = delete;
    file_descriptor &operator=(const file_descriptor &) = delete;
    ~file_descriptor() { close(); }

    void close() noexcept {
        if (fd >= 0 && ::close(fd) != 0)
            LOG(WARNING) << "closing fd " << fd << ": " << strerror(errno);
        fd = -1;
    }
};

static void make_pipe(file_descriptor fds[2], const char *name) {
    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) != 0)
        throw sandbox_error(errno, fmt::format("creating pipe for {}", name));
    fds[PIPE_OUT].fd = pipefd[0];
    fds[PIPE_IN].fd = pipefd[1];
}

/**
 * @brief 从子进程的输出管道中读取数据，超过 limit 的部分被丢弃但仍计入总量
 */
struct stream_pump {
    file_descriptor fd;
    string *buffer;
    size_t limit;
    size_t data_read = 0;

    bool open() const { return fd.fd >= 0; }

    bool truncated() const { return data_read > buffer->size(); }

    void pump() {
        char buf[BUF_SIZE];
        ssize_t nread = read(fd.fd, buf, BUF_SIZE);
        if (nread == -1) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return;
            throw sandbox_error(errno, "copying data from child");
        }
        if (nread == 0) {
            // EOF detected
            fd.close();
            return;
        }
        if (buffer->size() < limit)
            buffer->append(buf, min((size_t)nread, limit - buffer->size()));
        data_read += nread;
    }
};

/**
 * @brief 等待子进程的输出，最多等待 timeout_ms 毫秒
 * @return 所有管道都已关闭时返回 -1，超时返回 0，否则返回大于 0 的值
 */
static int pump_pipes(stream_pump *streams[], size_t count, int timeout_ms) {
    pollfd fds[2];
    stream_pump *targets[2];
    nfds_t nfds = 0;
    for (size_t i = 0; i < count; ++i) {
        if (streams[i]->open()) {
            fds[nfds].fd = streams[i]->fd.fd;
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            targets[nfds++] = streams[i];
        }
    }
    if (nfds == 0) return -1;

    int r = poll(fds, nfds, timeout_ms);
    if (r == -1) {
        if (errno == EINTR) return 1;
        throw sandbox_error(errno, "waiting for child data");
    }
    for (nfds_t i = 0; i < nfds; ++i)
        if (fds[i].revents & (POLLIN | POLLHUP | POLLERR))
            targets[i]->pump();
    return r;
}

/**
 * @param leader_alive 子进程尚未被回收，此时子进程可能还没有调用 setsid
 */
static void kill_process_group(pid_t pid, int sig, bool leader_alive = true) {
    if (kill(-pid, sig) == 0) return;
    if (errno == ESRCH && leader_alive && kill(pid, sig) == 0) return;
    if (errno != ESRCH)
        LOG(ERROR) << fmt::format("sending signal {} to process group {}: {}", sig, pid, strerror(errno));
}

/**
 * First try to kill graciously, then hard.
 */
static void terminate(pid_t pid) {
    LOG(INFO) << "sending SIGTERM to " << pid;
    kill_process_group(pid, SIGTERM);

    /* Prefer nanosleep over sleep because of higher resolution and
       it does not interfere with signals. */
    nanosleep(&killdelay, nullptr);

    LOG(INFO) << "sending SIGKILL to " << pid;
    kill_process_group(pid, SIGKILL);
}

static void reap(pid_t pid, int &status, struct rusage &usage) {
    while (wait4(pid, &status, 0, &usage) < 0) {
        if (errno != EINTR) throw sandbox_error(errno, "waiting on child");
    }
}

static outcome_kind classify(const execution_outcome &outcome, double time_limit, int64_t memory_limit, bool address_space_limited, bool oom) {
    if (outcome.killed || outcome.signal == SIGXCPU ||
        outcome.wall_time > time_limit || outcome.cpu_time > time_limit)
        return outcome_kind::TIMED_OUT;

    if (oom || (memory_limit > 0 && outcome.memory > memory_limit))
        return outcome_kind::MEMORY_EXCEEDED;

    if (outcome.exitcode == 0 && outcome.signal == 0)
        return outcome_kind::COMPLETED;

    // 没有由沙箱发出的 SIGKILL 一般来自内核的 OOM killer
    if (outcome.signal == SIGKILL)
        return outcome_kind::MEMORY_EXCEEDED;

    // 地址空间用尽时分配失败的程序通常会 abort
    if (address_space_limited && (outcome.signal == SIGABRT || outcome.exitcode == 128 + SIGABRT))
        return outcome_kind::MEMORY_EXCEEDED;

    for (const char *marker : oom_markers)
        if (outcome.error.find(marker) != string::npos)
            return outcome_kind::MEMORY_EXCEEDED;

    return outcome_kind::RUNTIME_ERROR;
}

execution_outcome run(const command &cmd,
                      const fs::path &stdin_path,
                      double time_limit,
                      int64_t memory_limit,
                      const sandbox_options &opts) {
    if (cmd.argv.empty()) throw sandbox_error("empty command");

    execution_outcome outcome;

    scoped_directory work_dir;
    try {
        work_dir = scoped_directory(opts.work_parent, "sandbox", opts.keep_work_dir);
    } catch (internal_error &e) {
        throw sandbox_error(e.what());
    }
    string work_dir_str = work_dir.path().string();

    // 子进程中不能分配内存，argv 和环境变量在 fork 之前准备好
    map<string, string> env = cmd.env;
    env.emplace("PATH", get_env("PATH", "/usr/local/bin:/usr/bin:/bin"));
    vector<string> env_strings;
    for (auto &[key, value] : env) env_strings.push_back(key + "=" + value);

    vector<char *> argv, envp;
    for (auto &arg : cmd.argv) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    for (auto &entry : env_strings) envp.push_back(const_cast<char *>(entry.c_str()));
    envp.push_back(nullptr);

    string stdin_file = stdin_path.empty() ? "/dev/null" : stdin_path.string();
    file_descriptor stdin_fd(open(stdin_file.c_str(), O_RDONLY | O_CLOEXEC));
    if (stdin_fd.fd < 0) throw sandbox_error(errno, fmt::format("opening file '{}'", stdin_file));

    file_descriptor out_pipe[2], err_pipe[2], start_pipe[2], error_pipe[2];
    make_pipe(out_pipe, "stdout");
    make_pipe(err_pipe, "stderr");
    make_pipe(start_pipe, "start");
    make_pipe(error_pipe, "error");

    unique_ptr<seccomp_filter> filter;
    if (opts.use_seccomp) filter = make_unique<seccomp_filter>();

    bool address_space_limited = opts.limit_address_space && memory_limit > 0;

    child_setup setup;
    setup.stdin_fd = stdin_fd.fd;
    setup.stdout_fd = out_pipe[PIPE_IN].fd;
    setup.stderr_fd = err_pipe[PIPE_IN].fd;
    setup.start_fd = start_pipe[PIPE_OUT].fd;
    setup.error_fd = error_pipe[PIPE_IN].fd;
    setup.work_dir = work_dir_str.c_str();
    setup.limits = make_rlimits(time_limit, address_space_limited ? memory_limit : -1, opts.file_limit, opts.process_limit);
    setup.argv = argv.data();
    setup.envp = envp.data();
    setup.seccomp_prog = filter ? filter->program() : nullptr;

    string cgroup_name;
    if (opts.use_cgroup) {
        cgroup_name = fmt::format("/grader/{}", random_uuid());
        cgroup_create(cgroup_name, memory_limit);
    }
    defer {
        if (cgroup_name.empty()) return;
        try {
            cgroup_delete(cgroup_name);
        } catch (cgroup_error &e) {
            LOG(ERROR) << "unable to delete cgroup " << cgroup_name << ": " << e.what();
        }
    };

    elapsed_time timer;
    pid_t pid = fork();
    if (pid < 0) throw sandbox_error(errno, "unable to fork");
    if (pid == 0) exec_child(setup);

    /* Close unused file descriptors */
    stdin_fd.close();
    out_pipe[PIPE_IN].close();
    err_pipe[PIPE_IN].close();
    start_pipe[PIPE_OUT].close();
    error_pipe[PIPE_IN].close();

    bool reaped = false;
    int status = 0;
    struct rusage usage = {};
    defer {
        if (reaped) return;
        // 异常退出时确保子进程被杀死并回收
        kill_process_group(pid, SIGKILL);
        while (wait4(pid, &status, 0, &usage) < 0 && errno == EINTR) {}
    };

    if (opts.use_cgroup) cgroup_attach(cgroup_name, pid);

    if (write(start_pipe[PIPE_IN].fd, "x", 1) != 1)
        throw sandbox_error(errno, "starting child");
    start_pipe[PIPE_IN].close();

    {
        // exec 成功时管道因 O_CLOEXEC 被关闭，读到 EOF
        child_failure failure;
        ssize_t n;
        do {
            n = read(error_pipe[PIPE_OUT].fd, &failure, sizeof(failure));
        } while (n < 0 && errno == EINTR);
        if (n < 0) throw sandbox_error(errno, "reading child status");
        if (n > 0) {
            reap(pid, status, usage);
            reaped = true;
            if (n != sizeof(failure))
                throw sandbox_error(fmt::format("unable to start command {}", cmd.argv[0]));
            throw sandbox_error(failure.err, fmt::format("{} {}", describe_stage(failure.stage), cmd.argv[0]));
        }
    }

    stream_pump out_stream{{}, &outcome.output, opts.output_limit};
    stream_pump err_stream{{}, &outcome.error, opts.error_limit};
    swap(out_stream.fd.fd, out_pipe[PIPE_OUT].fd);
    swap(err_stream.fd.fd, err_pipe[PIPE_OUT].fd);
    for (stream_pump *stream : {&out_stream, &err_stream}) {
        int flags = fcntl(stream->fd.fd, F_GETFL);
        if (flags == -1 || fcntl(stream->fd.fd, F_SETFL, flags | O_NONBLOCK) == -1)
            throw sandbox_error(errno, "fcntl, setting flags");
    }
    stream_pump *streams[] = {&out_stream, &err_stream};

    double hard_limit = time_limit + opts.grace_period;
    while (!reaped) {
        pid_t r = wait4(pid, &status, WNOHANG, &usage);
        if (r == pid) {
            reaped = true;
            break;
        }
        if (r < 0 && errno != EINTR) throw sandbox_error(errno, "waiting on child");

        double remaining = hard_limit - timer.seconds();
        if (remaining <= 0) {
            LOG(WARNING) << fmt::format("timelimit exceeded (hard wall time {:.3f}s): aborting command {}", hard_limit, cmd.argv[0]);
            outcome.killed = true;
            terminate(pid);
            if (opts.use_cgroup) cgroup_kill(cgroup_name);
            reap(pid, status, usage);
            reaped = true;
            break;
        }

        int timeout_ms = clamp((int)(remaining * 1000) + 1, 1, 20);
        if (pump_pipes(streams, 2, timeout_ms) < 0) {
            struct timespec idle = {0, 2000000L};  // 2ms
            nanosleep(&idle, nullptr);
        }
    }
    outcome.wall_time = timer.seconds();

    // so our timing is correct: no child processes can survive longer than
    // our monitored process.
    kill_process_group(pid, SIGKILL, false);
    if (opts.use_cgroup) cgroup_kill(cgroup_name);

    // 读取管道中剩余的数据，脱离了进程组的进程可能一直持有管道并不断写入
    elapsed_time drain;
    int pumped = 1;
    while (pumped > 0 && drain.seconds() < drain_timeout)
        pumped = pump_pipes(streams, 2, 50);
    if (pumped >= 0)
        LOG(WARNING) << "output pipes of " << cmd.argv[0] << " are still held open, stop reading";

    if (WIFEXITED(status)) {
        outcome.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        // In linux, exitcode is no larger than 127.
        outcome.signal = WTERMSIG(status);
        outcome.exitcode = outcome.signal + 128;
    } else {
        throw sandbox_error(fmt::format("unknown status: {:x}", status));
    }

    outcome.cpu_time = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec * 1e-6 +
                       usage.ru_stime.tv_sec + usage.ru_stime.tv_usec * 1e-6;
    outcome.memory = (int64_t)usage.ru_maxrss * 1024;  // ru_maxrss is in kB

    bool oom = false;
    if (opts.use_cgroup) {
        cgroup_usage summary = cgroup_summarize(cgroup_name);
        outcome.memory = summary.memory;
        outcome.cpu_time = summary.cpu_time;
        oom = summary.oom;
    }

    outcome.output_truncated = out_stream.truncated();
    outcome.error_truncated = err_stream.truncated();
    if (outcome.output_truncated)
        LOG(INFO) << "stdout of " << cmd.argv[0] << " truncated, " << out_stream.data_read << " bytes written";

    outcome.kind = classify(outcome, time_limit, memory_limit, address_space_limited, oom);

    LOG(INFO) << fmt::format("{}: {}, real {:.3f}s, cpu {:.3f}s, memory {}kB, exitcode {}",
                             cmd.argv[0], get_display_message(outcome.kind),
                             outcome.wall_time, outcome.cpu_time, outcome.memory / 1024, outcome.exitcode);
    return outcome;
}

}  // namespace grader::sandbox
