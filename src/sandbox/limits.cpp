#include "sandbox/limits.hpp"
#include <errno.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <libcgroup.h>
#include <linux/seccomp.h>
#include <math.h>
#include <seccomp.h>
#include <signal.h>
#include <string.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <unistd.h>
#include <fstream>
#include <memory>
#include <mutex>
#include "common/defer.hpp"

namespace grader::sandbox {
using namespace std;

const char *describe_stage(child_stage stage) {
    switch (stage) {
        case child_stage::WAIT_START: return "waiting for the watchdog";
        case child_stage::SETSID: return "unable to setsid";
        case child_stage::CHDIR: return "unable to chdir to working directory";
        case child_stage::REDIRECT: return "redirecting standard streams";
        case child_stage::SETRLIMIT: return "setrlimit";
        case child_stage::SECCOMP: return "loading seccomp filter";
        case child_stage::EXEC: return "unable to start command";
    }
    return "unknown stage";
}

vector<rlimit_entry> make_rlimits(double time_limit, int64_t memory_limit, int64_t file_limit, int nproc) {
    vector<rlimit_entry> limits;

    /* At the soft limit the kernel sends SIGXCPU, at the hard limit SIGKILL.
       SIGXCPU is not caught by default and gives a reliable way to detect
       that the CPU-time limit was reached. The wall clock watchdog fires
       first in normal cases. */
    rlim_t cputime_limit = (rlim_t)ceil(time_limit) + 1;
    limits.push_back({RLIMIT_CPU, cputime_limit, cputime_limit + 1});

    limits.push_back({RLIMIT_CORE, 0, 0});

    if (memory_limit > 0)
        limits.push_back({RLIMIT_AS, (rlim_t)memory_limit, (rlim_t)memory_limit});

    // 递归较深的程序需要较大的栈空间，将软限制提升到硬限制
    struct rlimit stack;
    if (getrlimit(RLIMIT_STACK, &stack) != 0)
        throw sandbox_error(errno, "getrlimit(RLIMIT_STACK)");
    limits.push_back({RLIMIT_STACK, stack.rlim_max, stack.rlim_max});

    if (file_limit >= 0)
        limits.push_back({RLIMIT_FSIZE, (rlim_t)file_limit, (rlim_t)file_limit + 1});
    if (nproc >= 0)
        limits.push_back({RLIMIT_NPROC, (rlim_t)nproc, (rlim_t)nproc});
    return limits;
}

[[noreturn]] static void fail(const child_setup &setup, child_stage stage, int err) noexcept {
    child_failure failure{stage, err};
    // the watchdog treats a short read as a failed exec, nothing else to do here
    if (write(setup.error_fd, &failure, sizeof(failure)) < 0) _exit(126);
    _exit(127);
}

static void redirect(const child_setup &setup, int from, int to) noexcept {
    if (from < 0) return;
    if (dup2(from, to) < 0) fail(setup, child_stage::REDIRECT, errno);
}

[[noreturn]] void exec_child(const child_setup &setup) noexcept {
    char token;
    ssize_t n;
    do {
        n = read(setup.start_fd, &token, 1);
    } while (n < 0 && errno == EINTR);
    if (n != 1) fail(setup, child_stage::WAIT_START, n < 0 ? errno : ECANCELED);

    // run the command in a separate process group,
    // so the command and all its child processes can be killed
    // off with one signal
    if (setsid() == -1) fail(setup, child_stage::SETSID, errno);

    if (setup.work_dir && chdir(setup.work_dir) != 0) fail(setup, child_stage::CHDIR, errno);

    redirect(setup, setup.stdin_fd, STDIN_FILENO);
    redirect(setup, setup.stdout_fd, STDOUT_FILENO);
    redirect(setup, setup.stderr_fd, STDERR_FILENO);

    for (const rlimit_entry &entry : setup.limits) {
        struct rlimit lim;
        lim.rlim_cur = entry.cur;
        lim.rlim_max = entry.max;
        if (setrlimit(entry.resource, &lim) != 0) fail(setup, child_stage::SETRLIMIT, errno);
    }

    // must come after setsid, the filter denies it
    if (setup.seccomp_prog) {
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) fail(setup, child_stage::SECCOMP, errno);
        if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, setup.seccomp_prog) != 0) fail(setup, child_stage::SECCOMP, errno);
    }

    execvpe(setup.argv[0], setup.argv, setup.envp);
    fail(setup, child_stage::EXEC, errno);
}

static const char *denied_syscalls[] = {
    "mount", "umount", "umount2", "pivot_root", "chroot",
    "ptrace", "process_vm_readv", "process_vm_writev",
    "reboot", "kexec_load", "kexec_file_load",
    "init_module", "finit_module", "delete_module",
    "swapon", "swapoff", "acct",
    "sethostname", "setdomainname",
    "settimeofday", "clock_settime", "adjtimex",
    "unshare", "setns", "setsid", "setpgid",
    "bpf", "perf_event_open", "quotactl"};

seccomp_filter::seccomp_filter() {
    scmp_filter_ctx filter = seccomp_init(SCMP_ACT_ALLOW);
    if (!filter) throw sandbox_error("seccomp_init failed");
    defer { seccomp_release(filter); };

    for (const char *name : denied_syscalls) {
        int nr = seccomp_syscall_resolve_name(name);
        if (nr == __NR_SCMP_ERROR) {
            DLOG(INFO) << "syscall " << name << " not available on this architecture";
            continue;
        }
        int ret = seccomp_rule_add(filter, SCMP_ACT_ERRNO(EPERM), nr, 0);
        if (ret != 0) throw sandbox_error(-ret, fmt::format("seccomp_rule_add({})", name));
    }

    // seccomp_load allocates memory, so the program is exported here and
    // installed in the forked child with a single prctl
    int fd = memfd_create("grader-seccomp", MFD_CLOEXEC);
    if (fd < 0) throw sandbox_error(errno, "memfd_create");
    defer { close(fd); };

    int ret = seccomp_export_bpf(filter, fd);
    if (ret != 0) throw sandbox_error(-ret, "seccomp_export_bpf");

    off_t size = lseek(fd, 0, SEEK_END);
    if (size < 0) throw sandbox_error(errno, "exporting seccomp filter");
    if (size == 0 || size % sizeof(struct sock_filter) != 0)
        throw sandbox_error(fmt::format("malformed seccomp program of {} bytes", size));
    instructions.resize(size / sizeof(struct sock_filter));
    if (pread(fd, instructions.data(), size, 0) != size)
        throw sandbox_error(errno, "reading seccomp filter");

    prog.len = (unsigned short)instructions.size();
    prog.filter = instructions.data();
}

const struct sock_fprog *seccomp_filter::program() const {
    return &prog;
}

cgroup_error::cgroup_error(const string &op, int ret)
    : sandbox_error(fmt::format("{}: {}", op, cgroup_strerror(ret))) {}

namespace {

struct cgroup_deleter {
    void operator()(struct cgroup *cg) const { cgroup_free(&cg); }
};

using cgroup_ptr = unique_ptr<struct cgroup, cgroup_deleter>;

void check(int ret, const string &op) {
    if (ret != 0) throw cgroup_error(op, ret);
}

/**
 * @brief 构造 cgroup 的描述，不会修改内核中的 cgroup
 */
cgroup_ptr open_cgroup(const string &cgroup_name) {
    static once_flag initialized;
    static int init_result = 0;
    call_once(initialized, [] { init_result = cgroup_init(); });
    check(init_result, "cgroup_init");

    cgroup_ptr cg(cgroup_new_cgroup(cgroup_name.c_str()));
    if (!cg) throw cgroup_error(fmt::format("cgroup_new_cgroup({})", cgroup_name), ECGFAIL);
    return cg;
}

/**
 * @brief 从内核中读入 cgroup 的当前状态
 */
cgroup_ptr load_cgroup(const string &cgroup_name) {
    cgroup_ptr cg = open_cgroup(cgroup_name);
    check(cgroup_get_cgroup(cg.get()), fmt::format("cgroup_get_cgroup({})", cgroup_name));
    return cg;
}

struct cgroup_controller *add_controller(struct cgroup *cg, const char *name) {
    struct cgroup_controller *ctrl = cgroup_add_controller(cg, name);
    if (!ctrl) throw cgroup_error(fmt::format("cgroup_add_controller({})", name), ECGFAIL);
    return ctrl;
}

int64_t read_counter(struct cgroup *cg, const char *controller, const char *key) {
    struct cgroup_controller *ctrl = cgroup_get_controller(cg, controller);
    if (!ctrl) throw cgroup_error(fmt::format("cgroup_get_controller({})", controller), ECGFAIL);
    int64_t value = 0;
    check(cgroup_get_value_int64(ctrl, key, &value), key);
    return value;
}

}  // namespace

void cgroup_create(const string &cgroup_name, int64_t memory_limit) {
    cgroup_ptr cg = open_cgroup(cgroup_name);

    struct cgroup_controller *memory = add_controller(cg.get(), "memory");
    if (memory_limit > 0) {
        // 将 RAM 和 RAM+交换 的大小限制设为一样可以强制不发生交换
        check(cgroup_add_value_int64(memory, "memory.limit_in_bytes", memory_limit), "memory.limit_in_bytes");
        check(cgroup_add_value_int64(memory, "memory.memsw.limit_in_bytes", memory_limit), "memory.memsw.limit_in_bytes");
    }
    add_controller(cg.get(), "cpuacct");

    check(cgroup_create_cgroup(cg.get(), 1), fmt::format("cgroup_create_cgroup({})", cgroup_name));
}

void cgroup_attach(const string &cgroup_name, pid_t pid) {
    cgroup_ptr cg = load_cgroup(cgroup_name);
    check(cgroup_attach_task_pid(cg.get(), pid), fmt::format("cgroup_attach_task_pid({})", pid));
}

cgroup_usage cgroup_summarize(const string &cgroup_name) {
    cgroup_ptr cg = load_cgroup(cgroup_name);

    cgroup_usage usage;
    usage.memory = read_counter(cg.get(), "memory", "memory.memsw.max_usage_in_bytes");
    usage.cpu_time = (double)read_counter(cg.get(), "cpuacct", "cpuacct.usage") / 1e9;  // in ns

    // oom_control 不是数值，libcgroup 无法解析，直接读取
    ifstream fin("/sys/fs/cgroup/memory" + cgroup_name + "/memory.oom_control");
    string key;
    int64_t value;
    while (fin >> key >> value)
        if (key == "oom_kill") usage.oom = value > 0;
    return usage;
}

void cgroup_kill(const string &cgroup_name) {
    // 进程可能在遍历期间继续 fork，反复遍历直到 cgroup 中没有进程
    for (int round = 0; round < 10; ++round) {
        void *handle = nullptr;
        pid_t pid;
        int killed = 0;
        int ret = cgroup_get_task_begin(cgroup_name.c_str(), "memory", &handle, &pid);
        while (ret == 0) {
            if (kill(pid, SIGKILL) != 0 && errno != ESRCH)
                LOG(ERROR) << "unable to kill process " << pid << " in cgroup " << cgroup_name << ": " << strerror(errno);
            ++killed;
            ret = cgroup_get_task_next(&handle, &pid);
        }
        cgroup_get_task_end(&handle);
        if (ret != ECGEOF) check(ret, fmt::format("cgroup_get_task_begin({})", cgroup_name));
        if (killed == 0) return;
    }
    LOG(WARNING) << "cgroup " << cgroup_name << " still has processes after repeated kills";
}

void cgroup_delete(const string &cgroup_name) {
    cgroup_ptr cg = open_cgroup(cgroup_name);
    add_controller(cg.get(), "memory");
    add_controller(cg.get(), "cpuacct");
    // 残留的进程被移入上一层 cgroup
    check(cgroup_delete_cgroup_ext(cg.get(), CGFLAG_DELETE_IGNORE_MIGRATION | CGFLAG_DELETE_RECURSIVE),
          fmt::format("cgroup_delete_cgroup({})", cgroup_name));
}

}  // namespace grader::sandbox
