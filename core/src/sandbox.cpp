#include "capsule/sandbox.h"

#if defined(__linux__) && (defined(__x86_64__) || defined(__aarch64__))

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/syscall.h>

#if defined(__x86_64__)
  #define CAPSULE_AUDIT_ARCH AUDIT_ARCH_X86_64
#else
  #define CAPSULE_AUDIT_ARCH AUDIT_ARCH_AARCH64
#endif

namespace capsule {

static sock_filter bpf_stmt(unsigned code, uint32_t k) {
    return sock_filter{static_cast<uint16_t>(code), 0, 0, k};
}

static sock_filter bpf_jump(unsigned code, uint32_t k, size_t jt, size_t jf) {
    return sock_filter{static_cast<uint16_t>(code), static_cast<uint8_t>(jt), static_cast<uint8_t>(jf), k};
}

static std::vector<unsigned int> allowed_syscalls() {
    std::vector<unsigned int> nr = {
        // memory
        SYS_brk, SYS_mmap, SYS_munmap, SYS_mremap, SYS_madvise,
        // files (scratch dir reads, stdout/stderr)
        SYS_read, SYS_write, SYS_readv, SYS_writev, SYS_pread64,
        SYS_openat, SYS_close, SYS_lseek, SYS_fstat, SYS_newfstatat,
        SYS_fcntl, SYS_ioctl, SYS_getcwd, SYS_readlinkat, SYS_faccessat,
        SYS_getdents64,
        // signals and the deadline timer
        SYS_rt_sigaction, SYS_rt_sigprocmask, SYS_rt_sigreturn, SYS_sigaltstack,
        SYS_setitimer, SYS_getitimer, SYS_tgkill, SYS_gettid, SYS_getpid,
        // time
        SYS_clock_gettime, SYS_clock_getres, SYS_clock_nanosleep, SYS_nanosleep,
        SYS_gettimeofday,
        // runtime startup
        SYS_execve, SYS_set_tid_address, SYS_set_robust_list, SYS_futex,
        SYS_prlimit64, SYS_getrlimit, SYS_uname, SYS_sysinfo, SYS_getrandom,
        SYS_sched_getaffinity, SYS_sched_yield,
        SYS_getuid, SYS_geteuid, SYS_getgid, SYS_getegid,
        // exit
        SYS_exit, SYS_exit_group,
    };
#if defined(__x86_64__)
    const unsigned int legacy[] = {
        SYS_open, SYS_stat, SYS_lstat, SYS_access, SYS_readlink,
        SYS_arch_prctl, SYS_alarm, SYS_poll,
    };
    nr.insert(nr.end(), legacy, legacy + sizeof(legacy) / sizeof(legacy[0]));
#endif
#ifdef SYS_rseq
    nr.push_back(SYS_rseq);
#endif
#ifdef SYS_statx
    nr.push_back(SYS_statx);
#endif
#ifdef SYS_faccessat2
    nr.push_back(SYS_faccessat2);
#endif
    return nr;
}

std::string install_seccomp_filter() {
    const std::vector<unsigned int> nr = allowed_syscalls();
    const size_t n = nr.size();

    // Layout:
    //   [0] ld arch   [1] jeq arch +1   [2] kill   [3] ld nr
    //   [4 .. 4+n)    jeq nr[s] -> ALLOW (mprotect handled separately)
    //   [4+n]         jeq mprotect -> [6+n]
    //   [5+n]         kill
    //   [6+n]         ld args[2]   [7+n] jset PROT_EXEC -> [9+n]
    //   [8+n]         allow        [9+n] kill      [10+n] ALLOW
    std::vector<sock_filter> prog;
    prog.reserve(n + 11);
    prog.push_back(bpf_stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    prog.push_back(bpf_jump(BPF_JMP | BPF_JEQ | BPF_K, CAPSULE_AUDIT_ARCH, 1, 0));
    prog.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    prog.push_back(bpf_stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));

    const size_t allow_at = n + 10;
    for (size_t s = 0; s < n; s++) {
        const size_t here = 4 + s;
        const size_t jt = allow_at - here - 1;
        if (jt > 255) return "seccomp: allowlist too long for a single jump";
        prog.push_back(bpf_jump(BPF_JMP | BPF_JEQ | BPF_K, nr[s], jt, 0));
    }
    prog.push_back(bpf_jump(BPF_JMP | BPF_JEQ | BPF_K, SYS_mprotect, 1, 0));
    prog.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    prog.push_back(bpf_stmt(BPF_LD | BPF_W | BPF_ABS,
                            offsetof(struct seccomp_data, args) + 2 * sizeof(uint64_t)));
    prog.push_back(bpf_jump(BPF_JMP | BPF_JSET | BPF_K, PROT_EXEC, 1, 0));
    prog.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
    prog.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    prog.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));

    struct sock_fprog fprog = {};
    fprog.len = static_cast<unsigned short>(prog.size());
    fprog.filter = prog.data();

    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &fprog, 0, 0) != 0) {
        return std::string("seccomp install failed: ") + std::strerror(errno);
    }
    return "";
}

bool seccomp_available() {
    return prctl(PR_GET_SECCOMP, 0, 0, 0, 0) >= 0;
}

} // namespace capsule

#else

namespace capsule {

std::string install_seccomp_filter() {
    return "seccomp: unsupported platform";
}

bool seccomp_available() {
    return false;
}

} // namespace capsule

#endif
