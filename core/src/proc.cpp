#include "capsule/proc.h"
#include "capsule/sandbox.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>

#ifndef _WIN32
  #include <fcntl.h>
  #include <poll.h>
  #include <signal.h>
  #include <sys/resource.h>
  #include <sys/stat.h>
  #include <sys/types.h>
  #include <sys/wait.h>
  #include <unistd.h>
  #ifdef __linux__
    #include <sys/prctl.h>
  #endif
#endif

namespace capsule {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    bool have = false;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    for (char c : cmd) {
        switch (st) {
        case NORM:
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                if (have) out.push_back(cur);
                cur.clear();
                have = false;
            } else if (c == '\'') {
                st = SQ;
                have = true;
            } else if (c == '"') {
                st = DQ;
                have = true;
                esc = false;
            } else {
                cur.push_back(c);
                have = true;
            }
            break;
        case SQ:
            if (c == '\'') st = NORM;
            else cur.push_back(c);
            break;
        case DQ:
            if (esc) {
                cur.push_back(c);
                esc = false;
            } else if (c == '\\') {
                esc = true;
            } else if (c == '"') {
                st = NORM;
            } else {
                cur.push_back(c);
            }
            break;
        }
    }
    if (st != NORM) return {};
    if (have) out.push_back(cur);
    return out;
}

static bool env_true(const char* key) {
    const char* v = std::getenv(key);
    if (!v) return false;
    std::string s = v;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

#ifndef _WIN32
// The child runs with PATH="", so a bare wrapper name is resolved here.
static std::string resolve_in_path(const std::string& prog) {
    if (prog.find('/') != std::string::npos) return prog;
    const char* path = std::getenv("PATH");
    if (!path) return prog;
    std::string dirs = path;
    size_t start = 0;
    while (start <= dirs.size()) {
        size_t end = dirs.find(':', start);
        if (end == std::string::npos) end = dirs.size();
        std::string dir = dirs.substr(start, end - start);
        if (!dir.empty()) {
            std::string cand = dir + "/" + prog;
            if (access(cand.c_str(), X_OK) == 0) return cand;
        }
        start = end + 1;
    }
    return prog;
}
#endif

std::vector<std::string> proc_wrapper_prefix() {
    if (!env_true("CAPSULE_PROC_WRAPPER_ENABLE")) return {};
    const char* w = std::getenv("CAPSULE_PROC_WRAPPER");
    if (!w) return {};
    auto toks = split_argv_quoted(w);
#ifndef _WIN32
    if (!toks.empty()) toks[0] = resolve_in_path(toks[0]);
#endif
    return toks;
}

#ifndef _WIN32

// Child-side failure report. Only async-signal-safe calls.
[[noreturn]] static void child_fail(const char* what, int err) {
    const char* prefix = "capsule: launch failed: ";
    (void)!write(STDERR_FILENO, prefix, std::strlen(prefix));
    (void)!write(STDERR_FILENO, what, std::strlen(what));
    if (err) {
        const char* sep = ": ";
        const char* msg = std::strerror(err);
        (void)!write(STDERR_FILENO, sep, 2);
        (void)!write(STDERR_FILENO, msg, std::strlen(msg));
    }
    (void)!write(STDERR_FILENO, "\n", 1);
    _exit(kExitSetupFailed);
}

static void set_hard_limit(int resource, uint64_t value, const char* name) {
    if (value == 0) return;
    struct rlimit rl;
    rl.rlim_cur = (rlim_t)value;
    rl.rlim_max = (rlim_t)value;
    if (setrlimit(resource, &rl) != 0) child_fail(name, errno);
}

#endif

bool proc_run_capture_sandboxed(const std::vector<std::string>& argv,
                                const std::string& cwd,
                                const std::vector<std::string>& env,
                                const ProcLimits& lim,
                                ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

#ifdef _WIN32
    res->error = "process isolation is not supported on Windows";
    return false;
#else
    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    std::vector<std::string> eff_argv = proc_wrapper_prefix();
    eff_argv.insert(eff_argv.end(), argv.begin(), argv.end());

    // Everything the child touches is prepared before fork.
    std::vector<char*> cargv;
    cargv.reserve(eff_argv.size() + 1);
    for (const auto& s : eff_argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    std::vector<char*> cenv;
    cenv.reserve(env.size() + 1);
    for (const auto& s : env) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);

    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    if (maxfd > 65536) maxfd = 65536;

    int pipefd[2];
    if (pipe(pipefd) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }

    int flags = fcntl(pipefd[0], F_GETFL, 0);
    if (flags >= 0) (void)fcntl(pipefd[0], F_SETFL, flags | O_NONBLOCK);

    const pid_t parent = getpid();
    pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        if (dup2(pipefd[1], STDOUT_FILENO) < 0 || dup2(pipefd[1], STDERR_FILENO) < 0) _exit(kExitSetupFailed);
        close(pipefd[0]);
        close(pipefd[1]);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            (void)dup2(devnull, STDIN_FILENO);
            if (devnull != STDIN_FILENO) close(devnull);
        }

        (void)setpgid(0, 0);
        (void)umask(077);

        for (int fd = 3; fd < maxfd; fd++) (void)close(fd);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) child_fail("chdir", errno);

#ifdef __linux__
        if (lim.no_new_privs && prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
            child_fail("PR_SET_NO_NEW_PRIVS", errno);
        }
        if (prctl(PR_SET_PDEATHSIG, SIGKILL) != 0) child_fail("PR_SET_PDEATHSIG", errno);
        if (getppid() != parent) _exit(kExitSetupFailed);
#else
        (void)parent;
#endif

        set_hard_limit(RLIMIT_DATA, lim.rlimit_data_bytes, "RLIMIT_DATA");
        set_hard_limit(RLIMIT_FSIZE, lim.rlimit_fsize_bytes, "RLIMIT_FSIZE");
        // Raised past the fds stdio needs so the child can still load.
        set_hard_limit(RLIMIT_NOFILE, lim.rlimit_nofile ? std::max<uint64_t>(lim.rlimit_nofile, 4) : 0,
                       "RLIMIT_NOFILE");
        set_hard_limit(RLIMIT_CPU, lim.rlimit_cpu_sec > 0 ? (uint64_t)lim.rlimit_cpu_sec : 0, "RLIMIT_CPU");
#ifdef RLIMIT_NPROC
        set_hard_limit(RLIMIT_NPROC, lim.rlimit_nproc > 0 ? (uint64_t)lim.rlimit_nproc : 0, "RLIMIT_NPROC");
#endif

        if (lim.enable_seccomp) {
            if (!lim.no_new_privs) child_fail("seccomp requires no_new_privs", 0);
            std::string err = install_seccomp_filter();
            if (!err.empty()) child_fail(err.c_str(), 0);
        }

        execve(cargv[0], cargv.data(), cenv.data());
        const char* msg = "capsule: exec failed\n";
        (void)!write(STDERR_FILENO, msg, std::strlen(msg));
        _exit(kExitExecFailed);
    }

    (void)setpgid(pid, pid);
    close(pipefd[1]);

    auto start = std::chrono::steady_clock::now();
    std::string out;
    out.reserve(std::min<size_t>(lim.stdout_max_bytes, 64 * 1024));

    auto append = [&](const char* buf, ssize_t n) {
        size_t can = lim.stdout_max_bytes > out.size() ? (lim.stdout_max_bytes - out.size()) : 0;
        size_t take = std::min(can, (size_t)n);
        if (take < (size_t)n) res->output_truncated = true;
        out.append(buf, take);
    };
    auto drain = [&]() {
        char buf[4096];
        while (true) {
            ssize_t n = read(pipefd[0], buf, sizeof(buf));
            if (n > 0) { append(buf, n); continue; }
            if (n < 0 && errno == EINTR) continue;
            break;
        }
    };

    int status = 0;
    while (true) {
        drain();

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) {
            res->error = std::string("waitpid failed: ") + std::strerror(errno);
            (void)kill(-pid, SIGKILL);
            break;
        }

        int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (lim.timeout_ms > 0 && elapsed_ms >= lim.timeout_ms) {
            res->timed_out = true;
            (void)kill(-pid, SIGKILL);
            (void)kill(pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            break;
        }

        struct pollfd pfd;
        pfd.fd = pipefd[0];
        pfd.events = POLLIN;
        int slice = 50;
        if (lim.timeout_ms > 0) slice = std::max(1, std::min(slice, lim.timeout_ms - elapsed_ms));
        (void)poll(&pfd, 1, slice);
    }

    // Grandchildren still holding the pipe are part of the group.
    (void)kill(-pid, SIGKILL);
    drain();
    close(pipefd[0]);

    res->output = std::move(out);
    if (!res->error.empty()) {
        res->exit_code = 128;
        return true;
    }
    if (WIFEXITED(status)) {
        res->exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res->term_signal = WTERMSIG(status);
        res->exit_code = 128 + res->term_signal;
    } else {
        res->exit_code = 128;
    }
    return true;
#endif
}

} // namespace capsule
