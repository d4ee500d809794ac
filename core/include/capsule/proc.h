#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace capsule {

// Exit codes a launched child uses to report a launch failure.
constexpr int kExitSetupFailed = 126;  // rlimit, chdir, prctl or seccomp refused
constexpr int kExitExecFailed = 127;

struct ProcLimits {
    int timeout_ms{5000};
    size_t stdout_max_bytes{256 * 1024};

    // Hard and soft limits set in the child before exec. 0 leaves a limit alone.
    uint64_t rlimit_data_bytes{50ull * 1024 * 1024};
    uint64_t rlimit_fsize_bytes{10ull * 1024 * 1024};
    uint64_t rlimit_nofile{10};
    int rlimit_cpu_sec{0};
    int rlimit_nproc{0};

    bool no_new_privs{true};

    // seccomp-BPF syscall allowlist (Linux only). CAPSULE_SECCOMP_ENABLE=1.
    bool enable_seccomp{false};
};

struct ProcResult {
    int exit_code{kExitExecFailed};  // 128 + signal when killed
    int term_signal{0};
    bool timed_out{false};
    bool output_truncated{false};
    std::string output;  // stdout+stderr merged
    std::string error;   // runner error, not child stderr
};

// Runs argv[0] (a path, no PATH search) with exactly `env` as its
// environment and `cwd` as working directory. stdout and stderr are merged
// and capped, the child gets its own process group, and on timeout the
// whole group is SIGKILLed. Every isolation step is mandatory: if one
// cannot be applied the child exits kExitSetupFailed with a one-line
// diagnostic instead of running unconfined.
//
// Returns true if the child was started.
bool proc_run_capture_sandboxed(const std::vector<std::string>& argv,
                                const std::string& cwd,
                                const std::vector<std::string>& env,
                                const ProcLimits& lim,
                                ProcResult* res);

// Splits a command string into argv tokens. Single quotes are literal,
// double quotes allow backslash escapes. Empty on unbalanced quotes.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

// Operator wrapper prefix from CAPSULE_PROC_WRAPPER, active only when
// CAPSULE_PROC_WRAPPER_ENABLE is truthy. Empty otherwise.
std::vector<std::string> proc_wrapper_prefix();

} // namespace capsule
