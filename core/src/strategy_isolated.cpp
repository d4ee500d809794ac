#include "capsule/strategy.h"
#include "capsule/deadline.h"
#include "capsule/isolation.h"
#include "capsule/proc.h"
#include "capsule/scratch.h"

#include <algorithm>
#include <cmath>
#include <csignal>
#include <cstring>
#include <sstream>

namespace capsule {

IsolatedProcessStrategy::IsolatedProcessStrategy(std::string childhost_bin, bool enable_seccomp)
    : childhost_bin_(std::move(childhost_bin)), enable_seccomp_(enable_seccomp) {}

static std::string seconds_arg(double s) {
    std::ostringstream oss;
    oss.precision(17);
    oss << s;
    return oss.str();
}

static std::string signal_text(int sig) {
    const char* name = strsignal(sig);
    std::string s = "child terminated by signal " + std::to_string(sig);
    if (name) s += std::string(" (") + name + ")";
    return s;
}

static constexpr double kMaxWaitSeconds = 24 * 3600.0;

// Worst case child line: a full result plus escaped output.
static constexpr size_t kChildStdoutMax = 2 * kMaxResultBytes + 256 * 1024;

ExecutionOutcome IsolatedProcessStrategy::run(const Submission& sub, const ResourceLimits& limits) {
    ScratchDir scratch;
    if (!scratch.ok()) return make_failure(ErrorKind::RESOURCE, scratch.error());

    std::string err;
    if (!scratch.write_file(kSnippetFile, sub.code, &err) ||
        !scratch.write_file(kContextFile, sub.context_json.empty() ? "{}" : sub.context_json, &err)) {
        return make_failure(ErrorKind::RESOURCE, "cannot stage snippet: " + err);
    }

    std::vector<std::string> argv = {
        childhost_bin_, "--timeout", seconds_arg(limits.timeout_seconds), kSnippetFile, kContextFile,
    };
    std::vector<std::string> env = build_child_environment(current_environment(), scratch.path());

    const double wait_s = std::min(limits.timeout_seconds, kMaxWaitSeconds);
    ProcLimits lim;
    lim.timeout_ms = wait_s > 0 ? static_cast<int>(std::ceil(wait_s * 1000.0)) + kChildGraceMs : 0;
    lim.stdout_max_bytes = kChildStdoutMax;
    lim.rlimit_data_bytes = limits.memory_bytes;
    lim.rlimit_fsize_bytes = limits.max_file_bytes;
    lim.rlimit_nofile = limits.max_open_files;
    lim.rlimit_cpu_sec = wait_s > 0 ? static_cast<int>(std::ceil(wait_s)) + 1 : 0;
    // A wrapper usually needs to fork; the bare child host never does.
    lim.rlimit_nproc = proc_wrapper_prefix().empty() ? 1 : 0;
    lim.no_new_privs = true;
    lim.enable_seccomp = enable_seccomp_;

    ProcResult res;
    if (!proc_run_capture_sandboxed(argv, scratch.path(), env, lim, &res)) {
        return make_failure(ErrorKind::RESOURCE, "cannot launch child host: " + res.error);
    }
    if (!res.error.empty()) {
        return make_failure(ErrorKind::RESOURCE, res.error);
    }
    if (res.timed_out || res.term_signal == SIGXCPU) {
        return make_failure(ErrorKind::TIMEOUT, timeout_message(limits.timeout_seconds));
    }
    if (res.exit_code == kExitSetupFailed || res.exit_code == kExitExecFailed) {
        return make_failure(ErrorKind::RESOURCE, "child host could not start: " + channel_excerpt(res.output));
    }
    if (res.term_signal != 0) {
        return make_failure(ErrorKind::RUNTIME, signal_text(res.term_signal));
    }
    if (res.output_truncated) {
        return make_failure(ErrorKind::CHANNEL, "child output exceeded " + std::to_string(kChildStdoutMax) + " bytes");
    }

    ExecutionOutcome out;
    std::string why;
    if (!parse_child_message(res.output, &out, &why)) {
        return make_failure(ErrorKind::CHANNEL, why + ": " + channel_excerpt(res.output));
    }
    if (out.succeeded != (res.exit_code == 0)) {
        return make_failure(ErrorKind::CHANNEL, "child exit status " + std::to_string(res.exit_code) +
                                                " does not match its message: " + channel_excerpt(res.output));
    }
    return out;
}

} // namespace capsule
