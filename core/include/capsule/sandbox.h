#pragma once

// seccomp-BPF syscall allowlist for the isolated child.
//
// Allowlist only: anything else kills the process with SIGSYS. Covers what
// the dynamic loader and the child host need (memory, file reads of the
// scratch dir, signals and timers for the deadline, exit) and execve itself
// so the filter can be installed just before exec. There are no socket,
// fork/clone, ptrace, mount or namespace syscalls on the list, and
// mprotect with PROT_EXEC is refused.
//
// x86_64 and aarch64 only.

#include <string>

namespace capsule {

// Must run after prctl(PR_SET_NO_NEW_PRIVS, 1). Returns an empty string on
// success, otherwise the reason. Non-Linux builds report it as unsupported.
std::string install_seccomp_filter();

bool seccomp_available();

} // namespace capsule
