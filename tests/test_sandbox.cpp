#include "test_common.h"
#include "capsule/sandbox.h"

#include <string>

#if defined(__linux__) && (defined(__x86_64__) || defined(__aarch64__))
#define CAPSULE_TEST_SECCOMP 1
#include <csignal>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

// Runs `body` in a forked child under the filter and returns the wait status.
template <typename F>
static int run_filtered(F body) {
    pid_t pid = fork();
    if (pid == 0) {
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) _exit(90);
        if (!capsule::install_seccomp_filter().empty()) _exit(91);
        _exit(body());
    }
    int status = 0;
    waitpid(pid, &status, 0);
    return status;
}

static bool killed_by_sigsys(int status) {
    return WIFSIGNALED(status) && WTERMSIG(status) == SIGSYS;
}
#endif

int main() {
    // Test 1: Availability matches the platform
#ifdef CAPSULE_TEST_SECCOMP
    expect_true(capsule::seccomp_available(), "seccomp should be available on Linux");
#else
    expect_true(!capsule::seccomp_available(), "seccomp should not be available here");
    expect_true(!capsule::install_seccomp_filter().empty(), "install reports unsupported platform");
#endif

#ifdef CAPSULE_TEST_SECCOMP
    // Test 2: Allowed syscalls keep working
    {
        int st = run_filtered([] {
            const char msg[] = "seccomp_ok\n";
            ssize_t n = write(STDOUT_FILENO, msg, sizeof(msg) - 1);
            void* p = mmap(nullptr, 4096, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
            if (p == MAP_FAILED) return 3;
            if (mprotect(p, 4096, PROT_READ) != 0) return 4;
            return n > 0 ? 0 : 2;
        });
        expect_true(WIFEXITED(st) && WEXITSTATUS(st) == 0, "child exits cleanly after allowed syscalls");
    }

    // Test 3: Network access kills the child
    {
        int st = run_filtered([] {
            int fd = socket(AF_INET, SOCK_STREAM, 0);
            return fd >= 0 ? 0 : 5;
        });
        expect_true(killed_by_sigsys(st), "socket() is fatal under the filter");
    }

    // Test 4: Spawning kills the child
    {
        int st = run_filtered([] {
            pid_t p = fork();
            if (p == 0) _exit(0);
            return 0;
        });
        expect_true(killed_by_sigsys(st), "fork() is fatal under the filter");
    }

    // Test 5: Making memory executable kills the child
    {
        int st = run_filtered([] {
            void* p = mmap(nullptr, 4096, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
            if (p == MAP_FAILED) return 3;
            mprotect(p, 4096, PROT_READ | PROT_EXEC);
            return 0;
        });
        expect_true(killed_by_sigsys(st), "mprotect(PROT_EXEC) is fatal under the filter");
    }

    // Test 6: The filter requires no_new_privs first (unless privileged)
    if (geteuid() != 0) {
        pid_t pid = fork();
        if (pid == 0) {
            _exit(capsule::install_seccomp_filter().empty() ? 1 : 0);
        }
        int status = 0;
        waitpid(pid, &status, 0);
        expect_true(WIFEXITED(status) && WEXITSTATUS(status) == 0, "install without no_new_privs is refused");
    }
#endif

    std::cerr << "test_sandbox: ALL PASSED" << std::endl;
    return 0;
}
