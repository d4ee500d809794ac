#include "test_common.h"
#include "capsule/deadline.h"

#include <chrono>
#include <csignal>
#include <cstring>
#include <sys/time.h>

using namespace capsule;

static volatile sig_atomic_t g_outer_fired = 0;

static void outer_handler(int) {
    g_outer_fired = 1;
}

// Spins until the flag rises or `max_ms` passes.
static bool wait_for_deadline(int max_ms) {
    auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(max_ms);
    while (std::chrono::steady_clock::now() < until) {
        if (deadline_expired()) return true;
    }
    return deadline_expired();
}

int main() {
    // Test 1: Message format
    expect_eq_str(timeout_message(5), "execution exceeded 5s limit", "integral seconds");
    expect_eq_str(timeout_message(0.25), "execution exceeded 0.25s limit", "fractional seconds");

    // Test 2: The flag rises once the deadline passes and is cleared on destruction
    {
        DeadlineGuard g(0.05);
        expect_true(g.armed(), "guard armed");
        expect_true(!deadline_expired(), "not expired right away");
        expect_true(wait_for_deadline(2000), "deadline fires");
    }
    expect_true(!deadline_expired(), "flag cleared after guard");

    // Test 3: Non-positive seconds means no deadline
    {
        DeadlineGuard g(0);
        expect_true(!g.armed(), "zero timeout leaves the timer alone");
        expect_true(!wait_for_deadline(50), "zero timeout never fires");
    }

    // Test 4: An early exit disarms the timer and restores the old disposition
    {
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = outer_handler;
        sigemptyset(&sa.sa_mask);
        expect_true(sigaction(SIGALRM, &sa, nullptr) == 0, "install outer handler");

        { DeadlineGuard g(10); }

        struct itimerval cur;
        expect_true(getitimer(ITIMER_REAL, &cur) == 0, "getitimer");
        expect_true(cur.it_value.tv_sec == 0 && cur.it_value.tv_usec == 0, "timer disarmed after early exit");

        struct sigaction now;
        expect_true(sigaction(SIGALRM, nullptr, &now) == 0, "query SIGALRM");
        expect_true(now.sa_handler == outer_handler, "previous SIGALRM handler reinstated");
    }

    // Test 5: A timer pending before the guard is re-armed afterwards
    {
        struct itimerval outer;
        std::memset(&outer, 0, sizeof(outer));
        outer.it_value.tv_sec = 30;
        expect_true(setitimer(ITIMER_REAL, &outer, nullptr) == 0, "arm outer timer");

        { DeadlineGuard g(0.01); wait_for_deadline(1000); }

        struct itimerval cur;
        expect_true(getitimer(ITIMER_REAL, &cur) == 0, "getitimer");
        expect_true(cur.it_value.tv_sec > 0 || cur.it_value.tv_usec > 0, "outer timer still pending");
        expect_true(cur.it_value.tv_sec <= 30, "outer timer not extended");
        expect_true(g_outer_fired == 0, "outer handler not triggered by the guard");

        struct itimerval off;
        std::memset(&off, 0, sizeof(off));
        setitimer(ITIMER_REAL, &off, nullptr);
    }

    std::cerr << "test_deadline: ALL PASSED" << std::endl;
    return 0;
}
