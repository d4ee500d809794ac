#include "capsule/deadline.h"
#include "capsule/errors.h"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>

namespace capsule {

static volatile sig_atomic_t g_deadline_expired = 0;

#ifndef _WIN32
static void on_alarm(int) {
    g_deadline_expired = 1;
}

static struct timeval to_timeval(double seconds) {
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(seconds);
    tv.tv_usec = static_cast<suseconds_t>((seconds - static_cast<double>(tv.tv_sec)) * 1e6);
    if (tv.tv_sec == 0 && tv.tv_usec == 0) tv.tv_usec = 1;
    return tv;
}
#endif

bool deadline_expired() {
    return g_deadline_expired != 0;
}

std::string timeout_message(double seconds) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "execution exceeded %gs limit", seconds);
    return buf;
}

DeadlineGuard::DeadlineGuard(double seconds) : started_(std::chrono::steady_clock::now()) {
    g_deadline_expired = 0;
    if (seconds <= 0) return;

#ifndef _WIN32
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_alarm;
    sigemptyset(&sa.sa_mask);
    if (sigaction(SIGALRM, &sa, &old_action_) != 0) {
        throw SandboxError(ErrorKind::RESOURCE, std::string("sigaction(SIGALRM) failed: ") + std::strerror(errno));
    }

    struct itimerval it;
    std::memset(&it, 0, sizeof(it));
    it.it_value = to_timeval(seconds);
    if (setitimer(ITIMER_REAL, &it, &old_timer_) != 0) {
        int err = errno;
        (void)sigaction(SIGALRM, &old_action_, nullptr);
        throw SandboxError(ErrorKind::RESOURCE, std::string("setitimer failed: ") + std::strerror(err));
    }
    armed_ = true;
#endif
}

DeadlineGuard::~DeadlineGuard() {
#ifndef _WIN32
    if (!armed_) {
        g_deadline_expired = 0;
        return;
    }

    struct itimerval off;
    std::memset(&off, 0, sizeof(off));
    (void)setitimer(ITIMER_REAL, &off, nullptr);
    (void)sigaction(SIGALRM, &old_action_, nullptr);
    g_deadline_expired = 0;

    // Re-arm a timer that was pending before us, minus the time we held it.
    if (old_timer_.it_value.tv_sec != 0 || old_timer_.it_value.tv_usec != 0) {
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
        double remaining = static_cast<double>(old_timer_.it_value.tv_sec) +
                           static_cast<double>(old_timer_.it_value.tv_usec) / 1e6 - elapsed;
        struct itimerval it = old_timer_;
        it.it_value = to_timeval(remaining > 0 ? remaining : 0);
        (void)setitimer(ITIMER_REAL, &it, nullptr);
    }
#else
    g_deadline_expired = 0;
#endif
}

} // namespace capsule
