#pragma once

#include <chrono>
#include <string>

#ifndef _WIN32
  #include <csignal>
  #include <sys/time.h>
#endif

namespace capsule {

// Set by the SIGALRM handler of the innermost active DeadlineGuard.
bool deadline_expired();

// "execution exceeded 5s limit"
std::string timeout_message(double seconds);

// Arms a one-shot ITIMER_REAL for `seconds` (fractional allowed; <= 0 means
// no deadline). The handler only raises a flag; code running under the guard
// polls deadline_expired(). Destruction disarms the timer and reinstates the
// previous SIGALRM disposition and any timer that was pending before.
// Throws SandboxError(RESOURCE) if the timer cannot be armed.
class DeadlineGuard {
public:
    explicit DeadlineGuard(double seconds);
    ~DeadlineGuard();

    DeadlineGuard(const DeadlineGuard&) = delete;
    DeadlineGuard& operator=(const DeadlineGuard&) = delete;

    bool armed() const { return armed_; }

private:
    bool armed_{false};
    std::chrono::steady_clock::time_point started_;
#ifndef _WIN32
    struct sigaction old_action_{};
    struct itimerval old_timer_{};
#endif
};

} // namespace capsule
