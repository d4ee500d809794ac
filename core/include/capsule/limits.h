#pragma once

#include <cstdint>
#include <utility>
#include <vector>

namespace capsule {

// Ceilings applied to one execution.
struct ResourceLimits {
    uint64_t memory_bytes{50ull * 1024 * 1024};
    uint64_t max_file_bytes{10ull * 1024 * 1024};
    uint64_t max_open_files{10};
    double timeout_seconds{5.0};
};

constexpr uint64_t kUnlimited = UINT64_MAX;

struct RlimitPair {
    uint64_t soft{kUnlimited};
    uint64_t hard{kUnlimited};
};

struct LimitSnapshot {
    RlimitPair data;
    RlimitPair fsize;
    RlimitPair nofile;
};

// False where the platform has no rlimits; ScopedResourceLimits is then a no-op.
bool limits_supported();

LimitSnapshot current_limits();

// Lowers the soft RLIMIT_DATA / RLIMIT_FSIZE / RLIMIT_NOFILE of the calling
// process for its lifetime and restores the previous values on destruction.
// Soft limits are only ever lowered and hard limits are left alone, so the
// restore cannot be refused. Throws SandboxError(RESOURCE) if a limit cannot
// be applied (after undoing the ones already lowered).
//
// Process-global: callers must not run two of these concurrently.
class ScopedResourceLimits {
public:
    explicit ScopedResourceLimits(const ResourceLimits& limits);
    ~ScopedResourceLimits();

    ScopedResourceLimits(const ScopedResourceLimits&) = delete;
    ScopedResourceLimits& operator=(const ScopedResourceLimits&) = delete;

private:
    void restore();

    // (resource, previous soft limit)
    std::vector<std::pair<int, uint64_t>> saved_;
};

} // namespace capsule
