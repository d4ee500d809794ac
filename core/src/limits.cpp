#include "capsule/limits.h"
#include "capsule/errors.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>

#ifndef _WIN32
  #include <sys/resource.h>
#endif

namespace capsule {

#ifndef _WIN32

static uint64_t from_rlim(rlim_t v) {
    return v == RLIM_INFINITY ? kUnlimited : static_cast<uint64_t>(v);
}

static rlim_t to_rlim(uint64_t v) {
    return v == kUnlimited ? RLIM_INFINITY : static_cast<rlim_t>(v);
}

static RlimitPair read_pair(int resource) {
    RlimitPair p;
    struct rlimit rl;
    if (getrlimit(resource, &rl) == 0) {
        p.soft = from_rlim(rl.rlim_cur);
        p.hard = from_rlim(rl.rlim_max);
    }
    return p;
}

static const char* resource_name(int resource) {
    switch (resource) {
        case RLIMIT_DATA:   return "RLIMIT_DATA";
        case RLIMIT_FSIZE:  return "RLIMIT_FSIZE";
        case RLIMIT_NOFILE: return "RLIMIT_NOFILE";
        default:            return "rlimit";
    }
}

#endif

bool limits_supported() {
#ifdef _WIN32
    return false;
#else
    return true;
#endif
}

LimitSnapshot current_limits() {
    LimitSnapshot s;
#ifndef _WIN32
    s.data = read_pair(RLIMIT_DATA);
    s.fsize = read_pair(RLIMIT_FSIZE);
    s.nofile = read_pair(RLIMIT_NOFILE);
#endif
    return s;
}

ScopedResourceLimits::ScopedResourceLimits(const ResourceLimits& limits) {
#ifndef _WIN32
    const std::pair<int, uint64_t> wanted[] = {
        {RLIMIT_DATA, limits.memory_bytes},
        {RLIMIT_FSIZE, limits.max_file_bytes},
        {RLIMIT_NOFILE, limits.max_open_files},
    };

    for (const auto& w : wanted) {
        if (w.second == 0) continue;

        struct rlimit rl;
        if (getrlimit(w.first, &rl) != 0) {
            int err = errno;
            restore();
            throw SandboxError(ErrorKind::RESOURCE,
                               std::string("cannot read ") + resource_name(w.first) + ": " + std::strerror(err));
        }

        uint64_t old_soft = from_rlim(rl.rlim_cur);
        uint64_t new_soft = std::min(old_soft, w.second);
        if (new_soft == old_soft) continue;

        rl.rlim_cur = to_rlim(new_soft);
        if (setrlimit(w.first, &rl) != 0) {
            int err = errno;
            restore();
            throw SandboxError(ErrorKind::RESOURCE,
                               std::string("cannot apply ") + resource_name(w.first) + ": " + std::strerror(err));
        }
        saved_.emplace_back(w.first, old_soft);
    }
#else
    (void)limits;
#endif
}

ScopedResourceLimits::~ScopedResourceLimits() {
    restore();
}

void ScopedResourceLimits::restore() {
#ifndef _WIN32
    for (auto it = saved_.rbegin(); it != saved_.rend(); ++it) {
        struct rlimit rl;
        if (getrlimit(it->first, &rl) != 0) continue;
        rl.rlim_cur = to_rlim(it->second);
        // The hard limit was never touched, so raising soft back to its
        // previous value is always permitted.
        (void)setrlimit(it->first, &rl);
    }
#endif
    saved_.clear();
}

} // namespace capsule
