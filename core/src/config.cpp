#include "capsule/config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace capsule {

Profile detect_profile() {
    const char* env = std::getenv("CAPSULE_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // setenv() races getenv() in other threads; call before starting any.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("CAPSULE_SECCOMP_ENABLE", "0",    NO_OVERWRITE);
            setenv("CAPSULE_ISOLATION",      "auto", NO_OVERWRITE);
            setenv("CAPSULE_TIMEOUT_SEC",    "5",    NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("CAPSULE_SECCOMP_ENABLE", "1",       NO_OVERWRITE);
            setenv("CAPSULE_ISOLATION",      "process", NO_OVERWRITE);
            setenv("CAPSULE_TIMEOUT_SEC",    "5",       NO_OVERWRITE);
            break;
    }
}

static bool env_double(const char* name, double* out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    char* end = nullptr;
    errno = 0;
    double d = std::strtod(v, &end);
    if (errno != 0 || end == v || *end != '\0' || !std::isfinite(d) || d <= 0) return false;
    *out = d;
    return true;
}

static bool env_u64(const char* name, uint64_t* out) {
    const char* v = std::getenv(name);
    if (!v || !*v || *v == '-') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long n = std::strtoull(v, &end, 10);
    if (errno != 0 || end == v || *end != '\0' || n == 0) return false;
    *out = n;
    return true;
}

static bool env_flag(const char* name, bool defv) {
    const char* v = std::getenv(name);
    if (!v) return defv;
    std::string s = v;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

static constexpr uint64_t kMiB = 1024ull * 1024ull;

EngineConfig load_engine_config() {
    EngineConfig cfg;

    double secs = 0;
    if (env_double("CAPSULE_TIMEOUT_SEC", &secs)) cfg.limits.timeout_seconds = secs;

    uint64_t n = 0;
    if (env_u64("CAPSULE_MEMORY_MB", &n) && n <= UINT64_MAX / kMiB) cfg.limits.memory_bytes = n * kMiB;
    if (env_u64("CAPSULE_MAX_FILE_MB", &n) && n <= UINT64_MAX / kMiB) cfg.limits.max_file_bytes = n * kMiB;
    if (env_u64("CAPSULE_MAX_OPEN_FILES", &n)) cfg.limits.max_open_files = n;

    if (const char* iso = std::getenv("CAPSULE_ISOLATION")) {
        IsolationMode m;
        if (parse_isolation_mode(iso, &m)) cfg.isolation = m;
    }
    if (const char* bin = std::getenv("CAPSULE_CHILDHOST_BIN")) cfg.childhost_bin = bin;
    cfg.enable_seccomp = env_flag("CAPSULE_SECCOMP_ENABLE", false);
    if (const char* log = std::getenv("CAPSULE_AUDIT_LOG")) cfg.audit_log_path = log;

    return cfg;
}

} // namespace capsule
