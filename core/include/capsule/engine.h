#pragma once

#include "capsule/limits.h"
#include "capsule/outcome.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace capsule {

class AuditLog;
class IExecutionStrategy;

// Submissions over these sizes are rejected as ValidationErrors.
constexpr size_t kMaxCodeBytes = 256 * 1024;
constexpr size_t kMaxContextBytes = 10 * 1024 * 1024;

enum class IsolationMode { AUTO, PROCESS, INPROCESS };

const char* isolation_mode_name(IsolationMode m);
// "auto", "process", "inprocess" (case-insensitive). False on anything else.
bool parse_isolation_mode(const std::string& s, IsolationMode* out);

struct EngineConfig {
    ResourceLimits limits;
    IsolationMode isolation{IsolationMode::AUTO};
    std::string childhost_bin;      // empty: capsule_childhost beside this executable
    bool enable_seccomp{false};
    std::string audit_log_path;     // empty: no audit log
};

// Front door: validate, pick the strategy resolved at construction, run,
// normalize, audit.
//
// Isolated executions may run concurrently. In-process executions change
// process-global rlimits and SIGALRM, so the host must serialize them.
class Engine {
public:
    explicit Engine(EngineConfig cfg);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // `context_json` must be empty or a JSON object.
    ExecutionOutcome execute(const std::string& code, const std::string& context_json);

    // "process", "inprocess" or "unavailable".
    const char* strategy_name() const;
    uint64_t execution_count() const { return execution_count_.load(); }
    const EngineConfig& config() const { return cfg_; }

private:
    EngineConfig cfg_;
    std::unique_ptr<IExecutionStrategy> strategy_;
    std::unique_ptr<AuditLog> audit_;
    std::mutex audit_mu_;
    std::atomic<uint64_t> execution_count_{0};

    void audit(const std::string& code, const std::string& context_json,
               const ExecutionOutcome& out, int64_t duration_ms);
};

} // namespace capsule
