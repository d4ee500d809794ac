#include "capsule/engine.h"
#include "capsule/isolation.h"
#include "capsule/log.h"
#include "capsule/runtime.h"
#include "capsule/strategy.h"
#include "capsule/validator.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <new>

namespace capsule {

const char* isolation_mode_name(IsolationMode m) {
    switch (m) {
        case IsolationMode::AUTO:      return "auto";
        case IsolationMode::PROCESS:   return "process";
        case IsolationMode::INPROCESS: return "inprocess";
    }
    return "auto";
}

bool parse_isolation_mode(const std::string& s, IsolationMode* out) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (v == "auto") *out = IsolationMode::AUTO;
    else if (v == "process") *out = IsolationMode::PROCESS;
    else if (v == "inprocess") *out = IsolationMode::INPROCESS;
    else return false;
    return true;
}

static bool platform_supports_processes() {
#ifdef _WIN32
    return false;
#else
    return true;
#endif
}

static std::unique_ptr<IExecutionStrategy> select_strategy(const EngineConfig& cfg) {
    if (cfg.isolation == IsolationMode::INPROCESS) {
        return std::make_unique<InProcessStrategy>();
    }

    std::string bin = cfg.childhost_bin.empty() ? default_childhost_path() : cfg.childhost_bin;
    const bool usable = platform_supports_processes() && childhost_usable(bin);
    if (usable) {
        return std::make_unique<IsolatedProcessStrategy>(bin, cfg.enable_seccomp);
    }
    if (cfg.isolation == IsolationMode::PROCESS) {
        std::string why = platform_supports_processes()
            ? "process isolation required but child host is not executable: " + (bin.empty() ? "<unknown>" : bin)
            : "process isolation required but not supported on this platform";
        return std::make_unique<UnavailableStrategy>(why);
    }
    return std::make_unique<InProcessStrategy>();
}

Engine::Engine(EngineConfig cfg) : cfg_(std::move(cfg)) {
    strategy_ = select_strategy(cfg_);
    if (!cfg_.audit_log_path.empty()) {
        audit_ = std::make_unique<AuditLog>(cfg_.audit_log_path);
    }
}

Engine::~Engine() = default;

const char* Engine::strategy_name() const {
    return strategy_->name();
}

ExecutionOutcome Engine::execute(const std::string& code, const std::string& context_json) {
    execution_count_++;
    const auto start = std::chrono::steady_clock::now();

    ExecutionOutcome out;
    try {
        std::string err;
        std::unique_ptr<Program> program;
        if (code.size() > kMaxCodeBytes) {
            out = make_failure(ErrorKind::VALIDATION, "code exceeds " + std::to_string(kMaxCodeBytes) + " bytes");
        } else if (context_json.size() > kMaxContextBytes) {
            out = make_failure(ErrorKind::VALIDATION, "context exceeds " + std::to_string(kMaxContextBytes) + " bytes");
        } else if (!(program = validate_source(code, &err))) {
            out = make_failure(ErrorKind::VALIDATION, err);
        } else if (!check_context(context_json, &err)) {
            out = make_failure(ErrorKind::VALIDATION, err);
        } else {
            out = strategy_->run(Submission{*program, code, context_json}, cfg_.limits);
        }
    } catch (const std::bad_alloc&) {
        out = make_failure(ErrorKind::RESOURCE, "out of memory while preparing execution");
    } catch (const std::exception& e) {
        out = make_failure(ErrorKind::RUNTIME, e.what());
    }
    out = normalize_outcome(std::move(out));

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    audit(code, context_json, out, static_cast<int64_t>(ms));
    return out;
}

void Engine::audit(const std::string& code, const std::string& context_json,
                   const ExecutionOutcome& out, int64_t duration_ms) {
    if (!audit_) return;
    std::lock_guard<std::mutex> lk(audit_mu_);
    audit_->record(make_audit_event(strategy_->name(), code, context_json, out, duration_ms));
}

} // namespace capsule
