#pragma once

#include "capsule/ast.h"
#include "capsule/limits.h"
#include "capsule/outcome.h"

#include <memory>
#include <string>
#include <utility>

namespace capsule {

// A validated snippet as handed to a strategy. The in-process strategy runs
// `program`; the isolated one ships `code` and re-parses it in the child.
struct Submission {
    const Program& program;
    const std::string& code;
    const std::string& context_json; // empty or a JSON object
};

// One way of running a validated snippet. Chosen once per Engine.
class IExecutionStrategy {
public:
    virtual ~IExecutionStrategy() = default;
    virtual const char* name() const = 0;

    // Never throws.
    virtual ExecutionOutcome run(const Submission& sub, const ResourceLimits& limits) = 0;
};

// Direct evaluation in the calling process under ScopedResourceLimits and a
// DeadlineGuard. Not safe to run concurrently within one process.
class InProcessStrategy final : public IExecutionStrategy {
public:
    const char* name() const override { return "inprocess"; }
    ExecutionOutcome run(const Submission& sub, const ResourceLimits& limits) override;
};

// Runs capsule_childhost in a scratch directory with a scrubbed environment.
class IsolatedProcessStrategy final : public IExecutionStrategy {
public:
    IsolatedProcessStrategy(std::string childhost_bin, bool enable_seccomp);
    const char* name() const override { return "process"; }
    ExecutionOutcome run(const Submission& sub, const ResourceLimits& limits) override;

    const std::string& childhost_bin() const { return childhost_bin_; }

private:
    std::string childhost_bin_;
    bool enable_seccomp_{false};
};

// Process isolation was required but is not available: every call fails
// with a ResourceError.
class UnavailableStrategy final : public IExecutionStrategy {
public:
    explicit UnavailableStrategy(std::string reason) : reason_(std::move(reason)) {}
    const char* name() const override { return "unavailable"; }
    ExecutionOutcome run(const Submission&, const ResourceLimits&) override {
        return make_failure(ErrorKind::RESOURCE, reason_);
    }

private:
    std::string reason_;
};

// File names inside the scratch directory.
constexpr const char* kSnippetFile = "snippet.cap";
constexpr const char* kContextFile = "context.json";

// Extra time the parent waits past the snippet deadline before killing the
// child, so the child's own Timeout report normally wins.
constexpr int kChildGraceMs = 1000;

} // namespace capsule
