#include "capsule/strategy.h"
#include "capsule/runtime.h"

#include <new>

namespace capsule {

ExecutionOutcome InProcessStrategy::run(const Submission& sub, const ResourceLimits& limits) {
    try {
        ScopedResourceLimits scoped(limits);
        return execute_program(sub.program, sub.context_json, limits.timeout_seconds);
    } catch (const SandboxError& e) {
        return make_failure(e.kind(), e.what());
    } catch (const std::bad_alloc&) {
        return make_failure(ErrorKind::RUNTIME, "memory limit exceeded");
    }
}

} // namespace capsule
