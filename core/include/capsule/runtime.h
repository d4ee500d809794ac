#pragma once

#include "capsule/ast.h"
#include "capsule/outcome.h"

#include <string>

namespace capsule {

// Runs an already-validated program against `context_json` (a JSON object
// or empty for {}) under a DeadlineGuard of `timeout_seconds`. Never throws:
// every failure comes back as a failed outcome. Resource limits are the
// caller's concern.
ExecutionOutcome execute_program(const Program& program, const std::string& context_json,
                                 double timeout_seconds);

// validate_source() followed by execute_program(). Used by the child host,
// which re-validates whatever it was handed.
ExecutionOutcome run_snippet(const std::string& code, const std::string& context_json,
                             double timeout_seconds);

// Checks that `context_json` is empty or a JSON object. False with *error
// set otherwise.
bool check_context(const std::string& context_json, std::string* error);

} // namespace capsule
