#pragma once

#include "capsule/ast.h"

#include <memory>
#include <string>

namespace capsule {

// Static pass run before any limit, timer or process is touched.
// Rejects imports, `__` identifiers, `_` attributes, deny-listed names and
// reflective attributes. The first violation in source order wins.
//
// Returns the parsed program, or nullptr with *error set to the violation
// text (syntax errors included).
std::unique_ptr<Program> validate_source(const std::string& code, std::string* error);

// Walks an already-parsed program. Returns false with *error set on the first
// violation.
bool validate_program(const Program& program, std::string* error);

bool is_denied_name(const std::string& name);
bool is_reflective_attribute(const std::string& attr);

} // namespace capsule
