#pragma once

#include "capsule/ast.h"
#include "capsule/value.h"

#include <cstddef>
#include <cstdint>

namespace capsule {

// Operator semantics shared by the interpreter and the capability catalogue.
// Integer arithmetic is checked: overflow, division by zero and type
// mismatches raise SandboxError(RUNTIME).

Value apply_binary(Op op, const Value& a, const Value& b);
Value apply_unary(Op op, const Value& v);

bool contains(const Value& container, const Value& item);

Value index_value(const Value& obj, const Value& index);
// Either bound may be null (open slice).
Value slice_value(const Value& obj, const Value* lo, const Value* hi);
void store_index(const Value& obj, const Value& index, Value v);

// int or bool as int64; anything else raises.
int64_t to_int(const Value& v, const char* what);
// Resolves a possibly negative index against `len`; raises when out of range.
size_t resolve_index(int64_t i, size_t len, const char* what);

void require_hashable(const Value& v);
void require_mutable(const Value& container);

int64_t checked_add(int64_t a, int64_t b);
int64_t checked_mul(int64_t a, int64_t b);

// Caps container/string growth before allocation is attempted.
constexpr size_t kMaxSequenceBytes = size_t{256} << 20;
void check_growth(size_t count, size_t elem_size);

} // namespace capsule
