#pragma once

// The fixed set of primitives visible to snippets. Anything not installed
// here (or reachable as a method of a value) does not exist for them.

#include "capsule/value.h"

#include <cstddef>
#include <string>
#include <vector>

namespace capsule {

class Interpreter;
struct Scope;

// One print() call.
constexpr size_t kMaxPrintChars = 1000;
// Whole captured output of one execution.
constexpr size_t kMaxOutputChars = 16384;
extern const char kOutputTruncatedMarker[];

// Longest prefix of `text` not above `max_bytes` that does not split a
// UTF-8 sequence.
std::string utf8_prefix(const std::string& text, size_t max_bytes);

// Lines over kMaxPrintChars keep their first 997 characters plus "...".
std::string cap_print_line(const std::string& line);

// Text over `max_chars` bytes is cut on a UTF-8 boundary and ends in
// kOutputTruncatedMarker; the result is exactly `max_chars` bytes.
std::string truncate_output(const std::string& text, size_t max_chars = kMaxOutputChars);

// Captured print() output. Lines are joined with '\n'; once the buffer
// passes kMaxOutputChars it is truncated and later lines are dropped.
class OutputSink {
public:
    void write_line(const std::string& line);

    const std::string& text() const { return text_; }
    bool truncated() const { return truncated_; }
    size_t lines() const { return lines_; }

private:
    std::string text_;
    bool truncated_{false};
    size_t lines_{0};
};

// Exact names installed into every snippet's builtin scope.
const std::vector<std::string>& capability_names();
void install_capabilities(Scope& builtins);

// Method `name` of `self` bound as a callable, or null when the type has
// no such method.
Value bound_method(const Value& self, const std::string& name);
bool has_method(ValueType type, const std::string& name);

// Argument-count check shared by builtins and methods.
void check_arity(const char* name, const std::vector<Value>& args, size_t min, size_t max);

// Sorts in place by compare_values, optionally through a key function.
void sort_values(Interpreter& in, std::vector<Value>& items, const Value& key, bool reverse);

} // namespace capsule
