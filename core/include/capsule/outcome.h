#pragma once

#include "capsule/errors.h"

#include <cstddef>
#include <optional>
#include <string>

namespace capsule {

// Serialized result ceiling.
constexpr size_t kMaxResultBytes = 1u << 20;
// Raw child text quoted in a ChannelError / ResourceError.
constexpr size_t kMaxChannelExcerpt = 1000;

struct ExecutionOutcome {
    bool succeeded{false};
    std::optional<std::string> result_json;  // raw JSON text
    std::string captured_output;
    std::optional<std::string> error;        // "<Kind>: <message>"
    ErrorKind error_kind{ErrorKind::NONE};
};

ExecutionOutcome make_success(std::string result_json, std::string output);
ExecutionOutcome make_failure(ErrorKind kind, const std::string& message);

// Enforces the outcome invariants: a failure carries no result and no
// output, a success carries no error and its output is capped.
ExecutionOutcome normalize_outcome(ExecutionOutcome out);

// {"succeeded":..,"result":..,"output":"..","error":..,"error_kind":".."}
std::string outcome_to_json(const ExecutionOutcome& out);

// The child host's single stdout line.
std::string child_success_json(const std::string& result_json, const std::string& output);
std::string child_failure_json(ErrorKind kind, const std::string& message);

// Interprets the last non-empty line of `raw` as the child's message.
// Returns false (with *why set) when that line is not a well-formed
// message; the caller turns that into a ChannelError.
bool parse_child_message(const std::string& raw, ExecutionOutcome* out, std::string* why);

// First kMaxChannelExcerpt bytes of `raw`, without a split UTF-8 sequence.
std::string channel_excerpt(const std::string& raw);

} // namespace capsule
