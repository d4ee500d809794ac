#include "capsule/outcome.h"
#include "capsule/capabilities.h"
#include "capsule/json_util.h"

#include <json-c/json.h>

namespace capsule {

ExecutionOutcome make_success(std::string result_json, std::string output) {
    ExecutionOutcome out;
    out.succeeded = true;
    out.result_json = std::move(result_json);
    out.captured_output = std::move(output);
    return out;
}

ExecutionOutcome make_failure(ErrorKind kind, const std::string& message) {
    ExecutionOutcome out;
    out.succeeded = false;
    out.error_kind = kind == ErrorKind::NONE ? ErrorKind::RUNTIME : kind;
    out.error = format_error(out.error_kind, message);
    return out;
}

ExecutionOutcome normalize_outcome(ExecutionOutcome out) {
    if (!out.succeeded) {
        out.result_json.reset();
        out.captured_output.clear();
        if (out.error_kind == ErrorKind::NONE) out.error_kind = ErrorKind::RUNTIME;
        if (!out.error) out.error = format_error(out.error_kind, "execution failed");
        return out;
    }
    out.error.reset();
    out.error_kind = ErrorKind::NONE;
    if (!out.result_json) out.result_json = "null";
    if (out.captured_output.size() > kMaxOutputChars) {
        out.captured_output = truncate_output(out.captured_output);
    }
    return out;
}

std::string outcome_to_json(const ExecutionOutcome& out) {
    json_object* obj = json_object_new_object();
    json_object_object_add(obj, "succeeded", json_object_new_boolean(out.succeeded ? 1 : 0));

    json_object* result = nullptr;
    if (out.result_json) {
        json_util::Doc d = json_util::parse(*out.result_json);
        result = d.release();
    }
    json_object_object_add(obj, "result", result);
    json_util::put_string(obj, "output", out.captured_output);
    if (out.error) {
        json_util::put_string(obj, "error", *out.error);
    } else {
        json_object_object_add(obj, "error", nullptr);
    }
    json_object_object_add(obj, "error_kind", json_object_new_string(error_kind_name(out.error_kind)));

    std::string s = json_util::to_string(obj);
    json_object_put(obj);
    return s;
}

std::string child_success_json(const std::string& result_json, const std::string& output) {
    json_object* obj = json_object_new_object();
    json_util::Doc d = json_util::parse(result_json);
    json_object_object_add(obj, "result", d.release());
    json_util::put_string(obj, "output", output);
    std::string s = json_util::to_string(obj);
    json_object_put(obj);
    return s;
}

std::string child_failure_json(ErrorKind kind, const std::string& message) {
    json_object* obj = json_object_new_object();
    json_util::put_string(obj, "error", message);
    json_object_object_add(obj, "kind", json_object_new_string(error_kind_name(kind)));
    std::string s = json_util::to_string(obj);
    json_object_put(obj);
    return s;
}

static std::string last_nonempty_line(const std::string& raw) {
    size_t end = raw.size();
    while (end > 0) {
        while (end > 0 && (raw[end - 1] == '\n' || raw[end - 1] == '\r')) end--;
        if (end == 0) break;
        size_t start = raw.rfind('\n', end - 1);
        start = (start == std::string::npos) ? 0 : start + 1;
        std::string line = raw.substr(start, end - start);
        if (line.find_first_not_of(" \t") != std::string::npos) return line;
        end = start;
    }
    return {};
}

bool parse_child_message(const std::string& raw, ExecutionOutcome* out, std::string* why) {
    std::string line = last_nonempty_line(raw);
    if (line.empty()) {
        if (why) *why = "child produced no output";
        return false;
    }
    std::string perr;
    json_util::Doc d = json_util::parse(line, &perr);
    if (!json_util::is_object(d)) {
        if (why) *why = perr.empty() ? "child message is not a JSON object" : "child message is not JSON: " + perr;
        return false;
    }

    if (auto err = json_util::get_string(d.root, "error")) {
        auto kind = json_util::get_string(d.root, "kind");
        ErrorKind k = kind ? error_kind_from_name(*kind) : ErrorKind::RUNTIME;
        *out = make_failure(k, *err);
        return true;
    }

    auto result = json_util::get_raw(d.root, "result");
    if (!result) {
        if (why) *why = "child message has neither result nor error";
        return false;
    }
    if (result->size() > kMaxResultBytes) {
        *out = make_failure(ErrorKind::RUNTIME, "result exceeds " + std::to_string(kMaxResultBytes) + " bytes");
        return true;
    }
    auto output = json_util::get_string(d.root, "output");
    *out = make_success(*result, output ? *output : std::string());
    return true;
}

std::string channel_excerpt(const std::string& raw) {
    return utf8_prefix(raw, kMaxChannelExcerpt);
}

} // namespace capsule
