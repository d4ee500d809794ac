#include "capsule/runtime.h"
#include "capsule/capabilities.h"
#include "capsule/deadline.h"
#include "capsule/interpreter.h"
#include "capsule/json_util.h"
#include "capsule/validator.h"

#include <json-c/json.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <new>

namespace capsule {

static bool blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

// json-c saturates integer literals outside int64 instead of failing, so the
// raw text is scanned for them before parsing.
static bool integers_fit(const std::string& text) {
    bool in_string = false;
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (in_string) {
            if (c == '\\') i++;
            else if (c == '"') in_string = false;
            i++;
            continue;
        }
        if (c == '"') {
            in_string = true;
            i++;
            continue;
        }
        if (c != '-' && (c < '0' || c > '9')) {
            i++;
            continue;
        }
        size_t start = i;
        bool integral = true;
        while (i < text.size()) {
            char d = text[i];
            if (d == '.' || d == 'e' || d == 'E') integral = false;
            else if (d != '-' && d != '+' && (d < '0' || d > '9')) break;
            i++;
        }
        if (!integral) continue;
        std::string token = text.substr(start, i - start);
        errno = 0;
        char* end = nullptr;
        std::strtoll(token.c_str(), &end, 10);
        if (errno == ERANGE) return false;
    }
    return true;
}

static bool numbers_finite(json_object* obj) {
    switch (json_object_get_type(obj)) {
    case json_type_double:
        return std::isfinite(json_object_get_double(obj));
    case json_type_array: {
        size_t n = json_object_array_length(obj);
        for (size_t i = 0; i < n; i++) {
            if (!numbers_finite(json_object_array_get_idx(obj, i))) return false;
        }
        return true;
    }
    case json_type_object: {
        json_object_object_foreach(obj, key, val) {
            (void)key;
            if (!numbers_finite(val)) return false;
        }
        return true;
    }
    default:
        return true;
    }
}

bool check_context(const std::string& context_json, std::string* error) {
    if (blank(context_json)) return true;
    std::string perr;
    json_util::Doc d = json_util::parse(context_json, &perr, json_util::kMaxContextDepth);
    if (!perr.empty()) {
        if (error) *error = "context is not valid JSON: " + perr;
        return false;
    }
    if (!json_util::is_object(d)) {
        if (error) *error = "context must be a JSON object";
        return false;
    }
    if (!integers_fit(context_json)) {
        if (error) *error = "context integer out of range: does not fit in 64 bits";
        return false;
    }
    if (!numbers_finite(d.root)) {
        if (error) *error = "context number out of range: not finite";
        return false;
    }
    return true;
}

static Value load_context(const std::string& context_json) {
    std::string err;
    if (!check_context(context_json, &err)) throw SandboxError(ErrorKind::VALIDATION, err);
    if (blank(context_json)) {
        Value empty = Value::map();
        empty.as_map().frozen = true;
        return empty;
    }
    json_util::Doc d = json_util::parse(context_json, nullptr, json_util::kMaxContextDepth);
    return value_from_json(d.root, true);
}

static std::string serialize_result(const Value& v) {
    json_object* obj = value_to_json(v);
    std::string s = json_util::to_string(obj);
    if (obj) json_object_put(obj);
    if (s.size() > kMaxResultBytes) {
        throw SandboxError(ErrorKind::RUNTIME, "result exceeds " + std::to_string(kMaxResultBytes) + " bytes");
    }
    return s;
}

ExecutionOutcome execute_program(const Program& program, const std::string& context_json,
                                 double timeout_seconds) {
    try {
        Value context = load_context(context_json);

        OutputSink sink;
        std::string result_json;
        {
            Interpreter in(sink);
            in.bind_context(std::move(context));
            in.set_time_limit(timeout_seconds);

            DeadlineGuard deadline(timeout_seconds);
            in.run(program);
            result_json = serialize_result(in.result());
        }
        return normalize_outcome(make_success(std::move(result_json), sink.text()));
    } catch (const SandboxError& e) {
        return make_failure(e.kind(), e.what());
    } catch (const SyntaxError& e) {
        return make_failure(ErrorKind::VALIDATION, e.what());
    } catch (const std::bad_alloc&) {
        return make_failure(ErrorKind::RUNTIME, "memory limit exceeded");
    } catch (const std::exception& e) {
        return make_failure(ErrorKind::RUNTIME, e.what());
    }
}

ExecutionOutcome run_snippet(const std::string& code, const std::string& context_json,
                             double timeout_seconds) {
    std::string err;
    std::unique_ptr<Program> program;
    try {
        program = validate_source(code, &err);
    } catch (const std::bad_alloc&) {
        return make_failure(ErrorKind::RESOURCE, "memory limit exceeded during validation");
    }
    if (!program) return make_failure(ErrorKind::VALIDATION, err);
    return execute_program(*program, context_json, timeout_seconds);
}

} // namespace capsule
