#include "test_common.h"
#include "capsule/capabilities.h"
#include "capsule/outcome.h"

#include <string>

using namespace capsule;

static ExecutionOutcome parse_ok(const std::string& raw) {
    ExecutionOutcome o;
    std::string why;
    if (!parse_child_message(raw, &o, &why)) die("child message should parse: " + raw + " (" + why + ")");
    return o;
}

static std::string parse_fail(const std::string& raw) {
    ExecutionOutcome o;
    std::string why;
    if (parse_child_message(raw, &o, &why)) die("child message should not parse: " + raw);
    return why;
}

int main() {
    // Test 1: Constructors
    {
        ExecutionOutcome f = make_failure(ErrorKind::TIMEOUT, "execution exceeded 5s limit");
        expect_true(!f.succeeded, "failure");
        expect_eq_str(f.error.value_or(""), "Timeout: execution exceeded 5s limit", "failure text");
        ExecutionOutcome n = make_failure(ErrorKind::NONE, "x");
        expect_eq_str(error_kind_name(n.error_kind), "RuntimeError", "NONE failure becomes RuntimeError");
    }

    // Test 2: normalize_outcome invariants
    {
        ExecutionOutcome f = make_failure(ErrorKind::RUNTIME, "boom");
        f.result_json = "1";
        f.captured_output = "partial";
        f = normalize_outcome(f);
        expect_true(!f.result_json.has_value(), "failure drops result");
        expect_eq_str(f.captured_output, "", "failure drops output");

        ExecutionOutcome s = make_success("[1]", std::string(kMaxOutputChars + 500, 'a'));
        s.error = "stale";
        s = normalize_outcome(s);
        expect_true(!s.error.has_value(), "success drops error");
        expect_true(s.captured_output.size() <= kMaxOutputChars, "success output capped");
        expect_contains(s.captured_output, "[output truncated]", "truncation marker");

        std::string wide;
        for (int i = 0; i < 5000; i++) wide += "\xf0\x9f\x98\x80";
        std::string cut = truncate_output(wide);
        expect_eq_ll((long long)cut.size(), (long long)kMaxOutputChars, "multibyte output cut to exactly the cap");
        size_t nl = cut.rfind('\n');
        expect_true(nl != std::string::npos && nl % 4 == 0, "cut lands on a sequence boundary");
        expect_eq_str(cut.substr(cut.size() - 18), "[output truncated]", "multibyte truncation marker");

        ExecutionOutcome bare;
        bare.succeeded = true;
        bare = normalize_outcome(bare);
        expect_eq_str(bare.result_json.value_or(""), "null", "missing result becomes null");

        ExecutionOutcome odd;
        odd = normalize_outcome(odd);
        expect_eq_str(error_kind_name(odd.error_kind), "RuntimeError", "kindless failure becomes RuntimeError");
        expect_true(odd.error.has_value(), "kindless failure gets a message");
    }

    // Test 3: outcome_to_json shape
    {
        std::string j = outcome_to_json(make_success("{\"a\":[1,2]}", "hi"));
        expect_eq_str(j, "{\"succeeded\":true,\"result\":{\"a\":[1,2]},\"output\":\"hi\",\"error\":null,\"error_kind\":\"None\"}",
                      "success json");
        j = outcome_to_json(make_failure(ErrorKind::VALIDATION, "Import statements are not allowed"));
        expect_contains(j, "\"succeeded\":false", "failure flag");
        expect_contains(j, "\"result\":null", "failure result is null");
        expect_contains(j, "\"error_kind\":\"ValidationError\"", "failure kind");
    }

    // Test 4: Child messages round through the channel format
    {
        ExecutionOutcome o = parse_ok(child_success_json("[1,\"x\"]", "line1\nline2"));
        expect_true(o.succeeded, "success message");
        expect_eq_str(o.result_json.value_or(""), "[1,\"x\"]", "result text");
        expect_eq_str(o.captured_output, "line1\nline2", "output text");

        o = parse_ok(child_failure_json(ErrorKind::TIMEOUT, "execution exceeded 2s limit"));
        expect_true(!o.succeeded, "failure message");
        expect_eq_str(o.error.value_or(""), "Timeout: execution exceeded 2s limit", "failure text");

        o = parse_ok("{\"result\":null}");
        expect_eq_str(o.result_json.value_or(""), "null", "null result is a result");

        o = parse_ok("loader noise\n\n{\"result\":3,\"output\":\"\"}\n\n");
        expect_eq_str(o.result_json.value_or(""), "3", "last non-empty line wins");

        o = parse_ok("{\"error\":\"x\",\"kind\":\"Bogus\"}");
        expect_eq_str(error_kind_name(o.error_kind), "RuntimeError", "unknown kind becomes RuntimeError");

        std::string big = "{\"result\":\"" + std::string(kMaxResultBytes, 'z') + "\"}";
        o = parse_ok(big);
        expect_true(!o.succeeded, "oversized result refused");
        expect_contains(o.error.value_or(""), "result exceeds", "oversized result text");
    }

    // Test 5: Malformed channel content
    expect_contains(parse_fail(""), "no output", "empty channel");
    expect_contains(parse_fail("\n  \n"), "no output", "blank channel");
    expect_contains(parse_fail("Segmentation fault"), "not JSON", "garbage line");
    expect_contains(parse_fail("[1,2]"), "not a JSON object", "array line");
    expect_contains(parse_fail("{\"output\":\"x\"}"), "neither result nor error", "object without result");

    // Test 6: Excerpts stay within bounds and whole code points
    {
        std::string raw = std::string(kMaxChannelExcerpt - 1, 'a') + "\xc3\xa9" + "tail";
        std::string ex = channel_excerpt(raw);
        expect_eq_ll((long long)ex.size(), (long long)kMaxChannelExcerpt - 1, "split code point dropped");
        expect_eq_str(channel_excerpt("short"), "short", "short text kept");
    }

    std::cerr << "test_outcome: ALL PASSED" << std::endl;
    return 0;
}
