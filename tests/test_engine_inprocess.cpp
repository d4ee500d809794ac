#include "test_common.h"
#include "capsule/engine.h"
#include "capsule/limits.h"
#include "capsule/strategy.h"
#include "capsule/validator.h"

#include <csignal>
#include <cstdio>
#include <fstream>
#include <memory>
#include <string>

#include <unistd.h>

using namespace capsule;

static EngineConfig inprocess_config(double timeout = 5.0) {
    EngineConfig cfg;
    cfg.isolation = IsolationMode::INPROCESS;
    cfg.limits.timeout_seconds = timeout;
    return cfg;
}

static bool same_limits(const LimitSnapshot& a, const LimitSnapshot& b) {
    return a.data.soft == b.data.soft && a.data.hard == b.data.hard &&
           a.fsize.soft == b.fsize.soft && a.fsize.hard == b.fsize.hard &&
           a.nofile.soft == b.nofile.soft && a.nofile.hard == b.nofile.hard;
}

static std::string kind_of(const ExecutionOutcome& o) {
    return error_kind_name(o.error_kind);
}

int main() {
    const LimitSnapshot before = current_limits();
    struct sigaction alarm_before;
    sigaction(SIGALRM, nullptr, &alarm_before);

    Engine engine(inprocess_config());
    expect_eq_str(engine.strategy_name(), "inprocess", "strategy");

    // Test 1: Result, output and context
    {
        ExecutionOutcome o = engine.execute("print('hello')\nresult = {'n': context['n'] * 2}", "{\"n\": 21}");
        expect_true(o.succeeded, "basic run succeeds: " + o.error.value_or(""));
        expect_eq_str(o.result_json.value_or(""), "{\"n\":42}", "result");
        expect_eq_str(o.captured_output, "hello", "output");
        expect_eq_str(kind_of(o), "None", "success kind");
    }

    // Test 2: Validation failures never reach the interpreter
    {
        ExecutionOutcome o = engine.execute("print('side effect')\nimport os", "");
        expect_eq_str(kind_of(o), "ValidationError", "import rejected");
        expect_eq_str(o.error.value_or(""), "ValidationError: Import statements are not allowed", "import text");
        expect_eq_str(o.captured_output, "", "nothing ran");

        o = engine.execute("x = __import__", "");
        expect_eq_str(kind_of(o), "ValidationError", "dunder rejected");

        o = engine.execute(std::string(kMaxCodeBytes + 1, '#'), "");
        expect_eq_str(kind_of(o), "ValidationError", "oversized code rejected");
        expect_contains(o.error.value_or(""), "code exceeds", "oversized code text");
    }

    // Test 3: Context must be a JSON object
    {
        ExecutionOutcome o = engine.execute("result = 1", "[1, 2]");
        expect_eq_str(kind_of(o), "ValidationError", "array context rejected");
        expect_contains(o.error.value_or(""), "context must be a JSON object", "array context text");

        o = engine.execute("result = 1", "{\"a\": ");
        expect_eq_str(kind_of(o), "ValidationError", "broken context rejected");
        expect_contains(o.error.value_or(""), "context is not valid JSON", "broken context text");

        o = engine.execute("result = len(context)", "   ");
        expect_true(o.succeeded, "blank context is an empty map");
        expect_eq_str(o.result_json.value_or(""), "0", "blank context is empty");

        o = engine.execute("result = context['id']", "{\"id\": 18446744073709551615}");
        expect_eq_str(kind_of(o), "ValidationError", "unsigned 64-bit context integer rejected");
        expect_contains(o.error.value_or(""), "context integer out of range", "wide integer text");

        o = engine.execute("result = context['v']", "{\"v\": [1, -99999999999999999999]}");
        expect_eq_str(kind_of(o), "ValidationError", "nested negative overflow rejected");

        o = engine.execute("result = context['x']", "{\"x\": 1e400}");
        expect_eq_str(kind_of(o), "ValidationError", "overflowing float rejected");

        o = engine.execute("result = context['n']", "{\"n\": -9223372036854775808, \"s\": \"99999999999999999999\"}");
        expect_true(o.succeeded, "int64 bounds accepted: " + o.error.value_or(""));
        expect_eq_str(o.result_json.value_or(""), "-9223372036854775808", "int64 minimum kept");
    }

    // Test 4: Timeout
    {
        Engine fast(inprocess_config(0.3));
        ExecutionOutcome o = fast.execute("while true { }", "");
        expect_eq_str(kind_of(o), "Timeout", "loop times out");
        expect_eq_str(o.error.value_or(""), "Timeout: execution exceeded 0.3s limit", "timeout text");
        expect_true(!o.result_json.has_value(), "timeout has no result");

        o = fast.execute("result = 1", "");
        expect_true(o.succeeded, "engine usable after a timeout");
    }

    // Test 5: Output is capped
    {
        ExecutionOutcome o = engine.execute("for i in range(100) { print('x' * 900) }\nresult = 1", "");
        expect_true(o.succeeded, "chatty snippet succeeds");
        expect_eq_ll((long long)o.captured_output.size(), 16384, "output cut to exactly the cap");
        expect_contains(o.captured_output, "[output truncated]", "truncation marker");

        o = engine.execute("for i in range(100) { print('\xf0\x9f\x98\x80' * 200) }\nresult = 1", "");
        expect_true(o.succeeded, "multibyte chatty snippet succeeds");
        expect_eq_ll((long long)o.captured_output.size(), 16384, "multibyte output cut to exactly the cap");
        expect_contains(o.captured_output, "[output truncated]", "multibyte truncation marker");
    }

    // Test 6: Runtime failures
    {
        ExecutionOutcome o = engine.execute("print('partial')\nresult = [1][5]", "");
        expect_eq_str(kind_of(o), "RuntimeError", "index error");
        expect_eq_str(o.captured_output, "", "failure output dropped");

        o = engine.execute("result = 'a' * 1000000000", "");
        expect_eq_str(kind_of(o), "RuntimeError", "oversized string");
        expect_contains(o.error.value_or(""), "memory limit exceeded", "oversized string text");

        o = engine.execute("result = ['' * 9223372036854775807, [] * 9223372036854775807, () * 9223372036854775807]", "");
        expect_true(o.succeeded, "huge repeat of an empty sequence returns: " + o.error.value_or(""));
        expect_eq_str(o.result_json.value_or(""), "[\"\",[],[]]", "huge repeat of an empty sequence is empty");
    }

    // Test 7: Same input, same outcome
    {
        const std::string code = "d = {}\nfor w in 'b a c a'.split(' ') { d[w] = d.get(w, 0) + 1 }\nresult = d";
        ExecutionOutcome a = engine.execute(code, "");
        ExecutionOutcome b = engine.execute(code, "");
        expect_true(a.succeeded && b.succeeded, "word count succeeds");
        expect_eq_str(a.result_json.value_or(""), "{\"a\":2,\"b\":1,\"c\":1}", "word count result");
        expect_eq_str(a.result_json.value_or(""), b.result_json.value_or(""), "repeatable result");
    }

    // Test 8: Process state is restored after every run
    expect_true(same_limits(current_limits(), before), "rlimits restored");
    {
        struct sigaction now;
        sigaction(SIGALRM, nullptr, &now);
        expect_true(now.sa_handler == alarm_before.sa_handler, "SIGALRM disposition restored");
    }

    // Test 9: Every call is counted
    {
        Engine counted(inprocess_config());
        counted.execute("result = 1", "");
        counted.execute("import os", "");
        counted.execute("result = 1", "[]");
        expect_eq_ll((long long)counted.execution_count(), 3, "execution count");
    }

    // Test 10: Audit log gets one line per execution
    {
        char tmpl[] = "/tmp/capsule-engine-audit-XXXXXX";
        int fd = mkstemp(tmpl);
        expect_true(fd >= 0, "mkstemp");
        close(fd);
        std::remove(tmpl);

        EngineConfig cfg = inprocess_config();
        cfg.audit_log_path = tmpl;
        {
            Engine audited(cfg);
            audited.execute("result = 1", "");
            audited.execute("import os", "");
        }
        std::ifstream in(tmpl);
        std::string line;
        int n = 0;
        while (std::getline(in, line)) {
            if (!line.empty()) n++;
        }
        expect_eq_ll(n, 2, "one audit line per execution");
        std::remove(tmpl);
    }

    // Test 11: Strategy runs a submission directly
    {
        const std::string code = "result = context['a'] + 1";
        const std::string ctx = "{\"a\": 1}";
        std::string err;
        std::unique_ptr<Program> program = validate_source(code, &err);
        expect_true(program != nullptr, "snippet validates: " + err);
        InProcessStrategy direct;
        ExecutionOutcome o = direct.run(Submission{*program, code, ctx}, inprocess_config().limits);
        expect_true(o.succeeded, "direct run succeeds: " + o.error.value_or(""));
        expect_eq_str(o.result_json.value_or(""), "2", "direct run result");

        UnavailableStrategy none("process isolation unavailable");
        o = none.run(Submission{*program, code, ctx}, inprocess_config().limits);
        expect_eq_str(kind_of(o), "ResourceError", "unavailable strategy fails");
    }

    std::cerr << "test_engine_inprocess: ALL PASSED" << std::endl;
    return 0;
}
