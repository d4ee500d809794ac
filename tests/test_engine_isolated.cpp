#include "test_common.h"
#include "capsule/engine.h"

#include <string>
#include <thread>
#include <vector>

using namespace capsule;

static EngineConfig process_config(const std::string& bin, double timeout = 5.0) {
    EngineConfig cfg;
    cfg.isolation = IsolationMode::PROCESS;
    cfg.childhost_bin = bin;
    cfg.limits.timeout_seconds = timeout;
    return cfg;
}

static std::string kind_of(const ExecutionOutcome& o) {
    return error_kind_name(o.error_kind);
}

int main(int argc, char** argv) {
    if (argc < 2) die("usage: test_engine_isolated <capsule_childhost>");
    const std::string childhost = argv[1];

    Engine engine(process_config(childhost));
    expect_eq_str(engine.strategy_name(), "process", "strategy");

    // Test 1: Result, output and context through the child
    {
        ExecutionOutcome o = engine.execute("print('from child')\nresult = [context['a'], sum(range(5))]",
                                            "{\"a\": \"x\"}");
        expect_true(o.succeeded, "isolated run succeeds: " + o.error.value_or(""));
        expect_eq_str(o.result_json.value_or(""), "[\"x\",10]", "result");
        expect_eq_str(o.captured_output, "from child", "output");
    }

    // Test 2: Failures keep their kind across the channel
    {
        ExecutionOutcome o = engine.execute("result = 1 / 0", "");
        expect_eq_str(kind_of(o), "RuntimeError", "runtime error kind");
        expect_eq_str(o.error.value_or(""), "RuntimeError: division by zero", "runtime error text");

        o = engine.execute("import socket", "");
        expect_eq_str(kind_of(o), "ValidationError", "validation happens in the parent");

        o = engine.execute("context = 2", "{}");
        expect_contains(o.error.value_or(""), "read-only", "context frozen in the child");
    }

    // Test 3: Timeout
    {
        Engine fast(process_config(childhost, 0.5));
        ExecutionOutcome o = fast.execute("while true { }", "");
        expect_eq_str(kind_of(o), "Timeout", "child loop times out");
        expect_eq_str(o.error.value_or(""), "Timeout: execution exceeded 0.5s limit", "timeout text");
    }

    // Test 4: Output cap and large results
    {
        ExecutionOutcome o = engine.execute("for i in range(100) { print('y' * 900) }\nresult = len('z' * 500000)", "");
        expect_true(o.succeeded, "chatty child succeeds");
        expect_true(o.captured_output.size() <= 16384, "child output capped");
        expect_eq_str(o.result_json.value_or(""), "500000", "result after output");
    }

    // Test 5: Concurrent isolated executions
    {
        std::vector<std::thread> threads;
        std::vector<std::string> results(4);
        for (int i = 0; i < 4; i++) {
            threads.emplace_back([&, i] {
                ExecutionOutcome o = engine.execute("result = context['i'] * 10", "{\"i\": " + std::to_string(i) + "}");
                results[i] = o.result_json.value_or("failed: " + o.error.value_or(""));
            });
        }
        for (auto& t : threads) t.join();
        for (int i = 0; i < 4; i++) {
            expect_eq_str(results[i], std::to_string(i * 10), "concurrent result " + std::to_string(i));
        }
    }

    // Test 6: Required isolation with no usable child host
    {
        Engine broken(process_config("/nonexistent/capsule_childhost"));
        expect_eq_str(broken.strategy_name(), "unavailable", "no silent fallback");
        ExecutionOutcome o = broken.execute("result = 1", "");
        expect_eq_str(kind_of(o), "ResourceError", "unavailable isolation fails");

        EngineConfig cfg = process_config("/nonexistent/capsule_childhost");
        cfg.isolation = IsolationMode::AUTO;
        Engine fallback(cfg);
        expect_eq_str(fallback.strategy_name(), "inprocess", "auto falls back to in-process");
    }

    // Test 7: A child that does not speak the protocol
    {
        Engine silent(process_config("/bin/true"));
        ExecutionOutcome o = silent.execute("result = 1", "");
        expect_eq_str(kind_of(o), "ChannelError", "silent child");
        expect_contains(o.error.value_or(""), "child produced no output", "silent child text");

        Engine chatty(process_config("/bin/echo"));
        o = chatty.execute("result = 1", "");
        expect_eq_str(kind_of(o), "ChannelError", "non-JSON child");
        expect_contains(o.error.value_or(""), "--timeout", "excerpt of the raw output");
    }

#if defined(__linux__) && (defined(__x86_64__) || defined(__aarch64__))
    // Test 8: The child host runs under the seccomp allowlist
    {
        EngineConfig cfg = process_config(childhost);
        cfg.enable_seccomp = true;
        Engine locked(cfg);
        ExecutionOutcome o = locked.execute("print('ok')\nresult = sorted([3, 1, 2])", "{\"k\": [1]}");
        expect_true(o.succeeded, "seccomp child succeeds: " + o.error.value_or(""));
        expect_eq_str(o.result_json.value_or(""), "[1,2,3]", "seccomp child result");

        EngineConfig fast_cfg = process_config(childhost, 0.3);
        fast_cfg.enable_seccomp = true;
        Engine locked_fast(fast_cfg);
        o = locked_fast.execute("while true { }", "");
        expect_eq_str(kind_of(o), "Timeout", "seccomp child still times out");
    }
#endif

    std::cerr << "test_engine_isolated: ALL PASSED" << std::endl;
    return 0;
}
