#include "test_common.h"
#include "capsule/runtime.h"

#include <string>

using namespace capsule;

static ExecutionOutcome run(const std::string& code, const std::string& ctx = "", double timeout = 5.0) {
    return run_snippet(code, ctx, timeout);
}

static void expect_result(const std::string& code, const std::string& want, const std::string& ctx = "") {
    ExecutionOutcome o = run(code, ctx);
    if (!o.succeeded) die("snippet failed: " + code + " -> " + o.error.value_or("?"));
    expect_true(o.result_json.has_value(), "success carries a result: " + code);
    expect_eq_str(*o.result_json, want, "result of: " + code);
}

static void expect_failure(const std::string& code, ErrorKind kind, const std::string& fragment,
                           const std::string& ctx = "") {
    ExecutionOutcome o = run(code, ctx);
    if (o.succeeded) die("snippet should fail: " + code);
    expect_eq_str(error_kind_name(o.error_kind), error_kind_name(kind), "error kind of: " + code);
    expect_true(o.error.has_value(), "failure carries an error: " + code);
    expect_contains(*o.error, fragment, "error text of: " + code);
    expect_true(!o.result_json.has_value(), "failure has no result: " + code);
}

int main() {
    // Test 1: Arithmetic and operator semantics
    expect_result("result = 1 + 2 * 3", "7");
    expect_result("result = [7 // 2, -7 // 2, -7 % 3, 2 ** 10]", "[3,-4,2,1024]");
    expect_result("result = 7 / 2", "3.5");
    expect_result("result = 0.1 + 0.2", "0.30000000000000004");
    expect_result("result = 'ab' * 3", "\"ababab\"");
    expect_result("result = '' * 9223372036854775807", "\"\"");
    expect_result("result = [] * 9223372036854775807", "[]");
    expect_result("result = () * 9223372036854775807", "[]");
    expect_result("result = [1, 2] * 0", "[]");
    expect_result("result = [2 in [1, 2], 'a' in {'a': 1}, 'ell' in 'hello', 3 not in [1]]", "[true,true,true,true]");
    expect_result("x = 5\nx += 2\nx *= 3\nresult = x", "21");

    // Test 2: Strings (byte semantics, methods, slicing)
    expect_result("result = 'a,b,c'.split(',')", "[\"a\",\"b\",\"c\"]");
    expect_result("result = '-'.join(['x', 'y'])", "\"x-y\"");
    expect_result("result = '  hi '.strip().upper()", "\"HI\"");
    expect_result("result = 'hello'[-3:5]", "\"llo\"");
    expect_result("result = len('h\xc3\xa9llo')", "6");
    expect_result("result = ord(chr(233))", "233");

    // Test 3: Containers and their JSON shapes
    expect_result("l = [3, 1, 2]\nl.sort()\nl.append(4)\nresult = l", "[1,2,3,4]");
    expect_result("result = [1, 2, 3, 4][1:3]", "[2,3]");
    expect_result("result = {'b': 2, 'a': 1}", "{\"a\":1,\"b\":2}");
    expect_result("result = (1, 2)", "[1,2]");
    expect_result("result = range(3)", "[0,1,2]");
    expect_result("result = set([3, 1, 1])", "[1,3]");
    expect_result("d = {'a': 1}\nd.update({'b': 2})\nresult = [d.get('c', 0), len(d.keys()), d.pop('a')]", "[0,2,1]");
    expect_result("s = set([1, 2])\ns.add(3)\nresult = sorted(s.union(set([9])))", "[1,2,3,9]");
    expect_result("d = {'keys': 5}\nresult = d['keys']", "5");
    expect_result("result = null", "null");

    // Test 4: Functions, closures, recursion, lambdas
    expect_result("fn make(n) {\n  return fn(x) => x + n\n}\nadd5 = make(5)\nresult = add5(10)", "15");
    expect_result("fn fib(n) {\n  if n < 2 { return n }\n  return fib(n - 1) + fib(n - 2)\n}\nresult = fib(15)", "610");
    expect_result("fn counter() {\n  n = 0\n  fn inc() {\n    n += 1\n    return n\n  }\n  return inc\n}\n"
                  "c = counter()\nc()\nc()\nresult = c()",
                  "3");
    expect_failure("fn r(n) { return r(n + 1) }\nresult = r(0)", ErrorKind::RUNTIME, "maximum recursion depth exceeded");
    expect_failure("fn f(a) { return a }\nresult = f(1, 2)", ErrorKind::RUNTIME, "takes 1 argument(s)");

    // Test 5: Scoping of plain assignment versus let
    expect_result("x = 1\nfn f() { x = 2 }\nf()\nresult = x", "2");
    expect_result("x = 1\nfn g() { let x = 5 }\ng()\nresult = x", "1");

    // Test 6: Control flow
    expect_result("t = 0\nfor i in range(10) {\n  if i == 7 { break }\n  if i % 2 == 0 { continue }\n  t += i\n}\nresult = t",
                  "9");
    expect_result("i = 0\nwhile i < 5 { i += 1 }\nresult = i", "5");
    expect_result("ks = []\nfor k in {'b': 1, 'a': 2} { ks.append(k) }\nresult = ks", "[\"a\",\"b\"]");
    expect_result("out = []\nfor a, b in [(1, 2), (3, 4)] { out.append(a * b) }\nresult = out", "[2,12]");

    // Test 7: Catalogue builtins
    expect_result("result = sum([1, 2, 3])", "6");
    expect_result("result = sorted(['bb', 'a', 'ccc'], fn(s) => len(s), true)", "[\"ccc\",\"bb\",\"a\"]");
    expect_result("result = filter(fn(x) => x % 2 == 0, range(6))", "[0,2,4]");
    expect_result("result = map(fn(x) => x * x, [1, 2, 3])", "[1,4,9]");
    expect_result("result = [min(3, 1, 2), max([4, 9]), abs(-3), all([1, true]), any([0, false]), pow(2, 10, 1000)]",
                  "[1,9,3,true,false,24]");
    expect_result("result = [round(2.5), round(3.5), round(1.25, 1)]", "[2,4,1.2]");
    expect_result("result = [int('42'), float('1.5'), str(3), int(3.9), bool(0)]", "[42,1.5,\"3\",3,false]");
    expect_result("result = [type(1), type(1.0), type('s'), type([]), type({}), isinstance(true, int), "
                  "isinstance(1, (str, float))]",
                  "[\"int\",\"float\",\"str\",\"list\",\"dict\",true,false]");
    expect_result("result = list(zip([1, 2], [3, 4]))", "[[1,3],[2,4]]");
    expect_result("result = list(enumerate(['a', 'b']))", "[[0,\"a\"],[1,\"b\"]]");

    // Test 8: print() capture
    {
        ExecutionOutcome o = run("print('a', 1, [2])\nprint('b')\nresult = true");
        expect_true(o.succeeded, "print snippet succeeds");
        expect_eq_str(o.captured_output, "a 1 [2]\nb", "captured output");
    }
    {
        ExecutionOutcome o = run("print('x')\nresult = 1 / 0");
        expect_true(!o.succeeded, "division by zero fails");
        expect_eq_str(o.captured_output, "", "failure drops captured output");
    }
    {
        ExecutionOutcome o = run("x = 1");
        expect_true(o.succeeded, "snippet without result succeeds");
        expect_eq_str(o.result_json.value_or(""), "null", "missing result serializes as null");
    }

    // Test 9: Context binding is read-only
    const std::string ctx = "{\"items\": [1, 2, 3], \"name\": \"x\", \"nested\": {\"k\": [true]}}";
    expect_result("result = sum(context['items'])", "6", ctx);
    expect_result("result = context.name", "\"x\"", ctx);
    expect_result("result = context['nested']['k'][0]", "true", ctx);
    expect_result("result = len(context)", "0");
    expect_failure("context = 1", ErrorKind::RUNTIME, "cannot assign to read-only name 'context'", ctx);
    expect_failure("context['items'].append(4)", ErrorKind::RUNTIME, "read-only", ctx);
    expect_failure("context['new'] = 1", ErrorKind::RUNTIME, "read-only", ctx);
    expect_result("c = list(context['items'])\nc.append(4)\nresult = c", "[1,2,3,4]", ctx);

    // Test 10: Runtime failures
    expect_failure("result = undefined_name", ErrorKind::RUNTIME, "name 'undefined_name' is not defined");
    expect_failure("result = 9223372036854775807 + 1", ErrorKind::RUNTIME, "integer overflow");
    expect_failure("result = 1 / 0", ErrorKind::RUNTIME, "division by zero");
    expect_failure("result = len", ErrorKind::RUNTIME, "function is not JSON-serializable");
    expect_failure("l = [1]\nl.append(l)\nresult = l", ErrorKind::RUNTIME, "cyclic container");
    expect_failure("result = 'a' * 1000000000", ErrorKind::RUNTIME, "memory limit exceeded");
    expect_failure("result = 1 + 'a'", ErrorKind::RUNTIME, "RuntimeError: ");

    // Test 11: Validation happens before anything runs
    expect_failure("print('never')\nimport os", ErrorKind::VALIDATION, "Import statements are not allowed");
    expect_failure("result = (1", ErrorKind::VALIDATION, "");

    // Test 12: Timeout
    {
        ExecutionOutcome o = run("while true { }", "", 0.3);
        expect_true(!o.succeeded, "infinite loop fails");
        expect_eq_str(error_kind_name(o.error_kind), "Timeout", "infinite loop kind");
        expect_eq_str(o.error.value_or(""), "Timeout: execution exceeded 0.3s limit", "timeout text");
    }

    // Test 13: Deep structures tear down without blowing the stack
    expect_result("l = []\nfor i in range(100000) { l = [l] }\nresult = 1", "1");

    std::cerr << "test_interpreter: ALL PASSED" << std::endl;
    return 0;
}
