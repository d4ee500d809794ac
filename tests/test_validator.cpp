#include "test_common.h"
#include "capsule/capabilities.h"
#include "capsule/validator.h"

#include <string>

using namespace capsule;

// Empty string when accepted, else the rejection text.
static std::string reject_reason(const std::string& code) {
    std::string err;
    auto prog = validate_source(code, &err);
    if (prog) return "";
    expect_true(!err.empty(), "rejection must carry a reason: " + code);
    return err;
}

static void expect_rejected(const std::string& code, const std::string& why_fragment) {
    std::string why = reject_reason(code);
    if (why.empty()) die("should be rejected: " + code);
    expect_contains(why, why_fragment, "rejection text for: " + code);
}

static void expect_accepted(const std::string& code) {
    std::string why = reject_reason(code);
    if (!why.empty()) die("should be accepted: " + code + " (" + why + ")");
}

int main() {
    // Test 1: Imports in any form
    expect_rejected("import os", "Import statements are not allowed");
    expect_rejected("import math as m", "Import statements are not allowed");
    expect_rejected("from json import loads", "Import statements are not allowed");
    expect_rejected("fn f() {\n  if true { import os }\n}", "Import statements are not allowed");

    // Test 2: Dunder identifiers in every binding and reference position
    expect_rejected("x = __builtins__", "Access to '__builtins__' is not allowed");
    expect_rejected("let __x = 1", "'__x'");
    expect_rejected("__y = 1", "'__y'");
    expect_rejected("fn __f() { }", "'__f'");
    expect_rejected("fn f(__p) { }", "'__p'");
    expect_rejected("for __i in range(3) { }", "'__i'");
    expect_rejected("g = fn(a, __b) => a", "'__b'");

    // Test 3: Private attributes
    expect_rejected("x = 'a'._secret", "Access to private attributes is not allowed");
    expect_rejected("x = [1].__class__", "Access to private attributes is not allowed");
    expect_rejected("d = {}\nd._hidden = 1", "Access to private attributes is not allowed");

    // Test 4: Deny-listed names
    const char* denied[] = {
        "eval", "exec", "compile", "getattr", "setattr", "delattr", "globals", "locals",
        "vars", "dir", "open", "input", "help", "breakpoint", "os", "sys", "subprocess",
        "socket", "ctypes", "importlib", "pickle", "exit",
    };
    for (const char* name : denied) {
        expect_rejected(std::string("x = ") + name, std::string("Access to '") + name + "' is not allowed");
        expect_true(is_denied_name(name), std::string("is_denied_name: ") + name);
    }

    // Test 5: Reflective attributes, including chains hidden in nested expressions
    expect_rejected("x = f.closure", "Access to 'closure' is not allowed");
    expect_rejected("x = [1, 2].constructor", "'constructor'");
    expect_rejected("x = len([(1).mro])", "'mro'");
    expect_rejected("x = {'a': [fn() => y.globals]}", "'globals'");
    expect_rejected("x = context.subclasses", "'subclasses'");
    expect_rejected("x = 'abc'.system", "'system'");
    expect_true(is_reflective_attribute("bases"), "bases is reflective");
    expect_true(!is_reflective_attribute("upper"), "upper is not reflective");

    // Test 6: Nested expressions are inspected
    expect_rejected("result = sorted([3, 1], fn(x) => eval(x))", "'eval'");
    expect_rejected("if len(context) > 0 { while true { x = [1][0:open] } }", "'open'");
    expect_rejected("m = {'k': 1}\nm[exec] = 2", "'exec'");

    // Test 7: First violation in source order wins
    expect_rejected("x = os\nimport sys", "Access to 'os' is not allowed");
    expect_rejected("import sys\nx = os", "Import statements are not allowed");

    // Test 8: Syntax errors are reported, not executed
    expect_rejected("x = (1", "syntax error at 1:");
    expect_rejected("fn f( { }", "syntax error");

    // Test 9: Ordinary programs pass
    expect_accepted("result = 1 + 2");
    expect_accepted("let total = 0\nfor i in range(10) { total += i }\nresult = total");
    expect_accepted("fn sq(x) { return x * x }\nresult = list(map(sq, [1, 2, 3]))");
    expect_accepted("result = context.get('name', 'anon').upper()");
    expect_accepted("d = {}\nd.count = 1\nresult = d");
    expect_accepted("_x = 1\nresult = _x");

    // Test 10: No catalogue entry is on the deny list
    for (const auto& name : capability_names()) {
        expect_true(!is_denied_name(name), "catalogue name is denied: " + name);
        expect_accepted("f = " + name);
    }
    expect_eq_ll((long long)capability_names().size(), 29, "catalogue size");

    std::cerr << "test_validator: ALL PASSED" << std::endl;
    return 0;
}
