#include "test_common.h"
#include "capsule/errors.h"
#include "capsule/lexer.h"
#include "capsule/parser.h"

#include <string>

using namespace capsule;

static std::string syntax_error_of(const std::string& src) {
    try {
        parse_program(src);
    } catch (const SyntaxError& e) {
        return e.what();
    }
    return "";
}

int main() {
    // Test 1: Token stream basics
    {
        auto toks = tokenize("let x = 1.5 + 2e3 # comment\ny += 'a\\tb'");
        expect_true(toks.size() >= 10, "token count");
        expect_true(toks[0].type == Tok::LET, "let keyword");
        expect_true(toks[1].type == Tok::IDENT && toks[1].text == "x", "identifier");
        expect_true(toks[3].type == Tok::FLOAT && toks[3].fval == 1.5, "float literal");
        expect_true(toks[5].type == Tok::FLOAT && toks[5].fval == 2000.0, "exponent literal");
        expect_true(toks[6].type == Tok::NEWLINE, "comment runs to end of line");
        expect_true(toks[8].type == Tok::PLUS_ASSIGN, "augmented assignment");
        expect_true(toks[9].type == Tok::STRING && toks[9].text == "a\tb", "escape decoded");
        expect_eq_ll(toks[9].line, 2, "line tracking");
    }

    // Test 2: Newlines inside brackets are not statement breaks
    {
        auto toks = tokenize("f(1,\n 2)\n[3,\n4]");
        int newlines = 0;
        for (const auto& t : toks) newlines += t.type == Tok::NEWLINE;
        expect_eq_ll(newlines, 1, "only the top-level newline survives");
    }

    // Test 3: Integer overflow is a lexical error
    expect_contains(syntax_error_of("x = 99999999999999999999"), "syntax error at 1:", "int literal overflow");

    // Test 4: Unterminated string
    expect_contains(syntax_error_of("x = 'abc"), "syntax error", "unterminated string");

    // Test 5: Full grammar round
    {
        const char* src =
            "import os.path as p\n"
            "from a.b import c, d\n"
            "fn add(a, b) { return a + b }\n"
            "let f = fn(x) => x * 2\n"
            "if 1 < 2 { x = [1, 2][0:1] } else if false { x = {'k': (1,)} } else { x = null }\n"
            "for i, v in enumerate([1]) { continue }\n"
            "while true { break }\n"
            "obj.attr = not 1 in [1] or 2 ** 3 // 2 % 5 >= 1\n";
        auto prog = parse_program(src);
        expect_eq_ll((long long)prog->body.size(), 8, "statement count");
        expect_true(prog->body[0]->kind == StmtKind::IMPORT, "import statement");
        auto* imp = static_cast<ImportStmt*>(prog->body[0].get());
        expect_eq_str(imp->module, "os.path", "dotted module name");
        auto* from = static_cast<ImportStmt*>(prog->body[1].get());
        expect_eq_ll((long long)from->names.size(), 2, "from-import names");
        expect_true(prog->body[2]->kind == StmtKind::FN_DEF, "fn definition");
        expect_true(prog->body[3]->kind == StmtKind::LET, "let statement");
        expect_true(prog->body[4]->kind == StmtKind::IF, "if statement");
        auto* iff = static_cast<IfStmt*>(prog->body[4].get());
        expect_eq_ll((long long)iff->else_body.size(), 1, "else-if nests as one statement");
        auto* loop = static_cast<ForStmt*>(prog->body[5].get());
        expect_eq_ll((long long)loop->vars.size(), 2, "for unpacking");
        expect_true(prog->body[7]->kind == StmtKind::ASSIGN, "member assignment");
        auto* as = static_cast<AssignStmt*>(prog->body[7].get());
        expect_true(as->target->kind == ExprKind::MEMBER, "assignment target is member");
        expect_true(as->value->kind == ExprKind::BINARY, "or-expression");
        expect_true(static_cast<BinaryExpr*>(as->value.get())->op == Op::OR, "or binds loosest");
    }

    // Test 6: Misplaced control flow is rejected at parse time
    expect_contains(syntax_error_of("return 1"), "'return' outside function", "return at top level");
    expect_contains(syntax_error_of("break"), "outside loop", "break at top level");
    expect_contains(syntax_error_of("while true { fn f() { continue } }"), "outside loop",
                    "continue inside nested fn body");

    // Test 7: Invalid assignment targets
    expect_true(!syntax_error_of("f() = 1").empty(), "call is not assignable");
    expect_true(!syntax_error_of("1 = x").empty(), "literal is not assignable");

    // Test 8: Duplicate parameters
    expect_true(!syntax_error_of("fn f(a, a) { }").empty(), "duplicate parameter");

    // Test 9: Nesting depth is capped, not a stack overflow
    {
        std::string deep(5000, '(');
        deep = "x = " + deep + "1" + std::string(5000, ')');
        expect_contains(syntax_error_of(deep), "too deep", "deep parentheses");

        std::string chain = "x = 1";
        for (int i = 0; i < 20000; i++) chain += " + 1";
        expect_contains(syntax_error_of(chain), "too deeply nested", "long operator chain");

        std::string blocks;
        for (int i = 0; i < 1000; i++) blocks += "if true { ";
        for (int i = 0; i < 1000; i++) blocks += "} ";
        expect_contains(syntax_error_of(blocks), "too deep", "deep blocks");
    }

    // Test 10: Moderate chains still parse
    {
        std::string chain = "x = 1";
        for (int i = 0; i < 100; i++) chain += " + 1";
        expect_true(syntax_error_of(chain).empty(), "100-term chain parses");
    }

    std::cerr << "test_lexer_parser: ALL PASSED" << std::endl;
    return 0;
}
