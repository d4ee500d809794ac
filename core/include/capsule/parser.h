#pragma once

#include "capsule/ast.h"
#include "capsule/lexer.h"

#include <memory>
#include <string>
#include <vector>

namespace capsule {

// Maximum syntactic nesting (blocks, parentheses, operators) accepted.
constexpr int kMaxParseDepth = 200;

// Parse capsule script into a Program. Throws SyntaxError.
std::unique_ptr<Program> parse_program(const std::string& src);

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : toks_(std::move(tokens)) {}

    std::unique_ptr<Program> parse();

private:
    std::vector<Token> toks_;
    size_t pos_{0};
    int depth_{0};
    int fn_depth_{0};    // enclosing function bodies
    int loop_depth_{0};  // enclosing loops within the current function

    struct DepthGuard {
        Parser& p;
        explicit DepthGuard(Parser& parser);
        ~DepthGuard() { p.depth_--; }
    };

    // Left-associative operator and postfix chains build trees as deep as
    // they are long, so each link counts against the same depth budget.
    struct ChainGuard {
        Parser& p;
        int added{0};
        explicit ChainGuard(Parser& parser) : p(parser) {}
        ~ChainGuard() { p.depth_ -= added; }
        void step();
    };

    const Token& peek(size_t ahead = 0) const;
    const Token& advance();
    bool check(Tok t) const { return peek().type == t; }
    bool match(Tok t);
    const Token& expect(Tok t, const char* what);
    [[noreturn]] void fail(const Token& at, const std::string& msg) const;
    void skip_newlines();
    void skip_terminators();
    void end_statement();

    StmtPtr statement();
    Block block();
    StmtPtr let_statement();
    StmtPtr fn_statement();
    StmtPtr if_statement();
    StmtPtr while_statement();
    StmtPtr for_statement();
    StmtPtr return_statement();
    StmtPtr import_statement();
    StmtPtr expression_statement();
    std::string dotted_name();

    ExprPtr expression();
    ExprPtr or_expr();
    ExprPtr and_expr();
    ExprPtr not_expr();
    ExprPtr comparison();
    ExprPtr additive();
    ExprPtr multiplicative();
    ExprPtr unary();
    ExprPtr power();
    ExprPtr postfix();
    ExprPtr primary();
    ExprPtr paren_or_tuple(Pos p);
    ExprPtr list_literal(Pos p);
    ExprPtr map_literal(Pos p);
    ExprPtr lambda(Pos p);
    std::vector<std::string> params();
    void function_body(FnExpr& fn);
    Block loop_body();
};

} // namespace capsule
