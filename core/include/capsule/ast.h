#pragma once

// Syntax tree for capsule script. Nodes are tagged with a kind and walked
// with a switch + static_cast (validator, interpreter).

#include "capsule/value.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace capsule {

struct Pos {
    int line{0};
    int col{0};
};

enum class Op {
    ADD, SUB, MUL, DIV, FLOOR_DIV, MOD, POW,
    NEG, PLUS, NOT,
    AND, OR,
    EQ, NE, LT, LE, GT, GE, IN, NOT_IN,
};

const char* op_symbol(Op op);

// ---- expressions ----

enum class ExprKind {
    LITERAL,
    NAME,
    LIST,
    TUPLE,
    MAP,
    UNARY,
    BINARY,
    CALL,
    INDEX,
    SLICE,
    MEMBER,
    LAMBDA,
};

struct Expr {
    ExprKind kind;
    Pos pos;

    virtual ~Expr() = default;

protected:
    Expr(ExprKind k, Pos p) : kind(k), pos(p) {}
};

using ExprPtr = std::unique_ptr<Expr>;

struct Stmt;
using StmtPtr = std::unique_ptr<Stmt>;
using Block = std::vector<StmtPtr>;

struct LiteralExpr : Expr {
    Value value;
    LiteralExpr(Pos p, Value v) : Expr(ExprKind::LITERAL, p), value(std::move(v)) {}
};

struct NameExpr : Expr {
    std::string name;
    NameExpr(Pos p, std::string n) : Expr(ExprKind::NAME, p), name(std::move(n)) {}
};

// LIST and TUPLE literals.
struct SeqExpr : Expr {
    std::vector<ExprPtr> items;
    SeqExpr(ExprKind k, Pos p) : Expr(k, p) {}
};

struct MapExpr : Expr {
    std::vector<std::pair<ExprPtr, ExprPtr>> entries;
    explicit MapExpr(Pos p) : Expr(ExprKind::MAP, p) {}
};

struct UnaryExpr : Expr {
    Op op;
    ExprPtr operand;
    UnaryExpr(Pos p, Op o, ExprPtr e) : Expr(ExprKind::UNARY, p), op(o), operand(std::move(e)) {}
};

struct BinaryExpr : Expr {
    Op op;
    ExprPtr lhs;
    ExprPtr rhs;
    BinaryExpr(Pos p, Op o, ExprPtr l, ExprPtr r)
        : Expr(ExprKind::BINARY, p), op(o), lhs(std::move(l)), rhs(std::move(r)) {}
};

struct CallExpr : Expr {
    ExprPtr callee;
    std::vector<ExprPtr> args;
    CallExpr(Pos p, ExprPtr c) : Expr(ExprKind::CALL, p), callee(std::move(c)) {}
};

struct IndexExpr : Expr {
    ExprPtr object;
    ExprPtr index;
    IndexExpr(Pos p, ExprPtr o, ExprPtr i) : Expr(ExprKind::INDEX, p), object(std::move(o)), index(std::move(i)) {}
};

// a[lo:hi]; either bound may be null.
struct SliceExpr : Expr {
    ExprPtr object;
    ExprPtr lo;
    ExprPtr hi;
    SliceExpr(Pos p, ExprPtr o, ExprPtr l, ExprPtr h)
        : Expr(ExprKind::SLICE, p), object(std::move(o)), lo(std::move(l)), hi(std::move(h)) {}
};

struct MemberExpr : Expr {
    ExprPtr object;
    std::string attr;
    MemberExpr(Pos p, ExprPtr o, std::string a) : Expr(ExprKind::MEMBER, p), object(std::move(o)), attr(std::move(a)) {}
};

// Named functions and lambdas. Exactly one of body / expr_body is used.
struct FnExpr : Expr {
    std::string name;
    std::vector<std::string> params;
    Block body;
    ExprPtr expr_body;
    explicit FnExpr(Pos p) : Expr(ExprKind::LAMBDA, p) {}
};

// ---- statements ----

enum class StmtKind {
    LET,
    ASSIGN,
    EXPR,
    IF,
    WHILE,
    FOR,
    BREAK,
    CONTINUE,
    RETURN,
    FN_DEF,
    IMPORT,
};

struct Stmt {
    StmtKind kind;
    Pos pos;

    virtual ~Stmt() = default;

protected:
    Stmt(StmtKind k, Pos p) : kind(k), pos(p) {}
};

struct LetStmt : Stmt {
    std::string name;
    ExprPtr value;
    LetStmt(Pos p, std::string n, ExprPtr v) : Stmt(StmtKind::LET, p), name(std::move(n)), value(std::move(v)) {}
};

// target = value, or target <op>= value when `augmented` is set.
struct AssignStmt : Stmt {
    ExprPtr target;
    ExprPtr value;
    bool augmented{false};
    Op op{Op::ADD};
    AssignStmt(Pos p, ExprPtr t, ExprPtr v) : Stmt(StmtKind::ASSIGN, p), target(std::move(t)), value(std::move(v)) {}
};

struct ExprStmt : Stmt {
    ExprPtr expr;
    ExprStmt(Pos p, ExprPtr e) : Stmt(StmtKind::EXPR, p), expr(std::move(e)) {}
};

struct IfStmt : Stmt {
    ExprPtr cond;
    Block then_body;
    Block else_body;
    IfStmt(Pos p, ExprPtr c) : Stmt(StmtKind::IF, p), cond(std::move(c)) {}
};

struct WhileStmt : Stmt {
    ExprPtr cond;
    Block body;
    WhileStmt(Pos p, ExprPtr c) : Stmt(StmtKind::WHILE, p), cond(std::move(c)) {}
};

struct ForStmt : Stmt {
    std::vector<std::string> vars;  // 1 or 2 (unpacking)
    ExprPtr iterable;
    Block body;
    explicit ForStmt(Pos p) : Stmt(StmtKind::FOR, p) {}
};

struct SimpleStmt : Stmt {
    SimpleStmt(StmtKind k, Pos p) : Stmt(k, p) {}
};

struct ReturnStmt : Stmt {
    ExprPtr value;  // may be null
    ReturnStmt(Pos p, ExprPtr v) : Stmt(StmtKind::RETURN, p), value(std::move(v)) {}
};

struct FnDefStmt : Stmt {
    std::unique_ptr<FnExpr> fn;
    FnDefStmt(Pos p, std::unique_ptr<FnExpr> f) : Stmt(StmtKind::FN_DEF, p), fn(std::move(f)) {}
};

// `import a.b [as c]` / `from a.b import x, y`. Parsed only to be rejected.
struct ImportStmt : Stmt {
    std::string module;
    std::vector<std::string> names;
    ImportStmt(Pos p, std::string m) : Stmt(StmtKind::IMPORT, p), module(std::move(m)) {}
};

struct Program {
    Block body;
};

} // namespace capsule
