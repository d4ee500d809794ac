#include "capsule/validator.h"
#include "capsule/errors.h"
#include "capsule/parser.h"

#include <unordered_set>

namespace capsule {

namespace {

const std::unordered_set<std::string>& denied_names() {
    static const std::unordered_set<std::string> names = {
        // dynamic evaluation
        "eval", "exec", "compile", "load", "require",
        // reflection
        "getattr", "hasattr", "dir", "vars", "globals", "locals", "help", "breakpoint",
        // attribute mutation
        "setattr", "delattr",
        // host access
        "open", "input", "exit", "quit", "system", "spawn", "getenv", "env",
        // host modules
        "os", "sys", "subprocess", "socket", "requests", "urllib", "http",
        "ftplib", "telnetlib", "ssl", "select", "selectors", "asyncio",
        "threading", "multiprocessing", "concurrent", "ctypes", "cffi",
        "importlib", "pkgutil", "inspect", "gc", "weakref", "pickle",
        "marshal", "shelve",
    };
    return names;
}

const std::unordered_set<std::string>& reflective_attrs() {
    static const std::unordered_set<std::string> attrs = {
        "builtins", "class", "bases", "mro", "subclasses", "dict", "code",
        "closure", "frame", "globals", "constructor", "prototype",
    };
    return attrs;
}

[[noreturn]] void reject(const std::string& msg) {
    throw SandboxError(ErrorKind::VALIDATION, msg);
}

void check_identifier(const std::string& name) {
    if (name.compare(0, 2, "__") == 0 || is_denied_name(name)) {
        reject("Access to '" + name + "' is not allowed");
    }
}

void check_attribute(const std::string& attr) {
    if (!attr.empty() && attr[0] == '_') reject("Access to private attributes is not allowed");
    if (is_denied_name(attr) || is_reflective_attribute(attr)) {
        reject("Access to '" + attr + "' is not allowed");
    }
}

void walk_block(const Block& body);

void walk_expr(const Expr* e) {
    if (!e) return;
    switch (e->kind) {
        case ExprKind::LITERAL:
            return;
        case ExprKind::NAME:
            check_identifier(static_cast<const NameExpr*>(e)->name);
            return;
        case ExprKind::LIST:
        case ExprKind::TUPLE:
            for (const auto& item : static_cast<const SeqExpr*>(e)->items) walk_expr(item.get());
            return;
        case ExprKind::MAP:
            for (const auto& kv : static_cast<const MapExpr*>(e)->entries) {
                walk_expr(kv.first.get());
                walk_expr(kv.second.get());
            }
            return;
        case ExprKind::UNARY:
            walk_expr(static_cast<const UnaryExpr*>(e)->operand.get());
            return;
        case ExprKind::BINARY: {
            auto* b = static_cast<const BinaryExpr*>(e);
            walk_expr(b->lhs.get());
            walk_expr(b->rhs.get());
            return;
        }
        case ExprKind::CALL: {
            auto* c = static_cast<const CallExpr*>(e);
            walk_expr(c->callee.get());
            for (const auto& a : c->args) walk_expr(a.get());
            return;
        }
        case ExprKind::INDEX: {
            auto* ix = static_cast<const IndexExpr*>(e);
            walk_expr(ix->object.get());
            walk_expr(ix->index.get());
            return;
        }
        case ExprKind::SLICE: {
            auto* s = static_cast<const SliceExpr*>(e);
            walk_expr(s->object.get());
            walk_expr(s->lo.get());
            walk_expr(s->hi.get());
            return;
        }
        case ExprKind::MEMBER: {
            auto* m = static_cast<const MemberExpr*>(e);
            walk_expr(m->object.get());
            check_attribute(m->attr);
            return;
        }
        case ExprKind::LAMBDA: {
            auto* fn = static_cast<const FnExpr*>(e);
            if (!fn->name.empty()) check_identifier(fn->name);
            for (const auto& p : fn->params) check_identifier(p);
            walk_block(fn->body);
            walk_expr(fn->expr_body.get());
            return;
        }
    }
}

void walk_stmt(const Stmt* s) {
    switch (s->kind) {
        case StmtKind::LET: {
            auto* l = static_cast<const LetStmt*>(s);
            check_identifier(l->name);
            walk_expr(l->value.get());
            return;
        }
        case StmtKind::ASSIGN: {
            auto* a = static_cast<const AssignStmt*>(s);
            walk_expr(a->target.get());
            walk_expr(a->value.get());
            return;
        }
        case StmtKind::EXPR:
            walk_expr(static_cast<const ExprStmt*>(s)->expr.get());
            return;
        case StmtKind::IF: {
            auto* i = static_cast<const IfStmt*>(s);
            walk_expr(i->cond.get());
            walk_block(i->then_body);
            walk_block(i->else_body);
            return;
        }
        case StmtKind::WHILE: {
            auto* w = static_cast<const WhileStmt*>(s);
            walk_expr(w->cond.get());
            walk_block(w->body);
            return;
        }
        case StmtKind::FOR: {
            auto* f = static_cast<const ForStmt*>(s);
            for (const auto& v : f->vars) check_identifier(v);
            walk_expr(f->iterable.get());
            walk_block(f->body);
            return;
        }
        case StmtKind::BREAK:
        case StmtKind::CONTINUE:
            return;
        case StmtKind::RETURN:
            walk_expr(static_cast<const ReturnStmt*>(s)->value.get());
            return;
        case StmtKind::FN_DEF:
            walk_expr(static_cast<const FnDefStmt*>(s)->fn.get());
            return;
        case StmtKind::IMPORT:
            reject("Import statements are not allowed");
    }
}

void walk_block(const Block& body) {
    for (const auto& s : body) walk_stmt(s.get());
}

} // namespace

bool is_denied_name(const std::string& name) {
    return denied_names().count(name) != 0;
}

bool is_reflective_attribute(const std::string& attr) {
    return reflective_attrs().count(attr) != 0;
}

bool validate_program(const Program& program, std::string* error) {
    try {
        walk_block(program.body);
        return true;
    } catch (const SandboxError& e) {
        if (error) *error = e.what();
        return false;
    }
}

std::unique_ptr<Program> validate_source(const std::string& code, std::string* error) {
    std::unique_ptr<Program> prog;
    try {
        prog = parse_program(code);
    } catch (const SyntaxError& e) {
        if (error) *error = e.what();
        return nullptr;
    }
    if (!validate_program(*prog, error)) return nullptr;
    return prog;
}

} // namespace capsule
