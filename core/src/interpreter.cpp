#include "capsule/interpreter.h"
#include "capsule/capabilities.h"
#include "capsule/deadline.h"
#include "capsule/errors.h"
#include "capsule/ops.h"

#include <algorithm>

namespace capsule {

static SandboxError runtime(const std::string& msg) {
    return SandboxError(ErrorKind::RUNTIME, msg);
}

Value* Scope::find(const std::string& name) {
    auto it = vars.find(name);
    return it == vars.end() ? nullptr : &it->second;
}

Interpreter::DepthGuard::DepthGuard(int& d, int max) : depth(d) {
    if (++depth > max) {
        depth--;
        throw runtime("maximum recursion depth exceeded");
    }
}

Interpreter::Interpreter(OutputSink& out)
    : out_(out),
      builtins_(std::make_shared<Scope>()),
      globals_(std::make_shared<Scope>(builtins_)),
      scope_(globals_) {
    install_capabilities(*builtins_);
    globals_->vars["result"] = Value();
}

Interpreter::~Interpreter() {
    // Script functions hold their defining scope, which may hold them back.
    for (auto& w : closures_) {
        if (auto s = w.lock()) s->vars.clear();
    }
    globals_->vars.clear();
}

void Interpreter::bind_context(Value context) {
    globals_->vars["context"] = std::move(context);
    readonly_.insert("context");
}

void Interpreter::set_time_limit(double seconds) {
    time_limit_ = seconds;
    has_deadline_ = seconds > 0;
    if (has_deadline_) {
        deadline_ = std::chrono::steady_clock::now() +
                    std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                        std::chrono::duration<double>(seconds));
    }
}

void Interpreter::check_interrupt() {
    if (deadline_expired()) throw SandboxError(ErrorKind::TIMEOUT, timeout_message(time_limit_));
    if (has_deadline_ && (++ticks_ & 0x3ff) == 0 && std::chrono::steady_clock::now() >= deadline_) {
        throw SandboxError(ErrorKind::TIMEOUT, timeout_message(time_limit_));
    }
}

void Interpreter::run(const Program& program) {
    exec_block(program.body);
}

Value Interpreter::result() const {
    auto it = globals_->vars.find("result");
    return it == globals_->vars.end() ? Value() : it->second;
}

// ---- bindings ----

Value Interpreter::lookup(const std::string& name) const {
    for (Scope* s = scope_.get(); s; s = s->parent.get()) {
        if (Value* v = s->find(name)) return *v;
    }
    throw runtime("name '" + name + "' is not defined");
}

void Interpreter::define(const std::string& name, Value v) {
    if (scope_ == globals_ && readonly_.count(name)) {
        throw runtime("cannot assign to read-only name '" + name + "'");
    }
    scope_->vars[name] = std::move(v);
}

// Rebinds the nearest enclosing binding (builtins excluded), else defines
// the name in the current function scope.
void Interpreter::assign_name(const std::string& name, Value v) {
    for (Scope* s = scope_.get(); s && s != builtins_.get(); s = s->parent.get()) {
        if (Value* slot = s->find(name)) {
            if (s == globals_.get() && readonly_.count(name)) {
                throw runtime("cannot assign to read-only name '" + name + "'");
            }
            *slot = std::move(v);
            return;
        }
    }
    define(name, std::move(v));
}

void Interpreter::track_closure() {
    if (!closures_.empty()) {
        auto last = closures_.back().lock();
        if (last == scope_) return;
    }
    closures_.push_back(scope_);
    if (closures_.size() >= prune_at_) {
        closures_.erase(std::remove_if(closures_.begin(), closures_.end(),
                                       [](const std::weak_ptr<Scope>& w) { return w.expired(); }),
                        closures_.end());
        prune_at_ = std::max<size_t>(64, closures_.size() * 2);
    }
}

// ---- statements ----

void Interpreter::exec_block(const Block& body) {
    for (const auto& s : body) exec(s.get());
}

void Interpreter::exec(const Stmt* s) {
    DepthGuard g(eval_depth_, kMaxEvalDepth);
    check_interrupt();

    switch (s->kind) {
        case StmtKind::LET: {
            auto* l = static_cast<const LetStmt*>(s);
            define(l->name, eval(l->value.get()));
            return;
        }
        case StmtKind::ASSIGN:
            exec_assign(static_cast<const AssignStmt*>(s));
            return;
        case StmtKind::EXPR:
            (void)eval(static_cast<const ExprStmt*>(s)->expr.get());
            return;
        case StmtKind::IF: {
            auto* i = static_cast<const IfStmt*>(s);
            if (truthy(eval(i->cond.get()))) exec_block(i->then_body);
            else exec_block(i->else_body);
            return;
        }
        case StmtKind::WHILE: {
            auto* w = static_cast<const WhileStmt*>(s);
            try {
                while (truthy(eval(w->cond.get()))) {
                    check_interrupt();
                    try {
                        exec_block(w->body);
                    } catch (const ContinueSignal&) {
                    }
                }
            } catch (const BreakSignal&) {
            }
            return;
        }
        case StmtKind::FOR:
            exec_for(static_cast<const ForStmt*>(s));
            return;
        case StmtKind::BREAK:
            throw BreakSignal{};
        case StmtKind::CONTINUE:
            throw ContinueSignal{};
        case StmtKind::RETURN: {
            auto* r = static_cast<const ReturnStmt*>(s);
            throw ReturnSignal{r->value ? eval(r->value.get()) : Value()};
        }
        case StmtKind::FN_DEF: {
            auto* d = static_cast<const FnDefStmt*>(s);
            define(d->fn->name, make_function(d->fn.get()));
            return;
        }
        case StmtKind::IMPORT:
            // Unreachable for validated programs.
            throw runtime("import is not available");
    }
}

void Interpreter::exec_for(const ForStmt* f) {
    Value iterable = eval(f->iterable.get());
    try {
        iterate(iterable, [&](const Value& item) {
            if (f->vars.size() == 1) {
                define(f->vars[0], item);
            } else {
                if (!item.is_sequence() || item.as_list().items.size() != f->vars.size()) {
                    throw runtime("cannot unpack " + std::string(type_name(item)) + " into " +
                                  std::to_string(f->vars.size()) + " variables");
                }
                const auto& parts = item.as_list().items;
                for (size_t i = 0; i < f->vars.size(); i++) define(f->vars[i], parts[i]);
            }
            try {
                exec_block(f->body);
            } catch (const ContinueSignal&) {
            }
        });
    } catch (const BreakSignal&) {
    }
}

void Interpreter::exec_assign(const AssignStmt* a) {
    const Expr* target = a->target.get();
    switch (target->kind) {
        case ExprKind::NAME: {
            const std::string& name = static_cast<const NameExpr*>(target)->name;
            Value v = eval(a->value.get());
            if (a->augmented) v = apply_binary(a->op, lookup(name), v);
            assign_name(name, std::move(v));
            return;
        }
        case ExprKind::INDEX: {
            auto* ix = static_cast<const IndexExpr*>(target);
            Value obj = eval(ix->object.get());
            Value key = eval(ix->index.get());
            Value v = eval(a->value.get());
            if (a->augmented) v = apply_binary(a->op, index_value(obj, key), v);
            store_index(obj, key, std::move(v));
            return;
        }
        case ExprKind::MEMBER: {
            auto* m = static_cast<const MemberExpr*>(target);
            Value obj = eval(m->object.get());
            if (obj.type() != ValueType::MAP) {
                throw runtime(std::string("cannot set attribute '") + m->attr + "' on '" + type_name(obj) + "'");
            }
            Value key = Value::str(m->attr);
            Value v = eval(a->value.get());
            if (a->augmented) v = apply_binary(a->op, index_value(obj, key), v);
            store_index(obj, key, std::move(v));
            return;
        }
        default:
            throw runtime("invalid assignment target");
    }
}

// ---- expressions ----

Value Interpreter::eval(const Expr* e) {
    DepthGuard g(eval_depth_, kMaxEvalDepth);

    switch (e->kind) {
        case ExprKind::LITERAL:
            return static_cast<const LiteralExpr*>(e)->value;
        case ExprKind::NAME:
            return lookup(static_cast<const NameExpr*>(e)->name);
        case ExprKind::LIST:
        case ExprKind::TUPLE: {
            auto* seq = static_cast<const SeqExpr*>(e);
            std::vector<Value> items;
            items.reserve(seq->items.size());
            for (const auto& item : seq->items) items.push_back(eval(item.get()));
            return e->kind == ExprKind::TUPLE ? Value::tuple(std::move(items)) : Value::list(std::move(items));
        }
        case ExprKind::MAP: {
            Value out = Value::map();
            for (const auto& kv : static_cast<const MapExpr*>(e)->entries) {
                Value k = eval(kv.first.get());
                require_hashable(k);
                out.as_map().entries[k] = eval(kv.second.get());
            }
            return out;
        }
        case ExprKind::UNARY: {
            auto* u = static_cast<const UnaryExpr*>(e);
            return apply_unary(u->op, eval(u->operand.get()));
        }
        case ExprKind::BINARY:
            return eval_binary(static_cast<const BinaryExpr*>(e));
        case ExprKind::CALL:
            return eval_call(static_cast<const CallExpr*>(e));
        case ExprKind::INDEX: {
            auto* ix = static_cast<const IndexExpr*>(e);
            Value obj = eval(ix->object.get());
            return index_value(obj, eval(ix->index.get()));
        }
        case ExprKind::SLICE: {
            auto* sl = static_cast<const SliceExpr*>(e);
            Value obj = eval(sl->object.get());
            Value lo = sl->lo ? eval(sl->lo.get()) : Value();
            Value hi = sl->hi ? eval(sl->hi.get()) : Value();
            return slice_value(obj, &lo, &hi);
        }
        case ExprKind::MEMBER:
            return eval_member(static_cast<const MemberExpr*>(e));
        case ExprKind::LAMBDA:
            return make_function(static_cast<const FnExpr*>(e));
    }
    throw runtime("unknown expression");
}

Value Interpreter::eval_binary(const BinaryExpr* b) {
    if (b->op == Op::AND) {
        Value lhs = eval(b->lhs.get());
        return truthy(lhs) ? eval(b->rhs.get()) : lhs;
    }
    if (b->op == Op::OR) {
        Value lhs = eval(b->lhs.get());
        return truthy(lhs) ? lhs : eval(b->rhs.get());
    }
    Value lhs = eval(b->lhs.get());
    Value rhs = eval(b->rhs.get());
    return apply_binary(b->op, lhs, rhs);
}

Value Interpreter::eval_call(const CallExpr* c) {
    Value callee = eval(c->callee.get());
    std::vector<Value> args;
    args.reserve(c->args.size());
    for (const auto& a : c->args) args.push_back(eval(a.get()));
    return call(callee, args);
}

// Maps expose their methods first and fall back to key lookup, so
// `cfg.name` reads cfg["name"] unless `name` is a dict method.
Value Interpreter::eval_member(const MemberExpr* m) {
    Value obj = eval(m->object.get());
    Value method = bound_method(obj, m->attr);
    if (!method.is_nil()) return method;
    if (obj.type() == ValueType::MAP) return index_value(obj, Value::str(m->attr));
    throw runtime(std::string("'") + type_name(obj) + "' object has no attribute '" + m->attr + "'");
}

Value Interpreter::make_function(const FnExpr* fn) {
    auto f = std::make_shared<Function>();
    f->name = fn->name;
    f->decl = fn;
    f->closure = scope_;
    track_closure();
    return Value::function(std::move(f));
}

Value Interpreter::call(const Value& callee, std::vector<Value>& args) {
    if (callee.type() != ValueType::FUNCTION) {
        throw runtime(std::string("'") + type_name(callee) + "' object is not callable");
    }
    check_interrupt();

    const auto& fn = callee.as_function();
    if (fn->native) return fn->native(*this, args);

    const FnExpr* decl = fn->decl;
    const std::string label = decl->name.empty() ? "<lambda>" : decl->name;
    if (args.size() != decl->params.size()) {
        throw runtime(label + "() takes " + std::to_string(decl->params.size()) + " argument(s) (" +
                      std::to_string(args.size()) + " given)");
    }

    DepthGuard calls(call_depth_, kMaxCallDepth);

    auto frame = std::make_shared<Scope>(fn->closure);
    for (size_t i = 0; i < args.size(); i++) frame->vars[decl->params[i]] = std::move(args[i]);

    struct ScopeSwap {
        std::shared_ptr<Scope>& slot;
        std::shared_ptr<Scope> saved;
        ScopeSwap(std::shared_ptr<Scope>& s, std::shared_ptr<Scope> next) : slot(s), saved(std::move(s)) {
            slot = std::move(next);
        }
        ~ScopeSwap() { slot = std::move(saved); }
    } swap(scope_, std::move(frame));

    if (decl->expr_body) return eval(decl->expr_body.get());
    try {
        exec_block(decl->body);
    } catch (ReturnSignal& r) {
        return std::move(r.value);
    }
    return Value();
}

// ---- iteration ----

void Interpreter::iterate(const Value& iterable, const std::function<void(const Value&)>& fn) {
    switch (iterable.type()) {
        case ValueType::LIST:
        case ValueType::TUPLE: {
            const auto& items = iterable.as_list().items;
            for (size_t i = 0; i < items.size(); i++) {
                check_interrupt();
                Value item = items[i];
                fn(item);
            }
            return;
        }
        case ValueType::STRING: {
            const std::string s = iterable.as_string();
            for (char ch : s) {
                check_interrupt();
                fn(Value::str(std::string(1, ch)));
            }
            return;
        }
        case ValueType::MAP: {
            std::vector<Value> keys;
            keys.reserve(iterable.as_map().entries.size());
            for (const auto& kv : iterable.as_map().entries) keys.push_back(kv.first);
            for (const auto& k : keys) {
                check_interrupt();
                fn(k);
            }
            return;
        }
        case ValueType::SET: {
            std::vector<Value> items(iterable.as_set().items.begin(), iterable.as_set().items.end());
            for (const auto& item : items) {
                check_interrupt();
                fn(item);
            }
            return;
        }
        case ValueType::RANGE: {
            const RangeVal r = iterable.as_range();
            const int64_t n = r.size();
            for (int64_t i = 0; i < n; i++) {
                check_interrupt();
                fn(Value::integer(r.at(i)));
            }
            return;
        }
        default:
            break;
    }
    throw runtime(std::string("'") + type_name(iterable) + "' object is not iterable");
}

std::vector<Value> Interpreter::collect(const Value& iterable) {
    std::vector<Value> out;
    if (iterable.type() == ValueType::RANGE) {
        check_growth(static_cast<size_t>(iterable.as_range().size()), sizeof(Value));
        out.reserve(static_cast<size_t>(iterable.as_range().size()));
    }
    iterate(iterable, [&](const Value& v) { out.push_back(v); });
    return out;
}

} // namespace capsule
