#pragma once

#include "capsule/ast.h"
#include "capsule/value.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace capsule {

class OutputSink;

constexpr int kMaxCallDepth = 200;
// Combined statement/expression nesting across all active calls.
constexpr int kMaxEvalDepth = 4000;

struct Scope {
    std::unordered_map<std::string, Value> vars;
    std::shared_ptr<Scope> parent;

    explicit Scope(std::shared_ptr<Scope> p = nullptr) : parent(std::move(p)) {}

    Value* find(const std::string& name);
};

// Control flow unwinding. Not std::exceptions: nothing at the engine
// boundary may mistake them for failures.
struct ReturnSignal {
    Value value;
};
struct BreakSignal {};
struct ContinueSignal {};

// Tree-walking evaluator for a validated Program. Globals are the capability
// catalogue, the read-only `context` binding and `result`.
//
// Failures are SandboxError (RUNTIME or TIMEOUT). std::bad_alloc escapes as
// is; the caller maps it to a memory-limit failure.
class Interpreter {
public:
    explicit Interpreter(OutputSink& out);
    ~Interpreter();

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    void bind_context(Value context);

    // Wall-clock backstop to the SIGALRM flag; <= 0 disables it. Also names
    // the limit in the timeout message.
    void set_time_limit(double seconds);

    void run(const Program& program);

    // Value bound to `result` in the global scope.
    Value result() const;

    Value call(const Value& callee, std::vector<Value>& args);

    // Visits list/tuple items, string bytes, map keys, set items or range
    // values in order. Lists are re-read on every step, maps and sets are
    // snapshotted first.
    void iterate(const Value& iterable, const std::function<void(const Value&)>& fn);
    std::vector<Value> collect(const Value& iterable);

    // Raises Timeout once the deadline has passed.
    void check_interrupt();

    OutputSink& output() { return out_; }

private:
    struct DepthGuard {
        int& depth;
        DepthGuard(int& d, int max);
        ~DepthGuard() { depth--; }
    };

    OutputSink& out_;
    std::shared_ptr<Scope> builtins_;
    std::shared_ptr<Scope> globals_;
    std::shared_ptr<Scope> scope_;
    std::unordered_set<std::string> readonly_;
    std::vector<std::weak_ptr<Scope>> closures_;
    size_t prune_at_{64};

    int call_depth_{0};
    int eval_depth_{0};

    double time_limit_{0};
    bool has_deadline_{false};
    std::chrono::steady_clock::time_point deadline_;
    uint32_t ticks_{0};

    void exec_block(const Block& body);
    void exec(const Stmt* s);
    void exec_for(const ForStmt* f);
    void exec_assign(const AssignStmt* a);

    Value eval(const Expr* e);
    Value eval_binary(const BinaryExpr* b);
    Value eval_call(const CallExpr* c);
    Value eval_member(const MemberExpr* m);
    Value make_function(const FnExpr* fn);

    Value lookup(const std::string& name) const;
    void define(const std::string& name, Value v);
    void assign_name(const std::string& name, Value v);
    void track_closure();
};

} // namespace capsule
