#pragma once

// Runtime values of capsule script.
//
// Scalars are stored inline; containers and functions are shared references
// (a list passed to a function is the same list). Containers carry a
// `frozen` flag used for the read-only `context` binding.

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <variant>
#include <vector>

struct json_object;

namespace capsule {

class Interpreter;
struct FnExpr;
struct Scope;

enum class ValueType {
    NIL,
    BOOL,
    INT,
    FLOAT,
    STRING,
    LIST,
    TUPLE,
    MAP,
    SET,
    RANGE,
    FUNCTION,
};

struct RangeVal {
    int64_t start{0};
    int64_t stop{0};
    int64_t step{1};

    int64_t size() const;
    int64_t at(int64_t i) const { return start + i * step; }
};

struct ListObj;
struct MapObj;
struct SetObj;
struct Function;

class Value {
public:
    Value() = default;

    static Value boolean(bool b);
    static Value integer(int64_t i);
    static Value number(double d);
    static Value str(std::string s);
    static Value list(std::vector<Value> items = {});
    static Value tuple(std::vector<Value> items);
    static Value map();
    static Value set();
    static Value range(RangeVal r);
    static Value function(std::shared_ptr<Function> fn);

    ValueType type() const { return type_; }
    bool is_nil() const { return type_ == ValueType::NIL; }
    bool is_number() const { return type_ == ValueType::INT || type_ == ValueType::FLOAT || type_ == ValueType::BOOL; }
    bool is_sequence() const { return type_ == ValueType::LIST || type_ == ValueType::TUPLE; }

    bool as_bool() const { return std::get<bool>(data_); }
    int64_t as_int() const { return std::get<int64_t>(data_); }
    double as_float() const { return std::get<double>(data_); }
    // int, float and bool widened to double.
    double to_double() const;
    const std::string& as_string() const { return std::get<std::string>(data_); }
    ListObj& as_list() const { return *std::get<std::shared_ptr<ListObj>>(data_); }
    MapObj& as_map() const { return *std::get<std::shared_ptr<MapObj>>(data_); }
    SetObj& as_set() const { return *std::get<std::shared_ptr<SetObj>>(data_); }
    const RangeVal& as_range() const { return std::get<RangeVal>(data_); }
    const std::shared_ptr<Function>& as_function() const { return std::get<std::shared_ptr<Function>>(data_); }

    // Identity for reference types (used by the cycle guard in repr/json).
    const void* identity() const;

    // If this is the last reference to a container, moves its elements into
    // `out` and leaves it empty. Used to tear down deep nesting iteratively.
    void release_children(std::vector<Value>& out);

private:
    using Storage = std::variant<std::monostate, bool, int64_t, double, std::string,
                                 std::shared_ptr<ListObj>, std::shared_ptr<MapObj>,
                                 std::shared_ptr<SetObj>, RangeVal, std::shared_ptr<Function>>;

    ValueType type_{ValueType::NIL};
    Storage data_;
};

// Total order over hashable values (null < bool/number < string < tuple).
// Unhashable values (list, map, set, function) are rejected where they are
// used as keys, before they reach this comparator.
struct ValueLess {
    bool operator()(const Value& a, const Value& b) const;
};

// Container destructors drain nested containers with an explicit stack.
struct ListObj {
    std::vector<Value> items;
    bool frozen{false};
    ~ListObj();
};

struct MapObj {
    std::map<Value, Value, ValueLess> entries;
    bool frozen{false};
    ~MapObj();
};

struct SetObj {
    std::set<Value, ValueLess> items;
    bool frozen{false};
    ~SetObj();
};

using NativeFn = std::function<Value(Interpreter&, std::vector<Value>&)>;

struct Function {
    std::string name;

    // Catalogue entries and bound methods.
    NativeFn native;
    // Type constructors (int, str, ...) double as isinstance() tags.
    bool is_type{false};
    ValueType type_tag{ValueType::NIL};

    // Script functions and lambdas.
    const FnExpr* decl{nullptr};
    std::shared_ptr<Scope> closure;
};

const char* type_name(ValueType t);
inline const char* type_name(const Value& v) { return type_name(v.type()); }

bool truthy(const Value& v);
bool hashable(const Value& v);
bool values_equal(const Value& a, const Value& b);

// <0, 0, >0. Throws SandboxError(RUNTIME) for unorderable pairs.
int compare_values(const Value& a, const Value& b);

// str() and repr() renderings.
std::string to_display(const Value& v);
std::string to_repr(const Value& v);
std::string format_float(double d);

// JSON bridge (json-c). value_to_json throws SandboxError(RUNTIME) for
// functions, non-finite floats and cyclic containers; caller owns the result.
json_object* value_to_json(const Value& v);
// Converts a parsed JSON document. `frozen` marks every container read-only.
Value value_from_json(json_object* obj, bool frozen);

} // namespace capsule
