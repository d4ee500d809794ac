#include "capsule/ops.h"
#include "capsule/errors.h"

#include <cmath>
#include <limits>

namespace capsule {

static SandboxError runtime(const std::string& msg) {
    return SandboxError(ErrorKind::RUNTIME, msg);
}

static bool is_intlike(const Value& v) {
    return v.type() == ValueType::INT || v.type() == ValueType::BOOL;
}

static int64_t as_i64(const Value& v) {
    if (v.type() == ValueType::BOOL) return v.as_bool() ? 1 : 0;
    return v.as_int();
}

static SandboxError bad_operands(Op op, const Value& a, const Value& b) {
    return runtime(std::string("unsupported operand types for ") + op_symbol(op) + ": '" +
                   type_name(a) + "' and '" + type_name(b) + "'");
}

int64_t checked_add(int64_t a, int64_t b) {
    int64_t r;
    if (__builtin_add_overflow(a, b, &r)) throw runtime("integer overflow");
    return r;
}

static int64_t checked_sub(int64_t a, int64_t b) {
    int64_t r;
    if (__builtin_sub_overflow(a, b, &r)) throw runtime("integer overflow");
    return r;
}

int64_t checked_mul(int64_t a, int64_t b) {
    int64_t r;
    if (__builtin_mul_overflow(a, b, &r)) throw runtime("integer overflow");
    return r;
}

static int64_t checked_pow(int64_t base, int64_t exp) {
    int64_t result = 1;
    while (exp > 0) {
        if (exp & 1) result = checked_mul(result, base);
        exp >>= 1;
        if (exp > 0) base = checked_mul(base, base);
    }
    return result;
}

static int64_t floor_div(int64_t a, int64_t b) {
    if (b == 0) throw runtime("division by zero");
    if (a == std::numeric_limits<int64_t>::min() && b == -1) throw runtime("integer overflow");
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) q--;
    return q;
}

static int64_t floor_mod(int64_t a, int64_t b) {
    if (b == 0) throw runtime("division by zero");
    if (b == -1) return 0;
    int64_t r = a % b;
    if (r != 0 && ((r < 0) != (b < 0))) r += b;
    return r;
}

static double float_result(double r, double a, double b) {
    if (std::isnan(r) && !std::isnan(a) && !std::isnan(b)) throw runtime("math domain error");
    if (std::isinf(r) && std::isfinite(a) && std::isfinite(b)) throw runtime("float overflow");
    return r;
}

void check_growth(size_t count, size_t elem_size) {
    if (elem_size != 0 && count > kMaxSequenceBytes / elem_size) throw runtime("memory limit exceeded");
}

// The loop count is bounded by check_growth only for non-empty sequences,
// so empty ones return before it.
static Value repeat(const Value& seq, int64_t times) {
    if (times < 0) times = 0;
    if (seq.type() == ValueType::STRING) {
        const auto& s = seq.as_string();
        if (s.empty() || times == 0) return Value::str("");
        check_growth(static_cast<size_t>(times), s.size());
        std::string out;
        out.reserve(s.size() * static_cast<size_t>(times));
        for (int64_t i = 0; i < times; i++) out += s;
        return Value::str(std::move(out));
    }
    const auto& items = seq.as_list().items;
    if (items.empty() || times == 0) {
        return seq.type() == ValueType::TUPLE ? Value::tuple({}) : Value::list({});
    }
    check_growth(static_cast<size_t>(times), items.size() * sizeof(Value));
    std::vector<Value> out;
    out.reserve(items.size() * static_cast<size_t>(times));
    for (int64_t i = 0; i < times; i++) out.insert(out.end(), items.begin(), items.end());
    return seq.type() == ValueType::TUPLE ? Value::tuple(std::move(out)) : Value::list(std::move(out));
}

static Value arithmetic(Op op, const Value& a, const Value& b) {
    if (is_intlike(a) && is_intlike(b)) {
        int64_t x = as_i64(a);
        int64_t y = as_i64(b);
        switch (op) {
            case Op::ADD:       return Value::integer(checked_add(x, y));
            case Op::SUB:       return Value::integer(checked_sub(x, y));
            case Op::MUL:       return Value::integer(checked_mul(x, y));
            case Op::FLOOR_DIV: return Value::integer(floor_div(x, y));
            case Op::MOD:       return Value::integer(floor_mod(x, y));
            case Op::DIV:
                if (y == 0) throw runtime("division by zero");
                return Value::number(static_cast<double>(x) / static_cast<double>(y));
            case Op::POW:
                if (y >= 0) return Value::integer(checked_pow(x, y));
                if (x == 0) throw runtime("zero cannot be raised to a negative power");
                return Value::number(std::pow(static_cast<double>(x), static_cast<double>(y)));
            default:
                break;
        }
        throw bad_operands(op, a, b);
    }

    double x = a.to_double();
    double y = b.to_double();
    switch (op) {
        case Op::ADD: return Value::number(float_result(x + y, x, y));
        case Op::SUB: return Value::number(float_result(x - y, x, y));
        case Op::MUL: return Value::number(float_result(x * y, x, y));
        case Op::DIV:
            if (y == 0.0) throw runtime("division by zero");
            return Value::number(float_result(x / y, x, y));
        case Op::FLOOR_DIV:
            if (y == 0.0) throw runtime("division by zero");
            return Value::number(float_result(std::floor(x / y), x, y));
        case Op::MOD: {
            if (y == 0.0) throw runtime("division by zero");
            double r = std::fmod(x, y);
            if (r != 0.0 && ((r < 0) != (y < 0))) r += y;
            return Value::number(r);
        }
        case Op::POW:
            if (x == 0.0 && y < 0) throw runtime("zero cannot be raised to a negative power");
            return Value::number(float_result(std::pow(x, y), x, y));
        default:
            break;
    }
    throw bad_operands(op, a, b);
}

Value apply_binary(Op op, const Value& a, const Value& b) {
    switch (op) {
        case Op::EQ:     return Value::boolean(values_equal(a, b));
        case Op::NE:     return Value::boolean(!values_equal(a, b));
        case Op::LT:     return Value::boolean(compare_values(a, b) < 0);
        case Op::LE:     return Value::boolean(compare_values(a, b) <= 0);
        case Op::GT:     return Value::boolean(compare_values(a, b) > 0);
        case Op::GE:     return Value::boolean(compare_values(a, b) >= 0);
        case Op::IN:     return Value::boolean(contains(b, a));
        case Op::NOT_IN: return Value::boolean(!contains(b, a));
        default:
            break;
    }

    if (a.is_number() && b.is_number()) return arithmetic(op, a, b);

    ValueType ta = a.type();
    ValueType tb = b.type();
    switch (op) {
        case Op::ADD:
            if (ta == ValueType::STRING && tb == ValueType::STRING) {
                check_growth(a.as_string().size() + b.as_string().size(), 1);
                return Value::str(a.as_string() + b.as_string());
            }
            if (a.is_sequence() && ta == tb) {
                std::vector<Value> out = a.as_list().items;
                const auto& rhs = b.as_list().items;
                out.insert(out.end(), rhs.begin(), rhs.end());
                return ta == ValueType::TUPLE ? Value::tuple(std::move(out)) : Value::list(std::move(out));
            }
            break;
        case Op::SUB:
            if (ta == ValueType::SET && tb == ValueType::SET) {
                Value out = Value::set();
                for (const auto& item : a.as_set().items) {
                    if (!b.as_set().items.count(item)) out.as_set().items.insert(item);
                }
                return out;
            }
            break;
        case Op::MUL:
            if ((ta == ValueType::STRING || a.is_sequence()) && is_intlike(b)) return repeat(a, as_i64(b));
            if (is_intlike(a) && (tb == ValueType::STRING || b.is_sequence())) return repeat(b, as_i64(a));
            break;
        default:
            break;
    }
    throw bad_operands(op, a, b);
}

Value apply_unary(Op op, const Value& v) {
    switch (op) {
        case Op::NOT:
            return Value::boolean(!truthy(v));
        case Op::NEG:
            if (is_intlike(v)) return Value::integer(checked_sub(0, as_i64(v)));
            if (v.type() == ValueType::FLOAT) return Value::number(-v.as_float());
            break;
        case Op::PLUS:
            if (is_intlike(v)) return Value::integer(as_i64(v));
            if (v.type() == ValueType::FLOAT) return v;
            break;
        default:
            break;
    }
    throw runtime(std::string("bad operand type for unary ") + op_symbol(op) + ": '" + type_name(v) + "'");
}

void require_hashable(const Value& v) {
    if (!hashable(v)) throw runtime(std::string("unhashable type: '") + type_name(v) + "'");
}

void require_mutable(const Value& container) {
    bool frozen = false;
    switch (container.type()) {
        case ValueType::LIST: frozen = container.as_list().frozen; break;
        case ValueType::MAP:  frozen = container.as_map().frozen; break;
        case ValueType::SET:  frozen = container.as_set().frozen; break;
        default:
            throw runtime(std::string("'") + type_name(container) + "' object is immutable");
    }
    if (frozen) throw runtime(std::string("'") + type_name(container) + "' object is read-only");
}

bool contains(const Value& container, const Value& item) {
    switch (container.type()) {
        case ValueType::STRING:
            if (item.type() != ValueType::STRING) {
                throw runtime(std::string("'in <str>' requires str as left operand, not ") + type_name(item));
            }
            return container.as_string().find(item.as_string()) != std::string::npos;
        case ValueType::LIST:
        case ValueType::TUPLE:
            for (const auto& v : container.as_list().items) {
                if (values_equal(v, item)) return true;
            }
            return false;
        case ValueType::MAP:
            require_hashable(item);
            return container.as_map().entries.count(item) != 0;
        case ValueType::SET:
            require_hashable(item);
            return container.as_set().items.count(item) != 0;
        case ValueType::RANGE: {
            if (!is_intlike(item)) return false;
            const auto& r = container.as_range();
            int64_t n = r.size();
            if (n == 0) return false;
            int64_t x = as_i64(item);
            int64_t lo = r.step > 0 ? r.start : r.at(n - 1);
            int64_t hi = r.step > 0 ? r.at(n - 1) : r.start;
            if (x < lo || x > hi) return false;
            return (x - r.start) % r.step == 0;
        }
        default:
            break;
    }
    throw runtime(std::string("argument of type '") + type_name(container) + "' is not iterable");
}

int64_t to_int(const Value& v, const char* what) {
    if (!is_intlike(v)) throw runtime(std::string(what) + " must be an integer, not " + type_name(v));
    return as_i64(v);
}

size_t resolve_index(int64_t i, size_t len, const char* what) {
    int64_t n = static_cast<int64_t>(len);
    if (i < 0) i += n;
    if (i < 0 || i >= n) throw runtime(std::string(what) + " index out of range");
    return static_cast<size_t>(i);
}

Value index_value(const Value& obj, const Value& index) {
    switch (obj.type()) {
        case ValueType::LIST:
        case ValueType::TUPLE: {
            const auto& items = obj.as_list().items;
            return items[resolve_index(to_int(index, "index"), items.size(), type_name(obj))];
        }
        case ValueType::STRING: {
            const auto& s = obj.as_string();
            return Value::str(std::string(1, s[resolve_index(to_int(index, "index"), s.size(), "string")]));
        }
        case ValueType::RANGE: {
            const auto& r = obj.as_range();
            size_t i = resolve_index(to_int(index, "index"), static_cast<size_t>(r.size()), "range");
            return Value::integer(r.at(static_cast<int64_t>(i)));
        }
        case ValueType::MAP: {
            require_hashable(index);
            const auto& entries = obj.as_map().entries;
            auto it = entries.find(index);
            if (it == entries.end()) throw runtime("key not found: " + to_repr(index));
            return it->second;
        }
        default:
            break;
    }
    throw runtime(std::string("'") + type_name(obj) + "' object is not subscriptable");
}

static int64_t clamp_bound(const Value* bound, int64_t fallback, int64_t n) {
    if (!bound || bound->is_nil()) return fallback;
    int64_t i = to_int(*bound, "slice bound");
    if (i < 0) i += n;
    if (i < 0) return 0;
    if (i > n) return n;
    return i;
}

Value slice_value(const Value& obj, const Value* lo, const Value* hi) {
    int64_t n = 0;
    switch (obj.type()) {
        case ValueType::LIST:
        case ValueType::TUPLE:  n = static_cast<int64_t>(obj.as_list().items.size()); break;
        case ValueType::STRING: n = static_cast<int64_t>(obj.as_string().size()); break;
        case ValueType::RANGE:  n = obj.as_range().size(); break;
        default:
            throw runtime(std::string("'") + type_name(obj) + "' object is not sliceable");
    }

    int64_t l = clamp_bound(lo, 0, n);
    int64_t h = clamp_bound(hi, n, n);
    if (h < l) h = l;

    switch (obj.type()) {
        case ValueType::STRING:
            return Value::str(obj.as_string().substr(static_cast<size_t>(l), static_cast<size_t>(h - l)));
        case ValueType::RANGE: {
            const auto& r = obj.as_range();
            return Value::range(RangeVal{r.at(l), r.at(h), r.step});
        }
        default: {
            const auto& items = obj.as_list().items;
            std::vector<Value> out(items.begin() + l, items.begin() + h);
            return obj.type() == ValueType::TUPLE ? Value::tuple(std::move(out)) : Value::list(std::move(out));
        }
    }
}

void store_index(const Value& obj, const Value& index, Value v) {
    switch (obj.type()) {
        case ValueType::LIST: {
            require_mutable(obj);
            auto& items = obj.as_list().items;
            items[resolve_index(to_int(index, "index"), items.size(), "list assignment")] = std::move(v);
            return;
        }
        case ValueType::MAP:
            require_mutable(obj);
            require_hashable(index);
            obj.as_map().entries[index] = std::move(v);
            return;
        default:
            break;
    }
    throw runtime(std::string("'") + type_name(obj) + "' object does not support item assignment");
}

} // namespace capsule
