#include "capsule/value.h"
#include "capsule/errors.h"

#include <json-c/json.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <new>
#include <vector>

namespace capsule {

static constexpr int kMaxRenderDepth = 256;

int64_t RangeVal::size() const {
    uint64_t n = 0;
    if (step > 0 && start < stop) {
        n = (static_cast<uint64_t>(stop) - static_cast<uint64_t>(start) - 1) / static_cast<uint64_t>(step) + 1;
    } else if (step < 0 && start > stop) {
        n = (static_cast<uint64_t>(start) - static_cast<uint64_t>(stop) - 1) / (0 - static_cast<uint64_t>(step)) + 1;
    }
    const uint64_t max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    return static_cast<int64_t>(n > max ? max : n);
}

Value Value::boolean(bool b) {
    Value v;
    v.type_ = ValueType::BOOL;
    v.data_ = b;
    return v;
}

Value Value::integer(int64_t i) {
    Value v;
    v.type_ = ValueType::INT;
    v.data_ = i;
    return v;
}

Value Value::number(double d) {
    Value v;
    v.type_ = ValueType::FLOAT;
    v.data_ = d;
    return v;
}

Value Value::str(std::string s) {
    Value v;
    v.type_ = ValueType::STRING;
    v.data_ = std::move(s);
    return v;
}

Value Value::list(std::vector<Value> items) {
    auto obj = std::make_shared<ListObj>();
    obj->items = std::move(items);
    Value v;
    v.type_ = ValueType::LIST;
    v.data_ = std::move(obj);
    return v;
}

Value Value::tuple(std::vector<Value> items) {
    auto obj = std::make_shared<ListObj>();
    obj->items = std::move(items);
    obj->frozen = true;
    Value v;
    v.type_ = ValueType::TUPLE;
    v.data_ = std::move(obj);
    return v;
}

Value Value::map() {
    Value v;
    v.type_ = ValueType::MAP;
    v.data_ = std::make_shared<MapObj>();
    return v;
}

Value Value::set() {
    Value v;
    v.type_ = ValueType::SET;
    v.data_ = std::make_shared<SetObj>();
    return v;
}

Value Value::range(RangeVal r) {
    Value v;
    v.type_ = ValueType::RANGE;
    v.data_ = r;
    return v;
}

Value Value::function(std::shared_ptr<Function> fn) {
    Value v;
    v.type_ = ValueType::FUNCTION;
    v.data_ = std::move(fn);
    return v;
}

double Value::to_double() const {
    switch (type_) {
        case ValueType::BOOL:  return as_bool() ? 1.0 : 0.0;
        case ValueType::INT:   return static_cast<double>(as_int());
        case ValueType::FLOAT: return as_float();
        default: break;
    }
    throw SandboxError(ErrorKind::RUNTIME, std::string("expected a number, got ") + type_name(type_));
}

const void* Value::identity() const {
    switch (type_) {
        case ValueType::LIST:
        case ValueType::TUPLE:    return std::get<std::shared_ptr<ListObj>>(data_).get();
        case ValueType::MAP:      return std::get<std::shared_ptr<MapObj>>(data_).get();
        case ValueType::SET:      return std::get<std::shared_ptr<SetObj>>(data_).get();
        case ValueType::FUNCTION: return std::get<std::shared_ptr<Function>>(data_).get();
        default: return nullptr;
    }
}

void Value::release_children(std::vector<Value>& out) {
    switch (type_) {
        case ValueType::LIST:
        case ValueType::TUPLE: {
            auto& p = std::get<std::shared_ptr<ListObj>>(data_);
            if (p.use_count() != 1) return;
            for (auto& item : p->items) out.push_back(std::move(item));
            p->items.clear();
            return;
        }
        case ValueType::MAP: {
            auto& p = std::get<std::shared_ptr<MapObj>>(data_);
            if (p.use_count() != 1) return;
            for (auto& kv : p->entries) {
                out.push_back(kv.first);
                out.push_back(std::move(kv.second));
            }
            p->entries.clear();
            return;
        }
        case ValueType::SET: {
            auto& p = std::get<std::shared_ptr<SetObj>>(data_);
            if (p.use_count() != 1) return;
            for (const auto& item : p->items) out.push_back(item);
            p->items.clear();
            return;
        }
        default:
            return;
    }
}

static void drain(std::vector<Value>& pending) noexcept {
    try {
        while (!pending.empty()) {
            Value v = std::move(pending.back());
            pending.pop_back();
            v.release_children(pending);
        }
    } catch (const std::bad_alloc&) {
        // Out of memory mid-teardown: what is left unwinds recursively.
    }
}

ListObj::~ListObj() {
    std::vector<Value> pending;
    pending.swap(items);
    drain(pending);
}

MapObj::~MapObj() {
    std::vector<Value> pending;
    for (auto& kv : entries) {
        pending.push_back(kv.first);
        pending.push_back(std::move(kv.second));
    }
    entries.clear();
    drain(pending);
}

SetObj::~SetObj() {
    std::vector<Value> pending(items.begin(), items.end());
    items.clear();
    drain(pending);
}

const char* type_name(ValueType t) {
    switch (t) {
        case ValueType::NIL:      return "null";
        case ValueType::BOOL:     return "bool";
        case ValueType::INT:      return "int";
        case ValueType::FLOAT:    return "float";
        case ValueType::STRING:   return "str";
        case ValueType::LIST:     return "list";
        case ValueType::TUPLE:    return "tuple";
        case ValueType::MAP:      return "dict";
        case ValueType::SET:      return "set";
        case ValueType::RANGE:    return "range";
        case ValueType::FUNCTION: return "function";
    }
    return "unknown";
}

bool truthy(const Value& v) {
    switch (v.type()) {
        case ValueType::NIL:      return false;
        case ValueType::BOOL:     return v.as_bool();
        case ValueType::INT:      return v.as_int() != 0;
        case ValueType::FLOAT:    return v.as_float() != 0.0;
        case ValueType::STRING:   return !v.as_string().empty();
        case ValueType::LIST:
        case ValueType::TUPLE:    return !v.as_list().items.empty();
        case ValueType::MAP:      return !v.as_map().entries.empty();
        case ValueType::SET:      return !v.as_set().items.empty();
        case ValueType::RANGE:    return v.as_range().size() > 0;
        case ValueType::FUNCTION: return true;
    }
    return false;
}

bool hashable(const Value& v) {
    switch (v.type()) {
        case ValueType::NIL:
        case ValueType::BOOL:
        case ValueType::INT:
        case ValueType::FLOAT:
        case ValueType::STRING:
            return true;
        case ValueType::TUPLE:
            for (const auto& item : v.as_list().items) {
                if (!hashable(item)) return false;
            }
            return true;
        default:
            return false;
    }
}

static int compare_numbers(const Value& a, const Value& b) {
    if (a.type() != ValueType::FLOAT && b.type() != ValueType::FLOAT) {
        int64_t x = a.type() == ValueType::BOOL ? (a.as_bool() ? 1 : 0) : a.as_int();
        int64_t y = b.type() == ValueType::BOOL ? (b.as_bool() ? 1 : 0) : b.as_int();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    double x = a.to_double();
    double y = b.to_double();
    return x < y ? -1 : (x > y ? 1 : 0);
}

static void check_compare_depth(int depth) {
    if (depth > kMaxRenderDepth) {
        throw SandboxError(ErrorKind::RUNTIME, "maximum recursion depth exceeded in comparison");
    }
}

static bool equal_at(const Value& a, const Value& b, int depth) {
    check_compare_depth(depth);
    if (a.is_number() && b.is_number()) {
        if (a.type() == ValueType::FLOAT || b.type() == ValueType::FLOAT) {
            return a.to_double() == b.to_double();
        }
        return compare_numbers(a, b) == 0;
    }
    if (a.type() != b.type()) return false;

    switch (a.type()) {
        case ValueType::NIL:
            return true;
        case ValueType::STRING:
            return a.as_string() == b.as_string();
        case ValueType::LIST:
        case ValueType::TUPLE: {
            const auto& x = a.as_list().items;
            const auto& y = b.as_list().items;
            if (x.size() != y.size()) return false;
            if (&x == &y) return true;
            for (size_t i = 0; i < x.size(); i++) {
                if (!equal_at(x[i], y[i], depth + 1)) return false;
            }
            return true;
        }
        case ValueType::MAP: {
            const auto& x = a.as_map().entries;
            const auto& y = b.as_map().entries;
            if (x.size() != y.size()) return false;
            for (const auto& kv : x) {
                auto it = y.find(kv.first);
                if (it == y.end() || !equal_at(kv.second, it->second, depth + 1)) return false;
            }
            return true;
        }
        case ValueType::SET: {
            const auto& x = a.as_set().items;
            const auto& y = b.as_set().items;
            if (x.size() != y.size()) return false;
            for (const auto& item : x) {
                if (y.find(item) == y.end()) return false;
            }
            return true;
        }
        case ValueType::RANGE: {
            const auto& x = a.as_range();
            const auto& y = b.as_range();
            if (x.size() != y.size()) return false;
            return x.size() == 0 || (x.start == y.start && (x.size() == 1 || x.step == y.step));
        }
        case ValueType::FUNCTION:
            return a.identity() == b.identity();
        default:
            return false;
    }
}

bool values_equal(const Value& a, const Value& b) {
    return equal_at(a, b, 0);
}

static int rank(const Value& v) {
    switch (v.type()) {
        case ValueType::NIL:    return 0;
        case ValueType::BOOL:
        case ValueType::INT:
        case ValueType::FLOAT:  return 1;
        case ValueType::STRING: return 2;
        case ValueType::TUPLE:  return 3;
        default:                return 4;
    }
}

bool ValueLess::operator()(const Value& a, const Value& b) const {
    int ra = rank(a);
    int rb = rank(b);
    if (ra != rb) return ra < rb;
    switch (ra) {
        case 0: return false;
        case 1: return compare_numbers(a, b) < 0;
        case 2: return a.as_string() < b.as_string();
        case 3: {
            const auto& x = a.as_list().items;
            const auto& y = b.as_list().items;
            return std::lexicographical_compare(x.begin(), x.end(), y.begin(), y.end(), ValueLess{});
        }
        default:
            return std::less<const void*>()(a.identity(), b.identity());
    }
}

static int compare_at(const Value& a, const Value& b, int depth) {
    check_compare_depth(depth);
    if (a.is_number() && b.is_number()) return compare_numbers(a, b);
    if (a.type() == ValueType::STRING && b.type() == ValueType::STRING) {
        int c = a.as_string().compare(b.as_string());
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (a.is_sequence() && a.type() == b.type()) {
        const auto& x = a.as_list().items;
        const auto& y = b.as_list().items;
        size_t n = std::min(x.size(), y.size());
        for (size_t i = 0; i < n; i++) {
            int c = compare_at(x[i], y[i], depth + 1);
            if (c != 0) return c;
        }
        return x.size() < y.size() ? -1 : (x.size() > y.size() ? 1 : 0);
    }
    throw SandboxError(ErrorKind::RUNTIME,
                       std::string("'<' not supported between '") + type_name(a) + "' and '" + type_name(b) + "'");
}

int compare_values(const Value& a, const Value& b) {
    return compare_at(a, b, 0);
}

std::string format_float(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d > 0 ? "inf" : "-inf";

    // Shortest representation that round-trips.
    char buf[64];
    for (int prec = 1; prec <= 17; prec++) {
        std::snprintf(buf, sizeof(buf), "%.*g", prec, d);
        if (std::strtod(buf, nullptr) == d) break;
    }
    std::string s = buf;
    if (s.find_first_of(".eEn") == std::string::npos) s += ".0";
    return s;
}

static std::string quote_string(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
    return out;
}

static void render(const Value& v, std::string& out, std::vector<const void*>& stack);

static bool enter(const Value& v, std::vector<const void*>& stack) {
    if (stack.size() >= static_cast<size_t>(kMaxRenderDepth)) {
        throw SandboxError(ErrorKind::RUNTIME, "value nesting too deep to render");
    }
    const void* id = v.identity();
    if (std::find(stack.begin(), stack.end(), id) != stack.end()) return false;
    stack.push_back(id);
    return true;
}

static void render_items(const std::vector<Value>& items, std::string& out, std::vector<const void*>& stack) {
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += ", ";
        render(items[i], out, stack);
    }
}

static void render(const Value& v, std::string& out, std::vector<const void*>& stack) {
    switch (v.type()) {
        case ValueType::NIL:    out += "null"; return;
        case ValueType::BOOL:   out += v.as_bool() ? "true" : "false"; return;
        case ValueType::INT:    out += std::to_string(v.as_int()); return;
        case ValueType::FLOAT:  out += format_float(v.as_float()); return;
        case ValueType::STRING: out += quote_string(v.as_string()); return;
        case ValueType::LIST:
        case ValueType::TUPLE: {
            bool is_tuple = v.type() == ValueType::TUPLE;
            if (!enter(v, stack)) { out += is_tuple ? "(...)" : "[...]"; return; }
            const auto& items = v.as_list().items;
            out += is_tuple ? "(" : "[";
            render_items(items, out, stack);
            if (is_tuple && items.size() == 1) out += ",";
            out += is_tuple ? ")" : "]";
            stack.pop_back();
            return;
        }
        case ValueType::MAP: {
            if (!enter(v, stack)) { out += "{...}"; return; }
            out += "{";
            bool first = true;
            for (const auto& kv : v.as_map().entries) {
                if (!first) out += ", ";
                first = false;
                render(kv.first, out, stack);
                out += ": ";
                render(kv.second, out, stack);
            }
            out += "}";
            stack.pop_back();
            return;
        }
        case ValueType::SET: {
            const auto& items = v.as_set().items;
            if (items.empty()) { out += "set()"; return; }
            out += "{";
            bool first = true;
            for (const auto& item : items) {
                if (!first) out += ", ";
                first = false;
                render(item, out, stack);
            }
            out += "}";
            return;
        }
        case ValueType::RANGE: {
            const auto& r = v.as_range();
            out += "range(" + std::to_string(r.start) + ", " + std::to_string(r.stop);
            if (r.step != 1) out += ", " + std::to_string(r.step);
            out += ")";
            return;
        }
        case ValueType::FUNCTION: {
            const auto& fn = v.as_function();
            out += "<function " + (fn->name.empty() ? std::string("<lambda>") : fn->name) + ">";
            return;
        }
    }
}

std::string to_repr(const Value& v) {
    std::string out;
    std::vector<const void*> stack;
    render(v, out, stack);
    return out;
}

std::string to_display(const Value& v) {
    if (v.type() == ValueType::STRING) return v.as_string();
    return to_repr(v);
}

static json_object* to_json(const Value& v, std::vector<const void*>& stack);

static json_object* array_to_json(const std::vector<Value>& items, std::vector<const void*>& stack) {
    json_object* arr = json_object_new_array();
    for (const auto& item : items) {
        try {
            json_object_array_add(arr, to_json(item, stack));
        } catch (...) {
            json_object_put(arr);
            throw;
        }
    }
    return arr;
}

static std::string json_key(const Value& k) {
    switch (k.type()) {
        case ValueType::STRING: return k.as_string();
        case ValueType::NIL:
        case ValueType::BOOL:
        case ValueType::INT:
        case ValueType::FLOAT:
            return to_repr(k);
        default:
            throw SandboxError(ErrorKind::RUNTIME,
                               std::string("dict key of type '") + type_name(k) + "' is not JSON-serializable");
    }
}

static json_object* to_json(const Value& v, std::vector<const void*>& stack) {
    switch (v.type()) {
        case ValueType::NIL:    return nullptr;
        case ValueType::BOOL:   return json_object_new_boolean(v.as_bool() ? 1 : 0);
        case ValueType::INT:    return json_object_new_int64(v.as_int());
        case ValueType::FLOAT: {
            double d = v.as_float();
            if (!std::isfinite(d)) {
                throw SandboxError(ErrorKind::RUNTIME, "non-finite float is not JSON-serializable");
            }
            return json_object_new_double_s(d, format_float(d).c_str());
        }
        case ValueType::STRING: {
            const auto& s = v.as_string();
            return json_object_new_string_len(s.c_str(), static_cast<int>(s.size()));
        }
        case ValueType::LIST:
        case ValueType::TUPLE: {
            if (!enter(v, stack)) {
                throw SandboxError(ErrorKind::RUNTIME, "cyclic container is not JSON-serializable");
            }
            json_object* arr = array_to_json(v.as_list().items, stack);
            stack.pop_back();
            return arr;
        }
        case ValueType::SET: {
            std::vector<Value> items(v.as_set().items.begin(), v.as_set().items.end());
            return array_to_json(items, stack);
        }
        case ValueType::RANGE: {
            const auto& r = v.as_range();
            if (r.size() > (int64_t{1} << 20)) {
                throw SandboxError(ErrorKind::RUNTIME, "range too large to serialize");
            }
            json_object* arr = json_object_new_array();
            for (int64_t i = 0; i < r.size(); i++) json_object_array_add(arr, json_object_new_int64(r.at(i)));
            return arr;
        }
        case ValueType::MAP: {
            if (!enter(v, stack)) {
                throw SandboxError(ErrorKind::RUNTIME, "cyclic container is not JSON-serializable");
            }
            json_object* obj = json_object_new_object();
            try {
                for (const auto& kv : v.as_map().entries) {
                    std::string key = json_key(kv.first);
                    json_object_object_add(obj, key.c_str(), to_json(kv.second, stack));
                }
            } catch (...) {
                json_object_put(obj);
                throw;
            }
            stack.pop_back();
            return obj;
        }
        case ValueType::FUNCTION:
            throw SandboxError(ErrorKind::RUNTIME, "function is not JSON-serializable");
    }
    return nullptr;
}

json_object* value_to_json(const Value& v) {
    std::vector<const void*> stack;
    return to_json(v, stack);
}

Value value_from_json(json_object* obj, bool frozen) {
    if (!obj) return Value();
    switch (json_object_get_type(obj)) {
        case json_type_null:
            return Value();
        case json_type_boolean:
            return Value::boolean(json_object_get_boolean(obj) != 0);
        case json_type_int:
            return Value::integer(json_object_get_int64(obj));
        case json_type_double:
            return Value::number(json_object_get_double(obj));
        case json_type_string:
            return Value::str(std::string(json_object_get_string(obj),
                                          static_cast<size_t>(json_object_get_string_len(obj))));
        case json_type_array: {
            std::vector<Value> items;
            const size_t n = json_object_array_length(obj);
            items.reserve(n);
            for (size_t i = 0; i < n; i++) {
                items.push_back(value_from_json(json_object_array_get_idx(obj, i), frozen));
            }
            Value out = Value::list(std::move(items));
            out.as_list().frozen = frozen;
            return out;
        }
        case json_type_object: {
            Value out = Value::map();
            auto& entries = out.as_map().entries;
            json_object_object_foreach(obj, key, val) {
                entries[Value::str(key)] = value_from_json(val, frozen);
            }
            out.as_map().frozen = frozen;
            return out;
        }
    }
    return Value();
}

} // namespace capsule
