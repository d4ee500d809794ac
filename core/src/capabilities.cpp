#include "capsule/capabilities.h"
#include "capsule/errors.h"
#include "capsule/interpreter.h"
#include "capsule/ops.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace capsule {

const char kOutputTruncatedMarker[] = "\n...[output truncated]";

static SandboxError runtime(const std::string& msg) {
    return SandboxError(ErrorKind::RUNTIME, msg);
}

// ---- output ----

std::string utf8_prefix(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) return text;
    size_t cut = max_bytes;
    // Step back over continuation bytes so the lead byte is dropped too.
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) cut--;
    return text.substr(0, cut);
}

std::string cap_print_line(const std::string& line) {
    if (line.size() <= kMaxPrintChars) return line;
    return utf8_prefix(line, kMaxPrintChars - 3) + "...";
}

std::string truncate_output(const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) return text;
    const std::string marker = kOutputTruncatedMarker;
    if (max_chars <= marker.size()) return marker.substr(0, max_chars);
    // The prefix stops on a sequence boundary; dots after the newline make up
    // the bytes it gave back so the result is always max_chars long.
    const size_t keep = max_chars - marker.size();
    std::string out = utf8_prefix(text, keep);
    const size_t pad = keep - out.size();
    out += marker.substr(0, 1);
    out.append(pad, '.');
    out += marker.substr(1);
    return out;
}

void OutputSink::write_line(const std::string& line) {
    if (truncated_) return;
    if (lines_ > 0) text_.push_back('\n');
    text_ += cap_print_line(line);
    lines_++;
    if (text_.size() > kMaxOutputChars) {
        text_ = truncate_output(text_, kMaxOutputChars);
        truncated_ = true;
    }
}

// ---- helpers ----

void check_arity(const char* name, const std::vector<Value>& args, size_t min, size_t max) {
    if (args.size() >= min && args.size() <= max) return;
    std::string want;
    if (min == max) want = "exactly " + std::to_string(min);
    else if (args.size() < min) want = "at least " + std::to_string(min);
    else want = "at most " + std::to_string(max);
    throw runtime(std::string(name) + "() takes " + want + " argument(s) (" + std::to_string(args.size()) +
                  " given)");
}

void sort_values(Interpreter& in, std::vector<Value>& items, const Value& key, bool reverse) {
    if (key.is_nil()) {
        std::stable_sort(items.begin(), items.end(), [&](const Value& a, const Value& b) {
            return reverse ? compare_values(b, a) < 0 : compare_values(a, b) < 0;
        });
        return;
    }

    std::vector<std::pair<Value, Value>> decorated;
    decorated.reserve(items.size());
    for (auto& item : items) {
        std::vector<Value> args{item};
        decorated.emplace_back(in.call(key, args), std::move(item));
    }
    std::stable_sort(decorated.begin(), decorated.end(), [&](const auto& a, const auto& b) {
        return reverse ? compare_values(b.first, a.first) < 0 : compare_values(a.first, b.first) < 0;
    });
    for (size_t i = 0; i < items.size(); i++) items[i] = std::move(decorated[i].second);
}

static int64_t float_to_int(double d) {
    if (!std::isfinite(d)) throw runtime("cannot convert non-finite float to int");
    double t = std::trunc(d);
    if (t < -9223372036854775808.0 || t >= 9223372036854775808.0) throw runtime("integer overflow");
    return static_cast<int64_t>(t);
}

static std::string trim_ascii(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

static int64_t parse_int(const std::string& raw) {
    std::string s = trim_ascii(raw);
    size_t i = 0;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) i++;
    bool digits = i < s.size();
    for (size_t j = i; j < s.size(); j++) {
        if (!std::isdigit(static_cast<unsigned char>(s[j]))) digits = false;
    }
    if (!digits) throw runtime("invalid literal for int(): " + to_repr(Value::str(raw)));
    errno = 0;
    long long v = std::strtoll(s.c_str(), nullptr, 10);
    if (errno == ERANGE) throw runtime("integer overflow");
    return static_cast<int64_t>(v);
}

static double parse_float(const std::string& raw) {
    std::string s = trim_ascii(raw);
    char* end = nullptr;
    double d = s.empty() ? 0.0 : std::strtod(s.c_str(), &end);
    if (s.empty() || end != s.c_str() + s.size()) {
        throw runtime("could not convert string to float: " + to_repr(Value::str(raw)));
    }
    return d;
}

static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Decodes `s` as exactly one UTF-8 code point; -1 otherwise.
static int64_t single_code_point(const std::string& s) {
    if (s.empty()) return -1;
    unsigned char c0 = static_cast<unsigned char>(s[0]);
    size_t len = c0 < 0x80 ? 1 : (c0 >> 5) == 0x6 ? 2 : (c0 >> 4) == 0xE ? 3 : (c0 >> 3) == 0x1E ? 4 : 0;
    if (len == 0 || s.size() != len) return -1;
    if (len == 1) return c0;
    uint32_t cp = c0 & (0x7F >> len);
    for (size_t i = 1; i < len; i++) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c & 0xC0) != 0x80) return -1;
        cp = (cp << 6) | (c & 0x3F);
    }
    return cp;
}

static bool instance_of(const Value& v, const Value& tag) {
    if (tag.type() == ValueType::TUPLE) {
        for (const auto& t : tag.as_list().items) {
            if (instance_of(v, t)) return true;
        }
        return false;
    }
    if (tag.type() != ValueType::FUNCTION || !tag.as_function()->is_type) {
        throw runtime("isinstance() arg 2 must be a type or tuple of types");
    }
    ValueType want = tag.as_function()->type_tag;
    if (v.type() == want) return true;
    return want == ValueType::INT && v.type() == ValueType::BOOL;
}

static Value extremum(Interpreter& in, std::vector<Value>& args, const char* name, int sign) {
    check_arity(name, args, 1, std::numeric_limits<size_t>::max());
    std::vector<Value> items = args.size() == 1 ? in.collect(args[0]) : args;
    if (items.empty()) throw runtime(std::string(name) + "() arg is an empty sequence");
    Value best = items[0];
    for (size_t i = 1; i < items.size(); i++) {
        if (compare_values(items[i], best) * sign > 0) best = items[i];
    }
    return best;
}

static int64_t mod_pow(int64_t base, int64_t exp, int64_t mod) {
    if (mod == 0) throw runtime("pow() 3rd argument cannot be 0");
    if (exp < 0) throw runtime("pow() 2nd argument cannot be negative when 3rd argument specified");
    __int128 m = mod < 0 ? -static_cast<__int128>(mod) : mod;
    __int128 result = 1 % m;
    __int128 b = ((base % m) + m) % m;
    while (exp > 0) {
        if (exp & 1) result = (result * b) % m;
        b = (b * b) % m;
        exp >>= 1;
    }
    if (mod < 0 && result != 0) result -= m;
    return static_cast<int64_t>(result);
}

static double round_half_even(double x) {
    double r = std::round(x);
    if (std::fabs(x - std::trunc(x)) == 0.5) r = 2.0 * std::round(x / 2.0);
    return r;
}

// ---- catalogue ----

namespace {

struct Entry {
    const char* name;
    NativeFn fn;
    bool is_type;
    ValueType tag;
};

Value b_int(Interpreter&, std::vector<Value>& a) {
    check_arity("int", a, 0, 1);
    if (a.empty()) return Value::integer(0);
    const Value& v = a[0];
    switch (v.type()) {
        case ValueType::INT:    return v;
        case ValueType::BOOL:   return Value::integer(v.as_bool() ? 1 : 0);
        case ValueType::FLOAT:  return Value::integer(float_to_int(v.as_float()));
        case ValueType::STRING: return Value::integer(parse_int(v.as_string()));
        default: break;
    }
    throw runtime(std::string("int() argument must be a string or a number, not '") + type_name(v) + "'");
}

Value b_float(Interpreter&, std::vector<Value>& a) {
    check_arity("float", a, 0, 1);
    if (a.empty()) return Value::number(0.0);
    const Value& v = a[0];
    if (v.is_number()) return Value::number(v.to_double());
    if (v.type() == ValueType::STRING) return Value::number(parse_float(v.as_string()));
    throw runtime(std::string("float() argument must be a string or a number, not '") + type_name(v) + "'");
}

Value b_str(Interpreter&, std::vector<Value>& a) {
    check_arity("str", a, 0, 1);
    return Value::str(a.empty() ? std::string() : to_display(a[0]));
}

Value b_bool(Interpreter&, std::vector<Value>& a) {
    check_arity("bool", a, 0, 1);
    return Value::boolean(!a.empty() && truthy(a[0]));
}

Value b_list(Interpreter& in, std::vector<Value>& a) {
    check_arity("list", a, 0, 1);
    return Value::list(a.empty() ? std::vector<Value>{} : in.collect(a[0]));
}

Value b_tuple(Interpreter& in, std::vector<Value>& a) {
    check_arity("tuple", a, 0, 1);
    return Value::tuple(a.empty() ? std::vector<Value>{} : in.collect(a[0]));
}

Value b_dict(Interpreter& in, std::vector<Value>& a) {
    check_arity("dict", a, 0, 1);
    Value out = Value::map();
    if (a.empty()) return out;
    auto& entries = out.as_map().entries;
    if (a[0].type() == ValueType::MAP) {
        for (const auto& kv : a[0].as_map().entries) entries[kv.first] = kv.second;
        return out;
    }
    in.iterate(a[0], [&](const Value& pair) {
        if (!pair.is_sequence() || pair.as_list().items.size() != 2) {
            throw runtime("dict() sequence elements must be pairs");
        }
        const Value& k = pair.as_list().items[0];
        require_hashable(k);
        entries[k] = pair.as_list().items[1];
    });
    return out;
}

Value b_set(Interpreter& in, std::vector<Value>& a) {
    check_arity("set", a, 0, 1);
    Value out = Value::set();
    if (a.empty()) return out;
    in.iterate(a[0], [&](const Value& v) {
        require_hashable(v);
        out.as_set().items.insert(v);
    });
    return out;
}

Value b_len(Interpreter&, std::vector<Value>& a) {
    check_arity("len", a, 1, 1);
    const Value& v = a[0];
    switch (v.type()) {
        case ValueType::STRING: return Value::integer(static_cast<int64_t>(v.as_string().size()));
        case ValueType::LIST:
        case ValueType::TUPLE:  return Value::integer(static_cast<int64_t>(v.as_list().items.size()));
        case ValueType::MAP:    return Value::integer(static_cast<int64_t>(v.as_map().entries.size()));
        case ValueType::SET:    return Value::integer(static_cast<int64_t>(v.as_set().items.size()));
        case ValueType::RANGE:  return Value::integer(v.as_range().size());
        default: break;
    }
    throw runtime(std::string("object of type '") + type_name(v) + "' has no len()");
}

Value b_range(Interpreter&, std::vector<Value>& a) {
    check_arity("range", a, 1, 3);
    RangeVal r;
    if (a.size() == 1) {
        r.stop = to_int(a[0], "range() argument");
    } else {
        r.start = to_int(a[0], "range() argument");
        r.stop = to_int(a[1], "range() argument");
        if (a.size() == 3) r.step = to_int(a[2], "range() argument");
    }
    if (r.step == 0) throw runtime("range() arg 3 must not be zero");
    return Value::range(r);
}

Value b_enumerate(Interpreter& in, std::vector<Value>& a) {
    check_arity("enumerate", a, 1, 2);
    int64_t i = a.size() == 2 ? to_int(a[1], "enumerate() start") : 0;
    std::vector<Value> out;
    in.iterate(a[0], [&](const Value& v) {
        out.push_back(Value::tuple({Value::integer(i), v}));
        i = checked_add(i, 1);
    });
    return Value::list(std::move(out));
}

Value b_zip(Interpreter& in, std::vector<Value>& a) {
    std::vector<std::vector<Value>> cols;
    cols.reserve(a.size());
    size_t n = a.empty() ? 0 : std::numeric_limits<size_t>::max();
    for (const auto& v : a) {
        cols.push_back(in.collect(v));
        n = std::min(n, cols.back().size());
    }
    std::vector<Value> out;
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        std::vector<Value> row;
        row.reserve(cols.size());
        for (const auto& c : cols) row.push_back(c[i]);
        out.push_back(Value::tuple(std::move(row)));
    }
    return Value::list(std::move(out));
}

Value b_map(Interpreter& in, std::vector<Value>& a) {
    check_arity("map", a, 2, 2);
    std::vector<Value> out;
    Value fn = a[0];
    in.iterate(a[1], [&](const Value& v) {
        std::vector<Value> args{v};
        out.push_back(in.call(fn, args));
    });
    return Value::list(std::move(out));
}

Value b_filter(Interpreter& in, std::vector<Value>& a) {
    check_arity("filter", a, 2, 2);
    std::vector<Value> out;
    Value fn = a[0];
    in.iterate(a[1], [&](const Value& v) {
        bool keep = truthy(v);
        if (!fn.is_nil()) {
            std::vector<Value> args{v};
            keep = truthy(in.call(fn, args));
        }
        if (keep) out.push_back(v);
    });
    return Value::list(std::move(out));
}

Value b_sorted(Interpreter& in, std::vector<Value>& a) {
    check_arity("sorted", a, 1, 3);
    std::vector<Value> items = in.collect(a[0]);
    Value key = a.size() >= 2 ? a[1] : Value();
    bool reverse = a.size() == 3 && truthy(a[2]);
    sort_values(in, items, key, reverse);
    return Value::list(std::move(items));
}

Value b_reversed(Interpreter& in, std::vector<Value>& a) {
    check_arity("reversed", a, 1, 1);
    std::vector<Value> items = in.collect(a[0]);
    std::reverse(items.begin(), items.end());
    return Value::list(std::move(items));
}

Value b_sum(Interpreter& in, std::vector<Value>& a) {
    check_arity("sum", a, 1, 2);
    Value total = a.size() == 2 ? a[1] : Value::integer(0);
    if (total.type() == ValueType::STRING) throw runtime("sum() can't sum strings, use ''.join(seq)");
    in.iterate(a[0], [&](const Value& v) { total = apply_binary(Op::ADD, total, v); });
    return total;
}

Value b_min(Interpreter& in, std::vector<Value>& a) {
    return extremum(in, a, "min", -1);
}

Value b_max(Interpreter& in, std::vector<Value>& a) {
    return extremum(in, a, "max", 1);
}

Value b_abs(Interpreter&, std::vector<Value>& a) {
    check_arity("abs", a, 1, 1);
    const Value& v = a[0];
    if (v.type() == ValueType::FLOAT) return Value::number(std::fabs(v.as_float()));
    int64_t i = to_int(v, "abs() argument");
    return Value::integer(i < 0 ? checked_mul(i, -1) : i);
}

Value b_round(Interpreter&, std::vector<Value>& a) {
    check_arity("round", a, 1, 2);
    const Value& v = a[0];
    if (!v.is_number()) throw runtime(std::string("type ") + type_name(v) + " doesn't define round()");
    bool has_digits = a.size() == 2 && !a[1].is_nil();
    if (v.type() != ValueType::FLOAT) {
        int64_t i = to_int(v, "round() argument");
        if (!has_digits || to_int(a[1], "ndigits") >= 0) return Value::integer(i);
        int64_t p = 1;
        for (int64_t k = to_int(a[1], "ndigits"); k < 0 && p <= std::numeric_limits<int64_t>::max() / 10; k++) p *= 10;
        double r = round_half_even(static_cast<double>(i) / static_cast<double>(p)) * static_cast<double>(p);
        return Value::integer(float_to_int(r));
    }
    double d = v.as_float();
    if (!has_digits) return Value::integer(float_to_int(round_half_even(d)));
    int64_t nd = to_int(a[1], "ndigits");
    if (nd > 308) return v;
    if (nd < -308) return Value::number(0.0);
    double scale = std::pow(10.0, static_cast<double>(nd));
    double scaled = d * scale;
    if (!std::isfinite(scaled)) return v;
    return Value::number(round_half_even(scaled) / scale);
}

Value b_pow(Interpreter&, std::vector<Value>& a) {
    check_arity("pow", a, 2, 3);
    if (a.size() == 3) {
        return Value::integer(mod_pow(to_int(a[0], "pow() base"), to_int(a[1], "pow() exponent"),
                                      to_int(a[2], "pow() modulus")));
    }
    return apply_binary(Op::POW, a[0], a[1]);
}

Value b_all(Interpreter& in, std::vector<Value>& a) {
    check_arity("all", a, 1, 1);
    bool ok = true;
    in.iterate(a[0], [&](const Value& v) { ok = ok && truthy(v); });
    return Value::boolean(ok);
}

Value b_any(Interpreter& in, std::vector<Value>& a) {
    check_arity("any", a, 1, 1);
    bool hit = false;
    in.iterate(a[0], [&](const Value& v) { hit = hit || truthy(v); });
    return Value::boolean(hit);
}

Value b_chr(Interpreter&, std::vector<Value>& a) {
    check_arity("chr", a, 1, 1);
    int64_t cp = to_int(a[0], "chr() argument");
    if (cp < 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) throw runtime("chr() arg not in range");
    std::string out;
    append_utf8(out, static_cast<uint32_t>(cp));
    return Value::str(std::move(out));
}

Value b_ord(Interpreter&, std::vector<Value>& a) {
    check_arity("ord", a, 1, 1);
    if (a[0].type() != ValueType::STRING) {
        throw runtime(std::string("ord() expected string, got ") + type_name(a[0]));
    }
    int64_t cp = single_code_point(a[0].as_string());
    if (cp < 0) throw runtime("ord() expected a single character");
    return Value::integer(cp);
}

Value b_type(Interpreter&, std::vector<Value>& a) {
    check_arity("type", a, 1, 1);
    return Value::str(type_name(a[0]));
}

Value b_isinstance(Interpreter&, std::vector<Value>& a) {
    check_arity("isinstance", a, 2, 2);
    return Value::boolean(instance_of(a[0], a[1]));
}

Value b_print(Interpreter& in, std::vector<Value>& a) {
    std::string line;
    for (size_t i = 0; i < a.size(); i++) {
        if (i > 0) line.push_back(' ');
        line += to_display(a[i]);
        if (line.size() > kMaxOutputChars) break;
    }
    in.output().write_line(line);
    return Value();
}

const std::vector<Entry>& catalogue() {
    static const std::vector<Entry> entries = {
        {"int", b_int, true, ValueType::INT},
        {"float", b_float, true, ValueType::FLOAT},
        {"str", b_str, true, ValueType::STRING},
        {"bool", b_bool, true, ValueType::BOOL},
        {"list", b_list, true, ValueType::LIST},
        {"tuple", b_tuple, true, ValueType::TUPLE},
        {"dict", b_dict, true, ValueType::MAP},
        {"set", b_set, true, ValueType::SET},
        {"len", b_len, false, ValueType::NIL},
        {"range", b_range, true, ValueType::RANGE},
        {"enumerate", b_enumerate, false, ValueType::NIL},
        {"zip", b_zip, false, ValueType::NIL},
        {"map", b_map, false, ValueType::NIL},
        {"filter", b_filter, false, ValueType::NIL},
        {"sorted", b_sorted, false, ValueType::NIL},
        {"reversed", b_reversed, false, ValueType::NIL},
        {"sum", b_sum, false, ValueType::NIL},
        {"min", b_min, false, ValueType::NIL},
        {"max", b_max, false, ValueType::NIL},
        {"abs", b_abs, false, ValueType::NIL},
        {"round", b_round, false, ValueType::NIL},
        {"pow", b_pow, false, ValueType::NIL},
        {"all", b_all, false, ValueType::NIL},
        {"any", b_any, false, ValueType::NIL},
        {"chr", b_chr, false, ValueType::NIL},
        {"ord", b_ord, false, ValueType::NIL},
        {"type", b_type, false, ValueType::NIL},
        {"isinstance", b_isinstance, false, ValueType::NIL},
        {"print", b_print, false, ValueType::NIL},
    };
    return entries;
}

} // namespace

const std::vector<std::string>& capability_names() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> out;
        for (const auto& e : catalogue()) out.push_back(e.name);
        return out;
    }();
    return names;
}

void install_capabilities(Scope& builtins) {
    for (const auto& e : catalogue()) {
        auto fn = std::make_shared<Function>();
        fn->name = e.name;
        fn->native = e.fn;
        fn->is_type = e.is_type;
        fn->type_tag = e.tag;
        builtins.vars[e.name] = Value::function(std::move(fn));
    }
}

} // namespace capsule
