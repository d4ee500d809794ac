#include "capsule/capabilities.h"
#include "capsule/errors.h"
#include "capsule/interpreter.h"
#include "capsule/ops.h"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace capsule {

namespace {

using Method = Value (*)(Interpreter&, const Value& self, std::vector<Value>& args);
using MethodTable = std::unordered_map<std::string, Method>;

SandboxError runtime(const std::string& msg) {
    return SandboxError(ErrorKind::RUNTIME, msg);
}

const std::string& str_arg(const Value& v, const char* what) {
    if (v.type() != ValueType::STRING) {
        throw runtime(std::string(what) + " must be str, not " + type_name(v));
    }
    return v.as_string();
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// ---- str ----

Value s_upper(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("upper", a, 0, 0);
    std::string s = self.as_string();
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return Value::str(std::move(s));
}

Value s_lower(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("lower", a, 0, 0);
    std::string s = self.as_string();
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return Value::str(std::move(s));
}

Value strip_impl(const Value& self, std::vector<Value>& a, const char* name, bool left, bool right) {
    check_arity(name, a, 0, 1);
    const std::string& s = self.as_string();
    bool custom = !a.empty() && !a[0].is_nil();
    std::string chars = custom ? str_arg(a[0], "strip chars") : std::string();
    auto strip_it = [&](char c) { return custom ? chars.find(c) != std::string::npos : is_space(c); };
    size_t b = 0;
    size_t e = s.size();
    if (left) {
        while (b < e && strip_it(s[b])) b++;
    }
    if (right) {
        while (e > b && strip_it(s[e - 1])) e--;
    }
    return Value::str(s.substr(b, e - b));
}

Value s_strip(Interpreter&, const Value& self, std::vector<Value>& a) {
    return strip_impl(self, a, "strip", true, true);
}

Value s_lstrip(Interpreter&, const Value& self, std::vector<Value>& a) {
    return strip_impl(self, a, "lstrip", true, false);
}

Value s_rstrip(Interpreter&, const Value& self, std::vector<Value>& a) {
    return strip_impl(self, a, "rstrip", false, true);
}

Value s_split(Interpreter& in, const Value& self, std::vector<Value>& a) {
    check_arity("split", a, 0, 2);
    const std::string& s = self.as_string();
    int64_t maxsplit = a.size() == 2 ? to_int(a[1], "maxsplit") : -1;
    std::vector<Value> out;

    if (a.empty() || a[0].is_nil()) {
        size_t i = 0;
        while (i < s.size()) {
            in.check_interrupt();
            while (i < s.size() && is_space(s[i])) i++;
            if (i >= s.size()) break;
            if (maxsplit >= 0 && static_cast<int64_t>(out.size()) == maxsplit) {
                size_t e = s.size();
                while (e > i && is_space(s[e - 1])) e--;
                out.push_back(Value::str(s.substr(i, e - i)));
                break;
            }
            size_t j = i;
            while (j < s.size() && !is_space(s[j])) j++;
            out.push_back(Value::str(s.substr(i, j - i)));
            i = j;
        }
        return Value::list(std::move(out));
    }

    const std::string& sep = str_arg(a[0], "separator");
    if (sep.empty()) throw runtime("empty separator");
    size_t start = 0;
    while (true) {
        in.check_interrupt();
        if (maxsplit >= 0 && static_cast<int64_t>(out.size()) == maxsplit) break;
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos) break;
        out.push_back(Value::str(s.substr(start, pos - start)));
        start = pos + sep.size();
    }
    out.push_back(Value::str(s.substr(start)));
    return Value::list(std::move(out));
}

Value s_join(Interpreter& in, const Value& self, std::vector<Value>& a) {
    check_arity("join", a, 1, 1);
    const std::string& sep = self.as_string();
    std::string out;
    bool first = true;
    in.iterate(a[0], [&](const Value& v) {
        if (v.type() != ValueType::STRING) {
            throw runtime(std::string("join() expected str items, found ") + type_name(v));
        }
        if (!first) out += sep;
        first = false;
        check_growth(out.size() + v.as_string().size(), 1);
        out += v.as_string();
    });
    return Value::str(std::move(out));
}

Value s_replace(Interpreter& in, const Value& self, std::vector<Value>& a) {
    check_arity("replace", a, 2, 3);
    const std::string& s = self.as_string();
    const std::string& from = str_arg(a[0], "replace() old");
    const std::string& to = str_arg(a[1], "replace() new");
    int64_t limit = a.size() == 3 ? to_int(a[2], "replace() count") : -1;

    std::string out;
    int64_t done = 0;
    if (from.empty()) {
        for (size_t i = 0; i <= s.size(); i++) {
            in.check_interrupt();
            if (limit < 0 || done < limit) {
                out += to;
                done++;
            }
            if (i < s.size()) out.push_back(s[i]);
            check_growth(out.size(), 1);
        }
        return Value::str(std::move(out));
    }

    size_t start = 0;
    while (limit < 0 || done < limit) {
        in.check_interrupt();
        size_t pos = s.find(from, start);
        if (pos == std::string::npos) break;
        out.append(s, start, pos - start);
        out += to;
        check_growth(out.size(), 1);
        start = pos + from.size();
        done++;
    }
    out.append(s, start, std::string::npos);
    return Value::str(std::move(out));
}

template <typename Pred>
Value affix_check(const Value& self, std::vector<Value>& a, const char* name, Pred pred) {
    check_arity(name, a, 1, 1);
    const std::string& s = self.as_string();
    if (a[0].type() == ValueType::TUPLE) {
        for (const auto& v : a[0].as_list().items) {
            if (pred(s, str_arg(v, name))) return Value::boolean(true);
        }
        return Value::boolean(false);
    }
    return Value::boolean(pred(s, str_arg(a[0], name)));
}

Value s_startswith(Interpreter&, const Value& self, std::vector<Value>& a) {
    return affix_check(self, a, "startswith", [](const std::string& s, const std::string& p) {
        return s.compare(0, p.size(), p) == 0 && s.size() >= p.size();
    });
}

Value s_endswith(Interpreter&, const Value& self, std::vector<Value>& a) {
    return affix_check(self, a, "endswith", [](const std::string& s, const std::string& p) {
        return s.size() >= p.size() && s.compare(s.size() - p.size(), p.size(), p) == 0;
    });
}

Value s_find(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("find", a, 1, 1);
    size_t pos = self.as_string().find(str_arg(a[0], "find() argument"));
    return Value::integer(pos == std::string::npos ? -1 : static_cast<int64_t>(pos));
}

Value s_count(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("count", a, 1, 1);
    const std::string& s = self.as_string();
    const std::string& sub = str_arg(a[0], "count() argument");
    if (sub.empty()) return Value::integer(static_cast<int64_t>(s.size()) + 1);
    int64_t n = 0;
    for (size_t pos = s.find(sub); pos != std::string::npos; pos = s.find(sub, pos + sub.size())) n++;
    return Value::integer(n);
}

Value s_isdigit(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("isdigit", a, 0, 0);
    const std::string& s = self.as_string();
    return Value::boolean(!s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }));
}

Value s_isalpha(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("isalpha", a, 0, 0);
    const std::string& s = self.as_string();
    return Value::boolean(!s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return std::isalpha(static_cast<unsigned char>(c)) != 0;
    }));
}

// ---- list / tuple ----

Value l_append(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("append", a, 1, 1);
    require_mutable(self);
    self.as_list().items.push_back(a[0]);
    return Value();
}

Value l_extend(Interpreter& in, const Value& self, std::vector<Value>& a) {
    check_arity("extend", a, 1, 1);
    require_mutable(self);
    std::vector<Value> more = in.collect(a[0]);
    auto& items = self.as_list().items;
    items.insert(items.end(), more.begin(), more.end());
    return Value();
}

Value l_insert(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("insert", a, 2, 2);
    require_mutable(self);
    auto& items = self.as_list().items;
    int64_t n = static_cast<int64_t>(items.size());
    int64_t i = to_int(a[0], "insert() index");
    if (i < 0) i += n;
    i = std::max<int64_t>(0, std::min(i, n));
    items.insert(items.begin() + i, a[1]);
    return Value();
}

Value l_pop(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("pop", a, 0, 1);
    require_mutable(self);
    auto& items = self.as_list().items;
    if (items.empty()) throw runtime("pop from empty list");
    size_t i = a.empty() ? items.size() - 1 : resolve_index(to_int(a[0], "pop() index"), items.size(), "pop");
    Value v = items[i];
    items.erase(items.begin() + static_cast<std::ptrdiff_t>(i));
    return v;
}

Value l_remove(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("remove", a, 1, 1);
    require_mutable(self);
    auto& items = self.as_list().items;
    for (auto it = items.begin(); it != items.end(); ++it) {
        if (values_equal(*it, a[0])) {
            items.erase(it);
            return Value();
        }
    }
    throw runtime("list.remove(x): x not in list");
}

Value l_index(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("index", a, 1, 1);
    const auto& items = self.as_list().items;
    for (size_t i = 0; i < items.size(); i++) {
        if (values_equal(items[i], a[0])) return Value::integer(static_cast<int64_t>(i));
    }
    throw runtime(to_repr(a[0]) + " is not in " + type_name(self));
}

Value l_count(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("count", a, 1, 1);
    int64_t n = 0;
    for (const auto& v : self.as_list().items) {
        if (values_equal(v, a[0])) n++;
    }
    return Value::integer(n);
}

Value l_reverse(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("reverse", a, 0, 0);
    require_mutable(self);
    auto& items = self.as_list().items;
    std::reverse(items.begin(), items.end());
    return Value();
}

Value l_sort(Interpreter& in, const Value& self, std::vector<Value>& a) {
    check_arity("sort", a, 0, 2);
    require_mutable(self);
    // Sort a copy so a throwing comparison leaves the list untouched.
    std::vector<Value> items = self.as_list().items;
    sort_values(in, items, a.empty() ? Value() : a[0], a.size() == 2 && truthy(a[1]));
    self.as_list().items = std::move(items);
    return Value();
}

Value l_copy(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("copy", a, 0, 0);
    return Value::list(self.as_list().items);
}

// ---- dict ----

Value m_get(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("get", a, 1, 2);
    require_hashable(a[0]);
    const auto& entries = self.as_map().entries;
    auto it = entries.find(a[0]);
    if (it != entries.end()) return it->second;
    return a.size() == 2 ? a[1] : Value();
}

Value m_keys(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("keys", a, 0, 0);
    std::vector<Value> out;
    for (const auto& kv : self.as_map().entries) out.push_back(kv.first);
    return Value::list(std::move(out));
}

Value m_values(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("values", a, 0, 0);
    std::vector<Value> out;
    for (const auto& kv : self.as_map().entries) out.push_back(kv.second);
    return Value::list(std::move(out));
}

Value m_items(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("items", a, 0, 0);
    std::vector<Value> out;
    for (const auto& kv : self.as_map().entries) out.push_back(Value::tuple({kv.first, kv.second}));
    return Value::list(std::move(out));
}

Value m_pop(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("pop", a, 1, 2);
    require_mutable(self);
    require_hashable(a[0]);
    auto& entries = self.as_map().entries;
    auto it = entries.find(a[0]);
    if (it == entries.end()) {
        if (a.size() == 2) return a[1];
        throw runtime("key not found: " + to_repr(a[0]));
    }
    Value v = it->second;
    entries.erase(it);
    return v;
}

Value m_update(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("update", a, 1, 1);
    require_mutable(self);
    if (a[0].type() != ValueType::MAP) {
        throw runtime(std::string("update() argument must be dict, not ") + type_name(a[0]));
    }
    // Copy first: `d.update(d)` must not iterate the map it writes.
    auto incoming = a[0].as_map().entries;
    for (auto& kv : incoming) self.as_map().entries[kv.first] = std::move(kv.second);
    return Value();
}

Value m_copy(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("copy", a, 0, 0);
    Value out = Value::map();
    out.as_map().entries = self.as_map().entries;
    return out;
}

// ---- set ----

Value t_add(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("add", a, 1, 1);
    require_mutable(self);
    require_hashable(a[0]);
    self.as_set().items.insert(a[0]);
    return Value();
}

Value t_remove(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("remove", a, 1, 1);
    require_mutable(self);
    require_hashable(a[0]);
    if (self.as_set().items.erase(a[0]) == 0) throw runtime("key not found: " + to_repr(a[0]));
    return Value();
}

Value t_discard(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("discard", a, 1, 1);
    require_mutable(self);
    require_hashable(a[0]);
    self.as_set().items.erase(a[0]);
    return Value();
}

SetObj other_set(Interpreter& in, const Value& v) {
    SetObj out;
    in.iterate(v, [&](const Value& item) {
        require_hashable(item);
        out.items.insert(item);
    });
    return out;
}

Value t_union(Interpreter& in, const Value& self, std::vector<Value>& a) {
    check_arity("union", a, 1, 1);
    SetObj other = other_set(in, a[0]);
    Value out = Value::set();
    out.as_set().items = self.as_set().items;
    out.as_set().items.insert(other.items.begin(), other.items.end());
    return out;
}

Value t_intersection(Interpreter& in, const Value& self, std::vector<Value>& a) {
    check_arity("intersection", a, 1, 1);
    SetObj other = other_set(in, a[0]);
    Value out = Value::set();
    for (const auto& item : self.as_set().items) {
        if (other.items.count(item)) out.as_set().items.insert(item);
    }
    return out;
}

Value t_difference(Interpreter& in, const Value& self, std::vector<Value>& a) {
    check_arity("difference", a, 1, 1);
    SetObj other = other_set(in, a[0]);
    Value out = Value::set();
    for (const auto& item : self.as_set().items) {
        if (!other.items.count(item)) out.as_set().items.insert(item);
    }
    return out;
}

Value t_copy(Interpreter&, const Value& self, std::vector<Value>& a) {
    check_arity("copy", a, 0, 0);
    Value out = Value::set();
    out.as_set().items = self.as_set().items;
    return out;
}

const MethodTable* table_for(ValueType t) {
    static const MethodTable str_methods = {
        {"upper", s_upper},         {"lower", s_lower},           {"strip", s_strip},
        {"lstrip", s_lstrip},       {"rstrip", s_rstrip},         {"split", s_split},
        {"join", s_join},           {"replace", s_replace},       {"startswith", s_startswith},
        {"endswith", s_endswith},   {"find", s_find},             {"count", s_count},
        {"isdigit", s_isdigit},     {"isalpha", s_isalpha},
    };
    static const MethodTable list_methods = {
        {"append", l_append},   {"extend", l_extend}, {"insert", l_insert}, {"pop", l_pop},
        {"remove", l_remove},   {"index", l_index},   {"count", l_count},   {"reverse", l_reverse},
        {"sort", l_sort},       {"copy", l_copy},
    };
    static const MethodTable tuple_methods = {
        {"index", l_index}, {"count", l_count},
    };
    static const MethodTable map_methods = {
        {"get", m_get}, {"keys", m_keys}, {"values", m_values}, {"items", m_items},
        {"pop", m_pop}, {"update", m_update}, {"copy", m_copy},
    };
    static const MethodTable set_methods = {
        {"add", t_add},     {"remove", t_remove},             {"discard", t_discard},
        {"union", t_union}, {"intersection", t_intersection}, {"difference", t_difference},
        {"copy", t_copy},
    };

    switch (t) {
        case ValueType::STRING: return &str_methods;
        case ValueType::LIST:   return &list_methods;
        case ValueType::TUPLE:  return &tuple_methods;
        case ValueType::MAP:    return &map_methods;
        case ValueType::SET:    return &set_methods;
        default:                return nullptr;
    }
}

} // namespace

bool has_method(ValueType type, const std::string& name) {
    const MethodTable* table = table_for(type);
    return table && table->count(name) != 0;
}

Value bound_method(const Value& self, const std::string& name) {
    const MethodTable* table = table_for(self.type());
    if (!table) return Value();
    auto it = table->find(name);
    if (it == table->end()) return Value();

    Method impl = it->second;
    auto fn = std::make_shared<Function>();
    fn->name = name;
    fn->native = [self, impl](Interpreter& in, std::vector<Value>& args) { return impl(in, self, args); };
    return Value::function(std::move(fn));
}

} // namespace capsule
