#include "MuRuntime.h"

namespace MuRuntime {
namespace Py {

// ====== Value ======

std::string format_float(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%.16g", d);
    std::string s = buf;
    if (s.find_first_of(".e") == std::string::npos) s += ".0";
    return s;
}

static std::string quote_str(const std::string& s) {
    char q = (s.find('\'') != std::string::npos && s.find('"') == std::string::npos) ? '"' : '\'';
    std::string out(1, q);
    for (char c : s) {
        if (c == q || c == '\\') { out += '\\'; out += c; }
        else if (c == '\n') out += "\\n";
        else if (c == '\t') out += "\\t";
        else if (c == '\r') out += "\\r";
        else out += c;
    }
    out += q;
    return out;
}

std::string Value::type_name() const {
    switch (v.index()) {
        case 0: return "NoneType";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "float";
        case 4: return "str";
        case 5: return "list";
        case 6: return object()->type;
        default: return "function";
    }
}

std::string Value::repr() const {
    if (is_none()) return "None";
    if (is_bool()) return std::get<bool>(v) ? "True" : "False";
    if (is_int()) return std::to_string(std::get<int64_t>(v));
    if (is_float()) return format_float(std::get<double>(v));
    if (is_str()) return quote_str(str());
    if (is_list()) {
        std::string s = "[";
        bool first = true;
        for (const auto& e : *list()) {
            if (!first) s += ", ";
            first = false;
            s += e.repr();
        }
        return s + "]";
    }
    if (is_object()) {
        const auto& o = object();
        return o->display.empty() ? "<" + o->type + ">" : o->display;
    }
    if (auto* b = std::get_if<std::shared_ptr<BuiltinFn>>(&v)) return "<function " + (*b)->name + ">";
    return "<function " + std::get<std::shared_ptr<Function>>(v)->name + ">";
}

std::string Value::to_str() const {
    if (is_str()) return str();
    if (is_object() && object()->is_exception) return object()->text;
    return repr();
}

bool Value::truthy() const {
    switch (v.index()) {
        case 0: return false;
        case 1: return std::get<bool>(v);
        case 2: return std::get<int64_t>(v) != 0;
        case 3: return std::get<double>(v) != 0.0;
        case 4: return !str().empty();
        case 5: return !list()->empty();
        default: return true;
    }
}

int64_t to_int(const Value& v, const char* what) {
    if (v.is_int()) return std::get<int64_t>(v.v);
    if (v.is_bool()) return std::get<bool>(v.v) ? 1 : 0;
    if (v.is_float()) {
        double d = std::get<double>(v.v);
        if (!std::isfinite(d)) throw PyError("OverflowError", "can't convert " + format_float(d) + " to int");
        return static_cast<int64_t>(d);
    }
    throw PyError("TypeError", std::string(what) + ": can't convert " + v.type_name() + " to int");
}

double to_float(const Value& v, const char* what) {
    if (v.is_float()) return std::get<double>(v.v);
    if (v.is_int()) return static_cast<double>(std::get<int64_t>(v.v));
    if (v.is_bool()) return std::get<bool>(v.v) ? 1.0 : 0.0;
    throw PyError("TypeError", std::string(what) + ": can't convert " + v.type_name() + " to float");
}

// ====== Exceptions ======

std::shared_ptr<Object> make_exception(const std::string& type, const std::string& message) {
    auto o = std::make_shared<Object>(type, message.empty() ? type + "()" : type + "(" + quote_str(message) + ")");
    o->text = message;
    o->is_exception = true;
    o->attrs["args"] = message.empty() ? Value::L({}) : Value::L({Value::S(message)});
    return o;
}

bool exception_matches(const std::string& raised, const std::string& handler) {
    if (handler.empty() || handler == raised || handler == "BaseException") return true;
    if (handler == "Exception") return raised != "KeyboardInterrupt" && raised != "SystemExit";
    if (handler == "LookupError") return raised == "IndexError" || raised == "KeyError";
    if (handler == "ArithmeticError") return raised == "ZeroDivisionError" || raised == "OverflowError";
    if (handler == "ImportError") return raised == "ImportError";
    return false;
}

// ====== Runtime ======

void Runtime::charge(size_t bytes) {
    heap_used += bytes;
    if (heap_limit > 0 && heap_used > heap_limit)
        throw PyError("MemoryError", "memory allocation failed, allocating " + std::to_string(bytes) + " bytes");
}

Value Runtime::import_module(const std::string& name) {
    auto it = modules.find(name);
    if (it != modules.end()) return it->second;
    auto f = module_factories.find(name);
    if (f == module_factories.end()) throw PyError("ImportError", "no module named '" + name + "'");
    charge(256);
    Value m = f->second(*this);
    modules[name] = m;
    return m;
}

Value Runtime::call(const Value& fn, Args& args, Kwargs& kwargs) {
    if (auto* b = std::get_if<std::shared_ptr<BuiltinFn>>(&fn.v)) return (*b)->fn(*this, args, kwargs);

    auto* fp = std::get_if<std::shared_ptr<Function>>(&fn.v);
    if (!fp) throw PyError("TypeError", "'" + fn.type_name() + "' object isn't callable");
    const Function& f = **fp;

    if (call_stack.size() >= kMaxDepth) throw PyError("RuntimeError", "maximum recursion depth exceeded");
    if (args.size() > f.params.size())
        throw PyError("TypeError", "function takes " + std::to_string(f.params.size()) +
                                   " positional arguments but " + std::to_string(args.size()) + " were given");
    charge(64 + 16 * f.params.size());

    auto local = std::make_shared<Env>(f.closure);
    size_t first_default = f.params.size() - f.defaults.size();
    for (size_t i = 0; i < f.params.size(); ++i) {
        const std::string& p = f.params[i];
        if (i < args.size()) {
            if (kwargs.count(p)) throw PyError("TypeError", "function got multiple values for argument '" + p + "'");
            local->set(p, args[i]);
        } else if (kwargs.count(p)) {
            local->set(p, kwargs[p]);
        } else if (i >= first_default) {
            local->set(p, f.defaults[i - first_default]);
        } else {
            throw PyError("TypeError", "function missing required positional argument '" + p + "'");
        }
    }
    for (const auto& [k, _] : kwargs) {
        if (std::find(f.params.begin(), f.params.end(), k) == f.params.end())
            throw PyError("TypeError", "unexpected keyword argument '" + k + "'");
    }

    call_stack.push_back(f.name);
    Value result;
    try {
        exec_block(*this, f.body, local);
    } catch (ReturnSignal& r) {
        result = std::move(r.value);
    } catch (PyError& e) {
        call_stack.pop_back();
        e.located = false; // let the caller's statement add its frame
        throw;
    } catch (BreakSignal&) {
        call_stack.pop_back();
        throw PyError("SyntaxError", "'break' outside loop");
    } catch (ContinueSignal&) {
        call_stack.pop_back();
        throw PyError("SyntaxError", "'continue' outside loop");
    }
    call_stack.pop_back();
    return result;
}

namespace {

Value bound(const std::string& name, std::function<Value(Args&)> fn) {
    return Value::Built(make_builtin(name, [fn](Runtime&, Args& a, Kwargs&) { return fn(a); }));
}

void want_args(const Args& a, size_t lo, size_t hi, const std::string& name) {
    if (a.size() < lo || a.size() > hi)
        throw PyError("TypeError", name + "() takes " +
                                   (lo == hi ? std::to_string(lo) : std::to_string(lo) + " to " + std::to_string(hi)) +
                                   " arguments but " + std::to_string(a.size()) + " were given");
}

const std::string& want_str(const Value& v, const std::string& name) {
    if (!v.is_str()) throw PyError("TypeError", name + "() argument must be str, not " + v.type_name());
    return v.str();
}

Value str_method(Runtime& rt, const std::string& s, const std::string& name) {
    if (name == "upper" || name == "lower") {
        return bound(name, [s, name](Args& a) {
            want_args(a, 0, 0, name);
            std::string r = s;
            for (auto& c : r) c = static_cast<char>(name == "upper" ? std::toupper(static_cast<unsigned char>(c))
                                                                   : std::tolower(static_cast<unsigned char>(c)));
            return Value::S(r);
        });
    }
    if (name == "strip") {
        return bound(name, [s](Args& a) {
            want_args(a, 0, 0, "strip");
            size_t b = s.find_first_not_of(" \t\r\n");
            if (b == std::string::npos) return Value::S("");
            size_t e = s.find_last_not_of(" \t\r\n");
            return Value::S(s.substr(b, e - b + 1));
        });
    }
    if (name == "startswith" || name == "endswith") {
        return bound(name, [s, name](Args& a) {
            want_args(a, 1, 1, name);
            const std::string& x = want_str(a[0], name);
            if (x.size() > s.size()) return Value::B(false);
            return Value::B(name == "startswith" ? s.compare(0, x.size(), x) == 0
                                                 : s.compare(s.size() - x.size(), x.size(), x) == 0);
        });
    }
    if (name == "split") {
        Runtime* r = &rt;
        return bound(name, [s, r](Args& a) {
            want_args(a, 0, 1, "split");
            std::vector<Value> parts;
            if (a.empty() || a[0].is_none()) {
                std::istringstream in(s);
                std::string w;
                while (in >> w) parts.push_back(Value::S(w));
            } else {
                const std::string& sep = want_str(a[0], "split");
                if (sep.empty()) throw PyError("ValueError", "empty separator");
                size_t start = 0, pos;
                while ((pos = s.find(sep, start)) != std::string::npos) {
                    parts.push_back(Value::S(s.substr(start, pos - start)));
                    start = pos + sep.size();
                }
                parts.push_back(Value::S(s.substr(start)));
            }
            r->charge(16 * parts.size() + s.size());
            return Value::L(std::move(parts));
        });
    }
    if (name == "join") {
        return bound(name, [s](Args& a) {
            want_args(a, 1, 1, "join");
            if (!a[0].is_list()) throw PyError("TypeError", "join expects a list");
            std::string out;
            bool first = true;
            for (const auto& item : *a[0].list()) {
                if (!first) out += s;
                first = false;
                out += want_str(item, "join");
            }
            return Value::S(out);
        });
    }
    if (name == "replace") {
        return bound(name, [s](Args& a) {
            want_args(a, 2, 2, "replace");
            const std::string& from = want_str(a[0], "replace");
            const std::string& to = want_str(a[1], "replace");
            if (from.empty()) return Value::S(s);
            std::string out;
            size_t start = 0, pos;
            while ((pos = s.find(from, start)) != std::string::npos) {
                out += s.substr(start, pos - start) + to;
                start = pos + from.size();
            }
            return Value::S(out + s.substr(start));
        });
    }
    if (name == "format") {
        return bound(name, [s](Args& a) {
            std::string out;
            size_t next = 0;
            for (size_t i = 0; i < s.size(); ++i) {
                if (s[i] == '{' && i + 1 < s.size() && s[i + 1] == '{') { out += '{'; i++; continue; }
                if (s[i] == '}' && i + 1 < s.size() && s[i + 1] == '}') { out += '}'; i++; continue; }
                if (s[i] == '{') {
                    size_t close = s.find('}', i);
                    if (close == std::string::npos) throw PyError("ValueError", "unmatched '{' in format");
                    std::string field = s.substr(i + 1, close - i - 1);
                    size_t idx = field.empty() ? next++ : static_cast<size_t>(std::atoi(field.c_str()));
                    if (idx >= a.size()) throw PyError("IndexError", "tuple index out of range");
                    out += a[idx].to_str();
                    i = close;
                    continue;
                }
                out += s[i];
            }
            return Value::S(out);
        });
    }
    throw PyError("AttributeError", "'str' object has no attribute '" + name + "'");
}

Value list_method(Runtime& rt, const Value::List& xs, const std::string& name) {
    Runtime* r = &rt;
    if (name == "append") {
        return bound(name, [xs, r](Args& a) {
            want_args(a, 1, 1, "append");
            r->charge(16);
            xs->push_back(a[0]);
            return Value::None();
        });
    }
    if (name == "pop") {
        return bound(name, [xs](Args& a) {
            want_args(a, 0, 1, "pop");
            if (xs->empty()) throw PyError("IndexError", "pop from empty list");
            int64_t i = a.empty() ? static_cast<int64_t>(xs->size()) - 1 : to_int(a[0], "pop");
            if (i < 0) i += static_cast<int64_t>(xs->size());
            if (i < 0 || i >= static_cast<int64_t>(xs->size())) throw PyError("IndexError", "list index out of range");
            Value v = (*xs)[static_cast<size_t>(i)];
            xs->erase(xs->begin() + i);
            return v;
        });
    }
    if (name == "insert") {
        return bound(name, [xs, r](Args& a) {
            want_args(a, 2, 2, "insert");
            int64_t i = to_int(a[0], "insert");
            int64_t n = static_cast<int64_t>(xs->size());
            if (i < 0) i = std::max<int64_t>(0, i + n);
            i = std::min(i, n);
            r->charge(16);
            xs->insert(xs->begin() + i, a[1]);
            return Value::None();
        });
    }
    if (name == "index") {
        return bound(name, [xs](Args& a) {
            want_args(a, 1, 1, "index");
            for (size_t i = 0; i < xs->size(); ++i)
                if (values_equal((*xs)[i], a[0])) return Value::I(static_cast<int64_t>(i));
            throw PyError("ValueError", "object not in sequence");
        });
    }
    if (name == "clear") {
        return bound(name, [xs](Args& a) {
            want_args(a, 0, 0, "clear");
            xs->clear();
            return Value::None();
        });
    }
    throw PyError("AttributeError", "'list' object has no attribute '" + name + "'");
}

} // namespace

Value Runtime::get_attr(const Value& target, const std::string& name) {
    if (target.is_object()) {
        const auto& o = target.object();
        if (auto v = o->get(name)) return *v;
        throw PyError("AttributeError", "'" + o->type + "' object has no attribute '" + name + "'");
    }
    if (target.is_str()) return str_method(*this, target.str(), name);
    if (target.is_list()) return list_method(*this, target.list(), name);
    throw PyError("AttributeError", "'" + target.type_name() + "' object has no attribute '" + name + "'");
}

void Runtime::set_attr(const Value& target, const std::string& name, const Value& v) {
    if (!target.is_object())
        throw PyError("AttributeError", "'" + target.type_name() + "' object has no attribute '" + name + "'");
    Object& o = *target.object();
    o.attrs[name] = o.on_setattr ? o.on_setattr(o, name, v) : v;
}

// ====== Operators ======

namespace {

bool as_int_operand(const Value& v, int64_t& out) {
    if (v.is_int()) { out = std::get<int64_t>(v.v); return true; }
    if (v.is_bool()) { out = std::get<bool>(v.v) ? 1 : 0; return true; }
    return false;
}

PyError unsupported(const std::string& op, const Value& a, const Value& b) {
    return PyError("TypeError", "unsupported types for " + op + ": '" + a.type_name() + "', '" + b.type_name() + "'");
}

void check_overflow(bool overflow) {
    if (overflow) throw PyError("OverflowError", "small int overflow");
}

Value repeat(Runtime& rt, const Value& seq, int64_t n) {
    if (n < 0) n = 0;
    if (seq.is_str()) {
        rt.charge(seq.str().size() * static_cast<size_t>(n));
        std::string out;
        for (int64_t i = 0; i < n; ++i) out += seq.str();
        return Value::S(out);
    }
    rt.charge(16 * seq.list()->size() * static_cast<size_t>(n));
    std::vector<Value> out;
    for (int64_t i = 0; i < n; ++i) out.insert(out.end(), seq.list()->begin(), seq.list()->end());
    return Value::L(std::move(out));
}

} // namespace

Value binary_op(Runtime& rt, const std::string& op, const Value& a, const Value& b) {
    int64_t x, y;
    bool ints = as_int_operand(a, x) && as_int_operand(b, y);
    bool nums = a.is_number() && b.is_number();

    if (op == "+") {
        if (ints) {
            int64_t r;
            check_overflow(__builtin_add_overflow(x, y, &r));
            return Value::I(r);
        }
        if (nums) return Value::F(to_float(a, "+") + to_float(b, "+"));
        if (a.is_str() && b.is_str()) {
            rt.charge(a.str().size() + b.str().size());
            return Value::S(a.str() + b.str());
        }
        if (a.is_list() && b.is_list()) {
            rt.charge(16 * (a.list()->size() + b.list()->size()));
            std::vector<Value> out(*a.list());
            out.insert(out.end(), b.list()->begin(), b.list()->end());
            return Value::L(std::move(out));
        }
        throw unsupported(op, a, b);
    }
    if (op == "-") {
        if (ints) {
            int64_t r;
            check_overflow(__builtin_sub_overflow(x, y, &r));
            return Value::I(r);
        }
        if (nums) return Value::F(to_float(a, "-") - to_float(b, "-"));
        throw unsupported(op, a, b);
    }
    if (op == "*") {
        if (ints) {
            int64_t r;
            check_overflow(__builtin_mul_overflow(x, y, &r));
            return Value::I(r);
        }
        if (nums) return Value::F(to_float(a, "*") * to_float(b, "*"));
        int64_t n;
        if ((a.is_str() || a.is_list()) && as_int_operand(b, n)) return repeat(rt, a, n);
        if ((b.is_str() || b.is_list()) && as_int_operand(a, n)) return repeat(rt, b, n);
        throw unsupported(op, a, b);
    }
    if (op == "/") {
        if (!nums) throw unsupported(op, a, b);
        double d = to_float(b, "/");
        if (d == 0.0) throw PyError("ZeroDivisionError", "division by zero");
        return Value::F(to_float(a, "/") / d);
    }
    if (op == "//") {
        if (ints) {
            if (y == 0) throw PyError("ZeroDivisionError", "division by zero");
            if (x == std::numeric_limits<int64_t>::min() && y == -1)
                throw PyError("OverflowError", "small int overflow");
            int64_t q = x / y;
            if ((x % y != 0) && ((x < 0) != (y < 0))) q--;
            return Value::I(q);
        }
        if (!nums) throw unsupported(op, a, b);
        double d = to_float(b, "//");
        if (d == 0.0) throw PyError("ZeroDivisionError", "division by zero");
        return Value::F(std::floor(to_float(a, "//") / d));
    }
    if (op == "%") {
        if (ints) {
            if (y == 0) throw PyError("ZeroDivisionError", "division by zero");
            if (y == -1) return Value::I(0);
            int64_t r = x % y;
            if (r != 0 && ((r < 0) != (y < 0))) r += y;
            return Value::I(r);
        }
        if (!nums) throw unsupported(op, a, b);
        double d = to_float(b, "%");
        if (d == 0.0) throw PyError("ZeroDivisionError", "division by zero");
        double r = std::fmod(to_float(a, "%"), d);
        if (r != 0.0 && ((r < 0) != (d < 0))) r += d;
        return Value::F(r);
    }
    if (op == "**") {
        if (ints && y >= 0) {
            if (y == 0) return Value::I(1);
            if (x == 0 || x == 1) return Value::I(x);
            if (x == -1) return Value::I((y % 2) ? -1 : 1);
            int64_t r = 1;
            for (int64_t i = 0; i < y; ++i) {
                if (__builtin_mul_overflow(r, x, &r)) throw PyError("OverflowError", "small int overflow");
            }
            return Value::I(r);
        }
        if (!nums) throw unsupported(op, a, b);
        double base = to_float(a, "**");
        if (base == 0.0 && to_float(b, "**") < 0)
            throw PyError("ZeroDivisionError", "0.0 cannot be raised to a negative power");
        return Value::F(std::pow(base, to_float(b, "**")));
    }
    throw unsupported(op, a, b);
}

bool values_equal(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        int64_t x, y;
        if (as_int_operand(a, x) && as_int_operand(b, y)) return x == y;
        return to_float(a, "==") == to_float(b, "==");
    }
    if (a.v.index() != b.v.index()) return false;
    if (a.is_none()) return true;
    if (a.is_str()) return a.str() == b.str();
    if (a.is_list()) {
        const auto& xs = *a.list();
        const auto& ys = *b.list();
        if (xs.size() != ys.size()) return false;
        for (size_t i = 0; i < xs.size(); ++i)
            if (!values_equal(xs[i], ys[i])) return false;
        return true;
    }
    if (a.is_object()) return a.object() == b.object();
    if (auto* f = std::get_if<std::shared_ptr<BuiltinFn>>(&a.v)) return *f == std::get<std::shared_ptr<BuiltinFn>>(b.v);
    return std::get<std::shared_ptr<Function>>(a.v) == std::get<std::shared_ptr<Function>>(b.v);
}

namespace {

// -1, 0, 1
int order(const std::string& op, const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        int64_t x, y;
        if (as_int_operand(a, x) && as_int_operand(b, y)) return x < y ? -1 : (x > y ? 1 : 0);
        double p = to_float(a, op.c_str()), q = to_float(b, op.c_str());
        return p < q ? -1 : (p > q ? 1 : 0);
    }
    if (a.is_str() && b.is_str()) {
        int c = a.str().compare(b.str());
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (a.is_list() && b.is_list()) {
        const auto& xs = *a.list();
        const auto& ys = *b.list();
        for (size_t i = 0; i < xs.size() && i < ys.size(); ++i) {
            if (values_equal(xs[i], ys[i])) continue;
            return order(op, xs[i], ys[i]);
        }
        return xs.size() < ys.size() ? -1 : (xs.size() > ys.size() ? 1 : 0);
    }
    throw unsupported(op, a, b);
}

bool identical(const Value& a, const Value& b) {
    if (a.v.index() != b.v.index()) return false;
    if (a.is_list()) return a.list() == b.list();
    return values_equal(a, b);
}

} // namespace

bool compare_op(const std::string& op, const Value& a, const Value& b) {
    if (op == "==") return values_equal(a, b);
    if (op == "!=") return !values_equal(a, b);
    if (op == "<") return order(op, a, b) < 0;
    if (op == ">") return order(op, a, b) > 0;
    if (op == "<=") return order(op, a, b) <= 0;
    if (op == ">=") return order(op, a, b) >= 0;
    if (op == "is") return identical(a, b);
    if (op == "is not") return !identical(a, b);
    if (op == "in" || op == "not in") {
        bool found = false;
        if (b.is_list()) {
            for (const auto& x : *b.list())
                if (values_equal(a, x)) { found = true; break; }
        } else if (b.is_str()) {
            if (!a.is_str()) throw PyError("TypeError", "can't convert '" + a.type_name() + "' object to str implicitly");
            found = b.str().find(a.str()) != std::string::npos;
        } else if (b.is_object()) {
            found = a.is_str() && b.object()->attrs.count(a.str()) > 0;
        } else {
            throw PyError("TypeError", "argument of type '" + b.type_name() + "' isn't iterable");
        }
        return op == "in" ? found : !found;
    }
    throw PyError("SyntaxError", "unknown comparison " + op);
}

std::vector<Value> iterate(Runtime& rt, const Value& v) {
    if (v.is_list()) return *v.list();
    if (v.is_str()) {
        rt.charge(16 * v.str().size());
        std::vector<Value> out;
        for (char c : v.str()) out.push_back(Value::S(std::string(1, c)));
        return out;
    }
    throw PyError("TypeError", "'" + v.type_name() + "' object isn't iterable");
}

namespace {

size_t normalize_index(const Value& index, size_t size, const char* what) {
    int64_t i;
    if (!as_int_operand(index, i))
        throw PyError("TypeError", std::string(what) + " indices must be integers, not " + index.type_name());
    if (i < 0) i += static_cast<int64_t>(size);
    if (i < 0 || i >= static_cast<int64_t>(size)) throw PyError("IndexError", std::string(what) + " index out of range");
    return static_cast<size_t>(i);
}

} // namespace

Value subscript_get(const Value& target, const Value& index) {
    if (target.is_list()) return (*target.list())[normalize_index(index, target.list()->size(), "list")];
    if (target.is_str()) return Value::S(std::string(1, target.str()[normalize_index(index, target.str().size(), "string")]));
    throw PyError("TypeError", "'" + target.type_name() + "' object isn't subscriptable");
}

void subscript_set(const Value& target, const Value& index, const Value& v) {
    if (!target.is_list())
        throw PyError("TypeError", "'" + target.type_name() + "' object doesn't support item assignment");
    (*target.list())[normalize_index(index, target.list()->size(), "list")] = v;
}

// ====== Expressions ======

Value AstConst::eval(Runtime&, const std::shared_ptr<Env>&) { return val; }

Value AstName::eval(Runtime&, const std::shared_ptr<Env>& env) {
    auto v = env->get(id);
    if (!v) throw PyError("NameError", "name '" + id + "' isn't defined");
    return *v;
}

Value AstList::eval(Runtime& rt, const std::shared_ptr<Env>& env) {
    rt.charge(16 + 16 * items.size());
    std::vector<Value> out;
    out.reserve(items.size());
    for (auto& e : items) out.push_back(e->eval(rt, env));
    return Value::L(std::move(out));
}

Value AstAttr::eval(Runtime& rt, const std::shared_ptr<Env>& env) {
    return rt.get_attr(target->eval(rt, env), name);
}

Value AstSubscript::eval(Runtime& rt, const std::shared_ptr<Env>& env) {
    Value t = target->eval(rt, env);
    return subscript_get(t, index->eval(rt, env));
}

Value AstCall::eval(Runtime& rt, const std::shared_ptr<Env>& env) {
    Value f = fn->eval(rt, env);
    Args av;
    av.reserve(args.size());
    for (auto& a : args) av.push_back(a->eval(rt, env));
    Kwargs kw;
    for (auto& [k, e] : kwargs) kw[k] = e->eval(rt, env);
    return rt.call(f, av, kw);
}

Value AstUnary::eval(Runtime& rt, const std::shared_ptr<Env>& env) {
    Value v = operand->eval(rt, env);
    if (op == "not") return Value::B(!v.truthy());
    int64_t i;
    if (as_int_operand(v, i)) {
        if (op == "+") return Value::I(i);
        if (i == std::numeric_limits<int64_t>::min()) throw PyError("OverflowError", "small int overflow");
        return Value::I(-i);
    }
    if (v.is_float()) return Value::F(op == "-" ? -std::get<double>(v.v) : std::get<double>(v.v));
    throw PyError("TypeError", "unsupported type for " + op + ": '" + v.type_name() + "'");
}

Value AstBinary::eval(Runtime& rt, const std::shared_ptr<Env>& env) {
    Value a = lhs->eval(rt, env);
    Value b = rhs->eval(rt, env);
    return binary_op(rt, op, a, b);
}

Value AstCompare::eval(Runtime& rt, const std::shared_ptr<Env>& env) {
    Value left = first->eval(rt, env);
    for (auto& [op, e] : rest) {
        Value right = e->eval(rt, env);
        if (!compare_op(op, left, right)) return Value::B(false);
        left = right;
    }
    return Value::B(true);
}

Value AstBoolOp::eval(Runtime& rt, const std::shared_ptr<Env>& env) {
    Value a = lhs->eval(rt, env);
    if (is_and ? !a.truthy() : a.truthy()) return a;
    return rhs->eval(rt, env);
}

Value AstTernary::eval(Runtime& rt, const std::shared_ptr<Env>& env) {
    return cond->eval(rt, env).truthy() ? a->eval(rt, env) : b->eval(rt, env);
}

// ====== Statements ======

void exec_block(Runtime& rt, const Block& block, const std::shared_ptr<Env>& env) {
    for (const auto& s : block) {
        try {
            s->exec(rt, env);
        } catch (PyError& e) {
            if (!e.located) {
                e.frames.push_back({s->line, rt.call_stack.empty() ? "<module>" : rt.call_stack.back()});
                e.located = true;
            }
            throw;
        }
    }
}

namespace {

void assign_to(Runtime& rt, const std::shared_ptr<Env>& env, const ExprPtr& target, const Value& v) {
    if (auto name = std::dynamic_pointer_cast<AstName>(target)) {
        if (env->global_names.count(name->id)) rt.globals->set(name->id, v);
        else env->set(name->id, v);
        return;
    }
    if (auto attr = std::dynamic_pointer_cast<AstAttr>(target)) {
        rt.set_attr(attr->target->eval(rt, env), attr->name, v);
        return;
    }
    if (auto sub = std::dynamic_pointer_cast<AstSubscript>(target)) {
        Value t = sub->target->eval(rt, env);
        subscript_set(t, sub->index->eval(rt, env), v);
        return;
    }
    throw PyError("SyntaxError", "can't assign to expression");
}

} // namespace

void StmtExpr::exec(Runtime& rt, const std::shared_ptr<Env>& env) {
    Value v = expr->eval(rt, env);
    if (echo && !v.is_none()) rt.write(v.repr() + "\n");
}

void StmtAssign::exec(Runtime& rt, const std::shared_ptr<Env>& env) {
    Value v = value->eval(rt, env);
    for (const auto& t : targets) assign_to(rt, env, t, v);
}

void StmtAugAssign::exec(Runtime& rt, const std::shared_ptr<Env>& env) {
    Value current = target->eval(rt, env);
    Value rhs = value->eval(rt, env);
    if (op == "+" && current.is_list() && rhs.is_list()) {
        rt.charge(16 * rhs.list()->size());
        std::vector<Value> extra(*rhs.list());
        current.list()->insert(current.list()->end(), extra.begin(), extra.end());
        return;
    }
    assign_to(rt, env, target, binary_op(rt, op, current, rhs));
}

void StmtIf::exec(Runtime& rt, const std::shared_ptr<Env>& env) {
    for (auto& [cond, body] : branches) {
        if (cond->eval(rt, env).truthy()) {
            exec_block(rt, body, env);
            return;
        }
    }
    exec_block(rt, orelse, env);
}

void StmtWhile::exec(Runtime& rt, const std::shared_ptr<Env>& env) {
    while (cond->eval(rt, env).truthy()) {
        try {
            exec_block(rt, body, env);
        } catch (BreakSignal&) {
            break;
        } catch (ContinueSignal&) {
            continue;
        }
    }
}

void StmtFor::exec(Runtime& rt, const std::shared_ptr<Env>& env) {
    std::vector<Value> items = iterate(rt, iter->eval(rt, env));
    for (const auto& item : items) {
        if (env->global_names.count(var)) rt.globals->set(var, item);
        else env->set(var, item);
        try {
            exec_block(rt, body, env);
        } catch (BreakSignal&) {
            break;
        } catch (ContinueSignal&) {
            continue;
        }
    }
}

void StmtDef::exec(Runtime& rt, const std::shared_ptr<Env>& env) {
    auto f = std::make_shared<Function>();
    f->name = name;
    f->params = params;
    for (auto& d : defaults) f->defaults.push_back(d->eval(rt, env));
    f->body = body;
    f->closure = env;
    rt.charge(64);
    env->set(name, Value::Fn(f));
}

void StmtReturn::exec(Runtime& rt, const std::shared_ptr<Env>& env) {
    throw ReturnSignal{value ? value->eval(rt, env) : Value::None()};
}

void StmtImport::exec(Runtime& rt, const std::shared_ptr<Env>& env) {
    env->set(alias, rt.import_module(module));
}

void StmtFromImport::exec(Runtime& rt, const std::shared_ptr<Env>& env) {
    Value m = rt.import_module(module);
    for (const auto& [name, alias] : names) {
        if (name == "*") {
            for (const auto& [k, v] : m.object()->attrs)
                if (!k.empty() && k[0] != '_') env->set(k, v);
            continue;
        }
        auto v = m.object()->get(name);
        if (!v) throw PyError("ImportError", "cannot import name " + name);
        env->set(alias, *v);
    }
}

void StmtTry::exec(Runtime& rt, const std::shared_ptr<Env>& env) {
    auto run_finally = [&] {
        if (!finally_body.empty()) exec_block(rt, finally_body, env);
    };

    try {
        try {
            exec_block(rt, body, env);
        } catch (PyError& e) {
            const Handler* match = nullptr;
            for (const auto& h : handlers) {
                if (exception_matches(e.type, h.type)) { match = &h; break; }
            }
            if (!match) throw;
            if (!match->name.empty()) env->set(match->name, Value::O(make_exception(e.type, e.message)));
            exec_block(rt, match->body, env);
        }
    } catch (...) {
        run_finally();
        throw;
    }
    run_finally();
}

void StmtRaise::exec(Runtime& rt, const std::shared_ptr<Env>& env) {
    if (!exc) throw PyError("RuntimeError", "no active exception to reraise");
    Value v = exc->eval(rt, env);
    if (v.is_callable()) {
        Args none;
        Kwargs kw;
        v = rt.call(v, none, kw);
    }
    if (!v.is_object() || !v.object()->is_exception)
        throw PyError("TypeError", "exceptions must derive from BaseException");
    throw PyError(v.object()->type, v.object()->text);
}

void StmtGlobal::exec(Runtime&, const std::shared_ptr<Env>& env) {
    for (const auto& n : names) env->global_names.insert(n);
}

} // namespace Py
} // namespace MuRuntime
