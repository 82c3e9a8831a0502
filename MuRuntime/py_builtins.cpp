#include "MuRuntime.h"

namespace MuRuntime {
namespace Py {

namespace {

void arity(const Args& a, size_t lo, size_t hi, const char* name) {
    if (a.size() < lo || a.size() > hi) {
        std::string want = lo == hi ? std::to_string(lo) : std::to_string(lo) + " to " + std::to_string(hi);
        throw PyError("TypeError", std::string(name) + "() takes " + want +
                                   " positional arguments but " + std::to_string(a.size()) + " were given");
    }
}

std::optional<Value> kwarg(Kwargs& kw, const char* name) {
    auto it = kw.find(name);
    if (it == kw.end()) return std::nullopt;
    return it->second;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

Value parse_int(const std::string& text, int base) {
    std::string s = trim(text);
    errno = 0;
    char* end = nullptr;
    long long n = std::strtoll(s.c_str(), &end, base);
    if (s.empty() || *end != '\0')
        throw PyError("ValueError", "invalid syntax for integer with base " + std::to_string(base) + ": " + Value::S(text).repr());
    if (errno == ERANGE) throw PyError("OverflowError", "small int overflow");
    return Value::I(n);
}

Value parse_float(const std::string& text) {
    std::string s = trim(text);
    char* end = nullptr;
    double d = std::strtod(s.c_str(), &end);
    if (s.empty() || *end != '\0') throw PyError("ValueError", "invalid syntax for number");
    return Value::F(d);
}

Value extreme(Args& a, bool want_max, const char* name) {
    std::vector<Value> items;
    if (a.size() == 1) {
        if (!a[0].is_list()) throw PyError("TypeError", "'" + a[0].type_name() + "' object isn't iterable");
        items = *a[0].list();
    } else {
        items = a;
    }
    if (items.empty()) throw PyError("ValueError", std::string(name) + "() arg is an empty sequence");
    Value best = items[0];
    for (size_t i = 1; i < items.size(); ++i) {
        if (compare_op(want_max ? ">" : "<", items[i], best)) best = items[i];
    }
    return best;
}

std::shared_ptr<Object> make_module(const std::string& name) {
    return std::make_shared<Object>("module", "<module '" + name + "'>");
}

void def(const std::shared_ptr<Object>& m, const std::string& name, BuiltinFn::Impl fn) {
    m->attrs[name] = Value::Built(make_builtin(name, std::move(fn)));
}

} // namespace

void install_builtins(Runtime& rt) {
    auto g = rt.builtins;
    auto set = [&](const std::string& name, BuiltinFn::Impl fn) {
        g->set(name, Value::Built(make_builtin(name, std::move(fn))));
    };

    set("print", [](Runtime& rt, Args& a, Kwargs& kw) {
        std::string sep = " ", end = "\n";
        if (auto v = kwarg(kw, "sep"); v && !v->is_none()) sep = v->to_str();
        if (auto v = kwarg(kw, "end"); v && !v->is_none()) end = v->to_str();
        std::string line;
        for (size_t i = 0; i < a.size(); ++i) {
            if (i) line += sep;
            line += a[i].to_str();
        }
        rt.write(line + end);
        return Value::None();
    });

    set("len", [](Runtime&, Args& a, Kwargs&) {
        arity(a, 1, 1, "len");
        if (a[0].is_str()) return Value::I(static_cast<int64_t>(a[0].str().size()));
        if (a[0].is_list()) return Value::I(static_cast<int64_t>(a[0].list()->size()));
        throw PyError("TypeError", "object of type '" + a[0].type_name() + "' has no len()");
    });

    set("range", [](Runtime& rt, Args& a, Kwargs&) {
        arity(a, 1, 3, "range");
        int64_t start = 0, stop, step = 1;
        if (a.size() == 1) {
            stop = to_int(a[0], "range");
        } else {
            start = to_int(a[0], "range");
            stop = to_int(a[1], "range");
            if (a.size() == 3) step = to_int(a[2], "range");
        }
        if (step == 0) throw PyError("ValueError", "range() arg 3 must not be zero");
        int64_t n = 0;
        if (step > 0 && stop > start) n = (stop - start + step - 1) / step;
        if (step < 0 && stop < start) n = (start - stop - step - 1) / (-step);
        rt.charge(16 * static_cast<size_t>(n));
        std::vector<Value> out;
        out.reserve(static_cast<size_t>(n));
        for (int64_t i = 0, v = start; i < n; ++i, v += step) out.push_back(Value::I(v));
        return Value::L(std::move(out));
    });

    set("int", [](Runtime&, Args& a, Kwargs&) {
        arity(a, 0, 2, "int");
        if (a.empty()) return Value::I(0);
        if (a[0].is_str()) return parse_int(a[0].str(), a.size() == 2 ? static_cast<int>(to_int(a[1], "int")) : 10);
        return Value::I(to_int(a[0], "int"));
    });

    set("float", [](Runtime&, Args& a, Kwargs&) {
        arity(a, 0, 1, "float");
        if (a.empty()) return Value::F(0.0);
        if (a[0].is_str()) return parse_float(a[0].str());
        return Value::F(to_float(a[0], "float"));
    });

    set("str", [](Runtime&, Args& a, Kwargs&) {
        arity(a, 0, 1, "str");
        return Value::S(a.empty() ? std::string() : a[0].to_str());
    });

    set("repr", [](Runtime&, Args& a, Kwargs&) {
        arity(a, 1, 1, "repr");
        return Value::S(a[0].repr());
    });

    set("bool", [](Runtime&, Args& a, Kwargs&) {
        arity(a, 0, 1, "bool");
        return Value::B(!a.empty() && a[0].truthy());
    });

    set("abs", [](Runtime&, Args& a, Kwargs&) {
        arity(a, 1, 1, "abs");
        if (a[0].is_float()) return Value::F(std::fabs(std::get<double>(a[0].v)));
        int64_t n = to_int(a[0], "abs");
        if (n == std::numeric_limits<int64_t>::min()) throw PyError("OverflowError", "small int overflow");
        return Value::I(n < 0 ? -n : n);
    });

    set("min", [](Runtime&, Args& a, Kwargs&) {
        if (a.empty()) throw PyError("TypeError", "min expected at least 1 argument");
        return extreme(a, false, "min");
    });

    set("max", [](Runtime&, Args& a, Kwargs&) {
        if (a.empty()) throw PyError("TypeError", "max expected at least 1 argument");
        return extreme(a, true, "max");
    });

    set("round", [](Runtime&, Args& a, Kwargs&) {
        arity(a, 1, 2, "round");
        if (a[0].is_int() || a[0].is_bool()) return Value::I(to_int(a[0], "round"));
        double x = to_float(a[0], "round");
        if (a.size() == 1 || a[1].is_none()) {
            if (!std::isfinite(x)) throw PyError("OverflowError", "can't convert " + format_float(x) + " to int");
            return Value::I(static_cast<int64_t>(std::nearbyint(x)));
        }
        double scale = std::pow(10.0, static_cast<double>(to_int(a[1], "round")));
        return Value::F(std::nearbyint(x * scale) / scale);
    });

    set("list", [](Runtime& rt, Args& a, Kwargs&) {
        arity(a, 0, 1, "list");
        if (a.empty()) return Value::L({});
        std::vector<Value> items = iterate(rt, a[0]);
        rt.charge(16 * items.size());
        return Value::L(std::move(items));
    });

    set("sorted", [](Runtime& rt, Args& a, Kwargs& kw) {
        arity(a, 1, 1, "sorted");
        std::vector<Value> items = iterate(rt, a[0]);
        rt.charge(16 * items.size());
        std::stable_sort(items.begin(), items.end(),
                         [](const Value& x, const Value& y) { return compare_op("<", x, y); });
        if (auto r = kwarg(kw, "reverse"); r && r->truthy()) std::reverse(items.begin(), items.end());
        return Value::L(std::move(items));
    });

    set("sum", [](Runtime& rt, Args& a, Kwargs&) {
        arity(a, 1, 2, "sum");
        Value acc = a.size() == 2 ? a[1] : Value::I(0);
        for (const auto& x : iterate(rt, a[0])) acc = binary_op(rt, "+", acc, x);
        return acc;
    });

    set("dir", [](Runtime& rt, Args& a, Kwargs&) {
        arity(a, 0, 1, "dir");
        std::vector<Value> names;
        if (a.empty()) {
            for (const auto& [k, _] : rt.globals->tbl) names.push_back(Value::S(k));
        } else if (a[0].is_object()) {
            for (const auto& [k, _] : a[0].object()->attrs)
                if (k.empty() || k[0] != '_') names.push_back(Value::S(k));
        }
        return Value::L(std::move(names));
    });

    set("type", [](Runtime&, Args& a, Kwargs&) {
        arity(a, 1, 1, "type");
        return Value::S("<class '" + a[0].type_name() + "'>");
    });

    set("isinstance", [](Runtime&, Args& a, Kwargs&) {
        arity(a, 2, 2, "isinstance");
        auto* b = std::get_if<std::shared_ptr<BuiltinFn>>(&a[1].v);
        if (!b) throw PyError("TypeError", "isinstance() arg 2 must be a type");
        std::string t = a[0].type_name();
        return Value::B(t == (*b)->name || ((*b)->name == "int" && t == "bool"));
    });

    static const char* exception_types[] = {
        "BaseException", "Exception", "ValueError", "TypeError", "RuntimeError", "NameError",
        "IndexError", "KeyError", "AttributeError", "ZeroDivisionError", "ImportError",
        "OSError", "MemoryError", "KeyboardInterrupt", "NotImplementedError", "OverflowError",
        "StopIteration", "AssertionError", "LookupError", "ArithmeticError"
    };
    for (const char* type : exception_types) {
        std::string name = type;
        set(name, [name](Runtime&, Args& a, Kwargs&) {
            return Value::O(make_exception(name, a.empty() ? std::string() : a[0].to_str()));
        });
    }
}

// ====== Modules ======

namespace {

const char* const kDigitalPins[] = {
    "D0", "D1", "D2", "D3", "D4", "D5", "D6", "D7", "D8", "D9", "D10", "D11", "D12", "D13"
};
const char* const kAnalogPins[] = {"A0", "A1", "A2"};

Value board_module(Runtime&) {
    auto m = make_module("board");
    auto add_pin = [&](const std::string& name) {
        auto pin = std::make_shared<Object>("Pin", "board." + name);
        pin->attrs["_name"] = Value::S(name);
        m->attrs[name] = Value::O(pin);
    };
    for (const char* p : kDigitalPins) add_pin(p);
    for (const char* p : kAnalogPins) add_pin(p);
    m->attrs["LED"] = m->attrs["D13"];
    m->attrs["board_id"] = Value::S("murepl_virtual");
    return Value::O(m);
}

std::shared_ptr<Object> enum_value(const std::string& cls, const std::string& name) {
    return std::make_shared<Object>(cls, "digitalio." + cls + "." + name);
}

Value digitalio_module(Runtime&) {
    auto m = make_module("digitalio");

    auto direction = std::make_shared<Object>("type", "<class 'Direction'>");
    auto dir_in = enum_value("Direction", "INPUT");
    auto dir_out = enum_value("Direction", "OUTPUT");
    direction->attrs["INPUT"] = Value::O(dir_in);
    direction->attrs["OUTPUT"] = Value::O(dir_out);

    auto pull = std::make_shared<Object>("type", "<class 'Pull'>");
    auto pull_up = enum_value("Pull", "UP");
    auto pull_down = enum_value("Pull", "DOWN");
    pull->attrs["UP"] = Value::O(pull_up);
    pull->attrs["DOWN"] = Value::O(pull_down);

    m->attrs["Direction"] = Value::O(direction);
    m->attrs["Pull"] = Value::O(pull);

    // Pins claimed by live DigitalInOut objects
    auto claimed = std::make_shared<std::set<std::string>>();

    def(m, "DigitalInOut", [=](Runtime& rt, Args& a, Kwargs&) {
        arity(a, 1, 1, "DigitalInOut");
        if (!a[0].is_object() || a[0].object()->type != "Pin")
            throw PyError("TypeError", "expected Pin, got " + a[0].type_name());
        std::string pin_name = a[0].object()->attrs["_name"].to_str();
        if (claimed->count(pin_name)) throw PyError("ValueError", pin_name + " in use");
        claimed->insert(pin_name);
        rt.charge(128);

        auto io = std::make_shared<Object>("DigitalInOut", "<DigitalInOut>");
        io->attrs["direction"] = Value::O(dir_in);
        io->attrs["value"] = Value::B(false);
        io->attrs["pull"] = Value::None();
        io->attrs["_pin"] = a[0];

        std::weak_ptr<Object> self = io;
        std::shared_ptr<Object> out_dir = dir_out, in_dir = dir_in;

        io->on_setattr = [out_dir, in_dir, pull_up, pull_down](Object& o, const std::string& name, const Value& v) -> Value {
            if (o.attrs.count("_deinit")) throw PyError("ValueError", "Object has been deinitialized and can no longer be used. Create a new object.");
            bool output = o.attrs["direction"].is_object() && o.attrs["direction"].object() == out_dir;
            if (name == "direction") {
                if (!v.is_object() || (v.object() != out_dir && v.object() != in_dir))
                    throw PyError("TypeError", "direction must be Direction.INPUT or Direction.OUTPUT");
                if (v.object() == out_dir) o.attrs["pull"] = Value::None();
                return v;
            }
            if (name == "value") {
                if (!output) throw PyError("AttributeError", "Cannot set value when direction is input.");
                return Value::B(v.truthy());
            }
            if (name == "pull") {
                if (output) throw PyError("AttributeError", "Pull not used when direction is output.");
                if (!v.is_none() && (!v.is_object() || (v.object() != pull_up && v.object() != pull_down)))
                    throw PyError("TypeError", "pull must be Pull.UP, Pull.DOWN or None");
                return v;
            }
            return v;
        };

        io->attrs["switch_to_output"] = Value::Built(make_builtin("switch_to_output",
            [self, out_dir](Runtime&, Args& a, Kwargs& kw) {
                auto o = self.lock();
                if (!o) return Value::None();
                Value initial = !a.empty() ? a[0] : kwarg(kw, "value").value_or(Value::B(false));
                o->attrs["direction"] = Value::O(out_dir);
                o->attrs["pull"] = Value::None();
                o->attrs["value"] = Value::B(initial.truthy());
                return Value::None();
            }));
        io->attrs["switch_to_input"] = Value::Built(make_builtin("switch_to_input",
            [self, in_dir](Runtime&, Args& a, Kwargs& kw) {
                auto o = self.lock();
                if (!o) return Value::None();
                Value p = !a.empty() ? a[0] : kwarg(kw, "pull").value_or(Value::None());
                o->attrs["direction"] = Value::O(in_dir);
                o->attrs["pull"] = p;
                return Value::None();
            }));
        io->attrs["deinit"] = Value::Built(make_builtin("deinit",
            [self, claimed, pin_name](Runtime&, Args&, Kwargs&) {
                auto o = self.lock();
                if (o) o->attrs["_deinit"] = Value::B(true);
                claimed->erase(pin_name);
                return Value::None();
            }));
        return Value::O(io);
    });

    return Value::O(m);
}

Value time_module(Runtime&) {
    auto m = make_module("time");
    def(m, "sleep", [](Runtime&, Args& a, Kwargs&) {
        arity(a, 1, 1, "sleep");
        double secs = to_float(a[0], "sleep");
        if (secs < 0) throw PyError("ValueError", "sleep length must be non-negative");
        std::this_thread::sleep_for(std::chrono::duration<double>(secs));
        return Value::None();
    });
    def(m, "monotonic", [](Runtime&, Args& a, Kwargs&) {
        arity(a, 0, 0, "monotonic");
        using namespace std::chrono;
        return Value::F(duration<double>(steady_clock::now().time_since_epoch()).count());
    });
    def(m, "monotonic_ns", [](Runtime&, Args& a, Kwargs&) {
        arity(a, 0, 0, "monotonic_ns");
        using namespace std::chrono;
        return Value::I(duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count());
    });
    def(m, "time", [](Runtime&, Args& a, Kwargs&) {
        arity(a, 0, 0, "time");
        return Value::I(now_epoch_ms() / 1000);
    });
    return Value::O(m);
}

Value math_module(Runtime&) {
    auto m = make_module("math");
    m->attrs["pi"] = Value::F(M_PI);
    m->attrs["e"] = Value::F(M_E);

    using Fn = double (*)(double);
    static const std::pair<const char*, Fn> unary[] = {
        {"sin", [](double x) { return std::sin(x); }},
        {"cos", [](double x) { return std::cos(x); }},
        {"tan", [](double x) { return std::tan(x); }},
        {"exp", [](double x) { return std::exp(x); }},
        {"fabs", [](double x) { return std::fabs(x); }},
    };
    for (const auto& [name, fn] : unary) {
        std::string n = name;
        Fn f = fn;
        def(m, n, [n, f](Runtime&, Args& a, Kwargs&) {
            arity(a, 1, 1, n.c_str());
            return Value::F(f(to_float(a[0], n.c_str())));
        });
    }

    def(m, "sqrt", [](Runtime&, Args& a, Kwargs&) {
        arity(a, 1, 1, "sqrt");
        double x = to_float(a[0], "sqrt");
        if (x < 0) throw PyError("ValueError", "math domain error");
        return Value::F(std::sqrt(x));
    });
    def(m, "log", [](Runtime&, Args& a, Kwargs&) {
        arity(a, 1, 2, "log");
        double x = to_float(a[0], "log");
        if (x <= 0) throw PyError("ValueError", "math domain error");
        double r = std::log(x);
        if (a.size() == 2) r /= std::log(to_float(a[1], "log"));
        return Value::F(r);
    });
    def(m, "pow", [](Runtime&, Args& a, Kwargs&) {
        arity(a, 2, 2, "pow");
        return Value::F(std::pow(to_float(a[0], "pow"), to_float(a[1], "pow")));
    });
    def(m, "floor", [](Runtime&, Args& a, Kwargs&) {
        arity(a, 1, 1, "floor");
        return Value::I(to_int(Value::F(std::floor(to_float(a[0], "floor"))), "floor"));
    });
    def(m, "ceil", [](Runtime&, Args& a, Kwargs&) {
        arity(a, 1, 1, "ceil");
        return Value::I(to_int(Value::F(std::ceil(to_float(a[0], "ceil"))), "ceil"));
    });
    return Value::O(m);
}

} // namespace

void install_modules(Runtime& rt) {
    rt.module_factories["board"] = board_module;
    rt.module_factories["digitalio"] = digitalio_module;
    rt.module_factories["time"] = time_module;
    rt.module_factories["math"] = math_module;
}

} // namespace Py
} // namespace MuRuntime
