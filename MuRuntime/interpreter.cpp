#include "MuRuntime.h"

namespace MuRuntime {
namespace Py {

// ============================================================================
// Interpreter::Impl
// ============================================================================

class Interpreter::Impl {
public:
    Impl() : initialized_(false), heap_bytes_(0), continuation_(false), last_char_(0) {}

    bool init(size_t heap_bytes) {
        if (initialized_) deinit();
        if (heap_bytes < kMinHeapBytes) {
            last_error_ = "heap size " + std::to_string(heap_bytes) + " bytes is below the minimum of " +
                          std::to_string(kMinHeapBytes);
            return false;
        }
        heap_bytes_ = heap_bytes;
        initialized_ = true;
        repl_init();
        return true;
    }

    void deinit() {
        rt_.globals.reset();
        rt_.builtins.reset();
        rt_.modules.clear();
        rt_.module_factories.clear();
        line_.clear();
        pending_.clear();
        continuation_ = false;
        initialized_ = false;
    }

    void repl_init() {
        if (!initialized_) return;
        rt_.builtins = std::make_shared<Env>();
        rt_.globals = std::make_shared<Env>(rt_.builtins);
        rt_.modules.clear();
        rt_.module_factories.clear();
        rt_.call_stack.clear();
        rt_.heap_limit = heap_bytes_;
        rt_.heap_used = 0;
        install_builtins(rt_);
        install_modules(rt_);
        rt_.globals->set("__name__", Value::S("__main__"));
        line_.clear();
        pending_.clear();
        continuation_ = false;
    }

    bool repl_process_char(int c) {
        if (!initialized_) return false;
        int prev = last_char_;
        last_char_ = c;

        if (c == '\n' && prev == '\r') return continuation_;
        if (c == '\r' || c == '\n') {
            submit_line();
            return continuation_;
        }
        if (c == 0x08 || c == 0x7f) {
            if (!line_.empty()) line_.pop_back();
            return continuation_;
        }
        // Ctrl-C abandons the line being edited
        if (c == 0x03) {
            line_.clear();
            pending_.clear();
            continuation_ = false;
            return false;
        }
        if (c < 0x20 && c != '\t') return continuation_;
        line_ += static_cast<char>(c);
        return continuation_;
    }

    bool exec_str(const std::string& source) {
        if (!initialized_) {
            last_error_ = "interpreter not initialized";
            return false;
        }
        return run_unit(source, false, "<string>");
    }

    std::vector<std::string> global_names() const {
        std::vector<std::string> names;
        if (!rt_.globals) return names;
        for (const auto& [k, _] : rt_.globals->tbl)
            if (k.compare(0, 2, "__") != 0) names.push_back(k);
        return names;
    }

    Runtime rt_;
    bool initialized_;
    size_t heap_bytes_;
    bool continuation_;
    std::string last_error_;

private:
    static bool blank(const std::string& s) {
        return s.find_first_not_of(" \t\r") == std::string::npos;
    }

    void submit_line() {
        std::string line = line_;
        line_.clear();

        if (!continuation_) {
            if (blank(line)) return;
            if (needs_more_input(line)) {
                pending_ = line + "\n";
                continuation_ = true;
                return;
            }
            run_unit(line, true, "<stdin>");
            return;
        }

        bool open = false;
        if (blank(line)) {
            needs_more_input(pending_, &open);
            if (open) {
                pending_ += "\n";
                return;
            }
        } else {
            pending_ += line + "\n";
            if (needs_more_input(pending_, &open)) return;
        }

        std::string unit = pending_;
        pending_.clear();
        continuation_ = false;
        run_unit(unit, true, "<stdin>");
    }

    bool run_unit(const std::string& source, bool interactive, const char* filename) {
        rt_.heap_used = 0;
        rt_.call_stack.clear();
        try {
            Block program = parse_program(source, interactive);
            rt_.charge(source.size());
            exec_block(rt_, program, rt_.globals);
            return true;
        } catch (PyError& e) {
            report(e, filename);
        } catch (BreakSignal&) {
            report(PyError("SyntaxError", "'break' outside loop"), filename);
        } catch (ContinueSignal&) {
            report(PyError("SyntaxError", "'continue' outside loop"), filename);
        } catch (ReturnSignal&) {
            report(PyError("SyntaxError", "'return' outside function"), filename);
        } catch (const std::exception& e) {
            report(PyError("RuntimeError", e.what()), filename);
        }
        return false;
    }

    void report(const PyError& e, const char* filename) {
        std::ostringstream ss;
        ss << "Traceback (most recent call last):\n";
        for (auto it = e.frames.rbegin(); it != e.frames.rend(); ++it) {
            ss << "  File \"" << filename << "\", line " << it->line;
            if (!it->scope.empty()) ss << ", in " << it->scope;
            ss << "\n";
        }
        ss << e.type;
        if (!e.message.empty()) ss << ": " << e.message;
        ss << "\n";
        last_error_ = e.type + (e.message.empty() ? "" : ": " + e.message);
        rt_.write_err(ss.str());
    }

    std::string line_;
    std::string pending_;
    int last_char_;
};

// ============================================================================
// Interpreter - Public API
// ============================================================================

Interpreter::Interpreter() : impl_(std::make_unique<Impl>()) {}

Interpreter::~Interpreter() = default;

bool Interpreter::init(size_t heap_bytes) {
    return impl_->init(heap_bytes);
}

void Interpreter::deinit() {
    impl_->deinit();
}

bool Interpreter::initialized() const {
    return impl_->initialized_;
}

size_t Interpreter::heap_size() const {
    return impl_->heap_bytes_;
}

void Interpreter::repl_init() {
    impl_->repl_init();
}

bool Interpreter::repl_process_char(int c) {
    return impl_->repl_process_char(c);
}

bool Interpreter::repl_in_continuation() const {
    return impl_->continuation_;
}

bool Interpreter::exec_str(const std::string& source) {
    return impl_->exec_str(source);
}

void Interpreter::set_stdout(Sink sink) {
    impl_->rt_.out = std::move(sink);
}

void Interpreter::set_stderr(Sink sink) {
    impl_->rt_.err = std::move(sink);
}

std::vector<std::string> Interpreter::global_names() const {
    return impl_->global_names();
}

std::string Interpreter::last_error() const {
    return impl_->last_error_;
}

} // namespace Py
} // namespace MuRuntime
