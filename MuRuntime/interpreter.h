#ifndef _MuRuntime_interpreter_h_
#define _MuRuntime_interpreter_h_

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace MuRuntime {
namespace Py {

// Embedded interpreter with a MicroPython-like embedding surface:
// init/deinit, a character-driven REPL and whole-buffer execution.
// Output goes to the stdout/stderr sinks; errors are printed as tracebacks
// on stderr and never escape as C++ exceptions.
class Interpreter {
public:
    using Sink = std::function<void(const std::string&)>;

    static const size_t kMinHeapBytes = 16 * 1024;

    Interpreter();
    ~Interpreter();

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    // Fails when heap_bytes is below kMinHeapBytes
    bool init(size_t heap_bytes);
    void deinit();
    bool initialized() const;
    size_t heap_size() const;

    // Clears globals, imported modules and any partial REPL input
    void repl_init();

    // Feed one character. '\r' or '\n' submits the current line.
    // Returns true while a multi-line unit is still being collected.
    bool repl_process_char(int c);
    bool repl_in_continuation() const;

    // Returns false if the code raised (traceback already written to stderr)
    bool exec_str(const std::string& source);

    void set_stdout(Sink sink);
    void set_stderr(Sink sink);

    std::vector<std::string> global_names() const;
    std::string last_error() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace Py
} // namespace MuRuntime

#endif
