#ifndef _MuRuntime_terminal_ui_h_
#define _MuRuntime_terminal_ui_h_

#include <memory>
#include <string>
#include <vector>

#include "config.h"
#include "session.h"

namespace MuRuntime {

// ANSI color codes
namespace Color {
    extern const char* RESET;
    extern const char* RED;
    extern const char* GREEN;
    extern const char* YELLOW;
    extern const char* BLUE;
    extern const char* CYAN;
    extern const char* GRAY;
}

const char* style_color(Style style);

// "[####------] 40% message"
std::string progress_bar(int percent, const std::string& message, int width = 10);

// Check if terminal supports ncurses
bool supports_ncurses();

// Byte stream -> key events. Keeps state across calls so escape
// sequences split between reads still decode.
class KeyDecoder {
public:
    KeyDecoder() : state_(0) {}

    // Ctrl-] (0x1d) sets quit
    void feed(unsigned char c, std::vector<KeyEvent>& out, bool* quit = nullptr);

private:
    int state_;   // 0 plain, 1 after ESC, 2 after ESC [ or ESC O
};

// Terminal front-end: renders the session and produces key events
class TerminalFrontend : public SessionView {
public:
    virtual bool open() = 0;
    virtual void close() = 0;
    virtual int input_fd() const = 0;

    // Collect available keys; false once input is exhausted
    virtual bool read_keys(std::vector<KeyEvent>& out) = 0;
    virtual bool quit_requested() const = 0;
};

// Plain terminal; raw termios when stdin is a tty, line input otherwise
class StdioTerminal : public TerminalFrontend {
public:
    StdioTerminal();
    ~StdioTerminal() override;

    bool open() override;
    void close() override;
    int input_fd() const override;
    bool read_keys(std::vector<KeyEvent>& out) override;
    bool quit_requested() const override;

    void write(const std::string& text, Style style) override;
    void render_prompt(const std::string& prompt, const std::string& line, size_t cursor) override;
    void render_progress(int percent, const std::string& message) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

#ifdef MURUNTIME_UI_NCURSES
class NcursesTerminal : public TerminalFrontend {
public:
    NcursesTerminal();
    ~NcursesTerminal() override;

    bool open() override;
    void close() override;
    int input_fd() const override;
    bool read_keys(std::vector<KeyEvent>& out) override;
    bool quit_requested() const override;

    void write(const std::string& text, Style style) override;
    void render_prompt(const std::string& prompt, const std::string& line, size_t cursor) override;
    void render_progress(int percent, const std::string& message) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};
#endif

// ncurses when compiled in and the terminal supports it, stdio otherwise
std::unique_ptr<TerminalFrontend> make_terminal(bool simple_mode);

// murepl main loop: picks the transport once, then polls terminal and
// channel until quit or end of input. Returns the process exit code.
int run_host(const RuntimeConfig& config);

} // namespace MuRuntime

#endif
