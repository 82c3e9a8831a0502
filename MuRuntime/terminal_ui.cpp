#include "MuRuntime.h"
#include <termios.h>

namespace MuRuntime {

namespace Color {
    const char* RESET = "\033[0m";
    const char* RED = "\033[31m";
    const char* GREEN = "\033[32m";
    const char* YELLOW = "\033[33m";
    const char* BLUE = "\033[34m";
    const char* CYAN = "\033[36m";
    const char* GRAY = "\033[90m";
}

const char* style_color(Style style) {
    switch (style) {
        case Style::NORMAL: return "";
        case Style::OUTPUT: return "";
        case Style::ERROR: return Color::RED;
        case Style::SUCCESS: return Color::GREEN;
        case Style::NOTICE: return Color::YELLOW;
        case Style::META: return Color::GRAY;
    }
    return "";
}

std::string progress_bar(int percent, const std::string& message, int width) {
    percent = std::max(0, std::min(100, percent));
    int filled = percent * width / 100;
    std::string bar = "[" + std::string(static_cast<size_t>(filled), '#') +
                      std::string(static_cast<size_t>(width - filled), '-') + "] " +
                      std::to_string(percent) + "%";
    if (!message.empty()) bar += " " + message;
    return bar;
}

// Check if terminal supports ncurses
bool supports_ncurses() {
    if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
        return false;
    }

    const char* term = std::getenv("TERM");
    if (!term || std::string(term).empty()) {
        return false;
    }

    std::vector<std::string> supported_terms = {
        "xterm", "xterm-256color", "xterm-color", "linux",
        "screen", "screen-256color", "tmux", "tmux-256color",
        "rxvt", "rxvt-unicode", "rxvt-256color", "dtterm",
        "ansi", "cygwin", "putty", "st", "st-256color"
    };

    for (const auto& supported : supported_terms) {
        if (std::string(term).find(supported) != std::string::npos) {
            return true;
        }
    }

    return false;
}

// ============================================================================
// KeyDecoder
// ============================================================================

void KeyDecoder::feed(unsigned char c, std::vector<KeyEvent>& out, bool* quit) {
    if (state_ == 1) {
        state_ = (c == '[' || c == 'O') ? 2 : 0;
        return;
    }
    if (state_ == 2) {
        switch (c) {
            case 'A': out.push_back(KeyEvent::of(Key::UP)); state_ = 0; return;
            case 'B': out.push_back(KeyEvent::of(Key::DOWN)); state_ = 0; return;
            case 'C': out.push_back(KeyEvent::of(Key::RIGHT)); state_ = 0; return;
            case 'D': out.push_back(KeyEvent::of(Key::LEFT)); state_ = 0; return;
            default: break;
        }
        // parameter bytes of a longer sequence
        if ((c >= '0' && c <= '9') || c == ';') return;
        state_ = 0;
        return;
    }

    switch (c) {
        case 0x1b: state_ = 1; return;
        case '\r':
        case '\n': out.push_back(KeyEvent::of(Key::ENTER)); return;
        case 0x7f:
        case 0x08: out.push_back(KeyEvent::of(Key::BACKSPACE)); return;
        case '\t': out.push_back(KeyEvent::of(Key::TAB)); return;
        case 0x03: out.push_back(KeyEvent::of(Key::CTRL_C)); return;
        case 0x04: out.push_back(KeyEvent::of(Key::CTRL_D)); return;
        case 0x05: out.push_back(KeyEvent::of(Key::CTRL_E)); return;
        case 0x1d:
            if (quit) *quit = true;
            return;
        default: break;
    }
    if (c < 0x20) return;
    out.push_back(KeyEvent::character(static_cast<char>(c)));
}

// ============================================================================
// StdioTerminal
// ============================================================================

namespace {

struct RawTerminalMode {
    termios original{};
    bool active = false;

    void enable() {
        if (active) return;
        if (::isatty(STDIN_FILENO) != 1) return;
        if (tcgetattr(STDIN_FILENO, &original) != 0) return;
        termios raw = original;
        // ISIG off so Ctrl-C/Ctrl-D arrive as keys
        raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO | ISIG));
        raw.c_iflag &= static_cast<tcflag_t>(~(IXON | ICRNL));
        raw.c_oflag &= static_cast<tcflag_t>(~OPOST);
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;
        if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) == 0) {
            active = true;
        }
    }

    void disable() {
        if (active) {
            tcsetattr(STDIN_FILENO, TCSAFLUSH, &original);
            active = false;
        }
    }

    ~RawTerminalMode() {
        disable();
    }
};

} // namespace

class StdioTerminal::Impl {
public:
    Impl()
        : tty_out_(isatty(STDOUT_FILENO) == 1)
        , quit_(false)
        , last_cr_(false)
        , prompt_shown_(false)
    {}

    void emit(const std::string& text) {
        if (!raw_.active) {
            std::cout << text;
            return;
        }
        // OPOST is off, so expand newlines ourselves
        for (char c : text) {
            if (c == '\n') std::cout << '\r';
            std::cout << c;
        }
    }

    void clear_prompt() {
        if (tty_out_ && prompt_shown_) {
            std::cout << "\r\x1b[K";
            prompt_shown_ = false;
        }
    }

    RawTerminalMode raw_;
    KeyDecoder decoder_;
    bool tty_out_;
    bool quit_;
    bool last_cr_;
    bool prompt_shown_;
};

StdioTerminal::StdioTerminal() : impl_(std::make_unique<Impl>()) {}

StdioTerminal::~StdioTerminal() {
    close();
}

bool StdioTerminal::open() {
    impl_->raw_.enable();
    return true;
}

void StdioTerminal::close() {
    if (impl_->prompt_shown_) {
        impl_->emit("\n");
        impl_->prompt_shown_ = false;
    }
    std::cout.flush();
    impl_->raw_.disable();
}

int StdioTerminal::input_fd() const {
    return STDIN_FILENO;
}

bool StdioTerminal::read_keys(std::vector<KeyEvent>& out) {
    unsigned char buf[256];
    ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
    if (n < 0) {
        return errno == EINTR || errno == EAGAIN;
    }
    if (n == 0) return false;

    for (ssize_t i = 0; i < n; ++i) {
        unsigned char c = buf[i];
        // CRLF from pasted text counts once
        if (c == '\n' && impl_->last_cr_) {
            impl_->last_cr_ = false;
            continue;
        }
        impl_->last_cr_ = (c == '\r');
        impl_->decoder_.feed(c, out, &impl_->quit_);
    }
    return true;
}

bool StdioTerminal::quit_requested() const {
    return impl_->quit_;
}

void StdioTerminal::write(const std::string& text, Style style) {
    impl_->clear_prompt();
    const char* color = impl_->tty_out_ ? style_color(style) : "";
    if (*color) std::cout << color;
    impl_->emit(text);
    if (*color) std::cout << Color::RESET;
    std::cout.flush();
}

void StdioTerminal::render_prompt(const std::string& prompt, const std::string& line, size_t cursor) {
    if (!impl_->tty_out_) return;
    std::cout << '\r' << prompt << line << "\x1b[K";
    if (cursor < line.size()) {
        size_t tail = line.size() - cursor;
        std::cout << "\x1b[" << tail << 'D';
    }
    std::cout.flush();
    impl_->prompt_shown_ = true;
}

void StdioTerminal::render_progress(int percent, const std::string& message) {
    if (!impl_->tty_out_) return;
    std::cout << "\r\x1b[K" << Color::YELLOW << progress_bar(percent, message) << Color::RESET;
    if (percent >= 100) impl_->emit("\n");
    std::cout.flush();
    impl_->prompt_shown_ = false;
}

// ============================================================================
// Host loop
// ============================================================================

std::unique_ptr<TerminalFrontend> make_terminal(bool simple_mode) {
#ifdef MURUNTIME_UI_NCURSES
    if (!simple_mode && supports_ncurses()) {
        return std::make_unique<NcursesTerminal>();
    }
#else
    (void)simple_mode;
#endif
    return std::make_unique<StdioTerminal>();
}

namespace {

bool is_control_key(const KeyEvent& ev) {
    return ev.key == Key::CTRL_C || ev.key == Key::CTRL_D || ev.key == Key::CTRL_E;
}

// Enter waits in the type-ahead queue until the session can take a line
bool can_deliver(const Session& session, const KeyEvent& ev) {
    if (!session.is_direct() || is_control_key(ev)) return true;
    if (ev.key != Key::ENTER || session.paste_mode()) return true;
    return session.state() == SessionState::IDLE || session.state() == SessionState::ERROR;
}

} // namespace

int run_host(const RuntimeConfig& config) {
    signal(SIGPIPE, SIG_IGN);

    std::unique_ptr<Channel> channel;
    std::unique_ptr<PassthroughChannel> passthrough;
    Transport transport;

    // Chosen once; never re-evaluated
    if (config.passthrough_command) {
        passthrough = std::make_unique<PassthroughChannel>(*config.passthrough_command, config.verbose);
        transport = PassthroughTransport{passthrough.get()};
    } else if (config.inprocess) {
        channel = std::make_unique<LoopbackChannel>(config.worker_config());
        transport = DirectTransport{channel.get()};
    } else {
        ProcessChannelConfig pc;
        pc.worker_executable = config.worker_executable;
        pc.worker_args = {"--heap-kb", std::to_string(config.heap_kb)};
        if (config.verbose) pc.worker_args.push_back("--verbose");
        pc.verbose = config.verbose;
        channel = std::make_unique<ProcessChannel>(pc);
        transport = DirectTransport{channel.get()};
    }

    auto term = make_terminal(config.simple_mode);
    if (!term->open()) {
        std::cerr << Color::RED << "Failed to open terminal\n" << Color::RESET;
        return 1;
    }

    int exit_code = 0;
    {
        Session session(transport, *term, config.session_config());

        bool started = passthrough ? passthrough->start() : channel->start();
        if (!started) {
            std::string reason = passthrough ? passthrough->get_last_error() : channel->get_last_error();
            term->close();
            std::cerr << Color::RED << "Failed to start runtime: " << reason << "\n" << Color::RESET;
            return 1;
        }
        if (passthrough) {
            session.on_progress(50, "Starting " + passthrough->command());
            session.on_runtime_ready(true);
        } else {
            session.on_progress(10, "Starting worker");
        }

        std::deque<KeyEvent> typeahead;
        bool input_open = true;

        while (!term->quit_requested()) {
            struct pollfd fds[2];
            int nfds = 0;
            int input_slot = -1;
            int channel_slot = -1;

            if (input_open) {
                fds[nfds].fd = term->input_fd();
                fds[nfds].events = POLLIN;
                fds[nfds].revents = 0;
                input_slot = nfds++;
            }
            int cfd = passthrough ? passthrough->wait_fd() : channel->wait_fd();
            if (cfd >= 0) {
                fds[nfds].fd = cfd;
                fds[nfds].events = POLLIN;
                fds[nfds].revents = 0;
                channel_slot = nfds++;
            }

            // The loopback channel has no descriptor, so keep the wait short
            int wait_ms = (cfd >= 0) ? 100 : 10;
            int r = poll(fds, static_cast<nfds_t>(nfds), wait_ms);
            if (r < 0 && errno != EINTR) {
                std::cerr << "[murepl] poll() failed: " << strerror(errno) << "\n";
                exit_code = 1;
                break;
            }

            if (r > 0 && input_slot >= 0 && (fds[input_slot].revents & (POLLIN | POLLHUP))) {
                std::vector<KeyEvent> keys;
                if (!term->read_keys(keys)) input_open = false;
                for (const auto& k : keys) {
                    // Interrupt jumps the queue
                    if (k.key == Key::CTRL_C) {
                        typeahead.clear();
                        session.handle_key(k);
                        continue;
                    }
                    typeahead.push_back(k);
                }
            }

            if (passthrough) {
                if (channel_slot >= 0 && (fds[channel_slot].revents & (POLLIN | POLLHUP))) {
                    passthrough->poll_output(0);
                }
            } else if (channel->is_running()) {
                if (cfd < 0 || (channel_slot >= 0 && (fds[channel_slot].revents & (POLLIN | POLLHUP)))) {
                    channel->poll_messages(0);
                }
            }

            while (!typeahead.empty() && can_deliver(session, typeahead.front())) {
                KeyEvent k = typeahead.front();
                typeahead.pop_front();
                session.handle_key(k);
            }

            session.tick();

            if (!input_open && typeahead.empty()) {
                if (!session.is_direct()) break;
                if (session.state() == SessionState::ERROR) {
                    exit_code = 1;
                    break;
                }
                if (session.state() == SessionState::IDLE && session.pending() == 0 && !session.paste_mode())
                    break;
            }
        }
    }

    if (channel) channel->stop();
    if (passthrough) passthrough->stop();
    term->close();
    return exit_code;
}

} // namespace MuRuntime
