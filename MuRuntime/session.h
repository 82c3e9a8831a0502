#ifndef _MuRuntime_session_h_
#define _MuRuntime_session_h_

#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "channel.h"
#include "completion.h"
#include "correlation.h"
#include "passthrough.h"
#include "protocol.h"

namespace MuRuntime {

enum class SessionState {
    AWAITING_RUNTIME,
    IDLE,
    EXECUTING,
    ERROR
};

const char* session_state_to_string(SessionState state);

enum class PromptMode {
    SHELL,        // "mu> "
    DEVICE_REPL   // ">>> "
};

enum class Style {
    NORMAL,
    OUTPUT,
    ERROR,
    SUCCESS,
    NOTICE,
    META
};

enum class Key {
    CHAR,
    ENTER,
    BACKSPACE,
    TAB,
    UP,
    DOWN,
    LEFT,
    RIGHT,
    CTRL_C,
    CTRL_D,
    CTRL_E
};

struct KeyEvent {
    Key key = Key::CHAR;
    char ch = 0;

    static KeyEvent character(char c) { return KeyEvent{Key::CHAR, c}; }
    static KeyEvent of(Key k) { return KeyEvent{k, 0}; }
};

// Rendering surface the session writes to
class SessionView {
public:
    virtual ~SessionView() = default;
    virtual void write(const std::string& text, Style style) = 0;
    virtual void render_prompt(const std::string& prompt, const std::string& line, size_t cursor) = 0;
    virtual void render_progress(int percent, const std::string& message) = 0;
};

// Structured commands exchanged with a worker
struct DirectTransport {
    Channel* channel = nullptr;
};

// Raw keystrokes forwarded to an external terminal program
struct PassthroughTransport {
    PassthroughChannel* channel = nullptr;
};

using Transport = std::variant<DirectTransport, PassthroughTransport>;

struct SessionConfig {
    std::chrono::milliseconds timeout{PendingTable::kDefaultTimeoutMs};
    std::chrono::milliseconds sweep_interval{PendingTable::kDefaultSweepMs};
    PromptMode prompt_mode = PromptMode::SHELL;
    size_t history_limit = 100;
    std::string which_text;   // answer for "mu which"
    bool verbose = false;
};

// Session Controller. Owns correlation state, history, paste mode and
// completion; the transport is fixed at construction. The caller owns the
// channel and must keep it alive for the session's lifetime.
class Session {
public:
    using Clock = PendingTable::Clock;

    Session(Transport transport, SessionView& view, const SessionConfig& config);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Readiness signals from the host
    void on_progress(int percent, const std::string& message);
    void on_runtime_ready(bool ready);

    void handle_key(const KeyEvent& ev);

    // idle -> executing for a non-empty line; ignored otherwise
    bool submit(const std::string& line);

    // Control signals; valid in any state
    void interrupt();
    void soft_restart();
    void enter_paste_mode();
    void finish_paste();
    void cancel_paste();

    // Issue one worker request through the correlation table; returns its id
    std::optional<std::string> issue(RequestType type, Json payload, Continuation continuation);

    // Periodic work; runs the pending sweep once per sweep interval
    void tick(Clock::time_point now = Clock::now());
    size_t sweep(Clock::time_point now = Clock::now());

    SessionState state() const { return state_; }
    bool is_direct() const { return std::holds_alternative<DirectTransport>(transport_); }
    bool paste_mode() const { return paste_mode_; }
    size_t pending() const { return pending_.size(); }
    const PendingTable& pending_table() const { return pending_; }
    const std::deque<std::string>& history() const { return history_; }
    const std::string& line() const { return line_; }
    size_t cursor() const { return cursor_; }
    std::string prompt() const;
    const std::string& inflight_id() const { return inflight_id_; }

    void set_completion_provider(std::unique_ptr<CompletionProvider> provider);

private:
    void install_handlers();
    void handle_direct_key(const KeyEvent& ev);
    void handle_passthrough_key(const KeyEvent& ev);

    void dispatch_cli(const std::string& line);
    void dispatch_repl(const std::string& code, ExecMode mode);
    void finish_command(const std::string& id);
    void render_execute(const Response& resp);
    void render_failure(const CommandError& err);

    void on_channel_response(const Response& resp);
    void on_channel_init(const Response& resp);
    void on_channel_fault(const std::string& reason);

    void send_control(ControlSignalType type);
    void push_history(const std::string& line);
    void history_step(int direction);
    void redraw();

    Transport transport_;
    SessionView& view_;
    SessionConfig config_;

    SessionState state_;
    PendingTable pending_;
    CorrelationIdGenerator ids_;
    std::string inflight_id_;
    Clock::time_point last_sweep_;

    std::string line_;
    size_t cursor_;
    std::string block_;          // compound statement being collected
    bool paste_mode_;
    std::vector<std::string> paste_lines_;

    std::deque<std::string> history_;
    int history_index_;          // -1 when not browsing
    std::string draft_;

    std::unique_ptr<CompletionProvider> completion_;
    std::unique_ptr<CompletionCycle> cycle_;
    bool init_error_reported_;
};

} // namespace MuRuntime

#endif
