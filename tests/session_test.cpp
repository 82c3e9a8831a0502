#include "MuRuntime.h"
#include "test_support.h"

using namespace MuRuntime;

namespace {

// Collects everything the session renders
class RecordingView : public SessionView {
public:
    void write(const std::string& text, Style style) override {
        writes.emplace_back(text, style);
    }

    void render_prompt(const std::string& p, const std::string& l, size_t c) override {
        prompt = p;
        line = l;
        cursor = c;
    }

    void render_progress(int percent, const std::string& message) override {
        progress = percent;
        progress_message = message;
    }

    std::string text(Style style) const {
        std::string out;
        for (const auto& [t, s] : writes)
            if (s == style) out += t;
        return out;
    }

    std::string all() const {
        std::string out;
        for (const auto& w : writes) out += w.first;
        return out;
    }

    std::vector<std::pair<std::string, Style>> writes;
    std::string prompt;
    std::string line;
    size_t cursor = 0;
    int progress = -1;
    std::string progress_message;
};

// Channel double: records requests, replies on demand
class ScriptedChannel : public Channel {
public:
    bool start() override {
        running = true;
        return true;
    }
    void stop() override { running = false; }
    bool is_running() const override { return running; }
    bool restart() override {
        restarts++;
        running = restart_ok;
        if (!restart_ok) last_error_ = "worker binary missing";
        return restart_ok;
    }

    bool send(const Request& req) override {
        if (fail_send) {
            last_error_ = "Broken pipe";
            return false;
        }
        sent.push_back(req);
        return true;
    }

    int poll_messages(int) override { return 0; }

    void init(bool success, const std::string& error = {}) {
        Response r;
        r.id = "init";
        r.success = success;
        if (success) {
            Json result = Json::object();
            result["status"] = "ready";
            r.result = result;
        } else {
            r.error = error;
        }
        dispatch_line(ProtocolParser::serialize_response(r), false, "ScriptedChannel");
    }

    void reply(const std::string& id, bool success, const std::string& output, const std::string& error = {}) {
        Response r;
        r.id = id;
        r.success = success;
        Json result = Json::object();
        result["output"] = output;
        r.result = result;
        if (!success) r.error = error;
        dispatch_line(ProtocolParser::serialize_response(r), false, "ScriptedChannel");
    }

    void raw(const std::string& line) { dispatch_line(line, false, "ScriptedChannel"); }
    void break_pipe(const std::string& reason) { fault(reason); }

    std::vector<Request> sent;
    bool running = false;
    bool fail_send = false;
    bool restart_ok = true;
    int restarts = 0;
};

void type(Session& s, const std::string& text) {
    for (char c : text) s.handle_key(KeyEvent::character(c));
}

void press(Session& s, Key k) {
    s.handle_key(KeyEvent::of(k));
}

void enter(Session& s, const std::string& text) {
    type(s, text);
    press(s, Key::ENTER);
}

void pump(LoopbackChannel& ch, int rounds = 10) {
    for (int i = 0; i < rounds; ++i) ch.poll_messages(0);
}

WorkerConfig loopback_config() {
    WorkerConfig c;
    c.heap_bytes = 64 * 1024;
    return c;
}

} // namespace

// ============================================================================
// Readiness
// ============================================================================

TEST(awaits_runtime_until_init) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    CHECK(s.state() == SessionState::AWAITING_RUNTIME);
    CHECK_EQ(view.progress, 0);
    CHECK(!s.submit("1"));

    s.on_progress(40, "Loading interpreter");
    CHECK_EQ(view.progress, 40);
    CHECK_EQ(view.progress_message, std::string("Loading interpreter"));

    ch.init(true);
    CHECK(s.state() == SessionState::IDLE);
    CHECK_EQ(view.progress, 100);
    CHECK_EQ(view.prompt, std::string("mu> "));

    // progress after readiness is ignored
    s.on_progress(10, "late");
    CHECK_EQ(view.progress, 100);
}

TEST(device_repl_prompt) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    SessionConfig cfg;
    cfg.prompt_mode = PromptMode::DEVICE_REPL;
    Session s(DirectTransport{&ch}, view, cfg);
    ch.init(true);
    CHECK_EQ(s.prompt(), std::string(">>> "));
}

TEST(init_failure_reported_once) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.init(false, "Failed to initialize runtime: heap too small");
    ch.init(false, "Failed to initialize runtime: heap too small");
    std::string err = view.text(Style::ERROR);
    CHECK(err.find("InitializationError") != std::string::npos);
    CHECK_EQ(err.find("InitializationError"), err.rfind("InitializationError"));
    CHECK(s.state() == SessionState::IDLE);
}

// ============================================================================
// Execute cycle
// ============================================================================

TEST(submit_moves_to_executing_and_back) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.init(true);

    CHECK(!s.submit("   "));
    CHECK(ch.sent.empty());

    enter(s, "2+3");
    CHECK(s.state() == SessionState::EXECUTING);
    CHECK_EQ(view.prompt, std::string("... "));
    CHECK_EQ(ch.sent.size(), static_cast<size_t>(1));
    const Request& req = ch.sent[0];
    CHECK(req.type == RequestType::EXECUTE);
    CHECK_EQ(req.payload["code"].as_string(), std::string("2+3"));
    CHECK_EQ(req.payload["mode"].as_string(), std::string("repl"));
    CHECK_EQ(s.inflight_id(), req.id);

    // Enter while executing does not submit
    enter(s, "9");
    CHECK_EQ(ch.sent.size(), static_cast<size_t>(1));

    ch.reply(req.id, true, "5\n");
    CHECK(s.state() == SessionState::IDLE);
    CHECK_EQ(view.text(Style::OUTPUT), std::string("5\n"));
    CHECK(s.inflight_id().empty());
    CHECK_EQ(s.pending(), static_cast<size_t>(0));
}

TEST(loopback_round_trip) {
    LoopbackChannel ch(loopback_config());
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    CHECK(ch.start());
    pump(ch);
    CHECK(s.state() == SessionState::IDLE);

    enter(s, "x = 20");
    pump(ch);
    enter(s, "x * 2 + 2");
    pump(ch);
    CHECK(s.state() == SessionState::IDLE);
    CHECK_EQ(view.text(Style::OUTPUT), std::string("42\n"));
}

TEST(execution_error_is_rendered) {
    LoopbackChannel ch(loopback_config());
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.start();
    pump(ch);

    enter(s, "undefined_name");
    pump(ch);
    CHECK(s.state() == SessionState::IDLE);
    CHECK(view.text(Style::ERROR).find("NameError") != std::string::npos);
}

TEST(compound_statement_collected_before_send) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.init(true);

    enter(s, "for i in range(2):");
    CHECK(s.state() == SessionState::IDLE);
    CHECK_EQ(view.prompt, std::string("... "));
    enter(s, "    print(i)");
    CHECK(ch.sent.empty());
    enter(s, "");
    CHECK_EQ(ch.sent.size(), static_cast<size_t>(1));
    CHECK_EQ(ch.sent[0].payload["code"].as_string(), std::string("for i in range(2):\n    print(i)"));
}

TEST(send_failure_returns_to_idle) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.init(true);
    ch.fail_send = true;

    CHECK(s.submit("1"));
    CHECK(s.state() == SessionState::IDLE);
    CHECK_EQ(s.pending(), static_cast<size_t>(0));
    CHECK(view.text(Style::ERROR).find("Broken pipe") != std::string::npos);
}

TEST(malformed_reply_is_ignored) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.init(true);
    s.submit("1");
    ch.raw("{broken");
    CHECK(s.state() == SessionState::EXECUTING);
    CHECK_EQ(ch.protocol_errors(), 1);
}

// ============================================================================
// Interrupt and stale responses
// ============================================================================

TEST(interrupt_discards_late_response) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.init(true);

    s.submit("while True: pass");
    std::string first = ch.sent.back().id;
    press(s, Key::CTRL_C);
    CHECK(s.state() == SessionState::IDLE);
    CHECK_EQ(s.pending(), static_cast<size_t>(0));
    CHECK(view.text(Style::NOTICE).find("^C") != std::string::npos);
    // interruption itself is not reported as an error
    CHECK_EQ(view.text(Style::ERROR), std::string(""));

    s.submit("7");
    std::string second = ch.sent.back().id;
    CHECK(first != second);

    ch.reply(first, true, "stale\n");
    CHECK(s.state() == SessionState::EXECUTING);
    CHECK(view.all().find("stale") == std::string::npos);

    ch.reply(second, true, "7\n");
    CHECK(s.state() == SessionState::IDLE);
    CHECK_EQ(view.text(Style::OUTPUT), std::string("7\n"));
}

TEST(loopback_interrupt_then_new_command) {
    LoopbackChannel ch(loopback_config());
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.start();
    pump(ch);

    s.submit("print('first')");
    s.interrupt();
    s.submit("print('second')");
    CHECK_EQ(ch.queued(), static_cast<size_t>(2));
    pump(ch);
    CHECK(s.state() == SessionState::IDLE);
    CHECK_EQ(view.text(Style::OUTPUT), std::string("second\n"));
}

TEST(ctrl_c_clears_line_when_idle) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.init(true);
    type(s, "half typed");
    press(s, Key::CTRL_C);
    CHECK_EQ(s.line(), std::string(""));
    CHECK(s.state() == SessionState::IDLE);
    CHECK(ch.sent.empty());
}

// ============================================================================
// Timeouts
// ============================================================================

TEST(sweep_times_out_inflight_command) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    SessionConfig cfg;
    cfg.timeout = std::chrono::milliseconds(50);
    Session s(DirectTransport{&ch}, view, cfg);
    ch.init(true);

    s.submit("1");
    std::string id = ch.sent.back().id;
    CHECK_EQ(s.sweep(Session::Clock::now() + std::chrono::seconds(1)), static_cast<size_t>(1));
    CHECK(s.state() == SessionState::IDLE);
    CHECK(view.text(Style::ERROR).find("TimeoutError: Command execute timed out") != std::string::npos);

    // the late reply is dropped
    ch.reply(id, true, "late\n");
    CHECK(view.all().find("late") == std::string::npos);
}

TEST(tick_sweeps_on_interval) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    SessionConfig cfg;
    cfg.timeout = std::chrono::milliseconds(10);
    cfg.sweep_interval = std::chrono::milliseconds(1000);
    Session s(DirectTransport{&ch}, view, cfg);
    ch.init(true);

    s.submit("1");
    auto now = Session::Clock::now();
    s.tick(now + std::chrono::milliseconds(20));
    CHECK(s.state() == SessionState::EXECUTING);
    s.tick(now + std::chrono::milliseconds(1500));
    CHECK(s.state() == SessionState::IDLE);
}

// ============================================================================
// Faults and restart
// ============================================================================

TEST(fault_enters_error_and_ctrl_d_restarts) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.init(true);

    s.submit("1");
    ch.break_pipe("Subprocess closed stdout");
    CHECK(s.state() == SessionState::ERROR);
    CHECK_EQ(view.prompt, std::string("!!! "));
    CHECK_EQ(s.pending(), static_cast<size_t>(0));
    CHECK(view.text(Style::ERROR).find("ProtocolError") != std::string::npos);
    CHECK(!s.submit("2"));

    press(s, Key::CTRL_D);
    CHECK_EQ(ch.restarts, 1);
    CHECK(s.state() == SessionState::IDLE);
    CHECK(view.text(Style::SUCCESS).find("Runtime restarted") != std::string::npos);
}

TEST(ctrl_c_keeps_error_until_restart) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.init(true);

    ch.break_pipe("Subprocess closed stdout");
    CHECK(s.state() == SessionState::ERROR);

    press(s, Key::CTRL_C);
    CHECK(s.state() == SessionState::ERROR);
    CHECK_EQ(view.prompt, std::string("!!! "));
    CHECK_EQ(ch.restarts, 0);

    press(s, Key::CTRL_D);
    CHECK_EQ(ch.restarts, 1);
    CHECK(s.state() == SessionState::IDLE);
}

TEST(failed_restart_stays_in_error) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.init(true);
    ch.break_pipe("gone");
    ch.restart_ok = false;
    s.soft_restart();
    CHECK(s.state() == SessionState::ERROR);
    CHECK(view.text(Style::ERROR).find("worker binary missing") != std::string::npos);
}

TEST(soft_restart_when_idle_issues_reset) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.init(true);

    press(s, Key::CTRL_D);
    CHECK(view.text(Style::NOTICE).find("soft reboot") != std::string::npos);
    CHECK_EQ(ch.sent.size(), static_cast<size_t>(1));
    CHECK(ch.sent[0].type == RequestType::RESET);
    CHECK(s.state() == SessionState::IDLE);
    ch.reply(ch.sent[0].id, true, "");
    CHECK_EQ(s.pending(), static_cast<size_t>(0));
}

TEST(soft_restart_clears_loopback_globals) {
    LoopbackChannel ch(loopback_config());
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.start();
    pump(ch);

    s.submit("secret = 1");
    pump(ch);
    s.soft_restart();
    pump(ch);
    s.submit("secret");
    pump(ch);
    CHECK(view.text(Style::ERROR).find("NameError") != std::string::npos);
}

// ============================================================================
// Paste mode
// ============================================================================

TEST(paste_mode_sends_file_mode_unit) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.init(true);

    press(s, Key::CTRL_E);
    CHECK(s.paste_mode());
    CHECK_EQ(s.prompt(), std::string("=== "));
    enter(s, "a = 1");
    enter(s, "if a:");
    enter(s, "    print(a)");
    CHECK(ch.sent.empty());
    press(s, Key::CTRL_D);

    CHECK(!s.paste_mode());
    CHECK_EQ(ch.sent.size(), static_cast<size_t>(1));
    CHECK_EQ(ch.sent[0].payload["mode"].as_string(), std::string("file"));
    CHECK_EQ(ch.sent[0].payload["code"].as_string(), std::string("a = 1\nif a:\n    print(a)\n"));
    CHECK(s.state() == SessionState::EXECUTING);
}

TEST(paste_mode_cancel) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.init(true);

    press(s, Key::CTRL_E);
    enter(s, "print(1)");
    press(s, Key::CTRL_C);
    CHECK(!s.paste_mode());
    CHECK(ch.sent.empty());
    CHECK(view.text(Style::NOTICE).find("^C") == std::string::npos);
    CHECK_EQ(s.prompt(), std::string("mu> "));
}

TEST(empty_paste_sends_nothing) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.init(true);
    s.enter_paste_mode();
    s.finish_paste();
    CHECK(ch.sent.empty());
    CHECK(s.state() == SessionState::IDLE);
}

// ============================================================================
// History, editing and completion
// ============================================================================

TEST(history_is_capped_and_deduplicated) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.init(true);

    for (int i = 0; i < 105; ++i) s.submit("mu cmd" + std::to_string(i));
    CHECK_EQ(s.history().size(), static_cast<size_t>(100));
    CHECK_EQ(s.history().front(), std::string("mu cmd5"));
    CHECK_EQ(s.history().back(), std::string("mu cmd104"));

    s.submit("mu cmd104");
    CHECK_EQ(s.history().size(), static_cast<size_t>(100));
    CHECK(ch.sent.empty());
}

TEST(history_navigation_keeps_draft) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.init(true);

    enter(s, "mu one");
    enter(s, "mu two");
    type(s, "dr");
    press(s, Key::UP);
    CHECK_EQ(s.line(), std::string("mu two"));
    press(s, Key::UP);
    CHECK_EQ(s.line(), std::string("mu one"));
    press(s, Key::UP);
    CHECK_EQ(s.line(), std::string("mu one"));
    press(s, Key::DOWN);
    CHECK_EQ(s.line(), std::string("mu two"));
    press(s, Key::DOWN);
    CHECK_EQ(s.line(), std::string("dr"));
    CHECK_EQ(s.cursor(), static_cast<size_t>(2));
}

TEST(line_editing_keys) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.init(true);

    type(s, "ac");
    press(s, Key::LEFT);
    type(s, "b");
    CHECK_EQ(s.line(), std::string("abc"));
    CHECK_EQ(s.cursor(), static_cast<size_t>(2));
    press(s, Key::RIGHT);
    press(s, Key::BACKSPACE);
    CHECK_EQ(s.line(), std::string("ab"));
    CHECK_EQ(view.line, std::string("ab"));
}

TEST(tab_cycles_completions) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.init(true);

    type(s, "ra");
    press(s, Key::TAB);
    CHECK_EQ(s.line(), std::string("raise"));
    press(s, Key::TAB);
    CHECK_EQ(s.line(), std::string("range"));
    press(s, Key::TAB);
    CHECK_EQ(s.line(), std::string("raise"));
    // typing ends the cycle
    type(s, "(");
    CHECK_EQ(s.line(), std::string("raise("));
}

// ============================================================================
// "mu" commands through the session
// ============================================================================

TEST(cli_local_and_invalid) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    SessionConfig cfg;
    cfg.which_text = "in-process worker";
    Session s(DirectTransport{&ch}, view, cfg);
    ch.init(true);

    s.submit("mu which");
    CHECK(view.text(Style::OUTPUT).find("in-process worker") != std::string::npos);
    s.submit("mu explode");
    CHECK(view.text(Style::ERROR).find("Unknown command: mu explode") != std::string::npos);
    CHECK(ch.sent.empty());
    CHECK(s.state() == SessionState::IDLE);
}

TEST(cli_hardware_commands_via_loopback) {
    LoopbackChannel ch(loopback_config());
    RecordingView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    ch.start();
    pump(ch);

    s.submit("mu pin 3 1 output");
    pump(ch);
    CHECK(view.text(Style::OUTPUT).find("1 change(s) applied") != std::string::npos);
    CHECK(ch.worker().hardware().pin(3)->value);

    s.submit("mu hw pins");
    pump(ch);
    CHECK(view.text(Style::OUTPUT).find("pins:") != std::string::npos);
    CHECK(s.state() == SessionState::IDLE);
}

// ============================================================================
// Disposal
// ============================================================================

TEST(disposal_drops_pending_without_running) {
    ScriptedChannel ch;
    ch.start();
    RecordingView view;
    std::string id;
    {
        Session s(DirectTransport{&ch}, view, SessionConfig{});
        ch.init(true);
        s.submit("1");
        id = ch.sent.back().id;
        CHECK_EQ(s.pending(), static_cast<size_t>(1));
    }
    size_t writes = view.writes.size();
    ch.reply(id, true, "after\n");
    ch.break_pipe("gone");
    CHECK_EQ(view.writes.size(), writes);
}

// ============================================================================
// Main Test Runner
// ============================================================================

int main() {
    std::cout << "=== Session Tests ===\n\n";

    RUN_TEST(awaits_runtime_until_init);
    RUN_TEST(device_repl_prompt);
    RUN_TEST(init_failure_reported_once);

    RUN_TEST(submit_moves_to_executing_and_back);
    RUN_TEST(loopback_round_trip);
    RUN_TEST(execution_error_is_rendered);
    RUN_TEST(compound_statement_collected_before_send);
    RUN_TEST(send_failure_returns_to_idle);
    RUN_TEST(malformed_reply_is_ignored);

    RUN_TEST(interrupt_discards_late_response);
    RUN_TEST(loopback_interrupt_then_new_command);
    RUN_TEST(ctrl_c_clears_line_when_idle);

    RUN_TEST(sweep_times_out_inflight_command);
    RUN_TEST(tick_sweeps_on_interval);

    RUN_TEST(fault_enters_error_and_ctrl_d_restarts);
    RUN_TEST(ctrl_c_keeps_error_until_restart);
    RUN_TEST(failed_restart_stays_in_error);
    RUN_TEST(soft_restart_when_idle_issues_reset);
    RUN_TEST(soft_restart_clears_loopback_globals);

    RUN_TEST(paste_mode_sends_file_mode_unit);
    RUN_TEST(paste_mode_cancel);
    RUN_TEST(empty_paste_sends_nothing);

    RUN_TEST(history_is_capped_and_deduplicated);
    RUN_TEST(history_navigation_keeps_draft);
    RUN_TEST(line_editing_keys);
    RUN_TEST(tab_cycles_completions);

    RUN_TEST(cli_local_and_invalid);
    RUN_TEST(cli_hardware_commands_via_loopback);

    RUN_TEST(disposal_drops_pending_without_running);

    return test_summary();
}
