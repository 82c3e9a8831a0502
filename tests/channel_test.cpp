#include "MuRuntime.h"
#include "test_support.h"

using namespace MuRuntime;

namespace {

std::string g_worker_path;

// Handler sink shared by the process tests
struct Inbox {
    std::vector<Response> inits;
    std::vector<Response> responses;
    std::vector<std::string> faults;

    ChannelHandlers handlers() {
        ChannelHandlers h;
        h.on_init = [this](const Response& r) { inits.push_back(r); };
        h.on_response = [this](const Response& r) { responses.push_back(r); };
        h.on_fault = [this](const std::string& reason) { faults.push_back(reason); };
        return h;
    }
};

template <typename Pred>
bool poll_until(Channel& ch, Pred done, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        if (ch.poll_messages(50) < 0 && !done()) return done();
    }
    return true;
}

ProcessChannelConfig worker_config(std::vector<std::string> args = {"--heap-kb", "64"}) {
    ProcessChannelConfig c;
    c.worker_executable = g_worker_path;
    c.worker_args = std::move(args);
    return c;
}

Request execute(const std::string& id, const std::string& code) {
    Request req;
    req.id = id;
    req.type = RequestType::EXECUTE;
    ExecutePayload p;
    p.code = code;
    req.payload = p.to_json();
    req.timestamp = now_epoch_ms();
    return req;
}

} // namespace

// ============================================================================
// ProcessChannel
// ============================================================================

TEST(worker_sends_init_then_answers) {
    ProcessChannel ch(worker_config());
    Inbox inbox;
    ch.set_handlers(inbox.handlers());
    CHECK(ch.start());
    CHECK(ch.is_running());
    CHECK(ch.wait_fd() >= 0);

    CHECK(poll_until(ch, [&] { return !inbox.inits.empty(); }));
    CHECK(inbox.inits[0].success);

    CHECK(ch.send(execute("e1", "6*7")));
    CHECK(ch.send(execute("e2", "print('done')")));
    CHECK(poll_until(ch, [&] { return inbox.responses.size() == 2; }));
    CHECK_EQ(inbox.responses[0].id, std::string("e1"));
    CHECK_EQ((*inbox.responses[0].result)["output"].as_string(), std::string("42\n"));
    CHECK_EQ(inbox.responses[1].id, std::string("e2"));
    CHECK(inbox.faults.empty());
    ch.stop();
    CHECK(!ch.is_running());
}

TEST(worker_reports_init_failure) {
    ProcessChannel ch(worker_config({"--heap-kb", "1"}));
    Inbox inbox;
    ch.set_handlers(inbox.handlers());
    CHECK(ch.start());
    CHECK(poll_until(ch, [&] { return !inbox.inits.empty(); }));
    CHECK(!inbox.inits[0].success);
    CHECK(inbox.inits[0].error->find("Failed to initialize runtime") == 0);

    CHECK(ch.send(execute("e1", "1")));
    CHECK(poll_until(ch, [&] { return !inbox.responses.empty(); }));
    CHECK(!inbox.responses[0].success);
    CHECK_EQ(*inbox.responses[0].error, std::string("runtime not initialized"));
}

TEST(send_after_stop_fails) {
    ProcessChannel ch(worker_config());
    CHECK(ch.start());
    ch.stop();
    CHECK(!ch.send(execute("x", "1")));
    CHECK_EQ(ch.get_last_error(), std::string("Channel not running"));
    CHECK_EQ(ch.poll_messages(0), -1);
}

TEST(killed_worker_raises_fault) {
    ProcessChannel ch(worker_config());
    Inbox inbox;
    ch.set_handlers(inbox.handlers());
    CHECK(ch.start());
    CHECK(poll_until(ch, [&] { return !inbox.inits.empty(); }));

    kill(ch.get_process_id(), SIGKILL);
    CHECK(poll_until(ch, [&] { return !inbox.faults.empty(); }));
    CHECK(!ch.is_running());
}

TEST(auto_restart_brings_worker_back) {
    auto cfg = worker_config();
    cfg.auto_restart = true;
    ProcessChannel ch(cfg);
    Inbox inbox;
    ch.set_handlers(inbox.handlers());
    CHECK(ch.start());
    CHECK(poll_until(ch, [&] { return inbox.inits.size() == 1; }));
    int first_pid = ch.get_process_id();

    kill(first_pid, SIGKILL);
    CHECK(poll_until(ch, [&] { return inbox.inits.size() == 2; }));
    CHECK_EQ(ch.get_restart_count(), 1);
    CHECK(ch.get_process_id() != first_pid);
    CHECK(inbox.faults.empty());
}

TEST(restart_limit) {
    auto cfg = worker_config();
    cfg.max_restarts = 1;
    ProcessChannel ch(cfg);
    CHECK(ch.start());
    CHECK(ch.restart());
    CHECK(ch.is_running());
    CHECK(!ch.restart());
    CHECK_EQ(ch.get_last_error(), std::string("Maximum restart attempts exceeded"));
}

TEST(missing_executable_faults) {
    ProcessChannelConfig cfg;
    cfg.worker_executable = "/nonexistent/muruntime-worker";
    ProcessChannel ch(cfg);
    Inbox inbox;
    ch.set_handlers(inbox.handlers());
    CHECK(ch.start());
    CHECK(poll_until(ch, [&] { return !inbox.faults.empty(); }));
    CHECK(inbox.inits.empty());
}

// ============================================================================
// Session over a real worker
// ============================================================================

namespace {

class TextView : public SessionView {
public:
    void write(const std::string& text, Style) override { out += text; }
    void render_prompt(const std::string& p, const std::string&, size_t) override { prompt = p; }
    void render_progress(int, const std::string&) override {}

    std::string out;
    std::string prompt;
};

} // namespace

TEST(session_over_process_worker) {
    ProcessChannel ch(worker_config());
    TextView view;
    Session s(DirectTransport{&ch}, view, SessionConfig{});
    CHECK(ch.start());
    CHECK(poll_until(ch, [&] { return s.state() == SessionState::IDLE; }));

    CHECK(s.submit("sum([1, 2, 3])"));
    CHECK(poll_until(ch, [&] { return s.state() == SessionState::IDLE; }));
    CHECK(view.out.find("6\n") != std::string::npos);

    kill(ch.get_process_id(), SIGKILL);
    CHECK(poll_until(ch, [&] { return s.state() == SessionState::ERROR; }));
    CHECK_EQ(view.prompt, std::string("!!! "));

    s.soft_restart();
    CHECK(s.state() == SessionState::IDLE);
    CHECK(ch.is_running());
    CHECK(s.submit("'back'"));
    CHECK(poll_until(ch, [&] { return s.state() == SessionState::IDLE; }));
    CHECK(view.out.find("'back'\n") != std::string::npos);
}

// ============================================================================
// PassthroughChannel
// ============================================================================

namespace {

bool pump_output(PassthroughChannel& ch, const std::function<bool()>& done, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        if (ch.poll_output(50) < 0) return done();
    }
    return true;
}

} // namespace

TEST(passthrough_echoes_keys) {
    PassthroughChannel ch("cat");
    std::string output;
    PassthroughHandlers h;
    h.on_output = [&](const std::string& s) { output += s; };
    ch.set_handlers(h);
    CHECK(ch.start());
    CHECK_EQ(ch.command(), std::string("cat"));

    CHECK(ch.send_keys("hello\n"));
    ControlSignal sig;
    sig.type = ControlSignalType::PASTE_MODE_ENTER;
    CHECK(ch.send_control(sig));
    CHECK(pump_output(ch, [&] { return output.find('\x05') != std::string::npos; }));
    CHECK(output.find("hello\n") == 0);
}

TEST(passthrough_exit_is_reported) {
    PassthroughChannel ch("echo bye; exit 3");
    std::string output;
    std::string exit_reason;
    PassthroughHandlers h;
    h.on_output = [&](const std::string& s) { output += s; };
    h.on_exit = [&](const std::string& r) { exit_reason = r; };
    ch.set_handlers(h);
    CHECK(ch.start());
    CHECK(pump_output(ch, [&] { return !exit_reason.empty(); }));
    CHECK_EQ(output, std::string("bye\n"));
    CHECK(!ch.is_running());
}

TEST(passthrough_ctrl_d_restarts_after_exit) {
    PassthroughChannel ch("echo up");
    TextView view;
    Session s(PassthroughTransport{&ch}, view, SessionConfig{});
    CHECK(ch.start());
    s.on_runtime_ready(true);

    CHECK(pump_output(ch, [&] { return s.state() == SessionState::ERROR; }));
    CHECK(!ch.is_running());

    // keys other than Ctrl-D are dropped while the program is gone
    s.handle_key(KeyEvent::character('x'));
    CHECK(s.state() == SessionState::ERROR);

    s.handle_key(KeyEvent::of(Key::CTRL_D));
    CHECK(s.state() == SessionState::IDLE);
    CHECK(view.out.find("Runtime restarted") != std::string::npos);
    CHECK(pump_output(ch, [&] { return s.state() == SessionState::ERROR; }));
    size_t first = view.out.find("up\n");
    CHECK(first != std::string::npos);
    CHECK(view.out.find("up\n", first + 1) != std::string::npos);
}

TEST(session_forwards_raw_keys_in_passthrough) {
    PassthroughChannel ch("cat");
    TextView view;
    Session s(PassthroughTransport{&ch}, view, SessionConfig{});
    CHECK(!s.is_direct());
    CHECK(ch.start());
    s.on_runtime_ready(true);
    CHECK(s.state() == SessionState::IDLE);
    CHECK(!s.submit("print(1)"));

    s.handle_key(KeyEvent::character('h'));
    s.handle_key(KeyEvent::character('i'));
    s.handle_key(KeyEvent::of(Key::UP));
    s.handle_key(KeyEvent::of(Key::CTRL_C));
    s.handle_key(KeyEvent::of(Key::ENTER));
    CHECK(pump_output(ch, [&] { return view.out.find('\r') != std::string::npos; }));
    CHECK_EQ(view.out, std::string("hi\x1b[A\x03\r"));
    CHECK(s.line().empty());
    CHECK_EQ(s.pending(), static_cast<size_t>(0));
}

// ============================================================================
// Main Test Runner
// ============================================================================

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: channel_test <path-to-muruntime-worker>\n";
        return 2;
    }
    g_worker_path = argv[1];
    signal(SIGPIPE, SIG_IGN);

    std::cout << "=== Channel Tests ===\n\n";

    RUN_TEST(worker_sends_init_then_answers);
    RUN_TEST(worker_reports_init_failure);
    RUN_TEST(send_after_stop_fails);
    RUN_TEST(killed_worker_raises_fault);
    RUN_TEST(auto_restart_brings_worker_back);
    RUN_TEST(restart_limit);
    RUN_TEST(missing_executable_faults);
    RUN_TEST(session_over_process_worker);

    RUN_TEST(passthrough_echoes_keys);
    RUN_TEST(passthrough_exit_is_reported);
    RUN_TEST(passthrough_ctrl_d_restarts_after_exit);
    RUN_TEST(session_forwards_raw_keys_in_passthrough);

    return test_summary();
}
