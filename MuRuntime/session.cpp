#include "MuRuntime.h"

namespace MuRuntime {

const char* session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::AWAITING_RUNTIME: return "awaiting_runtime";
        case SessionState::IDLE: return "idle";
        case SessionState::EXECUTING: return "executing";
        case SessionState::ERROR: return "error";
    }
    return "unknown";
}

namespace {

bool blank(const std::string& s) {
    return s.find_first_not_of(" \t\r") == std::string::npos;
}

std::string with_newline(const std::string& s) {
    if (s.empty() || s.back() == '\n') return s;
    return s + "\n";
}

} // namespace

// ============================================================================
// Construction / disposal
// ============================================================================

Session::Session(Transport transport, SessionView& view, const SessionConfig& config)
    : transport_(transport)
    , view_(view)
    , config_(config)
    , state_(SessionState::AWAITING_RUNTIME)
    , pending_(config.timeout)
    , last_sweep_(Clock::now())
    , cursor_(0)
    , paste_mode_(false)
    , history_index_(-1)
    , completion_(std::make_unique<ModuleCompletionProvider>())
    , init_error_reported_(false)
{
    cycle_ = std::make_unique<CompletionCycle>(*completion_);
    install_handlers();
    view_.render_progress(0, "Awaiting runtime...");
}

Session::~Session() {
    if (auto* direct = std::get_if<DirectTransport>(&transport_)) {
        if (direct->channel) direct->channel->set_handlers(ChannelHandlers{});
    } else if (auto* pass = std::get_if<PassthroughTransport>(&transport_)) {
        if (pass->channel) pass->channel->set_handlers(PassthroughHandlers{});
    }
    // Continuations capture this session; drop them without running
    size_t dropped = pending_.size();
    if (dropped > 0 && config_.verbose) {
        std::cerr << "[Session] Disposing with " << dropped << " pending command(s)\n";
    }
    PendingTable discard;
    std::swap(pending_, discard);
}

void Session::install_handlers() {
    if (auto* direct = std::get_if<DirectTransport>(&transport_)) {
        if (!direct->channel) return;
        ChannelHandlers h;
        h.on_init = [this](const Response& r) { on_channel_init(r); };
        h.on_response = [this](const Response& r) { on_channel_response(r); };
        h.on_fault = [this](const std::string& reason) { on_channel_fault(reason); };
        h.on_protocol_error = [this](const std::string& line) {
            if (config_.verbose) std::cerr << "[Session] ProtocolError: dropped line " << line << "\n";
        };
        direct->channel->set_handlers(h);
    } else if (auto* pass = std::get_if<PassthroughTransport>(&transport_)) {
        if (!pass->channel) return;
        PassthroughHandlers h;
        h.on_output = [this](const std::string& data) { view_.write(data, Style::NORMAL); };
        h.on_exit = [this](const std::string& reason) { on_channel_fault(reason); };
        pass->channel->set_handlers(h);
    }
}

void Session::set_completion_provider(std::unique_ptr<CompletionProvider> provider) {
    if (!provider) return;
    completion_ = std::move(provider);
    cycle_ = std::make_unique<CompletionCycle>(*completion_);
}

// ============================================================================
// Readiness
// ============================================================================

void Session::on_progress(int percent, const std::string& message) {
    if (state_ != SessionState::AWAITING_RUNTIME) return;
    view_.render_progress(std::max(0, std::min(100, percent)), message);
}

void Session::on_runtime_ready(bool ready) {
    if (!ready) {
        if (config_.verbose) std::cerr << "[Session] Runtime reported not ready\n";
        return;
    }
    if (state_ != SessionState::AWAITING_RUNTIME) return;

    view_.render_progress(100, "Runtime ready");
    state_ = SessionState::IDLE;
    if (is_direct()) {
        view_.write("MuRuntime " MURUNTIME_VERSION " - type 'mu help' for commands\n", Style::META);
    }
    redraw();
}

void Session::on_channel_init(const Response& resp) {
    if (resp.success) {
        on_runtime_ready(true);
        return;
    }
    if (!init_error_reported_) {
        init_error_reported_ = true;
        view_.write(std::string(error_kind_to_string(ErrorKind::INITIALIZATION)) + ": " +
                    resp.error.value_or("runtime failed to start") + "\n", Style::ERROR);
    }
    // Worker stays up; its commands fail fast
    on_runtime_ready(true);
}

void Session::on_channel_response(const Response& resp) {
    if (!pending_.deliver(resp)) {
        if (config_.verbose) {
            std::cerr << "[Session] Ignoring response with unknown id " << resp.id << "\n";
        }
    }
}

void Session::on_channel_fault(const std::string& reason) {
    if (config_.verbose) std::cerr << "[Session] Channel fault: " << reason << "\n";
    pending_.reject_all(ErrorKind::PROTOCOL, "channel closed: " + reason);
    inflight_id_.clear();
    state_ = SessionState::ERROR;
    view_.write("\nRuntime connection lost: " + reason + "\nPress Ctrl-D to restart.\n", Style::ERROR);
    redraw();
}

// ============================================================================
// Requests
// ============================================================================

std::optional<std::string> Session::issue(RequestType type, Json payload, Continuation continuation) {
    auto* direct = std::get_if<DirectTransport>(&transport_);
    if (!direct || !direct->channel) return std::nullopt;

    Request req;
    req.id = ids_.next();
    req.type = type;
    req.payload = std::move(payload);
    req.timestamp = now_epoch_ms();

    if (!pending_.add(req.id, command_kind_for(type), continuation)) {
        CommandError err;
        err.kind = ErrorKind::PROTOCOL;
        err.message = "duplicate correlation id " + req.id;
        if (continuation.reject) continuation.reject(err);
        return std::nullopt;
    }

    if (!direct->channel->send(req)) {
        std::string reason = direct->channel->get_last_error();
        CommandError err;
        err.kind = ErrorKind::PROTOCOL;
        err.message = "send failed: " + reason;
        // Fail the entry we just registered without touching the others
        Response synthetic;
        synthetic.id = req.id;
        synthetic.success = false;
        synthetic.error = err.message;
        pending_.deliver(synthetic);
        return std::nullopt;
    }

    if (config_.verbose) {
        std::cerr << "[Session] Issued " << request_type_to_string(type) << " " << req.id << "\n";
    }
    return req.id;
}

bool Session::submit(const std::string& raw) {
    if (state_ != SessionState::IDLE) return false;
    if (!is_direct()) return false;

    std::string line = raw;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();

    // Multi-line compound statement collection
    if (!block_.empty()) {
        bool open = false;
        if (blank(line)) {
            Py::needs_more_input(block_, &open);
            if (open) {
                block_ += "\n";
                redraw();
                return true;
            }
        } else {
            push_history(line);
            block_ += line + "\n";
            if (Py::needs_more_input(block_, &open)) {
                redraw();
                return true;
            }
        }
        std::string code = block_;
        block_.clear();
        while (!code.empty() && code.back() == '\n') code.pop_back();
        dispatch_repl(code, ExecMode::REPL);
        return true;
    }

    if (blank(line)) {
        redraw();
        return false;
    }

    push_history(line);

    if (is_cli_line(line)) {
        dispatch_cli(line);
        return true;
    }

    if (Py::needs_more_input(line)) {
        block_ = line + "\n";
        redraw();
        return true;
    }

    dispatch_repl(line, ExecMode::REPL);
    return true;
}

void Session::dispatch_repl(const std::string& code, ExecMode mode) {
    ExecutePayload p;
    p.code = code;
    p.mode = mode;
    p.enable_hardware_monitoring = true;

    Continuation cont;
    cont.resolve = [this](const Response& r) {
        render_execute(r);
        finish_command(r.id);
    };
    auto id_holder = std::make_shared<std::string>();
    cont.reject = [this, id_holder](const CommandError& e) {
        render_failure(e);
        finish_command(*id_holder);
    };

    state_ = SessionState::EXECUTING;
    redraw();
    auto id = issue(RequestType::EXECUTE, p.to_json(), cont);
    if (id) {
        *id_holder = *id;
        inflight_id_ = *id;
    } else {
        if (state_ == SessionState::EXECUTING) state_ = SessionState::IDLE;
        redraw();
    }
}

void Session::dispatch_cli(const std::string& line) {
    auto cmd = parse_cli_line(line);
    if (!cmd) return;

    CliAction action = plan_cli_command(*cmd, config_.which_text);
    switch (action.kind) {
        case CliActionKind::LOCAL:
            view_.write(action.text, Style::OUTPUT);
            redraw();
            return;
        case CliActionKind::INVALID:
            view_.write(action.text + "\n", Style::ERROR);
            redraw();
            return;
        case CliActionKind::REQUEST:
            break;
    }

    CliCommand command = *cmd;
    Continuation cont;
    cont.resolve = [this, command](const Response& r) {
        view_.write(render_cli_result(command, r), Style::OUTPUT);
        finish_command(r.id);
    };
    auto id_holder = std::make_shared<std::string>();
    cont.reject = [this, id_holder](const CommandError& e) {
        render_failure(e);
        finish_command(*id_holder);
    };

    state_ = SessionState::EXECUTING;
    redraw();
    auto id = issue(action.request, action.payload, cont);
    if (id) {
        *id_holder = *id;
        inflight_id_ = *id;
    } else {
        if (state_ == SessionState::EXECUTING) state_ = SessionState::IDLE;
        redraw();
    }
}

void Session::finish_command(const std::string& id) {
    // Only the in-flight command moves the state machine
    if (id.empty() || id != inflight_id_) return;
    inflight_id_.clear();
    if (state_ == SessionState::EXECUTING) state_ = SessionState::IDLE;
    redraw();
}

void Session::render_execute(const Response& resp) {
    if (!resp.result) return;
    std::string output = (*resp.result)["output"].as_string();
    if (!output.empty()) view_.write(with_newline(output), Style::OUTPUT);
}

void Session::render_failure(const CommandError& err) {
    if (err.kind == ErrorKind::INTERRUPTED) return;

    if (err.response && err.response->result) {
        std::string output = (*err.response->result)["output"].as_string();
        if (!output.empty()) view_.write(with_newline(output), Style::OUTPUT);
    }
    if (err.kind == ErrorKind::EXECUTION) {
        view_.write(with_newline(err.message), Style::ERROR);
    } else {
        view_.write(std::string(error_kind_to_string(err.kind)) + ": " + err.message + "\n", Style::ERROR);
    }
}

// ============================================================================
// Control signals
// ============================================================================

void Session::send_control(ControlSignalType type) {
    ControlSignal sig;
    sig.type = type;
    sig.id = ids_.next();
    sig.timestamp = now_epoch_ms();

    if (auto* pass = std::get_if<PassthroughTransport>(&transport_)) {
        if (pass->channel) pass->channel->send_control(sig);
        return;
    }
    if (config_.verbose) {
        std::cerr << "[Session] Control " << ProtocolParser::serialize_control(sig) << "\n";
    }
}

void Session::interrupt() {
    send_control(ControlSignalType::INTERRUPT);
    if (!is_direct()) return;

    view_.write("^C\n", Style::NOTICE);
    size_t n = pending_.reject_all(ErrorKind::INTERRUPTED, "interrupted by user");
    if (config_.verbose && n > 0) {
        std::cerr << "[Session] Interrupt cleared " << n << " pending command(s)\n";
    }
    inflight_id_.clear();
    line_.clear();
    cursor_ = 0;
    block_.clear();
    cycle_->reset();
    // A dead channel stays in ERROR until an explicit restart
    if (state_ == SessionState::EXECUTING) state_ = SessionState::IDLE;
    redraw();
}

void Session::soft_restart() {
    if (auto* pass = std::get_if<PassthroughTransport>(&transport_)) {
        if (state_ != SessionState::ERROR) {
            send_control(ControlSignalType::SOFT_RESTART);
            return;
        }
        if (!pass->channel || !pass->channel->restart()) {
            std::string reason = pass->channel ? pass->channel->get_last_error() : "no channel";
            view_.write("Restart failed: " + reason + "\n", Style::ERROR);
            redraw();
            return;
        }
        view_.write("Runtime restarted\n", Style::SUCCESS);
        state_ = SessionState::IDLE;
        redraw();
        return;
    }
    send_control(ControlSignalType::SOFT_RESTART);

    view_.write("soft reboot\n", Style::NOTICE);
    pending_.reject_all(ErrorKind::INTERRUPTED, "soft restart");
    inflight_id_.clear();
    line_.clear();
    cursor_ = 0;
    block_.clear();

    auto& direct = std::get<DirectTransport>(transport_);
    if (state_ == SessionState::ERROR) {
        if (!direct.channel || !direct.channel->restart()) {
            std::string reason = direct.channel ? direct.channel->get_last_error() : "no channel";
            view_.write("Restart failed: " + reason + "\n", Style::ERROR);
            redraw();
            return;
        }
        view_.write("Runtime restarted\n", Style::SUCCESS);
        state_ = SessionState::IDLE;
        redraw();
        return;
    }

    Continuation cont;
    cont.resolve = [this](const Response&) {
        view_.write("runtime reset\n", Style::META);
        redraw();
    };
    cont.reject = [this](const CommandError& e) {
        render_failure(e);
        redraw();
    };
    issue(RequestType::RESET, Json::object(), cont);

    if (state_ != SessionState::AWAITING_RUNTIME) state_ = SessionState::IDLE;
    redraw();
}

void Session::enter_paste_mode() {
    send_control(ControlSignalType::PASTE_MODE_ENTER);
    if (!is_direct() || paste_mode_) return;

    paste_mode_ = true;
    paste_lines_.clear();
    if (!line_.empty()) {
        paste_lines_.push_back(line_);
        line_.clear();
        cursor_ = 0;
    }
    view_.write("paste mode; Ctrl-C to cancel, Ctrl-D to finish\n", Style::NOTICE);
    redraw();
}

void Session::finish_paste() {
    if (!paste_mode_) return;
    if (!line_.empty()) paste_lines_.push_back(line_);
    line_.clear();
    cursor_ = 0;
    paste_mode_ = false;

    std::string code;
    for (const auto& l : paste_lines_) code += l + "\n";
    paste_lines_.clear();

    if (blank(code)) {
        redraw();
        return;
    }
    if (state_ != SessionState::IDLE) {
        view_.write("runtime busy; paste discarded\n", Style::ERROR);
        redraw();
        return;
    }
    dispatch_repl(code, ExecMode::FILE);
}

void Session::cancel_paste() {
    if (!paste_mode_) return;
    paste_mode_ = false;
    paste_lines_.clear();
    line_.clear();
    cursor_ = 0;
    view_.write("\n", Style::NORMAL);
    redraw();
}

// ============================================================================
// Periodic sweep
// ============================================================================

void Session::tick(Clock::time_point now) {
    if (now - last_sweep_ < config_.sweep_interval) return;
    last_sweep_ = now;
    sweep(now);
}

size_t Session::sweep(Clock::time_point now) {
    size_t n = pending_.sweep(now);
    if (n > 0 && config_.verbose) {
        std::cerr << "[Session] Sweep timed out " << n << " command(s)\n";
    }
    return n;
}

// ============================================================================
// Keys
// ============================================================================

void Session::handle_key(const KeyEvent& ev) {
    if (is_direct()) {
        handle_direct_key(ev);
    } else {
        handle_passthrough_key(ev);
    }
}

void Session::handle_passthrough_key(const KeyEvent& ev) {
    auto& pass = std::get<PassthroughTransport>(transport_);
    if (!pass.channel) return;
    if (state_ == SessionState::ERROR) {
        if (ev.key == Key::CTRL_D) soft_restart();
        return;
    }

    switch (ev.key) {
        case Key::CHAR:      pass.channel->send_keys(std::string(1, ev.ch)); break;
        case Key::ENTER:     pass.channel->send_keys("\r"); break;
        case Key::BACKSPACE: pass.channel->send_keys("\x7f"); break;
        case Key::TAB:       pass.channel->send_keys("\t"); break;
        case Key::UP:        pass.channel->send_keys("\x1b[A"); break;
        case Key::DOWN:      pass.channel->send_keys("\x1b[B"); break;
        case Key::RIGHT:     pass.channel->send_keys("\x1b[C"); break;
        case Key::LEFT:      pass.channel->send_keys("\x1b[D"); break;
        case Key::CTRL_C:    interrupt(); break;
        case Key::CTRL_D:    soft_restart(); break;
        case Key::CTRL_E:    enter_paste_mode(); break;
    }
}

void Session::handle_direct_key(const KeyEvent& ev) {
    if (ev.key != Key::TAB) cycle_->reset();

    // Control keys bypass the submit path
    if (ev.key == Key::CTRL_C) {
        if (paste_mode_) cancel_paste();
        else interrupt();
        return;
    }
    if (ev.key == Key::CTRL_D) {
        if (paste_mode_) finish_paste();
        else soft_restart();
        return;
    }
    if (ev.key == Key::CTRL_E) {
        enter_paste_mode();
        return;
    }

    switch (ev.key) {
        case Key::CHAR:
            line_.insert(cursor_, 1, ev.ch);
            cursor_++;
            history_index_ = -1;
            break;
        case Key::BACKSPACE:
            if (cursor_ > 0) {
                line_.erase(cursor_ - 1, 1);
                cursor_--;
            }
            break;
        case Key::LEFT:
            if (cursor_ > 0) cursor_--;
            break;
        case Key::RIGHT:
            if (cursor_ < line_.size()) cursor_++;
            break;
        case Key::UP:
            history_step(-1);
            break;
        case Key::DOWN:
            history_step(1);
            break;
        case Key::TAB: {
            size_t new_cursor = cursor_;
            auto rewritten = cycle_->next(line_, cursor_, &new_cursor);
            if (rewritten) {
                line_ = *rewritten;
                cursor_ = new_cursor;
            }
            break;
        }
        case Key::ENTER: {
            if (paste_mode_) {
                paste_lines_.push_back(line_);
                view_.write("=== " + line_ + "\n", Style::NORMAL);
                line_.clear();
                cursor_ = 0;
                break;
            }
            if (state_ != SessionState::IDLE) break;
            std::string submitted = line_;
            view_.write(prompt() + submitted + "\n", Style::NORMAL);
            line_.clear();
            cursor_ = 0;
            history_index_ = -1;
            submit(submitted);
            return;
        }
        default:
            break;
    }
    redraw();
}

// ============================================================================
// History
// ============================================================================

void Session::push_history(const std::string& line) {
    if (blank(line)) return;
    if (!history_.empty() && history_.back() == line) return;
    history_.push_back(line);
    while (history_.size() > config_.history_limit) history_.pop_front();
}

void Session::history_step(int direction) {
    if (history_.empty()) return;

    if (history_index_ < 0) {
        if (direction > 0) return;
        draft_ = line_;
        history_index_ = static_cast<int>(history_.size()) - 1;
    } else {
        int next = history_index_ + direction;
        if (next < 0) return;
        if (next >= static_cast<int>(history_.size())) {
            history_index_ = -1;
            line_ = draft_;
            cursor_ = line_.size();
            return;
        }
        history_index_ = next;
    }
    line_ = history_[static_cast<size_t>(history_index_)];
    cursor_ = line_.size();
}

// ============================================================================
// Prompt
// ============================================================================

std::string Session::prompt() const {
    switch (state_) {
        case SessionState::AWAITING_RUNTIME: return "";
        case SessionState::EXECUTING: return "... ";
        case SessionState::ERROR: return "!!! ";
        case SessionState::IDLE: break;
    }
    if (!is_direct()) return "";
    if (paste_mode_) return "=== ";
    if (!block_.empty()) return "... ";
    return config_.prompt_mode == PromptMode::DEVICE_REPL ? ">>> " : "mu> ";
}

void Session::redraw() {
    if (!is_direct()) return;
    view_.render_prompt(prompt(), line_, cursor_);
}

} // namespace MuRuntime
