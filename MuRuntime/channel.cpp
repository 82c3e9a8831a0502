#include "MuRuntime.h"

namespace MuRuntime {

// ============================================================================
// Channel - shared dispatch
// ============================================================================

void Channel::dispatch_line(const std::string& line, bool verbose, const char* tag) {
    if (verbose) {
        std::cerr << "[" << tag << "] Received: " << line << "\n";
    }

    std::string error;
    auto resp = ProtocolParser::parse_response(line, &error);
    if (!resp) {
        protocol_errors_++;
        last_error_ = "Failed to parse message: " + error;
        if (verbose) {
            std::cerr << "[" << tag << "] " << last_error_ << "\n";
        }
        if (handlers_.on_protocol_error) handlers_.on_protocol_error(line);
        return;
    }

    if (resp->id == "init") {
        if (handlers_.on_init) handlers_.on_init(*resp);
        return;
    }
    if (handlers_.on_response) handlers_.on_response(*resp);
}

void Channel::fault(const std::string& reason) {
    last_error_ = reason;
    if (handlers_.on_fault) handlers_.on_fault(reason);
}

// ============================================================================
// ProcessChannel::Impl
// ============================================================================

class ProcessChannel::Impl {
public:
    Impl(ProcessChannel& owner, const ProcessChannelConfig& config)
        : owner_(owner)
        , config_(config)
        , restart_count_(0)
    {
        make_process();
    }

    bool start() {
        if (process_->is_running()) {
            owner_.last_error_ = "Channel already running";
            return false;
        }
        read_buffer_.clear();
        if (!process_->start()) {
            owner_.last_error_ = process_->get_last_error();
            return false;
        }
        if (config_.verbose) {
            std::cerr << "[ProcessChannel] Started successfully\n";
        }
        return true;
    }

    void stop() {
        if (config_.verbose && process_->is_running()) {
            std::cerr << "[ProcessChannel] Stopping...\n";
        }
        process_->stop();
        read_buffer_.clear();
    }

    bool restart() {
        if (config_.verbose) {
            std::cerr << "[ProcessChannel] Restarting (attempt " << (restart_count_ + 1) << ")\n";
        }

        stop();

        if (restart_count_ >= config_.max_restarts) {
            owner_.last_error_ = "Maximum restart attempts exceeded";
            return false;
        }

        restart_count_++;
        return start();
    }

    bool send(const Request& req) {
        if (!process_->is_running()) {
            owner_.last_error_ = "Channel not running";
            return false;
        }

        std::string json = ProtocolParser::serialize_request(req);
        json += '\n';

        if (config_.verbose) {
            std::cerr << "[ProcessChannel] Sending: " << json;
        }

        if (!process_->write_all(json)) {
            owner_.fault(process_->get_last_error());
            return false;
        }
        return true;
    }

    int poll_messages(int timeout_ms) {
        if (!process_->is_running()) {
            owner_.last_error_ = "Channel not running";
            return -1;
        }

        int n = process_->poll_read(read_buffer_, timeout_ms);
        if (n < 0) {
            // Worker exited or the pipe broke
            std::string reason = process_->get_last_error();
            process_->stop();
            if (config_.auto_restart && restart()) {
                if (config_.verbose) {
                    std::cerr << "[ProcessChannel] Worker restarted after: " << reason << "\n";
                }
                return 0;
            }
            owner_.fault(reason);
            return -1;
        }
        if (n == 0) return 0;

        int message_count = 0;
        size_t pos;
        while ((pos = read_buffer_.find('\n')) != std::string::npos) {
            std::string line = read_buffer_.substr(0, pos);
            read_buffer_.erase(0, pos + 1);
            if (line.empty()) continue;
            owner_.dispatch_line(line, config_.verbose, "ProcessChannel");
            message_count++;
        }
        return message_count;
    }

    ProcessChannel& owner_;
    ProcessChannelConfig config_;
    std::unique_ptr<Subprocess> process_;
    int restart_count_;
    std::string read_buffer_;

private:
    void make_process() {
        SubprocessConfig sc;
        sc.executable = config_.worker_executable;
        sc.args = config_.worker_args;
        sc.verbose = config_.verbose;
        sc.log_tag = "ProcessChannel";
        process_ = std::make_unique<Subprocess>(sc);
    }
};

// ============================================================================
// ProcessChannel - Public API
// ============================================================================

ProcessChannel::ProcessChannel(const ProcessChannelConfig& config)
    : impl_(std::make_unique<Impl>(*this, config)) {}

ProcessChannel::~ProcessChannel() {
    impl_->stop();
}

bool ProcessChannel::start() {
    return impl_->start();
}

void ProcessChannel::stop() {
    impl_->stop();
}

bool ProcessChannel::is_running() const {
    return impl_->process_->is_running();
}

bool ProcessChannel::restart() {
    return impl_->restart();
}

bool ProcessChannel::send(const Request& req) {
    return impl_->send(req);
}

int ProcessChannel::poll_messages(int timeout_ms) {
    return impl_->poll_messages(timeout_ms);
}

int ProcessChannel::wait_fd() const {
    return impl_->process_->output_fd();
}

int ProcessChannel::get_restart_count() const {
    return impl_->restart_count_;
}

int ProcessChannel::get_process_id() const {
    return static_cast<int>(impl_->process_->process_id());
}

// ============================================================================
// LoopbackChannel
// ============================================================================

LoopbackChannel::LoopbackChannel(const WorkerConfig& config, std::unique_ptr<SimulationStrategy> simulation)
    : config_(config)
    , worker_(std::make_unique<RuntimeWorker>(config, std::move(simulation)))
    , running_(false)
    , init_pending_(false)
{}

LoopbackChannel::~LoopbackChannel() {
    stop();
}

bool LoopbackChannel::start() {
    if (running_) {
        last_error_ = "Channel already running";
        return false;
    }
    running_ = true;
    init_pending_ = true;
    if (config_.verbose) {
        std::cerr << "[LoopbackChannel] Started in-process worker\n";
    }
    return true;
}

void LoopbackChannel::stop() {
    if (!running_) return;
    worker_->shutdown();
    queue_.clear();
    running_ = false;
    init_pending_ = false;
}

bool LoopbackChannel::is_running() const {
    return running_;
}

bool LoopbackChannel::restart() {
    stop();
    worker_->hardware().reset_defaults();
    return start();
}

bool LoopbackChannel::send(const Request& req) {
    if (!running_) {
        last_error_ = "Channel not running";
        return false;
    }
    std::string json = ProtocolParser::serialize_request(req);
    if (config_.verbose) {
        std::cerr << "[LoopbackChannel] Sending: " << json << "\n";
    }
    queue_.push_back(json);
    return true;
}

int LoopbackChannel::poll_messages(int) {
    if (!running_) {
        last_error_ = "Channel not running";
        return -1;
    }

    if (init_pending_) {
        init_pending_ = false;
        Response init = worker_->initialize();
        dispatch_line(ProtocolParser::serialize_response(init), config_.verbose, "LoopbackChannel");
        return 1;
    }

    if (queue_.empty()) return 0;

    std::string line = queue_.front();
    queue_.pop_front();
    auto reply = worker_->handle_line(line);
    if (!reply) return 0;
    dispatch_line(*reply, config_.verbose, "LoopbackChannel");
    return 1;
}

} // namespace MuRuntime
