#include "MuRuntime.h"

namespace MuRuntime {

namespace {

volatile sig_atomic_t g_stop_requested = 0;

void on_termination_signal(int) {
    g_stop_requested = 1;
}

bool write_all(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

std::string trim_trailing_newlines(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

} // namespace

// ============================================================================
// RuntimeWorker::Impl - Implementation Details
// ============================================================================

class RuntimeWorker::Impl {
public:
    Impl(const WorkerConfig& config, std::unique_ptr<SimulationStrategy> simulation)
        : config_(config)
        , simulation_(simulation ? std::move(simulation) : std::make_unique<HeuristicSimulation>())
        , malformed_(0)
    {
        interp_.set_stdout([this](const std::string& s) { out_ += s; });
        interp_.set_stderr([this](const std::string& s) { err_ += s; });
    }

    ~Impl() {
        shutdown();
    }

    Response initialize() {
        Response resp;
        resp.id = "init";

        if (!interp_.init(config_.heap_bytes)) {
            resp.success = false;
            resp.error = "Failed to initialize runtime: " + interp_.last_error();
            if (config_.verbose) {
                std::cerr << "[RuntimeWorker] " << *resp.error << "\n";
            }
            return resp;
        }

        Json result = Json::object();
        result["status"] = "ready";
        resp.success = true;
        resp.result = result;

        if (config_.verbose) {
            std::cerr << "[RuntimeWorker] Interpreter ready (heap " << config_.heap_bytes << " bytes)\n";
        }
        return resp;
    }

    Response handle_request(const Request& req) {
        auto start = std::chrono::steady_clock::now();
        Response resp;
        resp.id = req.id;

        try {
            Json result;
            switch (req.type) {
                case RequestType::EXECUTE:
                    resp = execute(req);
                    break;
                case RequestType::QUERY:
                    result = query(req.payload);
                    break;
                case RequestType::RESET:
                    result = reset();
                    break;
                case RequestType::CONFIGURE:
                    result = configure(req.payload);
                    break;
                case RequestType::HARDWARE_QUERY:
                    result = hardware_query(req.payload);
                    break;
                case RequestType::HARDWARE_SET:
                    result = hardware_set(req.payload);
                    break;
            }
            if (req.type != RequestType::EXECUTE) {
                resp.success = true;
                resp.result = result;
            }
            if (resp.success) resp.hardware_snapshot = hardware_.snapshot().to_json();
        } catch (const std::exception& e) {
            resp.success = false;
            resp.result.reset();
            resp.error = e.what();
            if (config_.verbose) {
                std::cerr << "[RuntimeWorker] " << request_type_to_string(req.type) << " failed: " << e.what() << "\n";
            }
        }

        resp.id = req.id;
        resp.execution_time_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        return resp;
    }

    std::optional<std::string> handle_line(const std::string& line) {
        std::string error;
        auto doc = Json::parse(line, &error);
        if (!doc || !doc->is_object() || !(*doc)["id"].is_string()) {
            malformed_++;
            if (config_.verbose) {
                std::cerr << "[RuntimeWorker] Dropping malformed envelope: "
                          << (error.empty() ? "missing id" : error) << "\n";
            }
            return std::nullopt;
        }

        std::string type = (*doc)["type"].as_string();
        auto req = ProtocolParser::parse_request(line, &error);
        if (!req) {
            Response resp;
            resp.id = (*doc)["id"].as_string();
            resp.success = false;
            resp.error = "Unknown message type: " + type;
            return ProtocolParser::serialize_response(resp);
        }

        if (config_.verbose) {
            std::cerr << "[RuntimeWorker] Handling " << type << " (" << req->id << ")\n";
        }
        return ProtocolParser::serialize_response(handle_request(*req));
    }

    int serve(int in_fd, int out_fd) {
        Response init = initialize();
        if (!write_all(out_fd, ProtocolParser::serialize_response(init) + "\n")) {
            shutdown();
            return 1;
        }

        std::string buffer;
        while (!g_stop_requested) {
            struct pollfd pfd;
            pfd.fd = in_fd;
            pfd.events = POLLIN;
            pfd.revents = 0;

            int r = poll(&pfd, 1, 200);
            if (r < 0) {
                if (errno == EINTR) continue;
                std::cerr << "[RuntimeWorker] poll() failed: " << strerror(errno) << "\n";
                break;
            }
            if (r == 0) continue;

            char chunk[4096];
            ssize_t n = read(in_fd, chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                std::cerr << "[RuntimeWorker] read() failed: " << strerror(errno) << "\n";
                break;
            }
            if (n == 0) {
                if (config_.verbose) std::cerr << "[RuntimeWorker] Host closed stdin\n";
                break;
            }
            buffer.append(chunk, static_cast<size_t>(n));

            size_t pos;
            bool write_failed = false;
            while ((pos = buffer.find('\n')) != std::string::npos) {
                std::string line = buffer.substr(0, pos);
                buffer.erase(0, pos + 1);
                if (line.empty()) continue;

                auto reply = handle_line(line);
                if (reply && !write_all(out_fd, *reply + "\n")) {
                    write_failed = true;
                    break;
                }
                if (g_stop_requested) break;
            }
            if (write_failed) {
                std::cerr << "[RuntimeWorker] write() failed: " << strerror(errno) << "\n";
                break;
            }
        }

        if (config_.verbose && g_stop_requested) {
            std::cerr << "[RuntimeWorker] Termination signal received, shutting down\n";
        }
        shutdown();
        return 0;
    }

    void shutdown() {
        if (interp_.initialized()) {
            interp_.deinit();
            if (config_.verbose) std::cerr << "[RuntimeWorker] Interpreter deinitialized\n";
        }
    }

    WorkerConfig config_;
    Py::Interpreter interp_;
    HardwareState hardware_;
    std::unique_ptr<SimulationStrategy> simulation_;
    int malformed_;

private:
    Response execute(const Request& req) {
        if (!interp_.initialized()) throw std::runtime_error("runtime not initialized");

        ExecutePayload p = ExecutePayload::from_json(req.payload);
        out_.clear();
        err_.clear();

        if (p.mode == ExecMode::REPL) {
            for (char c : p.code) interp_.repl_process_char(static_cast<unsigned char>(c));
            interp_.repl_process_char('\r');
            // close an open block the way an interactive user would
            if (interp_.repl_in_continuation()) interp_.repl_process_char('\r');
            if (interp_.repl_in_continuation()) {
                interp_.repl_process_char(0x03);
                err_ += "SyntaxError: incomplete input\n";
            }
        } else {
            interp_.exec_str(p.code);
        }

        if (p.enable_hardware_monitoring) {
            hardware_.replace(simulation_->simulate(p.code, hardware_.snapshot()));
        }

        Json result = Json::object();
        result["output"] = out_;
        result["mode"] = exec_mode_to_string(p.mode);

        Response resp;
        resp.result = result;
        if (err_.empty()) {
            resp.success = true;
        } else {
            (*resp.result)["error"] = err_;
            resp.success = false;
            resp.error = trim_trailing_newlines(err_);
        }
        return resp;
    }

    Json query(const Json& payload) {
        std::string type = payload["queryType"].as_string();
        Json result = Json::object();
        if (type == "ready") {
            result["status"] = interp_.initialized() ? "ready" : "not_ready";
        } else if (type == "health") {
            result["status"] = "healthy";
            result["initialized"] = interp_.initialized();
            result["timestamp"] = static_cast<long long>(now_epoch_ms());
        } else {
            throw std::runtime_error("Unknown query type: " + type);
        }
        return result;
    }

    Json reset() {
        if (interp_.initialized()) interp_.repl_init();
        hardware_.reset_defaults();
        Json result = Json::object();
        result["status"] = "reset_complete";
        return result;
    }

    Json configure(const Json& payload) {
        ConfigurePayload c = ConfigurePayload::from_json(payload);
        hardware_.configure(c);

        Json result = Json::object();
        result["status"] = "configured";
        result["boardProfile"] = c.board_id.value_or("default");
        result["sensorCount"] = c.sensors.size();
        result["gpioCount"] = c.gpios.size();
        return result;
    }

    Json hardware_query(const Json& payload) {
        std::string type = payload["queryType"].as_string("full_state");
        Json full = hardware_.snapshot().to_json();
        Json state = Json::object();
        if (type == "full_state") {
            state = full;
        } else if (type == "pins") {
            state["pins"] = full["pins"];
            state["timestamp"] = full["timestamp"];
        } else if (type == "sensors") {
            state["sensors"] = full["sensors"];
            state["timestamp"] = full["timestamp"];
        } else {
            throw std::runtime_error("Unknown hardware query type: " + type);
        }

        Json result = Json::object();
        result["queryType"] = type;
        result["state"] = state;
        return result;
    }

    Json hardware_set(const Json& payload) {
        std::vector<PinUpdate> pins;
        for (const auto& p : payload["pins"].as_array()) {
            PinUpdate u;
            u.pin = static_cast<int>(p["pin"].as_int());
            u.value = p["value"].as_bool();
            if (p["mode"].is_string()) u.mode = pin_mode_from_string(p["mode"].as_string());
            pins.push_back(u);
        }
        std::vector<SensorUpdate> sensors;
        for (const auto& s : payload["sensors"].as_array()) {
            SensorUpdate u;
            u.id = s["id"].as_string();
            u.value = s["value"].as_number();
            sensors.push_back(u);
        }

        Json result = Json::object();
        result["status"] = "updated";
        result["changesApplied"] = hardware_.apply_updates(pins, sensors);
        return result;
    }

    std::string out_;
    std::string err_;
};

// ============================================================================
// RuntimeWorker - Public API
// ============================================================================

RuntimeWorker::RuntimeWorker(const WorkerConfig& config, std::unique_ptr<SimulationStrategy> simulation)
    : impl_(std::make_unique<Impl>(config, std::move(simulation))) {}

RuntimeWorker::~RuntimeWorker() = default;

Response RuntimeWorker::initialize() {
    return impl_->initialize();
}

bool RuntimeWorker::initialized() const {
    return impl_->interp_.initialized();
}

Response RuntimeWorker::handle_request(const Request& req) {
    return impl_->handle_request(req);
}

std::optional<std::string> RuntimeWorker::handle_line(const std::string& line) {
    return impl_->handle_line(line);
}

int RuntimeWorker::serve(int in_fd, int out_fd) {
    return impl_->serve(in_fd, out_fd);
}

void RuntimeWorker::shutdown() {
    impl_->shutdown();
}

HardwareState& RuntimeWorker::hardware() {
    return impl_->hardware_;
}

int RuntimeWorker::malformed_count() const {
    return impl_->malformed_;
}

void RuntimeWorker::install_signal_handlers() {
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_termination_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0; // no SA_RESTART: poll() must return EINTR
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);
}

bool RuntimeWorker::stop_requested() {
    return g_stop_requested != 0;
}

} // namespace MuRuntime
