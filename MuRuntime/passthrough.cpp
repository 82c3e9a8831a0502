#include "MuRuntime.h"

namespace MuRuntime {

namespace {

SubprocessConfig shell_config(const std::string& command, bool verbose) {
    SubprocessConfig sc;
    sc.executable = "/bin/sh";
    sc.args = {"-c", command};
    sc.merge_stderr = true;
    sc.verbose = verbose;
    sc.log_tag = "Passthrough";
    return sc;
}

} // namespace

PassthroughChannel::PassthroughChannel(const std::string& command, bool verbose)
    : command_(command)
    , verbose_(verbose)
    , process_(shell_config(command, verbose))
{}

PassthroughChannel::~PassthroughChannel() {
    stop();
}

bool PassthroughChannel::start() {
    if (!process_.start()) {
        last_error_ = process_.get_last_error();
        return false;
    }
    return true;
}

void PassthroughChannel::stop() {
    process_.stop();
}

bool PassthroughChannel::restart() {
    if (verbose_) std::cerr << "[Passthrough] Restarting: " << command_ << "\n";
    process_.stop();
    return start();
}

bool PassthroughChannel::is_running() const {
    return process_.is_running();
}

bool PassthroughChannel::send_keys(const std::string& keys) {
    if (!process_.write_all(keys)) {
        last_error_ = process_.get_last_error();
        return false;
    }
    return true;
}

bool PassthroughChannel::send_control(const ControlSignal& sig) {
    char byte = 0x03;
    switch (sig.type) {
        case ControlSignalType::INTERRUPT:        byte = 0x03; break;
        case ControlSignalType::SOFT_RESTART:     byte = 0x04; break;
        case ControlSignalType::PASTE_MODE_ENTER: byte = 0x05; break;
    }
    if (verbose_) {
        std::cerr << "[Passthrough] Control " << ProtocolParser::serialize_control(sig) << "\n";
    }
    return send_keys(std::string(1, byte));
}

int PassthroughChannel::poll_output(int timeout_ms) {
    std::string chunk;
    int n = process_.poll_read(chunk, timeout_ms);
    if (n < 0) {
        last_error_ = process_.get_last_error();
        process_.stop();
        if (handlers_.on_exit) handlers_.on_exit(last_error_);
        return -1;
    }
    if (n > 0 && handlers_.on_output) handlers_.on_output(chunk);
    return n;
}

int PassthroughChannel::wait_fd() const {
    return process_.output_fd();
}

} // namespace MuRuntime
