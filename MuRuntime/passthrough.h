#ifndef _MuRuntime_passthrough_h_
#define _MuRuntime_passthrough_h_

#include <functional>
#include <memory>
#include <string>

#include "protocol.h"
#include "subprocess.h"

namespace MuRuntime {

struct PassthroughHandlers {
    std::function<void(const std::string&)> on_output;
    std::function<void(const std::string&)> on_exit;
};

// Raw keystroke pipe to an externally managed terminal program.
// The command line runs under /bin/sh -c with stderr merged into stdout.
class PassthroughChannel {
public:
    PassthroughChannel(const std::string& command, bool verbose = false);
    ~PassthroughChannel();

    PassthroughChannel(const PassthroughChannel&) = delete;
    PassthroughChannel& operator=(const PassthroughChannel&) = delete;

    bool start();
    void stop();
    // Stops any running process and launches the command again
    bool restart();
    bool is_running() const;

    bool send_keys(const std::string& keys);

    // Forwarded as the conventional control byte (^C, ^D, ^E)
    bool send_control(const ControlSignal& sig);

    // Returns bytes delivered to on_output, or -1 once the process is gone
    int poll_output(int timeout_ms);
    int wait_fd() const;

    void set_handlers(const PassthroughHandlers& handlers) { handlers_ = handlers; }
    const std::string& command() const { return command_; }
    std::string get_last_error() const { return last_error_; }

private:
    std::string command_;
    bool verbose_;
    Subprocess process_;
    PassthroughHandlers handlers_;
    std::string last_error_;
};

} // namespace MuRuntime

#endif
