#ifndef _MuRuntime_channel_h_
#define _MuRuntime_channel_h_

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "protocol.h"
#include "worker.h"

namespace MuRuntime {

// Callbacks invoked from poll_messages()
struct ChannelHandlers {
    std::function<void(const Response&)> on_init;
    std::function<void(const Response&)> on_response;
    // Unrecoverable: the worker is gone or the pipe broke
    std::function<void(const std::string&)> on_fault;
    // Malformed inbound line; the channel keeps going
    std::function<void(const std::string&)> on_protocol_error;
};

// Structured transport to a Runtime Worker
class Channel {
public:
    virtual ~Channel() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;
    virtual bool restart() = 0;

    virtual bool send(const Request& req) = 0;

    // Dispatch inbound messages, waiting up to timeout_ms.
    // Returns number of messages handled, or -1 on error.
    virtual int poll_messages(int timeout_ms) = 0;

    // Descriptor for the host poll loop, -1 when the channel has none
    virtual int wait_fd() const { return -1; }

    void set_handlers(const ChannelHandlers& handlers) { handlers_ = handlers; }
    std::string get_last_error() const { return last_error_; }
    int protocol_errors() const { return protocol_errors_; }

protected:
    // Parse one response line and route it to the handlers
    void dispatch_line(const std::string& line, bool verbose, const char* tag);
    void fault(const std::string& reason);

    ChannelHandlers handlers_;
    std::string last_error_;
    int protocol_errors_ = 0;
};

struct ProcessChannelConfig {
    std::string worker_executable = "muruntime-worker";
    std::vector<std::string> worker_args;
    bool verbose = false;
    bool auto_restart = false;
    int max_restarts = 3;
};

// Worker running as a child process speaking line-delimited JSON
class ProcessChannel : public Channel {
public:
    explicit ProcessChannel(const ProcessChannelConfig& config);
    ~ProcessChannel() override;

    bool start() override;
    void stop() override;
    bool is_running() const override;
    bool restart() override;
    bool send(const Request& req) override;
    int poll_messages(int timeout_ms) override;
    int wait_fd() const override;

    int get_restart_count() const;
    int get_process_id() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// Worker hosted in the same process. Requests are queued by send() and
// answered one per poll_messages() call, which keeps delivery asynchronous
// from the caller's point of view.
class LoopbackChannel : public Channel {
public:
    explicit LoopbackChannel(const WorkerConfig& config,
                             std::unique_ptr<SimulationStrategy> simulation = nullptr);
    ~LoopbackChannel() override;

    bool start() override;
    void stop() override;
    bool is_running() const override;
    bool restart() override;
    bool send(const Request& req) override;
    int poll_messages(int timeout_ms) override;

    size_t queued() const { return queue_.size(); }
    RuntimeWorker& worker() { return *worker_; }

private:
    WorkerConfig config_;
    std::unique_ptr<RuntimeWorker> worker_;
    std::deque<std::string> queue_;
    bool running_;
    bool init_pending_;
};

} // namespace MuRuntime

#endif
