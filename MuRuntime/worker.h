#ifndef _MuRuntime_worker_h_
#define _MuRuntime_worker_h_

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "protocol.h"
#include "hardware.h"
#include "simulation.h"

namespace MuRuntime {

struct WorkerConfig {
    size_t heap_bytes = 512 * 1024;
    bool verbose = false;
};

// Hosts one interpreter instance and the simulated hardware it drives.
// Requests are processed strictly one at a time; every failure, including
// exceptions raised by user code, becomes a {success:false} response.
class RuntimeWorker {
public:
    explicit RuntimeWorker(const WorkerConfig& config,
                           std::unique_ptr<SimulationStrategy> simulation = nullptr);
    ~RuntimeWorker();

    RuntimeWorker(const RuntimeWorker&) = delete;
    RuntimeWorker& operator=(const RuntimeWorker&) = delete;

    // Brings up the interpreter; the returned response has id "init".
    // On failure the worker stays usable but execute fails fast.
    Response initialize();
    bool initialized() const;

    Response handle_request(const Request& req);

    // Decode one envelope line and produce the serialized reply.
    // Returns nullopt for input that carries no usable id.
    std::optional<std::string> handle_line(const std::string& line);

    // Read requests from in_fd, write replies to out_fd until EOF or a
    // termination signal. Emits the init response first.
    int serve(int in_fd, int out_fd);

    // Best-effort interpreter teardown
    void shutdown();

    HardwareState& hardware();
    int malformed_count() const;

    static void install_signal_handlers();
    static bool stop_requested();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace MuRuntime

#endif
