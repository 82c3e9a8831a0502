#ifndef _MuRuntime_config_h_
#define _MuRuntime_config_h_

#include <optional>
#include <string>
#include <vector>

#include "session.h"
#include "worker.h"

namespace MuRuntime {

// Host settings: defaults, then environment, then command line
struct RuntimeConfig {
    size_t heap_kb = 512;
    std::string worker_executable = "muruntime-worker";
    int timeout_ms = 10000;
    int sweep_ms = 30000;
    bool verbose = false;
    std::optional<std::string> passthrough_command;
    bool inprocess = false;
    bool simple_mode = false;
    PromptMode prompt_mode = PromptMode::SHELL;
    bool help = false;

    // Problems found while loading; the caller decides whether to abort
    std::vector<std::string> errors;

    void load_from_env();
    SessionConfig session_config() const;
    WorkerConfig worker_config() const;
};

// Applies command-line options on top of base
RuntimeConfig parse_args(const std::vector<std::string>& args, RuntimeConfig base = RuntimeConfig());
void show_help();

struct WorkerOptions {
    WorkerConfig worker;
    bool help = false;
    std::vector<std::string> errors;
};

// muruntime-worker: --heap-kb N, --verbose, falling back to the environment
WorkerOptions parse_worker_args(const std::vector<std::string>& args);
void show_worker_help();

} // namespace MuRuntime

#endif
