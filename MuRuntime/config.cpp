#include "MuRuntime.h"

namespace MuRuntime {

namespace {

std::optional<long> parse_positive(const std::string& s) {
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v <= 0) return std::nullopt;
    return v;
}

void read_heap_env(size_t& heap_kb, std::vector<std::string>& errors) {
    if (const char* val = std::getenv("MURUNTIME_HEAP_KB"); val && *val) {
        if (auto v = parse_positive(val)) heap_kb = static_cast<size_t>(*v);
        else errors.push_back(std::string("MURUNTIME_HEAP_KB: invalid value '") + val + "'");
    }
}

bool env_flag(const char* name) {
    const char* val = std::getenv(name);
    return val && *val == '1';
}

} // namespace

void RuntimeConfig::load_from_env() {
    read_heap_env(heap_kb, errors);

    if (const char* val = std::getenv("MURUNTIME_WORKER"); val && *val) {
        worker_executable = val;
    }

    if (const char* val = std::getenv("MURUNTIME_TIMEOUT_MS"); val && *val) {
        if (auto v = parse_positive(val)) timeout_ms = static_cast<int>(*v);
        else errors.push_back(std::string("MURUNTIME_TIMEOUT_MS: invalid value '") + val + "'");
    }

    if (const char* val = std::getenv("MURUNTIME_SWEEP_MS"); val && *val) {
        if (auto v = parse_positive(val)) sweep_ms = static_cast<int>(*v);
        else errors.push_back(std::string("MURUNTIME_SWEEP_MS: invalid value '") + val + "'");
    }

    if (env_flag("MURUNTIME_VERBOSE")) {
        verbose = true;
    }
}

SessionConfig RuntimeConfig::session_config() const {
    SessionConfig sc;
    sc.timeout = std::chrono::milliseconds(timeout_ms);
    sc.sweep_interval = std::chrono::milliseconds(sweep_ms);
    sc.prompt_mode = prompt_mode;
    sc.verbose = verbose;
    if (passthrough_command) sc.which_text = "pass-through: " + *passthrough_command;
    else if (inprocess) sc.which_text = "direct: in-process worker";
    else sc.which_text = "direct: " + worker_executable;
    return sc;
}

WorkerConfig RuntimeConfig::worker_config() const {
    WorkerConfig wc;
    wc.heap_bytes = heap_kb * 1024;
    wc.verbose = verbose;
    return wc;
}

RuntimeConfig parse_args(const std::vector<std::string>& args, RuntimeConfig cfg) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool has_value = i + 1 < args.size();

        if (arg == "--heap-kb" && has_value) {
            const std::string& v = args[++i];
            if (auto n = parse_positive(v)) cfg.heap_kb = static_cast<size_t>(*n);
            else cfg.errors.push_back("--heap-kb: invalid value '" + v + "'");
        }
        else if (arg == "--worker" && has_value) {
            cfg.worker_executable = args[++i];
        }
        else if (arg == "--timeout-ms" && has_value) {
            const std::string& v = args[++i];
            if (auto n = parse_positive(v)) cfg.timeout_ms = static_cast<int>(*n);
            else cfg.errors.push_back("--timeout-ms: invalid value '" + v + "'");
        }
        else if (arg == "--sweep-ms" && has_value) {
            const std::string& v = args[++i];
            if (auto n = parse_positive(v)) cfg.sweep_ms = static_cast<int>(*n);
            else cfg.errors.push_back("--sweep-ms: invalid value '" + v + "'");
        }
        else if (arg == "--passthrough" && has_value) {
            cfg.passthrough_command = args[++i];
        }
        else if (arg == "--inprocess") {
            cfg.inprocess = true;
        }
        else if (arg == "--device-repl") {
            cfg.prompt_mode = PromptMode::DEVICE_REPL;
        }
        else if (arg == "--verbose" || arg == "-v") {
            cfg.verbose = true;
        }
        else if (arg == "--simple") {
            cfg.simple_mode = true;
        }
        else if (arg == "--help" || arg == "-h") {
            cfg.help = true;
        }
        else {
            cfg.errors.push_back("unknown option: " + arg);
        }
    }

    if (cfg.passthrough_command && cfg.inprocess) {
        cfg.errors.push_back("--passthrough and --inprocess are mutually exclusive");
    }
    return cfg;
}

void show_help() {
    std::cout << "murepl - interactive session for the MuRuntime embedded Python worker\n\n";
    std::cout << "Usage:\n";
    std::cout << "  murepl [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --heap-kb <n>                 Interpreter heap in KiB (default: 512)\n";
    std::cout << "  --worker <path>               Worker executable (default: muruntime-worker)\n";
    std::cout << "  --timeout-ms <n>              Command deadline (default: 10000)\n";
    std::cout << "  --sweep-ms <n>                Timeout sweep interval (default: 30000)\n";
    std::cout << "  --passthrough <cmd>           Forward keystrokes to <cmd> instead of a worker\n";
    std::cout << "  --inprocess                   Run the worker inside this process\n";
    std::cout << "  --device-repl                 Use the '>>> ' prompt\n";
    std::cout << "  --simple                      Force stdio mode instead of ncurses\n";
    std::cout << "  --verbose                     Diagnostics on stderr\n";
    std::cout << "  --help                        Show this help\n\n";
    std::cout << "Environment:\n";
    std::cout << "  MURUNTIME_HEAP_KB, MURUNTIME_WORKER, MURUNTIME_TIMEOUT_MS,\n";
    std::cout << "  MURUNTIME_SWEEP_MS, MURUNTIME_VERBOSE=1\n\n";
    std::cout << cli_help_text();
}

WorkerOptions parse_worker_args(const std::vector<std::string>& args) {
    WorkerOptions opts;
    size_t heap_kb = opts.worker.heap_bytes / 1024;
    read_heap_env(heap_kb, opts.errors);
    if (env_flag("MURUNTIME_VERBOSE")) opts.worker.verbose = true;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--heap-kb" && i + 1 < args.size()) {
            const std::string& v = args[++i];
            if (auto n = parse_positive(v)) heap_kb = static_cast<size_t>(*n);
            else opts.errors.push_back("--heap-kb: invalid value '" + v + "'");
        }
        else if (arg == "--verbose" || arg == "-v") {
            opts.worker.verbose = true;
        }
        else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        }
        else {
            opts.errors.push_back("unknown option: " + arg);
        }
    }

    opts.worker.heap_bytes = heap_kb * 1024;
    return opts;
}

void show_worker_help() {
    std::cerr << "muruntime-worker - line-delimited JSON runtime worker\n\n";
    std::cerr << "Usage:\n";
    std::cerr << "  muruntime-worker [--heap-kb <n>] [--verbose]\n\n";
    std::cerr << "Reads requests on stdin, writes responses on stdout, logs on stderr.\n";
}

} // namespace MuRuntime
