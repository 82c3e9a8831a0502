#include "MuRuntime.h"
#include "test_support.h"

using namespace MuRuntime;

namespace {

void clear_env() {
    unsetenv("MURUNTIME_HEAP_KB");
    unsetenv("MURUNTIME_WORKER");
    unsetenv("MURUNTIME_TIMEOUT_MS");
    unsetenv("MURUNTIME_SWEEP_MS");
    unsetenv("MURUNTIME_VERBOSE");
}

} // namespace

TEST(defaults) {
    clear_env();
    RuntimeConfig cfg;
    cfg.load_from_env();
    CHECK_EQ(cfg.heap_kb, static_cast<size_t>(512));
    CHECK_EQ(cfg.worker_executable, std::string("muruntime-worker"));
    CHECK_EQ(cfg.timeout_ms, 10000);
    CHECK_EQ(cfg.sweep_ms, 30000);
    CHECK(!cfg.verbose);
    CHECK(cfg.errors.empty());

    SessionConfig sc = cfg.session_config();
    CHECK(sc.timeout == std::chrono::milliseconds(10000));
    CHECK(sc.sweep_interval == std::chrono::milliseconds(30000));
    CHECK_EQ(sc.which_text, std::string("direct: muruntime-worker"));
    CHECK_EQ(cfg.worker_config().heap_bytes, static_cast<size_t>(512 * 1024));
}

TEST(environment_overrides) {
    clear_env();
    setenv("MURUNTIME_HEAP_KB", "128", 1);
    setenv("MURUNTIME_WORKER", "/opt/mu/worker", 1);
    setenv("MURUNTIME_TIMEOUT_MS", "2500", 1);
    setenv("MURUNTIME_VERBOSE", "1", 1);
    RuntimeConfig cfg;
    cfg.load_from_env();
    CHECK_EQ(cfg.heap_kb, static_cast<size_t>(128));
    CHECK_EQ(cfg.worker_executable, std::string("/opt/mu/worker"));
    CHECK_EQ(cfg.timeout_ms, 2500);
    CHECK(cfg.verbose);
    clear_env();
}

TEST(environment_rejects_bad_numbers) {
    clear_env();
    setenv("MURUNTIME_SWEEP_MS", "soon", 1);
    RuntimeConfig cfg;
    cfg.load_from_env();
    CHECK_EQ(cfg.sweep_ms, 30000);
    CHECK_EQ(cfg.errors.size(), static_cast<size_t>(1));
    clear_env();
}

TEST(arguments_override_environment) {
    RuntimeConfig base;
    base.heap_kb = 128;
    RuntimeConfig cfg = parse_args({"--heap-kb", "256", "--timeout-ms", "500", "--device-repl", "-v"}, base);
    CHECK(cfg.errors.empty());
    CHECK_EQ(cfg.heap_kb, static_cast<size_t>(256));
    CHECK_EQ(cfg.timeout_ms, 500);
    CHECK(cfg.prompt_mode == PromptMode::DEVICE_REPL);
    CHECK(cfg.verbose);
}

TEST(transport_selection_text) {
    RuntimeConfig pass = parse_args({"--passthrough", "picocom /dev/ttyACM0"});
    CHECK(pass.passthrough_command.has_value());
    CHECK_EQ(pass.session_config().which_text, std::string("pass-through: picocom /dev/ttyACM0"));

    RuntimeConfig inproc = parse_args({"--inprocess"});
    CHECK_EQ(inproc.session_config().which_text, std::string("direct: in-process worker"));
}

TEST(argument_errors) {
    CHECK(!parse_args({"--bogus"}).errors.empty());
    CHECK(!parse_args({"--heap-kb", "-4"}).errors.empty());
    CHECK(!parse_args({"--heap-kb"}).errors.empty());
    CHECK(!parse_args({"--passthrough", "cat", "--inprocess"}).errors.empty());
    CHECK(parse_args({"--help"}).help);
}

TEST(worker_arguments) {
    clear_env();
    WorkerOptions opts = parse_worker_args({"--heap-kb", "32", "--verbose"});
    CHECK(opts.errors.empty());
    CHECK_EQ(opts.worker.heap_bytes, static_cast<size_t>(32 * 1024));
    CHECK(opts.worker.verbose);

    setenv("MURUNTIME_HEAP_KB", "48", 1);
    WorkerOptions from_env = parse_worker_args({});
    CHECK_EQ(from_env.worker.heap_bytes, static_cast<size_t>(48 * 1024));
    clear_env();

    CHECK(!parse_worker_args({"--inprocess"}).errors.empty());
}

// ============================================================================
// Main Test Runner
// ============================================================================

int main() {
    std::cout << "=== Config Tests ===\n\n";

    RUN_TEST(defaults);
    RUN_TEST(environment_overrides);
    RUN_TEST(environment_rejects_bad_numbers);
    RUN_TEST(arguments_override_environment);
    RUN_TEST(transport_selection_text);
    RUN_TEST(argument_errors);
    RUN_TEST(worker_arguments);

    return test_summary();
}
