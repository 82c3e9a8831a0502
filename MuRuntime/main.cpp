#include "MuRuntime.h"
#include <filesystem>

namespace {

// A bare worker name prefers the copy installed beside this executable
std::string resolve_worker(const std::string& name) {
    if (name.find('/') != std::string::npos) return name;
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) return name;
    auto sibling = self.parent_path() / name;
    if (std::filesystem::exists(sibling, ec)) return sibling.string();
    return name;
}

} // namespace

int main(int argc, char** argv) {
    using namespace MuRuntime;

    RuntimeConfig config;
    config.load_from_env();

    std::vector<std::string> args(argv + 1, argv + argc);
    config = parse_args(args, config);

    if (config.help) {
        show_help();
        return 0;
    }

    if (!config.errors.empty()) {
        for (const auto& e : config.errors) {
            std::cerr << Color::RED << "murepl: " << e << Color::RESET << "\n";
        }
        std::cerr << "Try 'murepl --help'.\n";
        return 2;
    }

    config.worker_executable = resolve_worker(config.worker_executable);
    if (config.verbose) {
        std::cerr << "[murepl] worker=" << config.worker_executable
                  << " heap=" << config.heap_kb << "KiB timeout=" << config.timeout_ms << "ms\n";
    }

    return run_host(config);
}
