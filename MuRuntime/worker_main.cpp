#include "MuRuntime.h"

int main(int argc, char** argv) {
    using namespace MuRuntime;

    std::vector<std::string> args(argv + 1, argv + argc);
    WorkerOptions opts = parse_worker_args(args);

    if (opts.help) {
        show_worker_help();
        return 0;
    }

    for (const auto& e : opts.errors) {
        std::cerr << "[RuntimeWorker] " << e << "\n";
    }
    if (!opts.errors.empty()) return 2;

    RuntimeWorker::install_signal_handlers();

    RuntimeWorker worker(opts.worker);
    return worker.serve(STDIN_FILENO, STDOUT_FILENO);
}
