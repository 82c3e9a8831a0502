#include "MuRuntime.h"

namespace MuRuntime {

// ============================================================================
// Subprocess::Impl - Implementation Details
// ============================================================================

class Subprocess::Impl {
public:
    explicit Impl(const SubprocessConfig& config)
        : config_(config)
        , running_(false)
        , process_id_(-1)
        , stdin_fd_(-1)
        , stdout_fd_(-1)
    {}

    ~Impl() {
        stop();
    }

    bool start() {
        if (running_) {
            last_error_ = "Process already running";
            return false;
        }

        int stdin_pipe[2];
        int stdout_pipe[2];

        if (pipe(stdin_pipe) < 0) {
            last_error_ = std::string("pipe() failed: ") + strerror(errno);
            return false;
        }

        if (pipe(stdout_pipe) < 0) {
            close(stdin_pipe[0]);
            close(stdin_pipe[1]);
            last_error_ = std::string("pipe() failed: ") + strerror(errno);
            return false;
        }

        pid_t pid = fork();

        if (pid < 0) {
            close(stdin_pipe[0]);
            close(stdin_pipe[1]);
            close(stdout_pipe[0]);
            close(stdout_pipe[1]);
            last_error_ = std::string("fork() failed: ") + strerror(errno);
            return false;
        }

        if (pid == 0) {
            // Own process group so terminal signals aimed at the host skip the child
            setpgid(0, 0);

            dup2(stdin_pipe[0], STDIN_FILENO);
            dup2(stdout_pipe[1], STDOUT_FILENO);
            if (config_.merge_stderr) dup2(stdout_pipe[1], STDERR_FILENO);

            close(stdin_pipe[0]);
            close(stdin_pipe[1]);
            close(stdout_pipe[0]);
            close(stdout_pipe[1]);

            std::vector<const char*> args;
            args.push_back(config_.executable.c_str());
            for (const auto& arg : config_.args) {
                args.push_back(arg.c_str());
            }
            args.push_back(nullptr);

            execvp(config_.executable.c_str(), const_cast<char* const*>(args.data()));

            std::cerr << "execvp() failed: " << strerror(errno) << "\n";
            _exit(127);
        }

        process_id_ = pid;

        close(stdin_pipe[0]);
        close(stdout_pipe[1]);

        stdin_fd_ = stdin_pipe[1];
        stdout_fd_ = stdout_pipe[0];

        int flags = fcntl(stdout_fd_, F_GETFL, 0);
        fcntl(stdout_fd_, F_SETFL, flags | O_NONBLOCK);

        running_ = true;
        if (config_.verbose) {
            std::cerr << "[" << config_.log_tag << "] Started " << config_.executable
                      << " with PID " << pid << "\n";
        }
        return true;
    }

    void stop() {
        if (stdin_fd_ >= 0) {
            close(stdin_fd_);
            stdin_fd_ = -1;
        }
        if (stdout_fd_ >= 0) {
            close(stdout_fd_);
            stdout_fd_ = -1;
        }

        if (process_id_ > 0) {
            if (config_.verbose) {
                std::cerr << "[" << config_.log_tag << "] Stopping PID " << process_id_ << "\n";
            }
            kill(process_id_, SIGTERM);

            int status;
            int wait_attempts = 10;
            bool reaped = false;
            while (wait_attempts-- > 0) {
                pid_t result = waitpid(process_id_, &status, WNOHANG);
                if (result != 0) {
                    reaped = true;
                    break;
                }
                usleep(100000); // 100ms
            }

            if (!reaped) {
                kill(process_id_, SIGKILL);
                waitpid(process_id_, &status, 0);
            }

            process_id_ = -1;
        }

        running_ = false;
    }

    bool write_all(const std::string& data) {
        if (!running_ || stdin_fd_ < 0) {
            last_error_ = "Process not running";
            return false;
        }
        size_t off = 0;
        while (off < data.size()) {
            ssize_t n = write(stdin_fd_, data.data() + off, data.size() - off);
            if (n < 0) {
                if (errno == EINTR) continue;
                last_error_ = std::string("write() failed: ") + strerror(errno);
                return false;
            }
            off += static_cast<size_t>(n);
        }
        return true;
    }

    int read_available(std::string& buffer) {
        if (stdout_fd_ < 0) {
            last_error_ = "Process not running";
            return -1;
        }

        char chunk[4096];
        ssize_t n = read(stdout_fd_, chunk, sizeof(chunk));

        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                return 0;
            }
            last_error_ = std::string("read() failed: ") + strerror(errno);
            return -1;
        }

        if (n == 0) {
            last_error_ = "Subprocess closed stdout";
            running_ = false;
            return -1;
        }

        buffer.append(chunk, static_cast<size_t>(n));
        return static_cast<int>(n);
    }

    int poll_read(std::string& buffer, int timeout_ms) {
        if (stdout_fd_ < 0) {
            last_error_ = "Process not running";
            return -1;
        }

        struct pollfd pfd;
        pfd.fd = stdout_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int poll_result = poll(&pfd, 1, timeout_ms);
        if (poll_result < 0) {
            if (errno == EINTR) return 0;
            last_error_ = std::string("poll() failed: ") + strerror(errno);
            return -1;
        }
        if (poll_result == 0) return 0;

        return read_available(buffer);
    }

    SubprocessConfig config_;
    bool running_;
    pid_t process_id_;
    int stdin_fd_;
    int stdout_fd_;
    std::string last_error_;
};

// ============================================================================
// Subprocess - Public API
// ============================================================================

Subprocess::Subprocess(const SubprocessConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

Subprocess::~Subprocess() = default;

bool Subprocess::start() {
    return impl_->start();
}

void Subprocess::stop() {
    impl_->stop();
}

bool Subprocess::is_running() const {
    return impl_->running_;
}

bool Subprocess::write_all(const std::string& data) {
    return impl_->write_all(data);
}

int Subprocess::read_available(std::string& buffer) {
    return impl_->read_available(buffer);
}

int Subprocess::poll_read(std::string& buffer, int timeout_ms) {
    return impl_->poll_read(buffer, timeout_ms);
}

pid_t Subprocess::process_id() const {
    return impl_->process_id_;
}

int Subprocess::output_fd() const {
    return impl_->stdout_fd_;
}

std::string Subprocess::get_last_error() const {
    return impl_->last_error_;
}

} // namespace MuRuntime
