#ifndef _MuRuntime_subprocess_h_
#define _MuRuntime_subprocess_h_

#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>

namespace MuRuntime {

struct SubprocessConfig {
    std::string executable;
    std::vector<std::string> args;
    bool merge_stderr = false;   // route the child's stderr into the stdout pipe
    bool verbose = false;
    std::string log_tag = "Subprocess";
};

// Child process connected by a pair of pipes. The read side is non-blocking
// so it can be multiplexed with poll() by the owner.
class Subprocess {
public:
    explicit Subprocess(const SubprocessConfig& config);
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    bool start();

    // Closes the pipes, sends SIGTERM and escalates to SIGKILL after ~1s
    void stop();
    bool is_running() const;

    bool write_all(const std::string& data);

    // Appends whatever is readable to buffer.
    // Returns bytes read, 0 when nothing is pending, -1 on EOF or error.
    int read_available(std::string& buffer);

    // Wait up to timeout_ms for output; same return convention as read_available
    int poll_read(std::string& buffer, int timeout_ms);

    pid_t process_id() const;
    int output_fd() const;
    std::string get_last_error() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace MuRuntime

#endif
