#ifndef _MuRuntime_correlation_h_
#define _MuRuntime_correlation_h_

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

#include "protocol.h"

namespace MuRuntime {

enum class ErrorKind {
    INITIALIZATION,
    EXECUTION,
    PROTOCOL,
    TIMEOUT,
    INTERRUPTED
};

const char* error_kind_to_string(ErrorKind kind);

struct CommandError {
    ErrorKind kind = ErrorKind::EXECUTION;
    std::string message;
    std::optional<Response> response;   // set for worker-reported failures
};

// Result channel of an outbound command; exactly one side is invoked
struct Continuation {
    std::function<void(const Response&)> resolve;
    std::function<void(const CommandError&)> reject;
};

struct PendingCommand {
    using Clock = std::chrono::steady_clock;

    std::string id;
    CommandKind kind = CommandKind::EXECUTE;
    Continuation continuation;
    Clock::time_point issued;
    Clock::time_point deadline;
};

// UUIDv4-formatted ids: BLAKE3 over a per-generator random key and a counter
class CorrelationIdGenerator {
public:
    CorrelationIdGenerator();
    explicit CorrelationIdGenerator(uint64_t seed);

    std::string next();

private:
    std::array<uint8_t, 32> key_;
    uint64_t counter_;
};

// id -> (continuation, deadline). Entries are removed before their
// continuation runs so a continuation may safely issue new commands.
class PendingTable {
public:
    using Clock = PendingCommand::Clock;

    static constexpr int kDefaultTimeoutMs = 10000;
    static constexpr int kDefaultSweepMs = 30000;

    explicit PendingTable(std::chrono::milliseconds timeout = std::chrono::milliseconds(kDefaultTimeoutMs));

    // Registers a command; deadline defaults to now + timeout.
    // An id that is already outstanding is refused and returns false.
    bool add(const std::string& id, CommandKind kind, Continuation continuation,
             std::optional<Clock::time_point> deadline = std::nullopt);

    // Resolves or rejects the matching entry. Unmatched ids return false.
    bool deliver(const Response& resp);

    // Rejects entries past their deadline with TimeoutError; returns count
    size_t sweep(Clock::time_point now = Clock::now());

    // Rejects every entry with the given kind; returns count
    size_t reject_all(ErrorKind kind, const std::string& message);

    bool contains(const std::string& id) const;
    size_t size() const { return pending_.size(); }
    bool empty() const { return pending_.empty(); }
    std::chrono::milliseconds timeout() const { return timeout_; }
    void set_timeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }

private:
    std::map<std::string, PendingCommand> pending_;
    std::chrono::milliseconds timeout_;
};

} // namespace MuRuntime

#endif
