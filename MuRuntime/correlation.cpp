#include "MuRuntime.h"

#include <blake3.h>

namespace MuRuntime {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INITIALIZATION: return "InitializationError";
        case ErrorKind::EXECUTION: return "ExecutionError";
        case ErrorKind::PROTOCOL: return "ProtocolError";
        case ErrorKind::TIMEOUT: return "TimeoutError";
        case ErrorKind::INTERRUPTED: return "InterruptedError";
    }
    return "Error";
}

// ============================================================================
// CorrelationIdGenerator
// ============================================================================

CorrelationIdGenerator::CorrelationIdGenerator() : counter_(0) {
    std::random_device rd;
    for (size_t i = 0; i < key_.size(); i += 4) {
        uint32_t r = rd();
        for (size_t b = 0; b < 4; ++b) key_[i + b] = static_cast<uint8_t>(r >> (8 * b));
    }
}

CorrelationIdGenerator::CorrelationIdGenerator(uint64_t seed) : counter_(0) {
    std::mt19937_64 rng(seed);
    for (size_t i = 0; i < key_.size(); i += 8) {
        uint64_t r = rng();
        for (size_t b = 0; b < 8; ++b) key_[i + b] = static_cast<uint8_t>(r >> (8 * b));
    }
}

std::string CorrelationIdGenerator::next() {
    uint8_t message[8];
    uint64_t n = counter_++;
    for (int b = 0; b < 8; ++b) message[b] = static_cast<uint8_t>(n >> (8 * b));

    blake3_hasher hasher;
    blake3_hasher_init_keyed(&hasher, key_.data());
    blake3_hasher_update(&hasher, message, sizeof(message));

    uint8_t output[16];
    blake3_hasher_finalize(&hasher, output, sizeof(output));

    // RFC 4122 version 4, variant 10xx
    output[6] = static_cast<uint8_t>((output[6] & 0x0f) | 0x40);
    output[8] = static_cast<uint8_t>((output[8] & 0x3f) | 0x80);

    static const char hex[] = "0123456789abcdef";
    std::string id;
    id.reserve(36);
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) id += '-';
        id += hex[output[i] >> 4];
        id += hex[output[i] & 0x0f];
    }
    return id;
}

// ============================================================================
// PendingTable
// ============================================================================

PendingTable::PendingTable(std::chrono::milliseconds timeout) : timeout_(timeout) {}

bool PendingTable::add(const std::string& id, CommandKind kind, Continuation continuation,
                       std::optional<Clock::time_point> deadline) {
    if (pending_.count(id)) return false;

    PendingCommand cmd;
    cmd.id = id;
    cmd.kind = kind;
    cmd.continuation = std::move(continuation);
    cmd.issued = Clock::now();
    cmd.deadline = deadline ? *deadline : cmd.issued + timeout_;
    pending_[id] = std::move(cmd);
    return true;
}

bool PendingTable::deliver(const Response& resp) {
    auto it = pending_.find(resp.id);
    if (it == pending_.end()) return false;

    Continuation cont = std::move(it->second.continuation);
    pending_.erase(it);

    if (resp.success) {
        if (cont.resolve) cont.resolve(resp);
    } else {
        CommandError err;
        err.kind = ErrorKind::EXECUTION;
        err.message = resp.error.value_or("Unknown error");
        err.response = resp;
        if (cont.reject) cont.reject(err);
    }
    return true;
}

size_t PendingTable::sweep(Clock::time_point now) {
    if (pending_.empty()) return 0;

    std::vector<PendingCommand> expired;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->second.deadline <= now) {
            expired.push_back(std::move(it->second));
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }

    for (auto& cmd : expired) {
        CommandError err;
        err.kind = ErrorKind::TIMEOUT;
        err.message = std::string("Command ") + command_kind_to_string(cmd.kind) + " timed out";
        if (cmd.continuation.reject) cmd.continuation.reject(err);
    }
    return expired.size();
}

size_t PendingTable::reject_all(ErrorKind kind, const std::string& message) {
    std::map<std::string, PendingCommand> taken;
    taken.swap(pending_);

    for (auto& [id, cmd] : taken) {
        CommandError err;
        err.kind = kind;
        err.message = message;
        if (cmd.continuation.reject) cmd.continuation.reject(err);
    }
    return taken.size();
}

bool PendingTable::contains(const std::string& id) const {
    return pending_.count(id) != 0;
}

} // namespace MuRuntime
