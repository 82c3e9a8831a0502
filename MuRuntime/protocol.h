#ifndef _MuRuntime_protocol_h_
#define _MuRuntime_protocol_h_

#include <cstdint>
#include <optional>
#include <string>

#include "json.h"

namespace MuRuntime {

// ============================================================================
// Envelope types (newline-delimited JSON between host and worker)
// ============================================================================

enum class RequestType {
    EXECUTE,
    QUERY,
    RESET,
    CONFIGURE,
    HARDWARE_QUERY,
    HARDWARE_SET
};

// Kind of a pending command, as tracked by the session controller
enum class CommandKind {
    EXECUTE,
    QUERY,
    RESET,
    CONFIGURE,
    HARDWARE,
    CONTROL
};

enum class ExecMode {
    REPL,
    FILE
};

enum class ControlSignalType {
    INTERRUPT,
    SOFT_RESTART,
    PASTE_MODE_ENTER
};

struct Request {
    std::string id;
    RequestType type = RequestType::QUERY;
    Json payload = Json::object();
    int64_t timestamp = 0;
};

struct Response {
    std::string id;
    bool success = false;
    std::optional<Json> result;
    std::optional<std::string> error;
    double execution_time_ms = 0.0;
    std::optional<Json> hardware_snapshot;
};

// Session-level signal; carries no business payload
struct ControlSignal {
    ControlSignalType type = ControlSignalType::INTERRUPT;
    std::string id;
    int64_t timestamp = 0;
};

struct ExecutePayload {
    std::string code;
    ExecMode mode = ExecMode::REPL;
    bool enable_hardware_monitoring = true;

    Json to_json() const;
    static ExecutePayload from_json(const Json& j);
};

// ============================================================================
// Serialization
// ============================================================================

class ProtocolParser {
public:
    static std::string serialize_request(const Request& req);
    static std::string serialize_response(const Response& resp);
    static std::string serialize_control(const ControlSignal& sig);

    // Return nullopt on malformed input; error receives the reason
    static std::optional<Request> parse_request(const std::string& line, std::string* error = nullptr);
    static std::optional<Response> parse_response(const std::string& line, std::string* error = nullptr);
    static std::optional<ControlSignal> parse_control(const std::string& line, std::string* error = nullptr);
};

const char* request_type_to_string(RequestType type);
std::optional<RequestType> request_type_from_string(const std::string& s);
const char* command_kind_to_string(CommandKind kind);
CommandKind command_kind_for(RequestType type);
const char* exec_mode_to_string(ExecMode mode);
const char* control_signal_to_string(ControlSignalType type);

// Wall-clock milliseconds since the epoch
int64_t now_epoch_ms();

} // namespace MuRuntime

#endif
