#include "MuRuntime.h"

namespace MuRuntime {

// ============================================================================
// Enum <-> string helpers
// ============================================================================

const char* request_type_to_string(RequestType type) {
    switch (type) {
        case RequestType::EXECUTE: return "execute";
        case RequestType::QUERY: return "query";
        case RequestType::RESET: return "reset";
        case RequestType::CONFIGURE: return "configure";
        case RequestType::HARDWARE_QUERY: return "hardware_query";
        case RequestType::HARDWARE_SET: return "hardware_set";
    }
    return "unknown";
}

std::optional<RequestType> request_type_from_string(const std::string& s) {
    if (s == "execute") return RequestType::EXECUTE;
    if (s == "query") return RequestType::QUERY;
    if (s == "reset") return RequestType::RESET;
    if (s == "configure") return RequestType::CONFIGURE;
    if (s == "hardware_query") return RequestType::HARDWARE_QUERY;
    if (s == "hardware_set") return RequestType::HARDWARE_SET;
    return std::nullopt;
}

const char* command_kind_to_string(CommandKind kind) {
    switch (kind) {
        case CommandKind::EXECUTE: return "execute";
        case CommandKind::QUERY: return "query";
        case CommandKind::RESET: return "reset";
        case CommandKind::CONFIGURE: return "configure";
        case CommandKind::HARDWARE: return "hardware";
        case CommandKind::CONTROL: return "control";
    }
    return "unknown";
}

CommandKind command_kind_for(RequestType type) {
    switch (type) {
        case RequestType::EXECUTE: return CommandKind::EXECUTE;
        case RequestType::QUERY: return CommandKind::QUERY;
        case RequestType::RESET: return CommandKind::RESET;
        case RequestType::CONFIGURE: return CommandKind::CONFIGURE;
        case RequestType::HARDWARE_QUERY:
        case RequestType::HARDWARE_SET: return CommandKind::HARDWARE;
    }
    return CommandKind::QUERY;
}

const char* exec_mode_to_string(ExecMode mode) {
    return mode == ExecMode::FILE ? "file" : "repl";
}

const char* control_signal_to_string(ControlSignalType type) {
    switch (type) {
        case ControlSignalType::INTERRUPT: return "interrupt";
        case ControlSignalType::SOFT_RESTART: return "soft-restart";
        case ControlSignalType::PASTE_MODE_ENTER: return "paste-mode-enter";
    }
    return "unknown";
}

int64_t now_epoch_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// ============================================================================
// ExecutePayload
// ============================================================================

Json ExecutePayload::to_json() const {
    Json j = Json::object();
    j["code"] = code;
    j["mode"] = exec_mode_to_string(mode);
    j["enableHardwareMonitoring"] = enable_hardware_monitoring;
    return j;
}

ExecutePayload ExecutePayload::from_json(const Json& j) {
    ExecutePayload p;
    p.code = j["code"].as_string();
    p.mode = j["mode"].as_string() == "file" ? ExecMode::FILE : ExecMode::REPL;
    p.enable_hardware_monitoring = j["enableHardwareMonitoring"].as_bool(true);
    return p;
}

// ============================================================================
// ProtocolParser
// ============================================================================

std::string ProtocolParser::serialize_request(const Request& req) {
    Json j = Json::object();
    j["id"] = req.id;
    j["type"] = request_type_to_string(req.type);
    j["payload"] = req.payload.is_object() ? req.payload : Json::object();
    j["timestamp"] = static_cast<long long>(req.timestamp);
    return j.dump();
}

std::string ProtocolParser::serialize_response(const Response& resp) {
    Json j = Json::object();
    j["id"] = resp.id;
    j["success"] = resp.success;
    if (resp.result) j["result"] = *resp.result;
    if (resp.error) j["error"] = *resp.error;
    j["executionTimeMs"] = resp.execution_time_ms;
    if (resp.hardware_snapshot) j["hardwareSnapshot"] = *resp.hardware_snapshot;
    return j.dump();
}

std::string ProtocolParser::serialize_control(const ControlSignal& sig) {
    Json j = Json::object();
    j["type"] = control_signal_to_string(sig.type);
    j["id"] = sig.id;
    j["timestamp"] = static_cast<long long>(sig.timestamp);
    return j.dump();
}

std::optional<Request> ProtocolParser::parse_request(const std::string& line, std::string* error) {
    auto doc = Json::parse(line, error);
    if (!doc) return std::nullopt;

    if (!doc->is_object() || !(*doc)["id"].is_string() || !(*doc)["type"].is_string()) {
        if (error) *error = "Request must be an object with string 'id' and 'type'";
        return std::nullopt;
    }

    auto type = request_type_from_string((*doc)["type"].as_string());
    if (!type) {
        if (error) *error = "Unknown message type: " + (*doc)["type"].as_string();
        return std::nullopt;
    }

    Request req;
    req.id = (*doc)["id"].as_string();
    req.type = *type;
    req.payload = (*doc)["payload"].is_object() ? (*doc)["payload"] : Json::object();
    req.timestamp = (*doc)["timestamp"].as_int();
    return req;
}

std::optional<Response> ProtocolParser::parse_response(const std::string& line, std::string* error) {
    auto doc = Json::parse(line, error);
    if (!doc) return std::nullopt;

    const Json& j = *doc;
    if (!j.is_object() || !j["id"].is_string() || !j["success"].is_bool()) {
        if (error) *error = "Response must be an object with string 'id' and bool 'success'";
        return std::nullopt;
    }

    Response resp;
    resp.id = j["id"].as_string();
    resp.success = j["success"].as_bool();
    if (j.has("result") && !j["result"].is_null()) resp.result = j["result"];
    if (j["error"].is_string()) resp.error = j["error"].as_string();
    resp.execution_time_ms = j["executionTimeMs"].as_number();
    if (j["hardwareSnapshot"].is_object()) resp.hardware_snapshot = j["hardwareSnapshot"];
    return resp;
}

std::optional<ControlSignal> ProtocolParser::parse_control(const std::string& line, std::string* error) {
    auto doc = Json::parse(line, error);
    if (!doc) return std::nullopt;

    std::string type = (*doc)["type"].as_string();
    ControlSignal sig;
    if (type == "interrupt") sig.type = ControlSignalType::INTERRUPT;
    else if (type == "soft-restart") sig.type = ControlSignalType::SOFT_RESTART;
    else if (type == "paste-mode-enter") sig.type = ControlSignalType::PASTE_MODE_ENTER;
    else {
        if (error) *error = "Unknown control signal: " + type;
        return std::nullopt;
    }
    sig.id = (*doc)["id"].as_string();
    sig.timestamp = (*doc)["timestamp"].as_int();
    return sig;
}

} // namespace MuRuntime
