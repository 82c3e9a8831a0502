#include "MuRuntime.h"
#include "test_support.h"

using namespace MuRuntime;

// ============================================================================
// Json
// ============================================================================

TEST(json_parse_nested_document) {
    auto doc = Json::parse(R"({"a":[1,2.5,true,null],"b":{"c":"x\ny"}})");
    CHECK(doc.has_value());
    CHECK(doc->is_object());
    CHECK_EQ((*doc)["a"].size(), 4u);
    CHECK_EQ((*doc)["a"].as_array()[1].as_number(), 2.5);
    CHECK((*doc)["a"].as_array()[2].as_bool());
    CHECK((*doc)["a"].as_array()[3].is_null());
    CHECK_EQ((*doc)["b"]["c"].as_string(), std::string("x\ny"));
}

TEST(json_parse_rejects_garbage) {
    std::string error;
    CHECK(!Json::parse("{\"a\":", &error));
    CHECK(!error.empty());
    CHECK(!Json::parse("[1,2] trailing"));
    CHECK(!Json::parse(""));
}

TEST(json_parse_depth_limit) {
    std::string deep(200, '[');
    deep += std::string(200, ']');
    CHECK(!Json::parse(deep));
}

TEST(json_dump_integral_numbers_without_fraction) {
    Json j = Json::object();
    j["n"] = 5;
    j["f"] = 2.5;
    j["s"] = "q\"uote";
    CHECK_EQ(j.dump(), std::string(R"({"f":2.5,"n":5,"s":"q\"uote"})"));
}

TEST(json_missing_key_reads_as_null) {
    const Json j = Json::object();
    CHECK(j["nope"].is_null());
    CHECK_EQ(j["nope"].as_string("fallback"), std::string("fallback"));
    CHECK(j["nope"]["deeper"].is_null());
}

TEST(json_escape_control_characters) {
    CHECK_EQ(json_escape("a\tb\x01"), std::string("a\\tb\\u0001"));
}

// ============================================================================
// Envelopes
// ============================================================================

TEST(serialize_execute_request) {
    Request req;
    req.id = "abc";
    req.type = RequestType::EXECUTE;
    ExecutePayload p;
    p.code = "print('hi')";
    p.mode = ExecMode::FILE;
    p.enable_hardware_monitoring = false;
    req.payload = p.to_json();
    req.timestamp = 42;

    auto json = ProtocolParser::serialize_request(req);
    auto doc = Json::parse(json);
    CHECK(doc.has_value());
    CHECK_EQ((*doc)["id"].as_string(), std::string("abc"));
    CHECK_EQ((*doc)["type"].as_string(), std::string("execute"));
    CHECK_EQ((*doc)["payload"]["mode"].as_string(), std::string("file"));
    CHECK_EQ((*doc)["payload"]["enableHardwareMonitoring"].as_bool(true), false);
    CHECK_EQ((*doc)["timestamp"].as_int(), 42);
}

TEST(parse_request_all_types) {
    const char* types[] = {"execute", "query", "reset", "configure", "hardware_query", "hardware_set"};
    for (const char* t : types) {
        std::string line = std::string(R"({"id":"1","type":")") + t + R"(","payload":{}})";
        auto req = ProtocolParser::parse_request(line);
        CHECK(req.has_value());
        CHECK_EQ(std::string(request_type_to_string(req->type)), std::string(t));
    }
}

TEST(parse_request_unknown_type) {
    std::string error;
    auto req = ProtocolParser::parse_request(R"({"id":"1","type":"reboot","payload":{}})", &error);
    CHECK(!req);
    CHECK_EQ(error, std::string("Unknown message type: reboot"));
}

TEST(parse_request_requires_id) {
    CHECK(!ProtocolParser::parse_request(R"({"type":"query","payload":{}})"));
    CHECK(!ProtocolParser::parse_request(R"([1,2,3])"));
}

TEST(response_wire_keys) {
    Response resp;
    resp.id = "r1";
    resp.success = true;
    Json result = Json::object();
    result["output"] = "5\n";
    resp.result = result;
    resp.execution_time_ms = 1.5;
    resp.hardware_snapshot = Json::object();

    auto doc = Json::parse(ProtocolParser::serialize_response(resp));
    CHECK(doc.has_value());
    CHECK((*doc).has("executionTimeMs"));
    CHECK((*doc).has("hardwareSnapshot"));
    CHECK(!(*doc).has("error"));

    auto back = ProtocolParser::parse_response(ProtocolParser::serialize_response(resp));
    CHECK(back.has_value());
    CHECK(back->success);
    CHECK_EQ((*back->result)["output"].as_string(), std::string("5\n"));
    CHECK_EQ(back->execution_time_ms, 1.5);
}

TEST(parse_failure_response) {
    auto resp = ProtocolParser::parse_response(R"({"id":"x","success":false,"error":"boom","executionTimeMs":0})");
    CHECK(resp.has_value());
    CHECK(!resp->success);
    CHECK(resp->error.has_value());
    CHECK_EQ(*resp->error, std::string("boom"));
    CHECK(!resp->result.has_value());
}

TEST(control_signals_carry_no_payload) {
    ControlSignal sig;
    sig.type = ControlSignalType::SOFT_RESTART;
    sig.id = "c1";
    sig.timestamp = 7;
    auto doc = Json::parse(ProtocolParser::serialize_control(sig));
    CHECK(doc.has_value());
    CHECK_EQ((*doc)["type"].as_string(), std::string("soft-restart"));
    CHECK(!(*doc).has("payload"));

    auto back = ProtocolParser::parse_control(ProtocolParser::serialize_control(sig));
    CHECK(back.has_value());
    CHECK(back->type == ControlSignalType::SOFT_RESTART);
    CHECK(!ProtocolParser::parse_control(R"({"type":"explode","id":"1"})"));
}

TEST(enum_converters) {
    CHECK_EQ(std::string(control_signal_to_string(ControlSignalType::PASTE_MODE_ENTER)), std::string("paste-mode-enter"));
    CHECK_EQ(std::string(exec_mode_to_string(ExecMode::REPL)), std::string("repl"));
    CHECK(command_kind_for(RequestType::HARDWARE_SET) == CommandKind::HARDWARE);
    CHECK(command_kind_for(RequestType::EXECUTE) == CommandKind::EXECUTE);
    CHECK(!request_type_from_string("bogus"));
}

// ============================================================================
// Main Test Runner
// ============================================================================

int main() {
    std::cout << "=== Protocol Tests ===\n\n";

    RUN_TEST(json_parse_nested_document);
    RUN_TEST(json_parse_rejects_garbage);
    RUN_TEST(json_parse_depth_limit);
    RUN_TEST(json_dump_integral_numbers_without_fraction);
    RUN_TEST(json_missing_key_reads_as_null);
    RUN_TEST(json_escape_control_characters);

    RUN_TEST(serialize_execute_request);
    RUN_TEST(parse_request_all_types);
    RUN_TEST(parse_request_unknown_type);
    RUN_TEST(parse_request_requires_id);
    RUN_TEST(response_wire_keys);
    RUN_TEST(parse_failure_response);
    RUN_TEST(control_signals_carry_no_payload);
    RUN_TEST(enum_converters);

    return test_summary();
}
