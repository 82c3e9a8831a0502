#include "MuRuntime.h"

namespace MuRuntime {

const char* pin_mode_to_string(PinMode mode) {
    return mode == PinMode::OUTPUT ? "output" : "input";
}

PinMode pin_mode_from_string(const std::string& s) {
    return s == "output" ? PinMode::OUTPUT : PinMode::INPUT;
}

// ============================================================================
// JSON conversion
// ============================================================================

Json PinState::to_json() const {
    Json j = Json::object();
    j["pin"] = pin;
    j["mode"] = pin_mode_to_string(mode);
    j["value"] = value;
    j["pullup"] = pullup;
    j["pulldown"] = pulldown;
    j["lastChanged"] = static_cast<long long>(last_changed);
    return j;
}

PinState PinState::from_json(const Json& j) {
    PinState p;
    p.pin = static_cast<int>(j["pin"].as_int());
    p.mode = pin_mode_from_string(j["mode"].as_string("input"));
    p.value = j["value"].as_bool();
    p.pullup = j["pullup"].as_bool();
    p.pulldown = j["pulldown"].as_bool();
    p.last_changed = j["lastChanged"].as_int();
    return p;
}

double SensorRange::clamp(double v) const {
    if (min > max) return v;
    return std::max(min, std::min(max, v));
}

Json SensorState::to_json() const {
    Json j = Json::object();
    j["id"] = id;
    j["type"] = type;
    j["value"] = value;
    Json r = Json::object();
    r["min"] = range.min;
    r["max"] = range.max;
    j["range"] = r;
    j["lastReading"] = static_cast<long long>(last_reading);
    j["isActive"] = is_active;
    return j;
}

SensorState SensorState::from_json(const Json& j) {
    SensorState s;
    s.id = j["id"].as_string();
    s.type = j["type"].as_string();
    s.value = j["value"].as_number();
    s.range.min = j["range"]["min"].as_number();
    s.range.max = j["range"]["max"].as_number();
    s.last_reading = j["lastReading"].as_int();
    s.is_active = j["isActive"].as_bool(true);
    return s;
}

Json HardwareSnapshot::to_json() const {
    Json j = Json::object();
    Json p = Json::object();
    for (const auto& [n, pin] : pins) p[std::to_string(n)] = pin.to_json();
    Json s = Json::object();
    for (const auto& [id, sensor] : sensors) s[id] = sensor.to_json();
    j["pins"] = p;
    j["sensors"] = s;
    j["timestamp"] = static_cast<long long>(timestamp);
    return j;
}

HardwareSnapshot HardwareSnapshot::from_json(const Json& j) {
    HardwareSnapshot snap;
    for (const auto& [key, value] : j["pins"].as_object()) {
        PinState p = PinState::from_json(value);
        p.pin = std::atoi(key.c_str());
        snap.pins[p.pin] = p;
    }
    for (const auto& [key, value] : j["sensors"].as_object()) {
        SensorState s = SensorState::from_json(value);
        s.id = key;
        snap.sensors[key] = s;
    }
    snap.timestamp = j["timestamp"].as_int();
    return snap;
}

ConfigurePayload ConfigurePayload::from_json(const Json& j) {
    ConfigurePayload c;
    if (j["boardProfile"]["boardId"].is_string())
        c.board_id = j["boardProfile"]["boardId"].as_string();
    for (const auto& s : j["sensors"].as_array()) c.sensors.push_back(SensorState::from_json(s));
    for (const auto& g : j["gpios"].as_array()) c.gpios.push_back(PinState::from_json(g));
    return c;
}

// ============================================================================
// HardwareState
// ============================================================================

HardwareState::HardwareState() : last_stamp_(0) {
    reset_defaults();
}

int64_t HardwareState::stamp() {
    last_stamp_ = std::max(last_stamp_, now_epoch_ms());
    return last_stamp_;
}

void HardwareState::reset_defaults() {
    int64_t now = stamp();
    pins_.clear();
    sensors_.clear();
    board_id_ = "default";

    for (int i = 0; i < kDefaultPinCount; ++i) {
        PinState p;
        p.pin = i;
        p.last_changed = now;
        pins_[i] = p;
    }

    SensorState temp;
    temp.id = "temp_sensor";
    temp.type = "temperature";
    temp.value = 22.5;
    temp.range = {-40.0, 85.0};
    temp.last_reading = now;
    sensors_[temp.id] = temp;

    SensorState light;
    light.id = "light_sensor";
    light.type = "light";
    light.value = 500.0;
    light.range = {0.0, 10000.0};
    light.last_reading = now;
    sensors_[light.id] = light;
}

void HardwareState::configure(const ConfigurePayload& payload) {
    int64_t now = stamp();
    if (payload.board_id) board_id_ = *payload.board_id;

    for (auto s : payload.sensors) {
        s.value = s.range.clamp(s.value);
        s.last_reading = now;
        sensors_[s.id] = s;
    }
    for (auto p : payload.gpios) {
        p.last_changed = now;
        pins_[p.pin] = p;
    }
}

int HardwareState::apply_updates(const std::vector<PinUpdate>& pins, const std::vector<SensorUpdate>& sensors) {
    int64_t now = stamp();
    int changes = 0;

    for (const auto& u : pins) {
        auto it = pins_.find(u.pin);
        if (it == pins_.end()) continue;
        it->second.value = u.value;
        if (u.mode) it->second.mode = *u.mode;
        it->second.last_changed = now;
        changes++;
    }

    for (const auto& u : sensors) {
        auto it = sensors_.find(u.id);
        if (it == sensors_.end()) continue;
        it->second.value = it->second.range.clamp(u.value);
        it->second.last_reading = now;
        changes++;
    }

    return changes;
}

void HardwareState::replace(HardwareSnapshot snapshot) {
    pins_ = std::move(snapshot.pins);
    sensors_ = std::move(snapshot.sensors);
    last_stamp_ = std::max(last_stamp_, snapshot.timestamp);
}

HardwareSnapshot HardwareState::snapshot() {
    HardwareSnapshot snap;
    snap.pins = pins_;
    snap.sensors = sensors_;
    snap.timestamp = stamp();
    return snap;
}

const PinState* HardwareState::pin(int n) const {
    auto it = pins_.find(n);
    return it == pins_.end() ? nullptr : &it->second;
}

const SensorState* HardwareState::sensor(const std::string& id) const {
    auto it = sensors_.find(id);
    return it == sensors_.end() ? nullptr : &it->second;
}

} // namespace MuRuntime
