#ifndef _MuRuntime_hardware_h_
#define _MuRuntime_hardware_h_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "json.h"

namespace MuRuntime {

enum class PinMode {
    INPUT,
    OUTPUT
};

const char* pin_mode_to_string(PinMode mode);
PinMode pin_mode_from_string(const std::string& s);

struct PinState {
    int pin = 0;
    PinMode mode = PinMode::INPUT;
    bool value = false;
    bool pullup = false;
    bool pulldown = false;
    int64_t last_changed = 0;

    Json to_json() const;
    static PinState from_json(const Json& j);
};

struct SensorRange {
    double min = 0.0;
    double max = 0.0;

    double clamp(double v) const;
    double span() const { return max - min; }
};

struct SensorState {
    std::string id;
    std::string type;
    double value = 0.0;
    SensorRange range;
    int64_t last_reading = 0;
    bool is_active = true;

    Json to_json() const;
    static SensorState from_json(const Json& j);
};

struct HardwareSnapshot {
    std::map<int, PinState> pins;
    std::map<std::string, SensorState> sensors;
    int64_t timestamp = 0;

    Json to_json() const;
    static HardwareSnapshot from_json(const Json& j);
};

struct ConfigurePayload {
    std::optional<std::string> board_id;
    std::vector<SensorState> sensors;
    std::vector<PinState> gpios;

    static ConfigurePayload from_json(const Json& j);
};

struct PinUpdate {
    int pin = 0;
    bool value = false;
    std::optional<PinMode> mode;
};

struct SensorUpdate {
    std::string id;
    double value = 0.0;
};

// Pins and sensors owned by one worker. Every timestamp handed out is
// non-decreasing for the lifetime of the object.
class HardwareState {
public:
    static const int kDefaultPinCount = 20;

    HardwareState();

    // 20 input pins at false, temp_sensor and light_sensor mid-range
    void reset_defaults();

    // Creates or overwrites the listed entries
    void configure(const ConfigurePayload& payload);

    // Updates existing entries only; returns how many were changed.
    // Sensor values are clamped to the sensor's range.
    int apply_updates(const std::vector<PinUpdate>& pins, const std::vector<SensorUpdate>& sensors);

    // Adopt the result of a simulation pass
    void replace(HardwareSnapshot snapshot);

    HardwareSnapshot snapshot();
    const std::string& board_id() const { return board_id_; }

    const PinState* pin(int n) const;
    const SensorState* sensor(const std::string& id) const;

    int64_t stamp();

private:
    std::map<int, PinState> pins_;
    std::map<std::string, SensorState> sensors_;
    std::string board_id_;
    int64_t last_stamp_;
};

} // namespace MuRuntime

#endif
