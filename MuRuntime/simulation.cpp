#include "MuRuntime.h"

namespace MuRuntime {

HeuristicSimulation::HeuristicSimulation(uint32_t seed) : rng_(seed) {}

int HeuristicSimulation::map_pin_name(const std::string& name) {
    static const std::map<std::string, int> pin_map = {
        {"D0", 0}, {"D1", 1}, {"D2", 2}, {"D3", 3}, {"D4", 4}, {"D5", 5},
        {"D6", 6}, {"D7", 7}, {"D8", 8}, {"D9", 9}, {"D10", 10}, {"D11", 11},
        {"D12", 12}, {"D13", 13}, {"LED", 13}, {"A0", 14}, {"A1", 15}, {"A2", 16}
    };
    auto it = pin_map.find(name);
    return it == pin_map.end() ? -1 : it->second;
}

// Uniform in [-amplitude, amplitude)
double HeuristicSimulation::jitter(double amplitude) {
    std::uniform_real_distribution<double> dist(-amplitude, amplitude);
    return dist(rng_);
}

HardwareSnapshot HeuristicSimulation::simulate(const std::string& source, HardwareSnapshot state) {
    auto contains = [&](const char* word) { return source.find(word) != std::string::npos; };

    if (contains("digitalio") || contains("DigitalInOut")) {
        static const std::regex pin_ref(R"(board\.(\w+))");
        for (auto it = std::sregex_iterator(source.begin(), source.end(), pin_ref);
             it != std::sregex_iterator(); ++it) {
            int n = map_pin_name((*it)[1].str());
            if (n < 0) continue;
            auto pin = state.pins.find(n);
            if (pin == state.pins.end()) continue;
            pin->second.value = !pin->second.value;
            pin->second.last_changed = state.timestamp;
        }
    }

    for (auto& [id, sensor] : state.sensors) {
        if (!sensor.is_active) continue;

        double amplitude = 0.0;
        if (sensor.type == "temperature") {
            if (contains("temperature") || contains("temp")) amplitude = 1.0;
        } else if (sensor.type == "light") {
            if (contains("light")) amplitude = 50.0;
        } else if (!sensor.type.empty() && contains(sensor.type.c_str())) {
            amplitude = sensor.range.span() * 0.01;
        }
        if (amplitude <= 0.0) continue;

        sensor.value = sensor.range.clamp(sensor.value + jitter(amplitude));
        sensor.last_reading = state.timestamp;
    }

    return state;
}

} // namespace MuRuntime
