#ifndef _MuRuntime_simulation_h_
#define _MuRuntime_simulation_h_

#include <cstdint>
#include <random>
#include <string>

#include "hardware.h"

namespace MuRuntime {

// Derives the next hardware state from executed source text
class SimulationStrategy {
public:
    virtual ~SimulationStrategy() = default;
    virtual HardwareSnapshot simulate(const std::string& source, HardwareSnapshot state) = 0;
};

// Pattern-matching approximation: board.<name> references toggle the
// mapped pin once per match (in document order) when the source touches
// digitalio; sensor-related keywords nudge the matching sensor by a small
// random delta clamped to its range.
class HeuristicSimulation : public SimulationStrategy {
public:
    explicit HeuristicSimulation(uint32_t seed = std::random_device{}());

    HardwareSnapshot simulate(const std::string& source, HardwareSnapshot state) override;

    // D0-D13 -> 0-13, LED -> 13, A0-A2 -> 14-16, otherwise -1
    static int map_pin_name(const std::string& name);

private:
    double jitter(double amplitude);

    std::mt19937 rng_;
};

// Leaves the state untouched
class NullSimulation : public SimulationStrategy {
public:
    HardwareSnapshot simulate(const std::string&, HardwareSnapshot state) override { return state; }
};

} // namespace MuRuntime

#endif
