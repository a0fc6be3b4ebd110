#pragma once

#include <cstdint>

namespace salvo::core {

// Fixed timestep accumulator for deterministic simulation
struct GameClock {
    double fixed_dt;           // Fixed timestep duration in seconds (from SimSettings)
    uint32_t max_substeps;     // Upper bound on ticks consumed per frame
    double accumulator;        // Accumulated time for fixed updates
    double alpha;              // Interpolation factor for rendering (0 to 1)

    explicit GameClock(double timestep = 1.0 / 60.0, uint32_t substeps = 4)
        : fixed_dt(timestep)
        , max_substeps(substeps == 0 ? 1 : substeps)
        , accumulator(0.0)
        , alpha(0.0)
    {}

    // Add frame time. Anything beyond max_substeps ticks is dropped so a long
    // stall cannot snowball into ever longer frames.
    void update(double dt) {
        if (dt > 0.0) {
            accumulator += dt;
        }
        double max_accumulator = fixed_dt * static_cast<double>(max_substeps);
        if (accumulator > max_accumulator) {
            accumulator = max_accumulator;
        }
    }

    // Returns true if a fixed update tick should run.
    // Call in a while loop until it returns false.
    bool consume_tick() {
        if (accumulator >= fixed_dt) {
            accumulator -= fixed_dt;
            return true;
        }
        alpha = accumulator / fixed_dt;
        return false;
    }

    double get_alpha() const {
        return alpha;
    }

    void reset() {
        accumulator = 0.0;
        alpha = 0.0;
    }
};

} // namespace salvo::core
