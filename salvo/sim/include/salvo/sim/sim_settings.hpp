#pragma once

#include <salvo/core/log.hpp>
#include <salvo/core/math.hpp>

#include <cstdint>
#include <string>

namespace salvo::sim {

using namespace salvo::core;

struct SimSettings {
    double fixed_timestep = 1.0 / 60.0;     // Seconds per tick for advance()
    uint32_t max_substeps = 4;              // Ticks per advance() call at most
    Vec3 gravity{0.0f, -9.81f, 0.0f};       // Dynamic motion

    float default_collider_radius = 0.25f;
    float swept_step_factor = 1.0f;         // Auto collision goes swept past diameter * factor
    uint32_t default_lifetime_ms = 10000;   // Entities spawned without any budget

    uint32_t random_seed = 1337;            // Trigger-chance rolls
    LogLevel log_level = LogLevel::Info;

    // Load settings from JSON file
    bool load(const std::string& path);

    // Save settings to JSON file
    bool save(const std::string& path) const;

    // Parse/serialize a JSON document. Missing keys keep their current value.
    bool parse(const std::string& text);
    std::string dump() const;

    // Reject values the simulation cannot run with
    bool validate(std::string& out_error) const;

    void reset();
};

} // namespace salvo::sim
