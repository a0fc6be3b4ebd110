#include <salvo/sim/sim_settings.hpp>
#include <salvo/core/filesystem.hpp>
#include <nlohmann/json.hpp>

#include <cmath>

namespace salvo::sim {

using json = nlohmann::json;

bool SimSettings::load(const std::string& path) {
    auto content = FileSystem::read_text(path);
    if (!content) {
        log(LogLevel::Warn, "[SimSettings] Cannot open {}", path);
        return false;
    }
    if (!parse(*content)) {
        log(LogLevel::Warn, "[SimSettings] Failed to load {}", path);
        return false;
    }
    return true;
}

bool SimSettings::parse(const std::string& text) {
    SimSettings parsed = *this;

    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            log(LogLevel::Error, "[SimSettings] Root must be an object");
            return false;
        }

        parsed.fixed_timestep = j.value("fixed_timestep", parsed.fixed_timestep);
        parsed.max_substeps = j.value("max_substeps", parsed.max_substeps);
        if (j.contains("gravity") && j["gravity"].is_array() && j["gravity"].size() >= 3) {
            parsed.gravity.x = j["gravity"][0].get<float>();
            parsed.gravity.y = j["gravity"][1].get<float>();
            parsed.gravity.z = j["gravity"][2].get<float>();
        }

        parsed.default_collider_radius = j.value("default_collider_radius", parsed.default_collider_radius);
        parsed.swept_step_factor = j.value("swept_step_factor", parsed.swept_step_factor);
        parsed.default_lifetime_ms = j.value("default_lifetime_ms", parsed.default_lifetime_ms);
        parsed.random_seed = j.value("random_seed", parsed.random_seed);

        if (j.contains("log_level")) {
            std::string level_name = j["log_level"].get<std::string>();
            if (!parse_log_level(level_name, parsed.log_level)) {
                log(LogLevel::Warn, "[SimSettings] Unknown log level '{}', keeping {}",
                    level_name, log_level_name(parsed.log_level));
            }
        }
    } catch (const json::exception& e) {
        log(LogLevel::Error, "[SimSettings] JSON error: {}", e.what());
        return false;
    }

    std::string error;
    if (!parsed.validate(error)) {
        log(LogLevel::Error, "[SimSettings] {}", error);
        return false;
    }

    *this = parsed;
    return true;
}

bool SimSettings::save(const std::string& path) const {
    return FileSystem::write_text(path, dump());
}

std::string SimSettings::dump() const {
    json j;

    j["fixed_timestep"] = fixed_timestep;
    j["max_substeps"] = max_substeps;
    j["gravity"] = {gravity.x, gravity.y, gravity.z};
    j["default_collider_radius"] = default_collider_radius;
    j["swept_step_factor"] = swept_step_factor;
    j["default_lifetime_ms"] = default_lifetime_ms;
    j["random_seed"] = random_seed;
    j["log_level"] = log_level_name(log_level);

    return j.dump(4);
}

bool SimSettings::validate(std::string& out_error) const {
    if (!(fixed_timestep > 0.0) || !std::isfinite(fixed_timestep)) {
        out_error = "fixed_timestep must be positive";
        return false;
    }
    if (max_substeps == 0) {
        out_error = "max_substeps must be at least 1";
        return false;
    }
    if (!is_finite(gravity)) {
        out_error = "gravity must be finite";
        return false;
    }
    if (!(default_collider_radius > 0.0f)) {
        out_error = "default_collider_radius must be positive";
        return false;
    }
    if (!(swept_step_factor > 0.0f)) {
        out_error = "swept_step_factor must be positive";
        return false;
    }
    if (default_lifetime_ms == 0) {
        out_error = "default_lifetime_ms must be positive";
        return false;
    }
    return true;
}

void SimSettings::reset() {
    *this = SimSettings{};
}

} // namespace salvo::sim
