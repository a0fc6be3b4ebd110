#include "commands.hpp"

#include <salvo/core/event_dispatcher.hpp>
#include <salvo/core/filesystem.hpp>
#include <salvo/core/log.hpp>
#include <salvo/physics/query_world.hpp>
#include <salvo/sim/simulation.hpp>
#include <salvo/sim/spawn_codec.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace salvo::cli {

using json = nlohmann::json;
using namespace salvo::sim;

namespace {

struct ScheduledSpawn {
    uint32_t at_ms = 0;
    SpawnEvent event;
};

struct Scenario {
    SimSettings settings;
    uint32_t duration_ms = 0;
    physics::QueryWorld world;
    std::map<uint32_t, std::string> actor_names;
    std::vector<ScheduledSpawn> spawns;
};

std::optional<json> read_json(const std::string& path) {
    auto text = core::FileSystem::read_text(path);
    if (!text) {
        std::cerr << "Error: cannot read " << path << "\n";
        return std::nullopt;
    }
    json j = json::parse(*text, nullptr, false);
    if (j.is_discarded()) {
        std::cerr << "Error: " << path << " is not valid JSON\n";
        return std::nullopt;
    }
    return j;
}

bool load_actor(const json& a, Scenario& scenario, std::string& out_error) {
    if (!a.is_object()) {
        out_error = "actors entries must be objects";
        return false;
    }

    Vec3 position;
    if (!a.contains("position") || !vec3_from_json(a["position"], position)) {
        out_error = "actor position must be a 3-element array";
        return false;
    }

    uint16_t layer = a.value("layer", physics::layers::STATIC);
    std::string shape = a.value("shape", std::string("sphere"));

    physics::ActorId id;
    if (shape == "sphere") {
        id = scenario.world.add_sphere(position, a.value("radius", 0.5f), layer);
    } else if (shape == "box") {
        Vec3 half{0.5f};
        if (a.contains("halfExtents") && !vec3_from_json(a["halfExtents"], half)) {
            out_error = "actor halfExtents must be a 3-element array";
            return false;
        }
        id = scenario.world.add_box(position, half, layer);
    } else {
        out_error = "unknown actor shape '" + shape + "'";
        return false;
    }

    scenario.actor_names[id.id] = a.value("name", "actor" + std::to_string(id.id));
    return true;
}

bool load_scenario(const json& root, Scenario& scenario, std::string& out_error) {
    if (!root.is_object()) {
        out_error = "scenario root must be an object";
        return false;
    }

    try {
        if (root.contains("settings") && !scenario.settings.parse(root["settings"].dump())) {
            out_error = "invalid settings";
            return false;
        }
        scenario.duration_ms = root.value("duration_ms", 5000u);

        for (const auto& a : root.value("actors", json::array())) {
            if (!load_actor(a, scenario, out_error)) return false;
        }

        for (const auto& s : root.value("spawns", json::array())) {
            ScheduledSpawn spawn;
            spawn.at_ms = s.value("at", 0u);
            auto event = decode_spawn_event(s, out_error);
            if (!event) return false;
            spawn.event = std::move(*event);
            scenario.spawns.push_back(std::move(spawn));
        }
    } catch (const json::exception& e) {
        out_error = e.what();
        return false;
    }

    std::stable_sort(scenario.spawns.begin(), scenario.spawns.end(),
        [](const ScheduledSpawn& a, const ScheduledSpawn& b) { return a.at_ms < b.at_ms; });
    return true;
}

} // namespace

// ============================================================================
// run
// ============================================================================

Result cmd_run(const std::string& scenario_path, const RunOptions& options) {
    auto root = read_json(scenario_path);
    if (!root) return Result::FileError;

    Scenario scenario;
    std::string error;
    if (!load_scenario(*root, scenario, error)) {
        std::cerr << "Error: " << error << "\n";
        return Result::ParseError;
    }

    core::set_log_level(options.verbose ? core::LogLevel::Debug : scenario.settings.log_level);

    core::EventDispatcher events;
    Simulation sim(scenario.world, events, scenario.settings);

    auto actor_name = [&scenario](physics::ActorId id) {
        auto it = scenario.actor_names.find(id.id);
        return it != scenario.actor_names.end() ? it->second : std::string("?");
    };

    std::map<std::string, float> damage_taken;
    std::map<std::string, uint32_t> completions;

    auto on_damage = events.subscribe<DamageAppliedEvent>([&](const DamageAppliedEvent& e) {
        std::string target = actor_name(e.info.target);
        damage_taken[target] += e.info.amount;
        if (options.verbose) {
            std::cout << "  [" << sim_to_ms(sim.now()) << " ms] " << target << " took "
                      << e.info.amount << " " << e.info.damage_type << " ("
                      << to_string(e.info.kind) << ")\n";
        }
    });
    auto on_complete = events.subscribe<EntityCompletedEvent>([&](const EntityCompletedEvent& e) {
        completions[to_string(e.reason)]++;
        std::cout << "  [" << sim_to_ms(sim.now()) << " ms] " << e.archetype << " #"
                  << to_integral(e.id) << " " << to_string(e.state) << " (" << to_string(e.reason)
                  << ") after " << e.distance_traveled << " m\n";
    });

    std::cout << "Running " << scenario_path << " (" << scenario.spawns.size() << " spawns, "
              << scenario.world.actor_count() << " actors)\n";

    float dt = static_cast<float>(scenario.settings.fixed_timestep);
    SimTime end = ms_to_sim(scenario.duration_ms);
    size_t next_spawn = 0;
    uint32_t ticks = 0;

    while (sim.now() < end) {
        if (options.max_ticks > 0 && ticks >= options.max_ticks) break;

        while (next_spawn < scenario.spawns.size() &&
               ms_to_sim(scenario.spawns[next_spawn].at_ms) <= sim.now()) {
            const auto& scheduled = scenario.spawns[next_spawn++];
            auto result = sim.spawn(scheduled.event.spec);
            if (!result) {
                std::cerr << "  spawn of " << scheduled.event.type << " rejected: "
                          << to_string(result.error) << "\n";
            }
        }

        sim.tick(dt);
        ++ticks;

        if (next_spawn >= scenario.spawns.size() && sim.registry().size() == 0 &&
            sim.registry().pending_count() == 0) {
            break;
        }
    }

    sim.shutdown();

    const SimStats& stats = sim.stats();
    std::cout << "\nTicks: " << stats.ticks << "  Spawned: " << stats.spawned << "  Rejected: " << stats.rejected
              << "  Hits: " << stats.hits << "  Completed: " << stats.completed << "  Faults: " << stats.faults << "\n";

    if (!damage_taken.empty()) {
        std::cout << "Damage taken:\n";
        for (const auto& [name, amount] : damage_taken) {
            std::cout << "  " << name << ": " << amount << "\n";
        }
    }
    if (!completions.empty()) {
        std::cout << "Completions:\n";
        for (const auto& [reason, count] : completions) {
            std::cout << "  " << reason << ": " << count << "\n";
        }
    }

    return stats.faults > 0 ? Result::RuntimeError : Result::Success;
}

// ============================================================================
// decode
// ============================================================================

Result cmd_decode(const std::string& event_path) {
    auto root = read_json(event_path);
    if (!root) return Result::FileError;

    std::string error;
    auto event = decode_spawn_event(*root, error);
    if (!event) {
        std::cerr << "Invalid spawn event: " << error << "\n";
        return Result::ParseError;
    }

    SpawnError spawn_error = EntityRegistry::validate(event->spec);
    if (spawn_error != SpawnError::None) {
        std::cerr << "Spawn would be rejected: " << to_string(spawn_error) << "\n";
        return Result::ParseError;
    }

    std::cout << encode_spawn_event(*event).dump(2) << "\n";
    return Result::Success;
}

void cmd_help() {
    std::cout << R"(Salvo CLI - projectile simulation tool

Usage: salvo <command> [options]

Commands:
  run <scenario.json>   Simulate a scenario headlessly
                          --ticks <n>     Stop after n ticks
                          --verbose       Print every damage application

  decode <event.json>   Validate a spawn event and print it normalized

  help                  Show this help message

Scenario format:
  {
    "settings":    { "fixed_timestep": 0.016, "gravity": [0,-9.81,0], ... },
    "duration_ms": 5000,
    "actors":      [ { "name": "wall", "shape": "box", "position": [0,0,5],
                       "halfExtents": [2,2,0.1], "layer": 0 } ],
    "spawns":      [ { "at": 0, "type": "fireball",
                       "config": { "startPosition": [0,1,0], "direction": [0,0,1],
                                   "speed": 25, "duration": 1500 } } ]
  }

Examples:
  salvo run scenarios/wall.json
  salvo decode fireball.json
)";
}

} // namespace salvo::cli
