#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <salvo/core/filesystem.hpp>
#include <salvo/sim/sim_settings.hpp>

#include <filesystem>

using namespace salvo::sim;
using Catch::Matchers::WithinAbs;

TEST_CASE("SimSettings defaults are valid", "[sim][settings]") {
    SimSettings settings;
    std::string error;
    REQUIRE(settings.validate(error));
    REQUIRE(error.empty());
    REQUIRE_THAT(settings.fixed_timestep, WithinAbs(1.0 / 60.0, 1e-12));
    REQUIRE(settings.max_substeps == 4);
}

TEST_CASE("SimSettings parse", "[sim][settings]") {
    SimSettings settings;

    SECTION("Present keys override, missing keys are kept") {
        REQUIRE(settings.parse(R"({
            "fixed_timestep": 0.02,
            "gravity": [0.0, -3.0, 0.0],
            "default_lifetime_ms": 2500,
            "log_level": "debug"
        })"));

        REQUIRE_THAT(settings.fixed_timestep, WithinAbs(0.02, 1e-12));
        REQUIRE_THAT(settings.gravity.y, WithinAbs(-3.0f, 1e-6f));
        REQUIRE(settings.default_lifetime_ms == 2500);
        REQUIRE(settings.log_level == LogLevel::Debug);
        REQUIRE(settings.max_substeps == 4);
        REQUIRE(settings.random_seed == 1337);
    }

    SECTION("Unknown log level keeps the current one") {
        REQUIRE(settings.parse(R"({ "log_level": "loud" })"));
        REQUIRE(settings.log_level == LogLevel::Info);
    }

    SECTION("Broken documents leave the settings untouched") {
        settings.default_lifetime_ms = 1234;

        REQUIRE_FALSE(settings.parse("{ not json"));
        REQUIRE_FALSE(settings.parse("[1, 2, 3]"));
        REQUIRE_FALSE(settings.parse(R"({ "max_substeps": "many" })"));
        REQUIRE(settings.default_lifetime_ms == 1234);
    }

    SECTION("Values that fail validation are rejected as a whole") {
        REQUIRE_FALSE(settings.parse(R"({ "default_lifetime_ms": 50, "fixed_timestep": 0.0 })"));
        REQUIRE(settings.default_lifetime_ms == 10000);
    }
}

TEST_CASE("SimSettings validate", "[sim][settings]") {
    SimSettings settings;
    std::string error;

    SECTION("Timestep") {
        settings.fixed_timestep = -0.1;
        REQUIRE_FALSE(settings.validate(error));
        REQUIRE(error == "fixed_timestep must be positive");
    }

    SECTION("Substeps") {
        settings.max_substeps = 0;
        REQUIRE_FALSE(settings.validate(error));
    }

    SECTION("Collider radius") {
        settings.default_collider_radius = 0.0f;
        REQUIRE_FALSE(settings.validate(error));
        REQUIRE(error == "default_collider_radius must be positive");
    }

    SECTION("Lifetime") {
        settings.default_lifetime_ms = 0;
        REQUIRE_FALSE(settings.validate(error));
    }
}

TEST_CASE("SimSettings save and load", "[sim][settings]") {
    auto path = (std::filesystem::temp_directory_path() / "salvo_settings_test.json").string();

    SimSettings saved;
    saved.swept_step_factor = 2.0f;
    saved.random_seed = 99;
    saved.log_level = LogLevel::Warn;
    REQUIRE(saved.save(path));
    REQUIRE(salvo::core::FileSystem::exists(path));

    SimSettings loaded;
    REQUIRE(loaded.load(path));
    REQUIRE_THAT(loaded.swept_step_factor, WithinAbs(2.0f, 1e-6f));
    REQUIRE(loaded.random_seed == 99);
    REQUIRE(loaded.log_level == LogLevel::Warn);

    loaded.reset();
    REQUIRE(loaded.random_seed == 1337);

    std::filesystem::remove(path);
    REQUIRE_FALSE(loaded.load(path));
}
