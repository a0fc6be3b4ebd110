#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <salvo/physics/query_world.hpp>
#include <salvo/sim/movement.hpp>

#include <cmath>

using namespace salvo::sim;
using salvo::physics::QueryWorld;
using Catch::Matchers::WithinAbs;

namespace {

Motion kinematic_motion(const Vec3& direction, float speed) {
    Motion motion;
    motion.direction = direction;
    motion.speed = speed;
    motion.velocity = direction * speed;
    return motion;
}

} // namespace

// ============================================================================
// Kinematic motion
// ============================================================================

TEST_CASE("Kinematic closed form", "[sim][movement]") {
    Motion motion = kinematic_motion(Vec3(1.0f, 0.0f, 0.0f), 10.0f);
    motion.anchor_position = Vec3(0.0f, 2.0f, 0.0f);
    motion.anchor_time = ms_to_sim(100);

    Vec3 p = MovementIntegrator::kinematic_position(motion, ms_to_sim(600));
    REQUIRE_THAT(p.x, WithinAbs(5.0f, 1e-4f));
    REQUIRE_THAT(p.y, WithinAbs(2.0f, 1e-6f));

    // Time before the anchor never runs backwards
    Vec3 before = MovementIntegrator::kinematic_position(motion, 0);
    REQUIRE_THAT(before.x, WithinAbs(0.0f, 1e-6f));
}

TEST_CASE("Kinematic integration tracks distance", "[sim][movement]") {
    QueryWorld world;
    MovementIntegrator integrator(world, Vec3(0.0f, -9.81f, 0.0f));
    Motion motion = kinematic_motion(Vec3(1.0f, 0.0f, 0.0f), 10.0f);

    integrator.integrate(motion, nullptr, ms_to_sim(100), 0.1f);
    REQUIRE_THAT(motion.position.x, WithinAbs(1.0f, 1e-4f));
    REQUIRE_THAT(motion.step_length, WithinAbs(1.0f, 1e-4f));
    REQUIRE_THAT(motion.distance_traveled, WithinAbs(1.0f, 1e-4f));
    REQUIRE_THAT(motion.previous_position.x, WithinAbs(0.0f, 1e-6f));

    integrator.integrate(motion, nullptr, ms_to_sim(200), 0.1f);
    REQUIRE_THAT(motion.position.x, WithinAbs(2.0f, 1e-4f));
    REQUIRE_THAT(motion.distance_traveled, WithinAbs(2.0f, 1e-4f));

    // Kinematic motion ignores gravity
    REQUIRE_THAT(motion.position.y, WithinAbs(0.0f, 1e-6f));
}

TEST_CASE("Integration clamps to the distance budget", "[sim][movement]") {
    QueryWorld world;
    MovementIntegrator integrator(world, Vec3(0.0f));
    Motion motion = kinematic_motion(Vec3(1.0f, 0.0f, 0.0f), 10.0f);

    Lifetime lifetime;
    lifetime.max_distance = 2.5f;

    integrator.integrate(motion, &lifetime, ms_to_sim(100), 0.1f);
    integrator.integrate(motion, &lifetime, ms_to_sim(200), 0.1f);
    REQUIRE_FALSE(motion.distance_capped);
    REQUIRE_THAT(motion.position.x, WithinAbs(2.0f, 1e-4f));

    integrator.integrate(motion, &lifetime, ms_to_sim(300), 0.1f);
    REQUIRE(motion.distance_capped);
    REQUIRE_THAT(motion.position.x, WithinAbs(2.5f, 1e-4f));
    REQUIRE_THAT(motion.step_length, WithinAbs(0.5f, 1e-4f));
    REQUIRE(motion.distance_traveled == 2.5f);
}

// ============================================================================
// Dynamic motion
// ============================================================================

TEST_CASE("Dynamic integration applies scaled gravity", "[sim][movement]") {
    QueryWorld world;
    MovementIntegrator integrator(world, Vec3(0.0f, -10.0f, 0.0f));

    Motion motion = kinematic_motion(Vec3(1.0f, 0.0f, 0.0f), 10.0f);

    SECTION("Unit gravity scale") {
        motion.model = MotionModel::dynamic();
        integrator.integrate(motion, nullptr, ms_to_sim(100), 0.1f);

        REQUIRE_THAT(motion.velocity.y, WithinAbs(-1.0f, 1e-5f));
        REQUIRE_THAT(motion.position.x, WithinAbs(1.0f, 1e-5f));
        REQUIRE_THAT(motion.position.y, WithinAbs(-0.1f, 1e-5f));
        REQUIRE_THAT(motion.speed, WithinAbs(std::sqrt(101.0f), 1e-4f));
        REQUIRE_THAT(glm::length(motion.direction), WithinAbs(1.0f, 1e-5f));
        REQUIRE(motion.direction.y < 0.0f);
    }

    SECTION("Zero gravity scale flies straight") {
        motion.model = MotionModel::dynamic(0.0f);
        integrator.integrate(motion, nullptr, ms_to_sim(100), 0.1f);
        integrator.integrate(motion, nullptr, ms_to_sim(200), 0.1f);

        REQUIRE_THAT(motion.position.x, WithinAbs(2.0f, 1e-5f));
        REQUIRE_THAT(motion.position.y, WithinAbs(0.0f, 1e-6f));
    }
}

// ============================================================================
// Homing
// ============================================================================

TEST_CASE("Homing steers toward the target and keeps speed", "[sim][movement]") {
    QueryWorld world;
    MovementIntegrator integrator(world, Vec3(0.0f));
    Motion motion = kinematic_motion(Vec3(1.0f, 0.0f, 0.0f), 10.0f);
    motion.position = Vec3(0.0f);

    SECTION("Partial blend toward a point") {
        HomingConfig homing;
        homing.strength = 0.1f;
        homing.target_point = Vec3(0.0f, 0.0f, 10.0f);

        REQUIRE(integrator.steer(homing, motion, ms_to_sim(50), 0.1f));
        REQUIRE(motion.direction.z > 0.0f);
        REQUIRE(motion.direction.x > motion.direction.z);
        REQUIRE_THAT(glm::length(motion.direction), WithinAbs(1.0f, 1e-5f));
        REQUIRE_THAT(motion.speed, WithinAbs(10.0f, 1e-6f));

        // Kinematic motion restarts its closed form from here
        REQUIRE(motion.anchor_time == ms_to_sim(50));
    }

    SECTION("Strong homing snaps onto the target direction") {
        HomingConfig homing;
        homing.strength = 5.0f;
        homing.target_point = Vec3(0.0f, 0.0f, 10.0f);

        REQUIRE(integrator.steer(homing, motion, 0, 0.1f));
        REQUIRE_THAT(motion.direction.z, WithinAbs(1.0f, 1e-5f));
    }

    SECTION("Dynamic motion keeps its velocity magnitude") {
        motion.model = MotionModel::dynamic();
        HomingConfig homing;
        homing.strength = 5.0f;
        homing.target_point = Vec3(0.0f, 10.0f, 0.0f);

        REQUIRE(integrator.steer(homing, motion, 0, 0.1f));
        REQUIRE_THAT(motion.velocity.y, WithinAbs(10.0f, 1e-4f));
    }

    SECTION("Tracked actor that is gone leaves the direction alone") {
        auto actor = world.add_sphere(Vec3(0.0f, 0.0f, 10.0f), 1.0f);
        HomingConfig homing;
        homing.target_actor = actor;
        world.remove(actor);

        REQUIRE_FALSE(integrator.steer(homing, motion, 0, 0.1f));
        REQUIRE_THAT(motion.direction.x, WithinAbs(1.0f, 1e-6f));
    }

    SECTION("Target directly behind cannot be blended") {
        HomingConfig homing;
        homing.strength = 0.05f;
        homing.target_point = Vec3(-10.0f, 0.0f, 0.0f);

        // t = 0.5 blends (1,0,0) and (-1,0,0) to zero
        REQUIRE_FALSE(integrator.steer(homing, motion, 0, 1.0f));
        REQUIRE_THAT(motion.direction.x, WithinAbs(1.0f, 1e-6f));
    }
}

TEST_CASE("Steered kinematic motion still covers speed * dt", "[sim][movement]") {
    QueryWorld world;
    MovementIntegrator integrator(world, Vec3(0.0f));
    Motion motion = kinematic_motion(Vec3(1.0f, 0.0f, 0.0f), 10.0f);

    HomingConfig homing;
    homing.strength = 1.0f;
    homing.target_point = Vec3(0.0f, 0.0f, 20.0f);

    const float dt = 1.0f / 60.0f;
    SimTime now = 0;

    SECTION("One step") {
        SimTime step_start = now;
        now += seconds_to_sim(dt);

        REQUIRE(integrator.steer(homing, motion, step_start, dt));
        integrator.integrate(motion, nullptr, now, dt);

        REQUIRE_THAT(motion.step_length, WithinAbs(10.0f * dt, 1e-4f));
        REQUIRE_THAT(glm::length(motion.position), WithinAbs(10.0f * dt, 1e-4f));
    }

    SECTION("Distance accumulates over many steered steps") {
        for (int i = 0; i < 30; ++i) {
            SimTime step_start = now;
            now += seconds_to_sim(dt);
            integrator.steer(homing, motion, step_start, dt);
            integrator.integrate(motion, nullptr, now, dt);
        }

        REQUIRE_THAT(motion.distance_traveled, WithinAbs(5.0f, 1e-2f));
        REQUIRE(motion.position.z > 1.0f);
        REQUIRE(motion.direction.z > 0.9f);
    }
}

// ============================================================================
// Attached zones
// ============================================================================

TEST_CASE("Attached zones follow their target", "[sim][movement]") {
    QueryWorld world;
    MovementIntegrator integrator(world, Vec3(0.0f));
    auto target = world.add_sphere(Vec3(1.0f, 0.0f, 0.0f), 0.5f);

    Motion motion;
    motion.position = Vec3(1.0f, 0.0f, 0.0f);

    AreaEffectZone zone;
    zone.attached_target = target;

    world.set_position(target, Vec3(4.0f, 0.0f, 0.0f));
    integrator.follow(motion, zone);
    REQUIRE_THAT(motion.position.x, WithinAbs(4.0f, 1e-6f));
    REQUIRE_THAT(motion.distance_traveled, WithinAbs(3.0f, 1e-6f));

    // Target gone: the zone stays where it was last seen
    world.remove(target);
    integrator.follow(motion, zone);
    REQUIRE_THAT(motion.position.x, WithinAbs(4.0f, 1e-6f));

    SECTION("Free zones never move") {
        AreaEffectZone free_zone;
        free_zone.radius = 2.0f;
        integrator.follow(motion, free_zone);
        REQUIRE_THAT(motion.position.x, WithinAbs(4.0f, 1e-6f));
        REQUIRE_THAT(motion.step_length, WithinAbs(0.0f, 1e-6f));
    }
}
