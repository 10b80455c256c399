/*
 * Pounce Collision Tests
 *
 * Tests for runner contacts, power-up collection, projectile hits and
 * pass scoring, driven through a world with hand-placed obstacles.
 */

#include <catch2/catch_test_macros.hpp>
#include "pounce/world.h"
#include "pounce/collision.h"
#include "pounce/config.h"
#include <vector>

static const float GROUND = 500.0f;

static Pounce_World *make_world() {
    Pounce_Config config;
    pounce_config_default(&config);
    return pounce_world_create(&config, nullptr, 1234);
}

static void record_event(const Pounce_Event *event, void *userdata) {
    static_cast<std::vector<Pounce_EventType> *>(userdata)->push_back(event->type);
}

static int count_type(const std::vector<Pounce_EventType> &events, Pounce_EventType type) {
    int n = 0;
    for (Pounce_EventType t : events) {
        if (t == type) n++;
    }
    return n;
}

/* Top-left y that lifts an obstacle of the given height off the ground */
static float lifted(float height, float lift) {
    return GROUND - lift - height;
}

/* ============================================================================
 * Runner vs Obstacles
 * ============================================================================ */

TEST_CASE("Ground obstacle contact is fatal", "[collision][runner]") {
    Pounce_World *world = make_world();
    REQUIRE(world != nullptr);

    pounce_world_add_obstacle(world, POUNCE_OBSTACLE_STONE, 110.0f, GROUND - 52.0f);
    Pounce_TickInput input = {};
    pounce_world_tick(world, &input, 16);

    Pounce_WorldStats stats;
    pounce_world_get_stats(world, &stats);
    REQUIRE(pounce_world_get_runner(world)->is_dead);
    REQUIRE(pounce_world_is_game_over(world));
    REQUIRE(stats.score == 0);

    pounce_world_destroy(world);
}

TEST_CASE("Stay-grounded obstacles", "[collision][runner]") {
    Pounce_World *world = make_world();
    REQUIRE(world != nullptr);
    Pounce_TickInput input = {};

    SECTION("Overlap while grounded is harmless") {
        pounce_world_add_obstacle(world, POUNCE_OBSTACLE_BALLOON, 110.0f, 420.0f);
        pounce_world_tick(world, &input, 16);
        REQUIRE_FALSE(pounce_world_get_runner(world)->is_dead);
        REQUIRE_FALSE(pounce_world_is_game_over(world));
    }

    SECTION("Overlap while airborne is fatal") {
        pounce_world_add_obstacle(world, POUNCE_OBSTACLE_BALLOON, 110.0f, 420.0f);
        input.jump = true;
        pounce_world_tick(world, &input, 16);
        REQUIRE(pounce_world_get_runner(world)->is_dead);
        REQUIRE(pounce_world_is_game_over(world));
    }

    SECTION("Passing it scores its pass value") {
        Pounce_Obstacle *obs = pounce_world_add_obstacle(world, POUNCE_OBSTACLE_BALLOON, 110.0f, 420.0f);
        REQUIRE(obs != nullptr);
        obs->speed = 10.0f;

        Pounce_WorldStats stats;
        for (int i = 1; i <= 10; i++) {
            pounce_world_tick(world, &input, (uint64_t)i * 16);
        }
        pounce_world_get_stats(world, &stats);
        REQUIRE_FALSE(stats.game_over);
        REQUIRE(stats.score == 2);
        REQUIRE(stats.combo == 1);
    }

    pounce_world_destroy(world);
}

TEST_CASE("Birds are cleared by sliding", "[collision][runner]") {
    Pounce_World *world = make_world();
    REQUIRE(world != nullptr);
    Pounce_TickInput input = {};

    pounce_world_add_obstacle(world, POUNCE_OBSTACLE_BIRD, 110.0f, lifted(24.0f, 34.0f));

    SECTION("Standing under a bird is fatal") {
        pounce_world_tick(world, &input, 16);
        REQUIRE(pounce_world_is_game_over(world));
    }

    SECTION("Sliding under a bird is safe") {
        input.slide = true;
        pounce_world_tick(world, &input, 16);
        REQUIRE(pounce_world_get_runner(world)->is_sliding);
        REQUIRE_FALSE(pounce_world_is_game_over(world));
    }

    pounce_world_destroy(world);
}

/* ============================================================================
 * Power-ups
 * ============================================================================ */

TEST_CASE("Power-up collection", "[collision][powerup]") {
    Pounce_World *world = make_world();
    REQUIRE(world != nullptr);
    std::vector<Pounce_EventType> events;
    pounce_event_subscribe_all(pounce_world_get_events(world), record_event, &events);
    Pounce_TickInput input = {};

    SECTION("Gem grants exactly one double jump") {
        pounce_world_add_obstacle(world, POUNCE_OBSTACLE_GEM, 110.0f, 460.0f);
        pounce_world_tick(world, &input, 16);

        Pounce_WorldStats stats;
        pounce_world_get_stats(world, &stats);
        REQUIRE(stats.double_jump_charges == 1);
        REQUIRE_FALSE(stats.game_over);
        REQUIRE(stats.score == 0);

        size_t count = 0;
        pounce_world_get_obstacles(world, &count);
        REQUIRE(count == 0);
        REQUIRE(count_type(events, POUNCE_EVENT_POWERUP_COLLECTED) == 1);
    }

    SECTION("Star grants a shot") {
        pounce_world_add_obstacle(world, POUNCE_OBSTACLE_STAR, 110.0f, 460.0f);
        pounce_world_tick(world, &input, 16);

        Pounce_WorldStats stats;
        pounce_world_get_stats(world, &stats);
        REQUIRE(stats.shot_charges == 1);
        REQUIRE(stats.double_jump_charges == 0);
    }

    SECTION("Collecting at the cap still consumes the power-up") {
        Pounce_Runner *runner = pounce_world_get_runner_mut(world);
        runner->double_jump_charges = runner->tuning.max_double_jumps;

        pounce_world_add_obstacle(world, POUNCE_OBSTACLE_GEM, 110.0f, 460.0f);
        pounce_world_tick(world, &input, 16);

        size_t count = 0;
        pounce_world_get_obstacles(world, &count);
        REQUIRE(count == 0);
        REQUIRE(pounce_world_get_runner(world)->double_jump_charges == runner->tuning.max_double_jumps);
    }

    SECTION("Passed power-ups score nothing") {
        pounce_world_add_obstacle(world, POUNCE_OBSTACLE_GEM, 10.0f, 300.0f);
        pounce_world_tick(world, &input, 16);

        Pounce_WorldStats stats;
        pounce_world_get_stats(world, &stats);
        REQUIRE(stats.score == 0);
        REQUIRE(stats.double_jump_charges == 0);
    }

    pounce_world_destroy(world);
}

/* ============================================================================
 * Projectiles
 * ============================================================================ */

TEST_CASE("Projectiles destroy obstacles", "[collision][projectile]") {
    Pounce_World *world = make_world();
    REQUIRE(world != nullptr);
    std::vector<Pounce_EventType> events;
    pounce_event_subscribe_all(pounce_world_get_events(world), record_event, &events);

    pounce_runner_grant(pounce_world_get_runner_mut(world), POUNCE_POWER_SHOT);
    pounce_world_add_obstacle(world, POUNCE_OBSTACLE_STONE, 160.0f, GROUND - 52.0f);

    Pounce_TickInput input = {};
    input.shoot = true;
    pounce_world_tick(world, &input, 16);

    Pounce_WorldStats stats;
    pounce_world_get_stats(world, &stats);
    REQUIRE_FALSE(stats.game_over);
    REQUIRE(stats.shot_charges == 0);
    REQUIRE(stats.score == 1);
    REQUIRE(stats.combo == 0);

    size_t obstacles = 0;
    size_t projectiles = 0;
    pounce_world_get_obstacles(world, &obstacles);
    pounce_world_get_projectiles(world, &projectiles);
    REQUIRE(obstacles == 0);
    REQUIRE(projectiles == 0);

    REQUIRE(count_type(events, POUNCE_EVENT_PROJECTILE_FIRED) == 1);
    REQUIRE(count_type(events, POUNCE_EVENT_OBSTACLE_DESTROYED) == 1);

    pounce_world_destroy(world);
}

TEST_CASE("Shooting without charges fires nothing", "[collision][projectile]") {
    Pounce_World *world = make_world();
    REQUIRE(world != nullptr);

    Pounce_TickInput input = {};
    input.shoot = true;
    pounce_world_tick(world, &input, 16);

    size_t projectiles = 0;
    pounce_world_get_projectiles(world, &projectiles);
    REQUIRE(projectiles == 0);

    pounce_world_destroy(world);
}

/* ============================================================================
 * Repeated Resolution
 * ============================================================================ */

TEST_CASE("An obstacle contributes to the score once", "[collision][idempotent]") {
    Pounce_World *world = make_world();
    REQUIRE(world != nullptr);
    std::vector<Pounce_EventType> events;
    pounce_event_subscribe_all(pounce_world_get_events(world), record_event, &events);
    Pounce_TickInput input = {};

    /* Drifts slowly so it overlaps the grounded runner for many ticks */
    Pounce_Obstacle *obs = pounce_world_add_obstacle(world, POUNCE_OBSTACLE_BALLOON, 110.0f, 420.0f);
    REQUIRE(obs != nullptr);
    obs->speed = 1.0f;

    int overlapping_ticks = 0;
    int ticks_after_pass = 0;
    for (int i = 0; i < 150; i++) {
        /* Fixed clock: the spawner never adds a second obstacle */
        pounce_world_tick(world, &input, 16);

        size_t count = 0;
        const Pounce_Obstacle *live = pounce_world_get_obstacles(world, &count);
        REQUIRE(count == 1);

        Pounce_Rect hitbox = pounce_runner_hitbox(pounce_world_get_runner(world));
        Pounce_Rect orect = pounce_obstacle_rect(&live[0]);
        Pounce_WorldStats stats;
        pounce_world_get_stats(world, &stats);
        REQUIRE_FALSE(stats.game_over);

        if (pounce_rect_overlaps(&hitbox, &orect)) {
            overlapping_ticks++;
            REQUIRE(stats.score == 0);
        } else if (live[0].scored) {
            ticks_after_pass++;
            REQUIRE(stats.score == 2);
            REQUIRE(stats.combo == 1);
        }
    }

    REQUIRE(overlapping_ticks > 10);
    REQUIRE(ticks_after_pass > 10);

    pounce_event_flush_deferred(pounce_world_get_events(world));
    REQUIRE(count_type(events, POUNCE_EVENT_SCORE_CHANGED) == 1);

    pounce_world_destroy(world);
}

TEST_CASE("Resolving twice changes nothing", "[collision][idempotent]") {
    Pounce_World *world = make_world();
    REQUIRE(world != nullptr);
    std::vector<Pounce_EventType> events;
    pounce_event_subscribe_all(pounce_world_get_events(world), record_event, &events);

    SECTION("Pass scoring happens once") {
        pounce_world_add_obstacle(world, POUNCE_OBSTACLE_CACTUS, 10.0f, GROUND - 80.0f);
        REQUIRE_FALSE(pounce_collision_resolve(world));
        REQUIRE_FALSE(pounce_collision_resolve(world));

        Pounce_WorldStats stats;
        pounce_world_get_stats(world, &stats);
        REQUIRE(stats.score == 1);
    }

    SECTION("Death happens once") {
        pounce_world_add_obstacle(world, POUNCE_OBSTACLE_STONE, 110.0f, GROUND - 52.0f);
        REQUIRE(pounce_collision_resolve(world));
        REQUIRE_FALSE(pounce_collision_resolve(world));

        pounce_event_flush_deferred(pounce_world_get_events(world));
        REQUIRE(count_type(events, POUNCE_EVENT_GAME_OVER) == 1);
    }

    pounce_world_destroy(world);
}
