/*
 * Pounce Runner Tests
 *
 * Tests for runner physics, actions, power-up charges and hitbox.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "pounce/runner.h"
#include "pounce/config.h"
#include <string>

static const float GROUND = 500.0f;

static Pounce_Runner make_runner(Pounce_Config *config) {
    pounce_config_default(config);
    Pounce_Runner runner;
    pounce_runner_reset(&runner, config, GROUND);
    return runner;
}

/* ============================================================================
 * Reset
 * ============================================================================ */

TEST_CASE("Runner reset", "[runner][lifecycle]") {
    Pounce_Config config;
    Pounce_Runner runner = make_runner(&config);

    REQUIRE(runner.state == POUNCE_RUNNER_IDLE);
    REQUIRE(runner.on_ground);
    REQUIRE_FALSE(runner.is_dead);
    REQUIRE(runner.y + runner.height == GROUND);
    REQUIRE(runner.x == config.runner_x);
    REQUIRE(runner.double_jump_charges == 0);
    REQUIRE(runner.shot_charges == 0);

    SECTION("First update starts running") {
        pounce_runner_update(&runner, GROUND);
        REQUIRE(runner.state == POUNCE_RUNNER_RUN);
        REQUIRE(runner.on_ground);
    }

    SECTION("Starting charges come from config") {
        config.start_double_jumps = 2;
        config.start_shots = 1;
        pounce_runner_reset(&runner, &config, GROUND);
        REQUIRE(runner.double_jump_charges == 2);
        REQUIRE(runner.shot_charges == 1);
    }
}

/* ============================================================================
 * Jumping
 * ============================================================================ */

TEST_CASE("Runner jump", "[runner][jump]") {
    Pounce_Config config;
    Pounce_Runner runner = make_runner(&config);

    SECTION("Launch velocity survives the next tick") {
        REQUIRE(pounce_runner_jump(&runner, nullptr, nullptr));
        REQUIRE(runner.state == POUNCE_RUNNER_JUMP);
        REQUIRE_FALSE(runner.on_ground);

        pounce_runner_update(&runner, GROUND);
        REQUIRE(runner.velocity_y == config.jump_force);
        REQUIRE(runner.y == Catch::Approx(GROUND - runner.height + config.jump_force));
    }

    SECTION("Gravity accelerates every airborne tick after launch") {
        pounce_runner_jump(&runner, nullptr, nullptr);
        pounce_runner_update(&runner, GROUND);

        for (int i = 0; i < 10; i++) {
            float before = runner.velocity_y;
            pounce_runner_update(&runner, GROUND);
            REQUIRE(runner.velocity_y == Catch::Approx(before + config.gravity));
        }
    }

    SECTION("Runner falls and lands") {
        pounce_runner_jump(&runner, nullptr, nullptr);

        bool saw_fall = false;
        int ticks = 0;
        while (!runner.on_ground && ticks < 200) {
            pounce_runner_update(&runner, GROUND);
            if (runner.state == POUNCE_RUNNER_FALL) saw_fall = true;
            REQUIRE(runner.y + runner.height <= GROUND);
            ticks++;
        }

        REQUIRE(runner.on_ground);
        REQUIRE(saw_fall);
        REQUIRE(runner.state == POUNCE_RUNNER_RUN);
        REQUIRE(runner.velocity_y == 0.0f);
        REQUIRE(runner.y + runner.height == GROUND);
    }

    SECTION("Air jump needs a charge") {
        pounce_runner_jump(&runner, nullptr, nullptr);
        pounce_runner_update(&runner, GROUND);
        REQUIRE_FALSE(pounce_runner_jump(&runner, nullptr, nullptr));

        REQUIRE(pounce_runner_grant(&runner, POUNCE_POWER_DOUBLE_JUMP));
        REQUIRE(pounce_runner_jump(&runner, nullptr, nullptr));
        REQUIRE(runner.double_jump_charges == 0);
        REQUIRE(runner.velocity_y == Catch::Approx(config.jump_force * config.double_jump_factor));
        REQUIRE(runner.state == POUNCE_RUNNER_JUMP);

        pounce_runner_update(&runner, GROUND);
        REQUIRE(runner.velocity_y == Catch::Approx(config.jump_force * config.double_jump_factor));
    }

    SECTION("Ground jump cancels a slide") {
        pounce_runner_update(&runner, GROUND);
        REQUIRE(pounce_runner_slide(&runner, nullptr, nullptr));
        REQUIRE(pounce_runner_jump(&runner, nullptr, nullptr));
        REQUIRE_FALSE(runner.is_sliding);
        REQUIRE(runner.state == POUNCE_RUNNER_JUMP);
    }
}

/* ============================================================================
 * Sliding
 * ============================================================================ */

TEST_CASE("Runner slide", "[runner][slide]") {
    Pounce_Config config;
    Pounce_Runner runner = make_runner(&config);
    pounce_runner_update(&runner, GROUND);

    SECTION("Slide lasts slide_duration ticks") {
        REQUIRE(pounce_runner_slide(&runner, nullptr, nullptr));
        REQUIRE(runner.is_sliding);
        REQUIRE(runner.state == POUNCE_RUNNER_SLIDE);

        for (int i = 0; i < config.slide_duration - 1; i++) {
            pounce_runner_update(&runner, GROUND);
        }
        REQUIRE(runner.is_sliding);

        pounce_runner_update(&runner, GROUND);
        REQUIRE_FALSE(runner.is_sliding);
        REQUIRE(runner.state == POUNCE_RUNNER_RUN);
    }

    SECTION("Cooldown blocks a second slide") {
        REQUIRE(pounce_runner_slide(&runner, nullptr, nullptr));
        REQUIRE_FALSE(pounce_runner_slide(&runner, nullptr, nullptr));

        for (int i = 0; i < config.slide_duration; i++) {
            pounce_runner_update(&runner, GROUND);
        }
        REQUIRE_FALSE(runner.is_sliding);
        REQUIRE_FALSE(pounce_runner_slide(&runner, nullptr, nullptr));

        for (int i = config.slide_duration; i < config.slide_cooldown; i++) {
            pounce_runner_update(&runner, GROUND);
        }
        REQUIRE(pounce_runner_slide(&runner, nullptr, nullptr));
    }

    SECTION("Sliding again mid-slide keeps the timer running") {
        REQUIRE(pounce_runner_slide(&runner, nullptr, nullptr));
        for (int i = 0; i < 10; i++) {
            pounce_runner_update(&runner, GROUND);
        }
        int timer = runner.slide_timer;
        REQUIRE_FALSE(pounce_runner_slide(&runner, nullptr, nullptr));
        REQUIRE(runner.slide_timer == timer);
    }

    SECTION("Cannot slide in the air") {
        pounce_runner_jump(&runner, nullptr, nullptr);
        REQUIRE_FALSE(pounce_runner_slide(&runner, nullptr, nullptr));
    }
}

/* ============================================================================
 * Hitbox
 * ============================================================================ */

TEST_CASE("Runner hitbox", "[runner][hitbox]") {
    Pounce_Config config;
    Pounce_Runner runner = make_runner(&config);
    pounce_runner_update(&runner, GROUND);

    Pounce_Rect standing = pounce_runner_hitbox(&runner);
    REQUIRE(standing.x == Catch::Approx(runner.x + config.hitbox_inset_x));
    REQUIRE(standing.w == Catch::Approx(runner.width - 2.0f * config.hitbox_inset_x));
    REQUIRE(standing.y == Catch::Approx(GROUND - 46.0f));
    REQUIRE(standing.y + standing.h == Catch::Approx(GROUND));

    SECTION("Sliding halves the height with the bottom fixed") {
        pounce_runner_slide(&runner, nullptr, nullptr);
        Pounce_Rect sliding = pounce_runner_hitbox(&runner);
        REQUIRE(sliding.h == Catch::Approx(standing.h * config.slide_height_factor));
        REQUIRE(sliding.y == Catch::Approx(GROUND - 23.0f));
        REQUIRE(sliding.y + sliding.h == Catch::Approx(GROUND));
        REQUIRE(sliding.x == Catch::Approx(standing.x));
    }
}

/* ============================================================================
 * Charges and Shooting
 * ============================================================================ */

TEST_CASE("Runner power-up charges", "[runner][powerup]") {
    Pounce_Config config;
    Pounce_Runner runner = make_runner(&config);

    SECTION("Double jump charges cap") {
        for (int i = 0; i < config.max_double_jumps; i++) {
            REQUIRE(pounce_runner_grant(&runner, POUNCE_POWER_DOUBLE_JUMP));
        }
        REQUIRE_FALSE(pounce_runner_grant(&runner, POUNCE_POWER_DOUBLE_JUMP));
        REQUIRE(runner.double_jump_charges == config.max_double_jumps);
    }

    SECTION("Shot charges cap and are spent") {
        for (int i = 0; i < config.max_shots; i++) {
            REQUIRE(pounce_runner_grant(&runner, POUNCE_POWER_SHOT));
        }
        REQUIRE_FALSE(pounce_runner_grant(&runner, POUNCE_POWER_SHOT));

        REQUIRE(pounce_runner_shoot(&runner));
        REQUIRE(runner.shot_charges == config.max_shots - 1);
    }

    SECTION("Shooting without charges does nothing") {
        REQUIRE_FALSE(pounce_runner_shoot(&runner));
        REQUIRE(runner.shot_charges == 0);
    }

    SECTION("Unknown power is ignored") {
        REQUIRE_FALSE(pounce_runner_grant(&runner, POUNCE_POWER_NONE));
    }
}

/* ============================================================================
 * Death
 * ============================================================================ */

TEST_CASE("Runner death", "[runner][death]") {
    Pounce_Config config;
    Pounce_Runner runner = make_runner(&config);
    pounce_runner_update(&runner, GROUND);

    REQUIRE(pounce_runner_die(&runner, nullptr, nullptr));
    REQUIRE(runner.is_dead);
    REQUIRE(runner.state == POUNCE_RUNNER_DEAD);
    REQUIRE(runner.velocity_y == config.death_bounce);

    SECTION("Second death has no effect") {
        float vy = runner.velocity_y;
        REQUIRE_FALSE(pounce_runner_die(&runner, nullptr, nullptr));
        REQUIRE(runner.velocity_y == vy);
    }

    SECTION("Dead runner ignores actions") {
        pounce_runner_grant(&runner, POUNCE_POWER_SHOT);
        REQUIRE_FALSE(pounce_runner_jump(&runner, nullptr, nullptr));
        REQUIRE_FALSE(pounce_runner_slide(&runner, nullptr, nullptr));
        REQUIRE_FALSE(pounce_runner_shoot(&runner));
    }

    SECTION("Dead runner falls through the ground") {
        for (int i = 0; i < 60; i++) {
            pounce_runner_update(&runner, GROUND);
        }
        REQUIRE(runner.y > GROUND);
        REQUIRE(runner.state == POUNCE_RUNNER_DEAD);
    }

    SECTION("Death animation holds its last frame") {
        int ticks = config.animation_speed * (config.frames_dead + 4);
        for (int i = 0; i < ticks; i++) {
            pounce_runner_update(&runner, GROUND);
        }
        REQUIRE(runner.frame_index == config.frames_dead - 1);
    }
}

TEST_CASE("Runner state names", "[runner][names]") {
    REQUIRE(std::string(pounce_runner_state_name(POUNCE_RUNNER_SLIDE)) == "slide");
    REQUIRE(std::string(pounce_runner_state_name(POUNCE_RUNNER_DEAD)) == "dead");
    REQUIRE(std::string(pounce_runner_state_name(POUNCE_RUNNER_STATE_COUNT)) == "unknown");
}
