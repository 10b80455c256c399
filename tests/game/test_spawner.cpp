/*
 * Pounce Spawner Tests
 *
 * Tests for interval gating, weighted type selection and the anti-repeat
 * history.
 */

#include <catch2/catch_test_macros.hpp>
#include "pounce/spawner.h"
#include "pounce/config.h"
#include "pounce/scoring.h"
#include <vector>

static void only_types(Pounce_Config *config, Pounce_ObstacleType a, Pounce_ObstacleType b) {
    for (int i = 0; i < POUNCE_OBSTACLE_TYPE_COUNT; i++) {
        config->obstacles[i].weight = 0;
    }
    config->obstacles[a].weight = 30;
    config->obstacles[b].weight = 30;
}

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

TEST_CASE("Spawner lifecycle", "[spawner][lifecycle]") {
    Pounce_Config config;
    pounce_config_default(&config);

    Pounce_Spawner *spawner = pounce_spawner_create(&config, 1000);
    REQUIRE(spawner != nullptr);
    REQUIRE(pounce_spawner_last_spawn(spawner) == 1000);
    REQUIRE(pounce_spawner_total_spawned(spawner) == 0);
    pounce_spawner_destroy(spawner);

    REQUIRE(pounce_spawner_create(nullptr, 0) == nullptr);
    pounce_spawner_destroy(nullptr);
}

/* ============================================================================
 * Interval Gating
 * ============================================================================ */

TEST_CASE("Spawner respects the spawn interval", "[spawner][interval]") {
    Pounce_Config config;
    pounce_config_default(&config);
    Pounce_Rng rng;
    pounce_rng_seed(&rng, 3);
    Pounce_ObstacleList list = {};

    Pounce_Spawner *spawner = pounce_spawner_create(&config, 0);
    REQUIRE(spawner != nullptr);

    SECTION("Nothing spawns until the interval has strictly elapsed") {
        REQUIRE(pounce_spawner_try_spawn(spawner, 100, 0, &list, &rng) == nullptr);
        REQUIRE(pounce_spawner_try_spawn(spawner, 1500, 0, &list, &rng) == nullptr);
        REQUIRE(list.count == 0);

        REQUIRE(pounce_spawner_try_spawn(spawner, 1501, 0, &list, &rng) != nullptr);
        REQUIRE(list.count == 1);
        REQUIRE(pounce_spawner_last_spawn(spawner) == 1501);

        REQUIRE(pounce_spawner_try_spawn(spawner, 1502, 0, &list, &rng) == nullptr);
        REQUIRE(list.count == 1);
    }

    SECTION("Higher scores shorten the interval") {
        int32_t score = 70;
        REQUIRE(pounce_spawn_interval(&config, score) == 800);
        REQUIRE(pounce_spawner_try_spawn(spawner, 801, score, &list, &rng) != nullptr);
    }

    SECTION("A clock behind the last spawn never spawns") {
        pounce_spawner_reset(spawner, 5000);
        REQUIRE(pounce_spawner_try_spawn(spawner, 10, 0, &list, &rng) == nullptr);
    }

    SECTION("At most one obstacle per call") {
        REQUIRE(pounce_spawner_try_spawn(spawner, 100000, 0, &list, &rng) != nullptr);
        REQUIRE(list.count == 1);
    }

    SECTION("New obstacles enter at the spawn edge with jittered speed") {
        Pounce_Obstacle *obs = pounce_spawner_try_spawn(spawner, 2000, 0, &list, &rng);
        REQUIRE(obs != nullptr);
        REQUIRE(obs->x == config.spawn_x);
        REQUIRE(obs->speed >= config.base_speed - config.speed_jitter);
        REQUIRE(obs->speed <= config.base_speed + config.speed_jitter);
        REQUIRE(pounce_spawner_total_spawned(spawner) == 1);
    }

    pounce_spawner_destroy(spawner);
    pounce_obstacle_list_free(&list);
}

/* ============================================================================
 * Type Selection
 * ============================================================================ */

TEST_CASE("Spawner type selection", "[spawner][weights]") {
    Pounce_Config config;
    pounce_config_default(&config);
    Pounce_Rng rng;
    pounce_rng_seed(&rng, 11);

    SECTION("Zero weight types are never drawn") {
        only_types(&config, POUNCE_OBSTACLE_CACTUS, POUNCE_OBSTACLE_BIRD);
        Pounce_Spawner *spawner = pounce_spawner_create(&config, 0);
        for (int i = 0; i < 1000; i++) {
            Pounce_ObstacleType t = pounce_spawner_select_type(spawner, &rng);
            REQUIRE((t == POUNCE_OBSTACLE_CACTUS || t == POUNCE_OBSTACLE_BIRD));
        }
        pounce_spawner_destroy(spawner);
    }

    SECTION("All weights zero falls back to the default obstacle") {
        for (int i = 0; i < POUNCE_OBSTACLE_TYPE_COUNT; i++) {
            config.obstacles[i].weight = 0;
        }
        config.default_obstacle = POUNCE_OBSTACLE_BUSH;
        Pounce_Spawner *spawner = pounce_spawner_create(&config, 0);
        REQUIRE(pounce_spawner_select_type(spawner, &rng) == POUNCE_OBSTACLE_BUSH);
        pounce_spawner_destroy(spawner);
    }

    SECTION("Recent types have their weight halved") {
        for (int i = 0; i < POUNCE_OBSTACLE_TYPE_COUNT; i++) {
            config.obstacles[i].weight = 0;
        }
        config.obstacles[POUNCE_OBSTACLE_STONE].weight = 30;
        Pounce_Spawner *spawner = pounce_spawner_create(&config, 0);
        Pounce_ObstacleList list = {};

        REQUIRE(pounce_spawner_effective_weight(spawner, POUNCE_OBSTACLE_STONE) == 30);
        REQUIRE(pounce_spawner_try_spawn(spawner, 2000, 0, &list, &rng) != nullptr);
        REQUIRE(pounce_spawner_effective_weight(spawner, POUNCE_OBSTACLE_STONE) == 15);
        REQUIRE(pounce_spawner_effective_weight(spawner, POUNCE_OBSTACLE_BUSH) == 0);

        pounce_spawner_destroy(spawner);
        pounce_obstacle_list_free(&list);
    }

    SECTION("Halved weights never drop below one") {
        for (int i = 0; i < POUNCE_OBSTACLE_TYPE_COUNT; i++) {
            config.obstacles[i].weight = 0;
        }
        config.obstacles[POUNCE_OBSTACLE_BUSH].weight = 1;
        Pounce_Spawner *spawner = pounce_spawner_create(&config, 0);
        Pounce_ObstacleList list = {};

        Pounce_Obstacle *obs = pounce_spawner_try_spawn(spawner, 2000, 0, &list, &rng);
        REQUIRE(obs != nullptr);
        REQUIRE(obs->type == POUNCE_OBSTACLE_BUSH);
        REQUIRE(pounce_spawner_effective_weight(spawner, POUNCE_OBSTACLE_BUSH) == 1);

        pounce_spawner_destroy(spawner);
        pounce_obstacle_list_free(&list);
    }

    SECTION("Anti-repeat lowers the chance of an immediate repeat") {
        only_types(&config, POUNCE_OBSTACLE_STONE, POUNCE_OBSTACLE_BUSH);
        config.history_size = 1;
        Pounce_Spawner *spawner = pounce_spawner_create(&config, 0);
        Pounce_ObstacleList list = {};

        Pounce_Obstacle *first = pounce_spawner_try_spawn(spawner, 2000, 0, &list, &rng);
        REQUIRE(first != nullptr);
        Pounce_ObstacleType last = first->type;

        const int draws = 20000;
        int repeats = 0;
        for (int i = 0; i < draws; i++) {
            if (pounce_spawner_select_type(spawner, &rng) == last) repeats++;
        }

        /* 15 / (15 + 30) with the history, 1/2 without */
        double ratio = (double)repeats / draws;
        REQUIRE(ratio > 0.29);
        REQUIRE(ratio < 0.38);

        pounce_spawner_destroy(spawner);
        pounce_obstacle_list_free(&list);
    }

    SECTION("Without history the draw is plain weighted sampling") {
        only_types(&config, POUNCE_OBSTACLE_STONE, POUNCE_OBSTACLE_BUSH);
        config.history_size = 0;
        Pounce_Spawner *spawner = pounce_spawner_create(&config, 0);
        Pounce_ObstacleList list = {};

        REQUIRE(pounce_spawner_try_spawn(spawner, 2000, 0, &list, &rng) != nullptr);
        REQUIRE(pounce_spawner_effective_weight(spawner, POUNCE_OBSTACLE_STONE) == 30);
        REQUIRE(pounce_spawner_effective_weight(spawner, POUNCE_OBSTACLE_BUSH) == 30);

        const int draws = 20000;
        int stones = 0;
        for (int i = 0; i < draws; i++) {
            if (pounce_spawner_select_type(spawner, &rng) == POUNCE_OBSTACLE_STONE) stones++;
        }
        double ratio = (double)stones / draws;
        REQUIRE(ratio > 0.45);
        REQUIRE(ratio < 0.55);

        pounce_spawner_destroy(spawner);
        pounce_obstacle_list_free(&list);
    }
}

/* ============================================================================
 * History
 * ============================================================================ */

TEST_CASE("Spawner history", "[spawner][history]") {
    Pounce_Config config;
    pounce_config_default(&config);
    config.history_size = 3;
    Pounce_Rng rng;
    pounce_rng_seed(&rng, 21);
    Pounce_ObstacleList list = {};

    Pounce_Spawner *spawner = pounce_spawner_create(&config, 0);
    REQUIRE(spawner != nullptr);

    Pounce_ObstacleType spawned[5];
    for (int i = 0; i < 5; i++) {
        Pounce_Obstacle *obs = pounce_spawner_try_spawn(spawner, (uint64_t)(i + 1) * 2000, 0, &list, &rng);
        REQUIRE(obs != nullptr);
        spawned[i] = obs->type;
    }

    SECTION("Keeps the most recent types, oldest first") {
        Pounce_ObstacleType history[POUNCE_SPAWN_HISTORY_MAX];
        int n = pounce_spawner_history(spawner, history, POUNCE_SPAWN_HISTORY_MAX);
        REQUIRE(n == 3);
        REQUIRE(history[0] == spawned[2]);
        REQUIRE(history[1] == spawned[3]);
        REQUIRE(history[2] == spawned[4]);
    }

    SECTION("Truncated reads return the newest entries") {
        Pounce_ObstacleType history[2];
        int n = pounce_spawner_history(spawner, history, 2);
        REQUIRE(n == 2);
        REQUIRE(history[0] == spawned[3]);
        REQUIRE(history[1] == spawned[4]);
    }

    SECTION("Reset forgets the history") {
        pounce_spawner_reset(spawner, 20000);
        Pounce_ObstacleType history[POUNCE_SPAWN_HISTORY_MAX];
        REQUIRE(pounce_spawner_history(spawner, history, POUNCE_SPAWN_HISTORY_MAX) == 0);
        REQUIRE(pounce_spawner_total_spawned(spawner) == 5);
    }

    pounce_spawner_destroy(spawner);
    pounce_obstacle_list_free(&list);
}

/* Count runs of three identical types in a row */
static int count_triples(const std::vector<Pounce_ObstacleType> &types) {
    int triples = 0;
    for (size_t i = 2; i < types.size(); i++) {
        if (types[i] == types[i - 1] && types[i] == types[i - 2]) triples++;
    }
    return triples;
}

static std::vector<Pounce_ObstacleType> spawn_sequence(Pounce_Config *config, int count) {
    Pounce_Rng rng;
    pounce_rng_seed(&rng, 1001);
    Pounce_ObstacleList list = {};
    Pounce_Spawner *spawner = pounce_spawner_create(config, 0);

    std::vector<Pounce_ObstacleType> types;
    for (int i = 1; i <= count; i++) {
        Pounce_Obstacle *obs = pounce_spawner_try_spawn(spawner, (uint64_t)i * 2000, 0, &list, &rng);
        if (obs) types.push_back(obs->type);
        pounce_obstacle_list_clear(&list);
    }

    pounce_spawner_destroy(spawner);
    pounce_obstacle_list_free(&list);
    return types;
}

TEST_CASE("History makes triple repeats rarer", "[spawner][history]") {
    Pounce_Config config;
    pounce_config_default(&config);

    config.history_size = 0;
    std::vector<Pounce_ObstacleType> plain = spawn_sequence(&config, 5000);

    config.history_size = 3;
    std::vector<Pounce_ObstacleType> anti = spawn_sequence(&config, 5000);

    REQUIRE(plain.size() == 5000);
    REQUIRE(anti.size() == 5000);
    REQUIRE(count_triples(anti) < count_triples(plain));
}
