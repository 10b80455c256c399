#include "pounce/pounce.h"
#include "pounce/spawner.h"
#include "pounce/scoring.h"
#include "pounce/error.h"
#include "pounce/validate.h"
#include "pounce/log.h"

#include <stdlib.h>
#include <string.h>

struct Pounce_Spawner {
    Pounce_Config config;
    uint64_t last_spawn_ms;
    uint32_t total_spawned;

    /* Ring buffer of recent types */
    Pounce_ObstacleType history[POUNCE_SPAWN_HISTORY_MAX];
    int history_head;            /* Next write slot */
    int history_count;
};

static bool history_contains(const Pounce_Spawner *spawner, Pounce_ObstacleType type) {
    for (int i = 0; i < spawner->history_count; i++) {
        if (spawner->history[i] == type) return true;
    }
    return false;
}

static void history_push(Pounce_Spawner *spawner, Pounce_ObstacleType type) {
    int size = spawner->config.history_size;
    if (size <= 0) return;

    spawner->history[spawner->history_head] = type;
    spawner->history_head = (spawner->history_head + 1) % size;
    if (spawner->history_count < size) {
        spawner->history_count++;
    }
}

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

Pounce_Spawner *pounce_spawner_create(const Pounce_Config *config, uint64_t now_ms) {
    if (!config) {
        pounce_set_error("Spawner requires a config");
        return NULL;
    }

    Pounce_Spawner *spawner = POUNCE_ALLOC(Pounce_Spawner);
    if (!spawner) {
        pounce_set_error("Failed to allocate spawner");
        return NULL;
    }

    spawner->config = *config;
    if (spawner->config.history_size > POUNCE_SPAWN_HISTORY_MAX) {
        spawner->config.history_size = POUNCE_SPAWN_HISTORY_MAX;
    }
    pounce_spawner_reset(spawner, now_ms);
    return spawner;
}

void pounce_spawner_destroy(Pounce_Spawner *spawner) {
    free(spawner);
}

void pounce_spawner_reset(Pounce_Spawner *spawner, uint64_t now_ms) {
    POUNCE_VALIDATE_PTR(spawner);
    spawner->last_spawn_ms = now_ms;
    spawner->history_head = 0;
    spawner->history_count = 0;
}

/* ============================================================================
 * Type Selection
 * ============================================================================ */

int pounce_spawner_effective_weight(const Pounce_Spawner *spawner, Pounce_ObstacleType type) {
    if (!spawner || !pounce_obstacle_type_valid(type)) return 0;

    int weight = spawner->config.obstacles[type].weight;
    if (weight <= 0) return 0;

    if (history_contains(spawner, type)) {
        weight /= 2;
        if (weight < 1) weight = 1;
    }
    return weight;
}

Pounce_ObstacleType pounce_spawner_select_type(const Pounce_Spawner *spawner, Pounce_Rng *rng) {
    POUNCE_VALIDATE_PTRS2_RET(spawner, rng, POUNCE_OBSTACLE_STONE);

    int weights[POUNCE_OBSTACLE_TYPE_COUNT];
    int total = 0;
    for (int i = 0; i < POUNCE_OBSTACLE_TYPE_COUNT; i++) {
        weights[i] = pounce_spawner_effective_weight(spawner, (Pounce_ObstacleType)i);
        total += weights[i];
    }

    if (total <= 0) {
        return spawner->config.default_obstacle;
    }

    int roll = pounce_rng_int(rng, 0, total - 1);
    for (int i = 0; i < POUNCE_OBSTACLE_TYPE_COUNT; i++) {
        if (roll < weights[i]) {
            return (Pounce_ObstacleType)i;
        }
        roll -= weights[i];
    }

    return spawner->config.default_obstacle;
}

/* ============================================================================
 * Spawning
 * ============================================================================ */

Pounce_Obstacle *pounce_spawner_try_spawn(Pounce_Spawner *spawner, uint64_t now_ms,
                                          int32_t score, Pounce_ObstacleList *obstacles,
                                          Pounce_Rng *rng) {
    POUNCE_VALIDATE_PTRS2_RET(spawner, obstacles, NULL);
    POUNCE_VALIDATE_PTR_RET(rng, NULL);

    int64_t elapsed = (int64_t)(now_ms - spawner->last_spawn_ms);
    if (elapsed <= (int64_t)pounce_spawn_interval(&spawner->config, score)) {
        return NULL;
    }

    Pounce_ObstacleType type = pounce_spawner_select_type(spawner, rng);
    float jitter = spawner->config.speed_jitter;
    float speed = pounce_difficulty_speed(&spawner->config, score)
                + pounce_rng_range(rng, -jitter, jitter);

    Pounce_Obstacle *obs = pounce_obstacle_list_push(obstacles);
    if (!obs) {
        pounce_log_error(POUNCE_LOG_SPAWNER, "Cannot spawn %s: %s",
                         pounce_obstacle_type_name(type), pounce_get_last_error());
        return NULL;
    }

    pounce_obstacle_init(obs, type, &spawner->config, spawner->config.spawn_x,
                         spawner->config.ground_y, speed, rng);

    history_push(spawner, type);
    spawner->last_spawn_ms = now_ms;
    spawner->total_spawned++;

    pounce_log_debug(POUNCE_LOG_SPAWNER, "Spawned %s at y=%.0f speed=%.2f",
                     pounce_obstacle_type_name(type), (double)obs->y, (double)obs->speed);
    return obs;
}

/* ============================================================================
 * Queries
 * ============================================================================ */

int pounce_spawner_history(const Pounce_Spawner *spawner, Pounce_ObstacleType *out, int max) {
    if (!spawner || !out || max <= 0) return 0;

    int size = spawner->config.history_size;
    int count = spawner->history_count < max ? spawner->history_count : max;

    /* Oldest entry sits at head once the buffer is full */
    int start = spawner->history_count < size ? 0 : spawner->history_head;
    int skip = spawner->history_count - count;
    for (int i = 0; i < count; i++) {
        out[i] = spawner->history[(start + skip + i) % size];
    }
    return count;
}

uint32_t pounce_spawner_total_spawned(const Pounce_Spawner *spawner) {
    return spawner ? spawner->total_spawned : 0;
}

uint64_t pounce_spawner_last_spawn(const Pounce_Spawner *spawner) {
    return spawner ? spawner->last_spawn_ms : 0;
}
