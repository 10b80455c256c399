#ifndef POUNCE_SPAWNER_H
#define POUNCE_SPAWNER_H

#include "pounce/config.h"
#include "pounce/obstacle.h"
#include "pounce/rng.h"
#include <stdbool.h>
#include <stdint.h>

/**
 * Obstacle Spawner
 *
 * Creates at most one obstacle per call once the score-dependent spawn
 * interval has elapsed. Types are drawn by configured weight; a type that
 * appears in the recent history has its weight halved (floored at 1), which
 * breaks up long runs of the same obstacle.
 *
 * Usage:
 *   Pounce_Spawner *spawner = pounce_spawner_create(&config, now_ms);
 *   Pounce_Obstacle *obs = pounce_spawner_try_spawn(spawner, now_ms, score,
 *                                                   &obstacles, &rng);
 */

typedef struct Pounce_Spawner Pounce_Spawner;

/**
 * Create a spawner. The config is copied.
 *
 * @return New spawner or NULL on failure. Caller owns it and must call
 *         pounce_spawner_destroy().
 */
Pounce_Spawner *pounce_spawner_create(const Pounce_Config *config, uint64_t now_ms);

void pounce_spawner_destroy(Pounce_Spawner *spawner);

/**
 * Forget the history and restart the spawn timer at now_ms.
 */
void pounce_spawner_reset(Pounce_Spawner *spawner, uint64_t now_ms);

/**
 * Append a new obstacle if more than spawn_interval(score) milliseconds have
 * passed since the last spawn.
 *
 * @return The new obstacle (owned by the list) or NULL
 */
Pounce_Obstacle *pounce_spawner_try_spawn(Pounce_Spawner *spawner, uint64_t now_ms,
                                          int32_t score, Pounce_ObstacleList *obstacles,
                                          Pounce_Rng *rng);

/**
 * Draw a type using the history-adjusted weights. Does not record it.
 */
Pounce_ObstacleType pounce_spawner_select_type(const Pounce_Spawner *spawner, Pounce_Rng *rng);

/**
 * Effective weight of a type after the history adjustment.
 */
int pounce_spawner_effective_weight(const Pounce_Spawner *spawner, Pounce_ObstacleType type);

/**
 * Recently spawned types, oldest first.
 *
 * @return Number of entries written to out
 */
int pounce_spawner_history(const Pounce_Spawner *spawner, Pounce_ObstacleType *out, int max);

/**
 * Total obstacles spawned since creation.
 */
uint32_t pounce_spawner_total_spawned(const Pounce_Spawner *spawner);

uint64_t pounce_spawner_last_spawn(const Pounce_Spawner *spawner);

#endif /* POUNCE_SPAWNER_H */
