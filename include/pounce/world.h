#ifndef POUNCE_WORLD_H
#define POUNCE_WORLD_H

#include "pounce/config.h"
#include "pounce/event.h"
#include "pounce/highscore.h"
#include "pounce/obstacle.h"
#include "pounce/particle.h"
#include "pounce/projectile.h"
#include "pounce/runner.h"
#include "pounce/spawner.h"
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * Pounce World
 *
 * The simulation context. Owns the runner, obstacles, projectiles,
 * particles, score, spawner, random generator and event dispatcher, and
 * advances all of them one frame per pounce_world_tick().
 *
 * Per tick:
 *   1. runner actions from the edge-triggered input
 *   2. spawning, and retiring off-screen entities
 *   3. physics for every entity
 *   4. collision resolution and scoring
 *   5. particle ageing
 *   6. deferred events are flushed
 *
 * Usage:
 *   Pounce_Config config;
 *   pounce_config_default(&config);
 *   Pounce_World *world = pounce_world_create(&config, store, 0);
 *
 *   while (running) {
 *       Pounce_TickInput input = {};
 *       pounce_input_fill_tick(actions, &input);
 *       pounce_world_tick(world, &input, SDL_GetTicks());
 *       draw(world);
 *   }
 *   pounce_world_destroy(world);
 */

/* Edge-triggered actions for one tick */
typedef struct Pounce_TickInput {
    bool jump;
    bool slide;
    bool shoot;
    bool restart;
    bool pause;                  /* Front-end only, ignored by the simulation */
    bool mute;                   /* Front-end only, ignored by the simulation */
} Pounce_TickInput;

typedef struct Pounce_WorldStats {
    int32_t score;
    int32_t high_score;
    int32_t combo;
    float speed;
    int32_t interval_ms;
    int double_jump_charges;
    int shot_charges;
    bool game_over;
    bool new_record;
    uint32_t frame;
    uint32_t obstacles_spawned;
} Pounce_WorldStats;

typedef struct Pounce_World Pounce_World;

/**
 * Create a world and start the first round at time 0.
 *
 * @param config Tuning, copied and sanitised
 * @param store  High-score persistence, borrowed; NULL keeps the high
 *               score in memory only
 * @param seed   Random seed, 0 for time-based seeding
 * @return New world or NULL on failure. Caller owns it and must call
 *         pounce_world_destroy().
 */
Pounce_World *pounce_world_create(const Pounce_Config *config, Pounce_HighScoreStore *store,
                                  uint32_t seed);

void pounce_world_destroy(Pounce_World *world);

/**
 * Advance one frame. While the round is over only input->restart is
 * honoured; the death fall and particles keep animating.
 *
 * @param now_ms Monotonic clock used for spawn timing
 */
void pounce_world_tick(Pounce_World *world, const Pounce_TickInput *input, uint64_t now_ms);

/**
 * Start a new round. The high score is kept; everything else returns to
 * its initial state. Emits ROUND_STARTED immediately.
 */
void pounce_world_reset(Pounce_World *world, uint64_t now_ms);

/**
 * Reseed the random generator and restart the spawner's history and timer.
 */
void pounce_world_reshuffle(Pounce_World *world, uint32_t seed);

/*============================================================================
 * Snapshots
 *============================================================================*/

const Pounce_Runner *pounce_world_get_runner(const Pounce_World *world);

const Pounce_Obstacle *pounce_world_get_obstacles(const Pounce_World *world, size_t *count);

const Pounce_Projectile *pounce_world_get_projectiles(const Pounce_World *world, size_t *count);

const Pounce_ParticlePool *pounce_world_get_particles(const Pounce_World *world);

const Pounce_Spawner *pounce_world_get_spawner(const Pounce_World *world);

void pounce_world_get_stats(const Pounce_World *world, Pounce_WorldStats *stats);

bool pounce_world_is_game_over(const Pounce_World *world);

const Pounce_Config *pounce_world_get_config(const Pounce_World *world);

/**
 * Dispatcher for world events. Owned by the world.
 */
Pounce_EventDispatcher *pounce_world_get_events(Pounce_World *world);

/*============================================================================
 * Direct Access
 *============================================================================*/

/**
 * Place an obstacle of the given type at base size with its top-left at
 * (x, y) and zero speed.
 *
 * @return The obstacle (valid until the next tick) or NULL on failure
 */
Pounce_Obstacle *pounce_world_add_obstacle(Pounce_World *world, Pounce_ObstacleType type,
                                           float x, float y);

Pounce_Runner *pounce_world_get_runner_mut(Pounce_World *world);

#endif /* POUNCE_WORLD_H */
