#include "pounce/pounce.h"
#include "pounce/world.h"
#include "pounce/collision.h"
#include "pounce/error.h"
#include "pounce/log.h"
#include "world_internal.h"

#include <stdlib.h>
#include <string.h>

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

Pounce_World *pounce_world_create(const Pounce_Config *config, Pounce_HighScoreStore *store,
                                  uint32_t seed) {
    if (!config) {
        pounce_set_error("World requires a config");
        return NULL;
    }

    Pounce_World *world = POUNCE_ALLOC(Pounce_World);
    if (!world) {
        pounce_set_error("Failed to allocate world");
        return NULL;
    }

    world->config = *config;
    pounce_config_sanitize(&world->config);
    world->store = store;
    pounce_rng_seed(&world->rng, seed);

    world->events = pounce_event_dispatcher_create();
    world->particles = pounce_particle_pool_create((uint32_t)world->config.max_particles);
    world->spawner = pounce_spawner_create(&world->config, 0);

    if (!world->events || !world->particles || !world->spawner ||
        !pounce_projectile_list_init(&world->projectiles, (size_t)world->config.max_projectiles)) {
        pounce_log_error(POUNCE_LOG_GAME, "World setup failed: %s", pounce_get_last_error());
        pounce_world_destroy(world);
        return NULL;
    }

    int32_t high_score = store ? pounce_highscore_load(store) : 0;
    pounce_score_reset(&world->score, &world->config, high_score);

    pounce_world_reset(world, 0);

    pounce_log_info(POUNCE_LOG_GAME, "World created (seed %u, high score %d)",
                    world->rng.seed, (int)high_score);
    return world;
}

void pounce_world_destroy(Pounce_World *world) {
    if (!world) return;

    pounce_spawner_destroy(world->spawner);
    pounce_particle_pool_destroy(world->particles);
    pounce_event_dispatcher_destroy(world->events);
    pounce_obstacle_list_free(&world->obstacles);
    pounce_projectile_list_free(&world->projectiles);
    free(world);
}

void pounce_world_reset(Pounce_World *world, uint64_t now_ms) {
    if (!world) return;

    pounce_runner_reset(&world->runner, &world->config, world->config.ground_y);
    pounce_obstacle_list_clear(&world->obstacles);
    pounce_projectile_list_clear(&world->projectiles);
    pounce_particle_pool_clear(world->particles);
    pounce_score_reset(&world->score, &world->config, world->score.high_score);
    pounce_spawner_reset(world->spawner, now_ms);

    world->game_over = false;
    world->now_ms = now_ms;

    /* Nothing from the previous round may leak into the new one */
    pounce_event_discard_deferred(world->events);
    pounce_event_emit_round_started(world->events);

    pounce_log_debug(POUNCE_LOG_GAME, "Round started");
}

void pounce_world_reshuffle(Pounce_World *world, uint32_t seed) {
    if (!world) return;

    pounce_rng_seed(&world->rng, seed);
    pounce_spawner_reset(world->spawner, world->now_ms);

    pounce_log_debug(POUNCE_LOG_SPAWNER, "Reshuffled with seed %u", world->rng.seed);
}

/* ============================================================================
 * Tick
 * ============================================================================ */

static void apply_actions(Pounce_World *world, const Pounce_TickInput *input) {
    Pounce_Runner *runner = &world->runner;

    if (input->jump) {
        bool grounded = runner->on_ground;
        if (pounce_runner_jump(runner, world->particles, &world->rng)) {
            Pounce_Event e = {};
            e.type = POUNCE_EVENT_RUNNER_JUMPED;
            e.runner.double_jump = !grounded;
            pounce_event_emit_deferred(world->events, &e);
        }
    }

    if (input->slide) {
        if (pounce_runner_slide(runner, world->particles, &world->rng)) {
            Pounce_Event e = {};
            e.type = POUNCE_EVENT_RUNNER_SLID;
            pounce_event_emit_deferred(world->events, &e);
        }
    }

    /* No charge is spent while every projectile slot is in flight */
    if (input->shoot && world->projectiles.count < world->projectiles.capacity &&
        pounce_runner_shoot(runner)) {
        Pounce_Projectile *p = pounce_projectile_list_fire(&world->projectiles,
                                                          runner->x + runner->width,
                                                          pounce_runner_center_y(runner),
                                                          world->config.projectile_width,
                                                          world->config.projectile_height,
                                                          world->config.projectile_speed);
        if (p) {
            Pounce_Event e = {};
            e.type = POUNCE_EVENT_PROJECTILE_FIRED;
            e.entity.type = -1;
            e.entity.x = p->x;
            e.entity.y = p->y;
            pounce_event_emit_deferred(world->events, &e);
        }
    }
}

static void spawn_and_retire(Pounce_World *world, uint64_t now_ms) {
    pounce_obstacle_list_compact(&world->obstacles);
    pounce_projectile_list_compact(&world->projectiles, world->config.screen_width);

    Pounce_Obstacle *obs = pounce_spawner_try_spawn(world->spawner, now_ms, world->score.score,
                                                    &world->obstacles, &world->rng);
    if (obs) {
        Pounce_Event e = {};
        e.type = POUNCE_EVENT_OBSTACLE_SPAWNED;
        e.entity.type = obs->type;
        e.entity.x = obs->x;
        e.entity.y = obs->y;
        pounce_event_emit_deferred(world->events, &e);
    }
}

static void step_physics(Pounce_World *world) {
    pounce_runner_update(&world->runner, world->config.ground_y);

    for (size_t i = 0; i < world->obstacles.count; i++) {
        pounce_obstacle_update(&world->obstacles.items[i]);
    }
    for (size_t i = 0; i < world->projectiles.count; i++) {
        pounce_projectile_update(&world->projectiles.items[i]);
    }
}

void pounce_world_tick(Pounce_World *world, const Pounce_TickInput *input, uint64_t now_ms) {
    if (!world) return;

    Pounce_TickInput none = {};
    if (!input) input = &none;

    world->frame++;
    world->now_ms = now_ms;
    pounce_event_set_frame(world->events, world->frame);

    if (world->game_over) {
        if (input->restart) {
            pounce_world_reset(world, now_ms);
            return;
        }

        /* Death fall and effects play out */
        pounce_runner_update(&world->runner, world->config.ground_y);
        pounce_particle_pool_update(world->particles);
        pounce_event_flush_deferred(world->events);
        return;
    }

    apply_actions(world, input);
    spawn_and_retire(world, now_ms);
    step_physics(world);
    pounce_collision_resolve(world);

    /* Drop what collision consumed */
    pounce_obstacle_list_compact(&world->obstacles);
    pounce_projectile_list_compact(&world->projectiles, world->config.screen_width);

    pounce_particle_pool_update(world->particles);
    pounce_event_flush_deferred(world->events);
}

/* ============================================================================
 * Snapshots
 * ============================================================================ */

const Pounce_Runner *pounce_world_get_runner(const Pounce_World *world) {
    return world ? &world->runner : NULL;
}

Pounce_Runner *pounce_world_get_runner_mut(Pounce_World *world) {
    return world ? &world->runner : NULL;
}

const Pounce_Obstacle *pounce_world_get_obstacles(const Pounce_World *world, size_t *count) {
    if (!world) {
        if (count) *count = 0;
        return NULL;
    }
    if (count) *count = world->obstacles.count;
    return world->obstacles.items;
}

const Pounce_Projectile *pounce_world_get_projectiles(const Pounce_World *world, size_t *count) {
    if (!world) {
        if (count) *count = 0;
        return NULL;
    }
    if (count) *count = world->projectiles.count;
    return world->projectiles.items;
}

const Pounce_ParticlePool *pounce_world_get_particles(const Pounce_World *world) {
    return world ? world->particles : NULL;
}

const Pounce_Spawner *pounce_world_get_spawner(const Pounce_World *world) {
    return world ? world->spawner : NULL;
}

void pounce_world_get_stats(const Pounce_World *world, Pounce_WorldStats *stats) {
    if (!stats) return;
    memset(stats, 0, sizeof(*stats));
    if (!world) return;

    stats->score = world->score.score;
    stats->high_score = world->score.high_score;
    stats->combo = world->score.combo;
    stats->speed = world->score.speed;
    stats->interval_ms = world->score.interval_ms;
    stats->double_jump_charges = world->runner.double_jump_charges;
    stats->shot_charges = world->runner.shot_charges;
    stats->game_over = world->game_over;
    stats->new_record = world->score.new_record;
    stats->frame = world->frame;
    stats->obstacles_spawned = pounce_spawner_total_spawned(world->spawner);
}

bool pounce_world_is_game_over(const Pounce_World *world) {
    return world ? world->game_over : false;
}

const Pounce_Config *pounce_world_get_config(const Pounce_World *world) {
    return world ? &world->config : NULL;
}

Pounce_EventDispatcher *pounce_world_get_events(Pounce_World *world) {
    return world ? world->events : NULL;
}

/* ============================================================================
 * Direct Access
 * ============================================================================ */

Pounce_Obstacle *pounce_world_add_obstacle(Pounce_World *world, Pounce_ObstacleType type,
                                           float x, float y) {
    POUNCE_VALIDATE_PTR_RET(world, NULL);

    Pounce_Obstacle *obs = pounce_obstacle_list_push(&world->obstacles);
    if (!obs) return NULL;

    pounce_obstacle_place(obs, type, x, y);
    return obs;
}
