#include "pounce/pounce.h"
#include "pounce/collision.h"
#include "pounce/log.h"
#include "world_internal.h"

static void emit_entity(Pounce_EventDispatcher *events, Pounce_EventType type,
                        int entity_type, float x, float y) {
    Pounce_Event e = {};
    e.type = type;
    e.entity.type = entity_type;
    e.entity.x = x;
    e.entity.y = y;
    pounce_event_emit_deferred(events, &e);
}

static float center_x(const Pounce_Obstacle *obs) {
    return obs->x + obs->width * 0.5f;
}

static float center_y(const Pounce_Obstacle *obs) {
    return obs->y + obs->height * 0.5f;
}

/* ============================================================================
 * Runner vs Obstacles
 * ============================================================================ */

static void collect_powerup(Pounce_World *world, Pounce_Obstacle *obs,
                            const Pounce_ObstacleTypeInfo *info) {
    Pounce_Runner *runner = &world->runner;

    if (!pounce_runner_grant(runner, info->power)) {
        pounce_log_debug(POUNCE_LOG_COLLISION, "%s collected at cap", info->name);
    }

    pounce_particle_preset_reward(world->particles, &world->rng, center_x(obs), center_y(obs));

    Pounce_Event e = {};
    e.type = POUNCE_EVENT_POWERUP_COLLECTED;
    e.powerup.power = info->power;
    e.powerup.charges = info->power == POUNCE_POWER_SHOT
                      ? runner->shot_charges : runner->double_jump_charges;
    pounce_event_emit_deferred(world->events, &e);

    obs->scored = true;
    obs->alive = false;
}

static bool is_fatal(const Pounce_Runner *runner, Pounce_ClearRule rule) {
    switch (rule) {
        case POUNCE_CLEAR_STAY_GROUNDED: return !runner->on_ground;
        case POUNCE_CLEAR_SLIDE:         return !runner->is_sliding;
        case POUNCE_CLEAR_COLLECT:       return false;
        case POUNCE_CLEAR_JUMP:
        default:                         return true;
    }
}

static bool resolve_runner(Pounce_World *world, const Pounce_Rect *hitbox) {
    Pounce_Runner *runner = &world->runner;

    for (size_t i = 0; i < world->obstacles.count; i++) {
        Pounce_Obstacle *obs = &world->obstacles.items[i];
        if (!obs->alive) continue;

        Pounce_Rect rect = pounce_obstacle_rect(obs);
        if (!pounce_rect_overlaps(hitbox, &rect)) continue;

        const Pounce_ObstacleTypeInfo *info = pounce_obstacle_type_info(obs->type);
        if (info->clear == POUNCE_CLEAR_COLLECT) {
            collect_powerup(world, obs, info);
            continue;
        }

        if (!is_fatal(runner, info->clear)) continue;

        pounce_log_info(POUNCE_LOG_COLLISION, "Runner hit %s (%s) at x=%.0f",
                        info->name, pounce_runner_state_name(runner->state), (double)obs->x);

        pounce_runner_die(runner, world->particles, &world->rng);
        world->game_over = true;
        pounce_score_finish(&world->score, world->store, world->events);
        return true;
    }

    return false;
}

/* ============================================================================
 * Projectiles vs Obstacles
 * ============================================================================ */

static void resolve_projectiles(Pounce_World *world) {
    for (size_t p = 0; p < world->projectiles.count; p++) {
        Pounce_Projectile *proj = &world->projectiles.items[p];
        if (!proj->alive) continue;

        Pounce_Rect prect = pounce_projectile_rect(proj);

        for (size_t i = 0; i < world->obstacles.count; i++) {
            Pounce_Obstacle *obs = &world->obstacles.items[i];
            if (!obs->alive) continue;

            Pounce_Rect orect = pounce_obstacle_rect(obs);
            if (!pounce_rect_overlaps(&prect, &orect)) continue;

            proj->alive = false;
            obs->alive = false;

            const Pounce_ObstacleTypeInfo *info = pounce_obstacle_type_info(obs->type);
            if (!obs->scored) {
                obs->scored = true;
                if (info->kind != POUNCE_KIND_POWERUP) {
                    const Pounce_ObstacleTuning *tuning = pounce_config_obstacle(&world->config, obs->type);
                    pounce_score_add(&world->score, &world->config, tuning->pass_score, world->events);
                }
            }

            pounce_particle_preset_explosion(world->particles, &world->rng, center_x(obs), center_y(obs));
            emit_entity(world->events, POUNCE_EVENT_OBSTACLE_DESTROYED, obs->type,
                        center_x(obs), center_y(obs));
            break;
        }
    }
}

/* ============================================================================
 * Passing
 * ============================================================================ */

static void resolve_passing(Pounce_World *world, const Pounce_Rect *hitbox) {
    const Pounce_Runner *runner = &world->runner;

    for (size_t i = 0; i < world->obstacles.count; i++) {
        Pounce_Obstacle *obs = &world->obstacles.items[i];
        if (!obs->alive || obs->scored) continue;
        Pounce_Rect orect = pounce_obstacle_rect(obs);
        if (pounce_rect_right(&orect) >= hitbox->x) continue;

        obs->scored = true;

        const Pounce_ObstacleTypeInfo *info = pounce_obstacle_type_info(obs->type);
        const Pounce_ObstacleTuning *tuning = pounce_config_obstacle(&world->config, obs->type);
        pounce_score_pass(&world->score, &world->config, info->kind, tuning->pass_score,
                          pounce_runner_center_x(runner), runner->y, world->events);
    }
}

/* ============================================================================
 * Public API
 * ============================================================================ */

bool pounce_collision_resolve(Pounce_World *world) {
    if (!world) return false;

    Pounce_Rect hitbox = pounce_runner_hitbox(&world->runner);

    if (!world->game_over && !world->runner.is_dead) {
        if (resolve_runner(world, &hitbox)) {
            return true;
        }
    }

    resolve_projectiles(world);
    resolve_passing(world, &hitbox);
    return false;
}
