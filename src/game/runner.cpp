#include "pounce/pounce.h"
#include "pounce/runner.h"

#include <string.h>

/* ============================================================================
 * Helpers
 * ============================================================================ */

static void set_state(Pounce_Runner *runner, Pounce_RunnerState state) {
    if (runner->state == state) return;
    runner->state = state;
    runner->frame_index = 0;
}

/* Restarts the animation even if the state is unchanged (air jumps) */
static void restart_state(Pounce_Runner *runner, Pounce_RunnerState state) {
    runner->state = state;
    runner->frame_index = 0;
    runner->anim_timer = 0;
}

static void end_slide(Pounce_Runner *runner) {
    runner->is_sliding = false;
    runner->slide_timer = 0;
}

static void advance_animation(Pounce_Runner *runner) {
    runner->anim_timer++;
    if (runner->anim_timer < runner->tuning.animation_speed) return;
    runner->anim_timer = 0;

    int frames = runner->tuning.frame_counts[runner->state];
    if (frames < 1) frames = 1;

    if (runner->state == POUNCE_RUNNER_DEAD) {
        /* Death holds its final frame */
        if (runner->frame_index < frames - 1) {
            runner->frame_index++;
        }
    } else {
        runner->frame_index = (runner->frame_index + 1) % frames;
    }
}

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

void pounce_runner_reset(Pounce_Runner *runner, const Pounce_Config *config, float ground_y) {
    if (!runner || !config) return;

    memset(runner, 0, sizeof(*runner));

    Pounce_RunnerTuning *t = &runner->tuning;
    t->gravity = config->gravity;
    t->jump_force = config->jump_force;
    t->double_jump_factor = config->double_jump_factor;
    t->death_bounce = config->death_bounce;
    t->hitbox_inset_x = config->hitbox_inset_x;
    t->hitbox_inset_top = config->hitbox_inset_top;
    t->slide_height_factor = config->slide_height_factor;
    t->slide_duration = config->slide_duration;
    t->slide_cooldown = config->slide_cooldown;
    t->max_double_jumps = config->max_double_jumps;
    t->max_shots = config->max_shots;
    t->animation_speed = config->animation_speed > 0 ? config->animation_speed : 1;
    t->frame_counts[POUNCE_RUNNER_IDLE] = config->frames_idle;
    t->frame_counts[POUNCE_RUNNER_RUN] = config->frames_run;
    t->frame_counts[POUNCE_RUNNER_JUMP] = config->frames_jump;
    t->frame_counts[POUNCE_RUNNER_FALL] = config->frames_fall;
    t->frame_counts[POUNCE_RUNNER_SLIDE] = config->frames_slide;
    t->frame_counts[POUNCE_RUNNER_DEAD] = config->frames_dead;

    runner->width = config->runner_width;
    runner->height = config->runner_height;
    runner->x = config->runner_x;
    runner->y = ground_y - runner->height;
    runner->on_ground = true;
    runner->state = POUNCE_RUNNER_IDLE;
    runner->double_jump_charges = config->start_double_jumps;
    runner->shot_charges = config->start_shots;
}

/* ============================================================================
 * Actions
 * ============================================================================ */

bool pounce_runner_jump(Pounce_Runner *runner, Pounce_ParticlePool *particles, Pounce_Rng *rng) {
    if (!runner || runner->is_dead) return false;

    if (runner->on_ground) {
        if (runner->is_sliding) {
            end_slide(runner);
        }

        runner->velocity_y = runner->tuning.jump_force;
        runner->on_ground = false;
        runner->fresh_jump = true;
        restart_state(runner, POUNCE_RUNNER_JUMP);

        if (particles && rng) {
            pounce_particle_preset_jump_dust(particles, rng,
                                             pounce_runner_center_x(runner),
                                             runner->y + runner->height);
        }
        return true;
    }

    if (runner->double_jump_charges > 0) {
        runner->double_jump_charges--;
        runner->velocity_y = runner->tuning.jump_force * runner->tuning.double_jump_factor;
        runner->fresh_jump = true;
        restart_state(runner, POUNCE_RUNNER_JUMP);

        if (particles && rng) {
            pounce_particle_preset_double_jump(particles, rng,
                                               pounce_runner_center_x(runner),
                                               runner->y + runner->height);
        }
        return true;
    }

    return false;
}

bool pounce_runner_slide(Pounce_Runner *runner, Pounce_ParticlePool *particles, Pounce_Rng *rng) {
    if (!runner || runner->is_dead) return false;
    if (!runner->on_ground || runner->is_sliding || runner->slide_cooldown > 0) return false;

    runner->is_sliding = true;
    runner->slide_timer = runner->tuning.slide_duration;
    runner->slide_cooldown = runner->tuning.slide_cooldown;
    set_state(runner, POUNCE_RUNNER_SLIDE);

    if (particles && rng) {
        pounce_particle_preset_slide_dust(particles, rng, runner->x, runner->y + runner->height);
    }
    return true;
}

bool pounce_runner_shoot(Pounce_Runner *runner) {
    if (!runner || runner->is_dead) return false;
    if (runner->shot_charges <= 0) return false;

    runner->shot_charges--;
    return true;
}

bool pounce_runner_die(Pounce_Runner *runner, Pounce_ParticlePool *particles, Pounce_Rng *rng) {
    if (!runner || runner->is_dead) return false;

    end_slide(runner);
    runner->is_dead = true;
    runner->on_ground = false;
    runner->fresh_jump = false;
    runner->velocity_y = runner->tuning.death_bounce;
    restart_state(runner, POUNCE_RUNNER_DEAD);

    if (particles && rng) {
        pounce_particle_preset_impact(particles, rng,
                                      pounce_runner_center_x(runner),
                                      pounce_runner_center_y(runner));
    }
    return true;
}

bool pounce_runner_grant(Pounce_Runner *runner, Pounce_PowerKind power) {
    if (!runner) return false;

    switch (power) {
        case POUNCE_POWER_DOUBLE_JUMP:
            if (runner->double_jump_charges >= runner->tuning.max_double_jumps) return false;
            runner->double_jump_charges++;
            return true;
        case POUNCE_POWER_SHOT:
            if (runner->shot_charges >= runner->tuning.max_shots) return false;
            runner->shot_charges++;
            return true;
        default:
            return false;
    }
}

/* ============================================================================
 * Update
 * ============================================================================ */

void pounce_runner_update(Pounce_Runner *runner, float ground_y) {
    if (!runner) return;

    if (runner->is_dead) {
        /* Scripted fall: no ground clamp */
        runner->velocity_y += runner->tuning.gravity;
        runner->y += runner->velocity_y;
        advance_animation(runner);
        return;
    }

    if (runner->is_sliding) {
        runner->slide_timer--;
        if (runner->slide_timer <= 0) {
            end_slide(runner);
            if (runner->on_ground) {
                set_state(runner, POUNCE_RUNNER_RUN);
            }
        }
    }
    if (runner->slide_cooldown > 0) {
        runner->slide_cooldown--;
    }

    if (!runner->on_ground) {
        if (runner->fresh_jump) {
            runner->fresh_jump = false;
        } else {
            runner->velocity_y += runner->tuning.gravity;
        }

        if (runner->velocity_y > 0.0f && runner->state != POUNCE_RUNNER_FALL) {
            set_state(runner, POUNCE_RUNNER_FALL);
        }

        runner->y += runner->velocity_y;

        if (runner->y + runner->height >= ground_y) {
            runner->y = ground_y - runner->height;
            runner->velocity_y = 0.0f;
            runner->on_ground = true;
            set_state(runner, runner->is_sliding ? POUNCE_RUNNER_SLIDE : POUNCE_RUNNER_RUN);
        }
    } else if (runner->state == POUNCE_RUNNER_IDLE) {
        set_state(runner, POUNCE_RUNNER_RUN);
    }

    advance_animation(runner);
}

/* ============================================================================
 * Queries
 * ============================================================================ */

Pounce_Rect pounce_runner_hitbox(const Pounce_Runner *runner) {
    Pounce_Rect r = { 0.0f, 0.0f, 0.0f, 0.0f };
    if (!runner) return r;

    const Pounce_RunnerTuning *t = &runner->tuning;
    r.x = runner->x + t->hitbox_inset_x;
    r.w = runner->width - 2.0f * t->hitbox_inset_x;
    r.y = runner->y + t->hitbox_inset_top;
    r.h = runner->height - t->hitbox_inset_top;

    if (runner->is_sliding) {
        float bottom = pounce_rect_bottom(&r);
        r.h *= t->slide_height_factor;
        r.y = bottom - r.h;
    }
    return r;
}

const char *pounce_runner_state_name(Pounce_RunnerState state) {
    switch (state) {
        case POUNCE_RUNNER_IDLE:  return "idle";
        case POUNCE_RUNNER_RUN:   return "run";
        case POUNCE_RUNNER_JUMP:  return "jump";
        case POUNCE_RUNNER_FALL:  return "fall";
        case POUNCE_RUNNER_SLIDE: return "slide";
        case POUNCE_RUNNER_DEAD:  return "dead";
        default:                  return "unknown";
    }
}
