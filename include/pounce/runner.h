#ifndef POUNCE_RUNNER_H
#define POUNCE_RUNNER_H

#include "pounce/config.h"
#include "pounce/obstacle.h"
#include "pounce/particle.h"
#include "pounce/rect.h"
#include "pounce/rng.h"
#include <stdbool.h>

/**
 * Runner State Machine
 *
 * The player-controlled actor. Position is the top-left corner of the full
 * body rectangle; the collision hitbox is derived from it and shrinks
 * (bottom edge fixed) while sliding.
 *
 * Actions (jump, slide, shoot, die) are silently ignored when their
 * preconditions do not hold; they return whether anything happened.
 *
 * A launch (ground or air jump) marks the runner as fresh-jumping, which
 * skips gravity for exactly the following update. The launch velocity is
 * therefore observable for one full tick.
 */

typedef enum Pounce_RunnerState {
    POUNCE_RUNNER_IDLE = 0,
    POUNCE_RUNNER_RUN,
    POUNCE_RUNNER_JUMP,
    POUNCE_RUNNER_FALL,
    POUNCE_RUNNER_SLIDE,
    POUNCE_RUNNER_DEAD,
    POUNCE_RUNNER_STATE_COUNT
} Pounce_RunnerState;

/* Values copied from Pounce_Config at reset */
typedef struct Pounce_RunnerTuning {
    float gravity;
    float jump_force;
    float double_jump_factor;
    float death_bounce;
    float hitbox_inset_x;
    float hitbox_inset_top;
    float slide_height_factor;
    int slide_duration;
    int slide_cooldown;
    int max_double_jumps;
    int max_shots;
    int animation_speed;
    int frame_counts[POUNCE_RUNNER_STATE_COUNT];
} Pounce_RunnerTuning;

typedef struct Pounce_Runner {
    float x, y;
    float width, height;
    float velocity_y;
    bool on_ground;
    bool is_dead;
    bool is_sliding;
    bool fresh_jump;

    Pounce_RunnerState state;
    int frame_index;
    int anim_timer;

    int double_jump_charges;
    int shot_charges;
    int slide_timer;
    int slide_cooldown;

    Pounce_RunnerTuning tuning;
} Pounce_Runner;

/**
 * Place the runner on the ground in IDLE with the configured starting
 * charges.
 */
void pounce_runner_reset(Pounce_Runner *runner, const Pounce_Config *config, float ground_y);

/**
 * Jump from the ground, or spend a double-jump charge in the air.
 * A ground jump cancels a slide in progress.
 *
 * @param particles Receives the dust or sparkle burst, may be NULL
 * @return true if the runner launched
 */
bool pounce_runner_jump(Pounce_Runner *runner, Pounce_ParticlePool *particles, Pounce_Rng *rng);

/**
 * Start a slide if grounded, not already sliding and off cooldown.
 *
 * @return true if a slide started
 */
bool pounce_runner_slide(Pounce_Runner *runner, Pounce_ParticlePool *particles, Pounce_Rng *rng);

/**
 * Spend a shot charge. The caller is responsible for spawning the
 * projectile.
 *
 * @return true if a charge was spent
 */
bool pounce_runner_shoot(Pounce_Runner *runner);

/**
 * Kill the runner. Only the first call has an effect.
 *
 * @return true if the runner was alive
 */
bool pounce_runner_die(Pounce_Runner *runner, Pounce_ParticlePool *particles, Pounce_Rng *rng);

/**
 * Advance physics, timers and animation by one tick.
 */
void pounce_runner_update(Pounce_Runner *runner, float ground_y);

/**
 * Add one charge of the given power, up to the configured cap.
 *
 * @return true if the charge count grew
 */
bool pounce_runner_grant(Pounce_Runner *runner, Pounce_PowerKind power);

Pounce_Rect pounce_runner_hitbox(const Pounce_Runner *runner);

static inline float pounce_runner_center_x(const Pounce_Runner *runner) {
    return runner->x + runner->width * 0.5f;
}

static inline float pounce_runner_center_y(const Pounce_Runner *runner) {
    return runner->y + runner->height * 0.5f;
}

const char *pounce_runner_state_name(Pounce_RunnerState state);

#endif /* POUNCE_RUNNER_H */
