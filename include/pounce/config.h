#ifndef POUNCE_CONFIG_H
#define POUNCE_CONFIG_H

#include "pounce/obstacle.h"
#include "pounce/log.h"
#include <stdbool.h>

/**
 * Pounce Tuning Configuration
 *
 * Every gameplay constant lives here. Defaults reproduce the classic
 * 800x600 tuning; TOML files overlay individual values:
 *
 *   [runner]
 *   jump_force = -22.0
 *   max_double_jumps = 2
 *
 *   [difficulty]
 *   max_speed = 18.0
 *
 *   [log]
 *   level = "debug"
 *
 *   [[obstacle]]
 *   type = "balloon"
 *   weight = 20
 *   band_min = 90
 *   band_max = 150
 *
 * Keys that are absent keep their current value, so files may be layered.
 * Out-of-range values are clamped by pounce_config_sanitize().
 */

#define POUNCE_CONFIG_PATH_MAX 256

/* Upper bound on the spawner's anti-repeat history */
#define POUNCE_SPAWN_HISTORY_MAX 8

/* Per-type tunables */
typedef struct Pounce_ObstacleTuning {
    int weight;                  /* Relative spawn weight, 0 disables the type */
    int pass_score;              /* Points for passing or shooting it */
    int band_min;                /* Air types: bottom edge height above ground */
    int band_max;
} Pounce_ObstacleTuning;

typedef struct Pounce_Config {
    /* Playfield */
    float screen_width;
    float screen_height;
    float ground_y;

    /* Runner body and physics */
    float runner_x;
    float runner_width;
    float runner_height;
    float gravity;
    float jump_force;            /* Negative is up */
    float double_jump_factor;    /* Multiplier on jump_force for air jumps */
    float death_bounce;          /* Upward impulse when the runner dies */
    float hitbox_inset_x;        /* Trimmed from each side of the body */
    float hitbox_inset_top;
    float slide_height_factor;   /* Hitbox height while sliding */
    int slide_duration;          /* Ticks */
    int slide_cooldown;          /* Ticks, counted from slide start */
    int max_double_jumps;
    int max_shots;
    int start_double_jumps;
    int start_shots;

    /* Animation */
    int animation_speed;         /* Ticks per frame */
    int frames_idle;
    int frames_run;
    int frames_jump;
    int frames_fall;
    int frames_slide;
    int frames_dead;

    /* Difficulty */
    float base_speed;
    float max_speed;
    float speed_step;            /* Added per speed_score_step points */
    int speed_score_step;
    float speed_jitter;          /* Spawn speed varies by +/- this much */
    int base_interval_ms;
    int min_interval_ms;
    int interval_step_ms;        /* Removed per interval_score_step points */
    int interval_score_step;

    /* Scoring */
    int combo_bonus_threshold;   /* Combo at which combo/2 bonus points start */
    int combo_callout_threshold; /* Combo at which a COMBO event is emitted */
    int milestone_step;

    /* Spawner */
    int history_size;
    float spawn_x;               /* Leading edge of new obstacles */
    Pounce_ObstacleType default_obstacle;
    Pounce_ObstacleTuning obstacles[POUNCE_OBSTACLE_TYPE_COUNT];

    /* Projectiles */
    float projectile_speed;
    float projectile_width;
    float projectile_height;
    int max_projectiles;

    /* Particles */
    int max_particles;

    /* Persistence */
    char highscore_path[POUNCE_CONFIG_PATH_MAX];

    /* Logging, applied by the front end */
    Pounce_LogLevel log_level;
    char log_path[POUNCE_CONFIG_PATH_MAX];  /* Empty: console only */
} Pounce_Config;

/**
 * Fill a config with the default tuning.
 */
void pounce_config_default(Pounce_Config *config);

/**
 * Overlay values from a TOML file onto config.
 *
 * @return true on success. On a missing or malformed file config is left
 *         untouched, the error is set and false is returned.
 */
bool pounce_config_load_file(Pounce_Config *config, const char *path);

/**
 * Overlay values from a TOML document held in memory.
 */
bool pounce_config_load_string(Pounce_Config *config, const char *toml);

/**
 * Clamp every value into its valid range. Called by the loaders; callers
 * that edit a config by hand should call it before use.
 */
void pounce_config_sanitize(Pounce_Config *config);

/**
 * Tunables for one obstacle type. Invalid types resolve to the default
 * obstacle's entry.
 */
const Pounce_ObstacleTuning *pounce_config_obstacle(const Pounce_Config *config,
                                                    Pounce_ObstacleType type);

#endif /* POUNCE_CONFIG_H */
