#include "pounce/pounce.h"
#include "pounce/config.h"
#include "pounce/error.h"
#include "pounce/log.h"
#include "pounce/validate.h"
#include "toml.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

/* ============================================================================
 * Defaults
 * ============================================================================ */

void pounce_config_default(Pounce_Config *config) {
    if (!config) return;

    memset(config, 0, sizeof(*config));

    config->screen_width = 800.0f;
    config->screen_height = 600.0f;
    config->ground_y = 500.0f;

    config->runner_x = 100.0f;
    config->runner_width = 50.0f;
    config->runner_height = 50.0f;
    config->gravity = 1.0f;
    config->jump_force = -20.0f;
    config->double_jump_factor = 0.9f;
    config->death_bounce = -8.0f;
    config->hitbox_inset_x = 6.0f;
    config->hitbox_inset_top = 4.0f;
    config->slide_height_factor = 0.5f;
    config->slide_duration = 30;
    config->slide_cooldown = 60;
    config->max_double_jumps = 3;
    config->max_shots = 5;
    config->start_double_jumps = 0;
    config->start_shots = 0;

    config->animation_speed = 6;
    config->frames_idle = 4;
    config->frames_run = 8;
    config->frames_jump = 4;
    config->frames_fall = 4;
    config->frames_slide = 2;
    config->frames_dead = 6;

    config->base_speed = 7.0f;
    config->max_speed = 15.0f;
    config->speed_step = 0.2f;
    config->speed_score_step = 10;
    config->speed_jitter = 0.5f;
    config->base_interval_ms = 1500;
    config->min_interval_ms = 800;
    config->interval_step_ms = 50;
    config->interval_score_step = 5;

    config->combo_bonus_threshold = 2;
    config->combo_callout_threshold = 3;
    config->milestone_step = 25;

    config->history_size = 3;
    config->spawn_x = 800.0f;
    config->default_obstacle = POUNCE_OBSTACLE_STONE;
    for (int i = 0; i < POUNCE_OBSTACLE_TYPE_COUNT; i++) {
        const Pounce_ObstacleTypeInfo *info = pounce_obstacle_type_info((Pounce_ObstacleType)i);
        config->obstacles[i].weight = info->default_weight;
        config->obstacles[i].pass_score = info->default_pass_score;
        config->obstacles[i].band_min = info->default_band_min;
        config->obstacles[i].band_max = info->default_band_max;
    }

    config->projectile_speed = 12.0f;
    config->projectile_width = 16.0f;
    config->projectile_height = 6.0f;
    config->max_projectiles = 8;

    config->max_particles = 512;

    strncpy(config->highscore_path, "highscore.txt", sizeof(config->highscore_path) - 1);

    config->log_level = POUNCE_LOG_LEVEL_INFO;
    config->log_path[0] = '\0';
}

/* ============================================================================
 * Sanitising
 * ============================================================================ */

static void clamp_float(float *value, float lo, float hi, const char *name) {
    float clamped = pounce_clampf(*value, lo, hi);
    if (clamped != *value) {
        pounce_log_warning(POUNCE_LOG_CONFIG, "%s = %.2f out of range, clamped to %.2f",
                           name, (double)*value, (double)clamped);
        *value = clamped;
    }
}

static void clamp_int(int *value, int lo, int hi, const char *name) {
    int clamped = pounce_clampi(*value, lo, hi);
    if (clamped != *value) {
        pounce_log_warning(POUNCE_LOG_CONFIG, "%s = %d out of range, clamped to %d",
                           name, *value, clamped);
        *value = clamped;
    }
}

void pounce_config_sanitize(Pounce_Config *config) {
    if (!config) return;

    clamp_float(&config->screen_width, 64.0f, 8192.0f, "playfield.width");
    clamp_float(&config->screen_height, 64.0f, 8192.0f, "playfield.height");
    clamp_float(&config->ground_y, 1.0f, config->screen_height, "playfield.ground_y");

    clamp_float(&config->runner_width, 1.0f, config->screen_width, "runner.width");
    clamp_float(&config->runner_height, 1.0f, config->ground_y, "runner.height");
    clamp_float(&config->runner_x, 0.0f, config->screen_width - config->runner_width, "runner.x");
    clamp_float(&config->gravity, 0.01f, 100.0f, "runner.gravity");
    clamp_float(&config->jump_force, -1000.0f, -0.01f, "runner.jump_force");
    clamp_float(&config->double_jump_factor, 0.0f, 2.0f, "runner.double_jump_factor");
    clamp_float(&config->death_bounce, -1000.0f, 0.0f, "runner.death_bounce");
    clamp_float(&config->hitbox_inset_x, 0.0f, config->runner_width * 0.49f, "runner.hitbox_inset_x");
    clamp_float(&config->hitbox_inset_top, 0.0f, config->runner_height * 0.49f, "runner.hitbox_inset_top");
    clamp_float(&config->slide_height_factor, 0.05f, 1.0f, "runner.slide_height_factor");
    clamp_int(&config->slide_duration, 1, 100000, "runner.slide_duration");
    clamp_int(&config->slide_cooldown, 0, 100000, "runner.slide_cooldown");
    clamp_int(&config->max_double_jumps, 0, 99, "runner.max_double_jumps");
    clamp_int(&config->max_shots, 0, 99, "runner.max_shots");
    clamp_int(&config->start_double_jumps, 0, config->max_double_jumps, "runner.start_double_jumps");
    clamp_int(&config->start_shots, 0, config->max_shots, "runner.start_shots");

    clamp_int(&config->animation_speed, 1, 1000, "runner.animation_speed");
    clamp_int(&config->frames_idle, 1, 64, "runner.frames_idle");
    clamp_int(&config->frames_run, 1, 64, "runner.frames_run");
    clamp_int(&config->frames_jump, 1, 64, "runner.frames_jump");
    clamp_int(&config->frames_fall, 1, 64, "runner.frames_fall");
    clamp_int(&config->frames_slide, 1, 64, "runner.frames_slide");
    clamp_int(&config->frames_dead, 1, 64, "runner.frames_dead");

    clamp_float(&config->base_speed, 0.1f, 1000.0f, "difficulty.base_speed");
    clamp_float(&config->max_speed, config->base_speed, 1000.0f, "difficulty.max_speed");
    clamp_float(&config->speed_step, 0.0f, 100.0f, "difficulty.speed_step");
    clamp_int(&config->speed_score_step, 1, 100000, "difficulty.speed_score_step");
    clamp_float(&config->speed_jitter, 0.0f, config->base_speed * 0.5f, "difficulty.speed_jitter");
    clamp_int(&config->base_interval_ms, 1, 600000, "difficulty.base_interval_ms");
    clamp_int(&config->min_interval_ms, 1, config->base_interval_ms, "difficulty.min_interval_ms");
    clamp_int(&config->interval_step_ms, 0, 600000, "difficulty.interval_step_ms");
    clamp_int(&config->interval_score_step, 1, 100000, "difficulty.interval_score_step");

    clamp_int(&config->combo_bonus_threshold, 1, 1000, "scoring.combo_bonus_threshold");
    clamp_int(&config->combo_callout_threshold, 1, 1000, "scoring.combo_callout_threshold");
    clamp_int(&config->milestone_step, 1, 1000000, "scoring.milestone_step");

    clamp_int(&config->history_size, 0, POUNCE_SPAWN_HISTORY_MAX, "spawner.history_size");
    clamp_float(&config->spawn_x, 0.0f, 100000.0f, "spawner.spawn_x");
    if (!pounce_obstacle_type_valid(config->default_obstacle)) {
        pounce_log_warning(POUNCE_LOG_CONFIG, "Invalid default obstacle %d, using stone",
                           (int)config->default_obstacle);
        config->default_obstacle = POUNCE_OBSTACLE_STONE;
    }
    for (int i = 0; i < POUNCE_OBSTACLE_TYPE_COUNT; i++) {
        Pounce_ObstacleTuning *t = &config->obstacles[i];
        clamp_int(&t->weight, 0, 1000000, "obstacle.weight");
        clamp_int(&t->pass_score, 0, 1000, "obstacle.pass_score");
        clamp_int(&t->band_min, 0, (int)config->ground_y, "obstacle.band_min");
        clamp_int(&t->band_max, t->band_min, (int)config->ground_y, "obstacle.band_max");
    }

    clamp_float(&config->projectile_speed, 0.1f, 1000.0f, "projectile.speed");
    clamp_float(&config->projectile_width, 1.0f, 1000.0f, "projectile.width");
    clamp_float(&config->projectile_height, 1.0f, 1000.0f, "projectile.height");
    clamp_int(&config->max_projectiles, 1, 1024, "projectile.max");

    clamp_int(&config->max_particles, 16, 65536, "particles.max");

    int level = (int)config->log_level;
    clamp_int(&level, POUNCE_LOG_LEVEL_ERROR, POUNCE_LOG_LEVEL_DEBUG, "log.level");
    config->log_level = (Pounce_LogLevel)level;
}

const Pounce_ObstacleTuning *pounce_config_obstacle(const Pounce_Config *config,
                                                    Pounce_ObstacleType type) {
    if (!config) return NULL;
    if (!pounce_obstacle_type_valid(type)) {
        type = pounce_obstacle_type_valid(config->default_obstacle)
             ? config->default_obstacle : POUNCE_OBSTACLE_STONE;
    }
    return &config->obstacles[type];
}

/* ============================================================================
 * TOML Overlay
 * ============================================================================ */

/* Integers are accepted wherever a float is expected */
static void read_float(toml_table_t *table, const char *key, float *out) {
    toml_datum_t d = toml_double_in(table, key);
    if (d.ok) {
        *out = (float)d.u.d;
        return;
    }
    d = toml_int_in(table, key);
    if (d.ok) {
        *out = (float)d.u.i;
    }
}

static void read_int(toml_table_t *table, const char *key, int *out) {
    toml_datum_t d = toml_int_in(table, key);
    if (d.ok) {
        *out = (int)d.u.i;
    }
}

static void read_string(toml_table_t *table, const char *key, char *out, size_t out_size) {
    toml_datum_t d = toml_string_in(table, key);
    if (d.ok) {
        strncpy(out, d.u.s, out_size - 1);
        out[out_size - 1] = '\0';
        free(d.u.s);
    }
}

static void parse_playfield(Pounce_Config *config, toml_table_t *t) {
    read_float(t, "width", &config->screen_width);
    read_float(t, "height", &config->screen_height);
    read_float(t, "ground_y", &config->ground_y);
}

static void parse_runner(Pounce_Config *config, toml_table_t *t) {
    read_float(t, "x", &config->runner_x);
    read_float(t, "width", &config->runner_width);
    read_float(t, "height", &config->runner_height);
    read_float(t, "gravity", &config->gravity);
    read_float(t, "jump_force", &config->jump_force);
    read_float(t, "double_jump_factor", &config->double_jump_factor);
    read_float(t, "death_bounce", &config->death_bounce);
    read_float(t, "hitbox_inset_x", &config->hitbox_inset_x);
    read_float(t, "hitbox_inset_top", &config->hitbox_inset_top);
    read_float(t, "slide_height_factor", &config->slide_height_factor);
    read_int(t, "slide_duration", &config->slide_duration);
    read_int(t, "slide_cooldown", &config->slide_cooldown);
    read_int(t, "max_double_jumps", &config->max_double_jumps);
    read_int(t, "max_shots", &config->max_shots);
    read_int(t, "start_double_jumps", &config->start_double_jumps);
    read_int(t, "start_shots", &config->start_shots);
    read_int(t, "animation_speed", &config->animation_speed);
    read_int(t, "frames_idle", &config->frames_idle);
    read_int(t, "frames_run", &config->frames_run);
    read_int(t, "frames_jump", &config->frames_jump);
    read_int(t, "frames_fall", &config->frames_fall);
    read_int(t, "frames_slide", &config->frames_slide);
    read_int(t, "frames_dead", &config->frames_dead);
}

static void parse_difficulty(Pounce_Config *config, toml_table_t *t) {
    read_float(t, "base_speed", &config->base_speed);
    read_float(t, "max_speed", &config->max_speed);
    read_float(t, "speed_step", &config->speed_step);
    read_int(t, "speed_score_step", &config->speed_score_step);
    read_float(t, "speed_jitter", &config->speed_jitter);
    read_int(t, "base_interval_ms", &config->base_interval_ms);
    read_int(t, "min_interval_ms", &config->min_interval_ms);
    read_int(t, "interval_step_ms", &config->interval_step_ms);
    read_int(t, "interval_score_step", &config->interval_score_step);
}

static void parse_scoring(Pounce_Config *config, toml_table_t *t) {
    read_int(t, "combo_bonus_threshold", &config->combo_bonus_threshold);
    read_int(t, "combo_callout_threshold", &config->combo_callout_threshold);
    read_int(t, "milestone_step", &config->milestone_step);
    read_string(t, "highscore_path", config->highscore_path, sizeof(config->highscore_path));
}

static void parse_spawner(Pounce_Config *config, toml_table_t *t) {
    read_int(t, "history_size", &config->history_size);
    read_float(t, "spawn_x", &config->spawn_x);

    toml_datum_t d = toml_string_in(t, "default_type");
    if (d.ok) {
        config->default_obstacle = pounce_obstacle_type_from_name(d.u.s, POUNCE_OBSTACLE_STONE);
        free(d.u.s);
    }

    read_float(t, "projectile_speed", &config->projectile_speed);
    read_float(t, "projectile_width", &config->projectile_width);
    read_float(t, "projectile_height", &config->projectile_height);
    read_int(t, "max_projectiles", &config->max_projectiles);
    read_int(t, "max_particles", &config->max_particles);
}

static void parse_log(Pounce_Config *config, toml_table_t *t) {
    read_string(t, "path", config->log_path, sizeof(config->log_path));

    toml_datum_t d = toml_string_in(t, "level");
    if (d.ok) {
        if (!pounce_log_level_from_name(d.u.s, &config->log_level)) {
            pounce_log_warning(POUNCE_LOG_CONFIG, "log.level \"%s\" is not a level, ignored", d.u.s);
        }
        free(d.u.s);
    }
}

static void parse_obstacles(Pounce_Config *config, toml_array_t *arr) {
    int count = toml_array_nelem(arr);
    for (int i = 0; i < count; i++) {
        toml_table_t *entry = toml_table_at(arr, i);
        if (!entry) {
            pounce_log_warning(POUNCE_LOG_CONFIG, "obstacle[%d] is not a table, skipped", i);
            continue;
        }

        Pounce_ObstacleType type = config->default_obstacle;
        toml_datum_t d = toml_string_in(entry, "type");
        if (d.ok) {
            type = pounce_obstacle_type_from_name(d.u.s, config->default_obstacle);
            free(d.u.s);
        } else {
            pounce_log_warning(POUNCE_LOG_CONFIG, "obstacle[%d] has no type, using %s",
                               i, pounce_obstacle_type_name(type));
        }

        Pounce_ObstacleTuning *tuning = &config->obstacles[type];
        read_int(entry, "weight", &tuning->weight);
        read_int(entry, "pass_score", &tuning->pass_score);
        read_int(entry, "band_min", &tuning->band_min);
        read_int(entry, "band_max", &tuning->band_max);
    }
}

static void apply_toml(Pounce_Config *config, toml_table_t *root) {
    toml_table_t *t;

    if ((t = toml_table_in(root, "playfield")) != NULL) parse_playfield(config, t);
    if ((t = toml_table_in(root, "runner")) != NULL) parse_runner(config, t);
    if ((t = toml_table_in(root, "difficulty")) != NULL) parse_difficulty(config, t);
    if ((t = toml_table_in(root, "scoring")) != NULL) parse_scoring(config, t);
    if ((t = toml_table_in(root, "spawner")) != NULL) parse_spawner(config, t);
    if ((t = toml_table_in(root, "log")) != NULL) parse_log(config, t);

    toml_array_t *obstacles = toml_array_in(root, "obstacle");
    if (obstacles) parse_obstacles(config, obstacles);

    pounce_config_sanitize(config);
}

bool pounce_config_load_file(Pounce_Config *config, const char *path) {
    POUNCE_VALIDATE_PTR_RET(config, false);
    POUNCE_VALIDATE_STRING_RET(path, false);

    FILE *fp = fopen(path, "r");
    if (!fp) {
        pounce_set_error("Cannot open config file: %s", path);
        pounce_log_warning(POUNCE_LOG_CONFIG, "Config %s not found, keeping defaults", path);
        return false;
    }

    char errbuf[256];
    toml_table_t *root = toml_parse_file(fp, errbuf, sizeof(errbuf));
    fclose(fp);

    if (!root) {
        pounce_set_error("TOML parse error in %s: %s", path, errbuf);
        pounce_log_warning(POUNCE_LOG_CONFIG, "%s", pounce_get_last_error());
        return false;
    }

    Pounce_Config overlay = *config;
    apply_toml(&overlay, root);
    toml_free(root);

    *config = overlay;
    pounce_log_info(POUNCE_LOG_CONFIG, "Loaded config from %s", path);
    return true;
}

bool pounce_config_load_string(Pounce_Config *config, const char *toml) {
    POUNCE_VALIDATE_PTRS2_RET(config, toml, false);

    /* toml_parse needs mutable string */
    char *copy = strdup(toml);
    if (!copy) {
        pounce_set_error("Out of memory");
        return false;
    }

    char errbuf[256];
    toml_table_t *root = toml_parse(copy, errbuf, sizeof(errbuf));
    free(copy);

    if (!root) {
        pounce_set_error("TOML parse error: %s", errbuf);
        pounce_log_warning(POUNCE_LOG_CONFIG, "%s", pounce_get_last_error());
        return false;
    }

    Pounce_Config overlay = *config;
    apply_toml(&overlay, root);
    toml_free(root);

    *config = overlay;
    return true;
}
