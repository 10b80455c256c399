#include "pounce/pounce.h"
#include "pounce/obstacle.h"
#include "pounce/config.h"
#include "pounce/log.h"
#include "pounce/validate.h"

#include <string.h>
#include <strings.h>

/* ============================================================================
 * Type Table
 * ============================================================================ */

static const Pounce_ObstacleTypeInfo s_type_info[POUNCE_OBSTACLE_TYPE_COUNT] = {
    /* name       kind                 anchor               clear                        power                     w      h      scale        cycle  weight pass band */
    { "stone",   POUNCE_KIND_BASIC,   POUNCE_ANCHOR_GROUND, POUNCE_CLEAR_JUMP,          POUNCE_POWER_NONE,        52.0f, 52.0f, 0.9f, 1.3f, false, 30, 1, 0,   0   },
    { "cactus",  POUNCE_KIND_BASIC,   POUNCE_ANCHOR_GROUND, POUNCE_CLEAR_JUMP,          POUNCE_POWER_NONE,        40.0f, 80.0f, 0.9f, 1.3f, false, 30, 1, 0,   0   },
    { "bush",    POUNCE_KIND_BASIC,   POUNCE_ANCHOR_GROUND, POUNCE_CLEAR_JUMP,          POUNCE_POWER_NONE,        66.0f, 42.0f, 0.9f, 1.3f, false, 25, 1, 0,   0   },
    { "balloon", POUNCE_KIND_HARD,    POUNCE_ANCHOR_AIR,    POUNCE_CLEAR_STAY_GROUNDED, POUNCE_POWER_NONE,        48.0f, 84.0f, 0.9f, 1.3f, false, 15, 2, 80,  140 },
    { "bird",    POUNCE_KIND_HARD,    POUNCE_ANCHOR_AIR,    POUNCE_CLEAR_SLIDE,         POUNCE_POWER_NONE,        44.0f, 24.0f, 0.9f, 1.1f, false, 12, 2, 30,  38  },
    { "gem",     POUNCE_KIND_POWERUP, POUNCE_ANCHOR_AIR,    POUNCE_CLEAR_COLLECT,       POUNCE_POWER_DOUBLE_JUMP, 28.0f, 28.0f, 1.0f, 1.0f, true,  5,  0, 60,  120 },
    { "star",    POUNCE_KIND_POWERUP, POUNCE_ANCHOR_AIR,    POUNCE_CLEAR_COLLECT,       POUNCE_POWER_SHOT,        28.0f, 28.0f, 1.0f, 1.0f, true,  5,  0, 60,  120 },
};

bool pounce_obstacle_type_valid(int type) {
    return type >= 0 && type < POUNCE_OBSTACLE_TYPE_COUNT;
}

const Pounce_ObstacleTypeInfo *pounce_obstacle_type_info(Pounce_ObstacleType type) {
    if (!pounce_obstacle_type_valid(type)) {
        return &s_type_info[POUNCE_OBSTACLE_STONE];
    }
    return &s_type_info[type];
}

const char *pounce_obstacle_type_name(Pounce_ObstacleType type) {
    if (!pounce_obstacle_type_valid(type)) return "unknown";
    return s_type_info[type].name;
}

Pounce_ObstacleType pounce_obstacle_type_from_name(const char *name, Pounce_ObstacleType fallback) {
    if (name) {
        for (int i = 0; i < POUNCE_OBSTACLE_TYPE_COUNT; i++) {
            if (strcasecmp(name, s_type_info[i].name) == 0) {
                return (Pounce_ObstacleType)i;
            }
        }
    }

    pounce_log_warning(POUNCE_LOG_CONFIG, "Unknown obstacle type '%s', using %s",
                       name ? name : "(null)", pounce_obstacle_type_name(fallback));
    return fallback;
}

/* ============================================================================
 * Obstacle Entity
 * ============================================================================ */

void pounce_obstacle_init(Pounce_Obstacle *obs, Pounce_ObstacleType type,
                          const Pounce_Config *config, float x, float ground_y,
                          float speed, Pounce_Rng *rng) {
    POUNCE_VALIDATE_PTRS2(obs, config);
    POUNCE_VALIDATE_PTR(rng);

    if (!pounce_obstacle_type_valid(type)) {
        type = config->default_obstacle;
    }

    const Pounce_ObstacleTypeInfo *info = pounce_obstacle_type_info(type);
    const Pounce_ObstacleTuning *tuning = pounce_config_obstacle(config, type);

    memset(obs, 0, sizeof(*obs));
    obs->type = type;
    obs->speed = speed;
    obs->alive = true;

    /* Whole-pixel sizes, as the sprites are scaled to integer dimensions */
    float scale = pounce_rng_range(rng, info->scale_min, info->scale_max);
    obs->width = (float)(int)(info->base_width * scale);
    obs->height = (float)(int)(info->base_height * scale);

    obs->x = x;
    if (info->anchor == POUNCE_ANCHOR_AIR) {
        int lift = pounce_rng_int(rng, tuning->band_min, tuning->band_max);
        obs->y = ground_y - (float)lift - obs->height;
    } else {
        obs->y = ground_y - obs->height;
    }

    obs->variant = pounce_rng_next(rng);
    if (info->color_cycle) {
        obs->palette_index = pounce_rng_int(rng, 0, POUNCE_OBSTACLE_PALETTE_SIZE - 1);
    }
}

void pounce_obstacle_place(Pounce_Obstacle *obs, Pounce_ObstacleType type, float x, float y) {
    if (!obs) return;

    const Pounce_ObstacleTypeInfo *info = pounce_obstacle_type_info(type);

    memset(obs, 0, sizeof(*obs));
    obs->type = pounce_obstacle_type_valid(type) ? type : POUNCE_OBSTACLE_STONE;
    obs->x = x;
    obs->y = y;
    obs->width = info->base_width;
    obs->height = info->base_height;
    obs->alive = true;
}

void pounce_obstacle_update(Pounce_Obstacle *obs) {
    if (!obs) return;

    obs->x -= obs->speed;

    if (pounce_obstacle_type_info(obs->type)->color_cycle) {
        obs->palette_timer++;
        if (obs->palette_timer >= POUNCE_OBSTACLE_PALETTE_TICKS) {
            obs->palette_timer = 0;
            obs->palette_index = (obs->palette_index + 1) % POUNCE_OBSTACLE_PALETTE_SIZE;
        }
    }
}

bool pounce_obstacle_offscreen(const Pounce_Obstacle *obs) {
    if (!obs) return true;
    return obs->x + obs->width < 0.0f;
}

Pounce_Rect pounce_obstacle_rect(const Pounce_Obstacle *obs) {
    Pounce_Rect r = { 0.0f, 0.0f, 0.0f, 0.0f };
    if (obs) {
        r.x = obs->x;
        r.y = obs->y;
        r.w = obs->width;
        r.h = obs->height;
    }
    return r;
}

/* ============================================================================
 * Obstacle List
 * ============================================================================ */

Pounce_Obstacle *pounce_obstacle_list_push(Pounce_ObstacleList *list) {
    POUNCE_VALIDATE_PTR_RET(list, NULL);

    if (list->count >= list->capacity) {
        size_t new_capacity = list->capacity ? list->capacity * 2 : 16;
        Pounce_Obstacle *items = POUNCE_REALLOC(list->items, Pounce_Obstacle, new_capacity);
        if (!items) {
            pounce_set_error("Failed to grow obstacle list");
            return NULL;
        }
        list->items = items;
        list->capacity = new_capacity;
    }

    Pounce_Obstacle *obs = &list->items[list->count++];
    memset(obs, 0, sizeof(*obs));
    obs->alive = true;
    return obs;
}

size_t pounce_obstacle_list_compact(Pounce_ObstacleList *list) {
    if (!list) return 0;

    size_t write = 0;
    for (size_t read = 0; read < list->count; read++) {
        Pounce_Obstacle *obs = &list->items[read];
        if (!obs->alive || pounce_obstacle_offscreen(obs)) continue;
        if (write != read) {
            list->items[write] = *obs;
        }
        write++;
    }

    size_t removed = list->count - write;
    list->count = write;
    return removed;
}

void pounce_obstacle_list_clear(Pounce_ObstacleList *list) {
    if (!list) return;
    list->count = 0;
}

void pounce_obstacle_list_free(Pounce_ObstacleList *list) {
    if (!list) return;
    free(list->items);
    list->items = NULL;
    list->count = 0;
    list->capacity = 0;
}
