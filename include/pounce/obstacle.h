#ifndef POUNCE_OBSTACLE_H
#define POUNCE_OBSTACLE_H

#include "pounce/rect.h"
#include "pounce/rng.h"
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * Obstacle types and entities.
 *
 * Each type has a static description (geometry, anchoring, how it is
 * cleared) and tunables in Pounce_Config (spawn weight, pass score,
 * placement band). Obstacles scroll left at a fixed per-obstacle speed
 * and are retired once fully past the left edge of the playfield.
 */

typedef struct Pounce_Config Pounce_Config;

/*============================================================================
 * Type Table
 *============================================================================*/

typedef enum Pounce_ObstacleType {
    POUNCE_OBSTACLE_STONE = 0,   /* Ground, jump over */
    POUNCE_OBSTACLE_CACTUS,      /* Ground, jump over (tall) */
    POUNCE_OBSTACLE_BUSH,        /* Ground, jump over (wide) */
    POUNCE_OBSTACLE_BALLOON,     /* Air, fatal only if the runner is airborne */
    POUNCE_OBSTACLE_BIRD,        /* Air, low: fatal unless the runner slides */
    POUNCE_OBSTACLE_GEM,         /* Power-up: +1 double jump */
    POUNCE_OBSTACLE_STAR,        /* Power-up: +1 shot */
    POUNCE_OBSTACLE_TYPE_COUNT
} Pounce_ObstacleType;

/* Scoring class of a type */
typedef enum Pounce_ObstacleKind {
    POUNCE_KIND_BASIC,           /* Flat pass score, resets the combo */
    POUNCE_KIND_HARD,            /* Higher pass score, feeds the combo */
    POUNCE_KIND_POWERUP          /* Collected on contact, never scored */
} Pounce_ObstacleKind;

typedef enum Pounce_Anchor {
    POUNCE_ANCHOR_GROUND,
    POUNCE_ANCHOR_AIR
} Pounce_Anchor;

/* What the runner has to do to get past it */
typedef enum Pounce_ClearRule {
    POUNCE_CLEAR_JUMP,           /* Any contact is fatal */
    POUNCE_CLEAR_STAY_GROUNDED,  /* Contact is fatal only while airborne */
    POUNCE_CLEAR_SLIDE,          /* Contact is fatal unless sliding */
    POUNCE_CLEAR_COLLECT         /* Contact grants a power */
} Pounce_ClearRule;

typedef enum Pounce_PowerKind {
    POUNCE_POWER_NONE = 0,
    POUNCE_POWER_DOUBLE_JUMP,
    POUNCE_POWER_SHOT
} Pounce_PowerKind;

typedef struct Pounce_ObstacleTypeInfo {
    const char *name;
    Pounce_ObstacleKind kind;
    Pounce_Anchor anchor;
    Pounce_ClearRule clear;
    Pounce_PowerKind power;
    float base_width;
    float base_height;
    float scale_min;
    float scale_max;
    bool color_cycle;

    /* Defaults for the tunables in Pounce_Config */
    int default_weight;
    int default_pass_score;
    int default_band_min;        /* Air types: bottom edge height above ground */
    int default_band_max;
} Pounce_ObstacleTypeInfo;

/* Colour-cycling power-ups rotate through this many palette entries */
#define POUNCE_OBSTACLE_PALETTE_SIZE 6
#define POUNCE_OBSTACLE_PALETTE_TICKS 5

/**
 * Static description of a type. Out-of-range values resolve to the
 * STONE description.
 */
const Pounce_ObstacleTypeInfo *pounce_obstacle_type_info(Pounce_ObstacleType type);

bool pounce_obstacle_type_valid(int type);

const char *pounce_obstacle_type_name(Pounce_ObstacleType type);

/**
 * Parse a type name ("stone", "balloon", ...), case-insensitive.
 * Unknown or NULL names log a warning and return fallback.
 */
Pounce_ObstacleType pounce_obstacle_type_from_name(const char *name, Pounce_ObstacleType fallback);

/*============================================================================
 * Obstacle Entity
 *============================================================================*/

typedef struct Pounce_Obstacle {
    Pounce_ObstacleType type;
    float x, y;
    float width, height;
    float speed;                 /* Pixels per tick, leftward */
    bool scored;                 /* Pass score already awarded */
    bool alive;                  /* Cleared when consumed mid-resolve */
    uint32_t variant;            /* Presentation seed */
    int palette_index;
    int palette_timer;
} Pounce_Obstacle;

/**
 * Initialise a freshly spawned obstacle at horizontal position x.
 * Size is the type's base size times a random scale factor; air types are
 * lifted by a random height drawn from the configured band.
 */
void pounce_obstacle_init(Pounce_Obstacle *obs, Pounce_ObstacleType type,
                          const Pounce_Config *config, float x, float ground_y,
                          float speed, Pounce_Rng *rng);

/**
 * Place an obstacle at base size with an explicit top-left position.
 * Used for scripted placement; speed is zero until set by the caller.
 */
void pounce_obstacle_place(Pounce_Obstacle *obs, Pounce_ObstacleType type,
                           float x, float y);

/**
 * Scroll one tick and advance the palette cycle.
 */
void pounce_obstacle_update(Pounce_Obstacle *obs);

/**
 * True once the trailing edge is left of the playfield.
 */
bool pounce_obstacle_offscreen(const Pounce_Obstacle *obs);

Pounce_Rect pounce_obstacle_rect(const Pounce_Obstacle *obs);

/*============================================================================
 * Obstacle List
 *============================================================================*/

/* Live obstacles in spawn order */
typedef struct Pounce_ObstacleList {
    Pounce_Obstacle *items;
    size_t count;
    size_t capacity;
} Pounce_ObstacleList;

/**
 * Append a zeroed obstacle slot.
 *
 * @return The new slot, or NULL if the list could not grow
 */
Pounce_Obstacle *pounce_obstacle_list_push(Pounce_ObstacleList *list);

/**
 * Remove dead and off-screen obstacles, keeping spawn order.
 *
 * @return Number of obstacles removed
 */
size_t pounce_obstacle_list_compact(Pounce_ObstacleList *list);

void pounce_obstacle_list_clear(Pounce_ObstacleList *list);

void pounce_obstacle_list_free(Pounce_ObstacleList *list);

#endif /* POUNCE_OBSTACLE_H */
