#ifndef POUNCE_PROJECTILE_H
#define POUNCE_PROJECTILE_H

#include "pounce/rect.h"
#include <stdbool.h>
#include <stddef.h>

/**
 * Projectiles fired by the runner. They fly right at a fixed speed and are
 * destroyed on leaving the playfield or on hitting an obstacle.
 */

typedef struct Pounce_Projectile {
    float x, y;
    float width, height;
    float speed;
    bool alive;
} Pounce_Projectile;

/* Fixed-capacity set of live projectiles in firing order */
typedef struct Pounce_ProjectileList {
    Pounce_Projectile *items;
    size_t count;
    size_t capacity;
} Pounce_ProjectileList;

void pounce_projectile_update(Pounce_Projectile *projectile);

bool pounce_projectile_offscreen(const Pounce_Projectile *projectile, float screen_width);

Pounce_Rect pounce_projectile_rect(const Pounce_Projectile *projectile);

/**
 * Allocate storage for capacity projectiles.
 *
 * @return false with the error set on allocation failure
 */
bool pounce_projectile_list_init(Pounce_ProjectileList *list, size_t capacity);

/**
 * Fire a projectile centred vertically on (x, y).
 *
 * @return The new projectile, or NULL if the list is full
 */
Pounce_Projectile *pounce_projectile_list_fire(Pounce_ProjectileList *list, float x, float y,
                                               float width, float height, float speed);

/**
 * Remove dead and off-screen projectiles, keeping order.
 */
size_t pounce_projectile_list_compact(Pounce_ProjectileList *list, float screen_width);

void pounce_projectile_list_clear(Pounce_ProjectileList *list);

void pounce_projectile_list_free(Pounce_ProjectileList *list);

#endif /* POUNCE_PROJECTILE_H */
