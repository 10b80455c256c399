#ifndef POUNCE_COLLISION_H
#define POUNCE_COLLISION_H

#include <stdbool.h>

typedef struct Pounce_World Pounce_World;

/**
 * Resolve one tick of contacts, in order:
 *
 *   1. Runner against obstacles (live rounds only). Power-ups are collected
 *      and removed; a fatal contact kills the runner, ends the round and
 *      stops resolution.
 *   2. Projectiles against obstacles. Both are destroyed and an unscored
 *      obstacle awards its pass value without touching the combo.
 *   3. Passing. Each unscored obstacle whose right edge is left of the
 *      runner hitbox scores once.
 *
 * @return true if the round ended this call
 */
bool pounce_collision_resolve(Pounce_World *world);

#endif /* POUNCE_COLLISION_H */
