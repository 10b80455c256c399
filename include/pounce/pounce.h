#ifndef POUNCE_H
#define POUNCE_H

#include <stdbool.h>
#include <stdint.h>
#include <stdlib.h>

// Allocation helpers (zero-initialised, caller frees)
#define POUNCE_ALLOC(type) (type*)calloc(1, sizeof(type))
#define POUNCE_ALLOC_ARRAY(type, count) (type*)calloc((count), sizeof(type))
#define POUNCE_REALLOC(ptr, type, count) (type*)realloc((ptr), (count) * sizeof(type))

// Version info
#define POUNCE_VERSION_MAJOR 0
#define POUNCE_VERSION_MINOR 3
#define POUNCE_VERSION_PATCH 0

/*============================================================================
 * Memory Ownership Conventions
 *============================================================================
 *
 * Pounce follows the same ownership rules across all APIs:
 *
 * 1. CREATE/DESTROY PAIRS:
 *    `pounce_*_create()` returns memory the caller OWNS and must release
 *    with the matching `pounce_*_destroy()`.
 *
 *      Pounce_World *world = pounce_world_create(&config, store, 0);
 *      pounce_world_destroy(world);
 *
 * 2. GET FUNCTIONS:
 *    `pounce_*_get_*()` return pointers to internally-owned data. They stay
 *    valid until the next tick, reset, or destroy of the owning object.
 *
 * 3. BORROWED COLLABORATORS:
 *    Objects passed into a create call (the high-score store, a config) are
 *    borrowed. A config is copied; a store must outlive the world.
 *
 * 4. NULL ON FAILURE:
 *    Allocating functions return NULL on failure and set the last error,
 *    see pounce_get_last_error().
 *
 *============================================================================*/

// Core infrastructure
#include "pounce/error.h"
#include "pounce/log.h"
#include "pounce/validate.h"
#include "pounce/rng.h"
#include "pounce/event.h"
#include "pounce/config.h"
#include "pounce/highscore.h"

// Simulation
#include "pounce/rect.h"
#include "pounce/particle.h"
#include "pounce/runner.h"
#include "pounce/obstacle.h"
#include "pounce/projectile.h"
#include "pounce/scoring.h"
#include "pounce/spawner.h"
#include "pounce/collision.h"
#include "pounce/world.h"

#endif // POUNCE_H
