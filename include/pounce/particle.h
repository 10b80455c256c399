#ifndef POUNCE_PARTICLE_H
#define POUNCE_PARTICLE_H

#include "pounce/rng.h"
#include <stdbool.h>
#include <stdint.h>

/**
 * Pounce Particle Pool
 *
 * Short-lived feedback particles (dust, sparkles, impacts). The pool has a
 * fixed capacity chosen at creation; particles spawned while it is full are
 * dropped. Simulation is tick-based: every update moves each particle by its
 * velocity, pulls it down by POUNCE_PARTICLE_GRAVITY and ages it by one.
 *
 * Usage:
 *   Pounce_ParticlePool *pool = pounce_particle_pool_create(512);
 *   pounce_particle_preset_jump_dust(pool, &rng, feet_x, feet_y);
 *
 *   // Each tick
 *   pounce_particle_pool_update(pool);
 *   for (uint32_t i = 0; i < pounce_particle_pool_count(pool); i++) {
 *       const Pounce_Particle *p = pounce_particle_pool_get(pool, i);
 *       draw_circle(p->x, p->y, p->size, p->color, pounce_particle_alpha(p));
 *   }
 */

#define POUNCE_PARTICLE_GRAVITY 0.1f

/* Particles start shrinking after this share of their lifetime */
#define POUNCE_PARTICLE_SHRINK_AFTER 0.7f
#define POUNCE_PARTICLE_SHRINK_RATE 0.5f
#define POUNCE_PARTICLE_MIN_SIZE 1.0f

typedef struct Pounce_Color {
    uint8_t r, g, b;
} Pounce_Color;

typedef struct Pounce_Particle {
    float x, y;
    float vx, vy;
    float size;
    Pounce_Color color;
    int age;
    int lifetime;
} Pounce_Particle;

/* Ranges are inclusive; every property is sampled independently */
typedef struct Pounce_ParticleBurst {
    int count;
    uint8_t r_min, r_max;
    uint8_t g_min, g_max;
    uint8_t b_min, b_max;
    float vx_min, vx_max;
    float vy_min, vy_max;
    float size_min, size_max;
    int lifetime_min, lifetime_max;
} Pounce_ParticleBurst;

typedef struct Pounce_ParticlePool Pounce_ParticlePool;

/*============================================================================
 * Pool Lifecycle
 *============================================================================*/

/**
 * Create a pool holding at most capacity particles.
 *
 * @return New pool or NULL on failure. Caller owns it and must call
 *         pounce_particle_pool_destroy().
 */
Pounce_ParticlePool *pounce_particle_pool_create(uint32_t capacity);

void pounce_particle_pool_destroy(Pounce_ParticlePool *pool);

void pounce_particle_pool_clear(Pounce_ParticlePool *pool);

/**
 * Advance every particle one tick and remove the expired ones.
 */
void pounce_particle_pool_update(Pounce_ParticlePool *pool);

uint32_t pounce_particle_pool_count(const Pounce_ParticlePool *pool);

uint32_t pounce_particle_pool_capacity(const Pounce_ParticlePool *pool);

/**
 * Live particle by index, valid until the next update or spawn.
 *
 * @return Particle or NULL if index is out of range
 */
const Pounce_Particle *pounce_particle_pool_get(const Pounce_ParticlePool *pool, uint32_t index);

/*============================================================================
 * Spawning
 *============================================================================*/

/**
 * Add a single particle. Age is reset to 0.
 *
 * @return false if the pool is full or the lifetime is not positive
 */
bool pounce_particle_spawn(Pounce_ParticlePool *pool, const Pounce_Particle *particle);

/**
 * Spawn burst->count particles at (x, y).
 *
 * @return Number of particles actually added
 */
int pounce_particle_spawn_burst(Pounce_ParticlePool *pool, Pounce_Rng *rng,
                                float x, float y, const Pounce_ParticleBurst *burst);

/**
 * Opacity implied by a particle's age: 255 at birth, 0 at expiry.
 */
uint8_t pounce_particle_alpha(const Pounce_Particle *particle);

/*============================================================================
 * Presets
 *============================================================================*/

/* Pale dust kicked up at the runner's feet */
int pounce_particle_preset_jump_dust(Pounce_ParticlePool *pool, Pounce_Rng *rng, float x, float y);

/* Blue and white sparkle for an air jump */
int pounce_particle_preset_double_jump(Pounce_ParticlePool *pool, Pounce_Rng *rng, float x, float y);

/* Low, trailing dust while sliding */
int pounce_particle_preset_slide_dust(Pounce_ParticlePool *pool, Pounce_Rng *rng, float x, float y);

/* Red burst when the runner is hit */
int pounce_particle_preset_impact(Pounce_ParticlePool *pool, Pounce_Rng *rng, float x, float y);

/* Golden shower on power-up collection */
int pounce_particle_preset_reward(Pounce_ParticlePool *pool, Pounce_Rng *rng, float x, float y);

/* Orange-yellow blast when a projectile destroys an obstacle */
int pounce_particle_preset_explosion(Pounce_ParticlePool *pool, Pounce_Rng *rng, float x, float y);

#endif /* POUNCE_PARTICLE_H */
