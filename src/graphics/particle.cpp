/*
 * Pounce Particle Pool Implementation
 *
 * Fixed-capacity array of live particles. Expired particles are removed by
 * swapping in the last live one, so the live set is always contiguous.
 */

#include "pounce/pounce.h"
#include "pounce/particle.h"
#include "pounce/error.h"
#include "pounce/validate.h"
#include <stdlib.h>
#include <string.h>

/* ============================================================================
 * Internal Types
 * ============================================================================ */

struct Pounce_ParticlePool {
    Pounce_Particle *particles;
    uint32_t capacity;
    uint32_t count;
};

static uint8_t rand_channel(Pounce_Rng *rng, uint8_t lo, uint8_t hi) {
    return (uint8_t)pounce_rng_int(rng, lo, hi);
}

/* ============================================================================
 * Pool Lifecycle
 * ============================================================================ */

Pounce_ParticlePool *pounce_particle_pool_create(uint32_t capacity) {
    if (capacity == 0) {
        pounce_set_error("Particle pool capacity must be positive");
        return NULL;
    }

    Pounce_ParticlePool *pool = POUNCE_ALLOC(Pounce_ParticlePool);
    if (!pool) {
        pounce_set_error("Failed to allocate particle pool");
        return NULL;
    }

    pool->particles = POUNCE_ALLOC_ARRAY(Pounce_Particle, capacity);
    if (!pool->particles) {
        pounce_set_error("Failed to allocate particle pool (%u particles)", capacity);
        free(pool);
        return NULL;
    }

    pool->capacity = capacity;
    pool->count = 0;
    return pool;
}

void pounce_particle_pool_destroy(Pounce_ParticlePool *pool) {
    if (!pool) return;
    free(pool->particles);
    free(pool);
}

void pounce_particle_pool_clear(Pounce_ParticlePool *pool) {
    if (!pool) return;
    pool->count = 0;
}

uint32_t pounce_particle_pool_count(const Pounce_ParticlePool *pool) {
    return pool ? pool->count : 0;
}

uint32_t pounce_particle_pool_capacity(const Pounce_ParticlePool *pool) {
    return pool ? pool->capacity : 0;
}

const Pounce_Particle *pounce_particle_pool_get(const Pounce_ParticlePool *pool, uint32_t index) {
    POUNCE_VALIDATE_PTR_RET(pool, NULL);
    POUNCE_VALIDATE_INDEX_RET(index, pool->count, NULL);
    return &pool->particles[index];
}

/* ============================================================================
 * Update
 * ============================================================================ */

void pounce_particle_pool_update(Pounce_ParticlePool *pool) {
    if (!pool) return;

    uint32_t i = 0;
    while (i < pool->count) {
        Pounce_Particle *p = &pool->particles[i];

        p->x += p->vx;
        p->y += p->vy;
        p->vy += POUNCE_PARTICLE_GRAVITY;
        p->age++;

        if ((float)p->age > (float)p->lifetime * POUNCE_PARTICLE_SHRINK_AFTER) {
            p->size -= POUNCE_PARTICLE_SHRINK_RATE;
            if (p->size < POUNCE_PARTICLE_MIN_SIZE) p->size = POUNCE_PARTICLE_MIN_SIZE;
        }

        if (p->age >= p->lifetime) {
            /* Swap-remove; re-examine slot i */
            pool->particles[i] = pool->particles[pool->count - 1];
            pool->count--;
            continue;
        }
        i++;
    }
}

uint8_t pounce_particle_alpha(const Pounce_Particle *particle) {
    if (!particle || particle->lifetime <= 0) return 0;
    if (particle->age <= 0) return 255;
    if (particle->age >= particle->lifetime) return 0;

    float t = 1.0f - (float)particle->age / (float)particle->lifetime;
    return (uint8_t)(255.0f * t);
}

/* ============================================================================
 * Spawning
 * ============================================================================ */

bool pounce_particle_spawn(Pounce_ParticlePool *pool, const Pounce_Particle *particle) {
    POUNCE_VALIDATE_PTRS2_RET(pool, particle, false);
    POUNCE_VALIDATE_POSITIVE_RET(particle->lifetime, false);
    if (pool->count >= pool->capacity) return false;

    Pounce_Particle *p = &pool->particles[pool->count++];
    *p = *particle;
    p->age = 0;
    return true;
}

int pounce_particle_spawn_burst(Pounce_ParticlePool *pool, Pounce_Rng *rng,
                                float x, float y, const Pounce_ParticleBurst *burst) {
    if (!pool || !rng || !burst) return 0;

    int added = 0;
    for (int i = 0; i < burst->count; i++) {
        Pounce_Particle p;
        p.x = x;
        p.y = y;
        p.color.r = rand_channel(rng, burst->r_min, burst->r_max);
        p.color.g = rand_channel(rng, burst->g_min, burst->g_max);
        p.color.b = rand_channel(rng, burst->b_min, burst->b_max);
        p.vx = pounce_rng_range(rng, burst->vx_min, burst->vx_max);
        p.vy = pounce_rng_range(rng, burst->vy_min, burst->vy_max);
        p.size = pounce_rng_range(rng, burst->size_min, burst->size_max);
        p.lifetime = pounce_rng_int(rng, burst->lifetime_min, burst->lifetime_max);
        p.age = 0;

        /* A zero lifetime would never be drawn */
        if (p.lifetime <= 0) continue;

        /* Full pool: the rest of the burst is dropped */
        if (!pounce_particle_spawn(pool, &p)) break;
        added++;
    }
    return added;
}

/* ============================================================================
 * Presets
 * ============================================================================ */

static const Pounce_ParticleBurst s_jump_dust = {
    15,
    200, 230, 200, 230, 180, 220,
    -2.0f, 2.0f, -3.0f, -1.0f,
    2.0f, 5.0f,
    20, 40
};

static const Pounce_ParticleBurst s_double_jump = {
    20,
    120, 220, 180, 240, 230, 255,
    -3.0f, 3.0f, -1.0f, 2.0f,
    2.0f, 4.0f,
    15, 30
};

static const Pounce_ParticleBurst s_slide_dust = {
    10,
    170, 200, 150, 180, 120, 150,
    -4.0f, -1.0f, -1.5f, -0.3f,
    2.0f, 4.0f,
    15, 25
};

static const Pounce_ParticleBurst s_impact = {
    30,
    200, 255, 50, 150, 50, 100,
    -3.0f, 3.0f, -5.0f, 1.0f,
    3.0f, 7.0f,
    30, 60
};

static const Pounce_ParticleBurst s_reward = {
    25,
    230, 255, 190, 230, 20, 80,
    -2.5f, 2.5f, -4.0f, -1.0f,
    2.0f, 5.0f,
    25, 45
};

static const Pounce_ParticleBurst s_explosion = {
    35,
    230, 255, 120, 220, 0, 60,
    -4.0f, 4.0f, -4.0f, 2.0f,
    3.0f, 8.0f,
    20, 45
};

int pounce_particle_preset_jump_dust(Pounce_ParticlePool *pool, Pounce_Rng *rng, float x, float y) {
    return pounce_particle_spawn_burst(pool, rng, x, y, &s_jump_dust);
}

int pounce_particle_preset_double_jump(Pounce_ParticlePool *pool, Pounce_Rng *rng, float x, float y) {
    return pounce_particle_spawn_burst(pool, rng, x, y, &s_double_jump);
}

int pounce_particle_preset_slide_dust(Pounce_ParticlePool *pool, Pounce_Rng *rng, float x, float y) {
    return pounce_particle_spawn_burst(pool, rng, x, y, &s_slide_dust);
}

int pounce_particle_preset_impact(Pounce_ParticlePool *pool, Pounce_Rng *rng, float x, float y) {
    return pounce_particle_spawn_burst(pool, rng, x, y, &s_impact);
}

int pounce_particle_preset_reward(Pounce_ParticlePool *pool, Pounce_Rng *rng, float x, float y) {
    return pounce_particle_spawn_burst(pool, rng, x, y, &s_reward);
}

int pounce_particle_preset_explosion(Pounce_ParticlePool *pool, Pounce_Rng *rng, float x, float y) {
    return pounce_particle_spawn_burst(pool, rng, x, y, &s_explosion);
}
