#ifndef POUNCE_RNG_H
#define POUNCE_RNG_H

#include <stdint.h>

/**
 * Seeded random generator (xorshift32).
 *
 * Every system that needs randomness takes a Pounce_Rng explicitly, so a
 * round can be replayed from its seed and reseeded on demand.
 *
 *   Pounce_Rng rng;
 *   pounce_rng_seed(&rng, 1234);
 *   float jitter = pounce_rng_range(&rng, -0.5f, 0.5f);
 */

typedef struct Pounce_Rng {
    uint32_t state;
    uint32_t seed;      /* Seed the generator was last initialised with */
} Pounce_Rng;

/**
 * Seed the generator. A seed of 0 uses the current time.
 */
void pounce_rng_seed(Pounce_Rng *rng, uint32_t seed);

/**
 * Next raw 32-bit value.
 */
uint32_t pounce_rng_next(Pounce_Rng *rng);

/**
 * Uniform float in [0, 1).
 */
float pounce_rng_float(Pounce_Rng *rng);

/**
 * Uniform float in [min, max). Returns min when max <= min.
 */
float pounce_rng_range(Pounce_Rng *rng, float min, float max);

/**
 * Uniform integer in [min, max] (inclusive). Returns min when max <= min.
 */
int pounce_rng_int(Pounce_Rng *rng, int min, int max);

#endif /* POUNCE_RNG_H */
