#include "pounce/rng.h"
#include <time.h>

static uint32_t xorshift32(uint32_t *state) {
    uint32_t x = *state;
    x ^= x << 13;
    x ^= x >> 17;
    x ^= x << 5;
    *state = x;
    return x;
}

void pounce_rng_seed(Pounce_Rng *rng, uint32_t seed) {
    if (!rng) return;

    if (seed == 0) {
        seed = (uint32_t)time(NULL);
    }
    /* xorshift has a fixed point at zero */
    if (seed == 0) {
        seed = 0x9E3779B9u;
    }
    rng->seed = seed;
    rng->state = seed;
}

uint32_t pounce_rng_next(Pounce_Rng *rng) {
    if (!rng) return 0;
    return xorshift32(&rng->state);
}

float pounce_rng_float(Pounce_Rng *rng) {
    if (!rng) return 0.0f;

    /* Top 24 bits keep the result strictly below 1.0 */
    uint32_t r = xorshift32(&rng->state) >> 8;
    return (float)r / 16777216.0f;
}

float pounce_rng_range(Pounce_Rng *rng, float min, float max) {
    if (max <= min) return min;
    return min + pounce_rng_float(rng) * (max - min);
}

int pounce_rng_int(Pounce_Rng *rng, int min, int max) {
    if (!rng || max <= min) return min;

    uint32_t span = (uint32_t)(max - min) + 1u;
    return min + (int)(xorshift32(&rng->state) % span);
}
