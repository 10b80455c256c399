/**
 * Pounce World - Internal State
 *
 * Shared between world.cpp and collision.cpp.
 */

#ifndef POUNCE_WORLD_INTERNAL_H
#define POUNCE_WORLD_INTERNAL_H

#include "pounce/config.h"
#include "pounce/event.h"
#include "pounce/highscore.h"
#include "pounce/obstacle.h"
#include "pounce/particle.h"
#include "pounce/projectile.h"
#include "pounce/rng.h"
#include "pounce/runner.h"
#include "pounce/scoring.h"
#include "pounce/spawner.h"

struct Pounce_World {
    Pounce_Config config;
    Pounce_HighScoreStore *store;        /* Borrowed, may be NULL */

    Pounce_Rng rng;
    Pounce_Runner runner;
    Pounce_ObstacleList obstacles;
    Pounce_ProjectileList projectiles;
    Pounce_ParticlePool *particles;
    Pounce_Spawner *spawner;
    Pounce_Score score;
    Pounce_EventDispatcher *events;

    bool game_over;
    uint32_t frame;
    uint64_t now_ms;
};

#endif /* POUNCE_WORLD_INTERNAL_H */
