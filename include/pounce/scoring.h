#ifndef POUNCE_SCORING_H
#define POUNCE_SCORING_H

#include "pounce/config.h"
#include "pounce/event.h"
#include "pounce/highscore.h"
#include "pounce/obstacle.h"
#include <stdbool.h>
#include <stdint.h>

/**
 * Score, Combo and Difficulty
 *
 * Difficulty is a pure function of the score: obstacle speed rises and the
 * spawn interval falls in steps, each clamped to its configured limit.
 * Both are recomputed whenever points are added.
 */

typedef struct Pounce_Score {
    int32_t score;
    int32_t combo;
    int32_t high_score;
    float speed;                 /* Current difficulty speed */
    int32_t interval_ms;         /* Current spawn interval */
    int32_t last_milestone;      /* Index of the last milestone reached */
    bool new_record;             /* Set by pounce_score_finish() */
} Pounce_Score;

/**
 * min(base_speed + (score / speed_score_step) * speed_step, max_speed)
 */
float pounce_difficulty_speed(const Pounce_Config *config, int32_t score);

/**
 * max(base_interval_ms - (score / interval_score_step) * interval_step_ms, min_interval_ms)
 */
int32_t pounce_spawn_interval(const Pounce_Config *config, int32_t score);

/**
 * Start a round at zero, keeping the given high score.
 */
void pounce_score_reset(Pounce_Score *score, const Pounce_Config *config, int32_t high_score);

/**
 * Add points and recompute difficulty. Emits SCORE_CHANGED and, when a
 * multiple of milestone_step is crossed, SCORE_MILESTONE.
 *
 * @param events Dispatcher for deferred events, may be NULL
 */
void pounce_score_add(Pounce_Score *score, const Pounce_Config *config,
                      int32_t amount, Pounce_EventDispatcher *events);

/**
 * Award the pass value of an obstacle kind and update the combo.
 *
 * Basic obstacles reset the combo. Hard obstacles extend it, emit a BONUS
 * callout, add combo / 2 once the combo reaches combo_bonus_threshold and
 * emit a COMBO callout from combo_callout_threshold on. Power-ups award
 * nothing and leave the combo alone.
 *
 * @param anchor_x Callout anchor (runner centre)
 * @param anchor_y Callout anchor (runner top)
 * @return Points awarded
 */
int32_t pounce_score_pass(Pounce_Score *score, const Pounce_Config *config,
                          Pounce_ObstacleKind kind, int32_t pass_score,
                          float anchor_x, float anchor_y,
                          Pounce_EventDispatcher *events);

/**
 * Close the round. A score above the high score becomes the new high score,
 * is written to store (best effort) and announced with HIGH_SCORE.
 * GAME_OVER is always emitted.
 *
 * @param store Persistence, may be NULL for an in-memory high score
 * @return true if a new record was set
 */
bool pounce_score_finish(Pounce_Score *score, Pounce_HighScoreStore *store,
                         Pounce_EventDispatcher *events);

#endif /* POUNCE_SCORING_H */
