#include "pounce/pounce.h"
#include "pounce/scoring.h"
#include "pounce/log.h"

#include <string.h>

/* Callouts stack above the runner */
#define BONUS_CALLOUT_OFFSET 20.0f
#define COMBO_CALLOUT_OFFSET 40.0f

/* ============================================================================
 * Difficulty
 * ============================================================================ */

float pounce_difficulty_speed(const Pounce_Config *config, int32_t score) {
    if (!config) return 0.0f;
    if (score < 0) score = 0;

    int32_t steps = score / config->speed_score_step;
    float speed = config->base_speed + (float)steps * config->speed_step;
    return speed < config->max_speed ? speed : config->max_speed;
}

int32_t pounce_spawn_interval(const Pounce_Config *config, int32_t score) {
    if (!config) return 0;
    if (score < 0) score = 0;

    int32_t steps = score / config->interval_score_step;
    int64_t interval = (int64_t)config->base_interval_ms - (int64_t)steps * config->interval_step_ms;
    return interval > config->min_interval_ms ? (int32_t)interval : config->min_interval_ms;
}

/* ============================================================================
 * Score State
 * ============================================================================ */

void pounce_score_reset(Pounce_Score *score, const Pounce_Config *config, int32_t high_score) {
    if (!score || !config) return;

    memset(score, 0, sizeof(*score));
    score->high_score = high_score > 0 ? high_score : 0;
    score->speed = pounce_difficulty_speed(config, 0);
    score->interval_ms = pounce_spawn_interval(config, 0);
}

void pounce_score_add(Pounce_Score *score, const Pounce_Config *config,
                      int32_t amount, Pounce_EventDispatcher *events) {
    if (!score || !config || amount <= 0) return;

    int32_t old_value = score->score;
    score->score += amount;
    score->speed = pounce_difficulty_speed(config, score->score);
    score->interval_ms = pounce_spawn_interval(config, score->score);

    if (events) {
        Pounce_Event e = {};
        e.type = POUNCE_EVENT_SCORE_CHANGED;
        e.score.old_value = old_value;
        e.score.new_value = score->score;
        e.score.delta = amount;
        pounce_event_emit_deferred(events, &e);
    }

    int32_t milestone = score->score / config->milestone_step;
    if (milestone > score->last_milestone) {
        score->last_milestone = milestone;
        pounce_log_debug(POUNCE_LOG_GAME, "Milestone %d reached", (int)(milestone * config->milestone_step));

        if (events) {
            Pounce_Event e = {};
            e.type = POUNCE_EVENT_SCORE_MILESTONE;
            e.milestone.value = milestone * config->milestone_step;
            pounce_event_emit_deferred(events, &e);
        }
    }
}

static void emit_callout(Pounce_EventDispatcher *events, Pounce_EventType type,
                         int32_t amount, int32_t combo, float x, float y) {
    if (!events) return;

    Pounce_Event e = {};
    e.type = type;
    e.callout.amount = amount;
    e.callout.combo = combo;
    e.callout.x = x;
    e.callout.y = y;
    pounce_event_emit_deferred(events, &e);
}

int32_t pounce_score_pass(Pounce_Score *score, const Pounce_Config *config,
                          Pounce_ObstacleKind kind, int32_t pass_score,
                          float anchor_x, float anchor_y,
                          Pounce_EventDispatcher *events) {
    if (!score || !config) return 0;

    int32_t award = 0;
    switch (kind) {
        case POUNCE_KIND_POWERUP:
            return 0;

        case POUNCE_KIND_BASIC:
            award = pass_score;
            score->combo = 0;
            break;

        case POUNCE_KIND_HARD:
            award = pass_score;
            score->combo++;
            emit_callout(events, POUNCE_EVENT_BONUS, pass_score, score->combo,
                         anchor_x, anchor_y - BONUS_CALLOUT_OFFSET);

            if (score->combo >= config->combo_bonus_threshold) {
                award += score->combo / 2;
            }
            if (score->combo >= config->combo_callout_threshold) {
                emit_callout(events, POUNCE_EVENT_COMBO, award, score->combo,
                             anchor_x, anchor_y - COMBO_CALLOUT_OFFSET);
            }
            break;
    }

    pounce_score_add(score, config, award, events);
    return award;
}

bool pounce_score_finish(Pounce_Score *score, Pounce_HighScoreStore *store,
                         Pounce_EventDispatcher *events) {
    if (!score) return false;

    score->new_record = false;
    if (score->score > score->high_score) {
        score->high_score = score->score;
        score->new_record = true;

        if (store && !pounce_highscore_save(store, score->high_score)) {
            pounce_log_warning(POUNCE_LOG_GAME, "High score %d kept in memory only",
                               (int)score->high_score);
        }

        if (events) {
            Pounce_Event e = {};
            e.type = POUNCE_EVENT_HIGH_SCORE;
            e.round.score = score->score;
            e.round.high_score = score->high_score;
            e.round.new_record = true;
            pounce_event_emit_deferred(events, &e);
        }
    }

    pounce_log_info(POUNCE_LOG_GAME, "Round over: score %d, best %d%s",
                    (int)score->score, (int)score->high_score,
                    score->new_record ? " (new record)" : "");

    if (events) {
        Pounce_Event e = {};
        e.type = POUNCE_EVENT_GAME_OVER;
        e.round.score = score->score;
        e.round.high_score = score->high_score;
        e.round.new_record = score->new_record;
        pounce_event_emit_deferred(events, &e);
    }

    return score->new_record;
}
