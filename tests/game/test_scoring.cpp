/*
 * Pounce Scoring Tests
 *
 * Tests for difficulty curves, combo bonuses, milestones and the end of
 * round high-score handling.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "pounce/scoring.h"
#include "pounce/config.h"
#include "pounce/event.h"
#include "pounce/highscore.h"
#include <cstdio>
#include <vector>

static void record_event(const Pounce_Event *event, void *userdata) {
    static_cast<std::vector<Pounce_Event> *>(userdata)->push_back(*event);
}

static int count_type(const std::vector<Pounce_Event> &events, Pounce_EventType type) {
    int n = 0;
    for (const Pounce_Event &e : events) {
        if (e.type == type) n++;
    }
    return n;
}

static const Pounce_Event *find_type(const std::vector<Pounce_Event> &events, Pounce_EventType type) {
    for (const Pounce_Event &e : events) {
        if (e.type == type) return &e;
    }
    return nullptr;
}

/* ============================================================================
 * Difficulty
 * ============================================================================ */

TEST_CASE("Difficulty speed", "[scoring][difficulty]") {
    Pounce_Config config;
    pounce_config_default(&config);

    REQUIRE(pounce_difficulty_speed(&config, 0) == Catch::Approx(7.0f));
    REQUIRE(pounce_difficulty_speed(&config, 9) == Catch::Approx(7.0f));
    REQUIRE(pounce_difficulty_speed(&config, 10) == Catch::Approx(7.2f));
    REQUIRE(pounce_difficulty_speed(&config, 100) == Catch::Approx(9.0f));
    REQUIRE(pounce_difficulty_speed(&config, 100000) == Catch::Approx(15.0f));

    SECTION("Speed never decreases as the score grows") {
        float previous = pounce_difficulty_speed(&config, 0);
        for (int32_t s = 1; s <= 1000; s++) {
            float speed = pounce_difficulty_speed(&config, s);
            REQUIRE(speed >= previous);
            REQUIRE(speed <= config.max_speed);
            previous = speed;
        }
    }
}

TEST_CASE("Spawn interval", "[scoring][difficulty]") {
    Pounce_Config config;
    pounce_config_default(&config);

    REQUIRE(pounce_spawn_interval(&config, 0) == 1500);
    REQUIRE(pounce_spawn_interval(&config, 4) == 1500);
    REQUIRE(pounce_spawn_interval(&config, 5) == 1450);
    REQUIRE(pounce_spawn_interval(&config, 70) == 800);
    REQUIRE(pounce_spawn_interval(&config, 100000) == 800);

    SECTION("Interval never increases as the score grows") {
        int32_t previous = pounce_spawn_interval(&config, 0);
        for (int32_t s = 1; s <= 1000; s++) {
            int32_t interval = pounce_spawn_interval(&config, s);
            REQUIRE(interval <= previous);
            REQUIRE(interval >= config.min_interval_ms);
            previous = interval;
        }
    }
}

/* ============================================================================
 * Passing Obstacles
 * ============================================================================ */

TEST_CASE("Passing obstacles", "[scoring][combo]") {
    Pounce_Config config;
    pounce_config_default(&config);
    Pounce_EventDispatcher *events = pounce_event_dispatcher_create();
    REQUIRE(events != nullptr);
    std::vector<Pounce_Event> seen;
    pounce_event_subscribe_all(events, record_event, &seen);

    Pounce_Score score;
    pounce_score_reset(&score, &config, 0);

    SECTION("Basic obstacles score one and reset the combo") {
        score.combo = 4;
        REQUIRE(pounce_score_pass(&score, &config, POUNCE_KIND_BASIC, 1, 125.0f, 450.0f, events) == 1);
        REQUIRE(score.score == 1);
        REQUIRE(score.combo == 0);

        pounce_event_flush_deferred(events);
        REQUIRE(count_type(seen, POUNCE_EVENT_SCORE_CHANGED) == 1);
        REQUIRE(count_type(seen, POUNCE_EVENT_BONUS) == 0);
    }

    SECTION("Hard obstacles build a combo") {
        REQUIRE(pounce_score_pass(&score, &config, POUNCE_KIND_HARD, 2, 125.0f, 450.0f, events) == 2);
        REQUIRE(score.combo == 1);
        REQUIRE(pounce_score_pass(&score, &config, POUNCE_KIND_HARD, 2, 125.0f, 450.0f, events) == 3);
        REQUIRE(score.combo == 2);
        REQUIRE(pounce_score_pass(&score, &config, POUNCE_KIND_HARD, 2, 125.0f, 450.0f, events) == 3);
        REQUIRE(pounce_score_pass(&score, &config, POUNCE_KIND_HARD, 2, 125.0f, 450.0f, events) == 4);
        REQUIRE(score.combo == 4);
        REQUIRE(score.score == 12);

        pounce_event_flush_deferred(events);
        REQUIRE(count_type(seen, POUNCE_EVENT_BONUS) == 4);
        REQUIRE(count_type(seen, POUNCE_EVENT_COMBO) == 2);
    }

    SECTION("Callouts stack above the anchor") {
        score.combo = 2;
        pounce_score_pass(&score, &config, POUNCE_KIND_HARD, 2, 125.0f, 450.0f, events);
        pounce_event_flush_deferred(events);

        const Pounce_Event *bonus = find_type(seen, POUNCE_EVENT_BONUS);
        const Pounce_Event *combo = find_type(seen, POUNCE_EVENT_COMBO);
        REQUIRE(bonus != nullptr);
        REQUIRE(combo != nullptr);
        REQUIRE(bonus->callout.x == 125.0f);
        REQUIRE(bonus->callout.y == 430.0f);
        REQUIRE(bonus->callout.amount == 2);
        REQUIRE(combo->callout.y == 410.0f);
        REQUIRE(combo->callout.combo == 3);
        REQUIRE(combo->callout.amount == 3);
    }

    SECTION("Power-ups award nothing and keep the combo") {
        score.combo = 3;
        REQUIRE(pounce_score_pass(&score, &config, POUNCE_KIND_POWERUP, 0, 0.0f, 0.0f, events) == 0);
        REQUIRE(score.combo == 3);
        REQUIRE(score.score == 0);
        REQUIRE(pounce_event_deferred_count(events) == 0);
    }

    SECTION("Difficulty follows the score") {
        for (int i = 0; i < 10; i++) {
            pounce_score_pass(&score, &config, POUNCE_KIND_BASIC, 1, 0.0f, 0.0f, events);
        }
        REQUIRE(score.speed == Catch::Approx(pounce_difficulty_speed(&config, 10)));
        REQUIRE(score.interval_ms == pounce_spawn_interval(&config, 10));
    }

    pounce_event_dispatcher_destroy(events);
}

TEST_CASE("Score milestones", "[scoring][milestone]") {
    Pounce_Config config;
    pounce_config_default(&config);
    Pounce_EventDispatcher *events = pounce_event_dispatcher_create();
    std::vector<Pounce_Event> seen;
    pounce_event_subscribe(events, POUNCE_EVENT_SCORE_MILESTONE, record_event, &seen);

    Pounce_Score score;
    pounce_score_reset(&score, &config, 0);

    pounce_score_add(&score, &config, 24, events);
    pounce_event_flush_deferred(events);
    REQUIRE(seen.empty());

    pounce_score_add(&score, &config, 1, events);
    pounce_event_flush_deferred(events);
    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].milestone.value == 25);

    pounce_score_add(&score, &config, 3, events);
    pounce_event_flush_deferred(events);
    REQUIRE(seen.size() == 1);

    SECTION("Non-positive amounts are ignored") {
        pounce_score_add(&score, &config, 0, events);
        pounce_score_add(&score, &config, -10, events);
        REQUIRE(score.score == 28);
    }

    pounce_event_dispatcher_destroy(events);
}

/* ============================================================================
 * End of Round
 * ============================================================================ */

TEST_CASE("Finishing a round", "[scoring][highscore]") {
    const char *path = "test_scoring_highscore.txt";
    remove(path);

    Pounce_Config config;
    pounce_config_default(&config);
    Pounce_EventDispatcher *events = pounce_event_dispatcher_create();
    std::vector<Pounce_Event> seen;
    pounce_event_subscribe_all(events, record_event, &seen);
    Pounce_HighScoreStore *store = pounce_highscore_create(path);
    REQUIRE(store != nullptr);

    Pounce_Score score;
    pounce_score_reset(&score, &config, 10);
    REQUIRE(score.high_score == 10);

    SECTION("Beating the high score records it") {
        pounce_score_add(&score, &config, 12, nullptr);
        REQUIRE(pounce_score_finish(&score, store, events));
        REQUIRE(score.high_score == 12);
        REQUIRE(score.new_record);
        REQUIRE(pounce_highscore_load(store) == 12);

        pounce_event_flush_deferred(events);
        REQUIRE(count_type(seen, POUNCE_EVENT_HIGH_SCORE) == 1);
        const Pounce_Event *over = find_type(seen, POUNCE_EVENT_GAME_OVER);
        REQUIRE(over != nullptr);
        REQUIRE(over->round.score == 12);
        REQUIRE(over->round.new_record);
    }

    SECTION("Matching the high score is not a record") {
        pounce_score_add(&score, &config, 10, nullptr);
        REQUIRE_FALSE(pounce_score_finish(&score, store, events));
        REQUIRE(score.high_score == 10);

        pounce_event_flush_deferred(events);
        REQUIRE(count_type(seen, POUNCE_EVENT_HIGH_SCORE) == 0);
        REQUIRE(count_type(seen, POUNCE_EVENT_GAME_OVER) == 1);
        REQUIRE(pounce_highscore_load(store) == 0);
    }

    SECTION("Works without a store") {
        pounce_score_add(&score, &config, 50, nullptr);
        REQUIRE(pounce_score_finish(&score, nullptr, nullptr));
        REQUIRE(score.high_score == 50);
    }

    pounce_highscore_destroy(store);
    pounce_event_dispatcher_destroy(events);
    remove(path);
}
