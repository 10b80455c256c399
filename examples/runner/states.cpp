/**
 * Pounce Runner Demo - Screen States
 */

#include "state.h"
#include <stdio.h>

/* Simulation step per rendered frame at 60 FPS */
#define DEMO_TICK_MS 16

static void advance_world(DemoContext *demo) {
    demo->sim_ms += DEMO_TICK_MS;
    pounce_world_tick(demo->world, &demo->tick, demo->sim_ms);
    demo_popups_update(demo);
}

/* ============================================================================
 * Splash
 * ============================================================================ */

static void splash_update(DemoContext *demo, void *userdata) {
    (void)userdata;
    if (demo->tick.jump || demo->tick.restart) {
        pounce_world_reset(demo->world, demo->sim_ms);
        game_state_machine_request(demo->states, GAME_STATE_PLAYING);
    }
}

static void splash_render(DemoContext *demo, void *userdata) {
    (void)userdata;
    demo_draw_world(demo);
    demo_draw_banner(demo, "POUNCE", "Space jump  Down slide  F shoot  B theme");
}

GameState game_state_splash_create(void) {
    GameState state = {};
    state.name = "splash";
    state.update = splash_update;
    state.render = splash_render;
    return state;
}

/* ============================================================================
 * Playing
 * ============================================================================ */

static void playing_update(DemoContext *demo, void *userdata) {
    (void)userdata;

    if (demo->tick.pause) {
        game_state_machine_request(demo->states, GAME_STATE_PAUSED);
        return;
    }

    advance_world(demo);

    if (pounce_world_is_game_over(demo->world)) {
        game_state_machine_request(demo->states, GAME_STATE_GAME_OVER);
    }
}

static void playing_render(DemoContext *demo, void *userdata) {
    (void)userdata;
    demo_draw_world(demo);
    demo_draw_hud(demo);
}

GameState game_state_playing_create(void) {
    GameState state = {};
    state.name = "playing";
    state.update = playing_update;
    state.render = playing_render;
    return state;
}

/* ============================================================================
 * Paused
 * ============================================================================ */

static void paused_update(DemoContext *demo, void *userdata) {
    (void)userdata;
    if (demo->tick.pause) {
        game_state_machine_request(demo->states, GAME_STATE_PLAYING);
    }
}

static void paused_render(DemoContext *demo, void *userdata) {
    (void)userdata;
    demo_draw_world(demo);
    demo_draw_hud(demo);
    demo_draw_banner(demo, "PAUSED", "Press P to resume");
}

GameState game_state_paused_create(void) {
    GameState state = {};
    state.name = "paused";
    state.update = paused_update;
    state.render = paused_render;
    return state;
}

/* ============================================================================
 * Game Over
 * ============================================================================ */

static void game_over_update(DemoContext *demo, void *userdata) {
    (void)userdata;

    /* The world ignores everything but restart while the round is over */
    advance_world(demo);

    if (!pounce_world_is_game_over(demo->world)) {
        demo_popups_clear(demo);
        game_state_machine_request(demo->states, GAME_STATE_PLAYING);
    }
}

static void game_over_render(DemoContext *demo, void *userdata) {
    (void)userdata;

    Pounce_WorldStats stats;
    pounce_world_get_stats(demo->world, &stats);

    char line[96];
    snprintf(line, sizeof(line), "Score %d  Best %d%s  -  R to restart",
             (int)stats.score, (int)stats.high_score, stats.new_record ? " NEW!" : "");

    demo_draw_world(demo);
    demo_draw_hud(demo);
    demo_draw_banner(demo, "GAME OVER", line);
}

GameState game_state_game_over_create(void) {
    GameState state = {};
    state.name = "game over";
    state.update = game_over_update;
    state.render = game_over_render;
    return state;
}
