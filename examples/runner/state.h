#ifndef POUNCE_DEMO_STATE_H
#define POUNCE_DEMO_STATE_H

#include "demo.h"
#include <stdbool.h>

/**
 * Game State Machine
 *
 * Screen flow for the demo: splash, playing, paused and game over.
 * Each state has enter, exit, update, and render callbacks.
 *
 * Usage:
 *   GameStateMachine *sm = game_state_machine_create();
 *   GameState splash = game_state_splash_create();
 *   game_state_machine_register(sm, GAME_STATE_SPLASH, &splash);
 *   game_state_machine_change(sm, GAME_STATE_SPLASH, demo);
 *
 *   // In game loop:
 *   game_state_machine_update(sm, demo);
 *   game_state_machine_render(sm, demo);
 */

#define GAME_MAX_STATES 8

typedef enum {
    GAME_STATE_NONE = 0,
    GAME_STATE_SPLASH,
    GAME_STATE_PLAYING,
    GAME_STATE_PAUSED,
    GAME_STATE_GAME_OVER,
    GAME_STATE_COUNT
} GameStateID;

typedef struct GameState GameState;

typedef void (*GameStateEnter)(DemoContext *demo, void *userdata);
typedef void (*GameStateExit)(DemoContext *demo, void *userdata);
typedef void (*GameStateUpdate)(DemoContext *demo, void *userdata);
typedef void (*GameStateRender)(DemoContext *demo, void *userdata);

struct GameState {
    const char *name;           /* State name for debugging */
    GameStateEnter enter;       /* Called when entering state */
    GameStateExit exit;         /* Called when leaving state */
    GameStateUpdate update;     /* Called each frame */
    GameStateRender render;     /* Called each frame for rendering */
    void *userdata;
};

struct GameStateMachine {
    GameState states[GAME_MAX_STATES];
    GameStateID current;
    GameStateID previous;
    GameStateID pending;        /* Applied at the start of the next update */
};

GameStateMachine *game_state_machine_create(void);

void game_state_machine_destroy(GameStateMachine *sm);

/**
 * Register a state. The definition is copied.
 */
void game_state_machine_register(GameStateMachine *sm, GameStateID id, const GameState *state);

/**
 * Change state now: exit on the current state, enter on the new one.
 */
void game_state_machine_change(GameStateMachine *sm, GameStateID id, DemoContext *demo);

/**
 * Request a change at the start of the next update. Safe to call from
 * inside a state callback.
 */
void game_state_machine_request(GameStateMachine *sm, GameStateID id);

void game_state_machine_update(GameStateMachine *sm, DemoContext *demo);

void game_state_machine_render(GameStateMachine *sm, DemoContext *demo);

GameStateID game_state_machine_current(GameStateMachine *sm);

GameStateID game_state_machine_previous(GameStateMachine *sm);

/*============================================================================
 * State Implementations (states.cpp)
 *============================================================================*/

GameState game_state_splash_create(void);
GameState game_state_playing_create(void);
GameState game_state_paused_create(void);
GameState game_state_game_over_create(void);

#endif /* POUNCE_DEMO_STATE_H */
