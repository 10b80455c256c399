#include "state.h"
#include <stdlib.h>

GameStateMachine *game_state_machine_create(void) {
    GameStateMachine *sm = POUNCE_ALLOC(GameStateMachine);
    if (!sm) {
        pounce_set_error("Failed to allocate state machine");
        return NULL;
    }

    sm->current = GAME_STATE_NONE;
    sm->previous = GAME_STATE_NONE;
    sm->pending = GAME_STATE_NONE;
    return sm;
}

void game_state_machine_destroy(GameStateMachine *sm) {
    free(sm);
}

void game_state_machine_register(GameStateMachine *sm, GameStateID id, const GameState *state) {
    if (!sm || id <= GAME_STATE_NONE || id >= GAME_MAX_STATES || !state) return;
    sm->states[id] = *state;
}

void game_state_machine_change(GameStateMachine *sm, GameStateID id, DemoContext *demo) {
    if (!sm || id <= GAME_STATE_NONE || id >= GAME_MAX_STATES) return;

    if (sm->current != GAME_STATE_NONE && sm->states[sm->current].exit) {
        sm->states[sm->current].exit(demo, sm->states[sm->current].userdata);
    }

    sm->previous = sm->current;
    sm->current = id;

    pounce_log_debug(POUNCE_LOG_GAME, "State: %s -> %s",
                     sm->previous != GAME_STATE_NONE ? sm->states[sm->previous].name : "none",
                     sm->states[id].name ? sm->states[id].name : "?");

    if (sm->states[id].enter) {
        sm->states[id].enter(demo, sm->states[id].userdata);
    }
}

void game_state_machine_request(GameStateMachine *sm, GameStateID id) {
    if (!sm) return;
    sm->pending = id;
}

void game_state_machine_update(GameStateMachine *sm, DemoContext *demo) {
    if (!sm) return;

    if (sm->pending != GAME_STATE_NONE) {
        GameStateID next = sm->pending;
        sm->pending = GAME_STATE_NONE;
        game_state_machine_change(sm, next, demo);
    }

    if (sm->current == GAME_STATE_NONE) return;
    if (sm->states[sm->current].update) {
        sm->states[sm->current].update(demo, sm->states[sm->current].userdata);
    }
}

void game_state_machine_render(GameStateMachine *sm, DemoContext *demo) {
    if (!sm || sm->current == GAME_STATE_NONE) return;

    if (sm->states[sm->current].render) {
        sm->states[sm->current].render(demo, sm->states[sm->current].userdata);
    }
}

GameStateID game_state_machine_current(GameStateMachine *sm) {
    return sm ? sm->current : GAME_STATE_NONE;
}

GameStateID game_state_machine_previous(GameStateMachine *sm) {
    return sm ? sm->previous : GAME_STATE_NONE;
}
