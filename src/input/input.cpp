/*
 * Pounce Input System Implementation
 */

#include "pounce/pounce.h"
#include "pounce/input.h"
#include "pounce/world.h"
#include <stdlib.h>
#include <string.h>

#define MAX_GAMEPADS 4
#define MAX_KEYS 512

typedef struct {
    SDL_Gamepad *handle;
    bool connected;
    bool buttons[SDL_GAMEPAD_BUTTON_COUNT];
    bool buttons_tapped[SDL_GAMEPAD_BUTTON_COUNT];
} GamepadState;

/* Internal input state */
struct Pounce_Input {
    /* Actions */
    Pounce_Action actions[POUNCE_INPUT_MAX_ACTIONS];
    int action_count;

    /* Keyboard state */
    bool keys[MAX_KEYS];
    bool keys_prev[MAX_KEYS];
    bool keys_tapped[MAX_KEYS];  /* Went down this frame, even if already released */

    /* Gamepad state */
    GamepadState gamepads[MAX_GAMEPADS];
    int gamepad_count;
};

static GamepadState *find_gamepad(Pounce_Input *input, SDL_JoystickID id) {
    for (int i = 0; i < MAX_GAMEPADS; i++) {
        if (input->gamepads[i].handle && SDL_GetGamepadID(input->gamepads[i].handle) == id) {
            return &input->gamepads[i];
        }
    }
    return NULL;
}

static void open_gamepad(Pounce_Input *input, SDL_JoystickID id) {
    if (input->gamepad_count >= MAX_GAMEPADS) return;

    SDL_Gamepad *pad = SDL_OpenGamepad(id);
    if (!pad) {
        pounce_set_error_from_sdl("Failed to open gamepad");
        pounce_log_warning(POUNCE_LOG_INPUT, "%s", pounce_get_last_error());
        return;
    }

    for (int i = 0; i < MAX_GAMEPADS; i++) {
        if (!input->gamepads[i].connected) {
            input->gamepads[i].handle = pad;
            input->gamepads[i].connected = true;
            memset(input->gamepads[i].buttons, 0, sizeof(input->gamepads[i].buttons));
            memset(input->gamepads[i].buttons_tapped, 0, sizeof(input->gamepads[i].buttons_tapped));
            input->gamepad_count++;
            pounce_log_info(POUNCE_LOG_INPUT, "Gamepad connected: %s", SDL_GetGamepadName(pad));
            return;
        }
    }
    SDL_CloseGamepad(pad);
}

Pounce_Input *pounce_input_init(void) {
    Pounce_Input *input = POUNCE_ALLOC(Pounce_Input);
    if (!input) {
        pounce_set_error("Failed to allocate input");
        return NULL;
    }

    /* Gamepads are optional; keyboard input works without the subsystem */
    if (!SDL_WasInit(SDL_INIT_GAMEPAD)) {
        if (!SDL_InitSubSystem(SDL_INIT_GAMEPAD)) {
            pounce_log_warning(POUNCE_LOG_INPUT, "Gamepad subsystem unavailable: %s", SDL_GetError());
            return input;
        }
    }

    int num_joysticks = 0;
    SDL_JoystickID *joysticks = SDL_GetJoysticks(&num_joysticks);
    if (joysticks) {
        for (int i = 0; i < num_joysticks; i++) {
            if (SDL_IsGamepad(joysticks[i])) {
                open_gamepad(input, joysticks[i]);
            }
        }
        SDL_free(joysticks);
    }

    return input;
}

void pounce_input_shutdown(Pounce_Input *input) {
    if (!input) return;

    for (int i = 0; i < MAX_GAMEPADS; i++) {
        if (input->gamepads[i].handle) {
            SDL_CloseGamepad(input->gamepads[i].handle);
        }
    }

    free(input);
}

void pounce_input_begin_frame(Pounce_Input *input) {
    if (!input) return;

    memcpy(input->keys_prev, input->keys, sizeof(input->keys));
    memset(input->keys_tapped, 0, sizeof(input->keys_tapped));
    for (int i = 0; i < MAX_GAMEPADS; i++) {
        memset(input->gamepads[i].buttons_tapped, 0, sizeof(input->gamepads[i].buttons_tapped));
    }

    for (int i = 0; i < input->action_count; i++) {
        input->actions[i].just_pressed = false;
        input->actions[i].just_released = false;
    }
}

bool pounce_input_process_event(Pounce_Input *input, const SDL_Event *event) {
    if (!input || !event) return false;

    switch (event->type) {
    case SDL_EVENT_KEY_DOWN:
        if (event->key.scancode < MAX_KEYS) {
            input->keys[event->key.scancode] = true;
            if (!event->key.repeat) {
                input->keys_tapped[event->key.scancode] = true;
            }
        }
        return true;

    case SDL_EVENT_KEY_UP:
        if (event->key.scancode < MAX_KEYS) {
            input->keys[event->key.scancode] = false;
        }
        return true;

    case SDL_EVENT_GAMEPAD_ADDED:
        if (!find_gamepad(input, event->gdevice.which)) {
            open_gamepad(input, event->gdevice.which);
        }
        return true;

    case SDL_EVENT_GAMEPAD_REMOVED: {
        GamepadState *pad = find_gamepad(input, event->gdevice.which);
        if (pad) {
            pounce_log_info(POUNCE_LOG_INPUT, "Gamepad disconnected");
            SDL_CloseGamepad(pad->handle);
            pad->handle = NULL;
            pad->connected = false;
            input->gamepad_count--;
        }
        return true;
    }

    case SDL_EVENT_GAMEPAD_BUTTON_DOWN:
    case SDL_EVENT_GAMEPAD_BUTTON_UP: {
        GamepadState *pad = find_gamepad(input, event->gbutton.which);
        int btn = event->gbutton.button;
        if (pad && btn < SDL_GAMEPAD_BUTTON_COUNT) {
            bool down = event->type == SDL_EVENT_GAMEPAD_BUTTON_DOWN;
            pad->buttons[btn] = down;
            if (down) pad->buttons_tapped[btn] = true;
        }
        return true;
    }

    default:
        return false;
    }
}

/* Held now, or (tapped) went down at any point this frame */
static bool binding_active(const Pounce_Input *input, const Pounce_Binding *binding, bool tapped) {
    switch (binding->type) {
    case POUNCE_BINDING_KEY:
        if (binding->key >= MAX_KEYS) return false;
        return tapped ? input->keys_tapped[binding->key] : input->keys[binding->key];

    case POUNCE_BINDING_GAMEPAD_BUTTON:
        for (int i = 0; i < MAX_GAMEPADS; i++) {
            const GamepadState *pad = &input->gamepads[i];
            if (!pad->connected) continue;
            if (tapped ? pad->buttons_tapped[binding->gamepad_button]
                       : pad->buttons[binding->gamepad_button]) {
                return true;
            }
        }
        return false;

    default:
        return false;
    }
}

void pounce_input_update(Pounce_Input *input) {
    if (!input) return;

    for (int i = 0; i < input->action_count; i++) {
        Pounce_Action *action = &input->actions[i];
        bool was_pressed = action->pressed;
        bool is_pressed = false;
        bool tapped = false;

        for (int b = 0; b < action->binding_count; b++) {
            is_pressed = is_pressed || binding_active(input, &action->bindings[b], false);
            tapped = tapped || binding_active(input, &action->bindings[b], true);
        }

        /* A press and release inside one frame still counts as a press */
        action->pressed = is_pressed;
        action->just_pressed = tapped || (is_pressed && !was_pressed);
        action->just_released = !is_pressed && (was_pressed || tapped);
    }
}

/* ============ Action Management ============ */

int pounce_input_register_action(Pounce_Input *input, const char *name) {
    if (!input || !name) return -1;

    for (int i = 0; i < input->action_count; i++) {
        if (strcmp(input->actions[i].name, name) == 0) {
            return i; /* Already exists, return existing ID */
        }
    }

    if (input->action_count >= POUNCE_INPUT_MAX_ACTIONS) {
        pounce_set_error("Too many input actions (max %d)", POUNCE_INPUT_MAX_ACTIONS);
        return -1;
    }

    int id = input->action_count++;
    Pounce_Action *action = &input->actions[id];
    memset(action, 0, sizeof(*action));
    strncpy(action->name, name, POUNCE_INPUT_ACTION_NAME_LEN - 1);
    return id;
}

int pounce_input_find_action(Pounce_Input *input, const char *name) {
    if (!input || !name) return -1;

    for (int i = 0; i < input->action_count; i++) {
        if (strcmp(input->actions[i].name, name) == 0) {
            return i;
        }
    }
    return -1;
}

static Pounce_Binding *add_binding(Pounce_Input *input, int action_id) {
    if (!input || action_id < 0 || action_id >= input->action_count) return NULL;

    Pounce_Action *action = &input->actions[action_id];
    if (action->binding_count >= POUNCE_INPUT_MAX_BINDINGS) return NULL;
    return &action->bindings[action->binding_count++];
}

bool pounce_input_bind_key(Pounce_Input *input, int action_id, SDL_Scancode key) {
    Pounce_Binding *binding = add_binding(input, action_id);
    if (!binding) return false;

    binding->type = POUNCE_BINDING_KEY;
    binding->key = key;
    return true;
}

bool pounce_input_bind_gamepad_button(Pounce_Input *input, int action_id,
                                      SDL_GamepadButton button) {
    if (button < 0 || button >= SDL_GAMEPAD_BUTTON_COUNT) return false;

    Pounce_Binding *binding = add_binding(input, action_id);
    if (!binding) return false;

    binding->type = POUNCE_BINDING_GAMEPAD_BUTTON;
    binding->gamepad_button = button;
    return true;
}

void pounce_input_clear_bindings(Pounce_Input *input, int action_id) {
    if (!input || action_id < 0 || action_id >= input->action_count) return;
    input->actions[action_id].binding_count = 0;
}

bool pounce_input_bind_defaults(Pounce_Input *input) {
    if (!input) return false;

    int jump = pounce_input_register_action(input, POUNCE_ACTION_JUMP);
    int slide = pounce_input_register_action(input, POUNCE_ACTION_SLIDE);
    int shoot = pounce_input_register_action(input, POUNCE_ACTION_SHOOT);
    int restart = pounce_input_register_action(input, POUNCE_ACTION_RESTART);
    int pause = pounce_input_register_action(input, POUNCE_ACTION_PAUSE);
    int mute = pounce_input_register_action(input, POUNCE_ACTION_MUTE);
    if (jump < 0 || slide < 0 || shoot < 0 || restart < 0 || pause < 0 || mute < 0) {
        return false;
    }

    bool ok = true;
    ok &= pounce_input_bind_key(input, jump, SDL_SCANCODE_SPACE);
    ok &= pounce_input_bind_key(input, jump, SDL_SCANCODE_UP);
    ok &= pounce_input_bind_key(input, jump, SDL_SCANCODE_W);
    ok &= pounce_input_bind_gamepad_button(input, jump, SDL_GAMEPAD_BUTTON_SOUTH);

    ok &= pounce_input_bind_key(input, slide, SDL_SCANCODE_DOWN);
    ok &= pounce_input_bind_key(input, slide, SDL_SCANCODE_S);
    ok &= pounce_input_bind_gamepad_button(input, slide, SDL_GAMEPAD_BUTTON_EAST);

    ok &= pounce_input_bind_key(input, shoot, SDL_SCANCODE_F);
    ok &= pounce_input_bind_key(input, shoot, SDL_SCANCODE_X);
    ok &= pounce_input_bind_gamepad_button(input, shoot, SDL_GAMEPAD_BUTTON_WEST);

    ok &= pounce_input_bind_key(input, restart, SDL_SCANCODE_R);
    ok &= pounce_input_bind_key(input, restart, SDL_SCANCODE_RETURN);
    ok &= pounce_input_bind_gamepad_button(input, restart, SDL_GAMEPAD_BUTTON_START);

    ok &= pounce_input_bind_key(input, pause, SDL_SCANCODE_P);
    ok &= pounce_input_bind_key(input, pause, SDL_SCANCODE_ESCAPE);
    ok &= pounce_input_bind_gamepad_button(input, pause, SDL_GAMEPAD_BUTTON_BACK);

    ok &= pounce_input_bind_key(input, mute, SDL_SCANCODE_M);

    if (!ok) {
        pounce_log_warning(POUNCE_LOG_INPUT, "Some default bindings could not be added");
    }
    return ok;
}

/* ============ Action Queries ============ */

bool pounce_input_action_pressed(Pounce_Input *input, int action_id) {
    if (!input || action_id < 0 || action_id >= input->action_count) return false;
    return input->actions[action_id].pressed;
}

bool pounce_input_action_just_pressed(Pounce_Input *input, int action_id) {
    if (!input || action_id < 0 || action_id >= input->action_count) return false;
    return input->actions[action_id].just_pressed;
}

bool pounce_input_action_just_released(Pounce_Input *input, int action_id) {
    if (!input || action_id < 0 || action_id >= input->action_count) return false;
    return input->actions[action_id].just_released;
}

bool pounce_input_pressed(Pounce_Input *input, const char *action) {
    return pounce_input_action_pressed(input, pounce_input_find_action(input, action));
}

bool pounce_input_just_pressed(Pounce_Input *input, const char *action) {
    return pounce_input_action_just_pressed(input, pounce_input_find_action(input, action));
}

bool pounce_input_just_released(Pounce_Input *input, const char *action) {
    return pounce_input_action_just_released(input, pounce_input_find_action(input, action));
}

/* ============ Direct Input Queries ============ */

bool pounce_input_key_pressed(Pounce_Input *input, SDL_Scancode key) {
    if (!input || key >= MAX_KEYS) return false;
    return input->keys[key];
}

bool pounce_input_key_just_pressed(Pounce_Input *input, SDL_Scancode key) {
    if (!input || key >= MAX_KEYS) return false;
    return input->keys_tapped[key] || (input->keys[key] && !input->keys_prev[key]);
}

void pounce_input_fill_tick(Pounce_Input *input, Pounce_TickInput *tick) {
    if (!tick) return;

    tick->jump = pounce_input_just_pressed(input, POUNCE_ACTION_JUMP);
    tick->slide = pounce_input_just_pressed(input, POUNCE_ACTION_SLIDE);
    tick->shoot = pounce_input_just_pressed(input, POUNCE_ACTION_SHOOT);
    tick->restart = pounce_input_just_pressed(input, POUNCE_ACTION_RESTART);
    tick->pause = pounce_input_just_pressed(input, POUNCE_ACTION_PAUSE);
    tick->mute = pounce_input_just_pressed(input, POUNCE_ACTION_MUTE);
}
