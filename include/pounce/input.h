/*
 * Pounce Input System
 *
 * Maps keyboard keys and gamepad buttons to named actions ("jump",
 * "slide"). The simulation never sees raw input: once per frame the
 * front end converts the standard actions into a Pounce_TickInput.
 */

#ifndef POUNCE_INPUT_H
#define POUNCE_INPUT_H

#include <SDL3/SDL.h>
#include <stdbool.h>
#include <stdint.h>

typedef struct Pounce_Input Pounce_Input;
typedef struct Pounce_TickInput Pounce_TickInput;

/* Maximum limits */
#define POUNCE_INPUT_MAX_ACTIONS      32
#define POUNCE_INPUT_MAX_BINDINGS     4   /* Max bindings per action */
#define POUNCE_INPUT_ACTION_NAME_LEN  32

/* Standard action names */
#define POUNCE_ACTION_JUMP     "jump"
#define POUNCE_ACTION_SLIDE    "slide"
#define POUNCE_ACTION_SHOOT    "shoot"
#define POUNCE_ACTION_RESTART  "restart"
#define POUNCE_ACTION_PAUSE    "pause"
#define POUNCE_ACTION_MUTE     "mute"

typedef enum {
    POUNCE_BINDING_NONE = 0,
    POUNCE_BINDING_KEY,            /* Keyboard key */
    POUNCE_BINDING_GAMEPAD_BUTTON, /* Gamepad button */
} Pounce_BindingType;

typedef struct {
    Pounce_BindingType type;
    union {
        SDL_Scancode key;
        SDL_GamepadButton gamepad_button;
    };
} Pounce_Binding;

typedef struct {
    char name[POUNCE_INPUT_ACTION_NAME_LEN];
    Pounce_Binding bindings[POUNCE_INPUT_MAX_BINDINGS];
    int binding_count;
    bool pressed;      /* Currently held down */
    bool just_pressed; /* Pressed this frame */
    bool just_released;/* Released this frame */
} Pounce_Action;

/*
 * Initialize the input system and open connected gamepads.
 * Returns NULL on failure
 */
Pounce_Input *pounce_input_init(void);

void pounce_input_shutdown(Pounce_Input *input);

/*
 * Feed an SDL event. Returns true if the event was consumed.
 */
bool pounce_input_process_event(Pounce_Input *input, const SDL_Event *event);

/*
 * Recompute action states from the raw key and button state.
 * Call once per frame after all events are processed.
 */
void pounce_input_update(Pounce_Input *input);

/*
 * Start a new frame: clears the per-frame edges.
 * Call before polling events.
 */
void pounce_input_begin_frame(Pounce_Input *input);

/* Action management. IDs are -1 on failure. */
int pounce_input_register_action(Pounce_Input *input, const char *name);
int pounce_input_find_action(Pounce_Input *input, const char *name);
bool pounce_input_bind_key(Pounce_Input *input, int action_id, SDL_Scancode key);
bool pounce_input_bind_gamepad_button(Pounce_Input *input, int action_id,
                                      SDL_GamepadButton button);
void pounce_input_clear_bindings(Pounce_Input *input, int action_id);

/*
 * Register the six standard actions with their default bindings:
 *   jump    Space, Up, W     / South
 *   slide   Down, S          / East
 *   shoot   F, X             / West
 *   restart R, Return        / Start
 *   pause   P, Escape        / Back
 *   mute    M
 */
bool pounce_input_bind_defaults(Pounce_Input *input);

/* Action queries */
bool pounce_input_action_pressed(Pounce_Input *input, int action_id);
bool pounce_input_action_just_pressed(Pounce_Input *input, int action_id);
bool pounce_input_action_just_released(Pounce_Input *input, int action_id);

bool pounce_input_pressed(Pounce_Input *input, const char *action);
bool pounce_input_just_pressed(Pounce_Input *input, const char *action);
bool pounce_input_just_released(Pounce_Input *input, const char *action);

/* Direct keyboard queries */
bool pounce_input_key_pressed(Pounce_Input *input, SDL_Scancode key);
bool pounce_input_key_just_pressed(Pounce_Input *input, SDL_Scancode key);


/*
 * Fill tick with the just-pressed edges of the standard actions.
 * Actions that are not registered read as false.
 */
void pounce_input_fill_tick(Pounce_Input *input, Pounce_TickInput *tick);

#endif /* POUNCE_INPUT_H */
