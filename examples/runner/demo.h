/**
 * Pounce Runner Demo - Shared State
 */

#ifndef POUNCE_DEMO_H
#define POUNCE_DEMO_H

#include "pounce/pounce.h"
#include "pounce/input.h"
#include <SDL3/SDL.h>

#define DEMO_MAX_POPUPS 16
#define DEMO_POPUP_LIFE 60
#define DEMO_POPUP_TEXT_LEN 32

typedef struct GameStateMachine GameStateMachine;

/* Floating callout spawned by BONUS and COMBO events */
typedef struct DemoPopup {
    char text[DEMO_POPUP_TEXT_LEN];
    float x, y;
    Pounce_Color color;
    int life;
} DemoPopup;

typedef struct DemoContext {
    SDL_Window *window;
    SDL_Renderer *renderer;

    Pounce_Config config;
    Pounce_World *world;
    Pounce_Input *input;
    Pounce_HighScoreStore *store;
    GameStateMachine *states;

    Pounce_TickInput tick;       /* Edges for the current frame */
    uint64_t sim_ms;             /* Simulation clock, frozen while paused */

    DemoPopup popups[DEMO_MAX_POPUPS];
    int popup_count;

    int background;              /* Cosmetic theme index */
    bool muted;
    bool running;
} DemoContext;

/* draw.cpp */
void demo_draw_world(DemoContext *demo);
void demo_draw_hud(DemoContext *demo);
void demo_draw_banner(DemoContext *demo, const char *title, const char *subtitle);
Pounce_Color demo_obstacle_color(Pounce_ObstacleType type, uint32_t variant, int palette_index);

/* popups.cpp */
void demo_popups_attach(DemoContext *demo);
void demo_popups_update(DemoContext *demo);
void demo_popups_clear(DemoContext *demo);

#endif /* POUNCE_DEMO_H */
