/**
 * Pounce - Runner Demo
 *
 * Plays the simulation in an SDL window with flat-colour rectangles.
 *
 *   pounce_runner [config.toml]
 *
 * Controls: Space/Up jump (again in the air with a gem charge), Down slide,
 * F shoot (needs a star charge), P pause, R restart, M mute, B switch the
 * background theme.
 */

#include "demo.h"
#include "state.h"
#include <stdio.h>

#define DEMO_FRAME_MS 16

static bool demo_init(DemoContext *demo, const char *config_path) {
    pounce_config_default(&demo->config);
    if (config_path && !pounce_config_load_file(&demo->config, config_path)) {
        pounce_log_and_clear_error(POUNCE_LOG_CONFIG);
    }

    /* A log file that cannot be opened leaves console logging running */
    if (!pounce_log_init(demo->config.log_path[0] ? demo->config.log_path : NULL)) {
        pounce_log_and_clear_error(POUNCE_LOG_CONFIG);
    }
    pounce_log_set_level(demo->config.log_level);

    if (!SDL_Init(SDL_INIT_VIDEO)) {
        pounce_set_error_from_sdl("SDL_Init failed");
        return false;
    }

    if (!SDL_CreateWindowAndRenderer("Pounce", (int)demo->config.screen_width,
                                     (int)demo->config.screen_height, 0,
                                     &demo->window, &demo->renderer)) {
        pounce_set_error_from_sdl("Failed to create window");
        return false;
    }
    SDL_SetRenderVSync(demo->renderer, 1);

    demo->store = pounce_highscore_create(demo->config.highscore_path);
    if (!demo->store) {
        /* In-memory high score only */
        pounce_log_and_clear_error(POUNCE_LOG_SAVE);
    }

    demo->world = pounce_world_create(&demo->config, demo->store, 0);
    if (!demo->world) return false;

    demo->input = pounce_input_init();
    if (!demo->input || !pounce_input_bind_defaults(demo->input)) return false;

    demo->states = game_state_machine_create();
    if (!demo->states) return false;

    GameState splash = game_state_splash_create();
    GameState playing = game_state_playing_create();
    GameState paused = game_state_paused_create();
    GameState game_over = game_state_game_over_create();
    game_state_machine_register(demo->states, GAME_STATE_SPLASH, &splash);
    game_state_machine_register(demo->states, GAME_STATE_PLAYING, &playing);
    game_state_machine_register(demo->states, GAME_STATE_PAUSED, &paused);
    game_state_machine_register(demo->states, GAME_STATE_GAME_OVER, &game_over);

    demo_popups_attach(demo);
    game_state_machine_change(demo->states, GAME_STATE_SPLASH, demo);

    demo->running = true;
    return true;
}

static void demo_shutdown(DemoContext *demo) {
    game_state_machine_destroy(demo->states);
    pounce_input_shutdown(demo->input);
    pounce_world_destroy(demo->world);
    pounce_highscore_destroy(demo->store);
    if (demo->renderer) SDL_DestroyRenderer(demo->renderer);
    if (demo->window) SDL_DestroyWindow(demo->window);
    SDL_Quit();
}

static void demo_poll(DemoContext *demo) {
    pounce_input_begin_frame(demo->input);

    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        if (event.type == SDL_EVENT_QUIT) {
            demo->running = false;
        }
        pounce_input_process_event(demo->input, &event);
    }

    pounce_input_update(demo->input);
    pounce_input_fill_tick(demo->input, &demo->tick);

    if (demo->tick.mute) {
        demo->muted = !demo->muted;
    }

    /* Switching the theme also reshuffles the obstacle sequence */
    if (pounce_input_key_just_pressed(demo->input, SDL_SCANCODE_B)) {
        demo->background ^= 1;
        pounce_world_reshuffle(demo->world, (uint32_t)SDL_GetPerformanceCounter());
    }
}

int main(int argc, char *argv[]) {
    DemoContext demo = {};
    const char *config_path = argc > 1 ? argv[1] : NULL;

    if (!demo_init(&demo, config_path)) {
        fprintf(stderr, "Failed to start: %s\n", pounce_get_last_error());
        demo_shutdown(&demo);
        pounce_log_shutdown();
        return 1;
    }

    while (demo.running) {
        uint64_t frame_start = SDL_GetTicks();

        demo_poll(&demo);
        game_state_machine_update(demo.states, &demo);
        game_state_machine_render(demo.states, &demo);
        SDL_RenderPresent(demo.renderer);

        uint64_t elapsed = SDL_GetTicks() - frame_start;
        if (elapsed < DEMO_FRAME_MS) {
            SDL_Delay((Uint32)(DEMO_FRAME_MS - elapsed));
        }
    }

    demo_shutdown(&demo);
    pounce_log_shutdown();
    return 0;
}
