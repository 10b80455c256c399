#include "pounce/error.h"
#include <SDL3/SDL.h>
#include <stdarg.h>
#include <stdio.h>

#define ERROR_BUFFER_SIZE 512

static thread_local char s_error[ERROR_BUFFER_SIZE] = {0};

void pounce_set_error(const char *fmt, ...) {
    if (!fmt) {
        s_error[0] = '\0';
        return;
    }

    va_list args;
    va_start(args, fmt);
    vsnprintf(s_error, sizeof(s_error), fmt, args);
    va_end(args);
}

const char *pounce_get_last_error(void) {
    return s_error;
}

void pounce_clear_error(void) {
    s_error[0] = '\0';
}

bool pounce_has_error(void) {
    return s_error[0] != '\0';
}

void pounce_set_error_from_sdl(const char *prefix) {
    const char *sdl_error = SDL_GetError();
    if (!sdl_error || !sdl_error[0]) sdl_error = "Unknown SDL error";

    if (prefix && prefix[0]) {
        pounce_set_error("%s: %s", prefix, sdl_error);
    } else {
        pounce_set_error("%s", sdl_error);
    }
}

bool pounce_log_and_clear_error(Pounce_LogSubsystem subsystem) {
    if (!s_error[0]) return false;

    pounce_log_warning(subsystem, "%s", s_error);
    s_error[0] = '\0';
    return true;
}
