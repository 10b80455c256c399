#include "pounce/log.h"
#include "pounce/error.h"
#include <SDL3/SDL.h>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <strings.h>
#include <time.h>

#define LOG_MAX_CALLBACKS 8
#define LOG_MESSAGE_SIZE 1024

struct LogSink {
    Pounce_LogCallback callback;
    void *userdata;
    uint32_t handle;
};

struct LogState {
    FILE *file;
    Pounce_LogLevel level;
    bool running;
    LogSink sinks[LOG_MAX_CALLBACKS];
    uint32_t next_handle;
};

static LogState s_log = { NULL, POUNCE_LOG_LEVEL_INFO, false, {}, 1 };

/* Padded to the widest entry so file columns line up */
static const char *s_level_names[] = { "ERROR  ", "WARNING", "INFO   ", "DEBUG  " };
static const char *s_level_keys[] = { "error", "warning", "info", "debug" };

static const char *s_subsystem_names[POUNCE_LOG_SUBSYSTEM_COUNT] = {
    "Game", "Spawner", "Collision", "Config", "Save", "Input"
};

bool pounce_log_init(const char *path) {
    if (s_log.running) return true;
    s_log.running = true;

    if (!path) return true;

    s_log.file = fopen(path, "a");
    if (!s_log.file) {
        pounce_set_error("Cannot open log file: %s", path);
        return false;
    }

    char stamp[32];
    time_t now = time(NULL);
    strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", localtime(&now));
    fprintf(s_log.file, "\n=== Pounce session %s ===\n", stamp);
    return true;
}

void pounce_log_shutdown(void) {
    if (s_log.file) {
        fclose(s_log.file);
        s_log.file = NULL;
    }
    s_log.running = false;
}

void pounce_log_set_level(Pounce_LogLevel level) {
    s_log.level = level;
}

bool pounce_log_level_from_name(const char *name, Pounce_LogLevel *level) {
    if (!name || !level) return false;

    for (int i = 0; i <= POUNCE_LOG_LEVEL_DEBUG; i++) {
        if (strcasecmp(name, s_level_keys[i]) == 0) {
            *level = (Pounce_LogLevel)i;
            return true;
        }
    }
    return false;
}

const char *pounce_log_subsystem_name(Pounce_LogSubsystem subsystem) {
    if ((int)subsystem < 0 || subsystem >= POUNCE_LOG_SUBSYSTEM_COUNT) return "?";
    return s_subsystem_names[subsystem];
}

static void log_write(Pounce_LogLevel level, Pounce_LogSubsystem subsystem,
                      const char *fmt, va_list args) {
    if (level > s_log.level) return;

    char message[LOG_MESSAGE_SIZE];
    vsnprintf(message, sizeof(message), fmt, args);

    const char *tag = pounce_log_subsystem_name(subsystem);

    if (s_log.file) {
        char stamp[32];
        time_t now = time(NULL);
        strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", localtime(&now));
        fprintf(s_log.file, "[%s] [%s] [%-9s] %s\n", stamp, s_level_names[level], tag, message);
        if (level == POUNCE_LOG_LEVEL_ERROR) fflush(s_log.file);
    }

    SDL_LogPriority priority = SDL_LOG_PRIORITY_DEBUG;
    switch (level) {
        case POUNCE_LOG_LEVEL_ERROR:   priority = SDL_LOG_PRIORITY_ERROR; break;
        case POUNCE_LOG_LEVEL_WARNING: priority = SDL_LOG_PRIORITY_WARN; break;
        case POUNCE_LOG_LEVEL_INFO:    priority = SDL_LOG_PRIORITY_INFO; break;
        case POUNCE_LOG_LEVEL_DEBUG:   break;
    }
    SDL_LogMessage(SDL_LOG_CATEGORY_APPLICATION, priority, "[%s] %s", tag, message);

    for (int i = 0; i < LOG_MAX_CALLBACKS; i++) {
        const LogSink *sink = &s_log.sinks[i];
        if (sink->callback) {
            sink->callback(level, subsystem, message, sink->userdata);
        }
    }
}

#define POUNCE_LOG_FORWARD(level_value)        \
    va_list args;                              \
    va_start(args, fmt);                       \
    log_write(level_value, subsystem, fmt, args); \
    va_end(args)

void pounce_log_error(Pounce_LogSubsystem subsystem, const char *fmt, ...) {
    POUNCE_LOG_FORWARD(POUNCE_LOG_LEVEL_ERROR);
}

void pounce_log_warning(Pounce_LogSubsystem subsystem, const char *fmt, ...) {
    POUNCE_LOG_FORWARD(POUNCE_LOG_LEVEL_WARNING);
}

void pounce_log_info(Pounce_LogSubsystem subsystem, const char *fmt, ...) {
    POUNCE_LOG_FORWARD(POUNCE_LOG_LEVEL_INFO);
}

void pounce_log_debug(Pounce_LogSubsystem subsystem, const char *fmt, ...) {
    POUNCE_LOG_FORWARD(POUNCE_LOG_LEVEL_DEBUG);
}

uint32_t pounce_log_add_callback(Pounce_LogCallback callback, void *userdata) {
    if (!callback) return 0;

    for (int i = 0; i < LOG_MAX_CALLBACKS; i++) {
        LogSink *sink = &s_log.sinks[i];
        if (!sink->callback) {
            sink->callback = callback;
            sink->userdata = userdata;
            sink->handle = s_log.next_handle++;
            return sink->handle;
        }
    }
    return 0;
}

void pounce_log_remove_callback(uint32_t handle) {
    if (handle == 0) return;

    for (int i = 0; i < LOG_MAX_CALLBACKS; i++) {
        if (s_log.sinks[i].handle == handle) {
            s_log.sinks[i] = LogSink{};
            return;
        }
    }
}
