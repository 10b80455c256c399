#ifndef POUNCE_LOG_H
#define POUNCE_LOG_H

#include <stdbool.h>
#include <stdint.h>

/**
 * Pounce Logging
 *
 * Every message carries a level and one subsystem tag. Messages that pass
 * the level filter go to the console (SDL_Log), to the log file when one
 * is open, and to every registered callback.
 *
 * Usage:
 *   pounce_log_init("pounce.log");        // NULL: console and callbacks only
 *   pounce_log_set_level(config.log_level);
 *
 *   pounce_log_warning(POUNCE_LOG_SAVE, "High score file unreadable: %s", path);
 *
 *   pounce_log_shutdown();
 *
 * File format:
 *   [2024-01-15 14:30:22] [WARNING] [Save     ] High score file unreadable
 */

typedef enum {
    POUNCE_LOG_LEVEL_ERROR = 0,    /**< Never filtered, flushed at once */
    POUNCE_LOG_LEVEL_WARNING,
    POUNCE_LOG_LEVEL_INFO,
    POUNCE_LOG_LEVEL_DEBUG
} Pounce_LogLevel;

typedef enum {
    POUNCE_LOG_GAME = 0,           /**< Round flow, runner, scoring */
    POUNCE_LOG_SPAWNER,
    POUNCE_LOG_COLLISION,
    POUNCE_LOG_CONFIG,
    POUNCE_LOG_SAVE,               /**< High-score persistence */
    POUNCE_LOG_INPUT,
    POUNCE_LOG_SUBSYSTEM_COUNT
} Pounce_LogSubsystem;

typedef void (*Pounce_LogCallback)(Pounce_LogLevel level, Pounce_LogSubsystem subsystem,
                                   const char *message, void *userdata);

/**
 * Start logging. Calling it again while running is a no-op.
 *
 * @param path File to append to, or NULL to log without a file
 * @return false with the error set if the file could not be opened
 *         (console logging still works)
 */
bool pounce_log_init(const char *path);

void pounce_log_shutdown(void);

/**
 * Drop messages less severe than level. Defaults to INFO.
 */
void pounce_log_set_level(Pounce_LogLevel level);

/**
 * Parse "error", "warning", "info" or "debug" (case-insensitive).
 *
 * @return false and leaves *level untouched if the name is unknown
 */
bool pounce_log_level_from_name(const char *name, Pounce_LogLevel *level);

const char *pounce_log_subsystem_name(Pounce_LogSubsystem subsystem);

void pounce_log_error(Pounce_LogSubsystem subsystem, const char *fmt, ...);
void pounce_log_warning(Pounce_LogSubsystem subsystem, const char *fmt, ...);
void pounce_log_info(Pounce_LogSubsystem subsystem, const char *fmt, ...);
void pounce_log_debug(Pounce_LogSubsystem subsystem, const char *fmt, ...);

/**
 * @return Handle for removal, or 0 if all slots are taken
 */
uint32_t pounce_log_add_callback(Pounce_LogCallback callback, void *userdata);

void pounce_log_remove_callback(uint32_t handle);

#endif /* POUNCE_LOG_H */
