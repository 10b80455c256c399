#ifndef POUNCE_ERROR_H
#define POUNCE_ERROR_H

#include "pounce/log.h"
#include <stdbool.h>

/**
 * Pounce Error Handling
 *
 * Functions that fail return NULL or false and leave a message in a
 * thread-local buffer. The caller decides whether the failure is fatal
 * or only worth a log line.
 *
 * Usage:
 *   Pounce_HighScoreStore *store = pounce_highscore_create(path);
 *   if (!store) {
 *       pounce_log_and_clear_error(POUNCE_LOG_SAVE);   // keep playing in memory
 *   }
 */

/**
 * Replace the current message (printf-style). A NULL format clears it.
 */
void pounce_set_error(const char *fmt, ...);

/**
 * @return The current message, or "" when none is set (thread-local, do not free)
 */
const char *pounce_get_last_error(void);

void pounce_clear_error(void);

bool pounce_has_error(void);

/**
 * Copy SDL_GetError() into the buffer as "prefix: sdl message".
 *
 * @param prefix May be NULL
 */
void pounce_set_error_from_sdl(const char *prefix);

/**
 * Log the current message as a warning under subsystem, then clear it.
 *
 * @return true if there was a message to log
 */
bool pounce_log_and_clear_error(Pounce_LogSubsystem subsystem);

#endif /* POUNCE_ERROR_H */
