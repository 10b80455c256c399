#ifndef POUNCE_HIGHSCORE_H
#define POUNCE_HIGHSCORE_H

#include <stdbool.h>
#include <stdint.h>

/**
 * High-Score Store
 *
 * Persists a single non-negative integer as decimal text. Reads and writes
 * are synchronous and best effort: a missing or corrupt file loads as 0,
 * and a failed write is reported but never fatal.
 *
 * Usage:
 *   Pounce_HighScoreStore *store = pounce_highscore_create("highscore.txt");
 *   int32_t best = pounce_highscore_load(store);
 *   ...
 *   if (!pounce_highscore_save(store, best)) {
 *       pounce_log_and_clear_error(POUNCE_LOG_SAVE);
 *   }
 *   pounce_highscore_destroy(store);
 */

typedef struct Pounce_HighScoreStore Pounce_HighScoreStore;

/**
 * Create a store backed by the file at path. The file is not touched until
 * the first load or save.
 *
 * @return New store or NULL on failure. Caller owns it and must call
 *         pounce_highscore_destroy().
 */
Pounce_HighScoreStore *pounce_highscore_create(const char *path);

void pounce_highscore_destroy(Pounce_HighScoreStore *store);

/**
 * Read the stored value.
 *
 * @return The stored score, or 0 if the file is missing, unreadable or does
 *         not hold a non-negative integer
 */
int32_t pounce_highscore_load(Pounce_HighScoreStore *store);

/**
 * Write value, replacing the file contents.
 *
 * @return true on success, false with the error set otherwise
 */
bool pounce_highscore_save(Pounce_HighScoreStore *store, int32_t value);

const char *pounce_highscore_get_path(const Pounce_HighScoreStore *store);

#endif /* POUNCE_HIGHSCORE_H */
