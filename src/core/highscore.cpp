#include "pounce/pounce.h"
#include "pounce/highscore.h"
#include "pounce/error.h"
#include "pounce/validate.h"
#include "pounce/log.h"

#include <ctype.h>
#include <errno.h>
#include <limits.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#define HIGHSCORE_PATH_MAX 512

struct Pounce_HighScoreStore {
    char path[HIGHSCORE_PATH_MAX];
};

Pounce_HighScoreStore *pounce_highscore_create(const char *path) {
    POUNCE_VALIDATE_STRING_RET(path, NULL);
    if (strlen(path) >= HIGHSCORE_PATH_MAX) {
        pounce_set_error("High-score path too long: %s", path);
        return NULL;
    }

    Pounce_HighScoreStore *store = POUNCE_ALLOC(Pounce_HighScoreStore);
    if (!store) {
        pounce_set_error("Failed to allocate high-score store");
        return NULL;
    }

    strncpy(store->path, path, sizeof(store->path) - 1);
    return store;
}

void pounce_highscore_destroy(Pounce_HighScoreStore *store) {
    free(store);
}

const char *pounce_highscore_get_path(const Pounce_HighScoreStore *store) {
    return store ? store->path : NULL;
}

/* Accepts optional surrounding whitespace and nothing else */
static bool parse_score(const char *text, int32_t *out) {
    while (isspace((unsigned char)*text)) text++;
    if (!isdigit((unsigned char)*text)) return false;

    errno = 0;
    char *end = NULL;
    long value = strtol(text, &end, 10);
    if (errno != 0 || value < 0 || value > INT32_MAX) return false;

    while (isspace((unsigned char)*end)) end++;
    if (*end != '\0') return false;

    *out = (int32_t)value;
    return true;
}

int32_t pounce_highscore_load(Pounce_HighScoreStore *store) {
    POUNCE_VALIDATE_PTR_RET(store, 0);

    FILE *fp = fopen(store->path, "r");
    if (!fp) {
        pounce_log_info(POUNCE_LOG_SAVE, "No high score at %s, starting from 0", store->path);
        return 0;
    }

    char buf[64];
    size_t len = fread(buf, 1, sizeof(buf) - 1, fp);
    bool read_error = ferror(fp) != 0;
    fclose(fp);
    buf[len] = '\0';

    int32_t value = 0;
    if (read_error || !parse_score(buf, &value)) {
        pounce_set_error("Corrupt high-score file: %s", store->path);
        pounce_log_warning(POUNCE_LOG_SAVE, "%s, using 0", pounce_get_last_error());
        return 0;
    }

    pounce_log_debug(POUNCE_LOG_SAVE, "Loaded high score %d from %s", (int)value, store->path);
    return value;
}

bool pounce_highscore_save(Pounce_HighScoreStore *store, int32_t value) {
    if (!store) {
        pounce_set_error("Invalid parameters");
        return false;
    }
    if (value < 0) value = 0;

    FILE *fp = fopen(store->path, "w");
    if (!fp) {
        pounce_set_error("Cannot write high-score file: %s", store->path);
        pounce_log_warning(POUNCE_LOG_SAVE, "%s", pounce_get_last_error());
        return false;
    }

    bool ok = fprintf(fp, "%d", (int)value) > 0;
    if (fclose(fp) != 0) ok = false;

    if (!ok) {
        pounce_set_error("Failed to write high-score file: %s", store->path);
        pounce_log_warning(POUNCE_LOG_SAVE, "%s", pounce_get_last_error());
        return false;
    }

    pounce_log_info(POUNCE_LOG_SAVE, "Saved high score %d", (int)value);
    return true;
}
