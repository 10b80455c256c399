#ifndef POUNCE_VALIDATE_H
#define POUNCE_VALIDATE_H

#include "pounce/error.h"
#include <stdbool.h>
#include <stddef.h>

/**
 * Pounce Validation Macros
 *
 * Early-return argument checks that record the failure in the Pounce
 * error buffer.
 *
 * Usage:
 *   bool pounce_highscore_save(Pounce_HighScoreStore *store, int value) {
 *       POUNCE_VALIDATE_PTR_RET(store, false);
 *       ...
 *   }
 */

/*============================================================================
 * Pointer Validation
 *============================================================================*/

#define POUNCE_VALIDATE_PTR(ptr) \
    do { \
        if (!(ptr)) { \
            pounce_set_error("%s: null pointer: %s", __func__, #ptr); \
            return; \
        } \
    } while(0)

#define POUNCE_VALIDATE_PTR_RET(ptr, ret) \
    do { \
        if (!(ptr)) { \
            pounce_set_error("%s: null pointer: %s", __func__, #ptr); \
            return (ret); \
        } \
    } while(0)

#define POUNCE_VALIDATE_PTRS2(p1, p2) \
    do { \
        if (!(p1)) { pounce_set_error("%s: null pointer: %s", __func__, #p1); return; } \
        if (!(p2)) { pounce_set_error("%s: null pointer: %s", __func__, #p2); return; } \
    } while(0)

#define POUNCE_VALIDATE_PTRS2_RET(p1, p2, ret) \
    do { \
        if (!(p1)) { pounce_set_error("%s: null pointer: %s", __func__, #p1); return (ret); } \
        if (!(p2)) { pounce_set_error("%s: null pointer: %s", __func__, #p2); return (ret); } \
    } while(0)

/*============================================================================
 * Index / Value Validation
 *============================================================================*/

#define POUNCE_VALIDATE_INDEX_RET(index, count, ret) \
    do { \
        if ((size_t)(index) >= (size_t)(count)) { \
            pounce_set_error("%s: index out of bounds: %s (%zu >= %zu)", \
                             __func__, #index, (size_t)(index), (size_t)(count)); \
            return (ret); \
        } \
    } while(0)

#define POUNCE_VALIDATE_POSITIVE_RET(val, ret) \
    do { \
        if ((val) <= 0) { \
            pounce_set_error("%s: %s must be positive: %d", __func__, #val, (int)(val)); \
            return (ret); \
        } \
    } while(0)

#define POUNCE_VALIDATE_STRING_RET(str, ret) \
    do { \
        if (!(str) || (str)[0] == '\0') { \
            pounce_set_error("%s: null or empty string: %s", __func__, #str); \
            return (ret); \
        } \
    } while(0)

#endif /* POUNCE_VALIDATE_H */
