#ifndef POUNCE_RECT_H
#define POUNCE_RECT_H

#include <stdbool.h>

/**
 * Axis-aligned rectangle in playfield pixels. (x, y) is the top-left
 * corner; y grows downward.
 */
typedef struct Pounce_Rect {
    float x, y;
    float w, h;
} Pounce_Rect;

static inline float pounce_rect_right(const Pounce_Rect *r) {
    return r->x + r->w;
}

static inline float pounce_rect_bottom(const Pounce_Rect *r) {
    return r->y + r->h;
}

/**
 * Strict overlap test. Rectangles that only share an edge do not overlap.
 */
static inline bool pounce_rect_overlaps(const Pounce_Rect *a, const Pounce_Rect *b) {
    return a->x < b->x + b->w &&
           b->x < a->x + a->w &&
           a->y < b->y + b->h &&
           b->y < a->y + a->h;
}

static inline float pounce_clampf(float v, float lo, float hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

static inline int pounce_clampi(int v, int lo, int hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

#endif /* POUNCE_RECT_H */
