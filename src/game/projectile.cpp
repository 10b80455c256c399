#include "pounce/pounce.h"
#include "pounce/projectile.h"
#include "pounce/error.h"

#include <stdlib.h>
#include <string.h>

void pounce_projectile_update(Pounce_Projectile *projectile) {
    if (!projectile) return;
    projectile->x += projectile->speed;
}

bool pounce_projectile_offscreen(const Pounce_Projectile *projectile, float screen_width) {
    if (!projectile) return true;
    return projectile->x > screen_width || projectile->x + projectile->width < 0.0f;
}

Pounce_Rect pounce_projectile_rect(const Pounce_Projectile *projectile) {
    Pounce_Rect r = { 0.0f, 0.0f, 0.0f, 0.0f };
    if (projectile) {
        r.x = projectile->x;
        r.y = projectile->y;
        r.w = projectile->width;
        r.h = projectile->height;
    }
    return r;
}

bool pounce_projectile_list_init(Pounce_ProjectileList *list, size_t capacity) {
    if (!list || capacity == 0) {
        pounce_set_error("Invalid parameters");
        return false;
    }

    list->items = POUNCE_ALLOC_ARRAY(Pounce_Projectile, capacity);
    if (!list->items) {
        pounce_set_error("Failed to allocate projectile list (%zu)", capacity);
        return false;
    }
    list->count = 0;
    list->capacity = capacity;
    return true;
}

Pounce_Projectile *pounce_projectile_list_fire(Pounce_ProjectileList *list, float x, float y,
                                               float width, float height, float speed) {
    if (!list || list->count >= list->capacity) return NULL;

    Pounce_Projectile *p = &list->items[list->count++];
    p->x = x;
    p->y = y - height * 0.5f;
    p->width = width;
    p->height = height;
    p->speed = speed;
    p->alive = true;
    return p;
}

size_t pounce_projectile_list_compact(Pounce_ProjectileList *list, float screen_width) {
    if (!list) return 0;

    size_t write = 0;
    for (size_t read = 0; read < list->count; read++) {
        Pounce_Projectile *p = &list->items[read];
        if (!p->alive || pounce_projectile_offscreen(p, screen_width)) continue;
        if (write != read) {
            list->items[write] = *p;
        }
        write++;
    }

    size_t removed = list->count - write;
    list->count = write;
    return removed;
}

void pounce_projectile_list_clear(Pounce_ProjectileList *list) {
    if (!list) return;
    list->count = 0;
}

void pounce_projectile_list_free(Pounce_ProjectileList *list) {
    if (!list) return;
    free(list->items);
    list->items = NULL;
    list->count = 0;
    list->capacity = 0;
}
