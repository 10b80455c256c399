#include "pounce/pounce.h"
#include "pounce/event.h"
#include <stdlib.h>
#include <string.h>

/*============================================================================
 * Internal Structures
 *============================================================================*/

#define POUNCE_EVENT_INITIAL_LISTENERS 8
#define POUNCE_EVENT_DEFERRED_QUEUE_SIZE 64

typedef struct Pounce_Listener {
    Pounce_ListenerID id;
    Pounce_EventType type;          /* POUNCE_EVENT_NONE for "all" listeners */
    Pounce_EventCallback callback;
    void *userdata;
    bool active;
} Pounce_Listener;

struct Pounce_EventDispatcher {
    Pounce_Listener *listeners;
    size_t listener_count;
    size_t listener_capacity;

    /* Monotonically increasing, 0 is reserved */
    Pounce_ListenerID next_id;

    uint32_t current_frame;

    Pounce_Event *deferred_queue;
    size_t deferred_count;
    size_t deferred_capacity;

    bool is_emitting;
};

/*============================================================================
 * Internal Helpers
 *============================================================================*/

static bool ensure_listener_capacity(Pounce_EventDispatcher *d) {
    if (d->listener_count < d->listener_capacity) {
        return true;
    }

    size_t new_capacity = d->listener_capacity == 0 ? POUNCE_EVENT_INITIAL_LISTENERS
                                                    : d->listener_capacity * 2;
    Pounce_Listener *new_listeners = POUNCE_REALLOC(d->listeners, Pounce_Listener, new_capacity);
    if (!new_listeners) {
        pounce_set_error("Failed to grow event listener array to %zu", new_capacity);
        return false;
    }

    d->listeners = new_listeners;
    d->listener_capacity = new_capacity;
    return true;
}

static bool ensure_deferred_capacity(Pounce_EventDispatcher *d) {
    if (d->deferred_count < d->deferred_capacity) {
        return true;
    }

    size_t new_capacity = d->deferred_capacity == 0 ? POUNCE_EVENT_DEFERRED_QUEUE_SIZE
                                                    : d->deferred_capacity * 2;
    Pounce_Event *new_queue = POUNCE_REALLOC(d->deferred_queue, Pounce_Event, new_capacity);
    if (!new_queue) {
        pounce_set_error("Failed to grow deferred event queue to %zu", new_capacity);
        return false;
    }

    d->deferred_queue = new_queue;
    d->deferred_capacity = new_capacity;
    return true;
}

static void compact_listeners(Pounce_EventDispatcher *d) {
    size_t write_idx = 0;
    for (size_t read_idx = 0; read_idx < d->listener_count; read_idx++) {
        if (d->listeners[read_idx].active) {
            if (write_idx != read_idx) {
                d->listeners[write_idx] = d->listeners[read_idx];
            }
            write_idx++;
        }
    }
    d->listener_count = write_idx;
}

/*============================================================================
 * Public API
 *============================================================================*/

Pounce_EventDispatcher *pounce_event_dispatcher_create(void) {
    Pounce_EventDispatcher *d = POUNCE_ALLOC(Pounce_EventDispatcher);
    if (!d) {
        pounce_set_error("Failed to allocate event dispatcher");
        return NULL;
    }

    d->next_id = 1;
    return d;
}

void pounce_event_dispatcher_destroy(Pounce_EventDispatcher *d) {
    if (!d) return;

    free(d->listeners);
    free(d->deferred_queue);
    free(d);
}

Pounce_ListenerID pounce_event_subscribe(Pounce_EventDispatcher *d,
                                         Pounce_EventType type,
                                         Pounce_EventCallback callback,
                                         void *userdata) {
    if (!d || !callback) return 0;

    if (!ensure_listener_capacity(d)) {
        return 0;
    }

    Pounce_Listener *listener = &d->listeners[d->listener_count++];
    listener->id = d->next_id++;
    listener->type = type;
    listener->callback = callback;
    listener->userdata = userdata;
    listener->active = true;

    return listener->id;
}

Pounce_ListenerID pounce_event_subscribe_all(Pounce_EventDispatcher *d,
                                             Pounce_EventCallback callback,
                                             void *userdata) {
    return pounce_event_subscribe(d, POUNCE_EVENT_NONE, callback, userdata);
}

void pounce_event_unsubscribe(Pounce_EventDispatcher *d, Pounce_ListenerID id) {
    if (!d || id == 0) return;

    for (size_t i = 0; i < d->listener_count; i++) {
        if (d->listeners[i].id == id) {
            d->listeners[i].active = false;

            /* Compaction is postponed while a callback may be iterating */
            if (!d->is_emitting) {
                if (i < d->listener_count - 1) {
                    d->listeners[i] = d->listeners[d->listener_count - 1];
                }
                d->listener_count--;
            }
            return;
        }
    }
}

void pounce_event_emit(Pounce_EventDispatcher *d, const Pounce_Event *event) {
    if (!d || !event) return;

    Pounce_Event e = *event;
    e.timestamp = d->current_frame;

    bool was_emitting = d->is_emitting;
    d->is_emitting = true;

    for (size_t i = 0; i < d->listener_count; i++) {
        Pounce_Listener *listener = &d->listeners[i];

        if (!listener->active) continue;

        if (listener->type == POUNCE_EVENT_NONE || listener->type == e.type) {
            listener->callback(&e, listener->userdata);
        }
    }

    d->is_emitting = was_emitting;

    if (!d->is_emitting) {
        compact_listeners(d);
    }
}

void pounce_event_emit_deferred(Pounce_EventDispatcher *d, const Pounce_Event *event) {
    if (!d || !event) return;

    if (!ensure_deferred_capacity(d)) {
        return;
    }

    Pounce_Event *queued = &d->deferred_queue[d->deferred_count++];
    *queued = *event;
    queued->timestamp = d->current_frame;
}

void pounce_event_flush_deferred(Pounce_EventDispatcher *d) {
    if (!d || d->deferred_count == 0) return;

    /* Listeners may queue more events; emit from a snapshot so the queue
     * can grow underneath us. */
    size_t count = d->deferred_count;
    Pounce_Event *batch = POUNCE_ALLOC_ARRAY(Pounce_Event, count);
    if (!batch) {
        pounce_set_error("Failed to allocate %zu deferred events for flush", count);
        d->deferred_count = 0;
        return;
    }
    memcpy(batch, d->deferred_queue, count * sizeof(Pounce_Event));
    d->deferred_count = 0;

    for (size_t i = 0; i < count; i++) {
        Pounce_Event e = batch[i];
        uint32_t frame = d->current_frame;
        d->current_frame = e.timestamp;
        pounce_event_emit(d, &e);
        d->current_frame = frame;
    }
    free(batch);

    if (d->deferred_count > 0) {
        pounce_event_flush_deferred(d);
    }
}

size_t pounce_event_deferred_count(const Pounce_EventDispatcher *d) {
    return d ? d->deferred_count : 0;
}

void pounce_event_discard_deferred(Pounce_EventDispatcher *d) {
    if (d) {
        d->deferred_count = 0;
    }
}

void pounce_event_set_frame(Pounce_EventDispatcher *d, uint32_t frame) {
    if (d) {
        d->current_frame = frame;
    }
}

int pounce_event_listener_count(const Pounce_EventDispatcher *d, Pounce_EventType type) {
    if (!d) return 0;

    int count = 0;
    for (size_t i = 0; i < d->listener_count; i++) {
        if (d->listeners[i].active &&
            (d->listeners[i].type == type || d->listeners[i].type == POUNCE_EVENT_NONE)) {
            count++;
        }
    }
    return count;
}

void pounce_event_clear_all(Pounce_EventDispatcher *d) {
    if (!d) return;

    d->listener_count = 0;
    d->deferred_count = 0;
}

/*============================================================================
 * Convenience Event Emitters
 *============================================================================*/

void pounce_event_emit_round_started(Pounce_EventDispatcher *d) {
    Pounce_Event e = {};
    e.type = POUNCE_EVENT_ROUND_STARTED;
    pounce_event_emit(d, &e);
}

/*============================================================================
 * Event Type Names
 *============================================================================*/

const char *pounce_event_type_name(Pounce_EventType type) {
    switch (type) {
        case POUNCE_EVENT_NONE:               return "NONE";

        case POUNCE_EVENT_ROUND_STARTED:      return "ROUND_STARTED";
        case POUNCE_EVENT_GAME_OVER:          return "GAME_OVER";
        case POUNCE_EVENT_HIGH_SCORE:         return "HIGH_SCORE";

        case POUNCE_EVENT_SCORE_CHANGED:      return "SCORE_CHANGED";
        case POUNCE_EVENT_SCORE_MILESTONE:    return "SCORE_MILESTONE";
        case POUNCE_EVENT_BONUS:              return "BONUS";
        case POUNCE_EVENT_COMBO:              return "COMBO";

        case POUNCE_EVENT_OBSTACLE_SPAWNED:   return "OBSTACLE_SPAWNED";
        case POUNCE_EVENT_OBSTACLE_DESTROYED: return "OBSTACLE_DESTROYED";
        case POUNCE_EVENT_POWERUP_COLLECTED:  return "POWERUP_COLLECTED";
        case POUNCE_EVENT_PROJECTILE_FIRED:   return "PROJECTILE_FIRED";

        case POUNCE_EVENT_RUNNER_JUMPED:      return "RUNNER_JUMPED";
        case POUNCE_EVENT_RUNNER_SLID:        return "RUNNER_SLID";

        default:
            return "UNKNOWN";
    }
}
