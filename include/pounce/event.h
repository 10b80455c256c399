#ifndef POUNCE_EVENT_H
#define POUNCE_EVENT_H

#include <stdbool.h>
#include <stdint.h>
#include <stddef.h>

/**
 * Pounce Event Dispatcher
 *
 * Publish-subscribe notifications from the simulation to its collaborators
 * (HUD, sound, persistence). Simulation code emits deferred during a tick;
 * the world flushes the queue once the tick is complete, so listeners
 * always observe a consistent state.
 *
 * Usage:
 *   Pounce_EventDispatcher *events = pounce_world_get_events(world);
 *   Pounce_ListenerID id = pounce_event_subscribe(events, POUNCE_EVENT_GAME_OVER,
 *                                                 on_game_over, hud);
 *   ...
 *   pounce_event_unsubscribe(events, id);
 */

/*============================================================================
 * Event Types
 *============================================================================*/

typedef enum Pounce_EventType {
    POUNCE_EVENT_NONE = 0,

    /* Round lifecycle (100-199) */
    POUNCE_EVENT_ROUND_STARTED = 100,
    POUNCE_EVENT_GAME_OVER,
    POUNCE_EVENT_HIGH_SCORE,

    /* Scoring (200-299) */
    POUNCE_EVENT_SCORE_CHANGED = 200,
    POUNCE_EVENT_SCORE_MILESTONE,
    POUNCE_EVENT_BONUS,
    POUNCE_EVENT_COMBO,

    /* Entities (300-399) */
    POUNCE_EVENT_OBSTACLE_SPAWNED = 300,
    POUNCE_EVENT_OBSTACLE_DESTROYED,
    POUNCE_EVENT_POWERUP_COLLECTED,
    POUNCE_EVENT_PROJECTILE_FIRED,

    /* Runner actions (400-499) */
    POUNCE_EVENT_RUNNER_JUMPED = 400,
    POUNCE_EVENT_RUNNER_SLID,
} Pounce_EventType;

/*============================================================================
 * Event Data
 *============================================================================*/

typedef struct Pounce_Event {
    Pounce_EventType type;
    uint32_t timestamp;     /* Frame number when emitted */

    union {
        /* GAME_OVER, HIGH_SCORE */
        struct {
            int32_t score;
            int32_t high_score;
            bool new_record;
        } round;

        /* SCORE_CHANGED */
        struct {
            int32_t old_value;
            int32_t new_value;
            int32_t delta;
        } score;

        /* SCORE_MILESTONE */
        struct {
            int32_t value;
        } milestone;

        /* BONUS, COMBO: cosmetic callouts anchored at the runner */
        struct {
            int32_t amount;
            int32_t combo;
            float x, y;
        } callout;

        /* OBSTACLE_SPAWNED, OBSTACLE_DESTROYED, PROJECTILE_FIRED */
        struct {
            int type;       /* Pounce_ObstacleType, -1 for projectiles */
            float x, y;
        } entity;

        /* POWERUP_COLLECTED */
        struct {
            int power;      /* Pounce_PowerKind */
            int charges;    /* Charges held after collection */
        } powerup;

        /* RUNNER_JUMPED, RUNNER_SLID */
        struct {
            bool double_jump;
        } runner;
    };
} Pounce_Event;

/*============================================================================
 * Event Dispatcher API
 *============================================================================*/

typedef struct Pounce_EventDispatcher Pounce_EventDispatcher;
typedef uint32_t Pounce_ListenerID;

typedef void (*Pounce_EventCallback)(const Pounce_Event *event, void *userdata);

/**
 * Create a new event dispatcher.
 *
 * @return New dispatcher or NULL on failure. Caller owns it and must call
 *         pounce_event_dispatcher_destroy().
 */
Pounce_EventDispatcher *pounce_event_dispatcher_create(void);

void pounce_event_dispatcher_destroy(Pounce_EventDispatcher *d);

/**
 * Subscribe to a specific event type.
 *
 * @return Listener ID for unsubscribing, or 0 on failure
 */
Pounce_ListenerID pounce_event_subscribe(Pounce_EventDispatcher *d,
                                         Pounce_EventType type,
                                         Pounce_EventCallback callback,
                                         void *userdata);

/**
 * Subscribe to every event type.
 */
Pounce_ListenerID pounce_event_subscribe_all(Pounce_EventDispatcher *d,
                                             Pounce_EventCallback callback,
                                             void *userdata);

void pounce_event_unsubscribe(Pounce_EventDispatcher *d, Pounce_ListenerID id);

/**
 * Emit an event immediately to all listeners.
 */
void pounce_event_emit(Pounce_EventDispatcher *d, const Pounce_Event *event);

/**
 * Queue an event for emission at the next flush.
 */
void pounce_event_emit_deferred(Pounce_EventDispatcher *d, const Pounce_Event *event);

/**
 * Emit all queued events. Events queued by listeners during the flush are
 * emitted in the same call.
 */
void pounce_event_flush_deferred(Pounce_EventDispatcher *d);

/**
 * Number of queued, not yet flushed events.
 */
size_t pounce_event_deferred_count(const Pounce_EventDispatcher *d);

/**
 * Drop queued events without emitting them.
 */
void pounce_event_discard_deferred(Pounce_EventDispatcher *d);

void pounce_event_set_frame(Pounce_EventDispatcher *d, uint32_t frame);

int pounce_event_listener_count(const Pounce_EventDispatcher *d, Pounce_EventType type);

void pounce_event_clear_all(Pounce_EventDispatcher *d);

/* Convenience emitters */
void pounce_event_emit_round_started(Pounce_EventDispatcher *d);

/**
 * Human-readable name for an event type.
 */
const char *pounce_event_type_name(Pounce_EventType type);

#endif /* POUNCE_EVENT_H */
