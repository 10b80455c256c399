/**
 * Pounce Runner Demo - Score Popups
 *
 * BONUS and COMBO events become short-lived text that drifts upwards.
 */

#include "demo.h"
#include <stdio.h>
#include <string.h>

static void push_popup(DemoContext *demo, const char *text, float x, float y, Pounce_Color color) {
    if (demo->popup_count >= DEMO_MAX_POPUPS) {
        /* Drop the oldest */
        memmove(&demo->popups[0], &demo->popups[1], sizeof(DemoPopup) * (DEMO_MAX_POPUPS - 1));
        demo->popup_count--;
    }

    DemoPopup *p = &demo->popups[demo->popup_count++];
    snprintf(p->text, sizeof(p->text), "%s", text);
    p->x = x;
    p->y = y;
    p->color = color;
    p->life = DEMO_POPUP_LIFE;
}

static void on_callout(const Pounce_Event *event, void *userdata) {
    DemoContext *demo = (DemoContext *)userdata;
    char text[DEMO_POPUP_TEXT_LEN];

    if (event->type == POUNCE_EVENT_BONUS) {
        snprintf(text, sizeof(text), "+%d BONUS!", (int)event->callout.amount);
        push_popup(demo, text, event->callout.x, event->callout.y, Pounce_Color{ 200, 50, 50 });
    } else {
        snprintf(text, sizeof(text), "COMBO x%d!", (int)event->callout.combo);
        push_popup(demo, text, event->callout.x, event->callout.y, Pounce_Color{ 200, 200, 50 });
    }
}

static void on_milestone(const Pounce_Event *event, void *userdata) {
    DemoContext *demo = (DemoContext *)userdata;
    char text[DEMO_POPUP_TEXT_LEN];

    snprintf(text, sizeof(text), "%d!", (int)event->milestone.value);
    push_popup(demo, text, demo->config.screen_width * 0.5f, 80.0f, Pounce_Color{ 60, 60, 160 });
}

static void on_game_over(const Pounce_Event *event, void *userdata) {
    (void)userdata;
    pounce_log_info(POUNCE_LOG_GAME, "Game over at %d", (int)event->round.score);
}

void demo_popups_attach(DemoContext *demo) {
    Pounce_EventDispatcher *events = pounce_world_get_events(demo->world);
    pounce_event_subscribe(events, POUNCE_EVENT_BONUS, on_callout, demo);
    pounce_event_subscribe(events, POUNCE_EVENT_COMBO, on_callout, demo);
    pounce_event_subscribe(events, POUNCE_EVENT_SCORE_MILESTONE, on_milestone, demo);
    pounce_event_subscribe(events, POUNCE_EVENT_GAME_OVER, on_game_over, demo);
}

void demo_popups_update(DemoContext *demo) {
    int write = 0;
    for (int i = 0; i < demo->popup_count; i++) {
        DemoPopup *p = &demo->popups[i];
        p->y -= 1.0f;
        p->life--;
        if (p->life > 0) {
            demo->popups[write++] = *p;
        }
    }
    demo->popup_count = write;
}

void demo_popups_clear(DemoContext *demo) {
    demo->popup_count = 0;
}
