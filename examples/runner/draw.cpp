/**
 * Pounce Runner Demo - Flat-Colour Renderer
 *
 * Everything is drawn with filled rectangles and SDL's built-in debug font.
 */

#include "demo.h"
#include <stdio.h>
#include <string.h>

#define GLYPH_SIZE 8.0f

static const Pounce_Color s_sky[2] = { { 100, 180, 255 }, { 52, 56, 104 } };
static const Pounce_Color s_ground[2] = { { 139, 69, 19 }, { 70, 48, 40 } };

/* Colour-cycling power-ups walk this ring */
static const Pounce_Color s_palette[POUNCE_OBSTACLE_PALETTE_SIZE] = {
    { 255, 80, 80 }, { 255, 180, 40 }, { 250, 240, 70 },
    { 80, 220, 110 }, { 80, 170, 255 }, { 190, 110, 255 },
};

static void set_color(SDL_Renderer *r, Pounce_Color c, uint8_t a) {
    SDL_SetRenderDrawColor(r, c.r, c.g, c.b, a);
}

static void fill(SDL_Renderer *r, float x, float y, float w, float h) {
    SDL_FRect rect = { x, y, w, h };
    SDL_RenderFillRect(r, &rect);
}

static void text(SDL_Renderer *r, float x, float y, const char *s) {
    SDL_RenderDebugText(r, x, y, s);
}

static void text_centered(SDL_Renderer *r, float cx, float y, const char *s) {
    text(r, cx - (float)strlen(s) * GLYPH_SIZE * 0.5f, y, s);
}

Pounce_Color demo_obstacle_color(Pounce_ObstacleType type, uint32_t variant, int palette_index) {
    /* Small per-variant shade so identical types are distinguishable */
    int shade = (int)(variant % 31) - 15;
    Pounce_Color base;

    switch (type) {
        case POUNCE_OBSTACLE_STONE:   base = { 128, 128, 128 }; break;
        case POUNCE_OBSTACLE_CACTUS:  base = { 40, 140, 60 };   break;
        case POUNCE_OBSTACLE_BUSH:    base = { 30, 110, 40 };   break;
        case POUNCE_OBSTACLE_BALLOON: base = { 220, 60, 90 };   break;
        case POUNCE_OBSTACLE_BIRD:    base = { 60, 50, 40 };    break;
        case POUNCE_OBSTACLE_GEM:
        case POUNCE_OBSTACLE_STAR:
            return s_palette[palette_index % POUNCE_OBSTACLE_PALETTE_SIZE];
        default:                      base = { 255, 0, 255 };   break;
    }

    base.r = (uint8_t)pounce_clampi(base.r + shade, 0, 255);
    base.g = (uint8_t)pounce_clampi(base.g + shade, 0, 255);
    base.b = (uint8_t)pounce_clampi(base.b + shade, 0, 255);
    return base;
}

static Pounce_Color runner_color(const Pounce_Runner *runner) {
    switch (runner->state) {
        case POUNCE_RUNNER_DEAD:  return Pounce_Color{ 200, 30, 30 };
        case POUNCE_RUNNER_SLIDE: return Pounce_Color{ 230, 140, 40 };
        case POUNCE_RUNNER_JUMP:
        case POUNCE_RUNNER_FALL:  return Pounce_Color{ 250, 170, 70 };
        default:                  return Pounce_Color{ 240, 150, 50 };
    }
}

void demo_draw_world(DemoContext *demo) {
    SDL_Renderer *r = demo->renderer;
    const Pounce_Config *cfg = &demo->config;
    int theme = demo->background & 1;

    set_color(r, s_sky[theme], 255);
    SDL_RenderClear(r);

    set_color(r, s_ground[theme], 255);
    fill(r, 0.0f, cfg->ground_y, cfg->screen_width, cfg->screen_height - cfg->ground_y);
    SDL_SetRenderDrawColor(r, 70, 160, 60, 255);
    fill(r, 0.0f, cfg->ground_y, cfg->screen_width, 6.0f);

    size_t count = 0;
    const Pounce_Obstacle *obstacles = pounce_world_get_obstacles(demo->world, &count);
    for (size_t i = 0; i < count; i++) {
        const Pounce_Obstacle *obs = &obstacles[i];
        set_color(r, demo_obstacle_color(obs->type, obs->variant, obs->palette_index), 255);
        fill(r, obs->x, obs->y, obs->width, obs->height);
    }

    const Pounce_Projectile *shots = pounce_world_get_projectiles(demo->world, &count);
    SDL_SetRenderDrawColor(r, 255, 230, 60, 255);
    for (size_t i = 0; i < count; i++) {
        fill(r, shots[i].x, shots[i].y, shots[i].width, shots[i].height);
    }

    const Pounce_Runner *runner = pounce_world_get_runner(demo->world);
    Pounce_Rect body = pounce_runner_hitbox(runner);
    set_color(r, runner_color(runner), 255);
    fill(r, body.x, body.y, body.w, body.h);

    SDL_SetRenderDrawBlendMode(r, SDL_BLENDMODE_BLEND);
    const Pounce_ParticlePool *particles = pounce_world_get_particles(demo->world);
    for (uint32_t i = 0; i < pounce_particle_pool_count(particles); i++) {
        const Pounce_Particle *p = pounce_particle_pool_get(particles, i);
        set_color(r, p->color, pounce_particle_alpha(p));
        fill(r, p->x - p->size, p->y - p->size, p->size * 2.0f, p->size * 2.0f);
    }
    SDL_SetRenderDrawBlendMode(r, SDL_BLENDMODE_NONE);
}

void demo_draw_hud(DemoContext *demo) {
    SDL_Renderer *r = demo->renderer;
    Pounce_WorldStats stats;
    pounce_world_get_stats(demo->world, &stats);

    char line[64];

    SDL_SetRenderDrawColor(r, 0, 0, 0, 255);
    snprintf(line, sizeof(line), "Score: %d", (int)stats.score);
    text(r, 10.0f, 10.0f, line);

    snprintf(line, sizeof(line), "Speed: %.1f", (double)stats.speed);
    text(r, 10.0f, 24.0f, line);

    snprintf(line, sizeof(line), "Jumps: %d  Shots: %d%s",
             stats.double_jump_charges, stats.shot_charges, demo->muted ? "  [muted]" : "");
    text(r, 10.0f, 38.0f, line);

    SDL_SetRenderDrawColor(r, 100, 50, 150, 255);
    snprintf(line, sizeof(line), "High Score: %d", (int)stats.high_score);
    text(r, demo->config.screen_width - 10.0f - (float)strlen(line) * GLYPH_SIZE, 10.0f, line);

    for (int i = 0; i < demo->popup_count; i++) {
        const DemoPopup *p = &demo->popups[i];
        set_color(r, p->color, 255);
        text_centered(r, p->x, p->y, p->text);
    }
}

void demo_draw_banner(DemoContext *demo, const char *title, const char *subtitle) {
    SDL_Renderer *r = demo->renderer;
    float cx = demo->config.screen_width * 0.5f;
    float cy = demo->config.screen_height * 0.4f;

    SDL_SetRenderDrawBlendMode(r, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(r, 0, 0, 0, 140);
    fill(r, 0.0f, cy - 30.0f, demo->config.screen_width, 70.0f);
    SDL_SetRenderDrawBlendMode(r, SDL_BLENDMODE_NONE);

    SDL_SetRenderDrawColor(r, 255, 255, 255, 255);
    SDL_SetRenderScale(r, 2.0f, 2.0f);
    text_centered(r, cx * 0.5f, (cy - 16.0f) * 0.5f, title);
    SDL_SetRenderScale(r, 1.0f, 1.0f);

    if (subtitle) {
        text_centered(r, cx, cy + 16.0f, subtitle);
    }
}
