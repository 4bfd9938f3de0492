/**
 * @file animation.cpp
 * @brief Pose transitions and animation scripts over the Maestro link
 */

#include "animation.h"
#include "safe_route.h"
#include "servo_timing.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

// ============================================================================
// Helpers
// ============================================================================

static void anim_sleep(animator_t *anim, uint32_t ms) {
    if (ms > 0) {
        anim->clock.sleep_ms(anim->clock.ctx, ms);
    }
}

static animation_result_t link_failed(animator_t *anim, maestro_status_t status, const char *what) {
    anim->last_link_status = status;
    printf("[ANIM] %s failed: %s\n", what, maestro_status_str(status));
    return ANIMATION_LINK_ERROR;
}

static animation_result_t send_targets(animator_t *anim, const pose_t *to) {
    uint16_t targets[POSE_CHANNEL_COUNT];
    pose_to_channels(to, targets);

    maestro_status_t status = maestro_set_multiple_targets(anim->link, 0, targets, POSE_CHANNEL_COUNT);
    if (status != MAESTRO_OK) {
        return link_failed(anim, status, "Set targets");
    }
    return ANIMATION_OK;
}

/**
 * @brief Program per-channel caps for one transition leg, then start it
 *
 * Each channel's caps come from its own distance and its leg's share of
 * the requested duration, so all servos of a leg finish together.
 */
static animation_result_t issue_move(animator_t *anim, const pose_t *from, const pose_t *to,
                                     const uint16_t durations_ms[POSE_LEG_COUNT]) {
    for (uint8_t ch = 0; ch < POSE_CHANNEL_COUNT; ch++) {
        float half_duration = durations_ms[ch / POSE_SERVOS_PER_LEG] / 2.0f;
        float distance = (float)pose_channel_value(to, ch) - (float)pose_channel_value(from, ch);

        servo_timing_t timing = servo_timing_from_duration(half_duration, distance, 0.0f);

        maestro_status_t status = maestro_set_speed(anim->link, ch, timing.speed);
        if (status != MAESTRO_OK) {
            return link_failed(anim, status, "Set speed");
        }
        status = maestro_set_accel(anim->link, ch, timing.accel);
        if (status != MAESTRO_OK) {
            return link_failed(anim, status, "Set accel");
        }
    }

    return send_targets(anim, to);
}

// Channel with the largest displacement finishes last
static uint8_t slowest_channel(const pose_t *from, const pose_t *to) {
    uint8_t best = 0;
    int best_delta = -1;

    for (uint8_t ch = 0; ch < POSE_CHANNEL_COUNT; ch++) {
        int delta = abs((int)pose_channel_value(to, ch) - (int)pose_channel_value(from, ch));
        if (delta > best_delta) {
            best_delta = delta;
            best = ch;
        }
    }
    return best;
}

/**
 * @brief Block until the move from -> to has settled
 *
 * Polls the slowest channel until it is within tolerance of its target.
 * A position that cannot be read counts as settled. The wait is bounded
 * by settle_timeout_ms, after which settle_fallback decides the outcome.
 */
static animation_result_t wait_for_settle(animator_t *anim, const pose_t *from, const pose_t *to) {
    const animation_config_t *cfg = &anim->config;
    uint8_t channel = slowest_channel(from, to);
    uint16_t target = pose_channel_value(to, channel);
    uint16_t position = 0;

    anim_sleep(anim, cfg->move_start_delay_ms);
    uint32_t start = anim->clock.now_ms(anim->clock.ctx);

    while (true) {
        maestro_status_t status = maestro_get_position(anim->link, channel, &position);
        if (status == MAESTRO_ERR_TIMEOUT) {
            printf("[ANIM] CH%u position unknown, assuming settled\n", channel);
            return ANIMATION_OK;
        }
        if (status != MAESTRO_OK) {
            return link_failed(anim, status, "Get position");
        }

        if (abs((int)position - (int)target) <= cfg->settle_tolerance_us) {
            return ANIMATION_OK;
        }

        uint32_t elapsed = anim->clock.now_ms(anim->clock.ctx) - start;
        if (elapsed >= cfg->settle_timeout_ms) {
            break;
        }
        anim_sleep(anim, cfg->settle_poll_ms);
    }

    if (cfg->settle_fallback == SETTLE_TIMEOUT_ABORT) {
        printf("[ANIM] Settle timeout on CH%u (at %u us, want %u us), aborting\n",
               channel, position, target);
        return ANIMATION_SETTLE_TIMEOUT;
    }

    printf("[ANIM] Settle timeout on CH%u (at %u us, want %u us), proceeding\n",
           channel, position, target);
    return ANIMATION_OK;
}

// Caller owns the ANIMATING state
static animation_result_t run_transition(animator_t *anim, const pose_t *target,
                                         const uint16_t durations_ms[POSE_LEG_COUNT]) {
    const pose_t *from = anim->current;
    const char *waypoint_name = safe_route_between(from, target);
    const pose_t *waypoint = pose_table_find(waypoint_name);

    if (!waypoint) {
        printf("[ROUTE] Waypoint '%s' is not a pose\n", waypoint_name);
        return ANIMATION_UNKNOWN_POSE;
    }

    printf("[ROUTE] %s -> %s -> %s\n", from->name, waypoint->name, target->name);

    animation_result_t result = issue_move(anim, from, waypoint, durations_ms);
    if (result != ANIMATION_OK) return result;

    if (anim->config.settle_between_legs) {
        result = wait_for_settle(anim, from, waypoint);
        if (result != ANIMATION_OK) return result;
    }

    result = issue_move(anim, waypoint, target, durations_ms);
    if (result != ANIMATION_OK) return result;

    if (anim->config.settle_after_move) {
        result = wait_for_settle(anim, waypoint, target);
        if (result != ANIMATION_OK) return result;
    }

    anim->current = target;
    return ANIMATION_OK;
}

static animation_result_t run_script(animator_t *anim, const animation_script_t *script) {
    for (size_t i = 0; i < script->step_count; i++) {
        const script_step_t *step = &script->steps[i];

        if (step->kind == SCRIPT_STEP_PAUSE) {
            anim_sleep(anim, step->pause_ms + ANIMATION_PAUSE_PADDING_MS);
            continue;
        }

        const pose_t *pose = pose_table_find(step->pose);
        if (!pose) {
            printf("[ANIM] Script '%s' step %u: unknown pose '%s'\n",
                   script->name, (unsigned)i, step->pose ? step->pose : "(null)");
            return ANIMATION_UNKNOWN_POSE;
        }

        animation_result_t result = run_transition(anim, pose, step->durations_ms);
        if (result != ANIMATION_OK) {
            printf("[ANIM] Script '%s' stopped at step %u (%s), pose is '%s'\n",
                   script->name, (unsigned)i, animation_result_str(result), anim->current->name);
            return result;
        }
    }
    return ANIMATION_OK;
}

// ============================================================================
// Setup
// ============================================================================

void animation_default_config(animation_config_t *config) {
    config->settle_between_legs = true;
    config->settle_after_move = true;
    config->settle_tolerance_us = 20;
    config->settle_poll_ms = 10;
    config->move_start_delay_ms = 100;
    config->settle_timeout_ms = 4000;
    config->settle_fallback = SETTLE_TIMEOUT_PROCEED;
    config->boot_speed = 10;
    config->boot_accel = 10;
}

void animation_init(animator_t *anim, maestro_t *link, const animation_clock_t *clock,
                    const animation_config_t *config) {
    memset(anim, 0, sizeof(*anim));
    anim->link = link;
    anim->clock = *clock;

    if (config) {
        anim->config = *config;
    } else {
        animation_default_config(&anim->config);
    }

    anim->state = ANIMATION_IDLE;
    anim->current = pose_table_find(POSE_DEFAULT_REST);
    anim->last_link_status = MAESTRO_OK;
    anim->proximity_read = NULL;
    anim->proximity_ctx = NULL;
    anim->proximity_band = -1;
}

// ============================================================================
// Motion
// ============================================================================

animation_result_t animation_enter_pose(animator_t *anim, const char *pose_name) {
    if (anim->state == ANIMATION_ANIMATING) {
        return ANIMATION_BUSY;
    }

    const pose_t *pose = pose_table_find(pose_name);
    if (!pose) {
        printf("[ANIM] Unknown pose '%s'\n", pose_name ? pose_name : "(null)");
        return ANIMATION_UNKNOWN_POSE;
    }

    anim->state = ANIMATION_ANIMATING;
    printf("[ANIM] Entering '%s' (speed %u, accel %u)\n",
           pose->name, anim->config.boot_speed, anim->config.boot_accel);

    animation_result_t result = ANIMATION_OK;
    for (uint8_t ch = 0; ch < POSE_CHANNEL_COUNT && result == ANIMATION_OK; ch++) {
        maestro_status_t status = maestro_set_speed(anim->link, ch, anim->config.boot_speed);
        if (status == MAESTRO_OK) {
            status = maestro_set_accel(anim->link, ch, anim->config.boot_accel);
        }
        if (status != MAESTRO_OK) {
            result = link_failed(anim, status, "Boot caps");
        }
    }

    if (result == ANIMATION_OK) {
        result = send_targets(anim, pose);
    }
    if (result == ANIMATION_OK) {
        anim->current = pose;
    }

    anim->state = ANIMATION_IDLE;
    return result;
}

animation_result_t animation_animate_to(animator_t *anim, const char *pose_name,
                                        const uint16_t durations_ms[POSE_LEG_COUNT]) {
    if (anim->state == ANIMATION_ANIMATING) {
        return ANIMATION_BUSY;
    }

    const pose_t *pose = pose_table_find(pose_name);
    if (!pose) {
        printf("[ANIM] Unknown pose '%s'\n", pose_name ? pose_name : "(null)");
        return ANIMATION_UNKNOWN_POSE;
    }

    anim->state = ANIMATION_ANIMATING;
    animation_result_t result = run_transition(anim, pose, durations_ms);
    anim->state = ANIMATION_IDLE;

    if (result != ANIMATION_OK) {
        printf("[ANIM] Transition to '%s' failed (%s), pose is '%s'\n",
               pose->name, animation_result_str(result), anim->current->name);
    }
    return result;
}

animation_result_t animation_play_script(animator_t *anim, const char *script_name) {
    if (anim->state == ANIMATION_ANIMATING) {
        return ANIMATION_BUSY;
    }

    const animation_script_t *script = script_table_find(script_name);
    if (!script) {
        printf("[ANIM] Unknown script '%s'\n", script_name ? script_name : "(null)");
        return ANIMATION_UNKNOWN_SCRIPT;
    }

    anim->state = ANIMATION_ANIMATING;
    printf("[ANIM] Playing '%s' (%u steps)\n", script->name, (unsigned)script->step_count);

    animation_result_t result = run_script(anim, script);

    anim->state = ANIMATION_IDLE;
    return result;
}

// ============================================================================
// Proximity
// ============================================================================

void animation_set_proximity_source(animator_t *anim, proximity_read_fn read, void *ctx) {
    anim->proximity_read = read;
    anim->proximity_ctx = ctx;
    anim->proximity_band = -1;
}

animation_result_t animation_poll_proximity(animator_t *anim) {
    if (!anim->proximity_read) {
        return ANIMATION_OK;
    }
    if (anim->state == ANIMATION_ANIMATING) {
        return ANIMATION_BUSY;
    }

    float distance_cm = anim->proximity_read(anim->proximity_ctx);
    if (!(distance_cm > 0.0f)) {
        return ANIMATION_OK;
    }

    int band = proximity_reaction_band(distance_cm);
    if (band == anim->proximity_band) {
        return ANIMATION_OK;
    }

    anim->proximity_band = band;
    if (band < 0) {
        return ANIMATION_OK;
    }

    const proximity_reaction_t *reaction = proximity_reaction_get((size_t)band);
    printf("[ANIM] Proximity %.1f cm -> '%s'\n", distance_cm, reaction->script);
    return animation_play_script(anim, reaction->script);
}

// ============================================================================
// Status
// ============================================================================

bool animation_is_animating(const animator_t *anim) {
    return anim->state == ANIMATION_ANIMATING;
}

const char* animation_current_pose(const animator_t *anim) {
    return anim->current ? anim->current->name : NULL;
}

maestro_status_t animation_last_link_status(const animator_t *anim) {
    return anim->last_link_status;
}

const char* animation_result_str(animation_result_t result) {
    switch (result) {
        case ANIMATION_OK:             return "OK";
        case ANIMATION_BUSY:           return "BUSY";
        case ANIMATION_UNKNOWN_POSE:   return "UNKNOWN_POSE";
        case ANIMATION_UNKNOWN_SCRIPT: return "UNKNOWN_SCRIPT";
        case ANIMATION_SETTLE_TIMEOUT: return "SETTLE_TIMEOUT";
        case ANIMATION_LINK_ERROR:     return "LINK_ERROR";
    }
    return "?";
}
