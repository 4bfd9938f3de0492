/**
 * @file animation.h
 * @brief Pose transitions and animation scripts over the Maestro link
 *
 * The animator is a two-state machine (IDLE / ANIMATING). A transition
 * to a pose always runs in two legs:
 *
 *   current --(half duration)--> waypoint --(half duration)--> target
 *
 * where the waypoint comes from safe_route_between(). Each leg programs
 * speed and acceleration for all 24 channels, then sends one
 * Set Multiple Targets so every servo starts together and arrives at
 * the same time.
 *
 * A call made while ANIMATING is rejected with ANIMATION_BUSY and
 * changes nothing. There is no queue; callers serialize requests
 * themselves (the firmware does this with a FreeRTOS queue).
 *
 * The animator never sleeps or reads time directly. Both go through an
 * animation_clock_t so the same code runs under FreeRTOS and in tests.
 */

#ifndef ANIMATION_H
#define ANIMATION_H

#include <stdint.h>
#include <stdbool.h>
#include "maestro.h"
#include "pose_table.h"

// Pause steps sleep this much longer than their nominal time
#define ANIMATION_PAUSE_PADDING_MS  100

// ============================================================================
// Data Types
// ============================================================================

typedef enum {
    ANIMATION_IDLE = 0,
    ANIMATION_ANIMATING
} animation_state_t;

typedef enum {
    ANIMATION_OK = 0,
    ANIMATION_BUSY,             // already animating, request ignored
    ANIMATION_UNKNOWN_POSE,
    ANIMATION_UNKNOWN_SCRIPT,
    ANIMATION_SETTLE_TIMEOUT,   // settle wait expired with SETTLE_TIMEOUT_ABORT
    ANIMATION_LINK_ERROR        // see animation_last_link_status()
} animation_result_t;

typedef enum {
    SETTLE_TIMEOUT_PROCEED = 0, // log and carry on as if settled
    SETTLE_TIMEOUT_ABORT        // log and stop the transition
} settle_fallback_t;

typedef struct {
    void *ctx;
    void (*sleep_ms)(void *ctx, uint32_t ms);
    uint32_t (*now_ms)(void *ctx);
} animation_clock_t;

typedef struct {
    bool settle_between_legs;       ///< Wait for the waypoint before the second leg
    bool settle_after_move;         ///< Wait for the target before returning
    uint16_t settle_tolerance_us;   ///< Settled when within this of the target
    uint32_t settle_poll_ms;        ///< Delay between position reads
    uint32_t move_start_delay_ms;   ///< Delay after a move before the first read
    uint32_t settle_timeout_ms;     ///< Give up waiting after this long
    settle_fallback_t settle_fallback;
    uint16_t boot_speed;            ///< Caps used by animation_enter_pose()
    uint16_t boot_accel;
} animation_config_t;

typedef float (*proximity_read_fn)(void *ctx);

typedef struct {
    maestro_t *link;
    animation_clock_t clock;
    animation_config_t config;

    animation_state_t state;
    const pose_t *current;              ///< Last pose fully reached
    maestro_status_t last_link_status;  ///< Status behind the last ANIMATION_LINK_ERROR

    proximity_read_fn proximity_read;
    void *proximity_ctx;
    int proximity_band;                 ///< Band last reacted to, -1 when armed
} animator_t;

// ============================================================================
// Setup
// ============================================================================

void animation_default_config(animation_config_t *config);

/**
 * @brief Bind the animator to a link and a clock
 *
 * The current pose starts as POSE_DEFAULT_REST. Nothing is sent; call
 * animation_enter_pose() to put the hardware there.
 *
 * @param config Settle policy, or NULL for animation_default_config()
 */
void animation_init(animator_t *anim, maestro_t *link, const animation_clock_t *clock,
                    const animation_config_t *config);

// ============================================================================
// Motion
// ============================================================================

/**
 * @brief Move straight to a pose at the gentle boot caps
 *
 * No waypoint and no settle wait. Used once at start-up, when the real
 * servo positions are unknown.
 */
animation_result_t animation_enter_pose(animator_t *anim, const char *pose_name);

/**
 * @brief Two-leg transition from the current pose to pose_name
 *
 * @param durations_ms Requested time per leg of the robot (6 entries).
 *                     Each transition leg gets half of it.
 */
animation_result_t animation_animate_to(animator_t *anim, const char *pose_name,
                                        const uint16_t durations_ms[POSE_LEG_COUNT]);

/**
 * @brief Run every step of a script in order
 *
 * Stops at the first failing step. The current pose is then the last
 * one fully reached.
 */
animation_result_t animation_play_script(animator_t *anim, const char *script_name);

// ============================================================================
// Proximity
// ============================================================================

/**
 * @brief Register the distance source polled by animation_poll_proximity()
 *
 * read returns a distance in cm; 0 or below means no echo. Pass NULL to
 * unregister.
 */
void animation_set_proximity_source(animator_t *anim, proximity_read_fn read, void *ctx);

/**
 * @brief Read the distance source and play the matching reaction script
 *
 * A band's script plays once on entering the band. Readings outside every
 * band re-arm the reactions; no-echo readings are ignored.
 *
 * @return ANIMATION_OK if nothing had to play, otherwise the script result
 */
animation_result_t animation_poll_proximity(animator_t *anim);

// ============================================================================
// Status
// ============================================================================

bool animation_is_animating(const animator_t *anim);
const char* animation_current_pose(const animator_t *anim);
maestro_status_t animation_last_link_status(const animator_t *anim);
const char* animation_result_str(animation_result_t result);

#endif // ANIMATION_H
