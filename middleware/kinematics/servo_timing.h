/**
 * @file servo_timing.h
 * @brief Convert a timed servo move into Maestro speed/acceleration caps
 *
 * The Maestro runs a trapezoidal velocity profile: it accelerates at the
 * acceleration cap up to the speed cap, cruises, then decelerates
 * symmetrically into the target. To make a move of distance d finish in
 * time t, the move is split into two mirrored half-phases (t/2, d/2):
 *
 *   accel     = 2 * (d/2 - v0 * t/2) / (t/2)^2
 *   max_speed = v0 + accel * t/2
 *
 * Units:
 *   time      : ms
 *   distance  : pulse width in us
 *   speed cap : 0.25 us / 10 ms
 *   accel cap : 0.25 us / 10 ms / 80 ms
 *
 * A cap of 0 means "unlimited" to the Maestro, so results are never
 * below 1. The math runs in double and applies the unit conversion as
 * x * 10 (* 80) / 0.25 before rounding half up.
 */

#ifndef SERVO_TIMING_H
#define SERVO_TIMING_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define SERVO_TIMING_SPEED_MIN     1
#define SERVO_TIMING_ACCEL_MIN     1
#define SERVO_TIMING_SPEED_MAX     0x3FFF
#define SERVO_TIMING_ACCEL_MAX     255

typedef struct {
    uint16_t speed;
    uint16_t accel;
} servo_timing_t;

/**
 * @brief Speed/acceleration caps that move a servo over distance in duration
 *
 * @param duration_ms      Time the move should take (ms)
 * @param distance_us      Pulse-width change (sign ignored)
 * @param initial_velocity Starting velocity (us/ms), 0 from rest
 * @return Caps in Maestro units, each within [1, protocol max].
 *         A non-positive duration returns the maximum caps.
 */
servo_timing_t servo_timing_from_duration(float duration_ms, float distance_us, float initial_velocity);

#ifdef __cplusplus
}
#endif

#endif // SERVO_TIMING_H
