/**
 * @file servo_timing.cpp
 * @brief Maestro speed/acceleration planning
 */

#include "servo_timing.h"
#include "maestro.h"
#include <math.h>

static_assert(SERVO_TIMING_SPEED_MAX == MAESTRO_SPEED_MAX, "speed cap must match the protocol limit");
static_assert(SERVO_TIMING_ACCEL_MAX == MAESTRO_ACCEL_MAX, "accel cap must match the protocol limit");

static uint16_t clamp_units(double value, uint16_t min_units, uint16_t max_units) {
    if (!(value >= (double)min_units)) return min_units;    // also catches NaN
    if (value >= (double)max_units) return max_units;
    return (uint16_t)value;
}

servo_timing_t servo_timing_from_duration(float duration_ms, float distance_us, float initial_velocity) {
    servo_timing_t timing;

    if (duration_ms <= 0.0f) {
        timing.speed = SERVO_TIMING_SPEED_MAX;
        timing.accel = SERVO_TIMING_ACCEL_MAX;
        return timing;
    }

    double v0 = initial_velocity;
    double half_time = (double)duration_ms / 2.0;
    double half_distance = fabs((double)distance_us) / 2.0;

    double accel = (2.0 * (half_distance - v0 * half_time)) / (half_time * half_time);
    double max_speed = v0 + accel * half_time;

    // us/ms -> (0.25 us)/(10 ms), us/ms^2 -> (0.25 us)/(10 ms)/(80 ms), round half up
    double speed_units = max_speed * 10.0 / 0.25 + 0.5;
    double accel_units = accel * 10.0 * 80.0 / 0.25 + 0.5;

    timing.speed = clamp_units(speed_units, SERVO_TIMING_SPEED_MIN, SERVO_TIMING_SPEED_MAX);
    timing.accel = clamp_units(accel_units, SERVO_TIMING_ACCEL_MIN, SERVO_TIMING_ACCEL_MAX);
    return timing;
}
