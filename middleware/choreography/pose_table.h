/**
 * @file pose_table.h
 * @brief Named poses, animation scripts and proximity reactions
 *
 * All tables are compiled-in constants and never change at runtime.
 *
 * Channel layout (24 channels, 4 per leg):
 *   channel = leg * 4 + servo
 *   legs 0..2 sit on the primary Maestro (channels 0..11),
 *   legs 3..5 on the secondary Maestro (channels 12..23).
 *
 * Each pose carries safe-route tags: names of intermediate poses the
 * legs can pass through without hitting each other. Moving between two
 * poses goes through a tag they share (see safe_route.h).
 */

#ifndef POSE_TABLE_H
#define POSE_TABLE_H

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

#define POSE_LEG_COUNT          6
#define POSE_SERVOS_PER_LEG     4
#define POSE_CHANNEL_COUNT      (POSE_LEG_COUNT * POSE_SERVOS_PER_LEG)
#define POSE_MAX_ROUTES         4

#define POSE_DEFAULT_REST       "park"

// ============================================================================
// Data Types
// ============================================================================

typedef struct {
    const char *name;
    uint16_t legs[POSE_LEG_COUNT][POSE_SERVOS_PER_LEG];  ///< Pulse widths (us)
    const char *safe_routes[POSE_MAX_ROUTES];           ///< Unused slots are NULL
} pose_t;

typedef enum {
    SCRIPT_STEP_POSE,
    SCRIPT_STEP_PAUSE
} script_step_kind_t;

typedef struct {
    script_step_kind_t kind;
    const char *pose;                           ///< SCRIPT_STEP_POSE only
    uint16_t durations_ms[POSE_LEG_COUNT];      ///< Per-leg move time, SCRIPT_STEP_POSE only
    uint32_t pause_ms;                          ///< SCRIPT_STEP_PAUSE only
} script_step_t;

typedef struct {
    const char *name;
    const script_step_t *steps;
    size_t step_count;
} animation_script_t;

typedef struct {
    float max_distance_cm;      ///< Band applies below this distance
    const char *script;
} proximity_reaction_t;

// ============================================================================
// Poses
// ============================================================================

size_t pose_table_count(void);
const pose_t* pose_table_get(size_t index);
const pose_t* pose_table_find(const char *name);

uint16_t pose_channel_value(const pose_t *pose, uint8_t channel);
void pose_to_channels(const pose_t *pose, uint16_t out[POSE_CHANNEL_COUNT]);
size_t pose_route_count(const pose_t *pose);

// ============================================================================
// Scripts
// ============================================================================

size_t script_table_count(void);
const animation_script_t* script_table_get(size_t index);
const animation_script_t* script_table_find(const char *name);

// ============================================================================
// Proximity reactions
// ============================================================================

size_t proximity_reaction_count(void);

/**
 * @brief Index of the first band containing distance_cm
 * @return band index, or -1 when no band applies (including no echo)
 */
int proximity_reaction_band(float distance_cm);
const proximity_reaction_t* proximity_reaction_get(size_t index);

// ============================================================================
// Validation
// ============================================================================

/**
 * @brief Check the tables are self-consistent
 *
 * Every pulse width must be in the Maestro range, every route tag and
 * every script step must name an existing pose, every reaction must name
 * an existing script and the default rest pose must exist. Problems are
 * printed.
 *
 * @return true if no problem was found
 */
bool pose_table_validate(void);

#endif // POSE_TABLE_H
