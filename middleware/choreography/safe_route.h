/**
 * @file safe_route.h
 * @brief Waypoint selection between two poses
 *
 * Two poses that share a safe-route tag can both be reached from the
 * pose that tag names without legs colliding. A transition goes
 * current -> waypoint -> target, with the waypoint taken from the
 * intersection of the two tag sets.
 */

#ifndef SAFE_ROUTE_H
#define SAFE_ROUTE_H

#include <stddef.h>
#include "pose_table.h"

/**
 * @brief Pick a waypoint from two tag sets
 *
 * Returns the smallest (strcmp order) tag present in both sets, so the
 * result does not depend on tag order. With no common tag, returns
 * fallback.
 *
 * @param current_tags  Tags of the pose the legs are in
 * @param current_count Number of entries in current_tags
 * @param target_tags   Tags of the pose to reach
 * @param target_count  Number of entries in target_tags
 * @param fallback      Returned when the sets are disjoint
 */
const char* safe_route_plan(const char *const *current_tags, size_t current_count,
                            const char *const *target_tags, size_t target_count,
                            const char *fallback);

/**
 * @brief Waypoint between two table poses, POSE_DEFAULT_REST if disjoint
 */
const char* safe_route_between(const pose_t *from, const pose_t *to);

#endif // SAFE_ROUTE_H
