/**
 * @file safe_route.cpp
 * @brief Waypoint selection between two poses
 */

#include "safe_route.h"
#include <string.h>

static bool tag_in(const char *tag, const char *const *tags, size_t count) {
    for (size_t i = 0; i < count; i++) {
        if (tags[i] && strcmp(tags[i], tag) == 0) {
            return true;
        }
    }
    return false;
}

const char* safe_route_plan(const char *const *current_tags, size_t current_count,
                            const char *const *target_tags, size_t target_count,
                            const char *fallback) {
    const char *best = NULL;

    for (size_t i = 0; i < current_count; i++) {
        const char *tag = current_tags[i];
        if (!tag || !tag_in(tag, target_tags, target_count)) {
            continue;
        }
        if (!best || strcmp(tag, best) < 0) {
            best = tag;
        }
    }

    return best ? best : fallback;
}

const char* safe_route_between(const pose_t *from, const pose_t *to) {
    return safe_route_plan(from->safe_routes, pose_route_count(from),
                           to->safe_routes, pose_route_count(to),
                           POSE_DEFAULT_REST);
}
