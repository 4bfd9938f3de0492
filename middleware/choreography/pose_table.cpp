/**
 * @file pose_table.cpp
 * @brief Pose, script and proximity tables for the spider
 *
 * Leg order: 0 front-left, 1 mid-left, 2 rear-left,
 *            3 rear-right, 4 mid-right, 5 front-right.
 * Servo order within a leg: hip, shoulder, knee, foot. The mid legs only
 * use their first two servos; slots 2-3 are held at center (1500).
 */

#include "pose_table.h"
#include "maestro.h"
#include <stdio.h>
#include <string.h>

#define COUNT_OF(a) (sizeof(a) / sizeof((a)[0]))

#define POSE_STEP(name, ms)  { SCRIPT_STEP_POSE, name, { ms, ms, ms, ms, ms, ms }, 0 }
#define PAUSE_STEP(ms)       { SCRIPT_STEP_PAUSE, NULL, { 0, 0, 0, 0, 0, 0 }, ms }

// ============================================================================
// Poses
// ============================================================================

static const pose_t k_poses[] = {
    { "park",
      { {1070, 2070, 1560, 2150}, {1030, 1980, 1500, 1500}, {1580, 1780,  880,  736},
        {1450, 1100, 1330,  780}, {1770,  890, 1500, 1500}, {1340, 1970, 1870, 1990} },
      { "park", "extend_half" } },

    { "extend",
      { {1070, 2070,  980, 1380}, {1710, 1500, 1500, 1500}, {1580, 1780, 1420, 1410},
        {1460,  980, 1890, 1360}, {1130, 1410, 1500, 1500}, {1360, 1890, 1210, 1210} },
      { "extend_half" } },

    { "extend_half",
      { {1370, 1760, 1330, 1790}, {1210, 1760, 1500, 1500}, {1580, 1810, 1020, 1210},
        {1450, 1080, 1560, 1200}, {1610, 1100, 1500, 1500}, {1340, 1970, 1700, 1610} },
      { "extend_half", "park" } },

    { "jugendstil",
      { {1510, 1990, 1270, 1590}, {1250, 1480, 1500, 1500}, {1640, 1900, 1020, 1590},
        {1250,  900, 1530, 1270}, {1560, 1460, 1500, 1500}, {1350, 1920, 1630, 1090} },
      { "jugendstil_half" } },

    { "jugendstil_half",
      { {1370, 1750, 1560, 2230}, {1250, 1480, 1500, 1500}, {1640, 1900, 1020, 1590},
        {1450, 1100, 1330,  780}, {1560, 1460, 1500, 1500}, {1350, 1920, 1630, 1090} },
      { "jugendstil_half", "park" } },

    { "challenge",
      { {1500, 1860, 1410, 1910}, {1130, 1610, 1500, 1500}, {1640, 1900, 1020, 1600},
        {1340,  970, 1450, 1020}, {1610, 1300, 1500, 1500}, {1350, 1910, 1650, 1100} },
      { "park" } },

    { "point",
      { {1240, 1590, 1020,  770}, {1190, 1180, 1500, 1500}, {1640, 1900,  910, 1700},
        {1530, 1190, 1810, 2040}, {1580, 1730, 1500, 1500}, {1350, 1860, 1710, 1020} },
      { "park" } },

    { "knife",
      { {1370, 1750, 1560, 2230}, {1650, 1400, 1500, 1500}, {1580, 1780,  880,  736},
        {1450, 1100, 1330,  780}, {1150, 1500, 1500, 1500}, {1340, 1970, 1870, 1990} },
      { "park" } },

    { "push_away",
      { {1210, 1970, 1240, 1580}, {1030, 1980, 1500, 1500}, {1580, 1780,  880,  736},
        {1640,  910, 1670, 1360}, {1820,  880, 1500, 1500}, {1340, 1970, 1870, 1990} },
      { "park" } },

    { "wiggle_up",
      { {1370, 1750, 1400, 1520}, {1270, 1430, 1500, 1500}, {1580, 1780, 1070, 1640},
        {1450, 1050, 1500, 1470}, {1500, 1510, 1500, 1500}, {1340, 1970, 1590, 1100} },
      { "wiggle_up", "park" } },

    { "wiggle_down",
      { {1370, 1750, 1400, 1610}, {1270, 1340, 1500, 1500}, {1580, 1780, 1070, 1560},
        {1450, 1050, 1500, 1390}, {1500, 1600, 1500, 1500}, {1340, 1970, 1590, 1190} },
      { "wiggle_up" } },
};

// ============================================================================
// Scripts
// ============================================================================

static const script_step_t k_script_park[] = {
    POSE_STEP("park", 1500),
};

static const script_step_t k_script_extend[] = {
    POSE_STEP("extend", 1500),
};

static const script_step_t k_script_breathe[] = {
    POSE_STEP("extend", 1500),
    POSE_STEP("park", 1500),
    POSE_STEP("extend_half", 1500),
    POSE_STEP("park", 1500),
};

static const script_step_t k_script_knife[] = {
    POSE_STEP("knife", 600),
    PAUSE_STEP(500),
    POSE_STEP("park", 1000),
};

static const script_step_t k_script_attack[] = {
    POSE_STEP("extend", 750),
    POSE_STEP("park", 1500),
};

// Hard on the front legs, use sparingly
static const script_step_t k_script_point[] = {
    POSE_STEP("point", 1500),
    POSE_STEP("park", 1500),
};

static const script_step_t k_script_jugendstil[] = {
    POSE_STEP("jugendstil_half", 1500),
    PAUSE_STEP(750),
    POSE_STEP("jugendstil", 1500),
    PAUSE_STEP(900),
    POSE_STEP("park", 1500),
};

static const script_step_t k_script_challenge[] = {
    POSE_STEP("challenge", 1500),
    PAUSE_STEP(1000),
    POSE_STEP("park", 1500),
};

static const script_step_t k_script_wiggle[] = {
    POSE_STEP("wiggle_up", 750),
    POSE_STEP("wiggle_down", 100),
    POSE_STEP("wiggle_up", 100),
    POSE_STEP("wiggle_down", 100),
    POSE_STEP("wiggle_up", 100),
    POSE_STEP("park", 750),
};

static const script_step_t k_script_push_away[] = {
    POSE_STEP("push_away", 600),
    PAUSE_STEP(300),
    POSE_STEP("park", 1000),
};

static const animation_script_t k_scripts[] = {
    { "park",       k_script_park,       COUNT_OF(k_script_park) },
    { "extend",     k_script_extend,     COUNT_OF(k_script_extend) },
    { "breathe",    k_script_breathe,    COUNT_OF(k_script_breathe) },
    { "knife",      k_script_knife,      COUNT_OF(k_script_knife) },
    { "attack",     k_script_attack,     COUNT_OF(k_script_attack) },
    { "point",      k_script_point,      COUNT_OF(k_script_point) },
    { "jugendstil", k_script_jugendstil, COUNT_OF(k_script_jugendstil) },
    { "challenge",  k_script_challenge,  COUNT_OF(k_script_challenge) },
    { "wiggle",     k_script_wiggle,     COUNT_OF(k_script_wiggle) },
    { "push_away",  k_script_push_away,  COUNT_OF(k_script_push_away) },
};

// ============================================================================
// Proximity reactions (checked in order, first match wins)
// ============================================================================

static const proximity_reaction_t k_reactions[] = {
    { 20.0f, "push_away" },
    { 60.0f, "challenge" },
};

// ============================================================================
// Lookups
// ============================================================================

size_t pose_table_count(void) {
    return COUNT_OF(k_poses);
}

const pose_t* pose_table_get(size_t index) {
    if (index >= COUNT_OF(k_poses)) return NULL;
    return &k_poses[index];
}

const pose_t* pose_table_find(const char *name) {
    if (!name) return NULL;
    for (size_t i = 0; i < COUNT_OF(k_poses); i++) {
        if (strcmp(k_poses[i].name, name) == 0) {
            return &k_poses[i];
        }
    }
    return NULL;
}

uint16_t pose_channel_value(const pose_t *pose, uint8_t channel) {
    return pose->legs[channel / POSE_SERVOS_PER_LEG][channel % POSE_SERVOS_PER_LEG];
}

void pose_to_channels(const pose_t *pose, uint16_t out[POSE_CHANNEL_COUNT]) {
    for (uint8_t ch = 0; ch < POSE_CHANNEL_COUNT; ch++) {
        out[ch] = pose_channel_value(pose, ch);
    }
}

size_t pose_route_count(const pose_t *pose) {
    size_t n = 0;
    while (n < POSE_MAX_ROUTES && pose->safe_routes[n]) {
        n++;
    }
    return n;
}

size_t script_table_count(void) {
    return COUNT_OF(k_scripts);
}

const animation_script_t* script_table_get(size_t index) {
    if (index >= COUNT_OF(k_scripts)) return NULL;
    return &k_scripts[index];
}

const animation_script_t* script_table_find(const char *name) {
    if (!name) return NULL;
    for (size_t i = 0; i < COUNT_OF(k_scripts); i++) {
        if (strcmp(k_scripts[i].name, name) == 0) {
            return &k_scripts[i];
        }
    }
    return NULL;
}

size_t proximity_reaction_count(void) {
    return COUNT_OF(k_reactions);
}

int proximity_reaction_band(float distance_cm) {
    if (!(distance_cm > 0.0f)) {
        return -1;  // no echo
    }
    for (size_t i = 0; i < COUNT_OF(k_reactions); i++) {
        if (distance_cm < k_reactions[i].max_distance_cm) {
            return (int)i;
        }
    }
    return -1;
}

const proximity_reaction_t* proximity_reaction_get(size_t index) {
    if (index >= COUNT_OF(k_reactions)) return NULL;
    return &k_reactions[index];
}

// ============================================================================
// Validation
// ============================================================================

bool pose_table_validate(void) {
    int problems = 0;

    if (!pose_table_find(POSE_DEFAULT_REST)) {
        printf("[POSES] Default rest pose '%s' missing\n", POSE_DEFAULT_REST);
        problems++;
    }

    for (size_t i = 0; i < COUNT_OF(k_poses); i++) {
        const pose_t *pose = &k_poses[i];

        for (uint8_t ch = 0; ch < POSE_CHANNEL_COUNT; ch++) {
            uint16_t pulse = pose_channel_value(pose, ch);
            if (!maestro_pulse_valid(pulse)) {
                printf("[POSES] '%s' CH%u = %u us out of range\n", pose->name, ch, pulse);
                problems++;
            }
        }

        for (size_t r = 0; r < pose_route_count(pose); r++) {
            if (!pose_table_find(pose->safe_routes[r])) {
                printf("[POSES] '%s' routes through unknown pose '%s'\n",
                       pose->name, pose->safe_routes[r]);
                problems++;
            }
        }

        if (pose_table_find(pose->name) != pose) {
            printf("[POSES] Duplicate pose name '%s'\n", pose->name);
            problems++;
        }
    }

    for (size_t i = 0; i < COUNT_OF(k_scripts); i++) {
        const animation_script_t *script = &k_scripts[i];
        for (size_t s = 0; s < script->step_count; s++) {
            const script_step_t *step = &script->steps[s];
            if (step->kind == SCRIPT_STEP_POSE && !pose_table_find(step->pose)) {
                printf("[POSES] Script '%s' step %u uses unknown pose '%s'\n",
                       script->name, (unsigned)s, step->pose ? step->pose : "(null)");
                problems++;
            }
        }
    }

    for (size_t i = 0; i < COUNT_OF(k_reactions); i++) {
        if (!script_table_find(k_reactions[i].script)) {
            printf("[POSES] Proximity band %u plays unknown script '%s'\n",
                   (unsigned)i, k_reactions[i].script);
            problems++;
        }
    }

    if (problems) {
        printf("[POSES] %d problem(s) in pose tables\n", problems);
    }
    return problems == 0;
}
