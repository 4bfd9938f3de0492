/**
 * @file test_animation.cpp
 * @brief Animator state machine against a simulated Maestro pair
 */

#include <gtest/gtest.h>

#include <cstdlib>
#include <vector>

#include "animation.h"
#include "fake_maestro.h"
#include "pose_table.h"
#include "servo_timing.h"

namespace {

const uint16_t kEven1500[POSE_LEG_COUNT] = {1500, 1500, 1500, 1500, 1500, 1500};

std::array<uint16_t, MAESTRO_CHANNEL_COUNT> channels_of(const char *name) {
    std::array<uint16_t, MAESTRO_CHANNEL_COUNT> out;
    pose_to_channels(pose_table_find(name), out.data());
    return out;
}

uint8_t largest_move(const char *from_name, const char *to_name) {
    const pose_t *from = pose_table_find(from_name);
    const pose_t *to = pose_table_find(to_name);
    uint8_t best = 0;
    int best_delta = -1;
    for (uint8_t ch = 0; ch < POSE_CHANNEL_COUNT; ch++) {
        int delta = std::abs((int)pose_channel_value(to, ch) - (int)pose_channel_value(from, ch));
        if (delta > best_delta) {
            best_delta = delta;
            best = ch;
        }
    }
    return best;
}

struct DistanceSequence {
    std::vector<float> readings;
    size_t next = 0;

    static float read(void *ctx) {
        DistanceSequence *seq = static_cast<DistanceSequence *>(ctx);
        return seq->readings[seq->next++];
    }
};

class AnimationTest : public ::testing::Test {
protected:
    void SetUp() override {
        animation_default_config(&config);
        start();
    }

    // Re-create link and animator, e.g. after changing config
    void start() {
        maestro_transport_t port = fake.transport();
        maestro_init(&link, &port, 1000);
        animation_clock_t clock = fake.clock();
        animation_init(&anim, &link, &clock, &config);
    }

    void no_settle() {
        config.settle_between_legs = false;
        config.settle_after_move = false;
        start();
    }

    FakeMaestro fake;
    maestro_t link;
    animation_config_t config;
    animator_t anim;
};

} // namespace

// ============================================================================
// Setup
// ============================================================================

TEST(AnimationConfig, Defaults) {
    animation_config_t cfg;
    animation_default_config(&cfg);
    EXPECT_TRUE(cfg.settle_between_legs);
    EXPECT_TRUE(cfg.settle_after_move);
    EXPECT_EQ(20, cfg.settle_tolerance_us);
    EXPECT_EQ(4000u, cfg.settle_timeout_ms);
    EXPECT_EQ(SETTLE_TIMEOUT_PROCEED, cfg.settle_fallback);
    EXPECT_EQ(10, cfg.boot_speed);
    EXPECT_EQ(10, cfg.boot_accel);
}

TEST_F(AnimationTest, StartsIdleAtRestWithoutTraffic) {
    EXPECT_FALSE(animation_is_animating(&anim));
    EXPECT_STREQ(POSE_DEFAULT_REST, animation_current_pose(&anim));
    EXPECT_TRUE(fake.frames.empty());
}

TEST_F(AnimationTest, EnterPoseUsesBootCapsAndNoWaypoint) {
    ASSERT_EQ(ANIMATION_OK, animation_enter_pose(&anim, "extend"));

    for (int ch = 0; ch < MAESTRO_CHANNEL_COUNT; ch++) {
        EXPECT_EQ(10, fake.speeds[ch]);
        EXPECT_EQ(10, fake.accels[ch]);
    }
    ASSERT_EQ(1u, fake.target_history.size());
    EXPECT_EQ(channels_of("extend"), fake.target_history[0]);
    EXPECT_TRUE(fake.position_queries.empty());
    EXPECT_STREQ("extend", animation_current_pose(&anim));
    EXPECT_FALSE(animation_is_animating(&anim));
}

// ============================================================================
// Transitions
// ============================================================================

TEST_F(AnimationTest, TransitionGoesThroughWaypoint) {
    ASSERT_EQ(ANIMATION_OK, animation_animate_to(&anim, "extend", kEven1500));

    ASSERT_EQ(2u, fake.target_history.size());
    EXPECT_EQ(channels_of("extend_half"), fake.target_history[0]);
    EXPECT_EQ(channels_of("extend"), fake.target_history[1]);
    EXPECT_STREQ("extend", animation_current_pose(&anim));
    EXPECT_FALSE(animation_is_animating(&anim));
}

TEST_F(AnimationTest, BothLegsRunEvenWhenWaypointIsCurrentPose) {
    ASSERT_EQ(ANIMATION_OK, animation_animate_to(&anim, "challenge", kEven1500));

    ASSERT_EQ(2u, fake.target_history.size());
    EXPECT_EQ(channels_of("park"), fake.target_history[0]);
    EXPECT_EQ(channels_of("challenge"), fake.target_history[1]);
}

TEST_F(AnimationTest, EachLegUsesHalfOfItsDuration) {
    no_settle();
    const uint16_t durations[POSE_LEG_COUNT] = {1000, 2000, 1500, 1500, 1500, 3000};
    ASSERT_EQ(ANIMATION_OK, animation_animate_to(&anim, "extend", durations));

    // Caps left on the wire are those of the second leg, extend_half -> extend
    const pose_t *from = pose_table_find("extend_half");
    const pose_t *to = pose_table_find("extend");
    for (uint8_t ch = 0; ch < POSE_CHANNEL_COUNT; ch++) {
        float distance = (float)pose_channel_value(to, ch) - (float)pose_channel_value(from, ch);
        servo_timing_t expected = servo_timing_from_duration(durations[ch / 4] / 2.0f, distance, 0.0f);
        EXPECT_EQ(expected.speed, fake.speeds[ch]) << "channel " << (int)ch;
        EXPECT_EQ(expected.accel, fake.accels[ch]) << "channel " << (int)ch;
    }
}

TEST_F(AnimationTest, CapsAreProgrammedBeforeTargets) {
    no_settle();
    ASSERT_EQ(ANIMATION_OK, animation_animate_to(&anim, "point", kEven1500));

    // Per leg: 24 speed + 24 accel, then secondary and primary multi-target
    ASSERT_EQ(2u * 50, fake.frames.size());
    for (size_t leg = 0; leg < 2; leg++) {
        size_t base = leg * 50;
        for (size_t i = 0; i < 48; i++) {
            uint8_t op = fake.frames[base + i][2];
            EXPECT_TRUE(op == MAESTRO_CMD_SET_SPEED || op == MAESTRO_CMD_SET_ACCEL);
        }
        EXPECT_EQ(MAESTRO_DEVICE_SECONDARY, fake.frames[base + 48][1]);
        EXPECT_EQ(MAESTRO_CMD_SET_MULTI, fake.frames[base + 48][2]);
        EXPECT_EQ(MAESTRO_DEVICE_PRIMARY, fake.frames[base + 49][1]);
        EXPECT_EQ(MAESTRO_CMD_SET_MULTI, fake.frames[base + 49][2]);
    }
}

TEST_F(AnimationTest, SettlePollsTheLargestMove) {
    ASSERT_EQ(ANIMATION_OK, animation_animate_to(&anim, "extend", kEven1500));

    ASSERT_EQ(2u, fake.position_queries.size());
    EXPECT_EQ(largest_move("park", "extend_half"), fake.position_queries[0]);
    EXPECT_EQ(largest_move("extend_half", "extend"), fake.position_queries[1]);
    EXPECT_EQ((std::vector<uint32_t>{100, 100}), fake.sleeps);
}

TEST_F(AnimationTest, SettleBetweenLegsOnly) {
    config.settle_after_move = false;
    start();
    ASSERT_EQ(ANIMATION_OK, animation_animate_to(&anim, "extend", kEven1500));
    EXPECT_EQ(1u, fake.position_queries.size());
}

TEST_F(AnimationTest, NoSettleMeansNoPolling) {
    no_settle();
    ASSERT_EQ(ANIMATION_OK, animation_animate_to(&anim, "extend", kEven1500));
    EXPECT_TRUE(fake.position_queries.empty());
    EXPECT_TRUE(fake.sleeps.empty());
}

TEST_F(AnimationTest, StuckServoProceedsAfterTimeout) {
    fake.stuck = true;
    fake.positions.fill(MAESTRO_PULSE_MAX_US);

    ASSERT_EQ(ANIMATION_OK, animation_animate_to(&anim, "extend", kEven1500));

    EXPECT_STREQ("extend", animation_current_pose(&anim));
    EXPECT_EQ(2u, fake.target_history.size());
    EXPECT_GE(fake.now_ms, 2 * (config.move_start_delay_ms + config.settle_timeout_ms));
    EXPECT_LT(fake.now_ms, 2 * (config.move_start_delay_ms + config.settle_timeout_ms + config.settle_poll_ms));
}

TEST_F(AnimationTest, StuckServoAbortsWhenConfigured) {
    config.settle_fallback = SETTLE_TIMEOUT_ABORT;
    start();
    fake.stuck = true;
    fake.positions.fill(MAESTRO_PULSE_MAX_US);

    EXPECT_EQ(ANIMATION_SETTLE_TIMEOUT, animation_animate_to(&anim, "extend", kEven1500));

    EXPECT_STREQ("park", animation_current_pose(&anim));
    EXPECT_EQ(1u, fake.target_history.size());
    EXPECT_FALSE(animation_is_animating(&anim));
}

TEST_F(AnimationTest, UnreadablePositionCountsAsSettled) {
    fake.silent = true;

    ASSERT_EQ(ANIMATION_OK, animation_animate_to(&anim, "extend", kEven1500));

    EXPECT_STREQ("extend", animation_current_pose(&anim));
    EXPECT_EQ(2u, maestro_timeout_count(&link));
    EXPECT_EQ(200u, fake.total_slept());
}

TEST_F(AnimationTest, UnknownNamesChangeNothing) {
    EXPECT_EQ(ANIMATION_UNKNOWN_POSE, animation_animate_to(&anim, "nope", kEven1500));
    EXPECT_EQ(ANIMATION_UNKNOWN_POSE, animation_enter_pose(&anim, "nope"));
    EXPECT_EQ(ANIMATION_UNKNOWN_SCRIPT, animation_play_script(&anim, "dance"));

    EXPECT_TRUE(fake.frames.empty());
    EXPECT_STREQ("park", animation_current_pose(&anim));
    EXPECT_FALSE(animation_is_animating(&anim));
}

// ============================================================================
// Reentrancy
// ============================================================================

TEST_F(AnimationTest, RequestsWhileAnimatingAreRejected) {
    std::vector<animation_result_t> nested;
    std::vector<bool> animating;

    fake.on_sleep = [&](uint32_t) {
        animating.push_back(animation_is_animating(&anim));
        nested.push_back(animation_animate_to(&anim, "knife", kEven1500));
        nested.push_back(animation_play_script(&anim, "wiggle"));
        nested.push_back(animation_enter_pose(&anim, "point"));
    };

    ASSERT_EQ(ANIMATION_OK, animation_animate_to(&anim, "extend", kEven1500));

    ASSERT_FALSE(nested.empty());
    for (animation_result_t r : nested) {
        EXPECT_EQ(ANIMATION_BUSY, r);
    }
    for (bool a : animating) {
        EXPECT_TRUE(a);
    }
    EXPECT_EQ(2u, fake.target_history.size());
    EXPECT_STREQ("extend", animation_current_pose(&anim));
    EXPECT_FALSE(animation_is_animating(&anim));
}

// ============================================================================
// Scripts
// ============================================================================

TEST_F(AnimationTest, PauseStepsSleepWithPadding) {
    no_settle();
    ASSERT_EQ(ANIMATION_OK, animation_play_script(&anim, "knife"));

    EXPECT_EQ((std::vector<uint32_t>{500 + ANIMATION_PAUSE_PADDING_MS}), fake.sleeps);
    ASSERT_EQ(4u, fake.target_history.size());
    EXPECT_EQ(channels_of("park"), fake.target_history[0]);
    EXPECT_EQ(channels_of("knife"), fake.target_history[1]);
    EXPECT_EQ(channels_of("park"), fake.target_history[2]);
    EXPECT_EQ(channels_of("park"), fake.target_history[3]);
    EXPECT_STREQ("park", animation_current_pose(&anim));
}

TEST_F(AnimationTest, ScriptStepsRunInOrder) {
    no_settle();
    ASSERT_EQ(ANIMATION_OK, animation_play_script(&anim, "breathe"));

    // Every pose step ends on its pose
    ASSERT_EQ(8u, fake.target_history.size());
    EXPECT_EQ(channels_of("extend"), fake.target_history[1]);
    EXPECT_EQ(channels_of("park"), fake.target_history[3]);
    EXPECT_EQ(channels_of("extend_half"), fake.target_history[5]);
    EXPECT_EQ(channels_of("park"), fake.target_history[7]);
}

TEST_F(AnimationTest, LinkErrorStopsScriptAtLastCompletedPose) {
    no_settle();
    fake.accept_frames = 100;   // exactly one full transition

    EXPECT_EQ(ANIMATION_LINK_ERROR, animation_play_script(&anim, "breathe"));

    EXPECT_STREQ("extend", animation_current_pose(&anim));
    EXPECT_EQ(MAESTRO_ERR_TRANSPORT, animation_last_link_status(&anim));
    EXPECT_FALSE(animation_is_animating(&anim));

    // Not wedged: works again once the link recovers
    fake.accept_frames = SIZE_MAX;
    EXPECT_EQ(ANIMATION_OK, animation_animate_to(&anim, "park", kEven1500));
    EXPECT_STREQ("park", animation_current_pose(&anim));
}

TEST_F(AnimationTest, LinkErrorDuringSettleLeavesPose) {
    // Leg 1 is 50 frames, the next frame is the settle query
    fake.accept_frames = 50;

    EXPECT_EQ(ANIMATION_LINK_ERROR, animation_animate_to(&anim, "extend", kEven1500));
    EXPECT_STREQ("park", animation_current_pose(&anim));
    EXPECT_EQ(MAESTRO_ERR_TRANSPORT, animation_last_link_status(&anim));
}

// ============================================================================
// Proximity
// ============================================================================

TEST_F(AnimationTest, NoProximitySourceIsNoOp) {
    EXPECT_EQ(ANIMATION_OK, animation_poll_proximity(&anim));
    EXPECT_TRUE(fake.frames.empty());
}

TEST_F(AnimationTest, ProximityBandPlaysOncePerEntry) {
    no_settle();
    DistanceSequence seq;
    seq.readings = {100.0f, 15.0f, 15.0f, 40.0f, 0.0f, 40.0f, 100.0f, 15.0f};
    animation_set_proximity_source(&anim, DistanceSequence::read, &seq);

    // Two transitions per reaction script, two legs each
    const size_t expected_moves[] = {0, 4, 4, 8, 8, 8, 8, 12};

    for (size_t i = 0; i < seq.readings.size(); i++) {
        EXPECT_EQ(ANIMATION_OK, animation_poll_proximity(&anim)) << "reading " << i;
        EXPECT_EQ(expected_moves[i], fake.target_history.size()) << "reading " << i;
    }
    EXPECT_STREQ("park", animation_current_pose(&anim));
    EXPECT_EQ(channels_of("push_away"), fake.target_history[9]);
}

TEST_F(AnimationTest, ProximityIgnoredWhileAnimating) {
    DistanceSequence seq;
    seq.readings = {10.0f, 10.0f, 10.0f, 10.0f};
    animation_set_proximity_source(&anim, DistanceSequence::read, &seq);

    std::vector<animation_result_t> nested;
    fake.on_sleep = [&](uint32_t) { nested.push_back(animation_poll_proximity(&anim)); };

    ASSERT_EQ(ANIMATION_OK, animation_animate_to(&anim, "extend", kEven1500));
    ASSERT_FALSE(nested.empty());
    for (animation_result_t r : nested) {
        EXPECT_EQ(ANIMATION_BUSY, r);
    }
    EXPECT_EQ(0u, seq.next);
}

TEST(AnimationStatus, ResultNames) {
    EXPECT_STREQ("OK", animation_result_str(ANIMATION_OK));
    EXPECT_STREQ("BUSY", animation_result_str(ANIMATION_BUSY));
    EXPECT_STREQ("SETTLE_TIMEOUT", animation_result_str(ANIMATION_SETTLE_TIMEOUT));
    EXPECT_STREQ("LINK_ERROR", animation_result_str(ANIMATION_LINK_ERROR));
}
