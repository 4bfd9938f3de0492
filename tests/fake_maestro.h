/**
 * @file fake_maestro.h
 * @brief Simulated Maestro pair and clock for host tests
 *
 * Decodes every frame the driver writes, keeps per-channel target and
 * position state for both units and queues the replies a real pair
 * would send. Positions follow targets immediately unless stuck is set.
 */

#ifndef FAKE_MAESTRO_H
#define FAKE_MAESTRO_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <vector>

#include "maestro.h"
#include "animation.h"

class FakeMaestro {
public:
    FakeMaestro();

    maestro_transport_t transport();
    animation_clock_t clock();

    // ---- Fault injection ----
    bool silent = false;            ///< Never reply to queries
    bool stuck = false;             ///< Positions ignore new targets
    size_t reply_limit = SIZE_MAX;  ///< Truncate every reply to this many bytes
    size_t accept_frames = SIZE_MAX;///< Writes fail once this many frames went through
    bool expect_crc = false;        ///< Strip and check a trailing CRC-7 byte
    std::array<uint16_t, 2> error_registers{{0, 0}};

    // ---- Observed traffic ----
    std::vector<std::vector<uint8_t>> frames;   ///< Every accepted write, as sent
    std::array<uint16_t, MAESTRO_CHANNEL_COUNT> targets;
    std::array<uint16_t, MAESTRO_CHANNEL_COUNT> positions;
    std::array<uint16_t, MAESTRO_CHANNEL_COUNT> speeds;
    std::array<uint16_t, MAESTRO_CHANNEL_COUNT> accels;
    std::vector<std::array<uint16_t, MAESTRO_CHANNEL_COUNT>> target_history; ///< After each multi-target on the primary
    std::vector<uint8_t> position_queries;      ///< Logical channels queried
    int home_count = 0;
    int flush_count = 0;
    int crc_failures = 0;

    // ---- Locking ----
    int lock_depth = 0;
    int lock_count = 0;
    int writes_outside_lock = 0;
    bool use_lock = true;

    // ---- Clock ----
    uint32_t now_ms = 0;
    std::vector<uint32_t> sleeps;
    std::function<void(uint32_t)> on_sleep;

    uint32_t total_slept() const;
    void queue_reply(const std::vector<uint8_t> &bytes);

private:
    std::deque<uint8_t> rx_;

    size_t write(const uint8_t *data, size_t len);
    size_t read(uint8_t *data, size_t len);
    void handle_frame(std::vector<uint8_t> frame);
    void reply(std::vector<uint8_t> bytes);
    bool device_moving(int device_index) const;

    static size_t write_cb(void *ctx, const uint8_t *data, size_t len);
    static size_t read_cb(void *ctx, uint8_t *data, size_t len, uint32_t timeout_us);
    static void flush_cb(void *ctx);
    static void lock_cb(void *ctx);
    static void unlock_cb(void *ctx);
    static void sleep_cb(void *ctx, uint32_t ms);
    static uint32_t now_cb(void *ctx);
};

#endif // FAKE_MAESTRO_H
