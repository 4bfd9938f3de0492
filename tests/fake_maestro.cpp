/**
 * @file fake_maestro.cpp
 * @brief Simulated Maestro pair and clock for host tests
 */

#include "fake_maestro.h"

FakeMaestro::FakeMaestro() {
    targets.fill(1500);
    positions.fill(1500);
    speeds.fill(0);
    accels.fill(0);
}

maestro_transport_t FakeMaestro::transport() {
    maestro_transport_t t;
    t.ctx = this;
    t.write = write_cb;
    t.read = read_cb;
    t.flush_input = flush_cb;
    t.lock = use_lock ? lock_cb : nullptr;
    t.unlock = use_lock ? unlock_cb : nullptr;
    return t;
}

animation_clock_t FakeMaestro::clock() {
    animation_clock_t c;
    c.ctx = this;
    c.sleep_ms = sleep_cb;
    c.now_ms = now_cb;
    return c;
}

uint32_t FakeMaestro::total_slept() const {
    uint32_t total = 0;
    for (uint32_t ms : sleeps) total += ms;
    return total;
}

void FakeMaestro::queue_reply(const std::vector<uint8_t> &bytes) {
    rx_.insert(rx_.end(), bytes.begin(), bytes.end());
}

// ============================================================================
// Wire side
// ============================================================================

size_t FakeMaestro::write(const uint8_t *data, size_t len) {
    if (use_lock && lock_depth == 0) {
        writes_outside_lock++;
    }
    if (frames.size() >= accept_frames) {
        return 0;
    }

    std::vector<uint8_t> frame(data, data + len);
    frames.push_back(frame);
    handle_frame(frame);
    return len;
}

size_t FakeMaestro::read(uint8_t *data, size_t len) {
    size_t got = 0;
    while (got < len && !rx_.empty()) {
        data[got++] = rx_.front();
        rx_.pop_front();
    }
    return got;
}

void FakeMaestro::reply(std::vector<uint8_t> bytes) {
    if (silent) return;
    if (bytes.size() > reply_limit) bytes.resize(reply_limit);
    queue_reply(bytes);
}

bool FakeMaestro::device_moving(int device_index) const {
    int base = device_index * MAESTRO_CHANNELS_PER_DEVICE;
    for (int ch = base; ch < base + MAESTRO_CHANNELS_PER_DEVICE; ch++) {
        if (positions[ch] != targets[ch]) return true;
    }
    return false;
}

void FakeMaestro::handle_frame(std::vector<uint8_t> frame) {
    if (expect_crc) {
        uint8_t crc = frame.back();
        frame.pop_back();
        if (maestro_crc7(frame.data(), frame.size()) != crc) {
            crc_failures++;
            return;
        }
    }
    if (frame.size() < 3 || frame[0] != MAESTRO_SYNC_BYTE) return;

    int dev = frame[1] == MAESTRO_DEVICE_SECONDARY ? 1 : 0;
    int base = dev * MAESTRO_CHANNELS_PER_DEVICE;
    uint8_t op = frame[2];

    switch (op) {
        case MAESTRO_CMD_SET_TARGET: {
            int ch = base + frame[3];
            targets[ch] = maestro_raw_to_pulse(maestro_unpack_7bit(frame[4], frame[5]));
            if (!stuck) positions[ch] = targets[ch];
            break;
        }
        case MAESTRO_CMD_SET_MULTI: {
            int count = frame[3];
            int first = base + frame[4];
            for (int i = 0; i < count; i++) {
                int ch = first + i;
                targets[ch] = maestro_raw_to_pulse(maestro_unpack_7bit(frame[5 + 2 * i], frame[6 + 2 * i]));
                if (!stuck) positions[ch] = targets[ch];
            }
            if (dev == 0) target_history.push_back(targets);
            break;
        }
        case MAESTRO_CMD_SET_SPEED:
            speeds[base + frame[3]] = maestro_unpack_7bit(frame[4], frame[5]);
            break;
        case MAESTRO_CMD_SET_ACCEL:
            accels[base + frame[3]] = maestro_unpack_7bit(frame[4], frame[5]);
            break;
        case MAESTRO_CMD_GET_POSITION: {
            int ch = base + frame[3];
            position_queries.push_back((uint8_t)ch);
            uint16_t raw = maestro_pulse_to_raw(positions[ch]);
            reply({(uint8_t)(raw & 0xFF), (uint8_t)(raw >> 8)});
            break;
        }
        case MAESTRO_CMD_GET_MOVING:
            reply({(uint8_t)(device_moving(dev) ? 1 : 0)});
            break;
        case MAESTRO_CMD_GET_ERRORS: {
            uint16_t err = error_registers[dev];
            reply({(uint8_t)(err & 0xFF), (uint8_t)(err >> 8)});
            error_registers[dev] = 0;   // reading clears the register
            break;
        }
        case MAESTRO_CMD_GO_HOME:
            home_count++;
            break;
        default:
            break;
    }
}

// ============================================================================
// Callbacks
// ============================================================================

size_t FakeMaestro::write_cb(void *ctx, const uint8_t *data, size_t len) {
    return static_cast<FakeMaestro *>(ctx)->write(data, len);
}

size_t FakeMaestro::read_cb(void *ctx, uint8_t *data, size_t len, uint32_t timeout_us) {
    (void)timeout_us;
    return static_cast<FakeMaestro *>(ctx)->read(data, len);
}

void FakeMaestro::flush_cb(void *ctx) {
    FakeMaestro *fake = static_cast<FakeMaestro *>(ctx);
    fake->rx_.clear();
    fake->flush_count++;
}

void FakeMaestro::lock_cb(void *ctx) {
    FakeMaestro *fake = static_cast<FakeMaestro *>(ctx);
    fake->lock_depth++;
    fake->lock_count++;
}

void FakeMaestro::unlock_cb(void *ctx) {
    static_cast<FakeMaestro *>(ctx)->lock_depth--;
}

void FakeMaestro::sleep_cb(void *ctx, uint32_t ms) {
    FakeMaestro *fake = static_cast<FakeMaestro *>(ctx);
    fake->now_ms += ms;
    fake->sleeps.push_back(ms);
    if (fake->on_sleep) fake->on_sleep(ms);
}

uint32_t FakeMaestro::now_cb(void *ctx) {
    return static_cast<FakeMaestro *>(ctx)->now_ms;
}
