/**
 * @file maestro.cpp
 * @brief Pololu Maestro driver implementation (chained pair, 24 channels)
 */

#include "maestro.h"
#include <stdio.h>
#include <string.h>

// Replies are always 1 (moving state) or 2 bytes (position, errors)
#define MAESTRO_REPLY_MAX 2

// ============================================================================
// Encoding
// ============================================================================

bool maestro_channel_to_device(uint8_t channel, uint8_t *device, uint8_t *local_channel) {
    if (channel >= MAESTRO_CHANNEL_COUNT) {
        return false;
    }

    if (channel < MAESTRO_CHANNELS_PER_DEVICE) {
        *device = MAESTRO_DEVICE_PRIMARY;
        *local_channel = channel;
    } else {
        *device = MAESTRO_DEVICE_SECONDARY;
        *local_channel = channel - MAESTRO_CHANNELS_PER_DEVICE;
    }
    return true;
}

bool maestro_pulse_valid(uint16_t pulse_us) {
    return pulse_us >= MAESTRO_PULSE_MIN_US && pulse_us <= MAESTRO_PULSE_MAX_US;
}

uint16_t maestro_pulse_to_raw(uint16_t pulse_us) {
    return (uint16_t)(pulse_us * 4);
}

uint16_t maestro_raw_to_pulse(uint16_t raw) {
    return (uint16_t)(raw / 4);
}

void maestro_pack_7bit(uint16_t value, uint8_t *low, uint8_t *high) {
    *low = value & 0x7F;
    *high = (value >> 7) & 0x7F;
}

uint16_t maestro_unpack_7bit(uint8_t low, uint8_t high) {
    return (uint16_t)((low & 0x7F) | ((high & 0x7F) << 7));
}

uint8_t maestro_crc7(const uint8_t *msg, size_t len) {
    uint8_t crc = 0;
    for (size_t i = 0; i < len; i++) {
        crc ^= msg[i];
        for (int bit = 0; bit < 8; bit++) {
            if (crc & 1) {
                crc ^= MAESTRO_CRC7_POLY;
            }
            crc >>= 1;
        }
    }
    return crc;
}

static void frame_begin(maestro_frame_t *out, uint8_t device, uint8_t opcode) {
    out->bytes[0] = MAESTRO_SYNC_BYTE;
    out->bytes[1] = device;
    out->bytes[2] = opcode;
    out->len = 3;
}

static void frame_put(maestro_frame_t *out, uint8_t byte) {
    out->bytes[out->len++] = byte;
}

static void frame_put_7bit(maestro_frame_t *out, uint16_t value) {
    uint8_t low, high;
    maestro_pack_7bit(value, &low, &high);
    frame_put(out, low);
    frame_put(out, high);
}

// Shared by speed and acceleration: same layout, different opcode
static maestro_status_t encode_channel_value(uint8_t opcode, uint8_t channel, uint16_t value,
                                             maestro_frame_t *out) {
    uint8_t device, local;
    if (!maestro_channel_to_device(channel, &device, &local)) {
        return MAESTRO_ERR_CHANNEL;
    }

    frame_begin(out, device, opcode);
    frame_put(out, local);
    frame_put_7bit(out, value);
    return MAESTRO_OK;
}

maestro_status_t maestro_encode_set_target(uint8_t channel, uint16_t pulse_us, maestro_frame_t *out) {
    if (channel >= MAESTRO_CHANNEL_COUNT) {
        return MAESTRO_ERR_CHANNEL;
    }
    if (!maestro_pulse_valid(pulse_us)) {
        return MAESTRO_ERR_PULSE_WIDTH;
    }
    return encode_channel_value(MAESTRO_CMD_SET_TARGET, channel, maestro_pulse_to_raw(pulse_us), out);
}

maestro_status_t maestro_encode_set_speed(uint8_t channel, uint16_t speed, maestro_frame_t *out) {
    if (channel >= MAESTRO_CHANNEL_COUNT) {
        return MAESTRO_ERR_CHANNEL;
    }
    if (speed > MAESTRO_SPEED_MAX) {
        return MAESTRO_ERR_RANGE;
    }
    return encode_channel_value(MAESTRO_CMD_SET_SPEED, channel, speed, out);
}

maestro_status_t maestro_encode_set_accel(uint8_t channel, uint16_t accel, maestro_frame_t *out) {
    if (channel >= MAESTRO_CHANNEL_COUNT) {
        return MAESTRO_ERR_CHANNEL;
    }
    if (accel > MAESTRO_ACCEL_MAX) {
        return MAESTRO_ERR_RANGE;
    }
    return encode_channel_value(MAESTRO_CMD_SET_ACCEL, channel, accel, out);
}

maestro_status_t maestro_encode_get_position(uint8_t channel, maestro_frame_t *out) {
    uint8_t device, local;
    if (!maestro_channel_to_device(channel, &device, &local)) {
        return MAESTRO_ERR_CHANNEL;
    }

    frame_begin(out, device, MAESTRO_CMD_GET_POSITION);
    frame_put(out, local);
    return MAESTRO_OK;
}

void maestro_encode_device_command(uint8_t device, uint8_t opcode, maestro_frame_t *out) {
    frame_begin(out, device, opcode);
}

static void encode_multi_run(uint8_t device, uint8_t first_local, const uint16_t *pulse_us,
                             size_t count, maestro_frame_t *out) {
    frame_begin(out, device, MAESTRO_CMD_SET_MULTI);
    frame_put(out, (uint8_t)count);
    frame_put(out, first_local);
    for (size_t i = 0; i < count; i++) {
        frame_put_7bit(out, maestro_pulse_to_raw(pulse_us[i]));
    }
}

maestro_status_t maestro_encode_multi_target(uint8_t first_channel, const uint16_t *pulse_us,
                                             size_t count, maestro_frame_t frames[2],
                                             size_t *frame_count) {
    *frame_count = 0;

    // A run must fit inside [0, 24); a start at or past 24 leaves no room
    if (first_channel >= MAESTRO_CHANNEL_COUNT) {
        return MAESTRO_ERR_RANGE;
    }
    if (count == 0 || count > (size_t)(MAESTRO_CHANNEL_COUNT - first_channel)) {
        return MAESTRO_ERR_RANGE;
    }
    for (size_t i = 0; i < count; i++) {
        if (!maestro_pulse_valid(pulse_us[i])) {
            return MAESTRO_ERR_PULSE_WIDTH;
        }
    }

    size_t end = first_channel + count;   // one past the last logical channel

    if (end <= MAESTRO_CHANNELS_PER_DEVICE) {
        encode_multi_run(MAESTRO_DEVICE_PRIMARY, first_channel, pulse_us, count, &frames[0]);
        *frame_count = 1;
    } else if (first_channel >= MAESTRO_CHANNELS_PER_DEVICE) {
        encode_multi_run(MAESTRO_DEVICE_SECONDARY, first_channel - MAESTRO_CHANNELS_PER_DEVICE,
                         pulse_us, count, &frames[0]);
        *frame_count = 1;
    } else {
        // Straddles the boundary: [first, 12) on the primary, [12, end) on the secondary
        size_t primary_count = MAESTRO_CHANNELS_PER_DEVICE - first_channel;
        size_t secondary_count = count - primary_count;

        encode_multi_run(MAESTRO_DEVICE_SECONDARY, 0, pulse_us + primary_count,
                         secondary_count, &frames[0]);
        encode_multi_run(MAESTRO_DEVICE_PRIMARY, first_channel, pulse_us, primary_count, &frames[1]);
        *frame_count = 2;
    }
    return MAESTRO_OK;
}

uint16_t maestro_decode_position(const uint8_t reply[2]) {
    uint16_t raw = (uint16_t)(reply[0] | (reply[1] << 8));
    return maestro_raw_to_pulse(raw);
}

// ============================================================================
// Transport helpers
// ============================================================================

static void port_lock(maestro_t *m) {
    if (m->port.lock) m->port.lock(m->port.ctx);
}

static void port_unlock(maestro_t *m) {
    if (m->port.unlock) m->port.unlock(m->port.ctx);
}

// Caller holds the lock
static maestro_status_t send_frame(maestro_t *m, maestro_frame_t *frame) {
    if (m->crc_enabled) {
        uint8_t crc = maestro_crc7(frame->bytes, frame->len);
        frame->bytes[frame->len++] = crc;
    }

    size_t written = m->port.write(m->port.ctx, frame->bytes, frame->len);
    if (written != frame->len) {
        printf("[MAESTRO] Short write: %u of %u bytes (dev 0x%02X op 0x%02X)\n",
               (unsigned)written, (unsigned)frame->len, frame->bytes[1], frame->bytes[2]);
        return MAESTRO_ERR_TRANSPORT;
    }
    return MAESTRO_OK;
}

// Caller holds the lock. Flushes on a short reply so the next exchange starts clean.
static maestro_status_t read_reply(maestro_t *m, uint8_t *reply, size_t len) {
    size_t got = m->port.read(m->port.ctx, reply, len, m->response_timeout_us);
    if (got < len) {
        m->port.flush_input(m->port.ctx);
        m->timeout_count++;
        return MAESTRO_ERR_TIMEOUT;
    }
    return MAESTRO_OK;
}

static maestro_status_t send_locked(maestro_t *m, maestro_frame_t *frame) {
    port_lock(m);
    maestro_status_t status = send_frame(m, frame);
    port_unlock(m);
    return status;
}

static maestro_status_t query_locked(maestro_t *m, maestro_frame_t *frame, uint8_t *reply, size_t len) {
    port_lock(m);
    maestro_status_t status = send_frame(m, frame);
    if (status == MAESTRO_OK) {
        status = read_reply(m, reply, len);
    }
    port_unlock(m);
    return status;
}

// ============================================================================
// Link
// ============================================================================

void maestro_init(maestro_t *m, const maestro_transport_t *port, uint32_t response_timeout_us) {
    memset(m, 0, sizeof(*m));
    m->port = *port;
    m->response_timeout_us = response_timeout_us;
    m->crc_enabled = false;
    m->timeout_count = 0;
}

void maestro_set_crc(maestro_t *m, bool enabled) {
    m->crc_enabled = enabled;
    printf("[MAESTRO] CRC-7 %s\n", enabled ? "enabled" : "disabled");
}

maestro_status_t maestro_set_target(maestro_t *m, uint8_t channel, uint16_t pulse_us) {
    maestro_frame_t frame;
    maestro_status_t status = maestro_encode_set_target(channel, pulse_us, &frame);
    if (status != MAESTRO_OK) {
        printf("[MAESTRO] Rejected target CH%u = %u us (%s)\n",
               channel, pulse_us, maestro_status_str(status));
        return status;
    }
    return send_locked(m, &frame);
}

maestro_status_t maestro_set_multiple_targets(maestro_t *m, uint8_t first_channel,
                                              const uint16_t *pulse_us, size_t count) {
    maestro_frame_t frames[2];
    size_t frame_count = 0;

    maestro_status_t status = maestro_encode_multi_target(first_channel, pulse_us, count,
                                                          frames, &frame_count);
    if (status != MAESTRO_OK) {
        printf("[MAESTRO] Rejected %u targets from CH%u (%s)\n",
               (unsigned)count, first_channel, maestro_status_str(status));
        return status;
    }

    // Both halves go out back-to-back under one lock
    port_lock(m);
    for (size_t i = 0; i < frame_count && status == MAESTRO_OK; i++) {
        status = send_frame(m, &frames[i]);
    }
    port_unlock(m);
    return status;
}

maestro_status_t maestro_set_speed(maestro_t *m, uint8_t channel, uint16_t speed) {
    maestro_frame_t frame;
    maestro_status_t status = maestro_encode_set_speed(channel, speed, &frame);
    if (status != MAESTRO_OK) {
        printf("[MAESTRO] Rejected speed CH%u = %u (%s)\n", channel, speed, maestro_status_str(status));
        return status;
    }
    return send_locked(m, &frame);
}

maestro_status_t maestro_set_accel(maestro_t *m, uint8_t channel, uint16_t accel) {
    maestro_frame_t frame;
    maestro_status_t status = maestro_encode_set_accel(channel, accel, &frame);
    if (status != MAESTRO_OK) {
        printf("[MAESTRO] Rejected accel CH%u = %u (%s)\n", channel, accel, maestro_status_str(status));
        return status;
    }
    return send_locked(m, &frame);
}

maestro_status_t maestro_get_position(maestro_t *m, uint8_t channel, uint16_t *pulse_us) {
    maestro_frame_t frame;
    maestro_status_t status = maestro_encode_get_position(channel, &frame);
    if (status != MAESTRO_OK) {
        return status;
    }

    uint8_t reply[MAESTRO_REPLY_MAX];
    status = query_locked(m, &frame, reply, 2);
    if (status == MAESTRO_ERR_TIMEOUT) {
        printf("[MAESTRO] CH%u position unknown (no reply)\n", channel);
        return status;
    }
    if (status != MAESTRO_OK) {
        return status;
    }

    *pulse_us = maestro_decode_position(reply);
    return MAESTRO_OK;
}

bool maestro_get_moving_state(maestro_t *m) {
    const uint8_t devices[2] = {MAESTRO_DEVICE_PRIMARY, MAESTRO_DEVICE_SECONDARY};

    for (int i = 0; i < 2; i++) {
        maestro_frame_t frame;
        uint8_t reply = 0;
        maestro_encode_device_command(devices[i], MAESTRO_CMD_GET_MOVING, &frame);
        if (query_locked(m, &frame, &reply, 1) == MAESTRO_OK && reply == 0x01) {
            return true;
        }
    }
    return false;
}

maestro_status_t maestro_get_errors(maestro_t *m, uint8_t device, uint16_t *errors) {
    if (device != MAESTRO_DEVICE_PRIMARY && device != MAESTRO_DEVICE_SECONDARY) {
        return MAESTRO_ERR_RANGE;
    }

    maestro_frame_t frame;
    uint8_t reply[MAESTRO_REPLY_MAX];
    maestro_encode_device_command(device, MAESTRO_CMD_GET_ERRORS, &frame);

    maestro_status_t status = query_locked(m, &frame, reply, 2);
    if (status != MAESTRO_OK) {
        printf("[MAESTRO] Device 0x%02X error register unavailable (%s)\n",
               device, maestro_status_str(status));
        return status;
    }

    *errors = (uint16_t)(reply[0] | (reply[1] << 8));
    return MAESTRO_OK;
}

maestro_status_t maestro_go_home(maestro_t *m) {
    maestro_frame_t frame;
    maestro_encode_device_command(MAESTRO_DEVICE_PRIMARY, MAESTRO_CMD_GO_HOME, &frame);
    return send_locked(m, &frame);
}

uint32_t maestro_timeout_count(const maestro_t *m) {
    return m->timeout_count;
}

const char* maestro_status_str(maestro_status_t status) {
    switch (status) {
        case MAESTRO_OK:              return "OK";
        case MAESTRO_ERR_CHANNEL:     return "CHANNEL";
        case MAESTRO_ERR_PULSE_WIDTH: return "PULSE_WIDTH";
        case MAESTRO_ERR_RANGE:       return "RANGE";
        case MAESTRO_ERR_TRANSPORT:   return "TRANSPORT";
        case MAESTRO_ERR_TIMEOUT:     return "TIMEOUT";
    }
    return "?";
}
