/**
 * @file maestro.h
 * @brief Pololu Maestro driver for two daisy-chained controllers
 *
 * Two Maestro 12-channel units share one serial line and are addressed
 * with the Pololu protocol (device numbers 12 and 13). The driver merges
 * them into a single 24-channel space:
 *   - channel  0..11 -> primary   (device 0x0C) local channel 0..11
 *   - channel 12..23 -> secondary (device 0x0D) local channel 0..11
 *
 * Frame layout (Pololu protocol):
 *   0xAA | device | opcode | payload... [| crc7]
 *
 * Targets are sent in quarter-microseconds (pulse_us * 4) split into
 * two 7-bit data bytes, low then high. Position replies are two raw
 * bytes, little-endian, also in quarter-microseconds.
 *
 * The driver never touches hardware directly: bytes go through a
 * maestro_transport_t supplied by the caller (see maestro_uart.h for
 * the RP2040 UART port).
 */

#ifndef MAESTRO_H
#define MAESTRO_H

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

// ============================================================================
// Protocol constants
// ============================================================================

#define MAESTRO_SYNC_BYTE           0xAA
#define MAESTRO_DEVICE_PRIMARY      0x0C
#define MAESTRO_DEVICE_SECONDARY    0x0D

#define MAESTRO_CMD_SET_TARGET      0x04
#define MAESTRO_CMD_SET_SPEED       0x07
#define MAESTRO_CMD_SET_ACCEL       0x09
#define MAESTRO_CMD_GET_POSITION    0x10
#define MAESTRO_CMD_GET_MOVING      0x13
#define MAESTRO_CMD_SET_MULTI       0x1F
#define MAESTRO_CMD_GET_ERRORS      0x21
#define MAESTRO_CMD_GO_HOME         0x22

#define MAESTRO_CHANNELS_PER_DEVICE 12
#define MAESTRO_CHANNEL_COUNT       24

#define MAESTRO_PULSE_MIN_US        736
#define MAESTRO_PULSE_MAX_US        2272

#define MAESTRO_SPEED_MAX           0x3FFF  // 14 bits in two 7-bit bytes
#define MAESTRO_ACCEL_MAX           255

#define MAESTRO_CRC7_POLY           0x91

// sync + device + opcode + count + channel + 12 targets * 2 + crc
#define MAESTRO_MAX_FRAME_LEN       32

// Error register bits (Get Errors reply)
#define MAESTRO_ERROR_SERIAL_SIGNAL     (1u << 0)
#define MAESTRO_ERROR_SERIAL_OVERRUN    (1u << 1)
#define MAESTRO_ERROR_SERIAL_RX_FULL    (1u << 2)
#define MAESTRO_ERROR_SERIAL_CRC        (1u << 3)
#define MAESTRO_ERROR_SERIAL_PROTOCOL   (1u << 4)
#define MAESTRO_ERROR_SERIAL_TIMEOUT    (1u << 5)

// ============================================================================
// Data Types
// ============================================================================

typedef enum {
    MAESTRO_OK = 0,
    MAESTRO_ERR_CHANNEL,        // channel outside [0, 24)
    MAESTRO_ERR_PULSE_WIDTH,    // pulse width outside [736, 2272]
    MAESTRO_ERR_RANGE,          // run/count/speed/accel outside protocol limits
    MAESTRO_ERR_TRANSPORT,      // port accepted fewer bytes than the frame
    MAESTRO_ERR_TIMEOUT         // reply missing before the deadline (Unknown)
} maestro_status_t;

/**
 * @brief One encoded command, ready to be written as-is
 */
typedef struct {
    uint8_t bytes[MAESTRO_MAX_FRAME_LEN];
    size_t len;
} maestro_frame_t;

/**
 * @brief Byte transport used by the driver
 *
 * write/read/flush_input are mandatory. lock/unlock are optional: when
 * set, the driver holds the lock for a whole exchange (frame write, or
 * query write plus reply) so that commands from different tasks never
 * interleave on the wire.
 */
typedef struct {
    void *ctx;
    size_t (*write)(void *ctx, const uint8_t *data, size_t len);
    size_t (*read)(void *ctx, uint8_t *data, size_t len, uint32_t timeout_us);
    void (*flush_input)(void *ctx);
    void (*lock)(void *ctx);
    void (*unlock)(void *ctx);
} maestro_transport_t;

/**
 * @brief Chained Maestro pair
 */
typedef struct {
    maestro_transport_t port;
    uint32_t response_timeout_us;   ///< Deadline for query replies
    bool crc_enabled;               ///< Append CRC-7 to every frame
    uint32_t timeout_count;         ///< Stalled reads since init
} maestro_t;

// ============================================================================
// Encoding (pure, no I/O)
// ============================================================================

/**
 * @brief Map a logical channel to device address and local channel
 * @return false if channel >= 24
 */
bool maestro_channel_to_device(uint8_t channel, uint8_t *device, uint8_t *local_channel);

bool maestro_pulse_valid(uint16_t pulse_us);

uint16_t maestro_pulse_to_raw(uint16_t pulse_us);
uint16_t maestro_raw_to_pulse(uint16_t raw);

void maestro_pack_7bit(uint16_t value, uint8_t *low, uint8_t *high);
uint16_t maestro_unpack_7bit(uint8_t low, uint8_t high);

/**
 * @brief Pololu CRC-7 over a message (polynomial 0x91, LSB first)
 */
uint8_t maestro_crc7(const uint8_t *msg, size_t len);

maestro_status_t maestro_encode_set_target(uint8_t channel, uint16_t pulse_us, maestro_frame_t *out);
maestro_status_t maestro_encode_set_speed(uint8_t channel, uint16_t speed, maestro_frame_t *out);
maestro_status_t maestro_encode_set_accel(uint8_t channel, uint16_t accel, maestro_frame_t *out);
maestro_status_t maestro_encode_get_position(uint8_t channel, maestro_frame_t *out);

/**
 * @brief Encode an opcode that has no payload (moving state, errors, home)
 */
void maestro_encode_device_command(uint8_t device, uint8_t opcode, maestro_frame_t *out);

/**
 * @brief Encode a Set Multiple Targets run over the logical channel space
 *
 * A run that crosses channel 12 becomes two frames. Frames are returned
 * in transmit order: secondary device first, then primary, so both
 * units start moving as close together as the line allows.
 *
 * All pulse widths are validated before anything is encoded. A run that
 * does not fit inside [0, 24), including one starting at channel 24 or
 * later, is MAESTRO_ERR_RANGE.
 *
 * @param first_channel First logical channel of the run
 * @param pulse_us      Pulse widths, one per channel
 * @param count         Number of channels in the run
 * @param frames        Output, room for 2 frames
 * @param frame_count   Number of frames produced (1 or 2)
 */
maestro_status_t maestro_encode_multi_target(uint8_t first_channel, const uint16_t *pulse_us,
                                             size_t count, maestro_frame_t frames[2],
                                             size_t *frame_count);

/**
 * @brief Decode a Get Position reply to microseconds
 */
uint16_t maestro_decode_position(const uint8_t reply[2]);

// ============================================================================
// Link
// ============================================================================

void maestro_init(maestro_t *m, const maestro_transport_t *port, uint32_t response_timeout_us);
void maestro_set_crc(maestro_t *m, bool enabled);

maestro_status_t maestro_set_target(maestro_t *m, uint8_t channel, uint16_t pulse_us);
maestro_status_t maestro_set_multiple_targets(maestro_t *m, uint8_t first_channel,
                                              const uint16_t *pulse_us, size_t count);
maestro_status_t maestro_set_speed(maestro_t *m, uint8_t channel, uint16_t speed);
maestro_status_t maestro_set_accel(maestro_t *m, uint8_t channel, uint16_t accel);

/**
 * @brief Read the current position of a channel
 *
 * On a short reply the pending input is flushed to resynchronize the
 * framing and MAESTRO_ERR_TIMEOUT is returned; *pulse_us is untouched.
 */
maestro_status_t maestro_get_position(maestro_t *m, uint8_t channel, uint16_t *pulse_us);

/**
 * @brief true if either unit reports a channel still moving
 *
 * A unit that does not answer is counted as not moving.
 */
bool maestro_get_moving_state(maestro_t *m);

maestro_status_t maestro_get_errors(maestro_t *m, uint8_t device, uint16_t *errors);

/**
 * @brief Send every primary-unit channel to its home position
 */
maestro_status_t maestro_go_home(maestro_t *m);

uint32_t maestro_timeout_count(const maestro_t *m);

const char* maestro_status_str(maestro_status_t status);

#endif // MAESTRO_H
