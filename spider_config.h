/**
 * @file spider_config.h
 * @brief Hardware and task configuration for the spider controller
 *
 * Wiring:
 * - GP0 (UART0 TX) -> Maestro #12 RX, chained on to Maestro #13 RX
 * - GP1 (UART0 RX) <- Maestro TX line
 * - Both Maestros set to "UART, fixed baud rate" at SPIDER_MAESTRO_BAUD,
 *   device numbers 12 and 13
 * - Console on USB CDC (stdio)
 */

#ifndef SPIDER_CONFIG_H
#define SPIDER_CONFIG_H

// ============================================================================
// Maestro link
// ============================================================================
#define SPIDER_MAESTRO_UART         uart0
#define SPIDER_MAESTRO_TX_PIN       0
#define SPIDER_MAESTRO_RX_PIN       1
#define SPIDER_MAESTRO_BAUD         9600
#define SPIDER_MAESTRO_TIMEOUT_US   500000  // Reply deadline for queries

// Must match the "Enable CRC" setting in the Maestro Control Center
#define SPIDER_MAESTRO_CRC          0

// ============================================================================
// Choreography
// ============================================================================
#define SPIDER_DEFAULT_MOVE_MS      1500    // POSE command without a time
#define SPIDER_PROXIMITY_POLL_MS    100

// ============================================================================
// Tasks
// ============================================================================
#define SPIDER_REQUEST_QUEUE_LEN    4
#define SPIDER_CONSOLE_POLL_MS      10
#define SPIDER_CONSOLE_LINE_MAX     64

#define SPIDER_PRIO_BLINK           1
#define SPIDER_PRIO_CONSOLE         2
#define SPIDER_PRIO_CONTROL         3

#define SPIDER_STACK_BLINK          256
#define SPIDER_STACK_CONSOLE        1024
#define SPIDER_STACK_CONTROL        1024

#endif // SPIDER_CONFIG_H
