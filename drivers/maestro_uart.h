/**
 * @file maestro_uart.h
 * @brief RP2040 hardware UART port for the Maestro driver
 *
 * Wiring (both Maestros on one line, daisy-chained):
 * - Pico UART TX -> Maestro #12 RX -> Maestro #13 RX
 * - Pico UART RX <- Maestro TX (wired-AND of both units)
 * - 8N1, no flow control
 */

#ifndef MAESTRO_UART_H
#define MAESTRO_UART_H

#include "pico/stdlib.h"
#include "hardware/uart.h"
#include "maestro.h"

typedef struct {
    uart_inst_t *uart;
    uint tx_pin;
    uint rx_pin;
    uint baud;
    uint32_t bytes_flushed;     ///< Stale bytes dropped by flush_input
} maestro_uart_t;

/**
 * @brief Configure the UART and its pins
 * @return true if the UART came up at the requested baud rate
 */
bool maestro_uart_init(maestro_uart_t *port, uart_inst_t *uart, uint tx_pin, uint rx_pin, uint baud);

/**
 * @brief Fill a transport with this port's write/read/flush functions
 *
 * lock/unlock are left NULL; the caller adds them when several tasks
 * share the link.
 */
void maestro_uart_bind(maestro_uart_t *port, maestro_transport_t *transport);

#endif // MAESTRO_UART_H
