#include "maestro_uart.h"
#include <stdio.h>

static size_t uart_port_write(void *ctx, const uint8_t *data, size_t len) {
    maestro_uart_t *port = (maestro_uart_t *)ctx;
    uart_write_blocking(port->uart, data, len);
    return len;
}

// Deadline applies per byte, so a reply that stops half-way ends early
static size_t uart_port_read(void *ctx, uint8_t *data, size_t len, uint32_t timeout_us) {
    maestro_uart_t *port = (maestro_uart_t *)ctx;
    size_t got = 0;

    while (got < len) {
        if (!uart_is_readable_within_us(port->uart, timeout_us)) {
            break;
        }
        data[got++] = (uint8_t)uart_getc(port->uart);
    }
    return got;
}

static void uart_port_flush_input(void *ctx) {
    maestro_uart_t *port = (maestro_uart_t *)ctx;
    while (uart_is_readable(port->uart)) {
        (void)uart_getc(port->uart);
        port->bytes_flushed++;
    }
}

bool maestro_uart_init(maestro_uart_t *port, uart_inst_t *uart, uint tx_pin, uint rx_pin, uint baud) {
    port->uart = uart;
    port->tx_pin = tx_pin;
    port->rx_pin = rx_pin;
    port->baud = baud;
    port->bytes_flushed = 0;

    printf("[MAESTRO] UART%u: GP%u (TX), GP%u (RX) @ %u baud\n",
           uart_get_index(uart), tx_pin, rx_pin, baud);

    uint actual_baud = uart_init(uart, baud);
    gpio_set_function(tx_pin, GPIO_FUNC_UART);
    gpio_set_function(rx_pin, GPIO_FUNC_UART);

    uart_set_format(uart, 8, 1, UART_PARITY_NONE);
    uart_set_hw_flow(uart, false, false);
    uart_set_fifo_enabled(uart, true);
    uart_set_translate_crlf(uart, false);

    // Drop anything the Maestros sent while we were booting
    uart_port_flush_input(port);

    // Integer divider rounding makes a small mismatch normal
    uint tolerance = baud / 50;
    if (actual_baud + tolerance < baud || actual_baud > baud + tolerance) {
        printf("[MAESTRO] UART baud mismatch (wanted %u, got %u)\n", baud, actual_baud);
        return false;
    }
    return true;
}

void maestro_uart_bind(maestro_uart_t *port, maestro_transport_t *transport) {
    transport->ctx = port;
    transport->write = uart_port_write;
    transport->read = uart_port_read;
    transport->flush_input = uart_port_flush_input;
    transport->lock = NULL;
    transport->unlock = NULL;
}
