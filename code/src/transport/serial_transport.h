/*
 * serial_transport.h
 *
 * Project: Orca Settings Link
 * Purpose: Framed serial link transport (USB CDC / UART)
 *
 * Behavior:
 *  - One request, one response; reads are serialized by io_lock
 *  - Every wait is bounded by timeout_ms           -> TIMEOUT
 *  - EOF, I/O error, or close() while waiting      -> DISCONNECTED
 *  - Bad framing, wrong command, echo mismatch     -> PROTOCOL_MISMATCH
 *  - Responses with a stale sequence number are discarded
 *  - The identity from get_info is cached; later reads past its
 *    blob_size fail OUT_OF_RANGE without touching the link
 *  - A length of 0 or above FRAME_MAX_READ_DATA also fails OUT_OF_RANGE
 *    locally, even inside the blob; it cannot be expressed on the link
 *
 * Threading:
 *  - Calls block; run them on the host's I/O thread
 *  - close() may be called from any thread; it wakes an in-flight
 *    call through a self-pipe and waits for it to unwind
 *
 * Updated: 2026-10-17
 */

#pragma once

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>

#include <atomic>
#include <mutex>

#include "blob_layout.h"
#include "link_config.h"
#include "protocol/frame.h"
#include "transport/transport.h"

struct serial_transport {
    char port[LINK_PORT_MAX];
    const struct blob_schema *schema;
    uint32_t timeout_ms;

    int fd      = -1;
    int wake_rd = -1;
    int wake_wr = -1;

    std::atomic<bool> closed{true};
    std::mutex io_lock;

    uint32_t seq;
    struct device_identity info;
    bool have_info;

    /* Receive stream and the last decoded frame */
    uint8_t rx[FRAME_MAX_SIZE * 2];
    size_t  rx_len;
    uint8_t frame[FRAME_MAX_SIZE];
    uint8_t tx[FRAME_MAX_SIZE];
};

/*
 * Open cfg->port raw 8N1 at cfg->baud.
 *
 * Returns:
 *  - ORCA_OK
 *  - ORCA_ERR_DISCONNECTED if the port cannot be opened or configured
 */
orca_err_t serial_transport_open(struct serial_transport *st,
                                 const struct link_config *cfg,
                                 const struct blob_schema *schema);

/* Capability table bound to st; st must outlive it */
Transport serial_transport_bind(struct serial_transport *st);
