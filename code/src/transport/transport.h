/*
 * transport.h
 *
 * Project: Orca Settings Link
 * Purpose: Chunked blob transport capability
 *
 * Rules:
 *  - A transport is a table of operations plus an opaque context
 *  - Implementations (serial, reference device) fill the table;
 *    nothing above this header knows which one it holds
 *  - read_chunk never mutates device state
 *  - close is idempotent; every call after close fails DISCONNECTED
 *  - One outstanding call at a time; callers serialize
 *
 * Updated: 2026-10-17
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

/* --------------------------------------------------------------------------
 * Errors
 * -------------------------------------------------------------------------- */

typedef enum {
    ORCA_OK = 0,

    /* Transport level: surface unchanged through the assembler */
    ORCA_ERR_DISCONNECTED,      /* link lost or transport closed */
    ORCA_ERR_TIMEOUT,           /* no response within link deadline */
    ORCA_ERR_OUT_OF_RANGE,      /* offset/length outside blob: caller bug */
    ORCA_ERR_PROTOCOL_MISMATCH, /* malformed or unexpected link response */

    /* Format level: raised by the assembler after a full transfer */
    ORCA_ERR_FORMAT_MISMATCH,   /* magic or major version not recognized */
    ORCA_ERR_CORRUPT            /* trailer checksum mismatch */
} orca_err_t;

/* Stable upper-case name, e.g. "DISCONNECTED" */
const char *orca_err_string(orca_err_t err);

/* --------------------------------------------------------------------------
 * Device identity
 * -------------------------------------------------------------------------- */

/* Fixed for the lifetime of a connection */
struct device_identity {
    uint32_t schema_id;
    uint8_t  settings_major;
    uint8_t  settings_minor;
    uint32_t blob_size;
    uint32_t max_chunk;     /* largest read_chunk length honored */
};

/* --------------------------------------------------------------------------
 * Capability table
 * -------------------------------------------------------------------------- */

typedef struct {
    const char *name;
    void *ctx;

    orca_err_t (*get_info)(void *ctx, struct device_identity *out);

    /*
     * Copy [offset, offset + length) into out.
     * *out_len receives the number of bytes produced; on ORCA_OK a
     * conforming link sets it to length, but callers verify.
     */
    orca_err_t (*read_chunk)(void *ctx,
                             uint32_t offset,
                             uint32_t length,
                             uint8_t *out,
                             uint32_t *out_len);

    void (*close)(void *ctx);

} Transport;

/* --------------------------------------------------------------------------
 * Dispatch helpers
 *
 * A NULL transport or missing operation reports DISCONNECTED.
 * -------------------------------------------------------------------------- */

orca_err_t transport_get_info(const Transport *t, struct device_identity *out);

orca_err_t transport_read_chunk(const Transport *t,
                                uint32_t offset,
                                uint32_t length,
                                uint8_t *out,
                                uint32_t *out_len);

void transport_close(const Transport *t);
