/*
 * mock_transport.h
 *
 * Project: Orca Settings Link
 * Purpose: In-memory reference device
 *
 * Behavior:
 *  - Holds one self-consistent blob (current versions, generation 1,
 *    profile 0, flags 0, valid CRC-32 trailer)
 *  - get_info reports the schema's identity and a configurable max_chunk
 *  - read_chunk enforces the same bounds contract as a real link
 *  - close is idempotent; afterwards every call fails DISCONNECTED
 *
 * Notes:
 *  - Deterministic, no I/O, no heap
 *  - Tests reach into the struct to corrupt bytes or inject faults
 *
 * Updated: 2026-10-17
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

#include "blob_layout.h"
#include "transport/transport.h"

#define MOCK_DEFAULT_MAX_CHUNK 256u

struct mock_transport {
    const struct blob_schema *schema;

    uint8_t  blob[ORCA_BLOB_MAX_SIZE];
    uint32_t blob_size;
    uint32_t max_chunk;

    bool closed;

    /* Accounting */
    uint32_t info_count;
    uint32_t read_count;
    uint32_t largest_read;
    uint32_t last_offset;

    /* Fault injection (0 = off) */
    uint32_t   fail_on_read;        /* 1-based read number that fails */
    orca_err_t fail_err;
    uint32_t   close_after_reads;   /* self-close once this many reads succeed */
};

/*
 * Build the reference blob for schema at the schema's default size.
 *
 * Returns:
 *  - false if the schema size does not fit ORCA_BLOB_MAX_SIZE
 */
bool mock_transport_init(struct mock_transport *m,
                         const struct blob_schema *schema,
                         uint32_t max_chunk);

/* Capability table bound to m; m must outlive it */
Transport mock_transport_bind(struct mock_transport *m);

/*
 * Array-slice copy: copies min(length, blob_size - offset) bytes,
 * zero when offset is at or past the end. Never fails.
 */
uint32_t mock_transport_slice(const struct mock_transport *m,
                              uint32_t offset, uint32_t length,
                              uint8_t *out);

/* Simulate a device-side commit: generation + 1, trailer resealed */
uint32_t mock_transport_commit(struct mock_transport *m);

/* Change the live profile and commit */
uint32_t mock_transport_set_active_profile(struct mock_transport *m, uint8_t profile);

uint32_t mock_transport_generation(const struct mock_transport *m);
