/*
 * blob_assembler.h
 *
 * Project: Orca Settings Link
 * Purpose: Reconstruct and validate a settings blob over a transport
 *
 * Sequence:
 *  1. get_info() -> blob_size, max_chunk
 *  2. read_chunk(offset, min(max_chunk, blob_size - offset)) from 0 upward
 *  3. check magic and major version       -> FORMAT_MISMATCH
 *  4. check CRC-32 trailer                -> CORRUPT
 *  5. check header_size against the blob  -> FORMAT_MISMATCH
 *
 * Rules:
 *  - Reads are strictly sequential and in increasing offset order
 *  - Any failure wipes the caller's buffer; no partial blob escapes
 *  - No retries. If generation may have moved, the caller starts over
 *    from offset 0 (see blob_peek_generation)
 *  - Format errors only after the full transfer, never mid-transfer
 *
 * Updated: 2026-10-17
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "blob_layout.h"
#include "transport/transport.h"

/* Called before each chunk with (offset, total) and once with (total, total) */
typedef void (*blob_progress_fn)(void *user, uint32_t offset, uint32_t total);

struct assemble_opts {
    uint32_t max_chunk;         /* 0 = device limit; never raises it */
    blob_progress_fn progress;  /* optional */
    void *user;
};

/* Validated result; bytes points into the caller's buffer */
struct assembled_blob {
    const uint8_t *bytes;
    uint32_t size;

    struct device_identity identity;
    struct blob_header header;
    uint32_t crc;
};

/*
 * Fetch identity, then assemble.
 *
 * Parameters:
 *  t       - open transport, exclusively owned for the call
 *  schema  - expected format (magic, major version, offsets)
 *  buf     - destination, at least identity.blob_size bytes
 *  cap     - size of buf
 *  opts    - may be NULL
 *  out     - filled only on ORCA_OK
 *
 * Returns:
 *  - ORCA_OK
 *  - any transport error, unchanged
 *  - ORCA_ERR_PROTOCOL_MISMATCH on an unusable identity or short chunk
 *  - ORCA_ERR_OUT_OF_RANGE if cap is smaller than the blob
 *  - ORCA_ERR_FORMAT_MISMATCH / ORCA_ERR_CORRUPT after transfer
 */
orca_err_t blob_assemble(const Transport *t,
                         const struct blob_schema *schema,
                         uint8_t *buf, size_t cap,
                         const struct assemble_opts *opts,
                         struct assembled_blob *out);

/* Same, with an identity the caller already holds for this connection */
orca_err_t blob_assemble_known(const Transport *t,
                               const struct blob_schema *schema,
                               const struct device_identity *identity,
                               uint8_t *buf, size_t cap,
                               const struct assemble_opts *opts,
                               struct assembled_blob *out);

/*
 * Read only the generation field and report the device's current value.
 * Does not validate magic or version.
 */
orca_err_t blob_peek_generation(const Transport *t,
                                const struct blob_schema *schema,
                                uint32_t *out_generation);
