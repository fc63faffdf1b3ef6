/*
 * blob_assembler.cpp
 *
 * Project: Orca Settings Link
 * Purpose: Chunked blob reconstruction and validation
 *
 * Updated: 2026-10-17
 */

#include "blob_assembler.h"
#include "log.h"

#include <string.h>

#define TAG "ASM"

static uint32_t min_u32(uint32_t a, uint32_t b)
{
    return a < b ? a : b;
}

static void report(const struct assemble_opts *opts, uint32_t offset, uint32_t total)
{
    if (opts && opts->progress)
        opts->progress(opts->user, offset, total);
}

/* Abort path: nothing read so far may reach the caller */
static orca_err_t fail(uint8_t *buf, uint32_t size, orca_err_t err)
{
    memset(buf, 0, size);
    log_printf(LOG_WARN, TAG, "assembly failed: %s", orca_err_string(err));
    return err;
}

static orca_err_t read_all(const Transport *t,
                           uint8_t *buf, uint32_t blob_size, uint32_t chunk,
                           const struct assemble_opts *opts)
{
    uint32_t offset = 0;

    while (offset < blob_size) {
        uint32_t want = min_u32(chunk, blob_size - offset);
        uint32_t got = 0;

        report(opts, offset, blob_size);

        orca_err_t err = transport_read_chunk(t, offset, want, buf + offset, &got);
        if (err != ORCA_OK)
            return err;

        if (got != want) {
            log_printf(LOG_WARN, TAG, "short chunk @%u: want %u got %u",
                       (unsigned)offset, (unsigned)want, (unsigned)got);
            return ORCA_ERR_PROTOCOL_MISMATCH;
        }

        log_printf(LOG_DEBUG, TAG, "chunk @%u len %u", (unsigned)offset, (unsigned)got);
        offset += got;
    }

    report(opts, blob_size, blob_size);
    return ORCA_OK;
}

static orca_err_t validate(const struct blob_schema *schema,
                           const uint8_t *buf, uint32_t blob_size,
                           struct blob_header *hdr, uint32_t *crc)
{
    struct blob_range payload;

    if (!blob_magic_ok(schema, buf, blob_size)) {
        log_printf(LOG_ERROR, TAG, "bad magic");
        return ORCA_ERR_FORMAT_MISMATCH;
    }

    if (!blob_header_parse(schema, buf, blob_size, hdr))
        return ORCA_ERR_FORMAT_MISMATCH;

    if (hdr->version_major != schema->version_major) {
        log_printf(LOG_ERROR, TAG, "unsupported major version %u (want %u)",
                   hdr->version_major, schema->version_major);
        return ORCA_ERR_FORMAT_MISMATCH;
    }

    if (hdr->version_minor != schema->version_minor)
        log_printf(LOG_INFO, TAG, "minor version %u (built for %u)",
                   hdr->version_minor, schema->version_minor);

    uint32_t stored   = blob_stored_crc(buf, blob_size);
    uint32_t computed = blob_computed_crc(buf, blob_size);

    if (stored != computed) {
        log_printf(LOG_ERROR, TAG, "crc mismatch: stored %08x computed %08x",
                   (unsigned)stored, (unsigned)computed);
        return ORCA_ERR_CORRUPT;
    }

    /* header_size is checked only once the CRC passes */
    if (!blob_payload_range(schema, hdr->header_size, blob_size, &payload)) {
        log_printf(LOG_ERROR, TAG, "bad header_size %u", hdr->header_size);
        return ORCA_ERR_FORMAT_MISMATCH;
    }

    *crc = stored;
    return ORCA_OK;
}

orca_err_t blob_assemble_known(const Transport *t,
                               const struct blob_schema *schema,
                               const struct device_identity *identity,
                               uint8_t *buf, size_t cap,
                               const struct assemble_opts *opts,
                               struct assembled_blob *out)
{
    struct blob_range trailer;

    if (!schema || !identity || !buf || !out)
        return ORCA_ERR_OUT_OF_RANGE;

    uint32_t blob_size = identity->blob_size;

    if (identity->max_chunk == 0 ||
        !blob_trailer_range(schema, blob_size, &trailer)) {
        log_printf(LOG_ERROR, TAG, "unusable identity: blob_size %u max_chunk %u",
                   (unsigned)blob_size, (unsigned)identity->max_chunk);
        return ORCA_ERR_PROTOCOL_MISMATCH;
    }

    if (cap < blob_size) {
        log_printf(LOG_ERROR, TAG, "buffer %zu < blob %u", cap, (unsigned)blob_size);
        return ORCA_ERR_OUT_OF_RANGE;
    }

    uint32_t chunk = identity->max_chunk;
    if (opts && opts->max_chunk)
        chunk = min_u32(chunk, opts->max_chunk);

    memset(buf, 0, blob_size);

    orca_err_t err = read_all(t, buf, blob_size, chunk, opts);
    if (err != ORCA_OK)
        return fail(buf, blob_size, err);

    struct blob_header hdr;
    uint32_t crc = 0;

    err = validate(schema, buf, blob_size, &hdr, &crc);
    if (err != ORCA_OK)
        return fail(buf, blob_size, err);

    out->bytes    = buf;
    out->size     = blob_size;
    out->identity = *identity;
    out->header   = hdr;
    out->crc      = crc;

    log_printf(LOG_INFO, TAG, "blob ok: %u bytes, v%u.%u, generation %u",
               (unsigned)blob_size, hdr.version_major, hdr.version_minor,
               (unsigned)hdr.generation);
    return ORCA_OK;
}

orca_err_t blob_assemble(const Transport *t,
                         const struct blob_schema *schema,
                         uint8_t *buf, size_t cap,
                         const struct assemble_opts *opts,
                         struct assembled_blob *out)
{
    struct device_identity id;

    orca_err_t err = transport_get_info(t, &id);
    if (err != ORCA_OK) {
        log_printf(LOG_WARN, TAG, "get_info failed: %s", orca_err_string(err));
        return err;
    }

    return blob_assemble_known(t, schema, &id, buf, cap, opts, out);
}

orca_err_t blob_peek_generation(const Transport *t,
                                const struct blob_schema *schema,
                                uint32_t *out_generation)
{
    uint8_t head[4];
    uint32_t got = 0;

    if (!schema || !out_generation)
        return ORCA_ERR_OUT_OF_RANGE;

    orca_err_t err = transport_read_chunk(t, schema->generation_offset,
                                          sizeof(head), head, &got);
    if (err != ORCA_OK)
        return err;
    if (got != sizeof(head))
        return ORCA_ERR_PROTOCOL_MISMATCH;

    *out_generation = blob_get_u32le(head);
    return ORCA_OK;
}
