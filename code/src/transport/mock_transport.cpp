/*
 * mock_transport.cpp
 *
 * Project: Orca Settings Link
 * Purpose: In-memory reference device implementation
 *
 * Updated: 2026-10-17
 */

#include "transport/mock_transport.h"
#include "log.h"

#include <string.h>

#define TAG "MOCK"

bool mock_transport_init(struct mock_transport *m,
                         const struct blob_schema *schema,
                         uint32_t max_chunk)
{
    if (!m || !schema || schema->blob_size > ORCA_BLOB_MAX_SIZE)
        return false;

    memset(m, 0, sizeof(*m));

    m->schema    = schema;
    m->blob_size = schema->blob_size;
    m->max_chunk = max_chunk ? max_chunk : MOCK_DEFAULT_MAX_CHUNK;
    m->fail_err  = ORCA_ERR_DISCONNECTED;

    return blob_build_default(schema, m->blob, m->blob_size, 1);
}

uint32_t mock_transport_slice(const struct mock_transport *m,
                              uint32_t offset, uint32_t length,
                              uint8_t *out)
{
    if (offset >= m->blob_size)
        return 0;

    uint32_t avail = m->blob_size - offset;
    uint32_t n = length < avail ? length : avail;

    memcpy(out, m->blob + offset, n);
    return n;
}

uint32_t mock_transport_generation(const struct mock_transport *m)
{
    return blob_get_u32le(m->blob + m->schema->generation_offset);
}

uint32_t mock_transport_commit(struct mock_transport *m)
{
    uint32_t gen = mock_transport_generation(m) + 1;

    blob_set_generation(m->schema, m->blob, gen);
    blob_seal(m->blob, m->blob_size);

    log_printf(LOG_DEBUG, TAG, "commit -> generation %u", (unsigned)gen);
    return gen;
}

uint32_t mock_transport_set_active_profile(struct mock_transport *m, uint8_t profile)
{
    blob_set_active_profile(m->schema, m->blob, profile);
    return mock_transport_commit(m);
}

/* --------------------------------------------------------------------------
 * Capability operations
 * -------------------------------------------------------------------------- */

static orca_err_t mock_get_info(void *ctx, struct device_identity *out)
{
    struct mock_transport *m = (struct mock_transport *)ctx;

    if (m->closed)
        return ORCA_ERR_DISCONNECTED;

    m->info_count++;

    out->schema_id      = m->schema->schema_id;
    out->settings_major = m->schema->version_major;
    out->settings_minor = m->schema->version_minor;
    out->blob_size      = m->blob_size;
    out->max_chunk      = m->max_chunk;
    return ORCA_OK;
}

static orca_err_t mock_read_chunk(void *ctx,
                                  uint32_t offset,
                                  uint32_t length,
                                  uint8_t *out,
                                  uint32_t *out_len)
{
    struct mock_transport *m = (struct mock_transport *)ctx;

    if (m->closed)
        return ORCA_ERR_DISCONNECTED;

    if (!blob_range_check(offset, length, m->blob_size)) {
        log_printf(LOG_DEBUG, TAG, "read @%u len %u out of range",
                   (unsigned)offset, (unsigned)length);
        return ORCA_ERR_OUT_OF_RANGE;
    }

    m->read_count++;
    m->last_offset = offset;
    if (length > m->largest_read)
        m->largest_read = length;

    if (m->fail_on_read && m->read_count == m->fail_on_read)
        return m->fail_err;

    *out_len = mock_transport_slice(m, offset, length, out);

    if (m->close_after_reads && m->read_count >= m->close_after_reads)
        m->closed = true;

    return ORCA_OK;
}

static void mock_close(void *ctx)
{
    struct mock_transport *m = (struct mock_transport *)ctx;

    m->closed = true;
}

Transport mock_transport_bind(struct mock_transport *m)
{
    Transport t = {
        .name       = "mock",
        .ctx        = m,
        .get_info   = mock_get_info,
        .read_chunk = mock_read_chunk,
        .close      = mock_close,
    };
    return t;
}
