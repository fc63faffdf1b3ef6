/*
 * transport.cpp
 *
 * Project: Orca Settings Link
 * Purpose: Transport dispatch and error names
 *
 * Updated: 2026-10-17
 */

#include "transport/transport.h"

#include <stddef.h>

const char *orca_err_string(orca_err_t err)
{
    switch (err) {
    case ORCA_OK:                    return "OK";
    case ORCA_ERR_DISCONNECTED:      return "DISCONNECTED";
    case ORCA_ERR_TIMEOUT:           return "TIMEOUT";
    case ORCA_ERR_OUT_OF_RANGE:      return "OUT_OF_RANGE";
    case ORCA_ERR_PROTOCOL_MISMATCH: return "PROTOCOL_MISMATCH";
    case ORCA_ERR_FORMAT_MISMATCH:   return "FORMAT_MISMATCH";
    case ORCA_ERR_CORRUPT:           return "CORRUPT";
    default:                         return "UNKNOWN";
    }
}

orca_err_t transport_get_info(const Transport *t, struct device_identity *out)
{
    if (!t || !t->get_info)
        return ORCA_ERR_DISCONNECTED;
    if (!out)
        return ORCA_ERR_OUT_OF_RANGE;

    return t->get_info(t->ctx, out);
}

orca_err_t transport_read_chunk(const Transport *t,
                                uint32_t offset,
                                uint32_t length,
                                uint8_t *out,
                                uint32_t *out_len)
{
    if (!t || !t->read_chunk)
        return ORCA_ERR_DISCONNECTED;
    if (!out || !out_len)
        return ORCA_ERR_OUT_OF_RANGE;

    *out_len = 0;
    return t->read_chunk(t->ctx, offset, length, out, out_len);
}

void transport_close(const Transport *t)
{
    if (!t || !t->close)
        return;

    t->close(t->ctx);
}
