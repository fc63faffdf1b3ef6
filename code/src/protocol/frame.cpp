/*
 * frame.cpp
 *
 * Project: Orca Settings Link
 * Purpose: Serial link framing and command payloads
 *
 * Updated: 2026-10-17
 */

#include "protocol/frame.h"
#include "blob_layout.h"
#include "checksum.h"
#include "log.h"

#include <string.h>

#define TAG "FRAME"

/* --------------------------------------------------------------------------
 * Framing
 * -------------------------------------------------------------------------- */

static uint32_t frame_crc(const uint8_t *hdr, const uint8_t *payload, uint16_t len)
{
    uint8_t tmp[FRAME_HEADER_SIZE];

    memcpy(tmp, hdr, FRAME_HEADER_SIZE);
    blob_put_u32le(tmp + 12, 0);

    uint32_t crc = crc32c_update(CRC_INIT, tmp, sizeof(tmp));
    crc = crc32c_update(crc, payload, len);
    return crc_final(crc);
}

size_t frame_encode(uint8_t msg_type, uint32_t seq,
                    const uint8_t *payload, uint16_t len,
                    uint8_t *out, size_t cap)
{
    size_t total = FRAME_HEADER_SIZE + (size_t)len;

    if (len > FRAME_MAX_PAYLOAD || cap < total)
        return 0;
    if (len && !payload)
        return 0;

    blob_put_u32le(out + 0, FRAME_MAGIC);
    out[4] = FRAME_PROTO_VERSION;
    out[5] = msg_type;
    blob_put_u16le(out + 6, len);
    blob_put_u32le(out + 8, seq);
    blob_put_u32le(out + 12, 0);

    if (len)
        memcpy(out + FRAME_HEADER_SIZE, payload, len);

    blob_put_u32le(out + 12, frame_crc(out, out + FRAME_HEADER_SIZE, len));
    return total;
}

frame_status_t frame_decode(const uint8_t *buf, size_t len,
                            struct frame_view *out, size_t *consumed)
{
    if (len < FRAME_HEADER_SIZE)
        return FRAME_NEED_MORE;

    if (blob_get_u32le(buf) != FRAME_MAGIC)
        return FRAME_BAD_MAGIC;
    if (buf[4] != FRAME_PROTO_VERSION)
        return FRAME_BAD_VERSION;

    uint16_t plen = blob_get_u16le(buf + 6);
    if (plen > FRAME_MAX_PAYLOAD)
        return FRAME_BAD_LENGTH;

    size_t total = FRAME_HEADER_SIZE + (size_t)plen;
    if (len < total)
        return FRAME_NEED_MORE;

    const uint8_t *payload = buf + FRAME_HEADER_SIZE;
    if (blob_get_u32le(buf + 12) != frame_crc(buf, payload, plen))
        return FRAME_BAD_CRC;

    out->msg_type = buf[5];
    out->seq      = blob_get_u32le(buf + 8);
    out->payload  = payload;
    out->len      = plen;
    *consumed     = total;
    return FRAME_OK;
}

const char *frame_status_string(frame_status_t st)
{
    switch (st) {
    case FRAME_OK:          return "OK";
    case FRAME_NEED_MORE:   return "NEED_MORE";
    case FRAME_BAD_MAGIC:   return "BAD_MAGIC";
    case FRAME_BAD_VERSION: return "BAD_VERSION";
    case FRAME_BAD_LENGTH:  return "BAD_LENGTH";
    case FRAME_BAD_CRC:     return "BAD_CRC";
    default:                return "UNKNOWN";
    }
}

/* --------------------------------------------------------------------------
 * Requests
 * -------------------------------------------------------------------------- */

size_t frame_encode_get_info(uint32_t seq, uint8_t *out, size_t cap)
{
    uint8_t payload[1] = { FRAME_CMD_GET_INFO };

    return frame_encode(FRAME_MSG_REQUEST, seq, payload, sizeof(payload), out, cap);
}

size_t frame_encode_read_blob(uint32_t seq, uint32_t offset, uint32_t length,
                              uint8_t *out, size_t cap)
{
    uint8_t payload[12] = { FRAME_CMD_READ_BLOB };

    blob_put_u32le(payload + 4, offset);
    blob_put_u32le(payload + 8, length);
    return frame_encode(FRAME_MSG_REQUEST, seq, payload, sizeof(payload), out, cap);
}

/* --------------------------------------------------------------------------
 * Responses (host side)
 * -------------------------------------------------------------------------- */

orca_err_t frame_map_device_error(const struct frame_view *f)
{
    uint8_t cmd = f->len > 0 ? f->payload[0] : 0;
    uint8_t err = f->len > 1 ? f->payload[1] : (uint8_t)FRAME_DEV_ERR_INTERNAL;

    log_printf(LOG_WARN, TAG, "device error %u for cmd 0x%02x", err, cmd);

    if (err == FRAME_DEV_ERR_OUT_OF_RANGE)
        return ORCA_ERR_OUT_OF_RANGE;

    return ORCA_ERR_PROTOCOL_MISMATCH;
}

static orca_err_t check_response(const struct frame_view *f, uint8_t cmd, uint16_t min_len)
{
    if (f->msg_type == FRAME_MSG_ERROR)
        return frame_map_device_error(f);

    if (f->msg_type != FRAME_MSG_RESPONSE) {
        log_printf(LOG_WARN, TAG, "unexpected msg_type %u", f->msg_type);
        return ORCA_ERR_PROTOCOL_MISMATCH;
    }

    if (f->len < min_len || f->payload[0] != cmd) {
        log_printf(LOG_WARN, TAG, "bad response for cmd 0x%02x (len %u)", cmd, f->len);
        return ORCA_ERR_PROTOCOL_MISMATCH;
    }

    return ORCA_OK;
}

orca_err_t frame_parse_info(const struct frame_view *f,
                            uint32_t default_blob_size,
                            struct device_identity *out)
{
    orca_err_t err = check_response(f, FRAME_CMD_GET_INFO, 16);
    if (err != ORCA_OK)
        return err;

    const uint8_t *p = f->payload;

    out->settings_major = p[1];
    out->settings_minor = p[2];
    out->schema_id      = blob_get_u32le(p + 4);
    out->blob_size      = blob_get_u32le(p + 8);
    out->max_chunk      = blob_get_u32le(p + 12);

    if (out->blob_size == 0)
        out->blob_size = default_blob_size;
    if (out->max_chunk == 0)
        out->max_chunk = FRAME_DEFAULT_MAX_CHUNK;

    /* A device may advertise more than one frame can carry */
    if (out->max_chunk > FRAME_MAX_READ_DATA)
        out->max_chunk = FRAME_MAX_READ_DATA;

    return ORCA_OK;
}

orca_err_t frame_parse_read_blob(const struct frame_view *f,
                                 uint32_t offset, uint32_t length,
                                 const uint8_t **data)
{
    orca_err_t err = check_response(f, FRAME_CMD_READ_BLOB, FRAME_READ_DATA_OFFSET);
    if (err != ORCA_OK)
        return err;

    uint32_t got_off = blob_get_u32le(f->payload + 4);
    uint32_t got_len = blob_get_u32le(f->payload + 8);

    if (got_off != offset || got_len != length) {
        log_printf(LOG_WARN, TAG, "READ_BLOB mismatch: offset %u len %u",
                   (unsigned)got_off, (unsigned)got_len);
        return ORCA_ERR_PROTOCOL_MISMATCH;
    }

    if ((uint32_t)f->len - FRAME_READ_DATA_OFFSET != got_len) {
        log_printf(LOG_WARN, TAG, "READ_BLOB short payload");
        return ORCA_ERR_PROTOCOL_MISMATCH;
    }

    *data = f->payload + FRAME_READ_DATA_OFFSET;
    return ORCA_OK;
}

/* --------------------------------------------------------------------------
 * Responses (device side)
 * -------------------------------------------------------------------------- */

size_t frame_encode_info_response(uint32_t seq, const struct device_identity *id,
                                  uint8_t *out, size_t cap)
{
    uint8_t payload[16] = { FRAME_CMD_GET_INFO };

    payload[1] = id->settings_major;
    payload[2] = id->settings_minor;
    blob_put_u32le(payload + 4, id->schema_id);
    blob_put_u32le(payload + 8, id->blob_size);
    blob_put_u32le(payload + 12, id->max_chunk);
    return frame_encode(FRAME_MSG_RESPONSE, seq, payload, sizeof(payload), out, cap);
}

size_t frame_encode_read_response(uint32_t seq, uint32_t offset,
                                  const uint8_t *data, uint32_t length,
                                  uint8_t *out, size_t cap)
{
    uint8_t payload[FRAME_MAX_PAYLOAD];

    if (length > FRAME_MAX_READ_DATA)
        return 0;

    memset(payload, 0, FRAME_READ_DATA_OFFSET);
    payload[0] = FRAME_CMD_READ_BLOB;
    blob_put_u32le(payload + 4, offset);
    blob_put_u32le(payload + 8, length);
    memcpy(payload + FRAME_READ_DATA_OFFSET, data, length);

    return frame_encode(FRAME_MSG_RESPONSE, seq, payload,
                        (uint16_t)(FRAME_READ_DATA_OFFSET + length), out, cap);
}

size_t frame_encode_error(uint32_t seq, uint8_t cmd, uint8_t dev_err,
                          uint8_t *out, size_t cap)
{
    uint8_t payload[2] = { cmd, dev_err };

    return frame_encode(FRAME_MSG_ERROR, seq, payload, sizeof(payload), out, cap);
}
