/*
 * device_emu.cpp
 *
 * Project: Orca Settings Link
 * Purpose: Device side of the serial link
 *
 * Updated: 2026-10-17
 */

#include "protocol/device_emu.h"
#include "blob_layout.h"
#include "log.h"

#define TAG "EMU"

static size_t handle_get_info(struct mock_transport *dev, uint32_t seq,
                              uint8_t *out, size_t cap)
{
    struct device_identity id;
    Transport t = mock_transport_bind(dev);

    if (transport_get_info(&t, &id) != ORCA_OK)
        return frame_encode_error(seq, FRAME_CMD_GET_INFO, FRAME_DEV_ERR_BUSY, out, cap);

    return frame_encode_info_response(seq, &id, out, cap);
}

static size_t handle_read_blob(struct mock_transport *dev, const struct frame_view *req,
                               uint8_t *out, size_t cap)
{
    uint8_t data[FRAME_MAX_READ_DATA];
    uint32_t got = 0;

    if (req->len < 12)
        return frame_encode_error(req->seq, FRAME_CMD_READ_BLOB,
                                  FRAME_DEV_ERR_BAD_LENGTH, out, cap);

    uint32_t offset = blob_get_u32le(req->payload + 4);
    uint32_t length = blob_get_u32le(req->payload + 8);

    if (length > FRAME_MAX_READ_DATA || length > dev->max_chunk)
        return frame_encode_error(req->seq, FRAME_CMD_READ_BLOB,
                                  FRAME_DEV_ERR_BAD_LENGTH, out, cap);

    Transport t = mock_transport_bind(dev);
    orca_err_t err = transport_read_chunk(&t, offset, length, data, &got);

    switch (err) {
    case ORCA_OK:
        return frame_encode_read_response(req->seq, offset, data, got, out, cap);
    case ORCA_ERR_OUT_OF_RANGE:
        return frame_encode_error(req->seq, FRAME_CMD_READ_BLOB,
                                  FRAME_DEV_ERR_OUT_OF_RANGE, out, cap);
    default:
        return frame_encode_error(req->seq, FRAME_CMD_READ_BLOB,
                                  FRAME_DEV_ERR_INTERNAL, out, cap);
    }
}

size_t device_emu_handle(struct mock_transport *dev,
                         const struct frame_view *req,
                         uint8_t *out, size_t cap)
{
    if (req->msg_type != FRAME_MSG_REQUEST)
        return 0;

    if (req->len == 0)
        return frame_encode_error(req->seq, 0, FRAME_DEV_ERR_BAD_LENGTH, out, cap);

    uint8_t cmd = req->payload[0];

    log_printf(LOG_DEBUG, TAG, "request seq %u cmd 0x%02x", (unsigned)req->seq, cmd);

    switch (cmd) {
    case FRAME_CMD_GET_INFO:
        return handle_get_info(dev, req->seq, out, cap);
    case FRAME_CMD_READ_BLOB:
        return handle_read_blob(dev, req, out, cap);
    default:
        return frame_encode_error(req->seq, cmd, FRAME_DEV_ERR_UNKNOWN_CMD, out, cap);
    }
}
