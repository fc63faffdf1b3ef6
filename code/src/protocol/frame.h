/*
 * frame.h
 *
 * Project: Orca Settings Link
 * Purpose: Serial link framing and command payloads
 *
 * Frame (little-endian):
 *
 *   0   magic     u32  0x4143524F ("ORCA")
 *   4   version   u8   FRAME_PROTO_VERSION
 *   5   msg_type  u8   request / response / error
 *   6   len       u16  payload length
 *   8   seq       u32  echoed by the device
 *   12  crc       u32  CRC-32C over header (crc zeroed) + payload
 *   16  payload[len]
 *
 * Payloads (byte 0 is always the command):
 *
 *   GET_INFO  req   [cmd]
 *             resp  [cmd][major][minor][-][schema u32][blob_size u32][max_chunk u32]
 *   READ_BLOB req   [cmd][-][-][-][offset u32][length u32]
 *             resp  [cmd][-][-][-][offset u32][length u32][data...]
 *   ERROR           [cmd][device_err]
 *
 * Updated: 2026-10-17
 */

#pragma once

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>

#include "transport/transport.h"

#define FRAME_MAGIC          0x4143524Fu
#define FRAME_PROTO_VERSION  1u
#define FRAME_HEADER_SIZE    16u
#define FRAME_MAX_PAYLOAD    1024u
#define FRAME_MAX_SIZE       (FRAME_HEADER_SIZE + FRAME_MAX_PAYLOAD)

/* Largest data section a READ_BLOB response can carry */
#define FRAME_READ_DATA_OFFSET 12u
#define FRAME_MAX_READ_DATA    (FRAME_MAX_PAYLOAD - FRAME_READ_DATA_OFFSET)

/* Defaults applied when GET_INFO reports zero */
#define FRAME_DEFAULT_MAX_CHUNK 256u

enum frame_msg_type : uint8_t {
    FRAME_MSG_REQUEST  = 1,
    FRAME_MSG_RESPONSE = 2,
    FRAME_MSG_ERROR    = 3
};

enum frame_cmd : uint8_t {
    FRAME_CMD_GET_INFO  = 0x01,
    FRAME_CMD_READ_BLOB = 0x02
};

/* Device-reported error codes (ERROR payload byte 1) */
enum frame_dev_err : uint8_t {
    FRAME_DEV_ERR_UNKNOWN_CMD  = 1,
    FRAME_DEV_ERR_BAD_LENGTH   = 2,
    FRAME_DEV_ERR_OUT_OF_RANGE = 3,
    FRAME_DEV_ERR_BUSY         = 4,
    FRAME_DEV_ERR_INTERNAL     = 0x7F
};

typedef enum {
    FRAME_OK = 0,
    FRAME_NEED_MORE,
    FRAME_BAD_MAGIC,
    FRAME_BAD_VERSION,
    FRAME_BAD_LENGTH,
    FRAME_BAD_CRC
} frame_status_t;

/* Decoded frame; payload points into the decode buffer */
struct frame_view {
    uint8_t  msg_type;
    uint32_t seq;
    const uint8_t *payload;
    uint16_t len;
};

/* --------------------------------------------------------------------------
 * Framing
 * -------------------------------------------------------------------------- */

/*
 * Encode one frame into out.
 *
 * Returns:
 *  - total bytes written
 *  - 0 if len exceeds FRAME_MAX_PAYLOAD or cap is too small
 */
size_t frame_encode(uint8_t msg_type, uint32_t seq,
                    const uint8_t *payload, uint16_t len,
                    uint8_t *out, size_t cap);

/*
 * Try to decode the frame at the start of buf.
 *
 * Returns:
 *  - FRAME_OK         *out set, *consumed = frame length
 *  - FRAME_NEED_MORE  buffer holds a partial frame
 *  - anything else    stream is unusable; caller drops the link state
 */
frame_status_t frame_decode(const uint8_t *buf, size_t len,
                            struct frame_view *out, size_t *consumed);

const char *frame_status_string(frame_status_t st);

/* --------------------------------------------------------------------------
 * Requests (host side)
 * -------------------------------------------------------------------------- */

size_t frame_encode_get_info(uint32_t seq, uint8_t *out, size_t cap);

size_t frame_encode_read_blob(uint32_t seq, uint32_t offset, uint32_t length,
                              uint8_t *out, size_t cap);

/* --------------------------------------------------------------------------
 * Responses (host side)
 *
 * Each takes the frame as decoded and maps device errors onto orca_err_t:
 * OUT_OF_RANGE stays OUT_OF_RANGE, everything else is PROTOCOL_MISMATCH.
 * -------------------------------------------------------------------------- */

orca_err_t frame_parse_info(const struct frame_view *f,
                            uint32_t default_blob_size,
                            struct device_identity *out);

/* On success *data points at exactly length bytes inside the frame */
orca_err_t frame_parse_read_blob(const struct frame_view *f,
                                 uint32_t offset, uint32_t length,
                                 const uint8_t **data);

orca_err_t frame_map_device_error(const struct frame_view *f);

/* --------------------------------------------------------------------------
 * Responses (device side, used by device_emu)
 * -------------------------------------------------------------------------- */

size_t frame_encode_info_response(uint32_t seq, const struct device_identity *id,
                                  uint8_t *out, size_t cap);

size_t frame_encode_read_response(uint32_t seq, uint32_t offset,
                                  const uint8_t *data, uint32_t length,
                                  uint8_t *out, size_t cap);

size_t frame_encode_error(uint32_t seq, uint8_t cmd, uint8_t dev_err,
                          uint8_t *out, size_t cap);
