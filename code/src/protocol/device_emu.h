/*
 * device_emu.h
 *
 * Project: Orca Settings Link
 * Purpose: Device side of the serial link, served from a reference device
 *
 * Notes:
 *  - Stateless per request; all state lives in the mock_transport
 *  - Lets the serial transport be exercised end to end on a pty
 *
 * Updated: 2026-10-17
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "protocol/frame.h"
#include "transport/mock_transport.h"

/*
 * Answer one decoded request frame.
 *
 * Returns:
 *  - bytes of response written to out (0 if the request deserves no
 *    answer, e.g. it is not a REQUEST frame)
 */
size_t device_emu_handle(struct mock_transport *dev,
                         const struct frame_view *req,
                         uint8_t *out, size_t cap);
