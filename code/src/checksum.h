/*
 * checksum.h
 *
 * Project: Orca Settings Link
 * Purpose: Integrity checksums shared by blob and link code
 *
 * Notes:
 *  - crc32_ieee: settings blob trailer (poly 0xEDB88320)
 *  - crc32c:     link frame header (poly 0x82F63B78)
 *  - Both reflected, init 0xFFFFFFFF, final xor 0xFFFFFFFF
 *  - *_update() takes and returns the raw register so input
 *    may be fed in pieces; start from CRC_INIT, finish with *_final()
 *
 * Updated: 2026-10-17
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#define CRC_INIT 0xFFFFFFFFu

uint32_t crc32_ieee_update(uint32_t crc, const void *data, size_t len);
uint32_t crc32c_update(uint32_t crc, const void *data, size_t len);

static inline uint32_t crc_final(uint32_t crc)
{
    return crc ^ 0xFFFFFFFFu;
}

/* One-shot forms */
uint32_t crc32_ieee(const void *data, size_t len);
uint32_t crc32c(const void *data, size_t len);
