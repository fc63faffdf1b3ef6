/*
 * checksum.cpp
 *
 * Project: Orca Settings Link
 * Purpose: Table-driven CRC-32 / CRC-32C
 *
 * Notes:
 *  - Tables built once, on first use, as function-local statics
 *  - Used by host and reference device alike
 *
 * Updated: 2026-10-17
 */

#include "checksum.h"

#define CRC32_POLY_REFLECTED   0xEDB88320u
#define CRC32C_POLY_REFLECTED  0x82F63B78u

struct crc_table {
    uint32_t v[256];

    explicit crc_table(uint32_t poly)
    {
        for (uint32_t i = 0; i < 256; i++) {
            uint32_t crc = i;
            for (int j = 0; j < 8; j++)
                crc = (crc >> 1) ^ ((crc & 1u) ? poly : 0u);
            v[i] = crc;
        }
    }
};

static uint32_t crc_run(const uint32_t *table, uint32_t crc,
                        const void *data, size_t len)
{
    const uint8_t *p = (const uint8_t *)data;

    while (len--)
        crc = (crc >> 8) ^ table[(crc ^ *p++) & 0xFFu];

    return crc;
}

uint32_t crc32_ieee_update(uint32_t crc, const void *data, size_t len)
{
    static const crc_table table(CRC32_POLY_REFLECTED);
    return crc_run(table.v, crc, data, len);
}

uint32_t crc32c_update(uint32_t crc, const void *data, size_t len)
{
    static const crc_table table(CRC32C_POLY_REFLECTED);
    return crc_run(table.v, crc, data, len);
}

uint32_t crc32_ieee(const void *data, size_t len)
{
    return crc_final(crc32_ieee_update(CRC_INIT, data, len));
}

uint32_t crc32c(const void *data, size_t len)
{
    return crc_final(crc32c_update(CRC_INIT, data, len));
}
