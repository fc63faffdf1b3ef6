/*
 * blob_layout.cpp
 *
 * Project: Orca Settings Link
 * Purpose: Settings blob layout arithmetic and field access
 *
 * Notes:
 *  - Shared by the assembler and every transport implementation
 *  - Pure functions over caller-owned buffers
 *
 * Updated: 2026-10-17
 */

#include "blob_layout.h"
#include "checksum.h"

#include <string.h>

static const uint8_t ORCA_MAGIC[ORCA_BLOB_MAGIC_MAX] = {
    'O', 'R', 'C', 'A', ' ', 'C', 'O', 'N',
    'T', 'R', 'O', 'L', 'L', 'E', 'R', '\0'
};

const struct blob_schema orca_settings_schema = {
    .schema_id             = 1,
    .magic                 = ORCA_MAGIC,
    .magic_len             = sizeof(ORCA_MAGIC),
    .version_major         = 1,
    .version_minor         = 5,
    .magic_offset          = 0,
    .version_major_offset  = 16,
    .version_minor_offset  = 17,
    .header_size_offset    = 18,
    .generation_offset     = 20,
    .active_profile_offset = 24,
    .flags_offset          = 25,
    .header_size           = 32,
    .blob_size             = 2048,
};

/* --------------------------------------------------------------------------
 * Range arithmetic
 * -------------------------------------------------------------------------- */

bool blob_range_check(uint32_t offset, uint32_t length, uint32_t blob_size)
{
    if (length == 0)
        return false;
    if (offset >= blob_size)
        return false;

    /* offset < blob_size, so this cannot wrap */
    return length <= blob_size - offset;
}

static uint16_t field_end(uint16_t offset, uint16_t width)
{
    return (uint16_t)(offset + width);
}

static uint16_t max_u16(uint16_t a, uint16_t b)
{
    return a > b ? a : b;
}

uint16_t blob_min_header(const struct blob_schema *schema)
{
    uint16_t end = field_end(schema->magic_offset, schema->magic_len);

    end = max_u16(end, field_end(schema->version_major_offset, 1));
    end = max_u16(end, field_end(schema->version_minor_offset, 1));
    end = max_u16(end, field_end(schema->header_size_offset, 2));
    end = max_u16(end, field_end(schema->generation_offset, 4));
    end = max_u16(end, field_end(schema->active_profile_offset, 1));
    end = max_u16(end, field_end(schema->flags_offset, 1));

    return end;
}

bool blob_trailer_range(const struct blob_schema *schema,
                        uint32_t blob_size,
                        struct blob_range *out)
{
    uint32_t min_size = (uint32_t)blob_min_header(schema) + ORCA_BLOB_TRAILER_SIZE;

    if (blob_size < min_size)
        return false;

    out->begin = blob_size - ORCA_BLOB_TRAILER_SIZE;
    out->end   = blob_size;
    return true;
}

bool blob_payload_range(const struct blob_schema *schema,
                        uint16_t header_size,
                        uint32_t blob_size,
                        struct blob_range *out)
{
    struct blob_range trailer;

    if (!blob_trailer_range(schema, blob_size, &trailer))
        return false;
    if (header_size < blob_min_header(schema))
        return false;
    if (header_size > trailer.begin)
        return false;

    /* Empty payload (header_size == trailer start) is legal */
    out->begin = header_size;
    out->end   = trailer.begin;
    return true;
}

/* --------------------------------------------------------------------------
 * Little-endian access
 * -------------------------------------------------------------------------- */

uint16_t blob_get_u16le(const uint8_t *p)
{
    return (uint16_t)(p[0] | (p[1] << 8));
}

uint32_t blob_get_u32le(const uint8_t *p)
{
    return (uint32_t)p[0]
         | ((uint32_t)p[1] << 8)
         | ((uint32_t)p[2] << 16)
         | ((uint32_t)p[3] << 24);
}

void blob_put_u16le(uint8_t *p, uint16_t v)
{
    p[0] = (uint8_t)(v & 0xFF);
    p[1] = (uint8_t)(v >> 8);
}

void blob_put_u32le(uint8_t *p, uint32_t v)
{
    p[0] = (uint8_t)(v & 0xFF);
    p[1] = (uint8_t)((v >> 8) & 0xFF);
    p[2] = (uint8_t)((v >> 16) & 0xFF);
    p[3] = (uint8_t)(v >> 24);
}

/* --------------------------------------------------------------------------
 * Header inspection
 * -------------------------------------------------------------------------- */

bool blob_magic_ok(const struct blob_schema *schema,
                   const uint8_t *buf, size_t len)
{
    size_t end = (size_t)schema->magic_offset + schema->magic_len;

    if (!buf || len < end)
        return false;

    return memcmp(buf + schema->magic_offset, schema->magic, schema->magic_len) == 0;
}

bool blob_header_parse(const struct blob_schema *schema,
                       const uint8_t *buf, size_t len,
                       struct blob_header *out)
{
    if (!buf || !out || len < blob_min_header(schema))
        return false;

    out->version_major  = buf[schema->version_major_offset];
    out->version_minor  = buf[schema->version_minor_offset];
    out->header_size    = blob_get_u16le(buf + schema->header_size_offset);
    out->generation     = blob_get_u32le(buf + schema->generation_offset);
    out->active_profile = buf[schema->active_profile_offset];
    out->flags          = buf[schema->flags_offset];
    return true;
}

uint32_t blob_stored_crc(const uint8_t *buf, uint32_t blob_size)
{
    return blob_get_u32le(buf + blob_size - ORCA_BLOB_TRAILER_SIZE);
}

uint32_t blob_computed_crc(const uint8_t *buf, uint32_t blob_size)
{
    return crc32_ieee(buf, blob_size - ORCA_BLOB_TRAILER_SIZE);
}

/* --------------------------------------------------------------------------
 * Producers
 * -------------------------------------------------------------------------- */

bool blob_build_default(const struct blob_schema *schema,
                        uint8_t *buf, uint32_t size,
                        uint32_t generation)
{
    struct blob_range payload;

    if (!buf || !blob_payload_range(schema, schema->header_size, size, &payload))
        return false;

    memset(buf, 0, size);

    memcpy(buf + schema->magic_offset, schema->magic, schema->magic_len);
    buf[schema->version_major_offset] = schema->version_major;
    buf[schema->version_minor_offset] = schema->version_minor;
    blob_put_u16le(buf + schema->header_size_offset, schema->header_size);
    blob_put_u32le(buf + schema->generation_offset, generation);
    buf[schema->active_profile_offset] = 0;
    buf[schema->flags_offset] = 0;

    blob_seal(buf, size);
    return true;
}

void blob_seal(uint8_t *buf, uint32_t size)
{
    blob_put_u32le(buf + size - ORCA_BLOB_TRAILER_SIZE, blob_computed_crc(buf, size));
}

void blob_set_generation(const struct blob_schema *schema,
                         uint8_t *buf, uint32_t generation)
{
    blob_put_u32le(buf + schema->generation_offset, generation);
}

void blob_set_active_profile(const struct blob_schema *schema,
                             uint8_t *buf, uint8_t profile)
{
    buf[schema->active_profile_offset] = profile;
}
