/*
 * blob_layout.h
 *
 * Project: Orca Settings Link
 * Purpose: Settings blob binary layout (header, payload, trailer)
 *
 * Layout (current schema, little-endian):
 *
 *   0   magic[16]        "ORCA CONTROLLER\0"
 *   16  version_major    must match consumer
 *   17  version_minor    tolerated
 *   18  header_size u16  consumer skips unknown header bytes
 *   20  generation  u32  bumped on every device commit
 *   24  active_profile
 *   25  flags
 *   26  reserved[6]
 *   ..  payload          opaque
 *   N-4 crc32 u32        CRC-32 (IEEE) over [0, N-4)
 *
 * Notes:
 *  - All offsets live in one blob_schema value, never as loose constants
 *  - Offset math is unsigned and overflow-checked
 *  - No heap; callers own every buffer
 *
 * Updated: 2026-10-17
 */

#pragma once

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>

/* Largest blob any caller-side static buffer must hold */
#define ORCA_BLOB_MAX_SIZE      16384u

#define ORCA_BLOB_TRAILER_SIZE  4u
#define ORCA_BLOB_MAGIC_MAX     16u

/* --------------------------------------------------------------------------
 * Schema description
 * -------------------------------------------------------------------------- */

struct blob_schema {
    uint32_t schema_id;

    const uint8_t *magic;
    uint8_t  magic_len;

    uint8_t  version_major;
    uint8_t  version_minor;

    /* Field offsets */
    uint16_t magic_offset;
    uint16_t version_major_offset;
    uint16_t version_minor_offset;
    uint16_t header_size_offset;
    uint16_t generation_offset;
    uint16_t active_profile_offset;
    uint16_t flags_offset;

    uint16_t header_size;   /* length written by current producers */
    uint32_t blob_size;     /* default total size for this schema */
};

/* Current settings format (v1.5) */
extern const struct blob_schema orca_settings_schema;

/* Parsed header fields */
struct blob_header {
    uint8_t  version_major;
    uint8_t  version_minor;
    uint16_t header_size;
    uint32_t generation;
    uint8_t  active_profile;
    uint8_t  flags;
};

/* Half-open byte range [begin, end) */
struct blob_range {
    uint32_t begin;
    uint32_t end;
};

/* --------------------------------------------------------------------------
 * Range arithmetic
 * -------------------------------------------------------------------------- */

/*
 * True if [offset, offset + length) lies inside [0, blob_size).
 * Zero-length requests are rejected.
 */
bool blob_range_check(uint32_t offset, uint32_t length, uint32_t blob_size);

/*
 * End of the last header field this consumer understands.
 * A blob advertising a smaller header_size is unreadable.
 */
uint16_t blob_min_header(const struct blob_schema *schema);

/*
 * Payload range [header_size, blob_size - 4).
 *
 * Returns:
 *  - false if header_size is below blob_min_header() or past the trailer
 */
bool blob_payload_range(const struct blob_schema *schema,
                        uint16_t header_size,
                        uint32_t blob_size,
                        struct blob_range *out);

/*
 * Trailer range [blob_size - 4, blob_size).
 *
 * Returns:
 *  - false if blob_size cannot hold the known header plus the trailer
 */
bool blob_trailer_range(const struct blob_schema *schema,
                        uint32_t blob_size,
                        struct blob_range *out);

/* --------------------------------------------------------------------------
 * Little-endian access
 * -------------------------------------------------------------------------- */

uint16_t blob_get_u16le(const uint8_t *p);
uint32_t blob_get_u32le(const uint8_t *p);
void     blob_put_u16le(uint8_t *p, uint16_t v);
void     blob_put_u32le(uint8_t *p, uint32_t v);

/* --------------------------------------------------------------------------
 * Header inspection
 * -------------------------------------------------------------------------- */

/* Exact magic match; len is the number of valid bytes in buf */
bool blob_magic_ok(const struct blob_schema *schema,
                   const uint8_t *buf, size_t len);

/*
 * Decode the fixed header fields.
 * Does not judge them: version and header_size policy belongs to the caller.
 *
 * Returns:
 *  - false if buf is too short to contain every known field
 */
bool blob_header_parse(const struct blob_schema *schema,
                       const uint8_t *buf, size_t len,
                       struct blob_header *out);

/* Trailer value stored in a complete blob */
uint32_t blob_stored_crc(const uint8_t *buf, uint32_t blob_size);

/* CRC-32 over everything before the trailer */
uint32_t blob_computed_crc(const uint8_t *buf, uint32_t blob_size);

/* --------------------------------------------------------------------------
 * Producers (reference device, tests)
 * -------------------------------------------------------------------------- */

/*
 * Write a fresh blob: magic, current versions, true header size,
 * the given generation, profile 0, flags 0, zero payload, sealed trailer.
 *
 * Returns:
 *  - false if size cannot hold header + trailer
 */
bool blob_build_default(const struct blob_schema *schema,
                        uint8_t *buf, uint32_t size,
                        uint32_t generation);

/* Recompute and store the trailer */
void blob_seal(uint8_t *buf, uint32_t size);

void blob_set_generation(const struct blob_schema *schema,
                         uint8_t *buf, uint32_t generation);

void blob_set_active_profile(const struct blob_schema *schema,
                             uint8_t *buf, uint8_t profile);
