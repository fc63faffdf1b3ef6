/*
 * test_blob_layout.cpp
 *
 * Project: Orca Settings Link
 * Purpose: Layout arithmetic, field access, default blob construction
 */

#include "test_utils.h"
#include "blob_layout.h"
#include "checksum.h"

#include <string.h>

static const struct blob_schema *S = &orca_settings_schema;
static uint8_t g_buf[ORCA_BLOB_MAX_SIZE];

static void
test_schema_constants()
{
    ASSERT_PRINT(S->magic_len == 16, "magic length %u\n", S->magic_len);
    ASSERT_PRINT(memcmp(S->magic, "ORCA CONTROLLER", 16) == 0, "magic text\n");
    ASSERT_PRINT(S->header_size == 32, "header size %u\n", S->header_size);
    ASSERT_PRINT(S->blob_size == 2048, "blob size %u\n", (unsigned)S->blob_size);
    ASSERT_PRINT(blob_min_header(S) == 26, "min header %u\n", blob_min_header(S));
}

static void
test_range_check()
{
    ASSERT_PRINT(blob_range_check(0, 2048, 2048), "whole blob\n");
    ASSERT_PRINT(blob_range_check(2047, 1, 2048), "last byte\n");
    ASSERT_PRINT(!blob_range_check(2047, 2, 2048), "one past end\n");
    ASSERT_PRINT(!blob_range_check(2048, 1, 2048), "offset at end\n");
    ASSERT_PRINT(!blob_range_check(0, 0, 2048), "zero length\n");

    /* offset + length wraps in 32 bits */
    ASSERT_PRINT(!blob_range_check(16, 0xFFFFFFF8u, 2048), "wrapping length\n");
    ASSERT_PRINT(!blob_range_check(0xFFFFFFFFu, 1, 2048), "huge offset\n");
}

static void
test_payload_and_trailer_ranges()
{
    struct blob_range r;

    ASSERT_PRINT(blob_trailer_range(S, 2048, &r), "trailer range\n");
    ASSERT_PRINT(r.begin == 2044 && r.end == 2048, "trailer [%u,%u)\n",
                 (unsigned)r.begin, (unsigned)r.end);

    ASSERT_PRINT(blob_payload_range(S, 32, 2048, &r), "payload range\n");
    ASSERT_PRINT(r.begin == 32 && r.end == 2044, "payload [%u,%u)\n",
                 (unsigned)r.begin, (unsigned)r.end);

    /* Grown header: consumer just starts the payload later */
    ASSERT_PRINT(blob_payload_range(S, 48, 2048, &r) && r.begin == 48, "grown header\n");

    /* Header filling everything up to the trailer leaves an empty payload */
    ASSERT_PRINT(blob_payload_range(S, 2044, 2048, &r) && r.begin == r.end, "empty payload\n");

    ASSERT_PRINT(!blob_payload_range(S, 2045, 2048, &r), "header overlapping trailer\n");
    ASSERT_PRINT(!blob_payload_range(S, 20, 2048, &r), "header shorter than known fields\n");
    ASSERT_PRINT(!blob_trailer_range(S, 29, &r), "blob too small for header + trailer\n");
    ASSERT_PRINT(blob_trailer_range(S, 30, &r), "smallest legal blob\n");
}

static void
test_little_endian()
{
    uint8_t b[4];

    blob_put_u16le(b, 0x1234);
    ASSERT_PRINT(b[0] == 0x34 && b[1] == 0x12, "u16 byte order\n");
    ASSERT_PRINT(blob_get_u16le(b) == 0x1234, "u16 read back\n");

    blob_put_u32le(b, 0xA1B2C3D4u);
    ASSERT_PRINT(b[0] == 0xD4 && b[1] == 0xC3 && b[2] == 0xB2 && b[3] == 0xA1, "u32 byte order\n");
    ASSERT_PRINT(blob_get_u32le(b) == 0xA1B2C3D4u, "u32 read back\n");
}

static void
test_build_default()
{
    struct blob_header h;

    ASSERT_PRINT(blob_build_default(S, g_buf, S->blob_size, 1), "build\n");
    ASSERT_PRINT(blob_magic_ok(S, g_buf, S->blob_size), "magic\n");
    ASSERT_PRINT(blob_header_parse(S, g_buf, S->blob_size, &h), "parse\n");

    ASSERT_PRINT(h.version_major == 1 && h.version_minor == 5, "version %u.%u\n",
                 h.version_major, h.version_minor);
    ASSERT_PRINT(h.header_size == 32, "header_size %u\n", h.header_size);
    ASSERT_PRINT(h.generation == 1, "generation %u\n", (unsigned)h.generation);
    ASSERT_PRINT(h.active_profile == 0 && h.flags == 0, "profile/flags\n");

    /* Field offsets on the wire */
    ASSERT_PRINT(g_buf[16] == 1 && g_buf[17] == 5, "version bytes\n");
    ASSERT_PRINT(g_buf[18] == 32 && g_buf[19] == 0, "header_size bytes\n");
    ASSERT_PRINT(g_buf[20] == 1 && g_buf[21] == 0 && g_buf[22] == 0 && g_buf[23] == 0,
                 "generation bytes\n");

    uint32_t stored = blob_stored_crc(g_buf, S->blob_size);
    ASSERT_PRINT(stored == crc32_ieee(g_buf, S->blob_size - 4), "trailer is crc32 of body\n");
    ASSERT_PRINT(stored != 0, "trailer must not be a placeholder\n");

    ASSERT_PRINT(!blob_build_default(S, g_buf, 16, 1), "undersized build must fail\n");
}

static void
test_seal_after_edit()
{
    ASSERT_PRINT(blob_build_default(S, g_buf, S->blob_size, 7), "build\n");
    uint32_t before = blob_stored_crc(g_buf, S->blob_size);

    blob_set_active_profile(S, g_buf, 3);
    ASSERT_PRINT(blob_stored_crc(g_buf, S->blob_size) != blob_computed_crc(g_buf, S->blob_size),
                 "edit without seal must break crc\n");

    blob_seal(g_buf, S->blob_size);
    ASSERT_PRINT(blob_stored_crc(g_buf, S->blob_size) == blob_computed_crc(g_buf, S->blob_size),
                 "seal restores crc\n");
    ASSERT_PRINT(blob_stored_crc(g_buf, S->blob_size) != before, "crc tracks content\n");

    blob_set_generation(S, g_buf, 0x01020304u);
    struct blob_header h;
    ASSERT_PRINT(blob_header_parse(S, g_buf, S->blob_size, &h), "parse\n");
    ASSERT_PRINT(h.generation == 0x01020304u && h.active_profile == 3, "fields updated\n");
}

static void
test_magic_rejects()
{
    ASSERT_PRINT(blob_build_default(S, g_buf, S->blob_size, 1), "build\n");
    ASSERT_PRINT(!blob_magic_ok(S, g_buf, 8), "truncated buffer\n");

    g_buf[15] = 'X';   /* terminator is part of the signature */
    ASSERT_PRINT(!blob_magic_ok(S, g_buf, S->blob_size), "altered terminator\n");

    struct blob_header h;
    ASSERT_PRINT(!blob_header_parse(S, g_buf, 25, &h), "short header parse\n");
}

int main()
{
    printf("blob_layout\n");
    RUN_TEST(test_schema_constants);
    RUN_TEST(test_range_check);
    RUN_TEST(test_payload_and_trailer_ranges);
    RUN_TEST(test_little_endian);
    RUN_TEST(test_build_default);
    RUN_TEST(test_seal_after_edit);
    RUN_TEST(test_magic_rejects);
    return 0;
}
