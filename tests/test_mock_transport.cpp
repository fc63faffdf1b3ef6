/*
 * test_mock_transport.cpp
 *
 * Project: Orca Settings Link
 * Purpose: Reference device contract (bounds, slicing, close, commit)
 */

#include "test_utils.h"
#include "blob_layout.h"
#include "transport/mock_transport.h"

#include <string.h>

static struct mock_transport g_mock;
static uint8_t g_chunk[ORCA_BLOB_MAX_SIZE];

static void
setup(uint32_t max_chunk)
{
    ASSERT_PRINT(mock_transport_init(&g_mock, &orca_settings_schema, max_chunk), "mock init\n");
}

static void
test_identity_matches_schema()
{
    setup(0);
    Transport t = mock_transport_bind(&g_mock);
    struct device_identity id;

    ASSERT_ERR(transport_get_info(&t, &id), ORCA_OK);
    ASSERT_PRINT(id.schema_id == orca_settings_schema.schema_id, "schema id\n");
    ASSERT_PRINT(id.settings_major == orca_settings_schema.version_major &&
                 id.settings_minor == orca_settings_schema.version_minor,
                 "version %u.%u\n", id.settings_major, id.settings_minor);
    ASSERT_PRINT(id.blob_size == orca_settings_schema.blob_size, "blob size\n");
    ASSERT_PRINT(id.max_chunk == MOCK_DEFAULT_MAX_CHUNK, "default max chunk %u\n",
                 (unsigned)id.max_chunk);
    ASSERT_PRINT(g_mock.info_count == 1, "info counted\n");
}

static void
test_valid_reads_match_blob()
{
    setup(0);
    Transport t = mock_transport_bind(&g_mock);
    const uint32_t size = g_mock.blob_size;

    /* A spread of offsets and lengths, including both edges */
    const uint32_t offsets[] = { 0, 1, 15, 16, 31, 255, 256, 1000, size - 4, size - 1 };
    const uint32_t lengths[] = { 1, 3, 4, 16, 255, 256, 257, 1024, size };

    for (uint32_t oi = 0; oi < sizeof(offsets) / sizeof(offsets[0]); oi++) {
        for (uint32_t li = 0; li < sizeof(lengths) / sizeof(lengths[0]); li++) {
            uint32_t off = offsets[oi];
            uint32_t len = lengths[li];
            uint32_t got = 0;

            if ((uint64_t)off + len > size)
                continue;

            memset(g_chunk, 0xEE, len);
            ASSERT_ERR(transport_read_chunk(&t, off, len, g_chunk, &got), ORCA_OK);
            ASSERT_PRINT(got == len, "len at %u: want %u got %u\n", (unsigned)off,
                         (unsigned)len, (unsigned)got);

            if (memcmp(g_chunk, g_mock.blob + off, len) != 0) {
                dump_bytes(g_mock.blob + off, len, "Expected");
                dump_bytes(g_chunk, len, "Got");
                ASSERT_PRINT(false, "content mismatch at %u+%u\n", (unsigned)off, (unsigned)len);
            }
        }
    }
}

static void
test_out_of_range_reads()
{
    setup(0);
    Transport t = mock_transport_bind(&g_mock);
    const uint32_t size = g_mock.blob_size;
    uint32_t got = 0;

    ASSERT_ERR(transport_read_chunk(&t, 0, size + 1, g_chunk, &got), ORCA_ERR_OUT_OF_RANGE);
    ASSERT_ERR(transport_read_chunk(&t, size - 4, 5, g_chunk, &got), ORCA_ERR_OUT_OF_RANGE);
    ASSERT_ERR(transport_read_chunk(&t, size, 1, g_chunk, &got), ORCA_ERR_OUT_OF_RANGE);
    ASSERT_ERR(transport_read_chunk(&t, 0xFFFFFF00u, 0x200, g_chunk, &got), ORCA_ERR_OUT_OF_RANGE);
    ASSERT_PRINT(got == 0, "no bytes on failure\n");
    ASSERT_PRINT(g_mock.read_count == 0, "rejected reads are not counted\n");
}

static void
test_slice_semantics()
{
    setup(0);
    const uint32_t size = g_mock.blob_size;

    ASSERT_PRINT(mock_transport_slice(&g_mock, size - 10, 64, g_chunk) == 10, "short slice\n");
    ASSERT_PRINT(memcmp(g_chunk, g_mock.blob + size - 10, 10) == 0, "short slice content\n");
    ASSERT_PRINT(mock_transport_slice(&g_mock, size, 8, g_chunk) == 0, "empty at end\n");
    ASSERT_PRINT(mock_transport_slice(&g_mock, size + 100, 8, g_chunk) == 0, "empty past end\n");
}

static void
test_close_is_idempotent()
{
    setup(0);
    Transport t = mock_transport_bind(&g_mock);
    struct device_identity id;
    uint32_t got = 0;

    transport_close(&t);
    transport_close(&t);

    ASSERT_ERR(transport_get_info(&t, &id), ORCA_ERR_DISCONNECTED);
    ASSERT_ERR(transport_read_chunk(&t, 0, 16, g_chunk, &got), ORCA_ERR_DISCONNECTED);
}

static void
test_reads_do_not_mutate()
{
    static uint8_t before[ORCA_BLOB_MAX_SIZE];

    setup(0);
    Transport t = mock_transport_bind(&g_mock);
    uint32_t got = 0;

    memcpy(before, g_mock.blob, g_mock.blob_size);
    for (uint32_t off = 0; off < g_mock.blob_size; off += 128)
        ASSERT_ERR(transport_read_chunk(&t, off, 128, g_chunk, &got), ORCA_OK);

    ASSERT_PRINT(memcmp(before, g_mock.blob, g_mock.blob_size) == 0, "reads changed device state\n");
}

static void
test_commit_bumps_generation()
{
    setup(0);

    ASSERT_PRINT(mock_transport_generation(&g_mock) == 1, "initial generation\n");
    ASSERT_PRINT(mock_transport_commit(&g_mock) == 2, "first commit\n");
    ASSERT_PRINT(mock_transport_set_active_profile(&g_mock, 2) == 3, "profile commit\n");

    struct blob_header h;
    ASSERT_PRINT(blob_header_parse(&orca_settings_schema, g_mock.blob, g_mock.blob_size, &h),
                 "parse\n");
    ASSERT_PRINT(h.generation == 3 && h.active_profile == 2, "header after commits\n");
    ASSERT_PRINT(blob_stored_crc(g_mock.blob, g_mock.blob_size) ==
                 blob_computed_crc(g_mock.blob, g_mock.blob_size), "commit reseals\n");
}

static void
test_fault_injection()
{
    setup(64);
    Transport t = mock_transport_bind(&g_mock);
    uint32_t got = 0;

    g_mock.fail_on_read = 2;
    g_mock.fail_err = ORCA_ERR_TIMEOUT;

    ASSERT_ERR(transport_read_chunk(&t, 0, 64, g_chunk, &got), ORCA_OK);
    ASSERT_ERR(transport_read_chunk(&t, 64, 64, g_chunk, &got), ORCA_ERR_TIMEOUT);
    ASSERT_ERR(transport_read_chunk(&t, 64, 64, g_chunk, &got), ORCA_OK);

    setup(64);
    t = mock_transport_bind(&g_mock);
    g_mock.close_after_reads = 1;

    ASSERT_ERR(transport_read_chunk(&t, 0, 64, g_chunk, &got), ORCA_OK);
    ASSERT_ERR(transport_read_chunk(&t, 64, 64, g_chunk, &got), ORCA_ERR_DISCONNECTED);
}

int main()
{
    printf("mock_transport\n");
    RUN_TEST(test_identity_matches_schema);
    RUN_TEST(test_valid_reads_match_blob);
    RUN_TEST(test_out_of_range_reads);
    RUN_TEST(test_slice_semantics);
    RUN_TEST(test_close_is_idempotent);
    RUN_TEST(test_reads_do_not_mutate);
    RUN_TEST(test_commit_bumps_generation);
    RUN_TEST(test_fault_injection);
    return 0;
}
