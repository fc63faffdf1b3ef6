/*
 * main_host.cpp
 *
 * Project: Orca Settings Link
 * Purpose: Host entry point: fetch and report a device's settings blob
 *
 * Usage:
 *   orca_host [config-file]      (default: orca.cfg)
 *
 * Notes:
 *  - No port configured -> in-memory reference device
 *  - Reports go to stdout, diagnostics to stderr
 *  - Exit status 0 on a validated blob, 1 otherwise
 *
 * Updated: 2026-10-17
 */

#include "blob_assembler.h"
#include "link_config.h"
#include "log.h"
#include "transport/mock_transport.h"
#include "transport/serial_transport.h"

#include <stdio.h>
#include <string.h>

#define HOST_CFG_FILE "orca.cfg"

static uint8_t g_blob[ORCA_BLOB_MAX_SIZE];
static struct mock_transport g_mock;
static struct serial_transport g_serial;

static void print_usage(const char *prog)
{
    printf("Usage: %s [config-file]\n", prog);
    printf("  config-file: link settings (default: %s)\n", HOST_CFG_FILE);
}

static void on_progress(void *user, uint32_t offset, uint32_t total)
{
    (void)user;
    log_printf(LOG_DEBUG, "HOST", "progress %u/%u", (unsigned)offset, (unsigned)total);
}

static void print_report(const struct assembled_blob *b)
{
    struct blob_range payload = { 0, 0 };

    if (!blob_payload_range(&orca_settings_schema, b->header.header_size, b->size, &payload))
        log_printf(LOG_WARN, "HOST", "payload range unavailable");

    printf("schema id      : %u\n", (unsigned)b->identity.schema_id);
    printf("device version : %u.%u\n", b->identity.settings_major, b->identity.settings_minor);
    printf("blob size      : %u (max chunk %u)\n",
           (unsigned)b->size, (unsigned)b->identity.max_chunk);
    printf("header version : %u.%u\n", b->header.version_major, b->header.version_minor);
    printf("header size    : %u\n", b->header.header_size);
    printf("payload        : [%u, %u)\n", (unsigned)payload.begin, (unsigned)payload.end);
    printf("generation     : %u\n", (unsigned)b->header.generation);
    printf("active profile : %u\n", b->header.active_profile);
    printf("flags          : 0x%02x\n", b->header.flags);
    printf("crc32          : 0x%08x\n", (unsigned)b->crc);
}

int main(int argc, char **argv)
{
    const char *cfg_path = HOST_CFG_FILE;

    if (argc > 2) {
        print_usage(argv[0]);
        return 1;
    }
    if (argc == 2) {
        if (!strcmp(argv[1], "-h") || !strcmp(argv[1], "--help")) {
            print_usage(argv[0]);
            return 0;
        }
        cfg_path = argv[1];
    }

    struct link_config cfg;
    bool cfg_ok = link_config_load(&cfg, cfg_path);
    log_set_level(cfg.log_level);

    if (!cfg_ok)
        log_printf(LOG_INFO, "HOST", "%s not fully applied, defaults in effect", cfg_path);

    Transport t;

    if (link_config_uses_mock(&cfg)) {
        if (!mock_transport_init(&g_mock, &orca_settings_schema, 0)) {
            log_printf(LOG_ERROR, "HOST", "reference device init failed");
            return 1;
        }
        t = mock_transport_bind(&g_mock);
    } else {
        orca_err_t err = serial_transport_open(&g_serial, &cfg, &orca_settings_schema);
        if (err != ORCA_OK) {
            fprintf(stderr, "cannot open %s: %s\n", cfg.port, orca_err_string(err));
            return 1;
        }
        t = serial_transport_bind(&g_serial);
    }

    struct assemble_opts opts = {
        .max_chunk = cfg.max_chunk,
        .progress  = on_progress,
        .user      = NULL,
    };
    struct assembled_blob blob;

    orca_err_t err = blob_assemble(&t, &orca_settings_schema,
                                   g_blob, sizeof(g_blob), &opts, &blob);

    transport_close(&t);

    if (err != ORCA_OK) {
        fprintf(stderr, "%s: %s\n", t.name, orca_err_string(err));
        return 1;
    }

    print_report(&blob);
    return 0;
}
