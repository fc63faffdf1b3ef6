/*
 * link_config.h
 *
 * Project: Orca Settings Link
 * Purpose: Host link configuration
 *
 * File format (one setting per line, '#' starts a comment):
 *
 *   port       /dev/ttyACM0     # empty or "mock" = reference device
 *   baud       115200
 *   timeout_ms 1000
 *   max_chunk  0                # 0 = device limit
 *   log        info             # error|warn|info|debug
 *
 * "key = value" is accepted too.
 *
 * Updated: 2026-10-17
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

#include "log.h"

#define LINK_PORT_MAX 128

struct link_config {
    char        port[LINK_PORT_MAX];
    uint32_t    baud;
    uint32_t    timeout_ms;
    uint32_t    max_chunk;
    log_level_t log_level;
};

void link_config_defaults(struct link_config *cfg);

/*
 * Apply one key/value pair.
 *
 * Returns:
 *  - false on unknown key or unparsable value (cfg unchanged)
 */
bool link_config_set(struct link_config *cfg, const char *key, const char *value);

/*
 * Apply one line of the file format. Modifies line in place.
 * Blank and comment-only lines succeed without effect.
 */
bool link_config_parse_line(struct link_config *cfg, char *line);

/* True when no serial port is configured */
bool link_config_uses_mock(const struct link_config *cfg);

/*
 * Reset to defaults, then apply path (host platform).
 *
 * Returns:
 *  - false if the file is missing or any line was rejected;
 *    accepted lines still apply
 */
bool link_config_load(struct link_config *cfg, const char *path);
