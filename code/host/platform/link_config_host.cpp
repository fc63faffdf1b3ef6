/*
 * link_config_host.cpp
 *
 * Project: Orca Settings Link
 * Purpose: Host-side link configuration source
 *
 * Notes:
 *  - Uses shared defaults, then applies file overrides
 *  - Rejected lines are logged and skipped
 *
 * Updated: 2026-10-17
 */

#include "link_config.h"
#include "log.h"

#include <stdio.h>
#include <string.h>

#define TAG "CFG"

bool link_config_load(struct link_config *cfg, const char *path)
{
    link_config_defaults(cfg);

    FILE *f = fopen(path, "r");
    if (!f) {
        /* No config file: defaults stand */
        log_printf(LOG_DEBUG, TAG, "%s not found, using defaults", path);
        return false;
    }

    char line[256];
    unsigned lineno = 0;
    bool ok = true;

    while (fgets(line, sizeof(line), f)) {
        lineno++;

        char copy[sizeof(line)];
        strcpy(copy, line);

        if (!link_config_parse_line(cfg, line)) {
            copy[strcspn(copy, "\r\n")] = '\0';
            log_printf(LOG_WARN, TAG, "%s:%u: rejected '%s'", path, lineno, copy);
            ok = false;
        }
    }

    fclose(f);
    return ok;
}
