/*
 * log_host.cpp
 *
 * Project: Orca Settings Link
 * Purpose: Host log sink
 *
 * Notes:
 *  - Writes to stderr so stdout stays clean for reports
 *  - One fprintf per message; lines from the I/O thread do not interleave
 *
 * Updated: 2026-10-17
 */

#include "log.h"

#include <stdio.h>
#include <stdarg.h>
#include <strings.h>

#include <atomic>

/* Read from the I/O thread on every message */
static std::atomic<log_level_t> g_level{LOG_INFO};

void log_set_level(log_level_t level)
{
    g_level.store(level);
}

log_level_t log_get_level(void)
{
    return g_level.load();
}

bool log_parse_level(const char *s, log_level_t *out)
{
    if (!s || !out)
        return false;

    if (!strcasecmp(s, "error"))      *out = LOG_ERROR;
    else if (!strcasecmp(s, "warn"))  *out = LOG_WARN;
    else if (!strcasecmp(s, "info"))  *out = LOG_INFO;
    else if (!strcasecmp(s, "debug")) *out = LOG_DEBUG;
    else
        return false;

    return true;
}

void log_printf(log_level_t level, const char *tag, const char *fmt, ...)
{
    if (level > g_level.load())
        return;

    char msg[256];
    va_list ap;

    va_start(ap, fmt);
    vsnprintf(msg, sizeof(msg), fmt, ap);
    va_end(ap);

    fprintf(stderr, "[%s] %s\n", tag ? tag : "-", msg);
}
