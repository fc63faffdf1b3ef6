/*
 * log.h
 *
 * Project: Orca Settings Link
 * Purpose: Tagged diagnostic output
 *
 * Notes:
 *  - Output format: "[TAG] message\n"
 *  - Sink is platform code (host: stderr)
 *  - Messages above the current level are dropped before formatting
 *
 * Updated: 2026-10-17
 */

#pragma once

#include <stdint.h>

typedef enum : uint8_t {
    LOG_ERROR = 0,
    LOG_WARN,
    LOG_INFO,
    LOG_DEBUG
} log_level_t;

void        log_set_level(log_level_t level);
log_level_t log_get_level(void);

/* Parse "error" / "warn" / "info" / "debug" (case-insensitive) */
bool        log_parse_level(const char *s, log_level_t *out);

#if defined(__GNUC__)
__attribute__((format(printf, 3, 4)))
#endif
void log_printf(log_level_t level, const char *tag, const char *fmt, ...);
