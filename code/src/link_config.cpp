/*
 * link_config.cpp
 *
 * Project: Orca Settings Link
 * Purpose: Link configuration defaults and parsing
 *
 * Notes:
 *  - Any future fields MUST be initialized in link_config_defaults()
 *
 * Updated: 2026-10-17
 */

#include "link_config.h"

#include <stdlib.h>
#include <string.h>
#include <errno.h>

void link_config_defaults(struct link_config *cfg)
{
    memset(cfg, 0, sizeof(*cfg));

    cfg->port[0]    = '\0';     /* reference device */
    cfg->baud       = 115200;
    cfg->timeout_ms = 1000;
    cfg->max_chunk  = 0;
    cfg->log_level  = LOG_INFO;
}

static bool parse_u32(const char *s, uint32_t *out)
{
    char *end = NULL;

    if (!s || !*s || *s == '-')
        return false;

    errno = 0;
    unsigned long v = strtoul(s, &end, 10);
    if (errno || *end || v > 0xFFFFFFFFul)
        return false;

    *out = (uint32_t)v;
    return true;
}

bool link_config_set(struct link_config *cfg, const char *key, const char *value)
{
    uint32_t v;

    if (!cfg || !key || !value)
        return false;

    if (!strcmp(key, "port")) {
        if (strlen(value) >= sizeof(cfg->port))
            return false;
        strcpy(cfg->port, value);
        return true;
    }

    if (!strcmp(key, "baud")) {
        if (!parse_u32(value, &v) || v == 0)
            return false;
        cfg->baud = v;
        return true;
    }

    if (!strcmp(key, "timeout_ms")) {
        if (!parse_u32(value, &v) || v == 0)
            return false;
        cfg->timeout_ms = v;
        return true;
    }

    if (!strcmp(key, "max_chunk")) {
        if (!parse_u32(value, &v))
            return false;
        cfg->max_chunk = v;
        return true;
    }

    if (!strcmp(key, "log"))
        return log_parse_level(value, &cfg->log_level);

    return false;
}

static void strip_comment(char *line)
{
    for (; *line; line++) {
        if (*line == '#') {
            *line = '\0';
            return;
        }
    }
}

bool link_config_parse_line(struct link_config *cfg, char *line)
{
    char *argv[3];
    int argc = 0;

    if (!line)
        return false;

    strip_comment(line);

    char *p = strtok(line, " \t\r\n=");
    while (p && argc < 3) {
        argv[argc++] = p;
        p = strtok(NULL, " \t\r\n=");
    }

    if (argc == 0)
        return true;

    /* "port" alone clears the port */
    if (argc == 1)
        return link_config_set(cfg, argv[0], "");
    if (argc != 2)
        return false;

    return link_config_set(cfg, argv[0], argv[1]);
}

bool link_config_uses_mock(const struct link_config *cfg)
{
    return cfg->port[0] == '\0' || !strcmp(cfg->port, "mock");
}
