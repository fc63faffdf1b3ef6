/*
 * test_link_config.cpp
 *
 * Project: Orca Settings Link
 * Purpose: Link configuration parsing and file loading
 */

#include "test_utils.h"
#include "link_config.h"
#include "log.h"

#include <string.h>
#include <unistd.h>

#include <atomic>
#include <thread>

static void
test_defaults()
{
    struct link_config cfg;

    link_config_defaults(&cfg);
    ASSERT_PRINT(cfg.port[0] == '\0', "port\n");
    ASSERT_PRINT(cfg.baud == 115200, "baud\n");
    ASSERT_PRINT(cfg.timeout_ms == 1000, "timeout\n");
    ASSERT_PRINT(cfg.max_chunk == 0, "max_chunk\n");
    ASSERT_PRINT(cfg.log_level == LOG_INFO, "log level\n");
    ASSERT_PRINT(link_config_uses_mock(&cfg), "empty port means reference device\n");
}

static void
test_set()
{
    struct link_config cfg;
    link_config_defaults(&cfg);

    ASSERT_PRINT(link_config_set(&cfg, "port", "/dev/ttyACM0"), "port\n");
    ASSERT_PRINT(!link_config_uses_mock(&cfg), "real port\n");
    ASSERT_PRINT(link_config_set(&cfg, "baud", "921600") && cfg.baud == 921600, "baud\n");
    ASSERT_PRINT(link_config_set(&cfg, "timeout_ms", "250") && cfg.timeout_ms == 250, "timeout\n");
    ASSERT_PRINT(link_config_set(&cfg, "max_chunk", "0") && cfg.max_chunk == 0, "max_chunk 0\n");
    ASSERT_PRINT(link_config_set(&cfg, "log", "DEBUG") && cfg.log_level == LOG_DEBUG, "log\n");

    ASSERT_PRINT(!link_config_set(&cfg, "baud", "0"), "zero baud\n");
    ASSERT_PRINT(!link_config_set(&cfg, "baud", "-9600"), "negative baud\n");
    ASSERT_PRINT(!link_config_set(&cfg, "timeout_ms", "12ms"), "trailing junk\n");
    ASSERT_PRINT(!link_config_set(&cfg, "timeout_ms", "0"), "zero timeout\n");
    ASSERT_PRINT(!link_config_set(&cfg, "log", "loud"), "bad level\n");
    ASSERT_PRINT(!link_config_set(&cfg, "parity", "none"), "unknown key\n");
    ASSERT_PRINT(cfg.baud == 921600 && cfg.timeout_ms == 250, "rejects leave cfg alone\n");

    char long_port[LINK_PORT_MAX + 8];
    memset(long_port, 'x', sizeof(long_port) - 1);
    long_port[sizeof(long_port) - 1] = '\0';
    ASSERT_PRINT(!link_config_set(&cfg, "port", long_port), "port too long\n");

    ASSERT_PRINT(link_config_set(&cfg, "port", "mock") && link_config_uses_mock(&cfg), "mock\n");
}

static void
test_parse_line()
{
    struct link_config cfg;
    link_config_defaults(&cfg);

    char l1[] = "baud 57600\n";
    char l2[] = "timeout_ms = 300   # shorter for bench\n";
    char l3[] = "   # only a comment\n";
    char l4[] = "\n";
    char l5[] = "baud 57600 extra\n";
    char l6[] = "baud\n";
    char l7[] = "port /dev/ttyUSB1\n";
    char l8[] = "port\n";

    ASSERT_PRINT(link_config_parse_line(&cfg, l1) && cfg.baud == 57600, "plain\n");
    ASSERT_PRINT(link_config_parse_line(&cfg, l2) && cfg.timeout_ms == 300, "key = value\n");
    ASSERT_PRINT(link_config_parse_line(&cfg, l3), "comment\n");
    ASSERT_PRINT(link_config_parse_line(&cfg, l4), "blank\n");
    ASSERT_PRINT(!link_config_parse_line(&cfg, l5), "too many tokens\n");
    ASSERT_PRINT(!link_config_parse_line(&cfg, l6), "missing value\n");
    ASSERT_PRINT(link_config_parse_line(&cfg, l7) && !strcmp(cfg.port, "/dev/ttyUSB1"), "port\n");
    ASSERT_PRINT(link_config_parse_line(&cfg, l8) && cfg.port[0] == '\0', "bare port clears\n");
}

static void
write_file(const char *path, const char *text)
{
    FILE *f = fopen(path, "w");
    ASSERT_PRINT(f, "create %s\n", path);
    fputs(text, f);
    fclose(f);
}

static void
test_load_file()
{
    char path[] = "/tmp/orca_cfg_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_PRINT(fd >= 0, "mkstemp\n");
    close(fd);

    struct link_config cfg;

    write_file(path,
               "# bench rig\n"
               "port       /dev/ttyACM3\n"
               "baud       230400\n"
               "max_chunk  128\n"
               "log        warn\n");
    ASSERT_PRINT(link_config_load(&cfg, path), "clean file\n");
    ASSERT_PRINT(!strcmp(cfg.port, "/dev/ttyACM3") && cfg.baud == 230400, "port/baud\n");
    ASSERT_PRINT(cfg.max_chunk == 128 && cfg.log_level == LOG_WARN, "chunk/log\n");
    ASSERT_PRINT(cfg.timeout_ms == 1000, "unset key keeps default\n");

    /* A bad line is reported, good lines still apply */
    write_file(path,
               "baud fast\n"
               "timeout_ms 50\n");
    ASSERT_PRINT(!link_config_load(&cfg, path), "bad line must fail the load\n");
    ASSERT_PRINT(cfg.baud == 115200 && cfg.timeout_ms == 50, "partial apply\n");
    ASSERT_PRINT(cfg.port[0] == '\0', "reload starts from defaults\n");

    unlink(path);

    ASSERT_PRINT(!link_config_load(&cfg, path), "missing file\n");
    ASSERT_PRINT(cfg.baud == 115200 && link_config_uses_mock(&cfg), "defaults after missing file\n");
}

static void
test_log_levels()
{
    log_level_t lvl;

    ASSERT_PRINT(log_parse_level("error", &lvl) && lvl == LOG_ERROR, "error\n");
    ASSERT_PRINT(log_parse_level("Warn", &lvl) && lvl == LOG_WARN, "warn\n");
    ASSERT_PRINT(log_parse_level("INFO", &lvl) && lvl == LOG_INFO, "info\n");
    ASSERT_PRINT(!log_parse_level("", &lvl), "empty\n");

    log_set_level(LOG_DEBUG);
    ASSERT_PRINT(log_get_level() == LOG_DEBUG, "set/get\n");
    log_set_level(LOG_ERROR);
}

static void
test_log_level_across_threads()
{
    std::atomic<bool> stop{false};

    /* Debug lines stay filtered while the level moves between error and warn */
    std::thread io([&]() {
        while (!stop.load())
            log_printf(LOG_DEBUG, "TEST", "filtered");
    });

    for (int i = 0; i < 1000; i++)
        log_set_level((i & 1) ? LOG_WARN : LOG_ERROR);

    stop = true;
    io.join();

    ASSERT_PRINT(log_get_level() == LOG_WARN, "last level wins\n");
    log_set_level(LOG_ERROR);
}

int main()
{
    log_set_level(LOG_ERROR);

    printf("link_config\n");
    RUN_TEST(test_defaults);
    RUN_TEST(test_set);
    RUN_TEST(test_parse_line);
    RUN_TEST(test_load_file);
    RUN_TEST(test_log_levels);
    RUN_TEST(test_log_level_across_threads);
    return 0;
}
