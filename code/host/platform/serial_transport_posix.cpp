/*
 * serial_transport_posix.cpp
 *
 * Project: Orca Settings Link
 * Purpose: Serial transport on POSIX termios
 *
 * Notes:
 *  - Host-only implementation
 *  - Waits use select() on the port and a wake pipe, never blocking reads
 *  - Deadlines use CLOCK_MONOTONIC
 *
 * Updated: 2026-10-17
 */

#include "transport/serial_transport.h"
#include "log.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <termios.h>
#include <time.h>
#include <unistd.h>
#include <sys/select.h>

#define TAG "SERIAL"

/* --------------------------------------------------------------------------
 * Helpers
 * -------------------------------------------------------------------------- */

static uint64_t now_ms(void)
{
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return (uint64_t)ts.tv_sec * 1000ULL + (uint64_t)ts.tv_nsec / 1000000ULL;
}

static bool baud_to_speed(uint32_t baud, speed_t *out)
{
    switch (baud) {
    case 9600:   *out = B9600;   return true;
    case 19200:  *out = B19200;  return true;
    case 38400:  *out = B38400;  return true;
    case 57600:  *out = B57600;  return true;
    case 115200: *out = B115200; return true;
    case 230400: *out = B230400; return true;
#ifdef B460800
    case 460800: *out = B460800; return true;
#endif
#ifdef B921600
    case 921600: *out = B921600; return true;
#endif
    default:     return false;
    }
}

static void close_fd(int *fd)
{
    if (*fd >= 0) {
        close(*fd);
        *fd = -1;
    }
}

static bool configure_port(int fd, uint32_t baud)
{
    struct termios tio;
    speed_t speed;

    if (!baud_to_speed(baud, &speed)) {
        log_printf(LOG_ERROR, TAG, "unsupported baud %u", (unsigned)baud);
        return false;
    }

    if (tcgetattr(fd, &tio) != 0)
        return false;

    cfmakeraw(&tio);
    tio.c_cflag |= CLOCAL | CREAD;
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (cfsetispeed(&tio, speed) != 0 || cfsetospeed(&tio, speed) != 0)
        return false;
    if (tcsetattr(fd, TCSANOW, &tio) != 0)
        return false;

    tcflush(fd, TCIOFLUSH);
    return true;
}

/* --------------------------------------------------------------------------
 * Request / response (caller holds io_lock)
 * -------------------------------------------------------------------------- */

static orca_err_t write_all(struct serial_transport *st, const uint8_t *buf, size_t len)
{
    while (len) {
        ssize_t n = write(st->fd, buf, len);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            log_printf(LOG_WARN, TAG, "write: %s", strerror(errno));
            return ORCA_ERR_DISCONNECTED;
        }
        buf += n;
        len -= (size_t)n;
    }
    return ORCA_OK;
}

static void rx_drop(struct serial_transport *st, size_t n)
{
    memmove(st->rx, st->rx + n, st->rx_len - n);
    st->rx_len -= n;
}

/* Wait for port data or wake-up until deadline */
static orca_err_t rx_fill(struct serial_transport *st, uint64_t deadline)
{
    for (;;) {
        if (st->closed.load())
            return ORCA_ERR_DISCONNECTED;

        uint64_t now = now_ms();
        if (now >= deadline)
            return ORCA_ERR_TIMEOUT;

        uint64_t left = deadline - now;
        struct timeval tv = { (time_t)(left / 1000), (suseconds_t)((left % 1000) * 1000) };

        fd_set rfds;
        FD_ZERO(&rfds);
        FD_SET(st->fd, &rfds);
        FD_SET(st->wake_rd, &rfds);
        int maxfd = st->fd > st->wake_rd ? st->fd : st->wake_rd;

        int r = select(maxfd + 1, &rfds, NULL, NULL, &tv);
        if (r < 0) {
            if (errno == EINTR)
                continue;
            log_printf(LOG_WARN, TAG, "select: %s", strerror(errno));
            return ORCA_ERR_DISCONNECTED;
        }
        if (r == 0)
            return ORCA_ERR_TIMEOUT;

        if (FD_ISSET(st->wake_rd, &rfds) || st->closed.load())
            return ORCA_ERR_DISCONNECTED;

        ssize_t n = read(st->fd, st->rx + st->rx_len, sizeof(st->rx) - st->rx_len);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            log_printf(LOG_WARN, TAG, "read: %s", strerror(errno));
            return ORCA_ERR_DISCONNECTED;
        }
        if (n == 0) {
            log_printf(LOG_WARN, TAG, "link closed by peer");
            return ORCA_ERR_DISCONNECTED;
        }

        st->rx_len += (size_t)n;
        return ORCA_OK;
    }
}

/*
 * Send req and wait for the response carrying seq.
 * On ORCA_OK *resp points into st->frame, valid until the next call.
 */
static orca_err_t transact(struct serial_transport *st,
                           size_t req_len, uint32_t seq,
                           struct frame_view *resp)
{
    orca_err_t err = write_all(st, st->tx, req_len);
    if (err != ORCA_OK)
        return err;

    uint64_t deadline = now_ms() + st->timeout_ms;

    for (;;) {
        struct frame_view f;
        size_t used = 0;

        frame_status_t fs = frame_decode(st->rx, st->rx_len, &f, &used);

        if (fs == FRAME_OK) {
            if (f.seq != seq) {
                log_printf(LOG_DEBUG, TAG, "discarding stale seq %u (want %u)",
                           (unsigned)f.seq, (unsigned)seq);
                rx_drop(st, used);
                continue;
            }

            memcpy(st->frame, st->rx, used);
            resp->msg_type = f.msg_type;
            resp->seq      = f.seq;
            resp->payload  = st->frame + FRAME_HEADER_SIZE;
            resp->len      = f.len;
            rx_drop(st, used);
            return ORCA_OK;
        }

        if (fs != FRAME_NEED_MORE) {
            log_printf(LOG_WARN, TAG, "framing error: %s", frame_status_string(fs));
            st->rx_len = 0;
            tcflush(st->fd, TCIFLUSH);
            return ORCA_ERR_PROTOCOL_MISMATCH;
        }

        err = rx_fill(st, deadline);
        if (err != ORCA_OK)
            return err;
    }
}

/* --------------------------------------------------------------------------
 * Capability operations
 * -------------------------------------------------------------------------- */

static orca_err_t serial_get_info(void *ctx, struct device_identity *out)
{
    struct serial_transport *st = (struct serial_transport *)ctx;
    std::lock_guard<std::mutex> guard(st->io_lock);

    if (st->closed.load())
        return ORCA_ERR_DISCONNECTED;

    uint32_t seq = st->seq++;
    size_t len = frame_encode_get_info(seq, st->tx, sizeof(st->tx));

    struct frame_view resp;
    orca_err_t err = transact(st, len, seq, &resp);
    if (err != ORCA_OK)
        return err;

    err = frame_parse_info(&resp, st->schema->blob_size, out);
    if (err != ORCA_OK)
        return err;

    st->info = *out;
    st->have_info = true;

    log_printf(LOG_INFO, TAG, "device schema %u v%u.%u blob %u chunk %u",
               (unsigned)out->schema_id, out->settings_major, out->settings_minor,
               (unsigned)out->blob_size, (unsigned)out->max_chunk);
    return ORCA_OK;
}

static orca_err_t serial_read_chunk(void *ctx,
                                    uint32_t offset,
                                    uint32_t length,
                                    uint8_t *out,
                                    uint32_t *out_len)
{
    struct serial_transport *st = (struct serial_transport *)ctx;
    std::lock_guard<std::mutex> guard(st->io_lock);

    if (st->closed.load())
        return ORCA_ERR_DISCONNECTED;

    /* Link limit: one response frame carries at most FRAME_MAX_READ_DATA */
    if (length == 0 || length > FRAME_MAX_READ_DATA)
        return ORCA_ERR_OUT_OF_RANGE;
    if (st->have_info && !blob_range_check(offset, length, st->info.blob_size))
        return ORCA_ERR_OUT_OF_RANGE;

    uint32_t seq = st->seq++;
    size_t len = frame_encode_read_blob(seq, offset, length, st->tx, sizeof(st->tx));

    struct frame_view resp;
    orca_err_t err = transact(st, len, seq, &resp);
    if (err != ORCA_OK)
        return err;

    const uint8_t *data = NULL;
    err = frame_parse_read_blob(&resp, offset, length, &data);
    if (err != ORCA_OK)
        return err;

    memcpy(out, data, length);
    *out_len = length;
    return ORCA_OK;
}

static void serial_close(void *ctx)
{
    struct serial_transport *st = (struct serial_transport *)ctx;

    if (st->closed.exchange(true))
        return;

    /* Kick any call parked in select() */
    uint8_t b = 1;
    if (write(st->wake_wr, &b, 1) != 1)
        log_printf(LOG_WARN, TAG, "wake: %s", strerror(errno));

    std::lock_guard<std::mutex> guard(st->io_lock);

    close_fd(&st->fd);
    close_fd(&st->wake_rd);
    close_fd(&st->wake_wr);
    st->rx_len = 0;
    st->have_info = false;

    log_printf(LOG_INFO, TAG, "closed %s", st->port);
}

/* --------------------------------------------------------------------------
 * Public API
 * -------------------------------------------------------------------------- */

orca_err_t serial_transport_open(struct serial_transport *st,
                                 const struct link_config *cfg,
                                 const struct blob_schema *schema)
{
    if (!st || !cfg || !schema)
        return ORCA_ERR_DISCONNECTED;

    if (!st->closed.load())
        serial_close(st);

    strcpy(st->port, cfg->port);
    st->schema     = schema;
    st->timeout_ms = cfg->timeout_ms;
    st->seq        = 1;
    st->have_info  = false;
    st->rx_len     = 0;

    st->fd = open(cfg->port, O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (st->fd < 0) {
        log_printf(LOG_ERROR, TAG, "open %s: %s", cfg->port, strerror(errno));
        return ORCA_ERR_DISCONNECTED;
    }

    if (!configure_port(st->fd, cfg->baud)) {
        log_printf(LOG_ERROR, TAG, "configure %s failed", cfg->port);
        close_fd(&st->fd);
        return ORCA_ERR_DISCONNECTED;
    }

    int p[2];
    if (pipe2(p, O_CLOEXEC | O_NONBLOCK) != 0) {
        log_printf(LOG_ERROR, TAG, "pipe: %s", strerror(errno));
        close_fd(&st->fd);
        return ORCA_ERR_DISCONNECTED;
    }
    st->wake_rd = p[0];
    st->wake_wr = p[1];

    st->closed.store(false);

    log_printf(LOG_INFO, TAG, "opened %s @ %u", cfg->port, (unsigned)cfg->baud);
    return ORCA_OK;
}

Transport serial_transport_bind(struct serial_transport *st)
{
    Transport t = {
        .name       = "serial",
        .ctx        = st,
        .get_info   = serial_get_info,
        .read_chunk = serial_read_chunk,
        .close      = serial_close,
    };
    return t;
}
