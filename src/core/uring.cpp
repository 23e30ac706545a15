// Copyright(C) 2025, Moritz Scheer

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <liburing.h>
#include <liburing/io_uring.h>
#include <sys/socket.h>

#include "../utils/types.hpp"
#include "uring.hpp"

namespace wtwire
{
namespace networking
{

uring_stream_t::uring_stream_t() noexcept
    : ring{}, ring_ready(false), fd(-1), settings(nullptr), buffer_size(0), rx{}, tx{}
{
}

uring_stream_t::~uring_stream_t()
{
    cleanup();
}

int uring_stream_t::setup(int socket, const settings_t *settings_r) noexcept
{
    /* release the ring and buffers of a previous setup */
    cleanup();

    settings_t defaults;
    settings_default(&defaults);

    settings = settings_r;

    const settings_t *config = settings ? settings : &defaults;
    buffer_size = config->buffer_size;

    int res = io_uring_queue_init(config->ring_entries, &ring, 0);
    if (res < 0)
    {
        log(settings, "uring: queue init failed: %s", ::strerror(-res));
        return res;
    }

    ring_ready = true;

    rx.buf = (uint8_t *)malloc(buffer_size);
    tx.buf = (uint8_t *)malloc(buffer_size);

    if (!rx.buf || !tx.buf)
    {
        cleanup();
        return -ENOMEM;
    }

    fd = socket;

    return 0;
}

void uring_stream_t::cleanup() noexcept
{
    if (ring_ready)
    {
        io_uring_queue_exit(&ring);
        ring_ready = false;
    }

    if (rx.buf)
    {
        free(rx.buf);
    }

    if (tx.buf)
    {
        free(tx.buf);
    }

    rx = {};
    tx = {};
    fd = -1;
}

ssize_t uring_stream_t::read(uint8_t *dest, size_t destlen) noexcept
{
    if (destlen == 0)
    {
        return 0;
    }

    if (rx.state == uring_op_t::IN_FLIGHT)
    {
        reap();
    }

    switch (rx.state)
    {
    case uring_op_t::IDLE:
    {
        int res = submit_read();
        return res < 0 ? res : WTWIRE_ERR_AGAIN;
    }
    case uring_op_t::IN_FLIGHT:
    {
        return WTWIRE_ERR_AGAIN;
    }
    case uring_op_t::COMPLETE:
    default:
    {
        if (rx.res < 0)
        {
            ssize_t err = rx.res;
            rx.state = uring_op_t::IDLE;
            return err;
        }

        /* end of stream, sticky */
        if (rx.res == 0)
        {
            return 0;
        }

        size_t avail = (size_t)rx.res - rx.off;
        size_t n = destlen < avail ? destlen : avail;

        memcpy(dest, rx.buf + rx.off, n);
        rx.off += n;

        if (rx.off == (size_t)rx.res)
        {
            rx.state = uring_op_t::IDLE;
        }

        return (ssize_t)n;
    }
    }
}

ssize_t uring_stream_t::write(const uint8_t *src, size_t srclen) noexcept
{
    if (srclen == 0)
    {
        return 0;
    }

    if (tx.state == uring_op_t::IN_FLIGHT)
    {
        reap();
    }

    switch (tx.state)
    {
    case uring_op_t::IDLE:
    {
        int res = submit_write(src, srclen);
        return res < 0 ? res : WTWIRE_ERR_AGAIN;
    }
    case uring_op_t::IN_FLIGHT:
    {
        return WTWIRE_ERR_AGAIN;
    }
    case uring_op_t::COMPLETE:
    default:
    {
        tx.state = uring_op_t::IDLE;
        return tx.res;
    }
    }
}

int uring_stream_t::wait() noexcept
{
    if (rx.state != uring_op_t::IN_FLIGHT && tx.state != uring_op_t::IN_FLIGHT)
    {
        return 0;
    }

    int res = io_uring_submit_and_wait(&ring, 1);
    if (res < 0 && res != -EINTR)
    {
        log(settings, "uring: submit and wait failed: %s", ::strerror(-res));
        return res;
    }

    reap();

    return 0;
}

int uring_stream_t::submit_read() noexcept
{
    io_uring_sqe *sqe = io_uring_get_sqe(&ring);
    if (!sqe)
    {
        log(settings, "uring: submission queue full");
        return -EBUSY;
    }

    io_uring_prep_recv(sqe, fd, rx.buf, buffer_size, 0);

    io_uring_sqe_set_data(sqe, (void *)WTWIRE_OP_READ);

    int res = io_uring_submit(&ring);
    if (res < 0)
    {
        log(settings, "uring: submit failed: %s", ::strerror(-res));
        return res;
    }

    rx.off = 0;
    rx.state = uring_op_t::IN_FLIGHT;

    return 0;
}

int uring_stream_t::submit_write(const uint8_t *src, size_t srclen) noexcept
{
    io_uring_sqe *sqe = io_uring_get_sqe(&ring);
    if (!sqe)
    {
        log(settings, "uring: submission queue full");
        return -EBUSY;
    }

    size_t len = srclen < buffer_size ? srclen : buffer_size;

    memcpy(tx.buf, src, len);

    io_uring_prep_send(sqe, fd, tx.buf, len, MSG_NOSIGNAL);

    io_uring_sqe_set_data(sqe, (void *)WTWIRE_OP_WRITE);

    int res = io_uring_submit(&ring);
    if (res < 0)
    {
        log(settings, "uring: submit failed: %s", ::strerror(-res));
        return res;
    }

    tx.state = uring_op_t::IN_FLIGHT;

    return 0;
}

void uring_stream_t::reap() noexcept
{
    unsigned count = io_uring_peek_batch_cqe(&ring, cqes, 2);

    for (unsigned i = 0; i < count; i++)
    {
        uint64_t op = (uint64_t)io_uring_cqe_get_data(cqes[i]);
        int res = cqes[i]->res;

        uring_op_t &target = op == WTWIRE_OP_READ ? rx : tx;

        /* interrupted, resubmitted on the next call */
        if (res == -EINTR)
        {
            target.state = uring_op_t::IDLE;
            continue;
        }

        if (res < 0)
        {
            log(settings, "uring: %s failed: %s", op == WTWIRE_OP_READ ? "recv" : "send", ::strerror(-res));
        }
        else if (res == 0 && op == WTWIRE_OP_READ)
        {
            log(settings, "uring: end of stream on fd %d", fd);
        }

        target.res = res;
        target.state = uring_op_t::COMPLETE;
    }

    io_uring_cq_advance(&ring, count);
}

}; // namespace networking
}; // namespace wtwire
