// Copyright(C) 2025, Moritz Scheer

#pragma once

#include <cstddef>
#include <cstdint>
#include <liburing.h>
#include <sys/types.h>

#include "async.hpp"
#include "settings.hpp"

namespace wtwire
{
namespace networking
{

/* ------------------------------------------- STRUCT DECLARATIONS -------------------------------------------------- */

struct uring_op_t
{
    typedef enum
    {
        IDLE,
        IN_FLIGHT,
        COMPLETE

    } state_t;

    uint8_t *buf;

    size_t off;

    int res;

    state_t state;
};

/* ------------------------------------------- CLASS DECLARATIONS --------------------------------------------------- */

//
// Byte source and sink over a connected stream socket, backed by its own io_uring instance. At most one receive
// and one send are in flight at a time, each staged through a buffer of settings->buffer_size bytes.
//
// write() stages the caller's bytes and reports WTWIRE_ERR_AGAIN until the send completes, it must then be called
// again with the same bytes to collect the number of bytes sent.
//
class uring_stream_t : public async::source_t, public async::sink_t
{
  public:
    uring_stream_t() noexcept;

    ~uring_stream_t() override;

    uring_stream_t(const uring_stream_t &) = delete;

    uring_stream_t &operator=(const uring_stream_t &) = delete;

    //
    // Falls back to settings_default() values when settings is null. Calling setup() again releases the previous ring
    // and buffers first.
    //
    int setup(int fd, const settings_t *settings) noexcept;

    void cleanup() noexcept;

    ssize_t read(uint8_t *dest, size_t destlen) noexcept override;

    ssize_t write(const uint8_t *src, size_t srclen) noexcept override;

    //
    // Blocks until an in-flight operation completes, returns immediately when nothing is in flight.
    //
    int wait() noexcept;

  private:
    int submit_read() noexcept;

    int submit_write(const uint8_t *src, size_t srclen) noexcept;

    void reap() noexcept;

    io_uring ring;

    io_uring_cqe *cqes[2]{};

    bool ring_ready;

    int fd;

    const settings_t *settings;

    size_t buffer_size;

    uring_op_t rx;

    uring_op_t tx;
};

/* ------------------------------------------------------------------------------------------------------------------ */

}; // namespace networking
}; // namespace wtwire
