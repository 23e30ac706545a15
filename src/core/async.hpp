// Copyright(C) 2025, Moritz Scheer

#pragma once

#include <cstddef>
#include <cstdint>
#include <sys/types.h>
#include <vector>

#include "../utils/types.hpp"
#include "../utils/varint.hpp"

namespace wtwire
{
namespace networking
{
namespace async
{

/* ------------------------------------------- CLASS DECLARATIONS --------------------------------------------------- */

//
// Non-blocking byte source. read() copies up to destlen bytes into dest and returns the number of bytes copied,
// WTWIRE_ERR_AGAIN when no progress is possible right now, or a negative transport error. Returning 0 for a
// non-empty request means the source is closed.
//
class source_t
{
  public:
    virtual ~source_t() = default;

    virtual ssize_t read(uint8_t *dest, size_t destlen) noexcept = 0;
};

//
// Non-blocking byte sink, symmetric to source_t. A sink returning WTWIRE_ERR_AGAIN is resumed with the same bytes.
//
class sink_t
{
  public:
    virtual ~sink_t() = default;

    virtual ssize_t write(const uint8_t *src, size_t srclen) noexcept = 0;
};

//
// Each task below is a single-use state machine. poll() returns WTWIRE_ERR_AGAIN while suspended on its source or
// sink, a non-negative value on completion and a negative error otherwise. Once completed or failed, further polls
// return WTWIRE_ERR_INVALID_STATE.
//

class get_varint_t
{
  public:
    explicit get_varint_t(source_t &src) noexcept;

    int poll() noexcept;

    varint_t value() const noexcept;

  private:
    source_t *src;

    uint8_t scratch[varint_t::MAX_SIZE];

    size_t offset;

    size_t varint_size;

    varint_t result;

    bool done;
};

class get_buffer_t
{
  public:
    get_buffer_t(source_t &src, uint8_t *dest, size_t destlen) noexcept;

    int poll() noexcept;

  private:
    source_t *src;

    uint8_t *dest;

    size_t destlen;

    size_t offset;

    bool done;
};

class put_varint_t
{
  public:
    put_varint_t(sink_t &sink, varint_t varint) noexcept;

    //
    // Returns the encoded size of the varint once all of it is written.
    //
    ssize_t poll() noexcept;

  private:
    sink_t *sink;

    uint8_t scratch[varint_t::MAX_SIZE];

    size_t offset;

    size_t varint_size;

    bool done;
};

class put_buffer_t
{
  public:
    put_buffer_t(sink_t &sink, const uint8_t *src, size_t srclen) noexcept;

    int poll() noexcept;

  private:
    sink_t *sink;

    const uint8_t *src;

    size_t srclen;

    size_t offset;

    bool done;
};

//
// In-memory source, hands out the slice and reports 0 once it is exhausted.
//
class slice_source_t : public source_t
{
  public:
    slice_source_t(const uint8_t *data, size_t datalen) noexcept;

    ssize_t read(uint8_t *dest, size_t destlen) noexcept override;

    size_t remaining() const noexcept;

  private:
    const uint8_t *data;

    size_t datalen;
};

//
// In-memory sink, appends everything it is given.
//
class vector_sink_t : public sink_t
{
  public:
    explicit vector_sink_t(std::vector<uint8_t> &dest) noexcept;

    ssize_t write(const uint8_t *src, size_t srclen) noexcept override;

  private:
    std::vector<uint8_t> *dest;
};

/* ------------------------------------------------------------------------------------------------------------------ */

}; // namespace async
}; // namespace networking
}; // namespace wtwire
