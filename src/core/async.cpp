// Copyright(C) 2025, Moritz Scheer

#include <cstdint>
#include <cstring>
#include <new>

#include "../middleware/error.hpp"
#include "async.hpp"

namespace wtwire
{
namespace networking
{
namespace async
{

/* -------------------------------------------------- GET VARINT ---------------------------------------------------- */

get_varint_t::get_varint_t(source_t &src) noexcept
    : src(&src), scratch{}, offset(0), varint_size(0), result(), done(false)
{
}

int get_varint_t::poll() noexcept
{
    if (done)
    {
        return WTWIRE_ERR_INVALID_STATE;
    }

    ssize_t res;

    if (offset == 0)
    {
        res = src->read(scratch, 1);
        if (res == WTWIRE_ERR_AGAIN)
        {
            return WTWIRE_ERR_AGAIN;
        }

        if (res <= 0)
        {
            done = true;
            return res == 0 ? WTWIRE_ERR_CLOSED : classify_io_error(res);
        }

        offset = 1;
        varint_size = varint_t::parse_size(scratch[0]);
    }

    while (offset < varint_size)
    {
        res = src->read(scratch + offset, varint_size - offset);
        if (res == WTWIRE_ERR_AGAIN)
        {
            return WTWIRE_ERR_AGAIN;
        }

        if (res <= 0)
        {
            done = true;
            return res == 0 ? WTWIRE_ERR_CLOSED : classify_io_error(res);
        }

        offset += (size_t)res;
    }

    /* exactly varint_size bytes are buffered */
    result = varint_t::decode(scratch);

    done = true;
    return 0;
}

varint_t get_varint_t::value() const noexcept
{
    return result;
}

/* -------------------------------------------------- GET BUFFER ---------------------------------------------------- */

get_buffer_t::get_buffer_t(source_t &src, uint8_t *dest, size_t destlen) noexcept
    : src(&src), dest(dest), destlen(destlen), offset(0), done(false)
{
}

int get_buffer_t::poll() noexcept
{
    if (done)
    {
        return WTWIRE_ERR_INVALID_STATE;
    }

    while (offset < destlen)
    {
        ssize_t res = src->read(dest + offset, destlen - offset);
        if (res == WTWIRE_ERR_AGAIN)
        {
            return WTWIRE_ERR_AGAIN;
        }

        if (res <= 0)
        {
            done = true;
            return res == 0 ? WTWIRE_ERR_CLOSED : classify_io_error(res);
        }

        offset += (size_t)res;
    }

    done = true;
    return 0;
}

/* -------------------------------------------------- PUT VARINT ---------------------------------------------------- */

put_varint_t::put_varint_t(sink_t &sink, varint_t varint) noexcept
    : sink(&sink), scratch{}, offset(0), varint_size(0), done(false)
{
    /* scratch holds varint_t::MAX_SIZE bytes, enough for any value */
    varint_size = varint.encode(scratch);
}

ssize_t put_varint_t::poll() noexcept
{
    if (done)
    {
        return WTWIRE_ERR_INVALID_STATE;
    }

    while (offset < varint_size)
    {
        ssize_t res = sink->write(scratch + offset, varint_size - offset);
        if (res == WTWIRE_ERR_AGAIN)
        {
            return WTWIRE_ERR_AGAIN;
        }

        /* a sink accepting nothing of a non-empty write is treated as closed */
        if (res <= 0)
        {
            done = true;
            return res == 0 ? WTWIRE_ERR_CLOSED : classify_io_error(res);
        }

        offset += (size_t)res;
    }

    done = true;
    return (ssize_t)varint_size;
}

/* -------------------------------------------------- PUT BUFFER ---------------------------------------------------- */

put_buffer_t::put_buffer_t(sink_t &sink, const uint8_t *src, size_t srclen) noexcept
    : sink(&sink), src(src), srclen(srclen), offset(0), done(false)
{
}

int put_buffer_t::poll() noexcept
{
    if (done)
    {
        return WTWIRE_ERR_INVALID_STATE;
    }

    while (offset < srclen)
    {
        ssize_t res = sink->write(src + offset, srclen - offset);
        if (res == WTWIRE_ERR_AGAIN)
        {
            return WTWIRE_ERR_AGAIN;
        }

        if (res <= 0)
        {
            done = true;
            return res == 0 ? WTWIRE_ERR_CLOSED : classify_io_error(res);
        }

        offset += (size_t)res;
    }

    done = true;
    return 0;
}

/* ------------------------------------------------- SLICE SOURCE --------------------------------------------------- */

slice_source_t::slice_source_t(const uint8_t *data, size_t datalen) noexcept : data(data), datalen(datalen)
{
}

ssize_t slice_source_t::read(uint8_t *dest, size_t destlen) noexcept
{
    size_t n = destlen < datalen ? destlen : datalen;

    if (n)
    {
        memcpy(dest, data, n);
    }

    data += n;
    datalen -= n;

    return (ssize_t)n;
}

size_t slice_source_t::remaining() const noexcept
{
    return datalen;
}

/* -------------------------------------------------- VECTOR SINK --------------------------------------------------- */

vector_sink_t::vector_sink_t(std::vector<uint8_t> &dest) noexcept : dest(&dest)
{
}

ssize_t vector_sink_t::write(const uint8_t *src, size_t srclen) noexcept
{
    try
    {
        dest->insert(dest->end(), src, src + srclen);
    }
    catch (const std::bad_alloc &)
    {
        return -ENOMEM;
    }

    return (ssize_t)srclen;
}

}; // namespace async
}; // namespace networking
}; // namespace wtwire
