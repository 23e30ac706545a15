// Copyright (C) 2025, Moritz Scheer

#include <cstddef>
#include <cstdint>
#include <cstring>

#include "buffer.hpp"

namespace wtwire
{
namespace networking
{

/* ---------------------------------------------------- READER ------------------------------------------------------ */

reader_t::reader_t(const uint8_t *data, size_t datalen) noexcept : data(data), datalen(datalen), off(0)
{
}

size_t reader_t::capacity() const noexcept
{
    return datalen - off;
}

size_t reader_t::offset() const noexcept
{
    return off;
}

int reader_t::skip(size_t len) noexcept
{
    if (capacity() < len)
    {
        return WTWIRE_ERR_END_OF_BUFFER;
    }

    off += len;
    return 0;
}

const uint8_t *reader_t::buffer() const noexcept
{
    return data;
}

size_t reader_t::buffer_len() const noexcept
{
    return datalen;
}

const uint8_t *reader_t::buffer_remaining() const noexcept
{
    return data + off;
}

int reader_t::get_varint(varint_t &dest) noexcept
{
    if (capacity() == 0)
    {
        return WTWIRE_ERR_END_OF_BUFFER;
    }

    size_t varint_size = varint_t::parse_size(data[off]);
    if (capacity() < varint_size)
    {
        return WTWIRE_ERR_END_OF_BUFFER;
    }

    dest = varint_t::decode(data + off);
    off += varint_size;

    return 0;
}

int reader_t::get_bytes(const uint8_t *&dest, size_t len) noexcept
{
    if (capacity() < len)
    {
        return WTWIRE_ERR_END_OF_BUFFER;
    }

    dest = data + off;
    off += len;

    return 0;
}

child_t reader_t::child() noexcept
{
    return child_t(*this);
}

/* ----------------------------------------------------- CHILD ------------------------------------------------------ */

child_t::child_t(reader_t &parent) noexcept
    : reader_t(parent.buffer_remaining(), parent.capacity()), parent(&parent)
{
}

int child_t::commit() noexcept
{
    if (!parent)
    {
        return WTWIRE_ERR_INVALID_STATE;
    }

    /* bounded by the parent's capacity at creation */
    int res = parent->skip(offset());
    parent = nullptr;

    return res;
}

/* ---------------------------------------------------- WRITER ------------------------------------------------------ */

writer_t::writer_t(uint8_t *data, size_t datalen) noexcept : data(data), datalen(datalen), off(0)
{
}

size_t writer_t::capacity() const noexcept
{
    return datalen - off;
}

size_t writer_t::offset() const noexcept
{
    return off;
}

const uint8_t *writer_t::buffer_written() const noexcept
{
    return data;
}

int writer_t::put_varint(varint_t varint) noexcept
{
    if (capacity() < varint.size())
    {
        return WTWIRE_ERR_END_OF_BUFFER;
    }

    off += varint.encode(data + off);
    return 0;
}

int writer_t::put_bytes(const uint8_t *src, size_t srclen) noexcept
{
    if (capacity() < srclen)
    {
        return WTWIRE_ERR_END_OF_BUFFER;
    }

    if (srclen)
    {
        memcpy(data + off, src, srclen);
    }

    off += srclen;
    return 0;
}

/* ------------------------------------------------ VECTOR WRITER --------------------------------------------------- */

vector_writer_t::vector_writer_t(std::vector<uint8_t> &dest) noexcept : dest(&dest)
{
}

int vector_writer_t::put_varint(varint_t varint)
{
    size_t offset = dest->size();

    dest->resize(offset + varint.size());
    varint.encode(dest->data() + offset);

    return 0;
}

int vector_writer_t::put_bytes(const uint8_t *src, size_t srclen)
{
    dest->insert(dest->end(), src, src + srclen);
    return 0;
}

}; // namespace networking
}; // namespace wtwire
