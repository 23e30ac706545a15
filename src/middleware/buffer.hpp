// Copyright (C) 2025, Moritz Scheer

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "../utils/types.hpp"
#include "../utils/varint.hpp"

namespace wtwire
{
namespace networking
{

class child_t;

/* ------------------------------------------- CLASS DECLARATIONS --------------------------------------------------- */

//
// Zero-copy reader over an immutable byte slice. The offset only advances on success, a failed read leaves it
// untouched. Slices returned by get_bytes() borrow from the underlying buffer, not from the reader.
//
class reader_t
{
  public:
    reader_t(const uint8_t *data, size_t datalen) noexcept;

    size_t capacity() const noexcept;

    size_t offset() const noexcept;

    int skip(size_t len) noexcept;

    //
    // Entire underlying buffer, regardless of the offset.
    //
    const uint8_t *buffer() const noexcept;

    size_t buffer_len() const noexcept;

    const uint8_t *buffer_remaining() const noexcept;

    int get_varint(varint_t &dest) noexcept;

    int get_bytes(const uint8_t *&dest, size_t len) noexcept;

    child_t child() noexcept;

  private:
    const uint8_t *data;

    size_t datalen;

    size_t off;
};

//
// Speculative copy of a parent reader's remaining bytes. commit() advances the parent by what was read here,
// destroying the child without committing leaves the parent as it was.
//
class child_t : public reader_t
{
  public:
    child_t(const child_t &) = delete;

    child_t &operator=(const child_t &) = delete;

    int commit() noexcept;

  private:
    friend class reader_t;

    explicit child_t(reader_t &parent) noexcept;

    reader_t *parent;
};

//
// Zero-copy writer over a fixed mutable byte slice. Writes are all or nothing.
//
class writer_t
{
  public:
    writer_t(uint8_t *data, size_t datalen) noexcept;

    size_t capacity() const noexcept;

    size_t offset() const noexcept;

    const uint8_t *buffer_written() const noexcept;

    int put_varint(varint_t varint) noexcept;

    int put_bytes(const uint8_t *src, size_t srclen) noexcept;

  private:
    uint8_t *data;

    size_t datalen;

    size_t off;
};

//
// Writer appending to a growable vector, put operations never fail.
//
class vector_writer_t
{
  public:
    explicit vector_writer_t(std::vector<uint8_t> &dest) noexcept;

    int put_varint(varint_t varint);

    int put_bytes(const uint8_t *src, size_t srclen);

  private:
    std::vector<uint8_t> *dest;
};

/* ------------------------------------------------------------------------------------------------------------------ */

}; // namespace networking
}; // namespace wtwire
