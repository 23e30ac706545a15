// Copyright (C) 2025, Moritz Scheer

#pragma once

#include <cstdint>

#include "../../core/async.hpp"
#include "../../core/settings.hpp"
#include "stream.hpp"

namespace wtwire
{
namespace networking
{
namespace webt
{

//
// Reads a stream header from a non-blocking source. poll() returns 0 once the header is read, WTWIRE_ERR_AGAIN
// while suspended, and otherwise either a stream header error (WTWIRE_ERR_UNKNOWN_STREAM,
// WTWIRE_ERR_INVALID_SESSION_ID) or an I/O error (WTWIRE_ERR_NOT_CONNECTED, WTWIRE_ERR_CLOSED). Bytes consumed from
// the source before a failure are not given back.
//
class read_header_t
{
  public:
    explicit read_header_t(async::source_t &src, const settings_t *settings = nullptr) noexcept;

    int poll() noexcept;

    stream_header_t value() const noexcept;

  private:
    typedef enum
    {
        READ_DISCRIMINANT,
        READ_SESSION_ID,
        DONE

    } state_t;

    int fail(int err) noexcept;

    async::source_t *src;

    const settings_t *settings;

    state_t state;

    async::get_varint_t varint;

    stream_kind_t kind;

    stream_header_t header;
};

}; // namespace webt
}; // namespace networking
}; // namespace wtwire
