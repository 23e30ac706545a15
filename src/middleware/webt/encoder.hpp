// Copyright (C) 2025, Moritz Scheer

#pragma once

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
// Writes a stream header to a non-blocking sink, the discriminant first and then the session id if any.
// poll() returns 0 once the whole header is written.
//
class write_header_t
{
  public:
    write_header_t(async::sink_t &sink, const stream_header_t &header, const settings_t *settings = nullptr) noexcept;

    int poll() noexcept;

  private:
    typedef enum
    {
        WRITE_DISCRIMINANT,
        WRITE_SESSION_ID,
        DONE

    } state_t;

    async::sink_t *sink;

    const settings_t *settings;

    stream_header_t header;

    state_t state;

    async::put_varint_t varint;
};

}; // namespace webt
}; // namespace networking
}; // namespace wtwire
