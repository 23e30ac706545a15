// Copyright (C) 2025, Moritz Scheer

#include "../error.hpp"
#include "encoder.hpp"

namespace wtwire
{
namespace networking
{
namespace webt
{

write_header_t::write_header_t(async::sink_t &sink, const stream_header_t &header, const settings_t *settings) noexcept
    : sink(&sink), settings(settings), header(header), state(WRITE_DISCRIMINANT), varint(sink, header.kind().id())
{
}

int write_header_t::poll() noexcept
{
    if (state == DONE)
    {
        return WTWIRE_ERR_INVALID_STATE;
    }

    ssize_t res = varint.poll();
    if (res == WTWIRE_ERR_AGAIN)
    {
        return WTWIRE_ERR_AGAIN;
    }

    if (res < 0)
    {
        log(settings, "stream header: %s", strerror((int)res));
        state = DONE;
        return (int)res;
    }

    std::optional<session_id_t> session_id = header.session_id();

    if (state == WRITE_DISCRIMINANT && session_id)
    {
        varint = async::put_varint_t(*sink, session_id->into_varint());
        state = WRITE_SESSION_ID;
        return poll();
    }

    state = DONE;
    return 0;
}

}; // namespace webt
}; // namespace networking
}; // namespace wtwire
