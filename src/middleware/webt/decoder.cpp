// Copyright (C) 2025, Moritz Scheer

#include <cstdint>
#include <optional>

#include "../error.hpp"
#include "decoder.hpp"

namespace wtwire
{
namespace networking
{
namespace webt
{

read_header_t::read_header_t(async::source_t &src, const settings_t *settings) noexcept
    : src(&src), settings(settings), state(READ_DISCRIMINANT), varint(src), kind(), header()
{
}

int read_header_t::poll() noexcept
{
    int res;

    switch (state)
    {
    case READ_DISCRIMINANT:
    {
        res = varint.poll();
        if (res == WTWIRE_ERR_AGAIN)
        {
            return res;
        }

        if (res != 0)
        {
            return fail(res);
        }

        res = stream_kind_t::parse(varint.value(), kind);
        if (res != 0)
        {
            log(settings, "stream header: unknown stream type 0x%llx", (unsigned long long)varint.value().value());
            return fail(res);
        }

        if (kind.tag != stream_kind_t::WEBTRANSPORT)
        {
            header = stream_header_t(kind, std::nullopt);
            state = DONE;
            return 0;
        }

        varint = async::get_varint_t(*src);
        state = READ_SESSION_ID;
    }
        [[fallthrough]];
    case READ_SESSION_ID:
    {
        res = varint.poll();
        if (res == WTWIRE_ERR_AGAIN)
        {
            return res;
        }

        if (res != 0)
        {
            return fail(res);
        }

        session_id_t session_id;

        res = session_id_t::try_from_varint(varint.value(), session_id);
        if (res != 0)
        {
            log(settings, "stream header: invalid session id %llu", (unsigned long long)varint.value().value());
            return fail(res);
        }

        header = stream_header_t(kind, session_id);
        state = DONE;
        return 0;
    }
    case DONE:
    default:
        return WTWIRE_ERR_INVALID_STATE;
    }
}

stream_header_t read_header_t::value() const noexcept
{
    return header;
}

int read_header_t::fail(int err) noexcept
{
    if (is_io_error(err))
    {
        log(settings, "stream header: %s", strerror(err));
    }

    state = DONE;
    return err;
}

}; // namespace webt
}; // namespace networking
}; // namespace wtwire
