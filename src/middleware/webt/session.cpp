// Copyright (C) 2025, Moritz Scheer

#include <cstdint>

#include "session.hpp"

namespace wtwire
{
namespace networking
{
namespace webt
{

int session_id_t::try_from_varint(varint_t varint, session_id_t &dest) noexcept
{
    if (!is_valid(varint))
    {
        return WTWIRE_ERR_INVALID_SESSION_ID;
    }

    dest.id = varint;
    return 0;
}

bool session_id_t::is_valid(varint_t varint) noexcept
{
    return (varint.value() & STREAM_ID_MASK) == CLIENT_BIDI;
}

varint_t session_id_t::into_varint() const noexcept
{
    return id;
}

bool session_id_t::operator==(const session_id_t &other) const noexcept
{
    return id.value() == other.id.value();
}

bool session_id_t::operator!=(const session_id_t &other) const noexcept
{
    return id.value() != other.id.value();
}

}; // namespace webt
}; // namespace networking
}; // namespace wtwire
