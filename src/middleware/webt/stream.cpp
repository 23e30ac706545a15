// Copyright (C) 2025, Moritz Scheer

#include <cassert>
#include <cstdint>

#include "stream.hpp"

namespace wtwire
{
namespace networking
{
namespace webt
{

/* -------------------------------------------------- STREAM KIND --------------------------------------------------- */

bool stream_kind_t::is_id_exercise(varint_t id) noexcept
{
    return id.value() >= STREAM_TYPE_EXERCISE_BASE && (id.value() - STREAM_TYPE_EXERCISE_BASE) % STREAM_TYPE_EXERCISE_STEP == 0;
}

int stream_kind_t::parse(varint_t id, stream_kind_t &dest) noexcept
{
    switch (id.value())
    {
    case STREAM_TYPE_CONTROL:
    {
        dest = {.tag = CONTROL};
        return 0;
    }
    case STREAM_TYPE_QPACK_ENCODER:
    {
        dest = {.tag = QPACK_ENCODER};
        return 0;
    }
    case STREAM_TYPE_QPACK_DECODER:
    {
        dest = {.tag = QPACK_DECODER};
        return 0;
    }
    case STREAM_TYPE_UNI_WEBTRANSPORT_STREAM:
    {
        dest = {.tag = WEBTRANSPORT};
        return 0;
    }
    default:
    {
        if (!is_id_exercise(id))
        {
            return WTWIRE_ERR_UNKNOWN_STREAM;
        }

        dest = {.tag = EXERCISE, .exercise_id = id};
        return 0;
    }
    }
}

varint_t stream_kind_t::id() const noexcept
{
    switch (tag)
    {
    case CONTROL:
        return STREAM_TYPE_CONTROL;
    case QPACK_ENCODER:
        return STREAM_TYPE_QPACK_ENCODER;
    case QPACK_DECODER:
        return STREAM_TYPE_QPACK_DECODER;
    case WEBTRANSPORT:
        return STREAM_TYPE_UNI_WEBTRANSPORT_STREAM;
    case EXERCISE:
        return exercise_id;
    }

    return exercise_id;
}

bool stream_kind_t::operator==(const stream_kind_t &other) const noexcept
{
    if (tag != other.tag)
    {
        return false;
    }

    return tag != EXERCISE || exercise_id.value() == other.exercise_id.value();
}

/* ------------------------------------------------- STREAM HEADER -------------------------------------------------- */

stream_header_t::stream_header_t() noexcept : stream_kind{.tag = stream_kind_t::CONTROL}, session()
{
}

stream_header_t::stream_header_t(stream_kind_t kind, std::optional<session_id_t> session_id) noexcept
    : stream_kind(kind), session(session_id)
{
    assert(session.has_value() == (kind.tag == stream_kind_t::WEBTRANSPORT));
    assert(kind.tag != stream_kind_t::EXERCISE || stream_kind_t::is_id_exercise(kind.exercise_id));
}

stream_header_t stream_header_t::new_control() noexcept
{
    return stream_header_t({.tag = stream_kind_t::CONTROL}, std::nullopt);
}

stream_header_t stream_header_t::new_qpack_encoder() noexcept
{
    return stream_header_t({.tag = stream_kind_t::QPACK_ENCODER}, std::nullopt);
}

stream_header_t stream_header_t::new_qpack_decoder() noexcept
{
    return stream_header_t({.tag = stream_kind_t::QPACK_DECODER}, std::nullopt);
}

stream_header_t stream_header_t::new_webtransport(session_id_t session_id) noexcept
{
    return stream_header_t({.tag = stream_kind_t::WEBTRANSPORT}, session_id);
}

int stream_header_t::new_exercise(varint_t id, stream_header_t &dest) noexcept
{
    if (!stream_kind_t::is_id_exercise(id))
    {
        return WTWIRE_ERR_UNKNOWN_STREAM;
    }

    dest = stream_header_t({.tag = stream_kind_t::EXERCISE, .exercise_id = id}, std::nullopt);
    return 0;
}

int stream_header_t::read_from_buffer(reader_t &src, stream_header_t &dest) noexcept
{
    child_t child = src.child();

    int res = read(child, dest);
    if (res != 0)
    {
        return res;
    }

    return child.commit();
}

int stream_header_t::write_to_buffer(writer_t &dest) const noexcept
{
    if (dest.capacity() < write_size())
    {
        return WTWIRE_ERR_END_OF_BUFFER;
    }

    return write(dest);
}

size_t stream_header_t::write_size() const noexcept
{
    size_t size = stream_kind.id().size();

    if (session)
    {
        size += session->into_varint().size();
    }

    return size;
}

stream_kind_t stream_header_t::kind() const noexcept
{
    return stream_kind;
}

std::optional<session_id_t> stream_header_t::session_id() const noexcept
{
    return session;
}

}; // namespace webt
}; // namespace networking
}; // namespace wtwire
