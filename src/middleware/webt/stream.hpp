// Copyright (C) 2025, Moritz Scheer

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "../../utils/types.hpp"
#include "../../utils/varint.hpp"
#include "../buffer.hpp"
#include "session.hpp"

namespace wtwire
{
namespace networking
{
namespace webt
{

typedef enum
{
    STREAM_TYPE_CONTROL = 0x00,
    STREAM_TYPE_QPACK_ENCODER = 0x02,
    STREAM_TYPE_QPACK_DECODER = 0x03,
    STREAM_TYPE_UNI_WEBTRANSPORT_STREAM = 0x54

} stream_type;

/* Reserved (greasing) stream types are 0x1f * N + 0x21 */

#define STREAM_TYPE_EXERCISE_BASE 0x21

#define STREAM_TYPE_EXERCISE_STEP 0x1f

/* ------------------------------------------- STRUCT DECLARATIONS -------------------------------------------------- */

struct stream_kind_t
{
    typedef enum
    {
        CONTROL,
        QPACK_ENCODER,
        QPACK_DECODER,
        WEBTRANSPORT,
        EXERCISE

    } tag_t;

    tag_t tag = CONTROL;

    //
    // Discriminant of an EXERCISE stream, unused otherwise.
    //
    varint_t exercise_id;

    static bool is_id_exercise(varint_t id) noexcept;

    static int parse(varint_t id, stream_kind_t &dest) noexcept;

    varint_t id() const noexcept;

    bool operator==(const stream_kind_t &other) const noexcept;
};

//
// Header prefixing every unidirectional HTTP/3 stream: the stream type, followed by the session id for WebTransport
// streams. A header carries a session id if and only if its kind is WEBTRANSPORT.
//
class stream_header_t
{
  public:
    static constexpr size_t MAX_SIZE = 2 * varint_t::MAX_SIZE;

    stream_header_t() noexcept;

    static stream_header_t new_control() noexcept;

    static stream_header_t new_qpack_encoder() noexcept;

    static stream_header_t new_qpack_decoder() noexcept;

    static stream_header_t new_webtransport(session_id_t session_id) noexcept;

    static int new_exercise(varint_t id, stream_header_t &dest) noexcept;

    //
    // Reads a header from any reader offering get_varint(). Returns WTWIRE_ERR_END_OF_BUFFER when the bytes run out
    // before the header is complete, WTWIRE_ERR_UNKNOWN_STREAM or WTWIRE_ERR_INVALID_SESSION_ID on bad content.
    // On any failure the reader may be left partially advanced, see read_from_buffer().
    //
    template <typename reader> static int read(reader &src, stream_header_t &dest) noexcept;

    //
    // Same as read(), but the reader's offset only moves when a whole header was read.
    //
    static int read_from_buffer(reader_t &src, stream_header_t &dest) noexcept;

    //
    // May leave dest partially written on failure.
    //
    template <typename writer> int write(writer &dest) const;

    //
    // Fails without writing anything if dest has less than write_size() bytes left.
    //
    int write_to_buffer(writer_t &dest) const noexcept;

    size_t write_size() const noexcept;

    stream_kind_t kind() const noexcept;

    std::optional<session_id_t> session_id() const noexcept;

  private:
    friend class read_header_t;

    stream_header_t(stream_kind_t kind, std::optional<session_id_t> session_id) noexcept;

    stream_kind_t stream_kind;

    std::optional<session_id_t> session;
};

/* -------------------------------------------- TEMPLATE DEFINITIONS ------------------------------------------------ */

template <typename reader> int stream_header_t::read(reader &src, stream_header_t &dest) noexcept
{
    varint_t kind_id;

    int res = src.get_varint(kind_id);
    if (res != 0)
    {
        return res;
    }

    stream_kind_t kind;

    res = stream_kind_t::parse(kind_id, kind);
    if (res != 0)
    {
        return res;
    }

    if (kind.tag != stream_kind_t::WEBTRANSPORT)
    {
        dest = stream_header_t(kind, std::nullopt);
        return 0;
    }

    varint_t varint;

    res = src.get_varint(varint);
    if (res != 0)
    {
        return res;
    }

    session_id_t session_id;

    res = session_id_t::try_from_varint(varint, session_id);
    if (res != 0)
    {
        return res;
    }

    dest = stream_header_t(kind, session_id);
    return 0;
}

template <typename writer> int stream_header_t::write(writer &dest) const
{
    int res = dest.put_varint(stream_kind.id());
    if (res != 0)
    {
        return res;
    }

    if (session)
    {
        return dest.put_varint(session->into_varint());
    }

    return 0;
}

}; // namespace webt
}; // namespace networking
}; // namespace wtwire
