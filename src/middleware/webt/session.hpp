// Copyright (C) 2025, Moritz Scheer

#pragma once

#include <cstdint>

#include "../../utils/types.hpp"
#include "../../utils/varint.hpp"

namespace wtwire
{
namespace networking
{
namespace webt
{

#define WEBTRANSPORT_ALPN "h3"

//
// A WebTransport session is identified by the stream id of the client-initiated bidirectional stream that carried
// its extended CONNECT request.
//
class session_id_t
{
  public:
    static int try_from_varint(varint_t varint, session_id_t &dest) noexcept;

    static bool is_valid(varint_t varint) noexcept;

    varint_t into_varint() const noexcept;

    bool operator==(const session_id_t &other) const noexcept;

    bool operator!=(const session_id_t &other) const noexcept;

  private:
    varint_t id;
};

}; // namespace webt
}; // namespace networking
}; // namespace wtwire
