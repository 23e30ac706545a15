// Copyright (C) 2025, Moritz Scheer

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <netinet/in.h>
#include <ngtcp2/ngtcp2.h>
#include <type_traits>

#include "helper.hpp"
#include "types.hpp"

namespace wtwire
{
namespace networking
{

//
// QUIC variable-length integer (RFC 9000, section 16). The two most significant bits of the first byte select an
// encoded length of 1, 2, 4 or 8 bytes, the remaining bits carry the value in network byte order.
//
// The value never exceeds MAX: anything wider than 32 bits only gets in through from_u64().
//
class varint_t
{
  public:
    static constexpr uint64_t MAX = NGTCP2_MAX_VARINT;

    static constexpr size_t MAX_SIZE = 8;

    constexpr varint_t() = default;

    constexpr varint_t(uint32_t value) noexcept : n(value)
    {
    }

    template <typename T>
        requires(std::is_integral_v<T> && sizeof(T) > sizeof(uint32_t))
    varint_t(T value) = delete;

    static int from_u64(uint64_t value, varint_t &dest) noexcept
    {
        if (value > MAX)
        {
            return WTWIRE_ERR_VARINT_OVERFLOW;
        }

        dest.n = value;
        return 0;
    }

    static size_t parse_size(uint8_t first) noexcept
    {
        return (size_t)(1u << (first >> 6));
    }

    constexpr size_t size() const noexcept
    {
        if (n < (1ULL << 6))
        {
            return 1;
        }
        if (n < (1ULL << 14))
        {
            return 2;
        }
        if (n < (1ULL << 30))
        {
            return 4;
        }
        return 8;
    }

    /* src must hold at least parse_size(*src) bytes */
    static varint_t decode(const uint8_t *src) noexcept
    {
        varint_t varint;

        switch (parse_size(*src))
        {
        case 1:
        {
            varint.n = *src;
            break;
        }
        case 2:
        {
            uint16_t n16;
            memcpy(&n16, src, 2);
            varint.n = ntohs(n16) & 0x3fff;
            break;
        }
        case 4:
        {
            uint32_t n32;
            memcpy(&n32, src, 4);
            varint.n = ntohl(n32) & 0x3fffffffu;
            break;
        }
        case 8:
        {
            uint64_t n64;
            memcpy(&n64, src, 8);
            varint.n = ntohll(n64) & 0x3fffffffffffffffULL;
            break;
        }
        }

        return varint;
    }

    /* dest must hold at least size() bytes, returns the number of bytes written */
    size_t encode(uint8_t *dest) const noexcept
    {
        size_t len = size();

        switch (len)
        {
        case 1:
        {
            *dest = (uint8_t)n;
            break;
        }
        case 2:
        {
            uint16_t n16 = htons((uint16_t)n);
            memcpy(dest, &n16, 2);
            *dest |= 0x40;
            break;
        }
        case 4:
        {
            uint32_t n32 = htonl((uint32_t)n);
            memcpy(dest, &n32, 4);
            *dest |= 0x80;
            break;
        }
        case 8:
        {
            uint64_t n64 = htonll(n);
            memcpy(dest, &n64, 8);
            *dest |= 0xc0;
            break;
        }
        }

        return len;
    }

    constexpr uint64_t value() const noexcept
    {
        return n;
    }

    constexpr operator uint64_t() const noexcept
    {
        return n;
    }

  private:
    uint64_t n = 0;
};

}; // namespace networking
}; // namespace wtwire
