// Copyright (C) 2025, Moritz Scheer

#pragma once

#include <cstdint>
#include <netinet/in.h>

namespace wtwire
{
namespace networking
{

inline uint64_t bswap64(uint64_t n)
{
    return ((n & 0xFF00000000000000ULL) >> 56) | ((n & 0x00FF000000000000ULL) >> 40) |
           ((n & 0x0000FF0000000000ULL) >> 24) | ((n & 0x000000FF00000000ULL) >> 8) |
           ((n & 0x00000000FF000000ULL) << 8) | ((n & 0x0000000000FF0000ULL) << 24) |
           ((n & 0x000000000000FF00ULL) << 40) | ((n & 0x00000000000000FFULL) << 56);
}

inline uint64_t ntohll(uint64_t netlong64)
{
    return ntohs(1) == 1 ? netlong64 : bswap64(netlong64);
}

inline uint64_t htonll(uint64_t hostlong64)
{
    return htons(1) == 1 ? hostlong64 : bswap64(hostlong64);
}

}; // namespace networking
}; // namespace wtwire
