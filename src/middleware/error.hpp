// Copyright (C) 2025, Moritz Scheer

#pragma once

#include <cstdint>
#include <ngtcp2/ngtcp2.h>
#include <sys/types.h>

#include "../utils/types.hpp"

namespace wtwire
{
namespace networking
{

/* ------------------------------------------- FUNCTION DECLARATIONS ------------------------------------------------ */

//
// Maps a raw transport error (negative errno) to WTWIRE_ERR_NOT_CONNECTED or WTWIRE_ERR_CLOSED.
//
int classify_io_error(ssize_t err) noexcept;

bool is_io_error(int err) noexcept;

bool is_stream_header_error(int err) noexcept;

const char *strerror(int err) noexcept;

//
// HTTP/3 application error code to close the connection with after a codec failure.
//
uint64_t infer_quic_error_code(int err) noexcept;

int set_application_error(ngtcp2_ccerr *ccerr, int err) noexcept;

/* ------------------------------------------------------------------------------------------------------------------ */

}; // namespace networking
}; // namespace wtwire
