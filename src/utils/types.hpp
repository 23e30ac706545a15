// Copyright (C) 2025, Moritz Scheer

#pragma once

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <sys/types.h>

namespace wtwire
{
namespace networking
{

/* -------------------------------------------- MACRO DECLARATIONS -------------------------------------------------- */

/* Capacity errors (synchronous path) */

#define WTWIRE_ERR_END_OF_BUFFER -1001

#define WTWIRE_ERR_VARINT_OVERFLOW -1002

/* Content errors (stream header) */

#define WTWIRE_ERR_UNKNOWN_STREAM -1011

#define WTWIRE_ERR_INVALID_SESSION_ID -1012

/* I/O errors (asynchronous path) */

#define WTWIRE_ERR_NOT_CONNECTED -1021

#define WTWIRE_ERR_CLOSED -1022

/* Task errors */

#define WTWIRE_ERR_INVALID_STATE -1031

/* Suspension: the underlying source or sink cannot make progress right now */

#define WTWIRE_ERR_AGAIN (-EAGAIN)

/* Stream id initiator and direction bits */

#define STREAM_ID_MASK 0x3

#define CLIENT_BIDI 0x0
#define SERVER_BIDI 0x1

#define CLIENT_UNI 0x2
#define SERVER_UNI 0x3

/* io_uring user data tags */

#define WTWIRE_OP_READ 1

#define WTWIRE_OP_WRITE 2

/* ------------------------------------------------------------------------------------------------------------------ */

}; // namespace networking
}; // namespace wtwire
