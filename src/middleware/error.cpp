// Copyright (C) 2025, Moritz Scheer

#include <cerrno>
#include <cstdint>
#include <nghttp3/nghttp3.h>
#include <ngtcp2/ngtcp2.h>

#include "error.hpp"

namespace wtwire
{
namespace networking
{

int classify_io_error(ssize_t err) noexcept
{
    switch (err)
    {
    case -ENOTCONN:
    case WTWIRE_ERR_NOT_CONNECTED:
        return WTWIRE_ERR_NOT_CONNECTED;
    default:
        return WTWIRE_ERR_CLOSED;
    }
}

bool is_io_error(int err) noexcept
{
    return err == WTWIRE_ERR_NOT_CONNECTED || err == WTWIRE_ERR_CLOSED;
}

bool is_stream_header_error(int err) noexcept
{
    return err == WTWIRE_ERR_UNKNOWN_STREAM || err == WTWIRE_ERR_INVALID_SESSION_ID;
}

const char *strerror(int err) noexcept
{
    switch (err)
    {
    case 0:
        return "success";
    case WTWIRE_ERR_END_OF_BUFFER:
        return "end of buffer";
    case WTWIRE_ERR_VARINT_OVERFLOW:
        return "value exceeds varint range";
    case WTWIRE_ERR_UNKNOWN_STREAM:
        return "unknown stream type";
    case WTWIRE_ERR_INVALID_SESSION_ID:
        return "invalid session id";
    case WTWIRE_ERR_NOT_CONNECTED:
        return "not connected";
    case WTWIRE_ERR_CLOSED:
        return "closed";
    case WTWIRE_ERR_INVALID_STATE:
        return "task already completed";
    case WTWIRE_ERR_AGAIN:
        return "would block";
    default:
        return "unknown error";
    }
}

uint64_t infer_quic_error_code(int err) noexcept
{
    switch (err)
    {
    case 0:
        return NGHTTP3_H3_NO_ERROR;
    case WTWIRE_ERR_UNKNOWN_STREAM:
        return NGHTTP3_H3_STREAM_CREATION_ERROR;
    case WTWIRE_ERR_INVALID_SESSION_ID:
        return NGHTTP3_H3_ID_ERROR;
    case WTWIRE_ERR_END_OF_BUFFER:
    case WTWIRE_ERR_VARINT_OVERFLOW:
        return NGHTTP3_H3_FRAME_ERROR;
    case WTWIRE_ERR_NOT_CONNECTED:
    case WTWIRE_ERR_CLOSED:
        return NGHTTP3_H3_CLOSED_CRITICAL_STREAM;
    default:
        return nghttp3_err_infer_quic_app_error_code(err);
    }
}

int set_application_error(ngtcp2_ccerr *ccerr, int err) noexcept
{
    ngtcp2_ccerr_set_application_error(ccerr, infer_quic_error_code(err), nullptr, 0);

    return NGTCP2_ERR_CALLBACK_FAILURE;
}

}; // namespace networking
}; // namespace wtwire
