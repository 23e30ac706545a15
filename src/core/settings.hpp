// Copyright (C) 2025, Moritz Scheer

#pragma once

#include <cstddef>
#include <cstdint>
#include <ngtcp2/ngtcp2.h>

namespace wtwire
{
namespace networking
{

/* -------------------------------------------- MACRO DECLARATIONS -------------------------------------------------- */

#define SQES 8

#define BUFFER_SHIFT 12 // 4KB

#define BUFFER_SIZE (1U << BUFFER_SHIFT)

#define LOG_LINE_SIZE 256

/* ------------------------------------------- STRUCT DECLARATIONS -------------------------------------------------- */

struct settings_t
{
    //
    // Receives one formatted line per event, nothing is logged when null.
    //
    ngtcp2_printf log_printf;

    void *user_data;

    //
    // Submission queue depth of the io_uring instance backing a transport.
    //
    uint32_t ring_entries;

    //
    // Staging buffer size per direction of an io_uring transport.
    //
    size_t buffer_size;
};

/* ------------------------------------------- FUNCTION DECLARATIONS ------------------------------------------------ */

void settings_default(settings_t *settings) noexcept;

//
// Formats one line and hands it to settings->log_printf. Does nothing when settings or the callback is null, lines
// longer than LOG_LINE_SIZE are truncated.
//
void log(const settings_t *settings, const char *format, ...) noexcept;

/* ------------------------------------------------------------------------------------------------------------------ */

}; // namespace networking
}; // namespace wtwire
