// Copyright (C) 2025, Moritz Scheer

#include <cstdarg>
#include <cstdio>

#include "settings.hpp"

namespace wtwire
{
namespace networking
{

void settings_default(settings_t *settings) noexcept
{
    *settings = settings_t{
        .log_printf = nullptr,
        .user_data = nullptr,
        .ring_entries = SQES,
        .buffer_size = BUFFER_SIZE,
    };
}

void log(const settings_t *settings, const char *format, ...) noexcept
{
    if (!settings || !settings->log_printf)
    {
        return;
    }

    char line[LOG_LINE_SIZE];

    va_list ap;
    va_start(ap, format);
    vsnprintf(line, sizeof(line), format, ap);
    va_end(ap);

    settings->log_printf(settings->user_data, "%s", line);
}

}; // namespace networking
}; // namespace wtwire
