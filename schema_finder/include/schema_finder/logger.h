/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <string>
#include <cstring>

#ifndef SCHEMA_FINDER_LOGGING_DEFINED

#ifdef USE_SCHEMA_FINDER_LOGGING
// implemented by the host application
extern "C"
{
    void schema_finder_log(int level, const char* str, size_t sz);
}
#define SCHEMA_FINDER_LOG_BACKEND(level, message) schema_finder_log(level, (message).c_str(), (message).length())

#include <fmt/format.h>

// Logging macros with levels (0=DEBUG, 1=TRACE, 2=INFO, 3=WARNING, 4=ERROR, 5=CRITICAL)
#define SCHEMA_FINDER_DEBUG(format_str, ...)                                                                           \
    do                                                                                                                 \
    {                                                                                                                  \
        auto formatted = fmt::format(format_str, ##__VA_ARGS__);                                                       \
        SCHEMA_FINDER_LOG_BACKEND(0, formatted);                                                                       \
    } while (0)

#define SCHEMA_FINDER_TRACE(format_str, ...)                                                                           \
    do                                                                                                                 \
    {                                                                                                                  \
        auto formatted = fmt::format(format_str, ##__VA_ARGS__);                                                       \
        SCHEMA_FINDER_LOG_BACKEND(1, formatted);                                                                       \
    } while (0)

#define SCHEMA_FINDER_INFO(format_str, ...)                                                                            \
    do                                                                                                                 \
    {                                                                                                                  \
        auto formatted = fmt::format(format_str, ##__VA_ARGS__);                                                       \
        SCHEMA_FINDER_LOG_BACKEND(2, formatted);                                                                       \
    } while (0)

#define SCHEMA_FINDER_WARNING(format_str, ...)                                                                         \
    do                                                                                                                 \
    {                                                                                                                  \
        auto formatted = fmt::format(format_str, ##__VA_ARGS__);                                                       \
        SCHEMA_FINDER_LOG_BACKEND(3, formatted);                                                                       \
    } while (0)

#define SCHEMA_FINDER_ERROR(format_str, ...)                                                                           \
    do                                                                                                                 \
    {                                                                                                                  \
        auto formatted = fmt::format(format_str, ##__VA_ARGS__);                                                       \
        SCHEMA_FINDER_LOG_BACKEND(4, formatted);                                                                       \
    } while (0)

#define SCHEMA_FINDER_CRITICAL(format_str, ...)                                                                        \
    do                                                                                                                 \
    {                                                                                                                  \
        auto formatted = fmt::format(format_str, ##__VA_ARGS__);                                                       \
        SCHEMA_FINDER_LOG_BACKEND(5, formatted);                                                                       \
    } while (0)

#else
// Disabled logging - all macros are no-ops
#define SCHEMA_FINDER_DEBUG(format_str, ...)
#define SCHEMA_FINDER_TRACE(format_str, ...)
#define SCHEMA_FINDER_INFO(format_str, ...)
#define SCHEMA_FINDER_WARNING(format_str, ...)
#define SCHEMA_FINDER_ERROR(format_str, ...)
#define SCHEMA_FINDER_CRITICAL(format_str, ...)
#endif
#define SCHEMA_FINDER_LOGGING_DEFINED
#endif
