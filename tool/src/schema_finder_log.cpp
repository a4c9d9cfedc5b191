/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <string>

#include <spdlog/spdlog.h>

// the library's logging sink for the command line tool
extern "C"
{
    void schema_finder_log(int level, const char* str, size_t sz)
    {
        std::string message(str, sz);
        switch (level)
        {
        case 0:
            spdlog::debug(message);
            break;
        case 1:
            spdlog::trace(message);
            break;
        case 2:
            spdlog::info(message);
            break;
        case 3:
            spdlog::warn(message);
            break;
        case 4:
            spdlog::error(message);
            break;
        case 5:
            spdlog::critical(message);
            break;
        default:
            spdlog::info(message);
            break;
        }
    }
}
