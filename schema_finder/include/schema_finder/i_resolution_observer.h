/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>
#include <filesystem>
#include <system_error>

#include <schema_finder/types.h>

// copied from spdlog
#define I_RESOLUTION_LEVEL_DEBUG 0
#define I_RESOLUTION_LEVEL_TRACE 1
#define I_RESOLUTION_LEVEL_INFO 2
#define I_RESOLUTION_LEVEL_WARN 3
#define I_RESOLUTION_LEVEL_ERROR 4
#define I_RESOLUTION_LEVEL_CRITICAL 5
#define I_RESOLUTION_LEVEL_OFF 6

namespace schema_finder
{
    // receives the diagnostic trail of a resolution, called on the resolving thread
    class i_resolution_observer
    {
    public:
        enum level_enum
        {
            debug = I_RESOLUTION_LEVEL_DEBUG,
            trace = I_RESOLUTION_LEVEL_TRACE,
            info = I_RESOLUTION_LEVEL_INFO,
            warn = I_RESOLUTION_LEVEL_WARN,
            err = I_RESOLUTION_LEVEL_ERROR,
            critical = I_RESOLUTION_LEVEL_CRITICAL,
            off = I_RESOLUTION_LEVEL_OFF,
            n_levels
        };
        virtual ~i_resolution_observer() = default;

        virtual void on_resolution_started(
            const std::string& subject, const std::filesystem::path& base_directory, size_t candidate_count) const
            = 0;
        virtual void on_candidate_probed(
            const std::string& subject, const candidate& probed, const std::filesystem::path& full_path, bool matched) const
            = 0;
        virtual void on_probe_failed(const std::string& subject,
            const candidate& probed,
            const std::filesystem::path& full_path,
            const std::error_code& ec) const
            = 0;
        virtual void on_resolution_completed(const std::string& subject, int result) const = 0;

        virtual void message(level_enum level, const char* message) const = 0;
    };
}
