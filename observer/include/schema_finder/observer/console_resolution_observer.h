/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>
#include <memory>

#include <schema_finder/i_resolution_observer.h>

namespace spdlog
{
    class logger;
}

namespace schema_finder
{
    // prints every probe of every resolution to stdout
    class console_resolution_observer : public schema_finder::i_resolution_observer
    {
        std::shared_ptr<spdlog::logger> logger_;
        bool show_misses_ = true;
        // false when the logger was handed in and is not ours to drop
        bool owns_logger_ = true;

        std::string get_level_color(level_enum level) const;
        std::string reset_color() const;
        void init_logger();

    public:
        static bool create(std::shared_ptr<schema_finder::i_resolution_observer>& observer, bool show_misses = true);
        // writes through an existing logger instead of a new stdout one
        static bool create(std::shared_ptr<schema_finder::i_resolution_observer>& observer,
            std::shared_ptr<spdlog::logger> logger,
            bool show_misses = true);

        explicit console_resolution_observer(bool show_misses = true);
        console_resolution_observer(std::shared_ptr<spdlog::logger> logger, bool show_misses);
        virtual ~console_resolution_observer();
        console_resolution_observer(const console_resolution_observer&) = delete;
        console_resolution_observer& operator=(const console_resolution_observer&) = delete;

        void on_resolution_started(
            const std::string& subject, const std::filesystem::path& base_directory, size_t candidate_count) const override;
        void on_candidate_probed(const std::string& subject,
            const candidate& probed,
            const std::filesystem::path& full_path,
            bool matched) const override;
        void on_probe_failed(const std::string& subject,
            const candidate& probed,
            const std::filesystem::path& full_path,
            const std::error_code& ec) const override;
        void on_resolution_completed(const std::string& subject, int result) const override;

        void message(level_enum level, const char* message) const override;
    };
}
