/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <cstdint>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <schema_finder/error_codes.h>
#include <schema_finder/observer/console_resolution_observer.h>

namespace schema_finder
{
    console_resolution_observer::console_resolution_observer(bool show_misses)
        : show_misses_(show_misses)
    {
        init_logger();
    }

    console_resolution_observer::console_resolution_observer(std::shared_ptr<spdlog::logger> logger, bool show_misses)
        : logger_(std::move(logger))
        , show_misses_(show_misses)
        , owns_logger_(false)
    {
        if (!logger_)
        {
            owns_logger_ = true;
            init_logger();
        }
    }

    console_resolution_observer::~console_resolution_observer()
    {
        if (logger_ && owns_logger_)
        {
            logger_->flush();
            auto logger_name = logger_->name();
            logger_.reset();
            if (logger_name != spdlog::default_logger()->name())
                spdlog::drop(logger_name);
        }
    }

    std::string console_resolution_observer::get_level_color(level_enum level) const
    {
        switch (level)
        {
        case warn:
            return "\033[93m"; // Bright Yellow
        case err:
            return "\033[91m"; // Bright Red
        case critical:
            return "\033[95m"; // Bright Magenta
        default:
            return ""; // No color for other levels
        }
    }

    std::string console_resolution_observer::reset_color() const
    {
        return "\033[0m";
    }

    void console_resolution_observer::init_logger()
    {
        // unique name per instance so several observers can coexist in the registry
        std::string logger_name = "console_resolution_" + std::to_string(reinterpret_cast<uintptr_t>(this));
        try
        {
            logger_ = spdlog::get(logger_name);
            if (!logger_)
                logger_ = spdlog::stdout_color_mt(logger_name);
            logger_->set_pattern("%v");
            logger_->set_level(spdlog::level::trace);
        }
        catch (const spdlog::spdlog_ex& ex)
        {
            // registry refused the logger, share the default one instead
            logger_ = spdlog::default_logger();
            logger_->warn("console_resolution_observer falling back to the default logger: {}", ex.what());
        }
    }

    bool console_resolution_observer::create(std::shared_ptr<schema_finder::i_resolution_observer>& observer, bool show_misses)
    {
        observer = std::make_shared<console_resolution_observer>(show_misses);
        return true;
    }

    bool console_resolution_observer::create(std::shared_ptr<schema_finder::i_resolution_observer>& observer,
        std::shared_ptr<spdlog::logger> logger,
        bool show_misses)
    {
        observer = std::make_shared<console_resolution_observer>(std::move(logger), show_misses);
        return true;
    }

    void console_resolution_observer::on_resolution_started(
        const std::string& subject, const std::filesystem::path& base_directory, size_t candidate_count) const
    {
        logger_->info("resolving {} in {} ({} candidates)", subject, base_directory.string(), candidate_count);
    }

    void console_resolution_observer::on_candidate_probed(
        const std::string& subject, const candidate& probed, const std::filesystem::path& full_path, bool matched) const
    {
        (void)subject;
        (void)full_path;
        if (matched)
        {
            logger_->info("\033[92m  [hit]  {} ({}){}", probed.file_name, to_string(probed.kind), reset_color());
        }
        else if (show_misses_)
        {
            logger_->info("  [miss] {}", probed.file_name);
        }
    }

    void console_resolution_observer::on_probe_failed(const std::string& subject,
        const candidate& probed,
        const std::filesystem::path& full_path,
        const std::error_code& ec) const
    {
        logger_->error("{}  [fail] {} while resolving {}: {}{}",
            get_level_color(err),
            full_path.string(),
            subject,
            ec.message(),
            reset_color());
        (void)probed;
    }

    void console_resolution_observer::on_resolution_completed(const std::string& subject, int result) const
    {
        if (result == error::OK())
        {
            logger_->info("{} resolved", subject);
        }
        else
        {
            logger_->warn("{}{} unresolved: {}{}", get_level_color(warn), subject, error::to_string(result), reset_color());
        }
    }

    void console_resolution_observer::message(level_enum level, const char* message) const
    {
        const char* level_str;
        switch (level)
        {
        case debug:
            level_str = "DEBUG";
            break;
        case trace:
            level_str = "TRACE";
            break;
        case info:
            level_str = "INFO";
            break;
        case warn:
            level_str = "WARN";
            break;
        case err:
            level_str = "ERROR";
            break;
        case critical:
            level_str = "CRITICAL";
            break;
        case off:
            return;
        default:
            level_str = "UNKNOWN";
            break;
        }

        std::string level_color = get_level_color(level);
        if (!level_color.empty())
        {
            logger_->info("{}{} {}{}", level_color, level_str, message, reset_color());
        }
        else
        {
            logger_->info("{} {}", level_str, message);
        }
    }
}
