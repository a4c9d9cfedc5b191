/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <fmt/format.h>

#include <schema_finder/search_policy.h>
#include <schema_finder/object_path.h>
#include <schema_finder/error_codes.h>
#include <schema_finder/logger.h>

namespace schema_finder
{
    search_policy::search_policy(bool include_package_name,
        bool include_path_to_file,
        path_separator path_to_file_separator,
        path_separator path_to_class_separator,
        std::vector<std::string> custom_patterns)
        : include_package_name_(include_package_name)
        , include_path_to_file_(include_path_to_file)
        , path_to_file_separator_(path_to_file_separator)
        , path_to_class_separator_(path_to_class_separator)
        , custom_patterns_(std::move(custom_patterns))
    {
    }

    int search_policy::validate() const
    {
        // a throwaway path is enough, only the placeholders matter
        object_path probe(std::string("package"), {"module"}, std::string("Class"), "method");
        for (auto& pattern : custom_patterns_)
        {
            std::string rendered;
            auto err = render_pattern(pattern, probe, rendered);
            if (err != error::OK())
                return err;
        }
        return error::OK();
    }

    std::string search_policy::to_string() const
    {
        std::string patterns;
        for (auto& pattern : custom_patterns_)
        {
            if (!patterns.empty())
                patterns += ", ";
            patterns += fmt::format("'{}'", pattern);
        }
        return fmt::format("search_policy(include_package_name={}, include_path_to_file={}, "
                           "path_to_file_separator=path_separator::{}, path_to_class_separator=path_separator::{}, "
                           "custom_patterns=[{}])",
            include_package_name_,
            include_path_to_file_,
            schema_finder::to_string(path_to_file_separator_),
            schema_finder::to_string(path_to_class_separator_),
            patterns);
    }

    int render_pattern(const std::string& pattern, const object_path& path, std::string& rendered)
    {
        const auto& class_name = path.get_class_name();
        try
        {
            rendered = fmt::format(fmt::runtime(pattern),
                fmt::arg("object_name", path.to_string()),
                fmt::arg("class_name", class_name ? *class_name : std::string()),
                fmt::arg("method_name", path.get_member_name()),
                fmt::arg("package_name", path.get_package_name()));
        }
        catch (const fmt::format_error& e)
        {
            SCHEMA_FINDER_ERROR("custom pattern '{}' is invalid: {}", pattern, e.what());
            return error::INVALID_PATTERN();
        }
        return error::OK();
    }
}
