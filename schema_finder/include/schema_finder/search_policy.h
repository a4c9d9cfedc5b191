/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>
#include <vector>

#include <schema_finder/types.h>

namespace schema_finder
{
    class object_path;

    // Naming rules used to turn an object path into candidate file names. Read only once built.
    class search_policy
    {
        bool include_package_name_ = false;
        bool include_path_to_file_ = true;
        path_separator path_to_file_separator_ = path_separator::dot;
        path_separator path_to_class_separator_ = path_separator::dot;
        std::vector<std::string> custom_patterns_;

    public:
        search_policy() = default;
        search_policy(bool include_package_name,
            bool include_path_to_file,
            path_separator path_to_file_separator,
            path_separator path_to_class_separator,
            std::vector<std::string> custom_patterns = {});

        bool get_include_package_name() const { return include_package_name_; }
        bool get_include_path_to_file() const { return include_path_to_file_; }
        path_separator get_path_to_file_separator() const { return path_to_file_separator_; }
        path_separator get_path_to_class_separator() const { return path_to_class_separator_; }
        const std::vector<std::string>& get_custom_patterns() const { return custom_patterns_; }

        // checks every custom pattern, returns error::OK() or error::INVALID_PATTERN()
        int validate() const;

        std::string to_string() const;
    };

    // renders one custom pattern for a path, returns error::OK() or error::INVALID_PATTERN()
    int render_pattern(const std::string& pattern, const object_path& path, std::string& rendered);
}
