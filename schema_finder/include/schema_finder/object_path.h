/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>
#include <vector>
#include <optional>

namespace schema_finder
{
    /**
     * @brief The structural parts of a documented object's dotted identifier.
     *
     * Joining package, path segments, class name and member name with '.' gives back the
     * identifier the path was built from. Instances are immutable and may be shared between
     * threads.
     */
    class object_path
    {
        std::optional<std::string> package_;
        std::vector<std::string> path_segments_;
        std::optional<std::string> class_name_;
        std::string member_name_;

    public:
        object_path() = default;
        object_path(std::optional<std::string> package,
            std::vector<std::string> path_segments,
            std::optional<std::string> class_name,
            std::string member_name);

        /**
         * @brief Splits an identifier without any structural hints from the caller.
         *
         * The last token is the member, the one before it is a class if it starts with an upper
         * case letter, the first remaining token is the package and the rest are path segments.
         * @return error::OK() or error::MALFORMED_IDENTIFIER() for an empty identifier
         */
        static int parse(const std::string& identifier, object_path& path);

        /**
         * @brief Splits an identifier using a structure supplied by the caller.
         *
         * @param package_depth number of leading tokens that make up the package
         * @param has_class true if the token before the member names a class
         * @return error::OK(), error::MALFORMED_IDENTIFIER() or error::STRUCTURE_MISMATCH()
         */
        static int split(const std::string& identifier, size_t package_depth, bool has_class, object_path& path);

        const std::optional<std::string>& get_package() const { return package_; }
        const std::vector<std::string>& get_path_segments() const { return path_segments_; }
        const std::optional<std::string>& get_class_name() const { return class_name_; }
        const std::string& get_member_name() const { return member_name_; }

        // package and path segments joined with '.'
        std::string get_package_name() const;

        // the full dotted identifier
        std::string to_string() const;

        bool operator==(const object_path& other) const;
        bool operator!=(const object_path& other) const { return !(*this == other); }
    };
}
