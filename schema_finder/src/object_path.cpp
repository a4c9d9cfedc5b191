/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <cctype>

#include <schema_finder/object_path.h>
#include <schema_finder/error_codes.h>
#include <schema_finder/logger.h>

namespace schema_finder
{
    namespace
    {
        std::vector<std::string> tokenise(const std::string& identifier)
        {
            std::vector<std::string> tokens;
            std::string::size_type start = 0;
            while (true)
            {
                auto pos = identifier.find('.', start);
                if (pos == std::string::npos)
                {
                    tokens.push_back(identifier.substr(start));
                    break;
                }
                tokens.push_back(identifier.substr(start, pos - start));
                start = pos + 1;
            }
            return tokens;
        }

        std::string join(std::vector<std::string>::const_iterator begin,
            std::vector<std::string>::const_iterator end)
        {
            std::string result;
            for (auto it = begin; it != end; ++it)
            {
                if (it != begin)
                    result += '.';
                result += *it;
            }
            return result;
        }

        bool looks_like_class(const std::string& token)
        {
            return !token.empty() && std::isupper(static_cast<unsigned char>(token[0]));
        }
    }

    object_path::object_path(std::optional<std::string> package,
        std::vector<std::string> path_segments,
        std::optional<std::string> class_name,
        std::string member_name)
        : package_(std::move(package))
        , path_segments_(std::move(path_segments))
        , class_name_(std::move(class_name))
        , member_name_(std::move(member_name))
    {
    }

    int object_path::parse(const std::string& identifier, object_path& path)
    {
        if (identifier.empty())
        {
            SCHEMA_FINDER_ERROR("object_path::parse empty identifier");
            return error::MALFORMED_IDENTIFIER();
        }

        auto tokens = tokenise(identifier);
        size_t count = tokens.size();
        bool has_class = count >= 2 && looks_like_class(tokens[count - 2]);
        size_t package_depth = (count - (has_class ? 2 : 1)) > 0 ? 1 : 0;
        return split(identifier, package_depth, has_class, path);
    }

    int object_path::split(const std::string& identifier, size_t package_depth, bool has_class, object_path& path)
    {
        if (identifier.empty())
        {
            SCHEMA_FINDER_ERROR("object_path::split empty identifier");
            return error::MALFORMED_IDENTIFIER();
        }

        auto tokens = tokenise(identifier);
        size_t required = has_class ? 2 : 1;
        if (package_depth >= tokens.size() || tokens.size() - package_depth < required)
        {
            SCHEMA_FINDER_ERROR("object_path::split '{}' has {} tokens, package depth {} leaves too few for{}",
                identifier,
                tokens.size(),
                package_depth,
                has_class ? " a class and a member" : " a member");
            return error::STRUCTURE_MISMATCH();
        }

        auto first_segment = tokens.cbegin() + package_depth;
        auto class_or_member = tokens.cend() - (has_class ? 2 : 1);

        std::optional<std::string> package;
        if (package_depth)
            package = join(tokens.cbegin(), first_segment);

        std::optional<std::string> class_name;
        if (has_class)
            class_name = *class_or_member;

        path = object_path(
            std::move(package), std::vector<std::string>(first_segment, class_or_member), std::move(class_name), tokens.back());
        return error::OK();
    }

    std::string object_path::get_package_name() const
    {
        std::vector<std::string> parts;
        if (package_)
            parts.push_back(*package_);
        parts.insert(parts.end(), path_segments_.begin(), path_segments_.end());
        return join(parts.cbegin(), parts.cend());
    }

    std::string object_path::to_string() const
    {
        std::vector<std::string> parts;
        if (package_)
            parts.push_back(*package_);
        parts.insert(parts.end(), path_segments_.begin(), path_segments_.end());
        if (class_name_)
            parts.push_back(*class_name_);
        parts.push_back(member_name_);
        return join(parts.cbegin(), parts.cend());
    }

    bool object_path::operator==(const object_path& other) const
    {
        return package_ == other.package_ && path_segments_ == other.path_segments_ && class_name_ == other.class_name_
               && member_name_ == other.member_name_;
    }
}
