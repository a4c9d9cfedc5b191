/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <algorithm>
#include <cctype>

#include <schema_finder/types.h>

namespace schema_finder
{
    const char* separator_text(path_separator separator)
    {
        switch (separator)
        {
        case path_separator::dot:
            return ".";
        case path_separator::slash:
            return "/";
        case path_separator::none:
            return "";
        }
        return ".";
    }

    const char* to_string(path_separator separator)
    {
        switch (separator)
        {
        case path_separator::dot:
            return "DOT";
        case path_separator::slash:
            return "SLASH";
        case path_separator::none:
            return "NONE";
        }
        return "DOT";
    }

    bool parse_path_separator(const std::string& text, path_separator& separator)
    {
        if (text == ".")
        {
            separator = path_separator::dot;
            return true;
        }
        if (text == "/")
        {
            separator = path_separator::slash;
            return true;
        }
        std::string lowered = text;
        std::transform(lowered.begin(),
            lowered.end(),
            lowered.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lowered == "none")
        {
            separator = path_separator::none;
            return true;
        }
        return false;
    }

    const char* extension(file_kind kind)
    {
        switch (kind)
        {
        case file_kind::schema:
            return ".schema.json";
        case file_kind::data:
            return ".json";
        }
        return ".json";
    }

    const char* to_string(file_kind kind)
    {
        switch (kind)
        {
        case file_kind::schema:
            return "schema";
        case file_kind::data:
            return "json";
        }
        return "json";
    }
}
