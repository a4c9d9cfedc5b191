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
    // how two parts of a candidate stem are joined
    enum class path_separator
    {
        dot,
        slash,
        none
    };

    // the text inserted between two parts, "" for none
    const char* separator_text(path_separator separator);

    // "DOT", "SLASH" or "NONE"
    const char* to_string(path_separator separator);

    // accepts ".", "/" and "none" (any case), returns false for anything else
    bool parse_path_separator(const std::string& text, path_separator& separator);

    enum class file_kind
    {
        schema, // a json schema, eligible for example generation downstream
        data    // plain json rendered as is
    };

    // ".schema.json" or ".json"
    const char* extension(file_kind kind);

    // "schema" or "json"
    const char* to_string(file_kind kind);

    struct candidate
    {
        std::string file_name; // relative to the schema directory
        std::string stem;
        file_kind kind = file_kind::schema;
        std::string variant; // empty when no variant was requested
    };

    struct generation_options
    {
        // opaque discriminator inserted before the extension, e.g. "options"
        std::optional<std::string> requested_variant;
        // suffixes to try for every stem, in order; empty means schema then data
        std::vector<file_kind> file_kinds;
    };
}
