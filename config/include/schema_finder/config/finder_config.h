/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <filesystem>

#include <nlohmann/json_fwd.hpp>

#include <schema_finder/search_policy.h>

namespace schema_finder
{
    namespace config
    {
        // settings handed to the resolver by the documentation build
        struct finder_config
        {
            std::filesystem::path schema_dir;
            search_policy policy;
            // whether a missing schema should fail the build rather than be skipped
            bool fail_on_missing = false;
            // attach the console observer to every resolution
            bool debug = false;
        };

        /**
         * @brief Reads a "search_policy" object.
         *
         * Missing keys keep their defaults and unknown separator strings fall back to a dot.
         * @return error::OK(), error::INVALID_CONFIG() on a badly typed value or
         * error::INVALID_PATTERN() if a custom pattern cannot be rendered
         */
        int parse_search_policy(const nlohmann::json& document, search_policy& policy);

        // reads a whole configuration document, see parse_search_policy for the policy part
        int parse_config(const nlohmann::json& document, finder_config& config);

        // parses a json file, a relative schema_dir is taken relative to the file's directory
        int load_config(const std::filesystem::path& file, finder_config& config);
    }
}
