/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <fstream>

#include <nlohmann/json.hpp>

#include <schema_finder/error_codes.h>
#include <schema_finder/logger.h>
#include <schema_finder/config/finder_config.h>

namespace schema_finder
{
    namespace config
    {
        namespace
        {
            int read_bool(const nlohmann::json& document, const char* key, bool& value)
            {
                auto it = document.find(key);
                if (it == document.end())
                    return error::OK();
                if (!it->is_boolean())
                {
                    SCHEMA_FINDER_ERROR("'{}' must be a boolean, got {}", key, it->type_name());
                    return error::INVALID_CONFIG();
                }
                value = it->get<bool>();
                return error::OK();
            }

            int read_separator(const nlohmann::json& document, const char* key, path_separator& value)
            {
                auto it = document.find(key);
                if (it == document.end())
                    return error::OK();
                if (!it->is_string())
                {
                    SCHEMA_FINDER_ERROR("'{}' must be a string, got {}", key, it->type_name());
                    return error::INVALID_CONFIG();
                }
                auto text = it->get<std::string>();
                if (!parse_path_separator(text, value))
                {
                    SCHEMA_FINDER_WARNING("'{}' has unknown separator '{}', using '.'", key, text);
                    value = path_separator::dot;
                }
                return error::OK();
            }
        }

        int parse_search_policy(const nlohmann::json& document, search_policy& policy)
        {
            if (!document.is_object())
            {
                SCHEMA_FINDER_ERROR("search_policy must be an object, got {}", document.type_name());
                return error::INVALID_CONFIG();
            }

            bool include_package_name = false;
            bool include_path_to_file = true;
            auto path_to_file_separator = path_separator::dot;
            auto path_to_class_separator = path_separator::dot;
            std::vector<std::string> custom_patterns;

            int err = read_bool(document, "include_package_name", include_package_name);
            if (err != error::OK())
                return err;
            err = read_bool(document, "include_path_to_file", include_path_to_file);
            if (err != error::OK())
                return err;
            err = read_separator(document, "path_to_file_separator", path_to_file_separator);
            if (err != error::OK())
                return err;
            err = read_separator(document, "path_to_class_separator", path_to_class_separator);
            if (err != error::OK())
                return err;

            auto patterns = document.find("custom_patterns");
            if (patterns != document.end())
            {
                if (!patterns->is_array())
                {
                    SCHEMA_FINDER_ERROR("custom_patterns must be an array, got {}", patterns->type_name());
                    return error::INVALID_CONFIG();
                }
                for (auto& pattern : *patterns)
                {
                    if (!pattern.is_string())
                    {
                        SCHEMA_FINDER_ERROR("custom_patterns entries must be strings, got {}", pattern.type_name());
                        return error::INVALID_CONFIG();
                    }
                    custom_patterns.push_back(pattern.get<std::string>());
                }
            }

            search_policy parsed(include_package_name,
                include_path_to_file,
                path_to_file_separator,
                path_to_class_separator,
                std::move(custom_patterns));
            err = parsed.validate();
            if (err != error::OK())
                return err;

            policy = parsed;
            return error::OK();
        }

        int parse_config(const nlohmann::json& document, finder_config& config)
        {
            if (!document.is_object())
            {
                SCHEMA_FINDER_ERROR("configuration must be an object, got {}", document.type_name());
                return error::INVALID_CONFIG();
            }

            finder_config parsed;
            auto schema_dir = document.find("schema_dir");
            if (schema_dir != document.end())
            {
                if (!schema_dir->is_string())
                {
                    SCHEMA_FINDER_ERROR("schema_dir must be a string, got {}", schema_dir->type_name());
                    return error::INVALID_CONFIG();
                }
                parsed.schema_dir = schema_dir->get<std::string>();
            }

            int err = read_bool(document, "fail_on_missing", parsed.fail_on_missing);
            if (err != error::OK())
                return err;
            err = read_bool(document, "debug", parsed.debug);
            if (err != error::OK())
                return err;

            auto policy = document.find("search_policy");
            if (policy != document.end())
            {
                err = parse_search_policy(*policy, parsed.policy);
                if (err != error::OK())
                    return err;
            }

            config = parsed;
            return error::OK();
        }

        int load_config(const std::filesystem::path& file, finder_config& config)
        {
            std::ifstream stream(file);
            if (!stream.is_open())
            {
                SCHEMA_FINDER_ERROR("unable to open configuration {}", file.string());
                return error::INVALID_CONFIG();
            }

            nlohmann::json document;
            try
            {
                document = nlohmann::json::parse(stream);
            }
            catch (const nlohmann::json::parse_error& e)
            {
                SCHEMA_FINDER_ERROR("configuration {} is not valid json: {}", file.string(), e.what());
                return error::INVALID_CONFIG();
            }

            finder_config parsed;
            auto err = parse_config(document, parsed);
            if (err != error::OK())
                return err;

            if (!parsed.schema_dir.empty() && parsed.schema_dir.is_relative())
                parsed.schema_dir = file.parent_path() / parsed.schema_dir;

            SCHEMA_FINDER_INFO("loaded {} from {}", parsed.policy.to_string(), file.string());
            config = parsed;
            return error::OK();
        }
    }
}
