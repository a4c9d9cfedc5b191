/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <unordered_set>

#include <fmt/format.h>

#include <schema_finder/pattern_generator.h>
#include <schema_finder/error_codes.h>
#include <schema_finder/logger.h>

namespace schema_finder
{
    namespace
    {
        std::string base_name(const object_path& path, const search_policy& policy)
        {
            const auto& class_name = path.get_class_name();
            if (!class_name)
                return path.get_member_name();
            return *class_name + separator_text(policy.get_path_to_class_separator()) + path.get_member_name();
        }

        // enclosing segments from outermost to innermost
        std::vector<std::string> context_segments(const object_path& path, const search_policy& policy)
        {
            std::vector<std::string> segments;
            if (policy.get_include_package_name() && path.get_package())
                segments.push_back(*path.get_package());
            const auto& path_segments = path.get_path_segments();
            segments.insert(segments.end(), path_segments.begin(), path_segments.end());
            return segments;
        }
    }

    int generate_stems(const object_path& path, const search_policy& policy, std::vector<std::string>& stems)
    {
        stems.clear();
        for (auto& pattern : policy.get_custom_patterns())
        {
            std::string rendered;
            auto err = render_pattern(pattern, path, rendered);
            if (err != error::OK())
                return err;
            stems.push_back(rendered);
        }

        auto base = base_name(path, policy);
        stems.push_back(base);

        if (policy.get_include_path_to_file())
        {
            auto segments = context_segments(path, policy);
            const char* separator = separator_text(policy.get_path_to_file_separator());
            // nearest segment first, widening outwards
            std::string prefix;
            for (auto it = segments.rbegin(); it != segments.rend(); ++it)
            {
                prefix = *it + separator + prefix;
                stems.push_back(prefix + base);
            }
        }

        auto fully_qualified = path.to_string();
        bool has_class = path.get_class_name().has_value();
        if (policy.get_include_package_name())
        {
            stems.push_back(fully_qualified);
            if (has_class)
                stems.push_back(path.get_member_name());
        }
        else
        {
            if (has_class)
                stems.push_back(path.get_member_name());
            stems.push_back(fully_qualified);
        }
        return error::OK();
    }

    int generate_candidates(const object_path& path,
        const search_policy& policy,
        const generation_options& options,
        std::vector<candidate>& candidates)
    {
        candidates.clear();
        std::vector<std::string> stems;
        auto err = generate_stems(path, policy, stems);
        if (err != error::OK())
            return err;

        std::vector<file_kind> kinds = options.file_kinds;
        if (kinds.empty())
            kinds = {file_kind::schema, file_kind::data};

        std::string variant;
        if (options.requested_variant)
            variant = *options.requested_variant;

        std::unordered_set<std::string> seen;
        auto emit = [&](const std::string& stem, const std::string& infix, file_kind kind)
        {
            auto file_name = infix.empty() ? stem + extension(kind) : fmt::format("{}.{}{}", stem, infix, extension(kind));
            if (seen.insert(file_name).second)
                candidates.push_back(candidate{file_name, stem, kind, infix});
        };

        for (auto& stem : stems)
        {
            if (!variant.empty())
            {
                for (auto kind : kinds)
                    emit(stem, variant, kind);
            }
            for (auto kind : kinds)
                emit(stem, std::string(), kind);
        }

        SCHEMA_FINDER_TRACE("generated {} candidates from {} stems for {}", candidates.size(), stems.size(), path.to_string());
        return error::OK();
    }

    int generate_candidates(const object_path& path, const search_policy& policy, std::vector<candidate>& candidates)
    {
        return generate_candidates(path, policy, generation_options{}, candidates);
    }
}
