/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <fstream>
#include <sstream>

#include <fmt/format.h>

#include <schema_finder/resolver.h>
#include <schema_finder/pattern_generator.h>
#include <schema_finder/error_codes.h>
#include <schema_finder/logger.h>

namespace schema_finder
{
    resolver::resolver(std::filesystem::path base_directory, std::shared_ptr<i_resolution_observer> observer)
        : base_directory_(std::move(base_directory))
        , observer_(std::move(observer))
    {
    }

    int resolver::probe(const std::string& subject, const candidate& probed, bool& matched) const
    {
        matched = false;
        auto full_path = base_directory_ / probed.file_name;

        std::error_code ec;
        auto status = std::filesystem::status(full_path, ec);
        // a name longer than the filesystem allows can never exist
        if (status.type() == std::filesystem::file_type::not_found || ec == std::errc::filename_too_long)
        {
            if (observer_)
                observer_->on_candidate_probed(subject, probed, full_path, false);
            return error::OK();
        }
        if (ec)
        {
            SCHEMA_FINDER_ERROR("probe of {} failed: {}", full_path.string(), ec.message());
            if (observer_)
                observer_->on_probe_failed(subject, probed, full_path, ec);
            return error::PROBE_FAILED();
        }
        if (!std::filesystem::is_regular_file(status))
        {
            auto text = fmt::format("{} exists but is not a regular file", full_path.string());
            SCHEMA_FINDER_DEBUG("{}", text);
            if (observer_)
            {
                observer_->message(i_resolution_observer::warn, text.c_str());
                observer_->on_candidate_probed(subject, probed, full_path, false);
            }
            return error::OK();
        }

        std::ifstream stream(full_path, std::ios::in | std::ios::binary);
        if (!stream.is_open())
        {
            ec = std::make_error_code(std::errc::permission_denied);
            SCHEMA_FINDER_ERROR("{} exists but cannot be opened for reading", full_path.string());
            if (observer_)
                observer_->on_probe_failed(subject, probed, full_path, ec);
            return error::PROBE_FAILED();
        }

        matched = true;
        if (observer_)
            observer_->on_candidate_probed(subject, probed, full_path, true);
        return error::OK();
    }

    int resolver::resolve(const std::string& subject, const std::vector<candidate>& candidates, resolution& result) const
    {
        result = resolution();
        if (observer_)
        {
            observer_->on_resolution_started(subject, base_directory_, candidates.size());

            std::error_code ec;
            if (!std::filesystem::is_directory(base_directory_, ec))
            {
                auto text = fmt::format("schema directory {} does not exist", base_directory_.string());
                observer_->message(i_resolution_observer::warn, text.c_str());
            }
        }

        for (auto& item : candidates)
        {
            result.attempted.push_back(item);

            bool matched = false;
            auto err = probe(subject, item, matched);
            if (err != error::OK())
            {
                if (observer_)
                    observer_->on_resolution_completed(subject, err);
                return err;
            }
            if (matched)
            {
                result.path = base_directory_ / item.file_name;
                result.match = item;
                SCHEMA_FINDER_DEBUG("{} resolved to {} ({})", subject, result.path.string(), to_string(item.kind));
                if (observer_)
                    observer_->on_resolution_completed(subject, error::OK());
                return error::OK();
            }
        }

        SCHEMA_FINDER_DEBUG("no schema for {} in {} after {} candidates",
            subject,
            base_directory_.string(),
            result.attempted.size());
        if (observer_)
            observer_->on_resolution_completed(subject, error::NOT_FOUND());
        return error::NOT_FOUND();
    }

    int resolver::resolve(const object_path& path,
        const search_policy& policy,
        const generation_options& options,
        resolution& result) const
    {
        std::vector<candidate> candidates;
        auto err = generate_candidates(path, policy, options, candidates);
        if (err != error::OK())
            return err;
        return resolve(path.to_string(), candidates, result);
    }

    int resolver::resolve(const std::string& identifier,
        const search_policy& policy,
        const generation_options& options,
        resolution& result) const
    {
        object_path path;
        auto err = object_path::parse(identifier, path);
        if (err != error::OK())
            return err;
        return resolve(path, policy, options, result);
    }

    int resolver::find_named(const std::string& schema_name, resolution& result) const
    {
        if (schema_name.empty())
        {
            SCHEMA_FINDER_ERROR("find_named called with an empty schema name");
            return error::MALFORMED_IDENTIFIER();
        }

        std::vector<candidate> candidates;
        for (auto kind : {file_kind::schema, file_kind::data})
            candidates.push_back(candidate{schema_name + extension(kind), schema_name, kind, std::string()});
        return resolve(schema_name, candidates, result);
    }

    int resolver::read(const resolution& resolved, std::string& contents) const
    {
        if (!resolved.found())
            return error::NOT_FOUND();

        std::ifstream stream(resolved.path, std::ios::in | std::ios::binary);
        if (!stream.is_open())
        {
            SCHEMA_FINDER_ERROR("unable to open {}", resolved.path.string());
            return error::READ_FAILED();
        }
        std::stringstream buffer;
        buffer << stream.rdbuf();
        if (stream.bad())
        {
            SCHEMA_FINDER_ERROR("error while reading {}", resolved.path.string());
            return error::READ_FAILED();
        }
        contents = buffer.str();
        return error::OK();
    }
}
