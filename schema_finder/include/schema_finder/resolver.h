/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>
#include <vector>
#include <memory>
#include <filesystem>

#include <schema_finder/types.h>
#include <schema_finder/object_path.h>
#include <schema_finder/search_policy.h>
#include <schema_finder/i_resolution_observer.h>

namespace schema_finder
{
    struct resolution
    {
        // empty unless a candidate matched
        std::filesystem::path path;
        candidate match;
        // every candidate probed, in order; on a match it ends with the match
        std::vector<candidate> attempted;

        bool found() const { return !path.empty(); }
        file_kind get_kind() const { return match.kind; }
    };

    /**
     * @brief Probes candidate file names against a schema directory.
     *
     * A resolver holds no mutable state and can be shared by concurrent resolutions. The optional
     * observer is told about every probe, which is how naming mismatches are debugged.
     */
    class resolver
    {
        std::filesystem::path base_directory_;
        std::shared_ptr<i_resolution_observer> observer_;

        int probe(const std::string& subject, const candidate& probed, bool& matched) const;

    public:
        explicit resolver(std::filesystem::path base_directory, std::shared_ptr<i_resolution_observer> observer = nullptr);

        const std::filesystem::path& get_base_directory() const { return base_directory_; }
        const std::shared_ptr<i_resolution_observer>& get_observer() const { return observer_; }

        /**
         * @brief Returns the first candidate that is an existing readable file.
         *
         * @param subject a label for diagnostics, normally the dotted identifier
         * @return error::OK(), error::NOT_FOUND() with result.attempted holding every candidate, or
         * error::PROBE_FAILED() if the filesystem reported something other than absence
         */
        int resolve(const std::string& subject, const std::vector<candidate>& candidates, resolution& result) const;

        // generates the candidates for the path and resolves them
        int resolve(const object_path& path,
            const search_policy& policy,
            const generation_options& options,
            resolution& result) const;

        // parses the identifier, generates the candidates and resolves them
        int resolve(const std::string& identifier,
            const search_policy& policy,
            const generation_options& options,
            resolution& result) const;

        // looks for <schema_name>.schema.json then <schema_name>.json
        int find_named(const std::string& schema_name, resolution& result) const;

        // reads the bytes of a resolved file
        int read(const resolution& resolved, std::string& contents) const;
    };
}
