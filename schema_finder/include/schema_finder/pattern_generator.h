/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>
#include <vector>

#include <schema_finder/types.h>
#include <schema_finder/object_path.h>
#include <schema_finder/search_policy.h>

namespace schema_finder
{
    /**
     * @brief Builds the ordered candidate file names for an object.
     *
     * Stems are produced in this order: custom patterns, the class/member base name, the base
     * name prefixed with growing windows of enclosing path segments, the member on its own and
     * finally the dotted identifier. With include_package_name the dotted identifier moves ahead
     * of the member-only stem. Every stem is expanded with the requested variant first and then
     * without it, once per file kind. Duplicate file names keep their first position.
     *
     * The dotted identifier is always present whatever the policy says.
     *
     * @return error::OK() or error::INVALID_PATTERN() if a custom pattern cannot be rendered
     */
    int generate_candidates(const object_path& path,
        const search_policy& policy,
        const generation_options& options,
        std::vector<candidate>& candidates);

    // as above with no variant and the default file kinds
    int generate_candidates(const object_path& path, const search_policy& policy, std::vector<candidate>& candidates);

    // the stems alone, before suffixes are applied and before deduplication
    int generate_stems(const object_path& path, const search_policy& policy, std::vector<std::string>& stems);
}
