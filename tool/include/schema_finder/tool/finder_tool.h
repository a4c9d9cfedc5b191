/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <ostream>

namespace schema_finder
{
    namespace tool
    {
        constexpr int exit_resolved = 0;
        // nothing matched and the configuration asked for that to be fatal
        constexpr int exit_missing = 1;
        constexpr int exit_failure = 2;

        /**
         * @brief Runs schema_finder_tool over a command line.
         *
         * The resolved path and its kind go to out, diagnostics and the probe trail go to diagnostics.
         * @return exit_resolved, exit_missing or exit_failure
         */
        int run(int argc, const char* const* argv, std::ostream& out, std::ostream& diagnostics);
    }
}
