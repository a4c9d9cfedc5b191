/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <schema_finder/error_codes.h>
#include <schema_finder/logger.h>

// separators, file kinds and candidates
#include <schema_finder/types.h>

// the structural parts of a dotted identifier
#include <schema_finder/object_path.h>

// naming rules
#include <schema_finder/search_policy.h>

// identifier + policy -> ordered candidate file names
#include <schema_finder/pattern_generator.h>

// diagnostics hook for resolutions
#include <schema_finder/i_resolution_observer.h>

// candidate file names -> the file on disk
#include <schema_finder/resolver.h>
