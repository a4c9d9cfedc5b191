/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <schema_finder/error_codes.h>

namespace schema_finder
{
    namespace error
    {
        [[nodiscard]] int OK()
        {
            return 0;
        }
        [[nodiscard]] int MALFORMED_IDENTIFIER()
        {
            return -1;
        }
        [[nodiscard]] int STRUCTURE_MISMATCH()
        {
            return -2;
        }
        [[nodiscard]] int INVALID_PATTERN()
        {
            return -3;
        }
        [[nodiscard]] int NOT_FOUND()
        {
            return -4;
        }
        [[nodiscard]] int PROBE_FAILED()
        {
            return -5;
        }
        [[nodiscard]] int READ_FAILED()
        {
            return -6;
        }
        [[nodiscard]] int INVALID_CONFIG()
        {
            return -7;
        }
        // dont forget to update MIN & MAX if new values

        [[nodiscard]] int MIN()
        {
            return -7;
        }
        [[nodiscard]] int MAX()
        {
            return -1;
        }

        const char* to_string(int err)
        {
            if (err == OK())
            {
                return "ok";
            }
            if (err == MALFORMED_IDENTIFIER())
            {
                return "malformed identifier";
            }
            if (err == STRUCTURE_MISMATCH())
            {
                return "identifier does not fit the requested structure";
            }
            if (err == INVALID_PATTERN())
            {
                return "invalid custom pattern";
            }
            if (err == NOT_FOUND())
            {
                return "schema file not found";
            }
            if (err == PROBE_FAILED())
            {
                return "filesystem probe failed";
            }
            if (err == READ_FAILED())
            {
                return "unable to read schema file";
            }
            if (err == INVALID_CONFIG())
            {
                return "invalid configuration";
            }
            return "invalid error code";
        }
    };
}
