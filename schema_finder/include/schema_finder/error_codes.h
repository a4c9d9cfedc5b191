/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

namespace schema_finder
{
    namespace error
    {
        int OK();
        int MIN();
        int MALFORMED_IDENTIFIER(); // the dotted identifier is empty
        int STRUCTURE_MISMATCH();   // an explicit structural split does not fit the identifier
        int INVALID_PATTERN();      // a custom pattern has an unknown placeholder or unbalanced braces
        int NOT_FOUND();            // no candidate matched an existing file
        int PROBE_FAILED();         // a filesystem probe failed for a reason other than absence
        int READ_FAILED();          // a resolved file could not be read
        int INVALID_CONFIG();       // the configuration document is unreadable or badly typed
        int MAX();                  // the biggest value

        const char* to_string(int);
    };
}
