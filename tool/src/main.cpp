/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <iostream>

#include <schema_finder/tool/finder_tool.h>

int main(const int argc, char* argv[])
{
    return schema_finder::tool::run(argc, argv, std::cout, std::cerr);
}
