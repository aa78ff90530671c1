//
// Created by igor on 02/12/2025.
//
// Main entry point for doctest test runner.
// All test cases are defined in separate test_*.cc files.
//

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest/doctest.h>

// Backends register themselves from the static library; the registry
// pulls them in on first use, so no explicit setup is needed here.
