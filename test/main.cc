//
// Created by bffnt_kit contributors on 15/10/2026.
//
// doctest runner for bffnt container tests
//

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
