//
// Created by bffnt_kit contributors on 13/10/2026.
//
// doctest runner for bffnt unit tests
//

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
