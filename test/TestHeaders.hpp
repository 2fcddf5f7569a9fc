#ifndef __TPOD_TEST_HEADERS__
#define __TPOD_TEST_HEADERS__

#include "Headers.hpp"
#include "catch2/catch.hpp"

#endif  // __TPOD_TEST_HEADERS__
