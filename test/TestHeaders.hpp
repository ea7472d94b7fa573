#ifndef __LP_TEST_HEADERS__
#define __LP_TEST_HEADERS__

#include "Headers.hpp"
#include "catch2/catch.hpp"

#endif  // __LP_TEST_HEADERS__
