#ifndef __JM_TEST_HEADERS__
#define __JM_TEST_HEADERS__

#include "Headers.hpp"
#include "catch2/catch.hpp"

#endif  // __JM_TEST_HEADERS__
