#ifndef CACHET_UTILITIES_TESTING_H
#define CACHET_UTILITIES_TESTING_H

#include <catch2/catch.hpp>

#include <cachet/utilities/concurrency_testing.h>

#endif
