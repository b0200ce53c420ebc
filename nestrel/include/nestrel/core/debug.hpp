/*
 * File: debug.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-14
 * License: MIT
 */


#pragma once

#include "nestrel/core/assert.hpp"

// Lets the test build reach the shift primitives of tree::manager.
#ifdef NESTREL_ENABLE_PRIVATE_TESTS
#define NESTREL_PRIVATE_TESTABLE public
#else
#define NESTREL_PRIVATE_TESTABLE private
#endif
