/*
 * File: assert.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-14
 * License: MIT
 */


#pragma once

#ifndef NESTREL_ASSERT
#include <cassert>
#define NESTREL_ASSERT(cond, msg) do { static_cast<void>(msg); assert(cond); } while(0)
#endif
