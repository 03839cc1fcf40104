/*

Copyright (c) 2007-2008, 2010-2011, 2013-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_ASSERT_HPP_INCLUDED
#define IGD_ASSERT_HPP_INCLUDED

#include "igd/config.hpp"
#include "igd/aux_/export.hpp"

namespace igd {

// internal
IGD_EXPORT void assert_print(char const* fmt, ...) IGD_FORMAT(1,2);

// internal
IGD_EXPORT void assert_fail(char const* expr, int line
	, char const* file, char const* function, char const* val, int kind = 0);

}

#if IGD_USE_ASSERTS

#ifndef IGD_USE_SYSTEM_ASSERTS

#define IGD_ASSERT_PRECOND(x) \
	do { if (x) {} else igd::assert_fail(#x, __LINE__, __FILE__, __func__, nullptr, 1); } while (false)

#define IGD_ASSERT(x) \
	do { if (x) {} else igd::assert_fail(#x, __LINE__, __FILE__, __func__, nullptr, 0); } while (false)

#define IGD_ASSERT_FAIL() \
	igd::assert_fail("<unconditional>", __LINE__, __FILE__, __func__, nullptr, 0)

#else
#include <cassert>
#define IGD_ASSERT_PRECOND(x) assert(x)
#define IGD_ASSERT(x) assert(x)
#define IGD_ASSERT_FAIL() assert(false)
#endif

#else // IGD_USE_ASSERTS

#define IGD_ASSERT_PRECOND(a) do {} while (false)
#define IGD_ASSERT(a) do {} while (false)
#define IGD_ASSERT_FAIL() do {} while (false)

#endif // IGD_USE_ASSERTS

#endif // IGD_ASSERT_HPP_INCLUDED
