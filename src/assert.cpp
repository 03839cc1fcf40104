/*

Copyright (c) 2007-2018, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/config.hpp"
#include "igd/assert.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>

namespace igd {

	void assert_print(char const* fmt, ...)
	{
		va_list va;
		va_start(va, fmt);
		std::vfprintf(stderr, fmt, va);
		va_end(va);
	}

	void assert_fail(char const* expr, int const line
		, char const* file, char const* function, char const* value, int const kind)
	{
		char const* message = "assertion failed. Please file a bugreport "
			"and include the following information:\n\n";

		switch (kind)
		{
			case 1:
				message = "A precondition of a libigd function has been violated.\n"
					"This indicates a bug in the client application using libigd\n";
				break;
			default:
				break;
		}

		assert_print("%s\n"
			"file: '%s'\n"
			"line: %d\n"
			"function: %s\n"
			"expression: %s\n"
			"%s%s\n"
			, message, file, line, function, expr
			, value ? value : "", value ? "\n" : "");

		// abort so a debugger or core dump catches the failing frame
		std::abort();
	}
}
