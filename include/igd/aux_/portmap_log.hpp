/*

Copyright (c) 2016-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_PORTMAP_LOG_HPP_INCLUDED
#define IGD_PORTMAP_LOG_HPP_INCLUDED

#include "igd/config.hpp"
#include "igd/portmap.hpp"
#include "igd/aux_/export.hpp"

#include <cstdarg>

namespace igd::aux {

#ifndef IGD_DISABLE_LOGGING
	// formats the message into a fixed size buffer and hands it to the
	// callback, if it wants to log
	IGD_EXTRA_EXPORT void portmap_log(portmap_callback const& cb
		, char const* fmt, ...) IGD_FORMAT(2,3);

	IGD_EXTRA_EXPORT void portmap_vlog(portmap_callback const& cb
		, char const* fmt, va_list v);
#endif
}

#endif
