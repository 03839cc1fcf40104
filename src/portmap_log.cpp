/*

Copyright (c) 2016-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/aux_/portmap_log.hpp"

#include <cstdarg>
#include <cstdio> // for vsnprintf

namespace igd::aux {

#ifndef IGD_DISABLE_LOGGING
	void portmap_log(portmap_callback const& cb, char const* fmt, ...)
	{
		if (!cb.should_log_portmap()) return;
		va_list v;
		va_start(v, fmt);
		portmap_vlog(cb, fmt, v);
		va_end(v);
	}

	void portmap_vlog(portmap_callback const& cb, char const* fmt, va_list v)
	{
		if (!cb.should_log_portmap()) return;
		char msg[1024];
		std::vsnprintf(msg, sizeof(msg), fmt, v);
		cb.log_portmap(msg);
	}
#endif
}
