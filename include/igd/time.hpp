/*

Copyright (c) 2009, 2014, 2016-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_TIME_HPP_INCLUDED
#define IGD_TIME_HPP_INCLUDED

#include "igd/config.hpp"

#include <chrono>
#include <cstdint>

namespace igd {

	using clock_type = std::chrono::steady_clock;

	// duration and time_point of the steady clock
	using time_point = clock_type::time_point;
	using time_duration = clock_type::duration;

	using std::chrono::seconds;
	using std::chrono::milliseconds;
	using std::chrono::duration_cast;

	inline std::int64_t total_seconds(time_duration td)
	{ return duration_cast<seconds>(td).count(); }

	inline std::int64_t total_milliseconds(time_duration td)
	{ return duration_cast<milliseconds>(td).count(); }
}

#endif // IGD_TIME_HPP_INCLUDED
