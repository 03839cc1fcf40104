/*

Copyright (c) 2005-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_EXPORT_HPP_INCLUDED
#define IGD_EXPORT_HPP_INCLUDED

#include <boost/config.hpp>

#include "igd/config.hpp"

#if !defined IGD_EXPORT_EXTRA \
	&& defined __GNUC__ && __GNUC__ >= 4 && !defined IGD_WINDOWS
# define IGD_UNEXPORT __attribute__((visibility("hidden")))
#else
# define IGD_UNEXPORT
#endif

#if defined IGD_BUILDING_SHARED
# define IGD_EXPORT BOOST_SYMBOL_EXPORT
#elif defined IGD_LINKING_SHARED
# define IGD_EXPORT BOOST_SYMBOL_IMPORT
#endif

// when this is specified, export a bunch of extra
// symbols, mostly for the unit tests to reach
#ifdef IGD_EXPORT_EXTRA
# ifdef IGD_BUILDING_SHARED
#  define IGD_EXTRA_EXPORT BOOST_SYMBOL_EXPORT
# elif defined IGD_LINKING_SHARED
#  define IGD_EXTRA_EXPORT BOOST_SYMBOL_IMPORT
# endif
#endif

#ifndef IGD_EXPORT
# define IGD_EXPORT
#endif

#ifndef IGD_EXTRA_EXPORT
# define IGD_EXTRA_EXPORT
#endif

#endif // IGD_EXPORT_HPP_INCLUDED
