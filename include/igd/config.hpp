/*

Copyright (c) 2005-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_CONFIG_HPP_INCLUDED
#define IGD_CONFIG_HPP_INCLUDED

#include <boost/config.hpp>
#include <boost/version.hpp>

#if BOOST_VERSION < 106600
#error "libigd requires boost 1.66 or newer (io_context)"
#endif

#if defined __GNUC__ || defined __clang__
#define IGD_FORMAT(fmt, ellipsis) __attribute__((__format__(__printf__, fmt, ellipsis)))
#else
#define IGD_FORMAT(fmt, ellipsis)
#endif

#ifndef IGD_USE_ASSERTS
#if defined IGD_DEBUG
#define IGD_USE_ASSERTS 1
#else
#define IGD_USE_ASSERTS 0
#endif
#endif // IGD_USE_ASSERTS

#if defined _WIN32 || defined __CYGWIN__
#define IGD_WINDOWS 1
#endif

#endif // IGD_CONFIG_HPP_INCLUDED
