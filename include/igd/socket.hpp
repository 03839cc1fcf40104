/*

Copyright (c) 2004-2005, 2007-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_SOCKET_HPP_INCLUDED
#define IGD_SOCKET_HPP_INCLUDED

#include "igd/config.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/post.hpp>

namespace igd {

	using boost::asio::ip::tcp;
	using boost::asio::ip::address;
	using boost::asio::ip::address_v4;
	using boost::asio::ip::address_v6;
	using boost::asio::ip::make_address;
	using io_context = boost::asio::io_context;
	using steady_timer = boost::asio::steady_timer;

	using boost::asio::post;
}

#endif // IGD_SOCKET_HPP_INCLUDED
