/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_HTTP_TRANSPORT_HPP_INCLUDED
#define IGD_HTTP_TRANSPORT_HPP_INCLUDED

#include "igd/config.hpp"
#include "igd/socket.hpp"
#include "igd/error_code.hpp"
#include "igd/string_view.hpp"
#include "igd/http_parser.hpp"
#include "igd/aux_/export.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace igd {

	// builds the raw request to send, once the local address of the
	// connection is known
	using request_builder = std::function<std::string(address const& local)>;

	// receives the next piece of the (de-chunked) response body. The view is
	// only valid during the call. ``ec`` is boost::asio::error::eof once the
	// whole body has been delivered
	using read_handler = std::function<void(error_code const& ec, string_view chunk)>;

	// one HTTP exchange whose response headers have been received
	struct IGD_EXPORT http_stream
	{
		// reads the next piece of the body. Only one read may be outstanding
		// at a time. The handler is never invoked from within this call
		virtual void async_read_some(read_handler h) = 0;

		// the status line and headers of the response. The body received so
		// far is available too
		virtual http_parser const& parser() const = 0;

		// the address of our end of the connection
		virtual address local_address() const = 0;

		virtual void close() = 0;

		virtual ~http_stream() = default;
	};

	using open_handler = std::function<void(error_code const& ec
		, std::shared_ptr<http_stream> const& s)>;

	// the seam between the protocol logic and the network. It connects to a
	// host, sends one request and reads the response headers.
	struct IGD_EXPORT http_transport
	{
		// the handler is never invoked from within this call. On success it
		// receives a stream positioned at the start of the body
		virtual void async_open(tcp::endpoint const& host
			, request_builder build, open_handler h) = 0;

	protected:
		~http_transport() = default;
	};

	using response_handler = std::function<void(error_code const& ec
		, http_parser const& p)>;

	// reads the remaining body of ``s`` into its parser and invokes ``h`` once
	// it's complete, or when it fails. A body larger than ``max_size`` fails
	// with errors::response_too_large
	IGD_EXPORT void read_response(std::shared_ptr<http_stream> s
		, std::size_t max_size, response_handler h);
}

#endif // IGD_HTTP_TRANSPORT_HPP_INCLUDED
