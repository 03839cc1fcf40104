/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/http_transport.hpp"

#include <boost/asio/error.hpp>

#include <utility>

namespace igd {

	void read_response(std::shared_ptr<http_stream> s
		, std::size_t const max_size, response_handler h)
	{
		http_stream& stream = *s;
		stream.async_read_some([s = std::move(s), max_size, h = std::move(h)]
			(error_code const& ec, string_view) mutable
		{
			if (ec == boost::asio::error::eof)
			{
				h(error_code(), s->parser());
				return;
			}
			if (ec)
			{
				h(ec, s->parser());
				return;
			}
			if (s->parser().body().size() > max_size)
			{
				s->close();
				h(errors::response_too_large, s->parser());
				return;
			}
			read_response(std::move(s), max_size, std::move(h));
		});
	}
}
