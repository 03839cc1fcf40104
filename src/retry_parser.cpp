/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/aux_/retry_parser.hpp"
#include "igd/assert.hpp"

#include <boost/asio/error.hpp>

#include <functional>
#include <utility>

using namespace std::placeholders;

namespace igd::aux {

	void timer_delay::async_delay(time_duration const d, std::function<void()> h)
	{
		auto t = std::make_shared<steady_timer>(m_ios, d);
		steady_timer& timer = *t;
		timer.async_wait([t = std::move(t), h = std::move(h)](error_code const& ec)
		{
			if (ec) return;
			h();
		});
	}

	retry_parser::retry_parser(std::shared_ptr<http_stream> s, delay_source& delay
		, int const max_attempts, time_duration const interval, std::size_t const max_size
		, parse_fun parse, completion_handler h)
		: m_stream(std::move(s))
		, m_delay(delay)
		, m_parse(std::move(parse))
		, m_handler(std::move(h))
		, m_interval(interval)
		, m_max_size(max_size)
		, m_max_attempts(max_attempts)
	{
		IGD_ASSERT(m_stream);
		IGD_ASSERT(m_max_attempts > 0);
	}

	void retry_parser::start()
	{
		read();
	}

	void retry_parser::read()
	{
		if (m_done) return;
		m_stream->async_read_some(std::bind(&retry_parser::on_read
			, shared_from_this(), _1, _2));
	}

	void retry_parser::on_read(error_code const& ec, string_view const chunk)
	{
		if (m_done) return;

		if (ec == boost::asio::error::eof)
		{
			// the body is complete. This is the last chance to parse it
			complete(m_parse(m_buffer)
				? error_code() : error_code(errors::description_incomplete));
			return;
		}

		if (ec)
		{
			complete(ec);
			return;
		}

		m_buffer.append(chunk.data(), chunk.size());
		if (m_buffer.size() > m_max_size)
		{
			complete(errors::response_too_large);
			return;
		}

		if (m_parse(m_buffer))
		{
			complete(error_code());
			return;
		}

		++m_attempts;
		if (m_attempts >= m_max_attempts)
		{
			complete(errors::description_timeout);
			return;
		}

		auto self = shared_from_this();
		m_delay.async_delay(m_interval, [self] { self->read(); });
	}

	void retry_parser::complete(error_code const& ec)
	{
		if (m_done) return;
		m_done = true;
		m_stream->close();
		completion_handler h = std::move(m_handler);
		m_handler = nullptr;
		h(ec, m_buffer);
	}
}
