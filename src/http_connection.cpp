/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/http_connection.hpp"
#include "igd/assert.hpp"

#include <boost/asio/write.hpp>
#include <boost/asio/error.hpp>

#include <functional>
#include <utility>

using namespace std::placeholders;

namespace igd {

	http_connection::http_connection(io_context& ios
		, time_duration const connect_timeout
		, time_duration const completion_timeout)
		: m_ios(ios)
		, m_sock(ios)
		, m_timer(ios)
		, m_connect_timeout(connect_timeout)
		, m_completion_timeout(completion_timeout)
	{}

	http_connection::~http_connection() = default;

	void http_connection::start(tcp::endpoint const& host
		, request_builder build, open_handler h)
	{
		m_builder = std::move(build);
		m_open_handler = std::move(h);
		m_start_time = clock_type::now();
		m_connecting = true;

		error_code ec;
		m_sock.open(host.protocol(), ec);
		if (ec)
		{
			post(m_ios, std::bind(&http_connection::fail_open, shared_from_this(), ec));
			return;
		}

		m_sock.async_connect(host, std::bind(&http_connection::on_connect
			, shared_from_this(), _1));

		m_timer.expires_at(m_start_time + m_connect_timeout);
		m_timer.async_wait(std::bind(&http_connection::on_timeout
			, std::weak_ptr<http_connection>(shared_from_this()), _1));
	}

	void http_connection::on_timeout(std::weak_ptr<http_connection> p
		, error_code const& e)
	{
		std::shared_ptr<http_connection> c = p.lock();
		if (!c) return;

		if (e == boost::asio::error::operation_aborted) return;
		if (c->m_abort) return;

		time_point const deadline = c->m_connecting
			? c->m_start_time + c->m_connect_timeout
			: c->m_start_time + c->m_completion_timeout;

		if (deadline <= clock_type::now())
		{
			// closing the socket aborts the outstanding operation, whose
			// handler reports the timeout
			c->m_timed_out = true;
			error_code ec;
			c->m_sock.close(ec);
			return;
		}

		c->m_timer.expires_at(deadline);
		c->m_timer.async_wait(std::bind(&http_connection::on_timeout, p, _1));
	}

	void http_connection::on_connect(error_code const& e)
	{
		m_connecting = false;
		if (m_abort) return;
		if (e)
		{
			fail_open(m_timed_out ? error_code(boost::asio::error::timed_out) : e);
			return;
		}

		error_code ec;
		m_local_address = m_sock.local_endpoint(ec).address();
		if (ec)
		{
			fail_open(ec);
			return;
		}

		m_sendbuffer = m_builder(m_local_address);
		boost::asio::async_write(m_sock, boost::asio::buffer(m_sendbuffer)
			, std::bind(&http_connection::on_write, shared_from_this(), _1));
	}

	void http_connection::on_write(error_code const& e)
	{
		if (m_abort) return;
		if (e)
		{
			fail_open(m_timed_out ? error_code(boost::asio::error::timed_out) : e);
			return;
		}

		std::string().swap(m_sendbuffer);
		read_more(true);
	}

	void http_connection::read_more(bool const header)
	{
		if (header)
		{
			m_sock.async_read_some(boost::asio::buffer(m_recvbuffer)
				, std::bind(&http_connection::on_header_read, shared_from_this(), _1, _2));
		}
		else
		{
			m_sock.async_read_some(boost::asio::buffer(m_recvbuffer)
				, std::bind(&http_connection::on_body_read, shared_from_this(), _1, _2));
		}
	}

	void http_connection::on_header_read(error_code e, std::size_t const bytes_transferred)
	{
		if (m_abort) return;
		if (m_timed_out) e = boost::asio::error::timed_out;

		if (bytes_transferred > 0)
		{
			bool parse_error = false;
			m_parser.incoming({m_recvbuffer.data(), bytes_transferred}, parse_error);
			if (parse_error)
			{
				fail_open(errors::http_parse_error);
				return;
			}
		}

		if (e == boost::asio::error::eof)
		{
			m_eof = true;
			m_parser.on_eof();
			if (m_parser.header_finished()) e.clear();
			else e = errors::incomplete_response;
		}

		if (e)
		{
			fail_open(e);
			return;
		}

		if (!m_parser.header_finished())
		{
			read_more(true);
			return;
		}

		if (m_parser.finished())
		{
			error_code ec;
			m_timer.cancel();
			m_sock.close(ec);
		}

		open_handler h = std::move(m_open_handler);
		m_open_handler = nullptr;
		h(error_code(), shared_from_this());
	}

	void http_connection::fail_open(error_code const& e)
	{
		error_code ec;
		m_timer.cancel();
		m_sock.close(ec);
		if (!m_open_handler) return;
		open_handler h = std::move(m_open_handler);
		m_open_handler = nullptr;
		h(e, std::shared_ptr<http_stream>());
	}

	void http_connection::async_read_some(read_handler h)
	{
		IGD_ASSERT(!m_read_handler);
		m_read_handler = std::move(h);

		if (m_delivered < m_parser.body().size() || m_parser.finished())
		{
			post(m_ios, std::bind(&http_connection::deliver, shared_from_this(), error_code()));
			return;
		}

		if (m_eof || m_abort || !m_sock.is_open())
		{
			error_code const e = m_timed_out
				? error_code(boost::asio::error::timed_out)
				: m_abort ? error_code(boost::asio::error::operation_aborted)
				: error_code(errors::incomplete_response);
			post(m_ios, std::bind(&http_connection::deliver, shared_from_this(), e));
			return;
		}

		read_more(false);
	}

	void http_connection::on_body_read(error_code e, std::size_t const bytes_transferred)
	{
		if (m_abort)
		{
			deliver(boost::asio::error::operation_aborted);
			return;
		}
		if (m_timed_out) e = boost::asio::error::timed_out;

		if (bytes_transferred > 0)
		{
			bool parse_error = false;
			m_parser.incoming({m_recvbuffer.data(), bytes_transferred}, parse_error);
			if (parse_error)
			{
				deliver(errors::http_parse_error);
				return;
			}
		}

		if (e == boost::asio::error::eof)
		{
			m_eof = true;
			m_parser.on_eof();
			e = m_parser.finished() ? error_code() : error_code(errors::incomplete_response);
		}

		if (m_parser.finished())
		{
			error_code ec;
			m_timer.cancel();
			m_sock.close(ec);
		}

		if (m_delivered < m_parser.body().size() || m_parser.finished() || e)
		{
			deliver(e);
			return;
		}

		// only framing (such as a chunk header) arrived, keep reading
		read_more(false);
	}

	// hands the undelivered part of the body, end of body or an error to the
	// outstanding read handler
	void http_connection::deliver(error_code const& e)
	{
		if (!m_read_handler) return;
		read_handler h = std::move(m_read_handler);
		m_read_handler = nullptr;

		string_view const body = m_parser.body();
		if (m_delivered < body.size())
		{
			string_view const chunk = body.substr(m_delivered);
			m_delivered = body.size();
			h(error_code(), chunk);
			return;
		}

		if (e)
		{
			h(e, {});
			return;
		}

		if (m_parser.finished())
		{
			h(boost::asio::error::eof, {});
			return;
		}

		h(errors::incomplete_response, {});
	}

	void http_connection::close()
	{
		if (m_abort) return;
		m_abort = true;
		error_code ec;
		m_timer.cancel();
		m_sock.close(ec);
	}

	asio_transport::asio_transport(io_context& ios, settings_pack const& sett)
		: m_ios(ios)
		, m_settings(sett)
	{}

	void asio_transport::async_open(tcp::endpoint const& host
		, request_builder build, open_handler h)
	{
		auto c = std::make_shared<http_connection>(m_ios
			, seconds(m_settings.get_int(settings_pack::upnp_connect_timeout))
			, seconds(m_settings.get_int(settings_pack::upnp_request_timeout)));
		c->start(host, std::move(build), std::move(h));
	}
}
