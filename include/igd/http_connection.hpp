/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_HTTP_CONNECTION_HPP_INCLUDED
#define IGD_HTTP_CONNECTION_HPP_INCLUDED

#include "igd/config.hpp"
#include "igd/socket.hpp"
#include "igd/error_code.hpp"
#include "igd/http_parser.hpp"
#include "igd/http_transport.hpp"
#include "igd/settings_pack.hpp"
#include "igd/time.hpp"
#include "igd/aux_/export.hpp"

#include <array>
#include <memory>
#include <string>

namespace igd {

	// a single HTTP/1.1 exchange over a TCP connection
	struct IGD_EXTRA_EXPORT http_connection final
		: http_stream
		, std::enable_shared_from_this<http_connection>
	{
		http_connection(io_context& ios, time_duration connect_timeout
			, time_duration completion_timeout);

		// non-copyable
		http_connection(http_connection const&) = delete;
		http_connection& operator=(http_connection const&) = delete;

		~http_connection() override;

		void start(tcp::endpoint const& host, request_builder build, open_handler h);

		void async_read_some(read_handler h) override;
		http_parser const& parser() const override { return m_parser; }
		address local_address() const override { return m_local_address; }
		void close() override;

	private:

		void on_connect(error_code const& e);
		void on_write(error_code const& e);
		void on_header_read(error_code e, std::size_t bytes_transferred);
		void on_body_read(error_code e, std::size_t bytes_transferred);
		static void on_timeout(std::weak_ptr<http_connection> p
			, error_code const& e);

		void read_more(bool header);
		void fail_open(error_code const& e);
		void deliver(error_code const& e);

		io_context& m_ios;
		tcp::socket m_sock;
		steady_timer m_timer;

		http_parser m_parser;
		std::array<char, 4096> m_recvbuffer;
		std::string m_sendbuffer;

		request_builder m_builder;
		open_handler m_open_handler;
		read_handler m_read_handler;

		address m_local_address;

		time_point m_start_time;
		time_duration const m_connect_timeout;
		time_duration const m_completion_timeout;

		// the number of body bytes handed to read handlers so far
		std::size_t m_delivered = 0;

		bool m_connecting = false;
		bool m_eof = false;
		bool m_timed_out = false;
		bool m_abort = false;
	};

	// the http_transport opening plain TCP connections. The timeouts are
	// taken from upnp_connect_timeout and upnp_request_timeout
	struct IGD_EXPORT asio_transport final : http_transport
	{
		asio_transport(io_context& ios, settings_pack const& sett);

		void async_open(tcp::endpoint const& host
			, request_builder build, open_handler h) override;

	private:
		io_context& m_ios;
		settings_pack m_settings;
	};
}

#endif // IGD_HTTP_CONNECTION_HPP_INCLUDED
