/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_RETRY_PARSER_HPP_INCLUDED
#define IGD_RETRY_PARSER_HPP_INCLUDED

#include "igd/config.hpp"
#include "igd/socket.hpp"
#include "igd/time.hpp"
#include "igd/error_code.hpp"
#include "igd/string_view.hpp"
#include "igd/http_transport.hpp"
#include "igd/aux_/export.hpp"

#include <functional>
#include <memory>
#include <string>

namespace igd::aux {

	// schedules a callback after a delay. Injected so that tests can run the
	// retry loop without waiting
	struct IGD_EXTRA_EXPORT delay_source
	{
		virtual void async_delay(time_duration d, std::function<void()> h) = 0;
	protected:
		~delay_source() = default;
	};

	// delay_source backed by steady timers on an io_context
	struct IGD_EXTRA_EXPORT timer_delay final : delay_source
	{
		explicit timer_delay(io_context& ios) : m_ios(ios) {}
		void async_delay(time_duration d, std::function<void()> h) override;
	private:
		io_context& m_ios;
	};

	// accumulates a response body piece by piece and, after every piece,
	// tries to parse what has arrived so far. A failed attempt waits for
	// ``interval`` before reading on. The completion handler is invoked
	// exactly once with one of:
	//
	// * no error, the accumulated text parsed
	// * errors::description_timeout, ``max_attempts`` parse attempts failed
	// * errors::description_incomplete, the body ended and still didn't parse
	// * errors::response_too_large, more than ``max_size`` bytes arrived
	// * the error reported by the stream
	class IGD_EXTRA_EXPORT retry_parser
		: public std::enable_shared_from_this<retry_parser>
	{
	public:
		using parse_fun = std::function<bool(string_view buffer)>;
		using completion_handler = std::function<void(error_code const& ec
			, string_view buffer)>;

		retry_parser(std::shared_ptr<http_stream> s, delay_source& delay
			, int max_attempts, time_duration interval, std::size_t max_size
			, parse_fun parse, completion_handler h);

		void start();

		// the number of failed parse attempts so far
		int attempts() const { return m_attempts; }

	private:

		void read();
		void on_read(error_code const& ec, string_view chunk);
		void complete(error_code const& ec);

		std::shared_ptr<http_stream> m_stream;
		delay_source& m_delay;
		parse_fun m_parse;
		completion_handler m_handler;

		std::string m_buffer;
		time_duration const m_interval;
		std::size_t const m_max_size;
		int const m_max_attempts;
		int m_attempts = 0;
		bool m_done = false;
	};
}

#endif
