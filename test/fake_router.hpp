/*

Copyright (c) 2016-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_FAKE_ROUTER_HPP_INCLUDED
#define IGD_FAKE_ROUTER_HPP_INCLUDED

#include "igd/http_parser.hpp"
#include "igd/http_transport.hpp"
#include "igd/portmap.hpp"
#include "igd/socket.hpp"
#include "igd/time.hpp"
#include "igd/aux_/retry_parser.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// what the fake router answers one request with. The raw HTTP response is
// handed out in ``pieces``, one piece per read
struct fake_response
{
	std::vector<std::string> pieces;

	// once the pieces run out, keep delivering empty reads instead of
	// reporting the end of the response
	bool endless = false;

	// fail the connection instead of responding
	igd::error_code open_error;
};

fake_response respond(std::string raw);
fake_response respond_pieces(std::vector<std::string> pieces, bool endless = false);
fake_response respond_error(igd::error_code ec);

// a raw HTTP response with a content-length header
std::string http_response(int status, std::string const& body
	, std::string const& message = std::string());

// a raw HTTP response with a chunked body, one chunk per element of
// ``chunks``. The result is split at chunk boundaries
std::vector<std::string> chunked_response(int status
	, std::vector<std::string> const& chunks);

// the body of a successful SOAP response to ``action``
std::string soap_ok(std::string const& action
	, std::vector<std::pair<std::string, std::string>> const& fields);

// the 500 response carrying a UPnP fault
std::string soap_fault(int code, std::string const& description);

// the SOAPAction of a recorded request, e.g. "GetGenericPortMappingEntry"
std::string request_action(std::string const& request);

// the text of the element ``name`` in a recorded request
std::string request_arg(std::string const& request, std::string const& name);

// an http_transport answering from a script instead of the network. All
// completions are posted to the io_context
struct fake_transport final : igd::http_transport
{
	explicit fake_transport(igd::io_context& ios);

	void async_open(igd::tcp::endpoint const& host
		, igd::request_builder build, igd::open_handler h) override;

	// queues the response to the next request. Requests without a queued
	// response (and no responder) fail to connect
	void push(fake_response r);

	// if set, computes the response to every request
	std::function<fake_response(std::string const& request)> responder;

	std::vector<std::string> requests() const;
	std::vector<igd::tcp::endpoint> hosts() const;
	int max_in_flight() const;

	// the local address requests are built with
	igd::address const local;

	void on_done();

private:
	igd::io_context& m_ios;
	mutable std::mutex m_mutex;
	std::deque<fake_response> m_responses;
	std::vector<std::string> m_requests;
	std::vector<igd::tcp::endpoint> m_hosts;
	int m_in_flight = 0;
	int m_max_in_flight = 0;
};

// a delay_source that doesn't wait, it just posts the handler
struct fake_delay final : igd::aux::delay_source
{
	explicit fake_delay(igd::io_context& ios) : m_ios(ios) {}
	void async_delay(igd::time_duration d, std::function<void()> h) override;

	int calls = 0;
	igd::time_duration last_delay{};

private:
	igd::io_context& m_ios;
};

// collects what the library reports through portmap_callback
struct test_callback final : igd::portmap_callback
{
	void on_device_resolved(std::shared_ptr<igd::device const> const& d) override;
	bool should_log_portmap() const override { return true; }
	void log_portmap(char const* msg) const override;

	std::vector<std::shared_ptr<igd::device const>> resolved() const;
	std::vector<std::string> log_lines() const;
	bool logged(std::string const& substr) const;

private:
	mutable std::mutex m_mutex;
	std::vector<std::shared_ptr<igd::device const>> m_resolved;
	mutable std::vector<std::string> m_log;
};

#endif // IGD_FAKE_ROUTER_HPP_INCLUDED
