/*

Copyright (c) 2016-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/aux_/retry_parser.hpp"
#include "igd/aux_/xml_parse.hpp"
#include "igd/error_code.hpp"
#include "fake_router.hpp"
#include "test.hpp"

#include <memory>
#include <string>

using namespace igd;

namespace {

struct outcome
{
	int calls = 0;
	error_code ec;
	std::string buffer;
	int attempts = 0;
	int delays = 0;
	milliseconds last_delay{0};
};

outcome run_parser(fake_response r, int const max_attempts
	, std::size_t const max_size = 1024 * 1024)
{
	io_context ios;
	fake_transport t(ios);
	fake_delay delay(ios);
	t.push(std::move(r));

	outcome ret;
	std::shared_ptr<aux::retry_parser> p;
	t.async_open(tcp::endpoint(make_address("192.168.1.1"), 5000)
		, [](address const&) { return std::string("GET / HTTP/1.1\r\n\r\n"); }
		, [&](error_code const& ec, std::shared_ptr<http_stream> const& s)
	{
		TEST_CHECK(!ec);
		if (ec) return;
		p = std::make_shared<aux::retry_parser>(s, delay, max_attempts
			, milliseconds(10), max_size
			, [](string_view buf) { return aux::xml_complete(buf); }
			, [&](error_code const& e, string_view buf)
		{
			++ret.calls;
			ret.ec = e;
			ret.buffer.assign(buf.begin(), buf.end());
		});
		p->start();
	});
	ios.run();

	if (p) ret.attempts = p->attempts();
	ret.delays = delay.calls;
	ret.last_delay = duration_cast<milliseconds>(delay.last_delay);
	return ret;
}

} // anonymous namespace

IGD_TEST(complete_at_once)
{
	outcome const o = run_parser(respond(http_response(200, "<root><a/></root>")), 50);
	TEST_EQUAL(o.calls, 1);
	TEST_CHECK(!o.ec);
	TEST_EQUAL(o.buffer, "<root><a/></root>");
	TEST_EQUAL(o.attempts, 0);
	TEST_EQUAL(o.delays, 0);
}

IGD_TEST(complete_after_retries)
{
	outcome const o = run_parser(respond_pieces(
		chunked_response(200, {"<root>", "<a>1</a>", "</root>"})), 50);
	TEST_EQUAL(o.calls, 1);
	TEST_CHECK(!o.ec);
	TEST_EQUAL(o.buffer, "<root><a>1</a></root>");
	TEST_EQUAL(o.attempts, 2);
	TEST_EQUAL(o.delays, 2);
	TEST_EQUAL(o.last_delay.count(), 10);
}

IGD_TEST(never_completes)
{
	// the router keeps the connection open without ever finishing the
	// document
	outcome const o = run_parser(respond_pieces(
		{"HTTP/1.1 200 OK\r\n\r\n", "<root><a>"}, true), 50);
	TEST_EQUAL(o.calls, 1);
	TEST_EQUAL(o.ec, error_code(errors::description_timeout));
	TEST_EQUAL(o.attempts, 50);
	TEST_EQUAL(o.delays, 49);
	TEST_EQUAL(o.buffer, "<root><a>");
}

IGD_TEST(attempt_limit)
{
	outcome const o = run_parser(respond_pieces(
		{"HTTP/1.1 200 OK\r\n\r\n", "<root>"}, true), 3);
	TEST_EQUAL(o.calls, 1);
	TEST_EQUAL(o.ec, error_code(errors::description_timeout));
	TEST_EQUAL(o.attempts, 3);
}

IGD_TEST(ends_incomplete)
{
	outcome const o = run_parser(respond(http_response(200, "<root><a>")), 50);
	TEST_EQUAL(o.calls, 1);
	TEST_EQUAL(o.ec, error_code(errors::description_incomplete));
	TEST_EQUAL(o.attempts, 1);
}

IGD_TEST(body_without_length)
{
	// no content-length, the end of the body is the end of the connection
	outcome const o = run_parser(respond_pieces(
		{"HTTP/1.0 200 OK\r\n\r\n", "<root>", "</root>"}), 50);
	TEST_EQUAL(o.calls, 1);
	TEST_CHECK(!o.ec);
	TEST_EQUAL(o.buffer, "<root></root>");
}

IGD_TEST(too_large)
{
	outcome const o = run_parser(respond(http_response(200
		, "<root>" + std::string(100, 'x') + "</root>")), 50, 64);
	TEST_EQUAL(o.calls, 1);
	TEST_EQUAL(o.ec, error_code(errors::response_too_large));
}

IGD_TEST(stream_error)
{
	outcome const o = run_parser(respond_pieces(
		{"HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n", "6\r\n<root>\r\n", "zz\r\n"}), 50);
	TEST_EQUAL(o.calls, 1);
	TEST_EQUAL(o.ec, error_code(errors::http_parse_error));
	TEST_EQUAL(o.attempts, 1);
}
