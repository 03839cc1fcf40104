/*

Copyright (c) 2008-2009, 2012-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/http_parser.hpp"
#include "test.hpp"

#include <string>

using namespace igd;

namespace {

// feeds ``in`` to ``p`` one byte at a time. Returns the number of body
// bytes reported
int feed_bytes(http_parser& p, string_view in, bool& error)
{
	int ret = 0;
	for (char const& c : in)
	{
		ret += p.incoming(string_view(&c, 1), error);
		if (error) break;
	}
	return ret;
}

} // anonymous namespace

IGD_TEST(content_length)
{
	http_parser p;
	bool error = false;
	char const response[] = "HTTP/1.1 200 OK\r\n"
		"Content-Length: 4\r\n"
		"Content-Type: text/xml\r\n"
		"\r\n"
		"test";
	int const received = p.incoming(response, error);
	TEST_CHECK(!error);
	TEST_EQUAL(received, 4);
	TEST_CHECK(p.header_finished());
	TEST_CHECK(p.finished());
	TEST_EQUAL(p.protocol(), "HTTP/1.1");
	TEST_EQUAL(p.status_code(), 200);
	TEST_EQUAL(p.message(), "OK");
	TEST_EQUAL(p.content_length(), 4);
	TEST_EQUAL(p.header("content-type"), "text/xml");
	TEST_EQUAL(p.header("Content-Type"), "text/xml");
	TEST_EQUAL(p.header("server"), "");
	TEST_EQUAL(p.body(), "test");
	TEST_CHECK(!p.chunked_encoding());
	TEST_CHECK(!p.connection_close());
}

IGD_TEST(byte_by_byte)
{
	http_parser p;
	bool error = false;
	int const received = feed_bytes(p, "HTTP/1.1 500 Internal Server Error\r\n"
		"content-length: 5\r\n"
		"\r\n"
		"fault", error);
	TEST_CHECK(!error);
	TEST_EQUAL(received, 5);
	TEST_CHECK(p.finished());
	TEST_EQUAL(p.status_code(), 500);
	TEST_EQUAL(p.message(), "Internal Server Error");
	TEST_EQUAL(p.body(), "fault");
}

IGD_TEST(partial_headers)
{
	http_parser p;
	bool error = false;
	p.incoming("HTTP/1.1 200 OK\r\nContent-Le", error);
	TEST_CHECK(!error);
	TEST_CHECK(!p.header_finished());
	TEST_EQUAL(p.status_code(), 200);
	p.incoming("ngth: 3\r\n\r\nab", error);
	TEST_CHECK(p.header_finished());
	TEST_CHECK(!p.finished());
	TEST_EQUAL(p.body(), "ab");
	// bytes past the content length are not part of the body
	p.incoming("cdef", error);
	TEST_CHECK(p.finished());
	TEST_EQUAL(p.body(), "abc");
}

IGD_TEST(chunked_encoding)
{
	http_parser p;
	bool error = false;
	int received = p.incoming("HTTP/1.1 200 OK\r\n"
		"Transfer-Encoding: chunked\r\n"
		"\r\n", error);
	TEST_EQUAL(received, 0);
	TEST_CHECK(p.header_finished());
	TEST_CHECK(p.chunked_encoding());

	received = p.incoming("6\r\n<root>\r\n", error);
	TEST_EQUAL(received, 6);
	TEST_CHECK(!p.finished());
	received = p.incoming("a;ext=1\r\n<a>x</a>", error);
	TEST_EQUAL(received, 8);
	received = p.incoming("</\r\n", error);
	TEST_EQUAL(received, 2);
	received = p.incoming("7\r\nroot>\r\n\r\n", error);
	TEST_EQUAL(received, 7);
	TEST_CHECK(!p.finished());
	received = p.incoming("0\r\nX-Trailer: 1\r\n\r\n", error);
	TEST_EQUAL(received, 0);
	TEST_CHECK(!error);
	TEST_CHECK(p.finished());
	TEST_EQUAL(p.body(), "<root><a>x</a></root>\r\n");
	TEST_EQUAL(p.header("x-trailer"), "1");
}

IGD_TEST(chunked_byte_by_byte)
{
	http_parser p;
	bool error = false;
	int const received = feed_bytes(p, "HTTP/1.1 200 OK\r\n"
		"Transfer-Encoding: chunked\r\n"
		"\r\n"
		"4\r\ntest\r\n"
		"2\r\n-1\r\n"
		"0\r\n\r\n", error);
	TEST_CHECK(!error);
	TEST_EQUAL(received, 6);
	TEST_CHECK(p.finished());
	TEST_EQUAL(p.body(), "test-1");
}

IGD_TEST(invalid_chunk_header)
{
	http_parser p;
	bool error = false;
	p.incoming("HTTP/1.1 200 OK\r\n"
		"Transfer-Encoding: chunked\r\n"
		"\r\n"
		"zz\r\n", error);
	TEST_CHECK(error);
	TEST_CHECK(p.error());
}

IGD_TEST(body_until_eof)
{
	http_parser p;
	bool error = false;
	p.incoming("HTTP/1.0 200 OK\r\n"
		"\r\n"
		"<root>", error);
	TEST_CHECK(p.connection_close());
	TEST_CHECK(!p.finished());
	p.incoming("</root>", error);
	TEST_CHECK(!p.finished());
	TEST_CHECK(p.on_eof());
	TEST_CHECK(p.finished());
	TEST_EQUAL(p.body(), "<root></root>");
}

IGD_TEST(eof_before_content_length)
{
	http_parser p;
	bool error = false;
	p.incoming("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc", error);
	TEST_CHECK(!p.on_eof());
	TEST_CHECK(!p.finished());
}

IGD_TEST(continue_response)
{
	http_parser p;
	bool error = false;
	p.incoming("HTTP/1.1 100 Continue\r\n\r\n"
		"HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok", error);
	TEST_CHECK(!error);
	TEST_EQUAL(p.status_code(), 200);
	TEST_CHECK(p.finished());
	TEST_EQUAL(p.body(), "ok");
}

IGD_TEST(no_content)
{
	http_parser p;
	bool error = false;
	p.incoming("HTTP/1.1 204 No Content\r\n\r\n", error);
	TEST_CHECK(p.finished());
	TEST_EQUAL(p.body(), "");
}

IGD_TEST(connection_close)
{
	http_parser p;
	bool error = false;
	p.incoming("HTTP/1.1 200 OK\r\nConnection: Close\r\nContent-Length: 0\r\n\r\n", error);
	TEST_CHECK(p.connection_close());
	TEST_CHECK(p.finished());
}

IGD_TEST(invalid_status_line)
{
	{
		http_parser p;
		bool error = false;
		p.incoming("SIP/2.0 200 OK\r\n\r\n", error);
		TEST_CHECK(error);
	}
	{
		http_parser p;
		bool error = false;
		p.incoming("HTTP/1.1 abc OK\r\n\r\n", error);
		TEST_CHECK(error);
		// once failed, the parser stays failed
		error = false;
		p.incoming("HTTP/1.1 200 OK\r\n\r\n", error);
		TEST_CHECK(error);
	}
	{
		http_parser p;
		bool error = false;
		p.incoming("HTTP/1.1 200 OK\r\nContent-Length: -5\r\n\r\n", error);
		TEST_CHECK(error);
	}
	{
		http_parser p;
		bool error = false;
		p.incoming("HTTP/1.1 200 OK\r\nno separator\r\n\r\n", error);
		TEST_CHECK(error);
	}
}

IGD_TEST(lf_line_endings)
{
	http_parser p;
	bool error = false;
	p.incoming("HTTP/1.1 200 OK\nContent-Length: 2\n\nhi", error);
	TEST_CHECK(!error);
	TEST_CHECK(p.finished());
	TEST_EQUAL(p.body(), "hi");
}

IGD_TEST(reset)
{
	http_parser p;
	bool error = false;
	p.incoming("HTTP/1.1 404 Not Found\r\nContent-Length: 1\r\n\r\nx", error);
	TEST_CHECK(p.finished());
	p.reset();
	TEST_CHECK(!p.header_finished());
	TEST_CHECK(!p.finished());
	TEST_EQUAL(p.body(), "");
	TEST_EQUAL(p.status_code(), -1);
	p.incoming("HTTP/1.1 200 OK\r\nContent-Length: 1\r\n\r\ny", error);
	TEST_CHECK(!error);
	TEST_EQUAL(p.body(), "y");
}

IGD_TEST(ok_status)
{
	TEST_CHECK(is_ok_status(200));
	TEST_CHECK(!is_ok_status(204));
	TEST_CHECK(!is_ok_status(500));
	TEST_CHECK(!is_ok_status(-1));
}
