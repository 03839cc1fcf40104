/*

Copyright (c) 2004, 2006-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_HTTP_PARSER_HPP_INCLUDED
#define IGD_HTTP_PARSER_HPP_INCLUDED

#include "igd/config.hpp"
#include "igd/string_view.hpp"
#include "igd/aux_/export.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace igd {

	// returns true if the HTTP status code is 200 OK
	IGD_EXTRA_EXPORT bool is_ok_status(int http_status);

	// an incremental parser of HTTP/1.x responses. Bytes are fed as they
	// arrive; the parser keeps the decoded body (chunked transfer encoding
	// removed) and the headers.
	class IGD_EXTRA_EXPORT http_parser
	{
	public:
		http_parser();
		~http_parser();

		// feeds the next bytes received from the socket. Returns the number
		// of body bytes that became available (appended to body()) because
		// of this call. ``error`` is set if the response is malformed, after
		// which all further input is rejected.
		int incoming(string_view recv_buffer, bool& error);

		// tells the parser the connection was closed. For a response with
		// neither a content-length nor chunked encoding, the body is
		// delimited by the close and is now complete. Returns finished()
		bool on_eof();

		bool header_finished() const { return m_state == read_body; }
		bool finished() const { return m_finished; }
		bool error() const { return m_state == error_state; }

		std::string const& protocol() const { return m_protocol; }
		int status_code() const { return m_status_code; }
		std::string const& message() const { return m_server_message; }

		// header names are matched case insensitively (they are stored in
		// lower case). Returns an empty string for a missing header
		std::string const& header(string_view key) const;
		std::multimap<std::string, std::string> const& headers() const { return m_header; }

		// -1 if the response has no content-length header
		std::int64_t content_length() const { return m_content_length; }
		bool chunked_encoding() const { return m_chunked_encoding; }
		bool connection_close() const { return m_connection_close; }

		// the body received so far
		string_view body() const { return m_body; }

		void reset();

	private:

		bool next_line(string_view& line);
		bool parse_header_line(string_view line);
		bool parse_body();

		enum state_t { read_status, read_header, read_body, error_state };
		enum chunk_state_t { chunk_header, chunk_data, chunk_data_end, chunk_trailer };

		// bytes received but not consumed yet
		std::string m_recv_buffer;
		std::size_t m_recv_pos = 0;

		std::string m_body;

		std::string m_protocol;
		std::string m_server_message;
		std::multimap<std::string, std::string> m_header;

		std::int64_t m_content_length = -1;
		std::int64_t m_chunk_left = 0;
		int m_status_code = -1;

		state_t m_state = read_status;
		chunk_state_t m_chunk_state = chunk_header;

		bool m_chunked_encoding = false;
		bool m_connection_close = false;
		bool m_finished = false;
	};
}

#endif // IGD_HTTP_PARSER_HPP_INCLUDED
