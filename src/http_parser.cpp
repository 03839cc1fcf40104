/*

Copyright (c) 2008-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <algorithm>
#include <cstdlib>
#include <limits>

#include "igd/config.hpp"
#include "igd/http_parser.hpp"
#include "igd/assert.hpp"
#include "igd/aux_/string_util.hpp"

namespace igd {

namespace {

	int hex_to_int(char const in)
	{
		if (in >= '0' && in <= '9') return int(in) - '0';
		if (in >= 'A' && in <= 'F') return int(in) - 'A' + 10;
		if (in >= 'a' && in <= 'f') return int(in) - 'a' + 10;
		return -1;
	}

	// splits off the text up to the next ``sep`` (or the end)
	string_view read_until(string_view& str, char const sep)
	{
		auto const pos = str.find(sep);
		string_view const ret = str.substr(0, pos);
		str = pos == string_view::npos ? string_view() : str.substr(pos + 1);
		return ret;
	}
}

	bool is_ok_status(int const http_status)
	{
		return http_status == 200;
	}

	http_parser::http_parser() = default;
	http_parser::~http_parser() = default;

	std::string const& http_parser::header(string_view const key) const
	{
		static std::string const empty;
		std::string name(key);
		std::transform(name.begin(), name.end(), name.begin(), &aux::to_lower);
		auto const i = m_header.find(name);
		if (i == m_header.end()) return empty;
		return i->second;
	}

	// pulls the next complete line (without its terminator) out of the
	// receive buffer. Returns false if there isn't one yet
	bool http_parser::next_line(string_view& line)
	{
		auto const newline = m_recv_buffer.find('\n', m_recv_pos);
		if (newline == std::string::npos) return false;

		std::size_t line_end = newline;
		if (line_end > m_recv_pos && m_recv_buffer[line_end - 1] == '\r') --line_end;
		line = string_view(m_recv_buffer).substr(m_recv_pos, line_end - m_recv_pos);
		m_recv_pos = newline + 1;
		return true;
	}

	bool http_parser::parse_header_line(string_view const line)
	{
		auto const separator = line.find(':');
		if (separator == string_view::npos) return false;

		std::string name(aux::strip_string(line.substr(0, separator)));
		std::transform(name.begin(), name.end(), name.begin(), &aux::to_lower);
		std::string value(aux::strip_string(line.substr(separator + 1)));

		if (m_state == read_header)
		{
			if (name == "content-length")
			{
				std::int64_t len = -1;
				if (!aux::parse_int(value, len) || len < 0) return false;
				m_content_length = len;
			}
			else if (name == "connection")
			{
				m_connection_close = aux::string_begins_no_case("close"_sv, value);
			}
			else if (name == "transfer-encoding")
			{
				m_chunked_encoding = aux::string_begins_no_case("chunked"_sv, value);
			}
		}
		m_header.emplace(std::move(name), std::move(value));
		return true;
	}

	int http_parser::incoming(string_view const recv_buffer, bool& error)
	{
		if (m_state == error_state)
		{
			error = true;
			return 0;
		}

		// drop what has been consumed already, before appending
		if (m_recv_pos > 0)
		{
			m_recv_buffer.erase(0, m_recv_pos);
			m_recv_pos = 0;
		}
		m_recv_buffer.append(recv_buffer.data(), recv_buffer.size());

		std::size_t const body_before = m_body.size();
		string_view line;

		while (m_state == read_status || m_state == read_header)
		{
			if (!next_line(line)) break;

			if (m_state == read_status)
			{
				string_view rest = line;
				m_protocol = std::string(read_until(rest, ' '));
				if (m_protocol.substr(0, 5) != "HTTP/")
				{
					m_state = error_state;
					error = true;
					return 0;
				}
				std::int64_t status = -1;
				if (!aux::parse_int(read_until(rest, ' '), status)
					|| status < 100 || status > 999)
				{
					m_state = error_state;
					error = true;
					return 0;
				}
				m_status_code = int(status);
				m_server_message = std::string(rest);

				// HTTP 1.0 always closes the connection after
				// each request
				if (m_protocol == "HTTP/1.0") m_connection_close = true;
				m_state = read_header;
				continue;
			}

			if (line.empty())
			{
				if (m_status_code == 100)
				{
					// for 100 Continue, we need to read another response header
					// before reading the body
					m_header.clear();
					m_state = read_status;
					continue;
				}
				// the header is finished and the body starts
				m_state = read_body;
				if (m_status_code == 204 || m_status_code == 304
					|| (m_content_length == 0 && !m_chunked_encoding))
				{
					m_finished = true;
				}
				break;
			}

			if (!parse_header_line(line))
			{
				m_state = error_state;
				error = true;
				return 0;
			}
		}

		if (m_state == read_body && !m_finished && !parse_body())
		{
			m_state = error_state;
			error = true;
		}

		return int(m_body.size() - body_before);
	}

	bool http_parser::parse_body()
	{
		if (!m_chunked_encoding)
		{
			std::size_t avail = m_recv_buffer.size() - m_recv_pos;
			if (m_content_length >= 0)
			{
				auto const left = std::uint64_t(m_content_length) - m_body.size();
				if (avail > left) avail = std::size_t(left);
			}
			m_body.append(m_recv_buffer, m_recv_pos, avail);
			m_recv_pos += avail;
			if (m_content_length >= 0 && std::int64_t(m_body.size()) >= m_content_length)
				m_finished = true;
			return true;
		}

		string_view line;
		while (!m_finished)
		{
			switch (m_chunk_state)
			{
				case chunk_header:
				{
					if (!next_line(line)) return true;
					// the chunk header is a hex length of the chunk followed
					// by an optional semi-colon with chunk extensions
					string_view const size_str = aux::strip_string(line.substr(0, line.find(';')));
					if (size_str.empty()) return false;
					std::int64_t size = 0;
					for (char const c : size_str)
					{
						int const digit = hex_to_int(c);
						if (digit < 0) return false;
						if (size >= std::numeric_limits<std::int64_t>::max() / 16) return false;
						size = size * 16 + digit;
					}
					m_chunk_left = size;
					m_chunk_state = size == 0 ? chunk_trailer : chunk_data;
					break;
				}
				case chunk_data:
				{
					std::size_t avail = m_recv_buffer.size() - m_recv_pos;
					if (avail == 0) return true;
					if (std::int64_t(avail) > m_chunk_left) avail = std::size_t(m_chunk_left);
					m_body.append(m_recv_buffer, m_recv_pos, avail);
					m_recv_pos += avail;
					m_chunk_left -= std::int64_t(avail);
					if (m_chunk_left == 0) m_chunk_state = chunk_data_end;
					break;
				}
				case chunk_data_end:
				{
					// every chunk is terminated by a newline
					if (!next_line(line)) return true;
					if (!line.empty()) return false;
					m_chunk_state = chunk_header;
					break;
				}
				case chunk_trailer:
				{
					// the terminating chunk may be followed by trailing headers,
					// ended by an empty line
					if (!next_line(line)) return true;
					if (line.empty())
					{
						m_finished = true;
						break;
					}
					if (!parse_header_line(line)) return false;
					break;
				}
			}
		}
		return true;
	}

	bool http_parser::on_eof()
	{
		if (m_state == read_body && !m_finished
			&& !m_chunked_encoding && m_content_length < 0)
		{
			m_finished = true;
		}
		return m_finished;
	}

	void http_parser::reset()
	{
		m_recv_buffer.clear();
		m_recv_pos = 0;
		m_body.clear();
		m_protocol.clear();
		m_server_message.clear();
		m_header.clear();
		m_content_length = -1;
		m_chunk_left = 0;
		m_status_code = -1;
		m_state = read_status;
		m_chunk_state = chunk_header;
		m_chunked_encoding = false;
		m_connection_close = false;
		m_finished = false;
	}
}
