/*

Copyright (c) 2012-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/config.hpp"
#include "igd/aux_/string_util.hpp"

#include <cstdlib>
#include <cstdio> // for snprintf
#include <limits>

namespace igd::aux {

	bool is_alpha(char const c)
	{
		return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
	}

	bool is_digit(char const c)
	{
		return c >= '0' && c <= '9';
	}

	bool is_space(char const c)
	{
		return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
	}

	char to_lower(char const c)
	{
		return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
	}

	bool string_begins_no_case(char const* s1, char const* s2)
	{
		while (*s1 != 0)
		{
			if (to_lower(*s1) != to_lower(*s2)) return false;
			++s1;
			++s2;
		}
		return true;
	}

	bool string_begins_no_case(string_view const prefix, string_view const s)
	{
		if (prefix.size() > s.size()) return false;
		return string_equal_no_case(prefix, s.substr(0, prefix.size()));
	}

	bool string_equal_no_case(string_view const s1, string_view const s2)
	{
		if (s1.size() != s2.size()) return false;
		for (std::size_t i = 0; i < s1.size(); ++i)
		{
			if (to_lower(s1[i]) != to_lower(s2[i])) return false;
		}
		return true;
	}

	string_view strip_string(string_view in)
	{
		while (!in.empty() && is_space(in.front()))
			in.remove_prefix(1);

		while (!in.empty() && is_space(in.back()))
			in.remove_suffix(1);
		return in;
	}

	string_view local_name(string_view const tag)
	{
		auto const colon = tag.find(':');
		if (colon == string_view::npos) return tag;
		return tag.substr(colon + 1);
	}

	bool parse_int(string_view str, std::int64_t& val)
	{
		str = strip_string(str);
		if (str.empty()) return false;
		bool negative = false;
		if (str.front() == '-' || str.front() == '+')
		{
			negative = str.front() == '-';
			str.remove_prefix(1);
			if (str.empty()) return false;
		}
		std::int64_t ret = 0;
		for (char const c : str)
		{
			if (!is_digit(c)) return false;
			if (ret > (std::numeric_limits<std::int64_t>::max() - (c - '0')) / 10)
				return false;
			ret = ret * 10 + (c - '0');
		}
		val = negative ? -ret : ret;
		return true;
	}

	std::string xml_escape(string_view const str)
	{
		std::string ret;
		ret.reserve(str.size());
		for (char const c : str)
		{
			switch (c)
			{
				case '&': ret += "&amp;"; break;
				case '<': ret += "&lt;"; break;
				case '>': ret += "&gt;"; break;
				case '"': ret += "&quot;"; break;
				case '\'': ret += "&apos;"; break;
				default: ret += c; break;
			}
		}
		return ret;
	}

	namespace {

	void append_utf8(std::string& out, std::uint32_t cp)
	{
		if (cp < 0x80)
		{
			out += static_cast<char>(cp);
		}
		else if (cp < 0x800)
		{
			out += static_cast<char>(0xc0 | (cp >> 6));
			out += static_cast<char>(0x80 | (cp & 0x3f));
		}
		else if (cp < 0x10000)
		{
			out += static_cast<char>(0xe0 | (cp >> 12));
			out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
			out += static_cast<char>(0x80 | (cp & 0x3f));
		}
		else
		{
			out += static_cast<char>(0xf0 | (cp >> 18));
			out += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
			out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
			out += static_cast<char>(0x80 | (cp & 0x3f));
		}
	}

	}

	std::string xml_unescape(string_view str)
	{
		std::string ret;
		ret.reserve(str.size());
		while (!str.empty())
		{
			auto const amp = str.find('&');
			ret.append(str.data(), std::min(amp, str.size()));
			if (amp == string_view::npos) break;
			str.remove_prefix(amp);

			auto const semi = str.find(';');
			if (semi == string_view::npos || semi > 10)
			{
				// not an entity, keep the ampersand verbatim
				ret += '&';
				str.remove_prefix(1);
				continue;
			}

			string_view const entity = str.substr(1, semi - 1);
			if (entity == "amp") ret += '&';
			else if (entity == "lt") ret += '<';
			else if (entity == "gt") ret += '>';
			else if (entity == "quot") ret += '"';
			else if (entity == "apos") ret += '\'';
			else if (entity.size() > 1 && entity[0] == '#')
			{
				char const* start = entity.data() + 1;
				int base = 10;
				if (*start == 'x' || *start == 'X')
				{
					++start;
					base = 16;
				}
				std::string const digits(start, entity.data() + entity.size());
				char* end = nullptr;
				unsigned long const cp = std::strtoul(digits.c_str(), &end, base);
				if (digits.empty() || *end != 0 || cp > 0x10ffff)
					ret.append(str.data(), semi + 1);
				else
					append_utf8(ret, static_cast<std::uint32_t>(cp));
			}
			else
			{
				ret.append(str.data(), semi + 1);
			}
			str.remove_prefix(semi + 1);
		}
		return ret;
	}
}
