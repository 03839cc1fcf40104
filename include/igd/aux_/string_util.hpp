/*

Copyright (c) 2012-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_STRING_UTIL_HPP_INCLUDED
#define IGD_STRING_UTIL_HPP_INCLUDED

#include "igd/config.hpp"
#include "igd/string_view.hpp"
#include "igd/aux_/export.hpp"

#include <cstdint>
#include <string>

namespace igd::aux {

	IGD_EXTRA_EXPORT bool is_alpha(char c);
	IGD_EXTRA_EXPORT bool is_digit(char c);
	IGD_EXTRA_EXPORT bool is_space(char c);
	IGD_EXTRA_EXPORT char to_lower(char c);

	IGD_EXTRA_EXPORT bool string_begins_no_case(char const* s1, char const* s2);
	IGD_EXTRA_EXPORT bool string_equal_no_case(string_view s1, string_view s2);
	IGD_EXTRA_EXPORT bool string_begins_no_case(string_view prefix, string_view s);

	// removes leading and trailing whitespace
	IGD_EXTRA_EXPORT string_view strip_string(string_view in);

	// returns the element name without any namespace prefix, i.e. "u:Foo"
	// becomes "Foo"
	IGD_EXTRA_EXPORT string_view local_name(string_view tag);

	// parses a decimal integer covering the whole of ``str`` (surrounding
	// whitespace allowed). Returns false if it isn't one, or if it doesn't
	// fit in an int64
	IGD_EXTRA_EXPORT bool parse_int(string_view str, std::int64_t& val);

	// escapes the characters XML treats specially (& < > " ')
	IGD_EXTRA_EXPORT std::string xml_escape(string_view str);

	// undoes xml_escape() and decodes numeric character references
	IGD_EXTRA_EXPORT std::string xml_unescape(string_view str);
}

#endif // IGD_STRING_UTIL_HPP_INCLUDED
