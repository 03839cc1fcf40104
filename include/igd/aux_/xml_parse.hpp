/*

Copyright (c) 2007, 2011-2017, 2019-2020, Arvid Norberg
Copyright (c) 2020, Alden Torres
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_XML_PARSE_HPP
#define IGD_XML_PARSE_HPP

#include <functional>

#include "igd/config.hpp"
#include "igd/string_view.hpp"
#include "igd/aux_/export.hpp"

namespace igd::aux {

	enum
	{
		xml_start_tag,
		xml_end_tag,
		xml_empty_tag,
		xml_declaration_tag,
		xml_string,
		xml_attribute,
		xml_comment,
		xml_parse_error,
		// used for tags that don't follow the convention of
		// key-value pairs inside the tag brackets. Like !DOCTYPE
		xml_tag_content,
		// markup declarations, <!DOCTYPE ...> and the like. The name is
		// reported without the leading '!'. They don't open an element
		xml_markup_tag
	};

	// callback(int type, string_view name, string_view val)
	// name is element or attribute name
	// val is attribute value
	IGD_EXTRA_EXPORT void xml_parse(string_view input
		, std::function<void(int, string_view, string_view)> callback);

	// returns true if ``input`` holds one complete document: a single root
	// element whose start and end tags balance, and no parse errors. Trailing
	// whitespace after the root is allowed. This is what tells a partially
	// received document from a finished one
	IGD_EXTRA_EXPORT bool xml_complete(string_view input);
}

#endif
