/*

Copyright (c) 2014-2020, Arvid Norberg
Copyright (c) 2016-2017, 2020, Alden Torres
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <functional>
#include <vector>

#include "igd/aux_/xml_parse.hpp"
#include "igd/aux_/string_util.hpp"

namespace igd::aux {

namespace {

	using callback_t = std::function<void(int, string_view, string_view)>;

	string_view skip_space(string_view s)
	{
		while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
		return s;
	}

	std::size_t find_space(string_view const s)
	{
		for (std::size_t i = 0; i < s.size(); ++i)
			if (is_space(s[i])) return i;
		return string_view::npos;
	}

	// reports the name="value" pairs of ``attrs``, the part of a tag
	// following its name. Anything not in that form ends the attribute list
	void parse_attributes(string_view attrs, callback_t const& callback)
	{
		for (;;)
		{
			attrs = skip_space(attrs);
			if (attrs.empty()) return;

			std::size_t name_end = 0;
			while (name_end < attrs.size() && attrs[name_end] != '='
				&& !is_space(attrs[name_end]))
				++name_end;
			string_view const name = attrs.substr(0, name_end);

			string_view rest = skip_space(attrs.substr(name_end));
			if (rest.empty() || rest.front() != '=')
			{
				// not key-value pairs, like <!DOCTYPE html>
				callback(xml_tag_content, attrs, {});
				return;
			}

			rest = skip_space(rest.substr(1));
			if (rest.empty() || (rest.front() != '"' && rest.front() != '\''))
			{
				callback(xml_parse_error, "unquoted attribute value", {});
				return;
			}

			auto const close = rest.find(rest.front(), 1);
			if (close == string_view::npos)
			{
				callback(xml_parse_error, "missing end quote on attribute", {});
				return;
			}
			callback(xml_attribute, name, rest.substr(1, close - 1));
			attrs = rest.substr(close + 1);
		}
	}
}

	void xml_parse(string_view input
		, std::function<void(int, string_view, string_view)> callback)
	{
		while (!input.empty())
		{
			auto const open = input.find('<');
			if (open != 0)
				callback(xml_string, input.substr(0, open), {});
			if (open == string_view::npos) return;
			input.remove_prefix(open + 1);

			if (string_begins_no_case("![CDATA["_sv, input))
			{
				input.remove_prefix(8);
				auto const close = input.find("]]>");
				if (close == string_view::npos)
				{
					callback(xml_parse_error, "unexpected end of file", {});
					return;
				}
				callback(xml_string, input.substr(0, close), {});
				input.remove_prefix(close + 3);
				continue;
			}

			if (input.substr(0, 3) == "!--")
			{
				auto const close = input.find("-->", 3);
				if (close == string_view::npos)
				{
					callback(xml_parse_error, "unexpected end of file", {});
					return;
				}
				callback(xml_comment, input.substr(3, close - 3), {});
				input.remove_prefix(close + 3);
				continue;
			}

			auto const close = input.find('>');
			if (close == string_view::npos)
			{
				callback(xml_parse_error, "unexpected end of file", {});
				return;
			}
			string_view tag = input.substr(0, close);
			input.remove_prefix(close + 1);

			int type = xml_start_tag;
			if (!tag.empty() && tag.front() == '/')
			{
				type = xml_end_tag;
				tag.remove_prefix(1);
			}
			else if (!tag.empty() && tag.back() == '/')
			{
				type = xml_empty_tag;
				tag.remove_suffix(1);
			}
			else if (tag.size() >= 2 && tag.front() == '?' && tag.back() == '?')
			{
				type = xml_declaration_tag;
				tag.remove_prefix(1);
				tag.remove_suffix(1);
			}
			else if (!tag.empty() && tag.front() == '!')
			{
				type = xml_markup_tag;
				tag.remove_prefix(1);
			}

			auto const name_end = find_space(tag);
			callback(type, tag.substr(0, name_end), {});
			if (name_end != string_view::npos)
				parse_attributes(tag.substr(name_end), callback);
		}
	}

	bool xml_complete(string_view const input)
	{
		std::vector<string_view> stack;
		bool error = false;
		bool root_closed = false;

		xml_parse(input, [&](int const type, string_view const name, string_view)
		{
			if (error) return;
			switch (type)
			{
				case xml_start_tag:
					if (root_closed) error = true;
					else stack.push_back(name);
					break;
				case xml_empty_tag:
					if (root_closed) error = true;
					else if (stack.empty()) root_closed = true;
					break;
				case xml_end_tag:
					if (stack.empty() || stack.back() != name)
					{
						error = true;
						break;
					}
					stack.pop_back();
					if (stack.empty()) root_closed = true;
					break;
				case xml_string:
					// text outside of the root element
					if (stack.empty() && !strip_string(name).empty()) error = true;
					break;
				case xml_parse_error:
					error = true;
					break;
				default: break;
			}
		});

		return !error && root_closed && stack.empty();
	}
}
