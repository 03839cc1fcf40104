/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/device_locator.hpp"
#include "igd/aux_/string_util.hpp"
#include "igd/aux_/portmap_log.hpp"

#include <string>

namespace igd {

	void parse_http_url(string_view url, tcp::endpoint& host
		, std::string& path, error_code& ec)
	{
		ec.clear();
		url = aux::strip_string(url);

		if (!aux::string_begins_no_case("http://"_sv, url))
		{
			ec = errors::unsupported_url_protocol;
			return;
		}
		url.remove_prefix(7);

		auto const slash = url.find('/');
		string_view hostport = url.substr(0, slash);
		path = slash == string_view::npos
			? std::string("/") : std::string(url.substr(slash));

		if (hostport.empty())
		{
			ec = errors::invalid_url;
			return;
		}

		string_view hostname;
		string_view port;
		if (hostport.front() == '[')
		{
			// IPv6 literal
			auto const close = hostport.find(']');
			if (close == string_view::npos)
			{
				ec = errors::invalid_url;
				return;
			}
			hostname = hostport.substr(1, close - 1);
			string_view const rest = hostport.substr(close + 1);
			if (!rest.empty())
			{
				if (rest.front() != ':')
				{
					ec = errors::invalid_url;
					return;
				}
				port = rest.substr(1);
			}
		}
		else
		{
			auto const colon = hostport.find(':');
			hostname = hostport.substr(0, colon);
			if (colon != string_view::npos) port = hostport.substr(colon + 1);
		}

		error_code err;
		address const addr = make_address(std::string(hostname), err);
		if (err)
		{
			ec = errors::invalid_address;
			return;
		}

		std::int64_t port_num = 80;
		if (!port.empty() || hostport.back() == ':')
		{
			if (!aux::parse_int(port, port_num) || port_num < 0 || port_num > 65535)
			{
				ec = errors::invalid_port;
				return;
			}
		}

		host = tcp::endpoint(addr, static_cast<std::uint16_t>(port_num));
	}

	string_view find_field(string_view text, string_view const field)
	{
		while (!text.empty())
		{
			auto const eol = text.find_first_of("\r\n");
			string_view const line = text.substr(0, eol);
			text = eol == string_view::npos ? string_view() : text.substr(eol + 1);

			auto const colon = line.find(':');
			if (colon == string_view::npos) continue;
			if (!aux::string_equal_no_case(aux::strip_string(line.substr(0, colon)), field))
				continue;
			return aux::strip_string(line.substr(colon + 1));
		}
		return {};
	}

	std::shared_ptr<device> parse_discovery(string_view const text
		, error_code& ec, time_point const now)
	{
		ec.clear();
		string_view const location = find_field(text, "location"_sv);
		if (location.empty())
		{
			ec = errors::missing_location;
			return {};
		}

		tcp::endpoint host;
		std::string path;
		parse_http_url(location, host, path, ec);
		if (ec) return {};

		return std::make_shared<device>(host, std::move(path), now);
	}

	std::shared_ptr<device> locate_device(string_view const text
		, portmap_callback const& cb, time_point const now)
	{
		error_code ec;
		auto ret = parse_discovery(text, ec, now);
#ifndef IGD_DISABLE_LOGGING
		if (ec)
		{
			std::string const location(find_field(text, "location"_sv));
			aux::portmap_log(cb, "ignoring discovery record, location: \"%s\": %s"
				, location.c_str(), ec.message().c_str());
		}
		else
		{
			aux::portmap_log(cb, "found device at: %s", ret->description_url().c_str());
		}
#else
		(void)cb;
#endif
		return ret;
	}
}
