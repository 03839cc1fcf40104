/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_DEVICE_LOCATOR_HPP_INCLUDED
#define IGD_DEVICE_LOCATOR_HPP_INCLUDED

#include "igd/config.hpp"
#include "igd/device.hpp"
#include "igd/error_code.hpp"
#include "igd/portmap.hpp"
#include "igd/string_view.hpp"
#include "igd/time.hpp"
#include "igd/aux_/export.hpp"

#include <memory>
#include <string>

namespace igd {

	// splits an absolute http URL into its endpoint and path. The host must
	// be a literal IP address (IPv6 in brackets). A missing port is 80 and a
	// missing path is "/". On failure ``ec`` is set to one of
	// errors::unsupported_url_protocol, invalid_url, invalid_address or
	// invalid_port.
	IGD_EXPORT void parse_http_url(string_view url, tcp::endpoint& host
		, std::string& path, error_code& ec);

	// returns the (trimmed) value of the first header-like line of ``text``
	// whose field name equals ``field``, ignoring case. Lines may end in
	// CR, LF or CRLF. Returns an empty view if there is no such line
	IGD_EXTRA_EXPORT string_view find_field(string_view text, string_view field);

	// parses a raw discovery record (e.g. an SSDP response) into a device
	// referring to the record's Location. Returns nullptr and sets ``ec`` if
	// the record has no usable http Location.
	IGD_EXPORT std::shared_ptr<device> parse_discovery(string_view text
		, error_code& ec, time_point now = clock_type::now());

	// like parse_discovery(), but failures are logged to ``cb`` and the
	// candidate is dropped. Never throws
	IGD_EXPORT std::shared_ptr<device> locate_device(string_view text
		, portmap_callback const& cb, time_point now = clock_type::now());
}

#endif // IGD_DEVICE_LOCATOR_HPP_INCLUDED
