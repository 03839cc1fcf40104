/*

Copyright (c) 2016-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/portmap.hpp"
#include "igd/aux_/string_util.hpp"

#include <utility>

namespace igd {

	mapping::mapping(int const ext_port, portmap_protocol const proto
		, int const int_port, std::string int_host, std::string desc)
		: external_port(ext_port)
		, protocol(proto)
		, internal_port(int_port)
		, internal_host(std::move(int_host))
		, description(std::move(desc))
	{}

	mapping mapping::not_found(portmap_protocol const proto)
	{
		mapping ret;
		ret.external_port = -1;
		ret.protocol = proto;
		ret.enabled = false;
		return ret;
	}

	bool operator==(mapping const& lhs, mapping const& rhs)
	{
		return lhs.external_port == rhs.external_port
			&& lhs.protocol == rhs.protocol
			&& lhs.internal_port == rhs.internal_port
			&& lhs.internal_host == rhs.internal_host
			&& lhs.description == rhs.description
			&& lhs.lease_duration == rhs.lease_duration
			&& lhs.remote_host == rhs.remote_host
			&& lhs.enabled == rhs.enabled;
	}

	portmap_protocol parse_protocol(string_view const str)
	{
		string_view const s = aux::strip_string(str);
		if (aux::string_equal_no_case(s, "tcp")) return portmap_protocol::tcp;
		if (aux::string_equal_no_case(s, "udp")) return portmap_protocol::udp;
		return portmap_protocol::none;
	}
}
