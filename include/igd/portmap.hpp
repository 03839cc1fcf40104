/*

Copyright (c) 2016-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_PORTMAP_HPP_INCLUDED
#define IGD_PORTMAP_HPP_INCLUDED

#include "igd/config.hpp"
#include "igd/string_view.hpp"
#include "igd/aux_/export.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace igd {

	class device;

	enum class portmap_protocol : std::uint8_t
	{
		none, tcp, udp
	};

	// a port mapping as it is added to, or listed by, a router
	struct IGD_EXPORT mapping
	{
		// the external (on the NAT router) port. -1 is the "not found"
		// sentinel returned when a router has no entry for a lookup
		int external_port = -1;

		portmap_protocol protocol = portmap_protocol::none;

		// the port and host (IP address as text) inside the LAN the
		// external port forwards to. An empty host means the local address
		// of the connection to the router is used
		int internal_port = 0;
		std::string internal_host;

		std::string description;

		// lease duration in seconds. 0 means permanent
		int lease_duration = 0;

		// the remote host the mapping is restricted to. Empty means any
		std::string remote_host;

		bool enabled = true;

		mapping() = default;
		mapping(int ext_port, portmap_protocol proto, int int_port
			, std::string int_host = std::string()
			, std::string desc = std::string());

		// the sentinel for a mapping the router does not have
		static mapping not_found(portmap_protocol proto = portmap_protocol::none);

		bool valid() const { return external_port != -1; }

		friend bool operator==(mapping const& lhs, mapping const& rhs);
		friend bool operator!=(mapping const& lhs, mapping const& rhs)
		{ return !(lhs == rhs); }
	};

	inline char const* to_string(portmap_protocol const p)
	{
		return p == portmap_protocol::udp ? "UDP" : "TCP";
	}

	// parses "TCP" or "UDP" (any case). Anything else is
	// portmap_protocol::none
	IGD_EXPORT portmap_protocol parse_protocol(string_view str);

	// the interface the hosting application implements to be told about
	// routers and to receive the log
	struct IGD_EXPORT portmap_callback
	{
		// called once for every device whose control endpoint has been
		// resolved. Devices that fail resolution are never reported
		virtual void on_device_resolved(std::shared_ptr<device const> const& d) = 0;
#ifndef IGD_DISABLE_LOGGING
		virtual bool should_log_portmap() const = 0;
		virtual void log_portmap(char const* msg) const = 0;
#endif

	protected:
		~portmap_callback() {}
	};
}

#endif // IGD_PORTMAP_HPP_INCLUDED
