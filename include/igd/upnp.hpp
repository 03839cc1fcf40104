/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_UPNP_HPP_INCLUDED
#define IGD_UPNP_HPP_INCLUDED

#include "igd/config.hpp"
#include "igd/socket.hpp"
#include "igd/device.hpp"
#include "igd/http_transport.hpp"
#include "igd/mapping_session.hpp"
#include "igd/portmap.hpp"
#include "igd/service_resolver.hpp"
#include "igd/settings_pack.hpp"
#include "igd/string_view.hpp"
#include "igd/time.hpp"
#include "igd/aux_/export.hpp"
#include "igd/aux_/retry_parser.hpp"

#include <memory>
#include <mutex>
#include <set>
#include <vector>

namespace igd {

	// ties discovery, resolution and mapping sessions together. Discovery
	// records are fed in by the hosting application (the SSDP multicast
	// itself is not done here). Every distinct router is resolved once and
	// reported to portmap_callback::on_device_resolved(). A router whose
	// description could not be fetched is tried again when it's announced
	// again. Must be created by std::make_shared.
	struct IGD_EXPORT upnp final : std::enable_shared_from_this<upnp>
	{
		upnp(io_context& ios, http_transport& transport
			, aux::delay_source& delay
			, settings_pack const& settings, portmap_callback& cb);

		// uses steady timers on ``ios`` for the description retry interval
		upnp(io_context& ios, http_transport& transport
			, settings_pack const& settings, portmap_callback& cb);

		upnp(upnp const&) = delete;
		upnp& operator=(upnp const&) = delete;

		// handles one discovery record (the text of an SSDP response or
		// NOTIFY). Returns the device it refers to, or nullptr if the record
		// was dropped. A device seen before is only marked as seen again
		std::shared_ptr<device const> on_discovery(string_view text
			, time_point now = clock_type::now());

		// the devices resolved so far
		std::vector<std::shared_ptr<device const>> devices() const;

		// the number of devices recorded, resolved or not. A device whose
		// description could not be fetched is forgotten, so that the next
		// announcement of it starts over
		int num_known_devices() const;

		// a session issuing mapping operations to ``d``
		std::shared_ptr<mapping_session> session(std::shared_ptr<device const> d);

		// stops reporting devices. Resolutions in flight complete silently
		void close();

	private:

		void on_resolved(error_code const& ec, std::shared_ptr<device> const& d);

#ifndef IGD_DISABLE_LOGGING
		bool should_log() const;
		void log(char const* fmt, ...) const IGD_FORMAT(2,3);
#endif

		struct device_less
		{
			bool operator()(std::shared_ptr<device> const& lhs
				, std::shared_ptr<device> const& rhs) const
			{ return *lhs < *rhs; }
		};

		io_context& m_ios;
		http_transport& m_transport;

		// only set when we own the delay source
		std::unique_ptr<aux::timer_delay> m_own_delay;

		settings_pack const m_settings;
		portmap_callback& m_callback;

		std::shared_ptr<service_resolver> m_resolver;

		mutable std::mutex m_mutex;
		std::set<std::shared_ptr<device>, device_less> m_devices;
		bool m_closing = false;
	};
}

#endif // IGD_UPNP_HPP_INCLUDED
