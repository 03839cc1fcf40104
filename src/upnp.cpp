/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/upnp.hpp"
#include "igd/assert.hpp"
#include "igd/device_locator.hpp"
#include "igd/aux_/portmap_log.hpp"
#include "igd/aux_/string_util.hpp"

#include <cstdarg>
#include <functional>
#include <initializer_list>
#include <string>
#include <utility>

using namespace std::placeholders;

namespace igd {

namespace {

	bool contains_no_case(string_view const haystack, string_view const needle)
	{
		if (needle.size() > haystack.size()) return false;
		for (std::size_t i = 0; i + needle.size() <= haystack.size(); ++i)
		{
			if (aux::string_equal_no_case(haystack.substr(i, needle.size()), needle))
				return true;
		}
		return false;
	}

	// true if the search target (ST) or notification type (NT) of a
	// discovery record refers to something that can map ports
	bool is_router_record(string_view const text)
	{
		for (string_view const field : {"st"_sv, "nt"_sv})
		{
			string_view const target = find_field(text, field);
			if (contains_no_case(target, "InternetGatewayDevice")
				|| contains_no_case(target, "WANIPConnection"))
				return true;
		}
		return false;
	}

	bool is_permanent_failure(error_code const& ec)
	{
		if (ec.category() != igd_category()) return false;
		switch (ec.value())
		{
			case errors::no_wanip_service:
			case errors::unsupported_url_protocol:
			case errors::invalid_url:
			case errors::invalid_address:
			case errors::invalid_port:
				return true;
			default:
				return false;
		}
	}
}

upnp::upnp(io_context& ios, http_transport& transport
	, aux::delay_source& delay
	, settings_pack const& settings, portmap_callback& cb)
	: m_ios(ios)
	, m_transport(transport)
	, m_settings(settings)
	, m_callback(cb)
	, m_resolver(std::make_shared<service_resolver>(transport, delay, settings, cb))
{
}

upnp::upnp(io_context& ios, http_transport& transport
	, settings_pack const& settings, portmap_callback& cb)
	: m_ios(ios)
	, m_transport(transport)
	, m_own_delay(std::make_unique<aux::timer_delay>(ios))
	, m_settings(settings)
	, m_callback(cb)
	, m_resolver(std::make_shared<service_resolver>(transport, *m_own_delay, settings, cb))
{
}

#ifndef IGD_DISABLE_LOGGING
bool upnp::should_log() const
{
	return m_callback.should_log_portmap();
}

void upnp::log(char const* fmt, ...) const
{
	if (!should_log()) return;
	va_list v;
	va_start(v, fmt);
	aux::portmap_vlog(m_callback, fmt, v);
	va_end(v);
}
#endif

std::shared_ptr<device const> upnp::on_discovery(string_view const text
	, time_point const now)
{
	if (m_settings.get_bool(settings_pack::upnp_ignore_nonrouters)
		&& !is_router_record(text))
	{
#ifndef IGD_DISABLE_LOGGING
		log("ignoring non-router: \"%s\"", std::string(find_field(text, "st")).c_str());
#endif
		return {};
	}

	std::shared_ptr<device> d = locate_device(text, m_callback, now);
	if (!d) return {};

	{
		std::lock_guard<std::mutex> l(m_mutex);
		if (m_closing) return {};

		auto const i = m_devices.find(d);
		if (i != m_devices.end())
		{
			// we already know about this one. It's still alive
			(*i)->touch(now);
			return *i;
		}

		if (int(m_devices.size()) >= m_settings.get_int(settings_pack::upnp_max_devices))
		{
#ifndef IGD_DISABLE_LOGGING
			log("too many devices, ignoring: %s", d->description_url().c_str());
#endif
			return {};
		}
		m_devices.insert(d);
	}

#ifndef IGD_DISABLE_LOGGING
	log("found device: %s", d->description_url().c_str());
#endif
	m_resolver->resolve(d, std::bind(&upnp::on_resolved, shared_from_this(), _1, _2));
	return d;
}

void upnp::on_resolved(error_code const& ec, std::shared_ptr<device> const& d)
{
	if (ec)
	{
		// a device that is not a usable router stays known, so it isn't
		// fetched again on every announcement. Anything else may be
		// transient
		if (is_permanent_failure(ec))
		{
#ifndef IGD_DISABLE_LOGGING
			log("disabling device: %s: %s", d->description_url().c_str()
				, ec.message().c_str());
#endif
			return;
		}

		{
			std::lock_guard<std::mutex> l(m_mutex);
			auto const i = m_devices.find(d);
			if (i != m_devices.end() && *i == d) m_devices.erase(i);
		}
#ifndef IGD_DISABLE_LOGGING
		log("failed to resolve device: %s: %s", d->description_url().c_str()
			, ec.message().c_str());
#endif
		return;
	}

	{
		std::lock_guard<std::mutex> l(m_mutex);
		if (m_closing) return;
	}
#ifndef IGD_DISABLE_LOGGING
	log("device resolved: %s control: %s model: \"%s\""
		, d->description_url().c_str(), d->control_path().c_str()
		, d->model_name().c_str());
#endif
	m_callback.on_device_resolved(d);
}

std::vector<std::shared_ptr<device const>> upnp::devices() const
{
	std::vector<std::shared_ptr<device const>> ret;
	std::lock_guard<std::mutex> l(m_mutex);
	for (auto const& d : m_devices)
		if (d->resolved()) ret.push_back(d);
	return ret;
}

int upnp::num_known_devices() const
{
	std::lock_guard<std::mutex> l(m_mutex);
	return int(m_devices.size());
}

std::shared_ptr<mapping_session> upnp::session(std::shared_ptr<device const> d)
{
	return std::make_shared<mapping_session>(m_ios, m_transport, std::move(d)
		, m_settings, m_callback);
}

void upnp::close()
{
	std::lock_guard<std::mutex> l(m_mutex);
	m_closing = true;
}

}
