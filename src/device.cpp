/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/device.hpp"
#include "igd/assert.hpp"

#include <tuple>
#include <utility>

namespace igd {

	device::device(tcp::endpoint host, std::string description_path
		, time_point const seen)
		: m_host(std::move(host))
		, m_description_path(std::move(description_path))
		, m_control_host(m_host)
		, m_last_seen(seen.time_since_epoch().count())
	{}

	std::string device::description_url() const
	{
		std::string ret = "http://";
		if (m_host.address().is_v6())
		{
			ret += '[';
			ret += m_host.address().to_string();
			ret += ']';
		}
		else
		{
			ret += m_host.address().to_string();
		}
		ret += ':';
		ret += std::to_string(m_host.port());
		ret += m_description_path;
		return ret;
	}

	std::string device::control_path() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_control_path;
	}

	tcp::endpoint device::control_host() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_control_host;
	}

	std::string device::service_type() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_service_type;
	}

	std::string device::model_name() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_model;
	}

	bool device::resolved() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return !m_control_path.empty();
	}

	bool device::set_control(std::string path, std::string service_type
		, std::string model)
	{
		return set_control(m_host, std::move(path), std::move(service_type)
			, std::move(model));
	}

	bool device::set_control(tcp::endpoint control_host, std::string path
		, std::string service_type, std::string model)
	{
		IGD_ASSERT(!path.empty());
		std::lock_guard<std::mutex> l(m_mutex);
		if (!m_control_path.empty()) return false;
		m_control_host = std::move(control_host);
		m_control_path = std::move(path);
		m_service_type = std::move(service_type);
		m_model = std::move(model);
		return true;
	}

	time_point device::last_seen() const
	{
		return time_point(time_duration(m_last_seen.load(std::memory_order_relaxed)));
	}

	void device::touch(time_point const now)
	{
		m_last_seen.store(now.time_since_epoch().count(), std::memory_order_relaxed);
	}

	std::size_t device::hash() const
	{
		std::size_t const h1 = std::hash<std::string>()(m_host.address().to_string());
		std::size_t const h2 = std::hash<unsigned short>()(m_host.port());
		std::size_t const h3 = std::hash<std::string>()(m_description_path);
		std::size_t ret = h1;
		ret ^= h2 + 0x9e3779b9 + (ret << 6) + (ret >> 2);
		ret ^= h3 + 0x9e3779b9 + (ret << 6) + (ret >> 2);
		return ret;
	}

	bool operator==(device const& lhs, device const& rhs)
	{
		return lhs.m_host == rhs.m_host
			&& lhs.m_description_path == rhs.m_description_path;
	}

	bool operator<(device const& lhs, device const& rhs)
	{
		return std::tie(lhs.m_host, lhs.m_description_path)
			< std::tie(rhs.m_host, rhs.m_description_path);
	}
}
