/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_DEVICE_HPP_INCLUDED
#define IGD_DEVICE_HPP_INCLUDED

#include "igd/config.hpp"
#include "igd/socket.hpp"
#include "igd/time.hpp"
#include "igd/aux_/export.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>

namespace igd {

	// a router found on the local network. It is created from a discovery
	// record, knowing only where its description document lives. Resolution
	// sets the control endpoint (host and path) once. Identity is (host,
	// description path) and does not change when the control endpoint is set.
	class IGD_EXPORT device
	{
	public:
		device(tcp::endpoint host, std::string description_path
			, time_point seen = clock_type::now());

		device(device const&) = delete;
		device& operator=(device const&) = delete;

		tcp::endpoint const& host() const { return m_host; }
		std::string const& description_path() const { return m_description_path; }

		// http://host:port/path of the description document
		std::string description_url() const;

		// the path SOAP requests are posted to. Empty until resolved
		std::string control_path() const;

		// the host SOAP requests are sent to. This is host() until resolved,
		// and may differ from it when the description names another port
		tcp::endpoint control_host() const;
		std::string service_type() const;
		std::string model_name() const;
		bool resolved() const;

		// sets the control endpoint. Returns false, leaving the device as it
		// was, if it had already been resolved
		bool set_control(tcp::endpoint control_host, std::string path
			, std::string service_type, std::string model = std::string());

		// the control endpoint is on host()
		bool set_control(std::string path, std::string service_type
			, std::string model = std::string());

		time_point last_seen() const;
		void touch(time_point now = clock_type::now());

		friend bool operator==(device const& lhs, device const& rhs);
		friend bool operator!=(device const& lhs, device const& rhs)
		{ return !(lhs == rhs); }
		friend bool operator<(device const& lhs, device const& rhs);

		std::size_t hash() const;

	private:

		tcp::endpoint const m_host;
		std::string const m_description_path;

		mutable std::mutex m_mutex;
		tcp::endpoint m_control_host;
		std::string m_control_path;
		std::string m_service_type;
		std::string m_model;

		std::atomic<time_duration::rep> m_last_seen;
	};
}

namespace std {

	template <>
	struct hash<igd::device>
	{
		std::size_t operator()(igd::device const& d) const
		{ return d.hash(); }
	};
}

#endif // IGD_DEVICE_HPP_INCLUDED
