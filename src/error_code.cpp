/*

Copyright (c) 2008-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/config.hpp"
#include "igd/error_code.hpp"

#include <cstdio> // for snprintf

namespace igd {

	struct igd_error_category final : boost::system::error_category
	{
		const char* name() const BOOST_SYSTEM_NOEXCEPT override;
		std::string message(int ev) const override;
		boost::system::error_condition default_error_condition(int ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};

	const char* igd_error_category::name() const BOOST_SYSTEM_NOEXCEPT
	{
		return "igd";
	}

	std::string igd_error_category::message(int ev) const
	{
		static char const* msgs[] =
		{
			"no error",
			"missing Location field in discovery record",
			"unsupported URL protocol",
			"invalid URL",
			"invalid IP address",
			"invalid port",
			"invalid HTTP response",
			"timed out waiting for a complete device description",
			"device description ended prematurely",
			"HTTP response too large",
			"HTTP response ended prematurely",
			"device has no WANIPConnection service",
			"invalid SOAP response",
			"invalid external IP address",
			"device has not been resolved",
			"client is closing",
			"too many port mapping entries",
		};
		static_assert(sizeof(msgs) / sizeof(msgs[0]) == errors::error_code_max
			, "error messages out of sync with error_code_enum");
		if (ev < 0 || ev >= int(sizeof(msgs)/sizeof(msgs[0])))
			return "Unknown error";
		return msgs[ev];
	}

	struct http_error_category final : boost::system::error_category
	{
		const char* name() const BOOST_SYSTEM_NOEXCEPT override
		{ return "http"; }

		std::string message(int ev) const override
		{
			char const* msg = nullptr;
			switch (ev)
			{
				case errors::cont: msg = "Continue"; break;
				case errors::ok: msg = "OK"; break;
				case errors::bad_request: msg = "Bad Request"; break;
				case errors::unauthorized: msg = "Unauthorized"; break;
				case errors::forbidden: msg = "Forbidden"; break;
				case errors::not_found: msg = "Not Found"; break;
				case errors::method_not_allowed: msg = "Method Not Allowed"; break;
				case errors::internal_server_error: msg = "Internal Server Error"; break;
				case errors::not_implemented: msg = "Not Implemented"; break;
				case errors::bad_gateway: msg = "Bad Gateway"; break;
				case errors::service_unavailable: msg = "Service Unavailable"; break;
				default: break;
			}
			char buf[100];
			if (msg == nullptr)
				std::snprintf(buf, sizeof(buf), "HTTP %d", ev);
			else
				std::snprintf(buf, sizeof(buf), "%d %s", ev, msg);
			return buf;
		}

		boost::system::error_condition default_error_condition(
			int ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};

	boost::system::error_category& igd_category()
	{
		static igd_error_category category;
		return category;
	}

	boost::system::error_category& http_category()
	{
		static http_error_category category;
		return category;
	}

	namespace errors
	{
		boost::system::error_code make_error_code(error_code_enum e)
		{
			return {e, igd_category()};
		}

		boost::system::error_code make_error_code(http_errors e)
		{
			return {e, http_category()};
		}
	}
}
