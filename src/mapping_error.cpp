/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/mapping_error.hpp"

#include <algorithm>
#include <cstdio> // for snprintf
#include <utility>

namespace igd {

namespace {

	struct error_code_t
	{
		int code;
		char const* msg;
	};

	error_code_t const error_codes[] =
	{
		{0, "no error"}
		, {401, "Invalid Action"}
		, {402, "Invalid Arguments"}
		, {501, "Action Failed"}
		, {606, "Action not authorized"}
		, {713, "The specified array index is out of bounds"}
		, {714, "The specified value does not exist in the array"}
		, {715, "The source IP address cannot be wild-carded"}
		, {716, "The external port cannot be wild-carded"}
		, {718, "The port mapping entry specified conflicts with "
			"a mapping assigned previously to another client"}
		, {724, "Internal and External port values must be the same"}
		, {725, "The NAT implementation only supports permanent "
			"lease times on port mappings"}
		, {726, "RemoteHost must be a wildcard and cannot be a "
			"specific IP address or DNS name"}
		, {727, "ExternalPort must be a wildcard and cannot be a specific port "}
	};

	struct upnp_error_category final : boost::system::error_category
	{
		const char* name() const BOOST_SYSTEM_NOEXCEPT override
		{
			return "upnp";
		}

		std::string message(int ev) const override
		{
			auto const end = std::end(error_codes);
			auto const e = std::lower_bound(std::begin(error_codes), end, ev
				, [] (error_code_t const& lhs, int const rhs)
				{ return lhs.code < rhs; });
			if (e != end && e->code == ev)
			{
				return e->msg;
			}
			char msg[500];
			std::snprintf(msg, sizeof(msg), "unknown UPnP error (%d)", ev);
			return msg;
		}

		boost::system::error_condition default_error_condition(
			int ev) const BOOST_SYSTEM_NOEXCEPT override
		{
			return {ev, *this};
		}
	};
}

	boost::system::error_category& upnp_category()
	{
		static upnp_error_category cat;
		return cat;
	}

	namespace upnp_errors
	{
		boost::system::error_code make_error_code(error_code_enum e)
		{
			return {e, upnp_category()};
		}
	}

	mapping_error::mapping_error(error_code ec, std::string description)
		: boost::system::system_error(ec, description)
		, m_description(std::move(description))
	{}

	error_code to_error_code(upnp_fault const& f)
	{
		return error_code(f.code, upnp_category());
	}

	error_code to_error_code(transport_failure const& f)
	{
		return f.ec;
	}

	mapping_error translate(upnp_fault const& f)
	{
		error_code const ec = to_error_code(f);
		return mapping_error(ec, f.description.empty() ? ec.message() : f.description);
	}

	mapping_error translate(transport_failure const& f)
	{
		error_code const ec = to_error_code(f);
		return mapping_error(ec, f.message.empty() ? ec.message() : f.message);
	}
}
