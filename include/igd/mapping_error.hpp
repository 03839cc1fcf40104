/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_MAPPING_ERROR_HPP_INCLUDED
#define IGD_MAPPING_ERROR_HPP_INCLUDED

#include "igd/config.hpp"
#include "igd/error_code.hpp"
#include "igd/aux_/export.hpp"

#include <boost/system/system_error.hpp>

#include <string>

namespace igd {

	namespace upnp_errors
	{
		// error codes for the upnp_category. They hold error codes
		// returned by UPnP routers when mapping ports
		enum error_code_enum
		{
			// No error
			no_error = 0,
			// The action is not implemented by the service
			invalid_action = 401,
			// One of the arguments in the request is invalid
			invalid_argument = 402,
			// The request failed
			action_failed = 501,
			// The action requires authorization the client doesn't have
			action_not_authorized = 606,
			// The specified array index is out of bounds. This ends an
			// enumeration of the port mapping table
			array_index_invalid = 713,
			// The specified value does not exist in the array. This is the
			// answer to a lookup of a mapping the router doesn't have
			no_such_entry_in_array = 714,
			// The source IP address cannot be wild-carded, but
			// must be fully specified
			source_ip_cannot_be_wildcarded = 715,
			// The external port cannot be a wildcard, but must
			// be specified
			external_port_cannot_be_wildcarded = 716,
			// The port mapping entry specified conflicts with a
			// mapping assigned previously to another client
			port_mapping_conflict = 718,
			// Internal and external port value must be the same
			internal_port_must_match_external = 724,
			// The NAT implementation only supports permanent
			// lease times on port mappings
			only_permanent_leases_supported = 725,
			// RemoteHost must be a wildcard and cannot be a
			// specific IP address or DNS name
			remote_host_must_be_wildcard = 726,
			// ExternalPort must be a wildcard and cannot be a
			// specific port
			external_port_must_be_wildcard = 727
		};

		// hidden
		IGD_EXPORT boost::system::error_code make_error_code(error_code_enum e);
	}

	// the boost.system error category for UPnP errors
	IGD_EXPORT boost::system::error_category& upnp_category();

	// a SOAP fault returned by a router, as decoded from the response body
	struct upnp_fault
	{
		int code = -1;
		std::string description;
	};

	// a failure to complete the HTTP exchange, or an HTTP error status
	// without a decodable fault
	struct transport_failure
	{
		error_code ec;
		std::string message;
	};

	// the one error type surfaced by mapping operations. code() is in the
	// upnp_category for router faults, otherwise in the category of the
	// transport error (http_category for HTTP statuses). description() is the
	// text reported by the router or transport.
	class IGD_EXPORT mapping_error : public boost::system::system_error
	{
	public:
		mapping_error(error_code ec, std::string description);

		std::string const& description() const { return m_description; }

	private:
		std::string m_description;
	};

	IGD_EXPORT error_code to_error_code(upnp_fault const& f);
	IGD_EXPORT error_code to_error_code(transport_failure const& f);

	IGD_EXPORT mapping_error translate(upnp_fault const& f);
	IGD_EXPORT mapping_error translate(transport_failure const& f);
}

namespace boost { namespace system {

	template<> struct is_error_code_enum<igd::upnp_errors::error_code_enum>
	{ static const bool value = true; };
} }

#endif // IGD_MAPPING_ERROR_HPP_INCLUDED
