/*

Copyright (c) 2008-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_ERROR_CODE_HPP_INCLUDED
#define IGD_ERROR_CODE_HPP_INCLUDED

#include "igd/config.hpp"
#include "igd/aux_/export.hpp"

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <string>

namespace igd {

	namespace errors
	{
		// libigd uses the ``boost.system`` ``error_code`` type to report
		// errors. The error_code_enum values live in the igd_category()
		enum error_code_enum
		{
			// Not an error
			no_error = 0,
			// the discovery record has no Location field
			missing_location,
			// the location URL does not use the http scheme
			unsupported_url_protocol,
			// the location or control URL could not be split into host and path
			invalid_url,
			// the host part of a URL is not an IP address
			invalid_address,
			// the port part of a URL is not a number in 0-65535
			invalid_port,
			// the HTTP response could not be parsed
			http_parse_error,
			// the device description did not become a complete XML document
			// within the configured number of attempts
			description_timeout,
			// the stream ended before the device description was complete
			description_incomplete,
			// the HTTP response body is larger than max_description_size
			response_too_large,
			// the connection closed before the HTTP response was complete
			incomplete_response,
			// the device does not expose a WANIPConnection:1 service
			no_wanip_service,
			// the control response was neither a SOAP result nor a SOAP fault
			invalid_soap_response,
			// the external IP address in the response could not be parsed
			invalid_external_address,
			// the device has not been resolved to a control path yet
			device_not_resolved,
			// the client has been closed
			client_closing,
			// the device kept returning mapping entries past
			// upnp_max_mapping_entries
			too_many_mappings,

			// the number of error codes
			error_code_max
		};

		// HTTP errors are reported in the http_category(), with error code
		// enums in the ``igd::errors`` namespace.
		enum http_errors
		{
			cont = 100,
			ok = 200,
			bad_request = 400,
			unauthorized = 401,
			forbidden = 403,
			not_found = 404,
			method_not_allowed = 405,
			internal_server_error = 500,
			not_implemented = 501,
			bad_gateway = 502,
			service_unavailable = 503
		};

		// hidden
		IGD_EXPORT boost::system::error_code make_error_code(error_code_enum e);
		IGD_EXPORT boost::system::error_code make_error_code(http_errors e);

	} // namespace errors

	// return the instance of the igd_error_category which maps library
	// error codes to human readable error messages.
	IGD_EXPORT boost::system::error_category& igd_category();

	// returns the error_category for HTTP status codes
	IGD_EXPORT boost::system::error_category& http_category();

	using boost::system::error_code;
	using boost::system::error_condition;
	using boost::system::system_error;

	// internal
	using boost::system::generic_category;
	using boost::system::system_category;
}

namespace boost { namespace system {

	template<> struct is_error_code_enum<igd::errors::error_code_enum>
	{ static const bool value = true; };

	template<> struct is_error_code_enum<igd::errors::http_errors>
	{ static const bool value = true; };
} }

#endif // IGD_ERROR_CODE_HPP_INCLUDED
