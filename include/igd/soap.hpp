/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_SOAP_HPP_INCLUDED
#define IGD_SOAP_HPP_INCLUDED

#include "igd/config.hpp"
#include "igd/socket.hpp"
#include "igd/string_view.hpp"
#include "igd/aux_/export.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace igd {

	// the only service type control requests are sent to
	constexpr char const* wanip_service_type = "urn:schemas-upnp-org:service:WANIPConnection:1";

	// the namespace of device description documents
	constexpr char const* device_namespace = "urn:schemas-upnp-org:device-1-0";

	// name, value pairs in the order they are sent. Values are escaped when
	// the envelope is built
	using soap_args = std::vector<std::pair<std::string, std::string>>;

	// the SOAP envelope invoking ``action`` of ``service_type``
	IGD_EXPORT std::string build_soap_envelope(string_view action
		, string_view service_type, soap_args const& args);

	// the complete HTTP POST request carrying ``envelope`` to ``control_path``
	IGD_EXPORT std::string build_soap_request(string_view control_path
		, tcp::endpoint const& host, string_view service_type
		, string_view action, string_view envelope, string_view user_agent);

	// the HTTP GET request for a device description
	IGD_EXPORT std::string build_description_request(string_view path
		, tcp::endpoint const& host, string_view user_agent);

	// a decoded SOAP response. Either a result (the leaf elements of the
	// <u:ActionResponse> element) or a fault
	struct IGD_EXPORT soap_response
	{
		// true if the body was a SOAP envelope with a Body
		bool envelope = false;

		// the local name of the first element in the Body, e.g.
		// "GetExternalIPAddressResponse" or "Fault"
		std::string action;

		// the UPnP errorCode of a fault, -1 if the response isn't a fault or
		// the fault carries no error code
		int fault_code = -1;
		bool fault = false;
		std::string fault_description;

		// result fields by local element name, e.g. "NewExternalPort"
		std::map<std::string, std::string> fields;

		// the value of the field, or an empty string
		std::string const& field(string_view name) const;
		bool has_field(string_view name) const;
	};

	IGD_EXPORT soap_response decode_soap(string_view body);
}

#endif // IGD_SOAP_HPP_INCLUDED
