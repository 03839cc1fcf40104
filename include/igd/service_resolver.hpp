/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_SERVICE_RESOLVER_HPP_INCLUDED
#define IGD_SERVICE_RESOLVER_HPP_INCLUDED

#include "igd/config.hpp"
#include "igd/device.hpp"
#include "igd/error_code.hpp"
#include "igd/http_transport.hpp"
#include "igd/portmap.hpp"
#include "igd/settings_pack.hpp"
#include "igd/socket.hpp"
#include "igd/string_view.hpp"
#include "igd/aux_/export.hpp"
#include "igd/aux_/retry_parser.hpp"
#include "igd/aux_/string_util.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace igd {

	struct parse_state
	{
		// the default namespace declared by the root element, if any
		std::string root_namespace;
		bool seen_root = false;
		// true between the root start tag and its first content, while its
		// attributes are reported
		bool in_root_tag = false;
		// set while inside a serviceList/service element, whose fields are
		// collected in cur_service_type and cur_control_url
		bool in_service = false;
		std::string cur_service_type;
		std::string cur_control_url;
		std::vector<string_view> tag_stack;
		std::string control_url;
		std::string service_type;
		std::string model;
		std::string url_base;

		// true if the innermost open elements are (outermost first) the ones
		// given, compared by local name, ignoring case
		bool top_tags(string_view str1, string_view str2) const
		{
			auto i = tag_stack.rbegin();
			if (i == tag_stack.rend()) return false;
			if (!aux::string_equal_no_case(*i, str2)) return false;
			++i;
			if (i == tag_stack.rend()) return false;
			if (!aux::string_equal_no_case(*i, str1)) return false;
			return true;
		}
	};

	// xml_parse() callback collecting the control URL of the WANIPConnection:1
	// service listed in a device description
	IGD_EXTRA_EXPORT void find_control_url(int type, string_view str
		, string_view val, parse_state& state);

	// parses a complete device description. Returns true if it lists a
	// WANIPConnection:1 service with a control URL, and the document's
	// default namespace (if it declares one) is device_namespace
	IGD_EXTRA_EXPORT bool parse_description(string_view doc, parse_state& state);

	// joins the controlURL of a description onto its URLBase and splits the
	// result into the host and path SOAP requests go to. A relative control
	// URL without a URLBase is on ``description_host``, the host the
	// description came from
	IGD_EXTRA_EXPORT void resolve_control_url(string_view control_url
		, string_view url_base, tcp::endpoint const& description_host
		, tcp::endpoint& host, std::string& path, error_code& ec);

	// fetches the description document of devices and extracts the control
	// endpoint of their WAN IP connection service. The handler is invoked
	// once per resolve() with the outcome. Failures are logged as well.
	// A second resolution of an already resolved device invokes nothing
	struct IGD_EXPORT service_resolver final
		: std::enable_shared_from_this<service_resolver>
	{
		using resolve_handler = std::function<void(error_code const&
			, std::shared_ptr<device> const&)>;

		service_resolver(http_transport& transport, aux::delay_source& delay
			, settings_pack const& settings, portmap_callback& cb);

		service_resolver(service_resolver const&) = delete;
		service_resolver& operator=(service_resolver const&) = delete;

		void resolve(std::shared_ptr<device> d, resolve_handler h);

	private:

		void on_description_open(error_code const& ec
			, std::shared_ptr<http_stream> const& s
			, std::shared_ptr<device> const& d, resolve_handler const& h);

		void on_description(error_code const& ec, string_view doc
			, std::shared_ptr<device> const& d, resolve_handler const& h);

#ifndef IGD_DISABLE_LOGGING
		bool should_log() const;
		void log(char const* fmt, ...) const IGD_FORMAT(2,3);
#endif

		http_transport& m_transport;
		aux::delay_source& m_delay;
		settings_pack const m_settings;
		portmap_callback& m_callback;
	};
}

#endif // IGD_SERVICE_RESOLVER_HPP_INCLUDED
