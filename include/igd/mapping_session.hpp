/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_MAPPING_SESSION_HPP_INCLUDED
#define IGD_MAPPING_SESSION_HPP_INCLUDED

#include "igd/config.hpp"
#include "igd/socket.hpp"
#include "igd/device.hpp"
#include "igd/error_code.hpp"
#include "igd/http_transport.hpp"
#include "igd/operation_future.hpp"
#include "igd/portmap.hpp"
#include "igd/settings_pack.hpp"
#include "igd/soap.hpp"
#include "igd/aux_/export.hpp"

#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace igd {

	// issues port mapping operations to one resolved device. Every operation
	// is a SOAP request to the device's control path, completing an
	// operation_future. Independent operations may be in flight at the same
	// time. Must be created by std::make_shared.
	struct IGD_EXPORT mapping_session final
		: std::enable_shared_from_this<mapping_session>
	{
		template <typename T>
		using callback = typename operation_future<T>::callback_t;

		mapping_session(io_context& ios, http_transport& transport
			, std::shared_ptr<device const> d
			, settings_pack const& settings, portmap_callback& cb);

		mapping_session(mapping_session const&) = delete;
		mapping_session& operator=(mapping_session const&) = delete;

		std::shared_ptr<device const> const& target() const { return m_device; }

		// the address of the router on the WAN side
		operation_future<address> async_get_external_ip(callback<address> cb = {});

		// adds ``m`` to the router's mapping table. ``description`` overrides
		// m.description. An empty m.internal_host is replaced by our local
		// address, as the router sees it
		operation_future<std::monostate> async_create_mapping(mapping const& m
			, callback<std::monostate> cb = {});
		operation_future<std::monostate> async_create_mapping(mapping const& m
			, std::string const& description, callback<std::monostate> cb = {});

		// removes the mapping of m.external_port and m.protocol
		operation_future<std::monostate> async_delete_mapping(mapping const& m
			, callback<std::monostate> cb = {});

		// looks up the mapping of an external port. If the router has none,
		// the result is mapping::not_found(), not an error. The returned
		// mapping always carries the requested port and protocol
		operation_future<mapping> async_get_specific_mapping(int external_port
			, portmap_protocol proto, callback<mapping> cb = {});

		// lists the router's mapping table, one request per entry starting at
		// index 0. A request is only sent once the previous response has been
		// decoded. The end of the table (fault 713) completes the list. Any
		// other failure fails the whole operation, the entries gathered
		// up to then are appended to ``partial``, if given
		operation_future<std::vector<mapping>> async_get_all_mappings(
			std::shared_ptr<std::vector<mapping>> partial = {}
			, callback<std::vector<mapping>> cb = {});

		// blocking versions of the operations above. They wait for the
		// future and throw mapping_error on failure. The io_context must be
		// run by another thread
		address get_external_ip();
		void create_mapping(mapping const& m);
		void create_mapping(mapping const& m, std::string const& description);
		void delete_mapping(mapping const& m);
		mapping get_specific_mapping(int external_port, portmap_protocol proto);
		std::vector<mapping> get_all_mappings();

	private:

		using soap_result = operation_result<soap_response>;
		using soap_handler = std::function<void(soap_result const&)>;
		using args_builder = std::function<soap_args(address const& local)>;

		struct enumeration
		{
			operation_promise<std::vector<mapping>> promise;
			std::vector<mapping> entries;
			std::shared_ptr<std::vector<mapping>> partial;
			int index = 0;
		};

		void soap_call(char const* action, args_builder args, soap_handler h);
		void on_soap_open(error_code const& ec, std::shared_ptr<http_stream> const& s
			, char const* action, soap_handler const& h);
		void on_soap_response(error_code const& ec, http_parser const& p
			, char const* action, soap_handler const& h);

		void next_entry(std::shared_ptr<enumeration> e);
		void on_entry(std::shared_ptr<enumeration> const& e, soap_result const& r);

		int lease_duration(mapping const& m) const;

		void assert_not_io_thread() const;

#ifndef IGD_DISABLE_LOGGING
		bool should_log() const;
		void log(char const* fmt, ...) const IGD_FORMAT(2,3);
#endif

		io_context& m_ios;
		http_transport& m_transport;
		std::shared_ptr<device const> const m_device;
		settings_pack const m_settings;
		portmap_callback& m_callback;
	};

	// builds a mapping from the fields of a GetGenericPortMappingEntry or
	// GetSpecificPortMappingEntry response
	IGD_EXTRA_EXPORT mapping parse_mapping(soap_response const& r);
}

#endif // IGD_MAPPING_SESSION_HPP_INCLUDED
