/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/mapping_session.hpp"
#include "igd/assert.hpp"
#include "igd/aux_/portmap_log.hpp"
#include "igd/aux_/string_util.hpp"

#include <cstdarg>
#include <functional>
#include <utility>

using namespace std::placeholders;

namespace igd {

namespace {

	int field_int(soap_response const& r, string_view const name, int const def)
	{
		std::int64_t val = 0;
		if (!aux::parse_int(r.field(name), val)) return def;
		return int(val);
	}

	// completes ``p`` with the fault or transport failure in ``r``. Returns
	// false if ``r`` is a success
	template <typename T>
	bool forward_failure(operation_result<soap_response> const& r
		, operation_promise<T> const& p)
	{
		if (auto const* f = std::get_if<upnp_fault>(&r))
		{
			p.complete(operation_result<T>(std::in_place_type<upnp_fault>, *f));
			return true;
		}
		if (auto const* f = std::get_if<transport_failure>(&r))
		{
			p.complete(operation_result<T>(std::in_place_type<transport_failure>, *f));
			return true;
		}
		return false;
	}
}

	mapping parse_mapping(soap_response const& r)
	{
		mapping m;
		m.remote_host = r.field("NewRemoteHost");
		m.external_port = field_int(r, "NewExternalPort", -1);
		m.protocol = parse_protocol(r.field("NewProtocol"));
		m.internal_port = field_int(r, "NewInternalPort", 0);
		m.internal_host = r.field("NewInternalClient");
		m.enabled = field_int(r, "NewEnabled", 1) != 0;
		m.description = r.field("NewPortMappingDescription");
		m.lease_duration = field_int(r, "NewLeaseDuration", 0);
		return m;
	}

	mapping_session::mapping_session(io_context& ios, http_transport& transport
		, std::shared_ptr<device const> d
		, settings_pack const& settings, portmap_callback& cb)
		: m_ios(ios)
		, m_transport(transport)
		, m_device(std::move(d))
		, m_settings(settings)
		, m_callback(cb)
	{
		IGD_ASSERT(m_device);
	}

#ifndef IGD_DISABLE_LOGGING
	bool mapping_session::should_log() const
	{
		return m_callback.should_log_portmap();
	}

	void mapping_session::log(char const* fmt, ...) const
	{
		if (!should_log()) return;
		va_list v;
		va_start(v, fmt);
		aux::portmap_vlog(m_callback, fmt, v);
		va_end(v);
	}
#endif

	int mapping_session::lease_duration(mapping const& m) const
	{
		return m.lease_duration != 0
			? m.lease_duration
			: m_settings.get_int(settings_pack::upnp_lease_duration);
	}

	void mapping_session::soap_call(char const* action, args_builder args
		, soap_handler h)
	{
		std::string const path = m_device->control_path();
		if (path.empty())
		{
			post(m_ios, [h]
			{
				h(soap_result(std::in_place_type<transport_failure>
					, transport_failure{errors::device_not_resolved
						, error_code(errors::device_not_resolved).message()}));
			});
			return;
		}

		std::string service = m_device->service_type();
		if (service.empty()) service = wanip_service_type;
		tcp::endpoint const host = m_device->control_host();
		std::string const agent = m_settings.get_str(settings_pack::user_agent);
		auto self = shared_from_this();

		m_transport.async_open(host
			, [self, action, path, service, host, agent, args = std::move(args)]
			(address const& local)
			{
				std::string const envelope = build_soap_envelope(action, service, args(local));
				std::string req = build_soap_request(path, host, service, action, envelope, agent);
#ifndef IGD_DISABLE_LOGGING
				self->log("sending: %s", req.c_str());
#endif
				return req;
			}
			, std::bind(&mapping_session::on_soap_open, self, _1, _2, action, std::move(h)));
	}

	void mapping_session::on_soap_open(error_code const& ec
		, std::shared_ptr<http_stream> const& s
		, char const* action, soap_handler const& h)
	{
		if (ec)
		{
#ifndef IGD_DISABLE_LOGGING
			log("error while sending %s to %s: %s"
				, action, m_device->description_url().c_str(), ec.message().c_str());
#endif
			h(soap_result(std::in_place_type<transport_failure>
				, transport_failure{ec, ec.message()}));
			return;
		}

		read_response(s, std::size_t(m_settings.get_int(settings_pack::max_description_size))
			, std::bind(&mapping_session::on_soap_response, shared_from_this()
				, _1, _2, action, h));
	}

	void mapping_session::on_soap_response(error_code const& ec
		, http_parser const& p, char const* action, soap_handler const& h)
	{
		if (ec)
		{
#ifndef IGD_DISABLE_LOGGING
			log("error while reading %s response: %s", action, ec.message().c_str());
#endif
			h(soap_result(std::in_place_type<transport_failure>
				, transport_failure{ec, ec.message()}));
			return;
		}

		std::string const body(p.body());
#ifndef IGD_DISABLE_LOGGING
		log("%s response: %d %s", action, p.status_code(), body.c_str());
#endif

		soap_response r = decode_soap(body);

		// routers answer faults with "500 Internal Server Error". The fault
		// in the body is what counts
		if (r.fault)
		{
#ifndef IGD_DISABLE_LOGGING
			log("%s failed, code: %d: %s", action, r.fault_code, r.fault_description.c_str());
#endif
			h(soap_result(std::in_place_type<upnp_fault>
				, upnp_fault{r.fault_code, std::move(r.fault_description)}));
			return;
		}

		if (!is_ok_status(p.status_code()))
		{
			error_code const err(p.status_code(), http_category());
			h(soap_result(std::in_place_type<transport_failure>
				, transport_failure{err, p.message().empty() ? err.message() : p.message()}));
			return;
		}

		if (!r.envelope)
		{
			h(soap_result(std::in_place_type<transport_failure>
				, transport_failure{errors::invalid_soap_response
					, error_code(errors::invalid_soap_response).message()}));
			return;
		}

		h(soap_result(std::in_place_index<0>, std::move(r)));
	}

	operation_future<address> mapping_session::async_get_external_ip(
		callback<address> cb)
	{
		operation_promise<address> p;
		auto ret = p.get_future();
		ret.on_complete(std::move(cb));

		auto self = shared_from_this();
		soap_call("GetExternalIPAddress"
			, [](address const&) { return soap_args(); }
			, [self, p](soap_result const& r)
		{
			if (forward_failure(r, p)) return;
			std::string const& ip = std::get<soap_response>(r).field("NewExternalIPAddress");
			error_code ec;
			address const a = make_address(ip, ec);
			if (ec)
			{
#ifndef IGD_DISABLE_LOGGING
				self->log("failed to find external IP address in response: \"%s\"", ip.c_str());
#endif
				p.set_failure(errors::invalid_external_address);
				return;
			}
#ifndef IGD_DISABLE_LOGGING
			self->log("got router external IP address %s", ip.c_str());
#endif
			p.set_value(a);
		});
		return ret;
	}

	operation_future<std::monostate> mapping_session::async_create_mapping(
		mapping const& m, callback<std::monostate> cb)
	{
		return async_create_mapping(m, m.description, std::move(cb));
	}

	operation_future<std::monostate> mapping_session::async_create_mapping(
		mapping const& m, std::string const& description, callback<std::monostate> cb)
	{
		operation_promise<std::monostate> p;
		auto ret = p.get_future();
		ret.on_complete(std::move(cb));

		int const lease = lease_duration(m);
		soap_call("AddPortMapping"
			, [m, description, lease](address const& local)
			{
				return soap_args{
					{"NewRemoteHost", m.remote_host},
					{"NewExternalPort", std::to_string(m.external_port)},
					{"NewProtocol", to_string(m.protocol)},
					{"NewInternalPort", std::to_string(m.internal_port)},
					{"NewInternalClient", m.internal_host.empty()
						? local.to_string() : m.internal_host},
					{"NewEnabled", m.enabled ? "1" : "0"},
					{"NewPortMappingDescription", description},
					{"NewLeaseDuration", std::to_string(lease)}};
			}
			, [p](soap_result const& r)
		{
			if (forward_failure(r, p)) return;
			p.set_value(std::monostate());
		});
		return ret;
	}

	operation_future<std::monostate> mapping_session::async_delete_mapping(
		mapping const& m, callback<std::monostate> cb)
	{
		operation_promise<std::monostate> p;
		auto ret = p.get_future();
		ret.on_complete(std::move(cb));

		soap_call("DeletePortMapping"
			, [m](address const&)
			{
				return soap_args{
					{"NewRemoteHost", m.remote_host},
					{"NewExternalPort", std::to_string(m.external_port)},
					{"NewProtocol", to_string(m.protocol)}};
			}
			, [p](soap_result const& r)
		{
			if (forward_failure(r, p)) return;
			p.set_value(std::monostate());
		});
		return ret;
	}

	operation_future<mapping> mapping_session::async_get_specific_mapping(
		int const external_port, portmap_protocol const proto, callback<mapping> cb)
	{
		operation_promise<mapping> p;
		auto ret = p.get_future();
		ret.on_complete(std::move(cb));

		auto self = shared_from_this();
		soap_call("GetSpecificPortMappingEntry"
			, [external_port, proto](address const&)
			{
				return soap_args{
					{"NewRemoteHost", std::string()},
					{"NewExternalPort", std::to_string(external_port)},
					{"NewProtocol", to_string(proto)}};
			}
			, [self, p, external_port, proto](soap_result const& r)
		{
			auto const* f = std::get_if<upnp_fault>(&r);
			if (f != nullptr && f->code == upnp_errors::no_such_entry_in_array)
			{
#ifndef IGD_DISABLE_LOGGING
				self->log("no mapping for %s port %d", to_string(proto), external_port);
#endif
				p.set_value(mapping::not_found(proto));
				return;
			}
			if (forward_failure(r, p)) return;

			mapping m = parse_mapping(std::get<soap_response>(r));
			// the response doesn't necessarily echo the key of the lookup
			m.external_port = external_port;
			m.protocol = proto;
			p.set_value(std::move(m));
		});
		return ret;
	}

	operation_future<std::vector<mapping>> mapping_session::async_get_all_mappings(
		std::shared_ptr<std::vector<mapping>> partial, callback<std::vector<mapping>> cb)
	{
		auto e = std::make_shared<enumeration>();
		e->partial = std::move(partial);
		auto ret = e->promise.get_future();
		ret.on_complete(std::move(cb));
		next_entry(std::move(e));
		return ret;
	}

	void mapping_session::next_entry(std::shared_ptr<enumeration> e)
	{
		int const index = e->index;
		auto self = shared_from_this();
		soap_call("GetGenericPortMappingEntry"
			, [index](address const&)
			{ return soap_args{{"NewPortMappingIndex", std::to_string(index)}}; }
			, [self, e](soap_result const& r) { self->on_entry(e, r); });
	}

	void mapping_session::on_entry(std::shared_ptr<enumeration> const& e
		, soap_result const& r)
	{
		auto const* f = std::get_if<upnp_fault>(&r);
		if (f != nullptr && f->code == upnp_errors::array_index_invalid)
		{
#ifndef IGD_DISABLE_LOGGING
			log("end of mapping table after %d entries", e->index);
#endif
			e->promise.set_value(std::move(e->entries));
			return;
		}
		if (forward_failure(r, e->promise)) return;

		mapping m = parse_mapping(std::get<soap_response>(r));
		if (e->partial) e->partial->push_back(m);
		e->entries.push_back(std::move(m));
		++e->index;

		if (e->index >= m_settings.get_int(settings_pack::upnp_max_mapping_entries))
		{
#ifndef IGD_DISABLE_LOGGING
			log("giving up on mapping table after %d entries", e->index);
#endif
			e->promise.set_failure(errors::too_many_mappings);
			return;
		}

		// the next request goes out from the event loop, not from within
		// this handler
		post(m_ios, std::bind(&mapping_session::next_entry, shared_from_this(), e));
	}

	void mapping_session::assert_not_io_thread() const
	{
		// waiting on the thread that would complete the operation deadlocks
		IGD_ASSERT(!m_ios.get_executor().running_in_this_thread());
	}

	address mapping_session::get_external_ip()
	{
		assert_not_io_thread();
		return async_get_external_ip().get();
	}

	void mapping_session::create_mapping(mapping const& m)
	{
		assert_not_io_thread();
		async_create_mapping(m).get();
	}

	void mapping_session::create_mapping(mapping const& m, std::string const& description)
	{
		assert_not_io_thread();
		async_create_mapping(m, description).get();
	}

	void mapping_session::delete_mapping(mapping const& m)
	{
		assert_not_io_thread();
		async_delete_mapping(m).get();
	}

	mapping mapping_session::get_specific_mapping(int const external_port
		, portmap_protocol const proto)
	{
		assert_not_io_thread();
		return async_get_specific_mapping(external_port, proto).get();
	}

	std::vector<mapping> mapping_session::get_all_mappings()
	{
		assert_not_io_thread();
		return async_get_all_mappings().get();
	}
}
