/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/service_resolver.hpp"
#include "igd/device_locator.hpp" // for parse_http_url
#include "igd/soap.hpp"
#include "igd/assert.hpp"
#include "igd/aux_/xml_parse.hpp"
#include "igd/aux_/portmap_log.hpp"

#include <cstdarg>
#include <functional>

using namespace std::placeholders;

namespace igd {

	void find_control_url(int const type, string_view const str
		, string_view const val, parse_state& state)
	{
		if (type == aux::xml_start_tag)
		{
			state.tag_stack.push_back(aux::local_name(str));
			state.in_root_tag = state.tag_stack.size() == 1 && !state.seen_root;
			state.seen_root = true;
			if (state.top_tags("servicelist", "service"))
			{
				state.in_service = true;
				state.cur_service_type.clear();
				state.cur_control_url.clear();
			}
			return;
		}

		if (type == aux::xml_attribute)
		{
			// only the default namespace of the root element matters
			if (state.in_root_tag && str == "xmlns")
				state.root_namespace.assign(val.begin(), val.end());
			return;
		}

		state.in_root_tag = false;

		if (type == aux::xml_end_tag)
		{
			if (state.tag_stack.empty()) return;
			if (state.in_service && state.top_tags("servicelist", "service"))
			{
				// the first WANIPConnection:1 entry with a control URL wins
				if (state.control_url.empty()
					&& state.cur_service_type == wanip_service_type
					&& !state.cur_control_url.empty())
				{
					state.service_type = state.cur_service_type;
					state.control_url = state.cur_control_url;
				}
				state.in_service = false;
			}
			state.tag_stack.pop_back();
		}
		else if (type == aux::xml_string)
		{
			if (state.tag_stack.empty()) return;
			string_view const text = aux::strip_string(str);
			if (state.in_service && state.top_tags("service", "servicetype"))
			{
				state.cur_service_type.assign(text.begin(), text.end());
			}
			else if (state.in_service && state.top_tags("service", "controlurl"))
			{
				state.cur_control_url.assign(text.begin(), text.end());
			}
			else if (state.model.empty() && state.top_tags("device", "modelname"))
			{
				state.model.assign(text.begin(), text.end());
			}
			else if (aux::string_equal_no_case(state.tag_stack.back(), "urlbase"))
			{
				state.url_base.assign(text.begin(), text.end());
			}
		}
	}

	bool parse_description(string_view const doc, parse_state& state)
	{
		aux::xml_parse(doc, std::bind(&find_control_url, _1, _2, _3, std::ref(state)));
		if (!state.root_namespace.empty() && state.root_namespace != device_namespace)
			return false;
		return !state.control_url.empty();
	}

	void resolve_control_url(string_view const control_url
		, string_view const url_base, tcp::endpoint const& description_host
		, tcp::endpoint& host, std::string& path, error_code& ec)
	{
		ec.clear();
		std::string url(aux::strip_string(control_url));
		if (url.empty())
		{
			ec = errors::invalid_url;
			return;
		}

		bool const absolute = aux::string_begins_no_case("http://"_sv, url);
		string_view const base = aux::strip_string(url_base);
		if (!base.empty() && !absolute)
		{
			std::string joined(base);
			// avoid double slashes in the path, and a missing one
			if (joined.back() == '/' && url.front() == '/') joined.pop_back();
			else if (joined.back() != '/' && url.front() != '/') joined += '/';
			url = joined + url;
		}

		if (absolute || !base.empty())
		{
			parse_http_url(url, host, path, ec);
			return;
		}

		host = description_host;
		path = url.front() == '/' ? url : "/" + url;
	}

	service_resolver::service_resolver(http_transport& transport
		, aux::delay_source& delay, settings_pack const& settings
		, portmap_callback& cb)
		: m_transport(transport)
		, m_delay(delay)
		, m_settings(settings)
		, m_callback(cb)
	{}

#ifndef IGD_DISABLE_LOGGING
	bool service_resolver::should_log() const
	{
		return m_callback.should_log_portmap();
	}

	void service_resolver::log(char const* fmt, ...) const
	{
		if (!should_log()) return;
		va_list v;
		va_start(v, fmt);
		aux::portmap_vlog(m_callback, fmt, v);
		va_end(v);
	}
#endif

	void service_resolver::resolve(std::shared_ptr<device> d, resolve_handler h)
	{
		IGD_ASSERT(d);
#ifndef IGD_DISABLE_LOGGING
		log("connecting to: %s", d->description_url().c_str());
#endif
		std::string const path = d->description_path();
		tcp::endpoint const host = d->host();
		std::string const agent = m_settings.get_str(settings_pack::user_agent);

		m_transport.async_open(host
			, [path, host, agent](address const&)
			{ return build_description_request(path, host, agent); }
			, std::bind(&service_resolver::on_description_open, shared_from_this()
				, _1, _2, std::move(d), std::move(h)));
	}

	void service_resolver::on_description_open(error_code const& ec
		, std::shared_ptr<http_stream> const& s
		, std::shared_ptr<device> const& d, resolve_handler const& h)
	{
		if (ec)
		{
#ifndef IGD_DISABLE_LOGGING
			log("error while fetching control url from: %s: %s"
				, d->description_url().c_str(), ec.message().c_str());
#endif
			h(ec, d);
			return;
		}

		if (!is_ok_status(s->parser().status_code()))
		{
#ifndef IGD_DISABLE_LOGGING
			log("error while fetching control url from: %s: %d %s"
				, d->description_url().c_str(), s->parser().status_code()
				, s->parser().message().c_str());
#endif
			s->close();
			h(error_code(s->parser().status_code(), http_category()), d);
			return;
		}

		auto p = std::make_shared<aux::retry_parser>(s, m_delay
			, m_settings.get_int(settings_pack::upnp_description_attempts)
			, milliseconds(m_settings.get_int(settings_pack::upnp_description_retry_interval))
			, std::size_t(m_settings.get_int(settings_pack::max_description_size))
			, [](string_view buf) { return aux::xml_complete(buf); }
			, std::bind(&service_resolver::on_description, shared_from_this()
				, _1, _2, d, h));
		p->start();
	}

	void service_resolver::on_description(error_code const& ec, string_view const doc
		, std::shared_ptr<device> const& d, resolve_handler const& h)
	{
		if (ec)
		{
#ifndef IGD_DISABLE_LOGGING
			log("giving up on device description from: %s: %s"
				, d->description_url().c_str(), ec.message().c_str());
#endif
			h(ec, d);
			return;
		}

		parse_state s;
		if (!parse_description(doc, s))
		{
#ifndef IGD_DISABLE_LOGGING
			log("device at: %s: %s (namespace: \"%s\")"
				, d->description_url().c_str()
				, error_code(errors::no_wanip_service).message().c_str()
				, s.root_namespace.c_str());
#endif
			h(errors::no_wanip_service, d);
			return;
		}

		tcp::endpoint host;
		std::string path;
		error_code ec2;
		resolve_control_url(s.control_url, s.url_base, d->host(), host, path, ec2);
		if (ec2)
		{
#ifndef IGD_DISABLE_LOGGING
			log("device at: %s: invalid control url: \"%s\" urlbase: \"%s\": %s"
				, d->description_url().c_str(), s.control_url.c_str()
				, s.url_base.c_str(), ec2.message().c_str());
#endif
			h(ec2, d);
			return;
		}

		if (!d->set_control(host, path, s.service_type, s.model))
		{
			// a concurrent resolution of the same device got there first
			return;
		}

#ifndef IGD_DISABLE_LOGGING
		log("found control URL: %s (host: %s port: %d) namespace %s model: \"%s\" urlbase: %s in response from %s"
			, path.c_str(), host.address().to_string().c_str(), int(host.port())
			, s.service_type.c_str()
			, s.model.c_str(), s.url_base.c_str(), d->description_url().c_str());
#endif
		h(error_code(), d);
	}
}
