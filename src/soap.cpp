/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/soap.hpp"
#include "igd/aux_/string_util.hpp"
#include "igd/aux_/xml_parse.hpp"

#include <cstdio> // for snprintf
#include <vector>

namespace igd {

namespace {

	std::string print_host(tcp::endpoint const& ep)
	{
		std::string ret;
		if (ep.address().is_v6())
		{
			ret += '[';
			ret += ep.address().to_string();
			ret += ']';
		}
		else
		{
			ret += ep.address().to_string();
		}
		ret += ':';
		ret += std::to_string(ep.port());
		return ret;
	}
}

	std::string build_soap_envelope(string_view const action
		, string_view const service_type, soap_args const& args)
	{
		std::string soap = "<?xml version=\"1.0\"?>\n"
			"<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" "
			"s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">"
			"<s:Body><u:";
		soap.append(action.data(), action.size());
		soap += " xmlns:u=\"";
		soap.append(service_type.data(), service_type.size());
		soap += "\">";

		for (auto const& a : args)
		{
			soap += '<';
			soap += a.first;
			soap += '>';
			soap += aux::xml_escape(a.second);
			soap += "</";
			soap += a.first;
			soap += '>';
		}

		soap += "</u:";
		soap.append(action.data(), action.size());
		soap += "></s:Body></s:Envelope>";
		return soap;
	}

	std::string build_soap_request(string_view const control_path
		, tcp::endpoint const& host, string_view const service_type
		, string_view const action, string_view const envelope
		, string_view const user_agent)
	{
		std::string const h = print_host(host);
		std::string const path(control_path);
		std::string const service(service_type);
		std::string const act(action);
		std::string const agent(user_agent);

		char header[2048];
		std::snprintf(header, sizeof(header), "POST %s HTTP/1.1\r\n"
			"Host: %s\r\n"
			"User-Agent: %s\r\n"
			"Content-Type: text/xml; charset=\"utf-8\"\r\n"
			"Content-Length: %d\r\n"
			"Connection: close\r\n"
			"Soapaction: \"%s#%s\"\r\n\r\n"
			, path.c_str(), h.c_str(), agent.c_str()
			, int(envelope.size()), service.c_str(), act.c_str());

		std::string ret = header;
		ret.append(envelope.data(), envelope.size());
		return ret;
	}

	std::string build_description_request(string_view const path
		, tcp::endpoint const& host, string_view const user_agent)
	{
		std::string const h = print_host(host);
		std::string const p(path);
		std::string const agent(user_agent);

		char header[2048];
		std::snprintf(header, sizeof(header), "GET %s HTTP/1.1\r\n"
			"Host: %s\r\n"
			"User-Agent: %s\r\n"
			"Connection: close\r\n\r\n"
			, p.c_str(), h.c_str(), agent.c_str());
		return header;
	}

	std::string const& soap_response::field(string_view const name) const
	{
		static std::string const empty;
		auto const i = fields.find(std::string(name));
		if (i == fields.end()) return empty;
		return i->second;
	}

	bool soap_response::has_field(string_view const name) const
	{
		return fields.count(std::string(name)) > 0;
	}

	// the element nesting of a response is
	// Envelope > Body > ActionResponse > field
	// and of a fault
	// Envelope > Body > Fault > detail > UPnPError > errorCode
	soap_response decode_soap(string_view const body)
	{
		soap_response ret;
		std::vector<string_view> tag_stack;
		std::string text;
		bool error = false;

		aux::xml_parse(body, [&](int const type, string_view const name, string_view)
		{
			if (error) return;
			switch (type)
			{
				case aux::xml_start_tag:
				{
					string_view const tag = aux::local_name(name);
					if (tag_stack.empty() && tag != "Envelope")
					{
						error = true;
						return;
					}
					if (tag_stack.size() == 1 && tag == "Body")
						ret.envelope = true;
					if (tag_stack.size() == 2 && ret.action.empty()
						&& tag_stack[1] == "Body")
					{
						ret.action = std::string(tag);
						ret.fault = tag == "Fault";
					}
					tag_stack.push_back(tag);
					text.clear();
					break;
				}
				case aux::xml_empty_tag:
				{
					string_view const tag = aux::local_name(name);
					if (tag_stack.size() == 2 && ret.action.empty()
						&& tag_stack[1] == "Body")
					{
						// a response without any output arguments
						ret.action = std::string(tag);
					}
					else if (tag_stack.size() == 3 && !ret.fault)
					{
						ret.fields.emplace(std::string(tag), std::string());
					}
					break;
				}
				case aux::xml_string:
					text.append(name.data(), name.size());
					break;
				case aux::xml_end_tag:
				{
					if (tag_stack.empty()) return;
					string_view const tag = tag_stack.back();
					std::string const value = aux::xml_unescape(aux::strip_string(text));
					if (ret.fault)
					{
						if (tag == "errorCode" && ret.fault_code == -1)
						{
							std::int64_t code = -1;
							if (aux::parse_int(value, code)) ret.fault_code = int(code);
						}
						else if (tag == "errorDescription")
						{
							ret.fault_description = value;
						}
						else if (tag == "faultstring" && ret.fault_description.empty())
						{
							ret.fault_description = value;
						}
					}
					else if (tag_stack.size() == 4)
					{
						ret.fields[std::string(tag)] = value;
					}
					text.clear();
					tag_stack.pop_back();
					break;
				}
				case aux::xml_parse_error:
					error = true;
					break;
				default: break;
			}
		});

		if (error) ret.envelope = false;
		return ret;
	}
}
