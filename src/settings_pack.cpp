/*

Copyright (c) 2012-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/config.hpp"
#include "igd/assert.hpp"
#include "igd/settings_pack.hpp"

#include <algorithm>
#include <array>

namespace {

	template <class T>
	bool compare_first(std::pair<std::uint16_t, T> const& lhs
		, std::pair<std::uint16_t, T> const& rhs)
	{
		return lhs.first < rhs.first;
	}

	template <class T>
	void insort_replace(std::vector<std::pair<std::uint16_t, T>>& c, std::pair<std::uint16_t, T> v)
	{
		auto i = std::lower_bound(c.begin(), c.end(), v, &compare_first<T>);
		if (i != c.end() && i->first == v.first) i->second = std::move(v.second);
		else c.emplace(i, std::move(v));
	}

	template <class T>
	T const* find_setting(std::vector<std::pair<std::uint16_t, T>> const& c, int const name)
	{
		std::pair<std::uint16_t, T> v(static_cast<std::uint16_t>(name), T());
		auto i = std::lower_bound(c.begin(), c.end(), v, &compare_first<T>);
		if (i != c.end() && i->first == name) return &i->second;
		return nullptr;
	}

	template <class T>
	void erase_setting(std::vector<std::pair<std::uint16_t, T>>& c, int const name)
	{
		std::pair<std::uint16_t, T> v(static_cast<std::uint16_t>(name), T());
		auto i = std::lower_bound(c.begin(), c.end(), v, &compare_first<T>);
		if (i != c.end() && i->first == name) c.erase(i);
	}
}

namespace igd {

	struct str_setting_entry_t
	{
		// the name of this setting. used for serialization and deserialization
		char const* name;
		char const* default_value;
	};

	struct int_setting_entry_t
	{
		// the name of this setting. used for serialization and deserialization
		char const* name;
		int default_value;
	};

	struct bool_setting_entry_t
	{
		// the name of this setting. used for serialization and deserialization
		char const* name;
		bool default_value;
	};

#define SET(name, default_value) { #name, default_value }

	namespace {

	std::array<str_setting_entry_t, settings_pack::num_string_settings> const str_settings
	{{
		SET(user_agent, "libigd/1.0"),
	}};

	std::array<bool_setting_entry_t, settings_pack::num_bool_settings> const bool_settings
	{{
		SET(upnp_ignore_nonrouters, false),
	}};

	std::array<int_setting_entry_t, settings_pack::num_int_settings> const int_settings
	{{
		SET(upnp_description_attempts, 50),
		SET(upnp_description_retry_interval, 10),
		SET(upnp_connect_timeout, 10),
		SET(upnp_request_timeout, 30),
		SET(upnp_lease_duration, 0),
		SET(upnp_max_devices, 50),
		SET(max_description_size, 2 * 1024 * 1024),
		SET(upnp_max_mapping_entries, 1024),
	}};

#undef SET

	} // anonymous namespace

	int setting_by_name(string_view const key)
	{
		for (int k = 0; k < int(str_settings.size()); ++k)
		{
			if (key != str_settings[std::size_t(k)].name) continue;
			return settings_pack::string_type_base + k;
		}
		for (int k = 0; k < int(int_settings.size()); ++k)
		{
			if (key != int_settings[std::size_t(k)].name) continue;
			return settings_pack::int_type_base + k;
		}
		for (int k = 0; k < int(bool_settings.size()); ++k)
		{
			if (key != bool_settings[std::size_t(k)].name) continue;
			return settings_pack::bool_type_base + k;
		}
		return -1;
	}

	char const* name_for_setting(int const s)
	{
		int const index = s & settings_pack::index_mask;
		switch (s & settings_pack::type_mask)
		{
			case settings_pack::string_type_base:
				if (index < settings_pack::num_string_settings)
					return str_settings[std::size_t(index)].name;
				break;
			case settings_pack::int_type_base:
				if (index < settings_pack::num_int_settings)
					return int_settings[std::size_t(index)].name;
				break;
			case settings_pack::bool_type_base:
				if (index < settings_pack::num_bool_settings)
					return bool_settings[std::size_t(index)].name;
				break;
		}
		return "";
	}

	settings_pack default_settings()
	{
		settings_pack ret;
		for (int i = 0; i < settings_pack::num_string_settings; ++i)
		{
			ret.set_str(settings_pack::string_type_base + i
				, str_settings[std::size_t(i)].default_value);
		}

		for (int i = 0; i < settings_pack::num_int_settings; ++i)
		{
			ret.set_int(settings_pack::int_type_base + i
				, int_settings[std::size_t(i)].default_value);
		}

		for (int i = 0; i < settings_pack::num_bool_settings; ++i)
		{
			ret.set_bool(settings_pack::bool_type_base + i
				, bool_settings[std::size_t(i)].default_value);
		}
		return ret;
	}

	void settings_pack::set_str(int const name, std::string val)
	{
		IGD_ASSERT((name & type_mask) == string_type_base);
		if ((name & type_mask) != string_type_base) return;
		if ((name & index_mask) >= num_string_settings) return;
		std::pair<std::uint16_t, std::string> v(static_cast<std::uint16_t>(name), std::move(val));
		insort_replace(m_strings, std::move(v));
	}

	void settings_pack::set_int(int const name, int const val)
	{
		IGD_ASSERT((name & type_mask) == int_type_base);
		if ((name & type_mask) != int_type_base) return;
		if ((name & index_mask) >= num_int_settings) return;
		std::pair<std::uint16_t, int> v(static_cast<std::uint16_t>(name), val);
		insort_replace(m_ints, v);
	}

	void settings_pack::set_bool(int const name, bool const val)
	{
		IGD_ASSERT((name & type_mask) == bool_type_base);
		if ((name & type_mask) != bool_type_base) return;
		if ((name & index_mask) >= num_bool_settings) return;
		std::pair<std::uint16_t, bool> v(static_cast<std::uint16_t>(name), val);
		insort_replace(m_bools, v);
	}

	bool settings_pack::has_val(int const name) const
	{
		switch (name & type_mask)
		{
			case string_type_base: return find_setting(m_strings, name) != nullptr;
			case int_type_base: return find_setting(m_ints, name) != nullptr;
			case bool_type_base: return find_setting(m_bools, name) != nullptr;
		}
		return false;
	}

	std::string const& settings_pack::get_str(int const name) const
	{
		static std::string const empty;
		IGD_ASSERT((name & type_mask) == string_type_base);
		if ((name & type_mask) != string_type_base) return empty;

		if (auto const* v = find_setting(m_strings, name)) return *v;

		int const index = name & index_mask;
		if (index >= num_string_settings) return empty;

		// function-local copies of the defaults, so a reference can be handed out
		static std::array<std::string, num_string_settings> const defaults = []
		{
			std::array<std::string, num_string_settings> ret;
			for (std::size_t i = 0; i < ret.size(); ++i)
				ret[i] = str_settings[i].default_value;
			return ret;
		}();
		return defaults[std::size_t(index)];
	}

	int settings_pack::get_int(int const name) const
	{
		IGD_ASSERT((name & type_mask) == int_type_base);
		if ((name & type_mask) != int_type_base) return 0;

		if (auto const* v = find_setting(m_ints, name)) return *v;

		int const index = name & index_mask;
		if (index >= num_int_settings) return 0;
		return int_settings[std::size_t(index)].default_value;
	}

	bool settings_pack::get_bool(int const name) const
	{
		IGD_ASSERT((name & type_mask) == bool_type_base);
		if ((name & type_mask) != bool_type_base) return false;

		if (auto const* v = find_setting(m_bools, name)) return *v;

		int const index = name & index_mask;
		if (index >= num_bool_settings) return false;
		return bool_settings[std::size_t(index)].default_value;
	}

	void settings_pack::clear()
	{
		m_strings.clear();
		m_ints.clear();
		m_bools.clear();
	}

	void settings_pack::clear(int const name)
	{
		switch (name & type_mask)
		{
			case string_type_base: erase_setting(m_strings, name); break;
			case int_type_base: erase_setting(m_ints, name); break;
			case bool_type_base: erase_setting(m_bools, name); break;
		}
	}
}
