/*

Copyright (c) 2012-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_SETTINGS_PACK_HPP_INCLUDED
#define IGD_SETTINGS_PACK_HPP_INCLUDED

#include "igd/config.hpp"
#include "igd/string_view.hpp"
#include "igd/aux_/export.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace igd {

	struct settings_pack;

	// converts a setting integer (from the enums string_types, int_types or
	// bool_types) to a string, and vice versa. Unknown names map to -1
	IGD_EXPORT int setting_by_name(string_view name);
	IGD_EXPORT char const* name_for_setting(int s);

	// returns a settings_pack with every setting set to its default value
	IGD_EXPORT settings_pack default_settings();

	// The ``settings_pack`` struct contains the names of all settings as enum
	// values. These values are passed in to the ``set_str()``, ``set_int()``,
	// ``set_bool()`` functions, to specify the setting to change. Settings
	// that have not been set read back as their default value.
	struct IGD_EXPORT settings_pack
	{
		settings_pack() = default;
		settings_pack(settings_pack const&) = default;
		settings_pack(settings_pack&&) noexcept = default;
		settings_pack& operator=(settings_pack const&) = default;
		settings_pack& operator=(settings_pack&&) noexcept = default;

		// set a configuration option in the settings_pack. ``name`` is one of
		// the enum values from string_types, int_types or bool_types. They must
		// match the respective type of the set_* function.
		void set_str(int name, std::string val);
		void set_int(int name, int val);
		void set_bool(int name, bool val);

		// queries whether the specified configuration option has a value set in
		// this pack.
		bool has_val(int name) const;

		// clear the settings pack from all settings
		void clear();

		// clear a specific setting from the pack
		void clear(int name);

		std::string const& get_str(int name) const;
		int get_int(int name) const;
		bool get_bool(int name) const;

		// setting names (indices) are 16 bits. The two most significant
		// bits indicate what type the setting has. (string, int, bool)
		enum type_bases
		{
			string_type_base = 0x0000,
			int_type_base =    0x4000,
			bool_type_base =   0x8000,
			type_mask =        0xc000,
			index_mask =       0x3fff
		};

		enum string_types
		{
			// the product name placed in the User-Agent header of requests
			// sent to routers
			user_agent = string_type_base,

			max_string_setting_internal
		};

		enum bool_types
		{
			// when set, discovery records whose ST or NT field names neither
			// an InternetGatewayDevice nor a WANIPConnection service are
			// ignored
			upnp_ignore_nonrouters = bool_type_base,

			max_bool_setting_internal
		};

		enum int_types
		{
			// the number of times the device description is parsed before
			// resolution gives up on a document that never completes
			upnp_description_attempts = int_type_base,

			// milliseconds to wait between two parse attempts of an
			// incomplete device description
			upnp_description_retry_interval,

			// seconds allowed for establishing the TCP connection to a router
			upnp_connect_timeout,

			// seconds allowed for a whole HTTP exchange with a router
			upnp_request_timeout,

			// the lease duration (in seconds) used for new port mappings when
			// the mapping itself does not specify one. 0 means permanent
			upnp_lease_duration,

			// the max number of distinct devices tracked by a client
			upnp_max_devices,

			// the max number of bytes of a device description or SOAP
			// response body
			max_description_size,

			// the max number of entries async_get_all_mappings() requests
			// before failing with errors::too_many_mappings
			upnp_max_mapping_entries,

			max_int_setting_internal
		};

		constexpr static int num_string_settings = int(max_string_setting_internal) - int(string_type_base);
		constexpr static int num_bool_settings = int(max_bool_setting_internal) - int(bool_type_base);
		constexpr static int num_int_settings = int(max_int_setting_internal) - int(int_type_base);

	private:

		std::vector<std::pair<std::uint16_t, std::string>> m_strings;
		std::vector<std::pair<std::uint16_t, int>> m_ints;
		std::vector<std::pair<std::uint16_t, bool>> m_bools;
	};
}

#endif // IGD_SETTINGS_PACK_HPP_INCLUDED
