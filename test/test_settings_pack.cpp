/*

Copyright (c) 2012, 2014-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/settings_pack.hpp"
#include "test.hpp"

#include <cstring>

using namespace igd;

IGD_TEST(defaults)
{
	settings_pack const p;
	TEST_EQUAL(p.get_str(settings_pack::user_agent), "libigd/1.0");
	TEST_EQUAL(p.get_int(settings_pack::upnp_description_attempts), 50);
	TEST_EQUAL(p.get_int(settings_pack::upnp_description_retry_interval), 10);
	TEST_EQUAL(p.get_int(settings_pack::upnp_connect_timeout), 10);
	TEST_EQUAL(p.get_int(settings_pack::upnp_request_timeout), 30);
	TEST_EQUAL(p.get_int(settings_pack::upnp_lease_duration), 0);
	TEST_EQUAL(p.get_int(settings_pack::upnp_max_devices), 50);
	TEST_EQUAL(p.get_int(settings_pack::max_description_size), 2 * 1024 * 1024);
	TEST_EQUAL(p.get_int(settings_pack::upnp_max_mapping_entries), 1024);
	TEST_EQUAL(p.get_bool(settings_pack::upnp_ignore_nonrouters), false);

	// an empty pack has no values of its own
	TEST_CHECK(!p.has_val(settings_pack::user_agent));
	TEST_CHECK(!p.has_val(settings_pack::upnp_max_devices));
}

IGD_TEST(default_settings)
{
	settings_pack const p = default_settings();
	TEST_CHECK(p.has_val(settings_pack::user_agent));
	TEST_CHECK(p.has_val(settings_pack::upnp_description_attempts));
	TEST_CHECK(p.has_val(settings_pack::upnp_ignore_nonrouters));
	TEST_EQUAL(p.get_int(settings_pack::upnp_description_attempts), 50);
}

IGD_TEST(set_and_clear)
{
	settings_pack p;
	p.set_int(settings_pack::upnp_lease_duration, 3600);
	p.set_str(settings_pack::user_agent, "test-agent/2.0");
	p.set_bool(settings_pack::upnp_ignore_nonrouters, true);

	TEST_EQUAL(p.get_int(settings_pack::upnp_lease_duration), 3600);
	TEST_EQUAL(p.get_str(settings_pack::user_agent), "test-agent/2.0");
	TEST_EQUAL(p.get_bool(settings_pack::upnp_ignore_nonrouters), true);
	TEST_CHECK(p.has_val(settings_pack::upnp_lease_duration));

	// setting again replaces the value
	p.set_int(settings_pack::upnp_lease_duration, 60);
	TEST_EQUAL(p.get_int(settings_pack::upnp_lease_duration), 60);

	p.clear(settings_pack::upnp_lease_duration);
	TEST_CHECK(!p.has_val(settings_pack::upnp_lease_duration));
	TEST_EQUAL(p.get_int(settings_pack::upnp_lease_duration), 0);
	TEST_EQUAL(p.get_str(settings_pack::user_agent), "test-agent/2.0");

	p.clear();
	TEST_CHECK(!p.has_val(settings_pack::user_agent));
	TEST_CHECK(!p.has_val(settings_pack::upnp_ignore_nonrouters));
	TEST_EQUAL(p.get_str(settings_pack::user_agent), "libigd/1.0");
}

IGD_TEST(copy)
{
	settings_pack p;
	p.set_int(settings_pack::upnp_max_devices, 3);
	settings_pack const copy = p;
	p.set_int(settings_pack::upnp_max_devices, 4);
	TEST_EQUAL(copy.get_int(settings_pack::upnp_max_devices), 3);
	TEST_EQUAL(p.get_int(settings_pack::upnp_max_devices), 4);
}

IGD_TEST(setting_names)
{
	TEST_EQUAL(setting_by_name("user_agent"), int(settings_pack::user_agent));
	TEST_EQUAL(setting_by_name("upnp_lease_duration"), int(settings_pack::upnp_lease_duration));
	TEST_EQUAL(setting_by_name("upnp_ignore_nonrouters"), int(settings_pack::upnp_ignore_nonrouters));
	TEST_EQUAL(setting_by_name("no_such_setting"), -1);
	TEST_EQUAL(setting_by_name(""), -1);

	TEST_EQUAL(std::strcmp(name_for_setting(settings_pack::max_description_size)
		, "max_description_size"), 0);
	TEST_EQUAL(std::strcmp(name_for_setting(settings_pack::max_int_setting_internal), ""), 0);
}

IGD_TEST(names_round_trip)
{
	for (int i = 0; i < settings_pack::num_int_settings; ++i)
	{
		int const s = settings_pack::int_type_base + i;
		TEST_EQUAL(setting_by_name(name_for_setting(s)), s);
	}
	for (int i = 0; i < settings_pack::num_string_settings; ++i)
	{
		int const s = settings_pack::string_type_base + i;
		TEST_EQUAL(setting_by_name(name_for_setting(s)), s);
	}
	for (int i = 0; i < settings_pack::num_bool_settings; ++i)
	{
		int const s = settings_pack::bool_type_base + i;
		TEST_EQUAL(setting_by_name(name_for_setting(s)), s);
	}
}
